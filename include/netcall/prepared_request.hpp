#pragma once

#include <boost/beast/http/fields.hpp>
#include <chrono>

#include "netcall/config.hpp"
#include "netcall/framing.hpp"
#include "netcall/http_method.hpp"
#include "netcall/result.hpp"
#include "netcall/service_request.hpp"
#include "netcall/url.hpp"

namespace netcall {

    /**
     * @brief One physical request: a ServiceRequest resolved against a
     * destination, with final headers and framing.
     *
     * Redirects produce a new PreparedRequest per hop.
     */
    struct PreparedRequest {
        HttpMethod method{HttpMethod::Get};
        ClientUri uri;
        boost::beast::http::fields headers;
        FramingDecision framing;
        /// Borrowed from the ServiceRequest of this hop.
        const Entity* entity{nullptr};
        std::chrono::milliseconds read_timeout{0};
        bool expect_continue{false};
        bool keep_alive{true};

        EntityKind entity_kind() const noexcept {
            if (entity == nullptr) return EntityKind::None;
            if (std::holds_alternative<std::string>(*entity))
                return EntityKind::Buffered;
            if (std::holds_alternative<OutputStreamHandler>(*entity))
                return EntityKind::OutputStream;
            return EntityKind::None;
        }

        const std::string* buffered_entity() const noexcept {
            return entity ? std::get_if<std::string>(entity) : nullptr;
        }
    };

    /**
     * @brief Validate and complete the headers of @p request for @p uri.
     *
     * Rejects (InvalidArgument) HEAD with an entity and header names or
     * values that cannot be sent. Adds default headers, User-Agent, Host and
     * the Connection header implied by keep-alive, then applies the framing
     * decision. Performs no I/O.
     */
    Result<PreparedRequest> prepare_request(const ServiceRequest& request,
                                            const ClientUri& uri,
                                            const ClientConfiguration& cfg);

    /// @brief Token characters only (RFC 9110 section 5.1).
    bool is_valid_header_name(std::string_view name);

    /// @brief No CR, LF or NUL.
    bool is_valid_header_value(std::string_view value);

    /// @brief Whether a comma-separated header value contains @p token
    /// (case-insensitive).
    bool header_has_token(std::string_view value, std::string_view token);

}  // namespace netcall
