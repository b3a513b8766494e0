#pragma once

#include <optional>
#include <string_view>

#include "netcall/http_method.hpp"
#include "netcall/result.hpp"
#include "netcall/service_request.hpp"
#include "netcall/url.hpp"

namespace netcall {

    /// @brief 301, 302, 303, 307 and 308.
    bool is_redirect_status(int status) noexcept;

    /**
     * @brief Next hop of a redirected request.
     */
    struct RedirectHop {
        HttpMethod method{HttpMethod::Get};
        ClientUri uri;
        /// 307/308 resend the entity; other codes drop it.
        bool keep_entity{false};
    };

    /**
     * @brief Work out where a redirect response leads.
     *
     * @param location Value of the Location header, if any.
     * @return ProtocolError when Location is missing, InvalidUrl when it
     * cannot be resolved against @p current.
     */
    Result<RedirectHop> next_hop(HttpMethod method, const ClientUri& current,
                                 int status,
                                 std::optional<std::string_view> location);

    /**
     * @brief The request sent to @p hop. Entity headers are removed when the
     * entity is dropped; the Host header is recomputed from the new URI.
     */
    ServiceRequest redirected_request(const ServiceRequest& previous,
                                      const RedirectHop& hop);

}  // namespace netcall
