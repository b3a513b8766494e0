#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "netcall/result.hpp"

namespace netcall {

    /**
     * @brief A resolved request URI.
     */
    struct ClientUri {
        /// "http" or "https", lower case.
        std::string scheme{"http"};
        /// Lower case, IPv6 literals without brackets.
        std::string host;
        std::uint16_t port{0};
        /// Always starts with '/'.
        std::string path{"/"};
        /// Raw query without the leading '?'.
        std::string query;

        bool https() const noexcept { return scheme == "https"; }

        std::uint16_t default_port() const noexcept {
            return https() ? 443 : 80;
        }

        /// @brief Value of the Host header: host, plus ":port" when the port
        /// is not the scheme default.
        std::string authority() const;

        /// @brief Origin-form request target.
        std::string path_and_query() const;

        /// @brief Absolute form, e.g. "http://host:8080/a?b".
        std::string to_string() const;
    };

    /// @brief Parse an absolute http(s) URI.
    Result<ClientUri> parse_uri(std::string_view uri);

    /// @brief Parse a base URI; its path becomes a prefix without trailing
    /// slash ("" for the root) and it must not carry a query.
    Result<ClientUri> parse_base_uri(std::string_view base_uri);

    /**
     * @brief Resolve a request URI that is either absolute or relative to
     * @p base (as produced by parse_base_uri).
     */
    Result<ClientUri> resolve_uri(std::string_view uri_or_path,
                                  const ClientUri* base /*nullable*/);

    /**
     * @brief Resolve a redirect Location against the URI that produced it.
     *
     * A relative or host-less Location inherits scheme, host and port from
     * @p current, so a redirect can never silently switch destination
     * unless the server names one. Relative paths are merged with RFC 3986
     * rules and dot segments are removed. Fragments are dropped.
     */
    Result<ClientUri> resolve_location(const ClientUri& current,
                                       std::string_view location);

    /// @brief RFC 3986 section 5.2.4.
    std::string remove_dot_segments(std::string_view path);

}  // namespace netcall
