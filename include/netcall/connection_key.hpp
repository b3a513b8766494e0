#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netcall {

    /**
     * @brief TLS settings of a destination.
     * @note Part of the connection identity: two requests with different TLS
     * settings never share a connection.
     */
    struct TlsConfig {
        /** @brief Verify the peer certificate chain. */
        bool verify_peer{true};
        /** @brief Verify that the certificate matches the requested host. */
        bool verify_hostname{true};
        /** @brief PEM file with trusted CAs; system defaults when empty. */
        std::optional<std::string> ca_file;
        /** @brief Directory with hashed trusted CAs. */
        std::optional<std::string> ca_path;
        /** @brief Client certificate chain (PEM) for mutual TLS. */
        std::optional<std::string> certificate_file;
        /** @brief Private key (PEM) matching certificate_file. */
        std::optional<std::string> private_key_file;

        friend bool operator==(const TlsConfig&, const TlsConfig&) = default;
    };

    /**
     * @brief Proxy used to reach a destination.
     */
    struct ProxyConfiguration {
        enum class Type {
            None,  ///< Connect directly.
            Http   ///< HTTP proxy; CONNECT tunnel for TLS destinations.
        };

        Type type{Type::None};
        std::string host;
        std::uint16_t port{3128};
        /// Hosts reached directly. An entry starting with '.' or "*." matches
        /// the domain and all of its subdomains.
        std::vector<std::string> no_proxy;

        /// @brief Whether requests to @p target_host go through this proxy.
        bool applies_to(std::string_view target_host) const {
            if (type == Type::None || host.empty()) return false;
            for (const auto& raw : no_proxy) {
                std::string_view entry = raw;
                if (entry.rfind("*.", 0) == 0) entry.remove_prefix(1);
                if (!entry.empty() && entry.front() == '.') {
                    std::string_view bare = entry.substr(1);
                    if (target_host == bare) return false;
                    if (target_host.size() > entry.size() &&
                        target_host.compare(target_host.size() - entry.size(),
                                            entry.size(), entry) == 0) {
                        return false;
                    }
                } else if (entry == target_host) {
                    return false;
                }
            }
            return true;
        }

        friend bool operator==(const ProxyConfiguration&,
                               const ProxyConfiguration&) = default;
    };

    /** @brief Order in which resolved addresses are tried. */
    enum class DnsStrategy {
        First,      ///< Resolver order.
        RoundRobin  ///< Rotate the starting address on every connect.
    };

    /** @brief Address family filter/preference applied after resolution. */
    enum class AddressFamily {
        Any,
        Ipv4Only,
        Ipv6Only,
        Ipv4Preferred,
        Ipv6Preferred
    };

    /**
     * @brief Identity of a reusable destination.
     *
     * Equality defines pool identity: a cached connection is only handed to a
     * request whose key compares equal to the key it was opened with.
     */
    struct ConnectionKey {
        std::string scheme;
        std::string host;
        std::uint16_t port{0};
        std::chrono::milliseconds read_timeout{0};
        TlsConfig tls;
        ProxyConfiguration proxy;
        DnsStrategy dns_strategy{DnsStrategy::First};
        AddressFamily address_family{AddressFamily::Any};

        bool https() const noexcept { return scheme == "https"; }

        /// @brief "host:port", with IPv6 literals in brackets.
        std::string authority() const {
            std::string out;
            if (host.find(':') != std::string::npos) {
                out.append("[").append(host).append("]");
            } else {
                out.append(host);
            }
            out.append(":").append(std::to_string(port));
            return out;
        }

        /// @brief Lower-case the host and fill the default port.
        void normalize() {
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            if (port == 0) port = https() ? 443 : 80;
        }

        friend bool operator==(const ConnectionKey&,
                               const ConnectionKey&) = default;
    };

}  // namespace netcall

namespace std {
    template <>
    struct hash<netcall::ConnectionKey> {
        size_t operator()(netcall::ConnectionKey const& k) const noexcept {
            // FNV-1a over the fields most likely to differ.
            size_t h = 1469598103934665603ull;
            auto mix_byte = [&](unsigned char c) {
                h ^= c;
                h *= 1099511628211ull;
            };
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) mix_byte(c);
                mix_byte(0);
            };
            mix(k.scheme);
            mix(k.host);
            mix_byte(static_cast<unsigned char>(k.port & 0xff));
            mix_byte(static_cast<unsigned char>(k.port >> 8));
            auto timeout = static_cast<std::uint64_t>(k.read_timeout.count());
            for (int i = 0; i < 8; ++i) {
                mix_byte(static_cast<unsigned char>(timeout >> (i * 8)));
            }
            mix(k.proxy.host);
            mix_byte(static_cast<unsigned char>(k.proxy.type));
            mix_byte(static_cast<unsigned char>(k.dns_strategy));
            mix_byte(static_cast<unsigned char>(k.address_family));
            mix_byte(static_cast<unsigned char>(k.tls.verify_peer));
            mix_byte(static_cast<unsigned char>(k.tls.verify_hostname));
            if (k.tls.ca_file) mix(*k.tls.ca_file);
            if (k.tls.certificate_file) mix(*k.tls.certificate_file);
            return h;
        }
    };
}  // namespace std
