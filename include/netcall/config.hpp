#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "netcall/connection_key.hpp"

namespace netcall {

    /** @brief Which HTTP version a request may use. */
    enum class ProtocolMode {
        Http1Only,      ///< Never negotiate HTTP/2.
        Http2Only,      ///< ALPN must select h2; clear-text uses prior knowledge.
        Upgrade,        ///< ALPN over TLS, h2c upgrade attempt in clear text.
        PriorKnowledge  ///< Write the HTTP/2 preface directly.
    };

    /** @brief What to do when a 100-Continue is not received in time. */
    enum class ContinueTimeoutPolicy {
        SendEntity,  ///< Send the entity anyway (interoperable default).
        Fail         ///< Fail the request with ReadTimeout.
    };

    /** @brief What to do with a released connection when its queue is full. */
    enum class CacheOverflowPolicy {
        RejectNewest,  ///< Close the connection being released.
        EvictOldest    ///< Close the oldest idle connection and queue this one.
    };

    /**
     * @brief Configuration of the HTTP/1.1 connection cache.
     */
    struct ConnectionCacheConfiguration {
        /** @brief Maximum idle connections kept per connection key. */
        std::size_t cache_size{256};

        /** @brief Policy applied once cache_size idle connections are queued. */
        CacheOverflowPolicy overflow_policy{CacheOverflowPolicy::RejectNewest};

        /** @brief Limit on live connections across all keys. */
        std::optional<std::size_t> max_total_connections;

        /** @brief Limit on live connections per host. */
        std::optional<std::size_t> max_connections_per_host;

        /** @brief How long a request waits for a released connection when a
         * limit is reached. */
        std::chrono::milliseconds keep_alive_wait{30000};

        /** @brief Remember clear-text destinations that ignored an h2c
         * upgrade and stop offering it to them. */
        bool remember_http1_only{true};
    };

    /**
     * @brief HTTP/2 session settings.
     */
    struct Http2Configuration {
        /** @brief SETTINGS_INITIAL_WINDOW_SIZE advertised to the server. */
        std::uint32_t initial_window_size{65535};

        /** @brief SETTINGS_MAX_FRAME_SIZE advertised to the server. */
        std::uint32_t max_frame_size{16384};

        /** @brief SETTINGS_MAX_HEADER_LIST_SIZE advertised to the server. */
        std::uint32_t max_header_list_size{8192};

        /** @brief Bytes an output stream may queue before write() blocks. */
        std::size_t write_queue_limit{static_cast<std::size_t>(1024) * 1024U};

        /** @brief Ping a cached connection idle for longer than
         * ping_idle_after before handing it out. */
        bool ping_on_idle{false};

        std::chrono::milliseconds ping_idle_after{30000};

        std::chrono::milliseconds ping_timeout{500};
    };

    /**
     * @brief Configuration of a Client.
     */
    struct ClientConfiguration {
        /** @brief Base URL that relative request URIs are resolved against. */
        std::optional<std::string> base_url;

        /** @brief User-Agent sent when the request does not set one. */
        std::string user_agent{"netcall/1.0"};

        /** @brief Headers added to every request unless already present. */
        std::map<std::string, std::string> default_headers;

        /** @brief Timeout for establishing a connection (incl. TLS). */
        std::chrono::milliseconds connect_timeout{10000};

        /** @brief Stream timeout: no data received within this window fails
         * the request. */
        std::chrono::milliseconds read_timeout{30000};

        /** @brief How long to wait for 100-Continue before applying
         * continue_timeout_policy. */
        std::chrono::milliseconds read_continue_timeout{1000};

        ContinueTimeoutPolicy continue_timeout_policy{
            ContinueTimeoutPolicy::SendEntity};

        /** @brief Send `Expect: 100-continue` with request entities. */
        bool send_expect_continue{true};

        bool follow_redirects{true};

        /** @brief Redirects followed before failing with RedirectLimit. */
        int max_redirects{10};

        /** @brief Use persistent connections unless the request opts out. */
        bool default_keep_alive{true};

        /** @brief Limit on the response header section, in bytes. */
        std::size_t max_header_size{16384};

        /** @brief Limit on the response status line, in bytes. */
        std::size_t max_status_line_length{256};

        /** @brief Bytes read and discarded when a response is closed before
         * its entity was consumed; beyond this the connection is closed. */
        std::size_t drain_limit{static_cast<std::size_t>(64) * 1024U};

        /** @brief Use origin-form targets even when sending through a proxy. */
        bool relative_uris{false};

        TlsConfig tls;

        ProxyConfiguration proxy;

        DnsStrategy dns_strategy{DnsStrategy::First};

        AddressFamily address_family{AddressFamily::Any};

        ProtocolMode protocol{ProtocolMode::Upgrade};

        ConnectionCacheConfiguration cache;

        Http2Configuration http2;

        /** @brief Threads executing submit_async() calls. */
        std::size_t async_workers{4};
    };

}  // namespace netcall
