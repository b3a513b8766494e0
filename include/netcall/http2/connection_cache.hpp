#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "netcall/config.hpp"
#include "netcall/connection_key.hpp"
#include "netcall/http2/connection.hpp"

namespace netcall {

    /**
     * Thread-safe registry of HTTP/2 connections, shared by all streams.
     *
     * Several connections may exist per key; find() hands out the first one
     * that still accepts streams. The cache also remembers clear-text
     * destinations that answered an h2c upgrade with HTTP/1.1.
     */
    class Http2ConnectionCache {
       public:
        Http2ConnectionCache(Http2Configuration cfg, bool remember_http1_only);

        Http2ConnectionCache(const Http2ConnectionCache&) = delete;
        Http2ConnectionCache& operator=(const Http2ConnectionCache&) = delete;

        ~Http2ConnectionCache();

        /**
         * @brief A connection for @p key with room for another stream, or
         * nullptr. Closed connections are dropped on the way; with
         * ping_on_idle an idle connection must answer a PING first.
         */
        std::shared_ptr<Http2Connection> find(const ConnectionKey& key);

        void add(std::shared_ptr<Http2Connection> connection);

        /// @brief Forget @p connection; its open streams are not affected.
        void evict(const Http2Connection& connection);

        /// @brief Close every connection.
        void close();

        void remember_http1_only(const ConnectionKey& key);

        bool is_http1_only(const ConnectionKey& key) const;

        std::size_t size(const ConnectionKey& key) const;

        const Http2Configuration& config() const noexcept { return cfg_; }

       private:
        bool probe(Http2Connection& connection) const;

        Http2Configuration cfg_;
        bool remember_http1_only_;

        mutable std::mutex mu_;
        bool closed_{false};
        std::unordered_map<ConnectionKey,
                           std::vector<std::shared_ptr<Http2Connection>>>
            connections_;
        std::unordered_set<ConnectionKey> http1_only_;
    };

}  // namespace netcall
