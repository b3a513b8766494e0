#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "netcall/config.hpp"
#include "netcall/connection_key.hpp"
#include "netcall/result.hpp"
#include "netcall/transport/tcp_connection.hpp"

namespace netcall {

    /**
     * Thread-safe cache of idle HTTP/1.1 connections.
     *
     * INVARIANTS:
     * 1. A leased connection is in no idle queue; an idle connection is
     *    owned by exactly one queue.
     * 2. Idle queues are FIFO: the connection released first is handed out
     *    first.
     * 3. No queue holds more than cache_size connections.
     * 4. Live counts (total and per host) include idle and leased
     *    connections and are only changed under mu_.
     *
     * ERRORS:
     * - AcquireTimeout: a connection limit stayed exhausted for keep_alive_wait
     * - CacheClosed: close() was called
     * - ConnectTimeout / ConnectionFailed / TlsHandshakeFailed: opening a new
     *   connection failed
     */
    class Http1ConnectionCache {
       public:
        /**
         * @brief Exclusive use of one connection.
         *
         * release() makes the connection available again, discard() closes
         * it. A Lease destroyed without either discards, so error paths can
         * never return a half-used connection.
         */
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    discard();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { discard(); }

            TcpConnection* operator->() const noexcept { return conn_.get(); }

            TcpConnection& operator*() const { return *conn_; }

            TcpConnection* get() const noexcept { return conn_.get(); }

            const std::shared_ptr<TcpConnection>& shared() const noexcept {
                return conn_;
            }

            explicit operator bool() const noexcept {
                return conn_ != nullptr;
            }

            /// @brief Whether the connection was opened for this lease.
            bool is_new() const noexcept { return new_; }

            /// @brief Whether the connection may go back to the idle queue.
            bool keep_alive() const noexcept { return keep_alive_; }

            /// @brief Return the connection to the cache. It is queued only
            /// when @p reusable, keep-alive applies and it is still open.
            void release(bool reusable = true) noexcept;

            /// @brief Close the connection and free its slot.
            void discard() noexcept;

            /// @brief Take the connection out of the cache's bookkeeping, for
            /// a connection that switches to HTTP/2.
            std::shared_ptr<TcpConnection> detach() noexcept;

           private:
            friend class Http1ConnectionCache;

            struct State {
                std::atomic<bool> alive{true};
            };

            Lease(std::weak_ptr<State> st, Http1ConnectionCache* cache,
                  std::shared_ptr<TcpConnection> conn, bool is_new,
                  bool keep_alive)
                : state_(std::move(st)),
                  cache_(cache),
                  conn_(std::move(conn)),
                  new_(is_new),
                  keep_alive_(keep_alive) {}

            void move_from(Lease&& other) noexcept {
                state_ = std::move(other.state_);
                cache_ = std::exchange(other.cache_, nullptr);
                conn_ = std::move(other.conn_);
                new_ = other.new_;
                keep_alive_ = other.keep_alive_;
            }

            /// Cache still alive, or nullptr.
            Http1ConnectionCache* owner() const noexcept;

            std::weak_ptr<State> state_;
            Http1ConnectionCache* cache_{nullptr};
            std::shared_ptr<TcpConnection> conn_;
            bool new_{false};
            bool keep_alive_{true};
        };

        explicit Http1ConnectionCache(ConnectionCacheConfiguration cfg);

        Http1ConnectionCache(const Http1ConnectionCache&) = delete;
        Http1ConnectionCache& operator=(const Http1ConnectionCache&) = delete;

        ~Http1ConnectionCache();

        /**
         * @brief Lease a connection for @p key.
         *
         * Hands out the oldest idle connection that passes the liveness
         * check, otherwise opens a new one. With @p keep_alive false a
         * one-off connection is opened and never cached.
         */
        Result<Lease> obtain(const ConnectionKey& key,
                             const ConnectOptions& options,
                             bool keep_alive = true);

        /// @brief Open a connection that the cache never tracks.
        Result<std::shared_ptr<TcpConnection>> open_unpooled(
            const ConnectionKey& key, const ConnectOptions& options);

        /// @brief Close all idle connections; later obtain() calls fail.
        void close();

        std::size_t idle_count(const ConnectionKey& key) const;

        std::size_t live_count() const;

        const ConnectionCacheConfiguration& config() const noexcept {
            return cfg_;
        }

       private:
        friend class Lease;

        struct HostCount {
            std::size_t live{0};
        };

        bool limit_reached_locked(const ConnectionKey& key) const;
        void forget_locked(const ConnectionKey& key);
        void on_release(const std::shared_ptr<TcpConnection>& conn,
                        bool keep_alive, bool reusable) noexcept;
        void on_discard(const std::shared_ptr<TcpConnection>& conn) noexcept;
        void on_detach(const std::shared_ptr<TcpConnection>& conn) noexcept;

        ConnectionCacheConfiguration cfg_;

        mutable std::mutex mu_;
        std::condition_variable released_cv_;
        bool closed_{false};

        std::unordered_map<ConnectionKey,
                           std::deque<std::shared_ptr<TcpConnection>>>
            idle_;
        std::unordered_map<std::string, HostCount> per_host_;
        std::size_t total_live_{0};

        std::shared_ptr<Lease::State> state_;
    };

}  // namespace netcall
