#include "netcall/connection_cache.hpp"

#include "netcall/log.hpp"

namespace netcall {

    // ---------------- Lease ----------------

    Http1ConnectionCache* Http1ConnectionCache::Lease::owner() const noexcept {
        auto st = state_.lock();
        if (!st || !st->alive.load(std::memory_order_acquire)) return nullptr;
        return cache_;
    }

    void Http1ConnectionCache::Lease::release(bool reusable) noexcept {
        if (!conn_) return;
        if (auto* cache = owner()) {
            cache->on_release(conn_, keep_alive_, reusable);
        } else {
            conn_->close();
        }
        conn_.reset();
    }

    void Http1ConnectionCache::Lease::discard() noexcept {
        if (!conn_) return;
        if (auto* cache = owner()) {
            cache->on_discard(conn_);
        } else {
            conn_->close();
        }
        conn_.reset();
    }

    std::shared_ptr<TcpConnection>
    Http1ConnectionCache::Lease::detach() noexcept {
        if (!conn_) return nullptr;
        if (auto* cache = owner()) cache->on_detach(conn_);
        return std::move(conn_);
    }

    // ---------------- Http1ConnectionCache ----------------

    Http1ConnectionCache::Http1ConnectionCache(ConnectionCacheConfiguration cfg)
        : cfg_(std::move(cfg)), state_(std::make_shared<Lease::State>()) {}

    Http1ConnectionCache::~Http1ConnectionCache() {
        state_->alive.store(false, std::memory_order_release);
        close();
    }

    bool Http1ConnectionCache::limit_reached_locked(
        const ConnectionKey& key) const {
        if (cfg_.max_total_connections &&
            total_live_ >= *cfg_.max_total_connections) {
            return true;
        }
        if (cfg_.max_connections_per_host) {
            auto it = per_host_.find(key.host);
            if (it != per_host_.end() &&
                it->second.live >= *cfg_.max_connections_per_host) {
                return true;
            }
        }
        return false;
    }

    void Http1ConnectionCache::forget_locked(const ConnectionKey& key) {
        if (total_live_ > 0) --total_live_;
        auto it = per_host_.find(key.host);
        if (it != per_host_.end()) {
            if (it->second.live > 0) --it->second.live;
            if (it->second.live == 0) per_host_.erase(it);
        }
    }

    Result<Http1ConnectionCache::Lease> Http1ConnectionCache::obtain(
        const ConnectionKey& key, const ConnectOptions& options,
        bool keep_alive) {
        auto logger = log::logger();
        const auto deadline =
            std::chrono::steady_clock::now() + cfg_.keep_alive_wait;

        std::unique_lock<std::mutex> lk(mu_);
        for (;;) {
            if (closed_) {
                return Result<Lease>::err(Error::Code::CacheClosed,
                                          "Connection cache is closed");
            }

            if (keep_alive) {
                auto it = idle_.find(key);
                while (it != idle_.end() && !it->second.empty()) {
                    auto conn = std::move(it->second.front());
                    it->second.pop_front();

                    if (conn->is_alive()) {
                        conn->state(TcpConnection::State::Leased);
                        logger->debug("{} obtained from cache for {}",
                                   conn->channel_id(), key.authority());
                        return Result<Lease>::ok(
                            Lease(state_, this, std::move(conn), false, true));
                    }

                    logger->debug("{} evicted from cache: not alive",
                               conn->channel_id());
                    conn->close();
                    forget_locked(key);
                }
            }

            if (!limit_reached_locked(key)) break;

            if (released_cv_.wait_until(lk, deadline) ==
                    std::cv_status::timeout &&
                limit_reached_locked(key)) {
                return Result<Lease>::err(
                    Error::Code::AcquireTimeout,
                    "Maximum number of connections reached for " +
                        key.authority());
            }
        }

        ++total_live_;
        ++per_host_[key.host].live;
        lk.unlock();

        auto conn = std::make_shared<TcpConnection>(key);
        if (auto st = conn->connect(options); st.has_error()) {
            {
                std::lock_guard<std::mutex> guard(mu_);
                forget_locked(key);
            }
            released_cv_.notify_one();
            return st.propagate<Lease>();
        }

        logger->debug("{} new connection for {}{}", conn->channel_id(),
                   key.authority(), keep_alive ? "" : " (one-off)");
        return Result<Lease>::ok(
            Lease(state_, this, std::move(conn), true, keep_alive));
    }

    Result<std::shared_ptr<TcpConnection>> Http1ConnectionCache::open_unpooled(
        const ConnectionKey& key, const ConnectOptions& options) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) {
                return Result<std::shared_ptr<TcpConnection>>::err(
                    Error::Code::CacheClosed, "Connection cache is closed");
            }
        }

        auto conn = std::make_shared<TcpConnection>(key);
        if (auto st = conn->connect(options); st.has_error()) {
            return st.propagate<std::shared_ptr<TcpConnection>>();
        }
        return Result<std::shared_ptr<TcpConnection>>::ok(std::move(conn));
    }

    void Http1ConnectionCache::on_release(
        const std::shared_ptr<TcpConnection>& conn, bool keep_alive,
        bool reusable) noexcept {
        auto logger = log::logger();
        {
            std::lock_guard<std::mutex> lk(mu_);
            const auto& key = conn->key();

            if (closed_ || !keep_alive || !reusable || !conn->is_open()) {
                logger->debug("{} closed on release", conn->channel_id());
                conn->close();
                forget_locked(key);
            } else {
                auto& queue = idle_[key];
                bool queued = true;

                if (queue.size() >= cfg_.cache_size) {
                    if (cfg_.overflow_policy ==
                            CacheOverflowPolicy::RejectNewest ||
                        queue.empty()) {
                        logger->debug("{} closed on release: cache full",
                                   conn->channel_id());
                        conn->close();
                        forget_locked(key);
                        queued = false;
                    } else {
                        auto oldest = std::move(queue.front());
                        queue.pop_front();
                        logger->debug("{} evicted: cache full",
                                   oldest->channel_id());
                        oldest->close();
                        forget_locked(key);
                    }
                }

                if (queued) {
                    conn->state(TcpConnection::State::Idle);
                    queue.push_back(conn);
                    logger->debug("{} returned to cache", conn->channel_id());
                }
            }
        }
        released_cv_.notify_all();
    }

    void Http1ConnectionCache::on_discard(
        const std::shared_ptr<TcpConnection>& conn) noexcept {
        {
            std::lock_guard<std::mutex> lk(mu_);
            conn->close();
            forget_locked(conn->key());
        }
        log::logger()->debug("{} discarded", conn->channel_id());
        released_cv_.notify_all();
    }

    void Http1ConnectionCache::on_detach(
        const std::shared_ptr<TcpConnection>& conn) noexcept {
        {
            std::lock_guard<std::mutex> lk(mu_);
            forget_locked(conn->key());
        }
        released_cv_.notify_all();
    }

    void Http1ConnectionCache::close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
            for (auto& [key, queue] : idle_) {
                for (auto& conn : queue) {
                    conn->close();
                    forget_locked(key);
                }
            }
            idle_.clear();
        }
        released_cv_.notify_all();
    }

    std::size_t Http1ConnectionCache::idle_count(
        const ConnectionKey& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = idle_.find(key);
        return it == idle_.end() ? 0 : it->second.size();
    }

    std::size_t Http1ConnectionCache::live_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return total_live_;
    }

}  // namespace netcall
