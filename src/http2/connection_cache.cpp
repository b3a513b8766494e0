#include "netcall/http2/connection_cache.hpp"

#include <algorithm>

#include "netcall/log.hpp"

namespace netcall {

    Http2ConnectionCache::Http2ConnectionCache(Http2Configuration cfg,
                                               bool remember_http1_only)
        : cfg_(std::move(cfg)), remember_http1_only_(remember_http1_only) {}

    Http2ConnectionCache::~Http2ConnectionCache() { close(); }

    bool Http2ConnectionCache::probe(Http2Connection& connection) const {
        if (!cfg_.ping_on_idle) return true;
        const auto idle = std::chrono::steady_clock::now() - connection.last_used();
        if (idle < cfg_.ping_idle_after || connection.active_streams() > 0)
            return true;

        auto st = connection.ping(cfg_.ping_timeout);
        if (st.has_error()) {
            log::logger()->debug("{} idle PING failed: {}",
                                 connection.channel_id(), st.error().message);
            return false;
        }
        return true;
    }

    std::shared_ptr<Http2Connection> Http2ConnectionCache::find(
        const ConnectionKey& key) {
        for (;;) {
            std::shared_ptr<Http2Connection> candidate;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (closed_) return nullptr;
                auto it = connections_.find(key);
                if (it == connections_.end()) return nullptr;

                auto& list = it->second;
                list.erase(std::remove_if(list.begin(), list.end(),
                                          [](const auto& c) {
                                              return !c->is_open();
                                          }),
                           list.end());
                for (const auto& c : list) {
                    if (c->accepts_streams()) {
                        candidate = c;
                        break;
                    }
                }
                if (list.empty()) connections_.erase(it);
            }

            if (!candidate) return nullptr;
            if (probe(*candidate)) {
                log::logger()->debug("{} reusing HTTP/2 connection for {}",
                                     candidate->channel_id(),
                                     key.authority());
                return candidate;
            }
            evict(*candidate);
            candidate->close();
        }
    }

    void Http2ConnectionCache::add(std::shared_ptr<Http2Connection> connection) {
        std::unique_lock<std::mutex> lk(mu_);
        if (closed_) {
            lk.unlock();
            connection->close();
            return;
        }
        auto key = connection->key();
        connections_[key].push_back(std::move(connection));
    }

    void Http2ConnectionCache::evict(const Http2Connection& connection) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(connection.key());
        if (it == connections_.end()) return;
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const auto& c) {
                                      return c.get() == &connection;
                                  }),
                   list.end());
        if (list.empty()) connections_.erase(it);
    }

    void Http2ConnectionCache::close() {
        std::unordered_map<ConnectionKey,
                           std::vector<std::shared_ptr<Http2Connection>>>
            doomed;
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
            doomed.swap(connections_);
        }
        for (auto& [key, list] : doomed) {
            for (auto& c : list) c->close();
        }
    }

    void Http2ConnectionCache::remember_http1_only(const ConnectionKey& key) {
        if (!remember_http1_only_) return;
        std::lock_guard<std::mutex> lk(mu_);
        if (http1_only_.insert(key).second) {
            log::logger()->debug("{} remembered as HTTP/1.1 only",
                                 key.authority());
        }
    }

    bool Http2ConnectionCache::is_http1_only(const ConnectionKey& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        return http1_only_.count(key) > 0;
    }

    std::size_t Http2ConnectionCache::size(const ConnectionKey& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(key);
        return it == connections_.end() ? 0 : it->second.size();
    }

}  // namespace netcall
