#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "netcall/connection_cache.hpp"
#include "support/http_test_server.hpp"

using namespace netcall;
using namespace std::chrono_literals;
using netcall::test::HttpTestServer;

namespace {

    class ConnectionCacheTest : public ::testing::Test {
       protected:
        ConnectionCacheTest()
            : server([](const HttpTestServer::Request&,
                        HttpTestServer::Reply&) {}) {}

        ConnectionKey key() const {
            ConnectionKey k;
            k.scheme = "http";
            k.host = "127.0.0.1";
            k.port = server.port();
            k.read_timeout = 5000ms;
            k.normalize();
            return k;
        }

        static ConnectionCacheConfiguration config(std::size_t cache_size = 4) {
            ConnectionCacheConfiguration cfg;
            cfg.cache_size = cache_size;
            cfg.keep_alive_wait = 100ms;
            return cfg;
        }

        ConnectOptions options;
        HttpTestServer server;
    };

    TEST_F(ConnectionCacheTest, ReleasedConnectionsAreReusedInFifoOrder) {
        Http1ConnectionCache cache(config());

        auto a = cache.obtain(key(), options);
        auto b = cache.obtain(key(), options);
        ASSERT_TRUE(a.has_value());
        ASSERT_TRUE(b.has_value());
        EXPECT_TRUE(a.value().is_new());
        EXPECT_TRUE(b.value().is_new());
        auto* first = a.value().get();
        auto* second = b.value().get();
        EXPECT_NE(first, second);

        a.value().release();
        b.value().release();
        EXPECT_EQ(cache.idle_count(key()), 2u);
        EXPECT_EQ(cache.live_count(), 2u);

        auto c = cache.obtain(key(), options);
        auto d = cache.obtain(key(), options);
        ASSERT_TRUE(c.has_value());
        ASSERT_TRUE(d.has_value());
        EXPECT_FALSE(c.value().is_new());
        EXPECT_EQ(c.value().get(), first);
        EXPECT_EQ(d.value().get(), second);
        EXPECT_EQ(cache.idle_count(key()), 0u);
    }

    TEST_F(ConnectionCacheTest, FullQueueRejectsNewest) {
        Http1ConnectionCache cache(config(1));

        auto a = cache.obtain(key(), options);
        auto b = cache.obtain(key(), options);
        ASSERT_TRUE(a.has_value());
        ASSERT_TRUE(b.has_value());
        auto* first = a.value().get();

        a.value().release();
        b.value().release();
        EXPECT_EQ(cache.idle_count(key()), 1u);
        EXPECT_EQ(cache.live_count(), 1u);

        auto c = cache.obtain(key(), options);
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c.value().get(), first);
    }

    TEST_F(ConnectionCacheTest, FullQueueEvictsOldest) {
        auto cfg = config(1);
        cfg.overflow_policy = CacheOverflowPolicy::EvictOldest;
        Http1ConnectionCache cache(cfg);

        auto a = cache.obtain(key(), options);
        auto b = cache.obtain(key(), options);
        ASSERT_TRUE(a.has_value());
        ASSERT_TRUE(b.has_value());
        auto* second = b.value().get();

        a.value().release();
        b.value().release();
        EXPECT_EQ(cache.idle_count(key()), 1u);

        auto c = cache.obtain(key(), options);
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c.value().get(), second);
    }

    TEST_F(ConnectionCacheTest, LeaseDestroyedWithoutReleaseIsDiscarded) {
        Http1ConnectionCache cache(config());
        {
            auto a = cache.obtain(key(), options);
            ASSERT_TRUE(a.has_value());
            EXPECT_EQ(cache.live_count(), 1u);
        }
        EXPECT_EQ(cache.live_count(), 0u);
        EXPECT_EQ(cache.idle_count(key()), 0u);

        auto b = cache.obtain(key(), options);
        ASSERT_TRUE(b.has_value());
        EXPECT_TRUE(b.value().is_new());
    }

    TEST_F(ConnectionCacheTest, NotReusableOrOneOffConnectionsAreClosed) {
        Http1ConnectionCache cache(config());

        auto a = cache.obtain(key(), options);
        ASSERT_TRUE(a.has_value());
        a.value().release(false);
        EXPECT_EQ(cache.idle_count(key()), 0u);

        auto b = cache.obtain(key(), options, false);
        ASSERT_TRUE(b.has_value());
        EXPECT_FALSE(b.value().keep_alive());
        b.value().release();
        EXPECT_EQ(cache.idle_count(key()), 0u);
        EXPECT_EQ(cache.live_count(), 0u);
    }

    TEST_F(ConnectionCacheTest, AbortedConnectionIsNotQueued) {
        Http1ConnectionCache cache(config());

        auto a = cache.obtain(key(), options);
        ASSERT_TRUE(a.has_value());
        a.value()->abort();
        a.value().release();
        EXPECT_EQ(cache.idle_count(key()), 0u);
        EXPECT_EQ(cache.live_count(), 0u);
    }

    TEST_F(ConnectionCacheTest, PerHostLimitTimesOut) {
        auto cfg = config();
        cfg.max_connections_per_host = 1;
        Http1ConnectionCache cache(cfg);

        auto held = cache.obtain(key(), options);
        ASSERT_TRUE(held.has_value());

        auto start = std::chrono::steady_clock::now();
        auto blocked = cache.obtain(key(), options);
        ASSERT_TRUE(blocked.has_error());
        EXPECT_EQ(blocked.error().code, Error::Code::AcquireTimeout);
        EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
    }

    TEST_F(ConnectionCacheTest, TotalLimitWaitsForRelease) {
        auto cfg = config();
        cfg.max_total_connections = 1;
        cfg.keep_alive_wait = 5000ms;
        Http1ConnectionCache cache(cfg);

        auto held = cache.obtain(key(), options);
        ASSERT_TRUE(held.has_value());
        auto* conn = held.value().get();

        std::thread releaser([&] {
            std::this_thread::sleep_for(50ms);
            held.value().release();
        });
        auto waited = cache.obtain(key(), options);
        releaser.join();

        ASSERT_TRUE(waited.has_value());
        EXPECT_FALSE(waited.value().is_new());
        EXPECT_EQ(waited.value().get(), conn);
    }

    TEST_F(ConnectionCacheTest, DetachFreesSlot) {
        auto cfg = config();
        cfg.max_total_connections = 1;
        Http1ConnectionCache cache(cfg);

        auto a = cache.obtain(key(), options);
        ASSERT_TRUE(a.has_value());
        auto detached = a.value().detach();
        ASSERT_TRUE(detached);
        EXPECT_FALSE(static_cast<bool>(a.value()));
        EXPECT_EQ(cache.live_count(), 0u);
        EXPECT_TRUE(detached->is_open());

        auto b = cache.obtain(key(), options);
        EXPECT_TRUE(b.has_value());
    }

    TEST_F(ConnectionCacheTest, ClosedCacheRejectsObtain) {
        Http1ConnectionCache cache(config());
        auto a = cache.obtain(key(), options);
        ASSERT_TRUE(a.has_value());
        a.value().release();

        cache.close();
        EXPECT_EQ(cache.idle_count(key()), 0u);

        auto b = cache.obtain(key(), options);
        ASSERT_TRUE(b.has_error());
        EXPECT_EQ(b.error().code, Error::Code::CacheClosed);

        auto c = cache.open_unpooled(key(), options);
        ASSERT_TRUE(c.has_error());
        EXPECT_EQ(c.error().code, Error::Code::CacheClosed);
    }

    TEST_F(ConnectionCacheTest, ConnectFailureFreesSlot) {
        auto cfg = config();
        cfg.max_total_connections = 1;
        Http1ConnectionCache cache(cfg);

        ConnectionKey dead = key();
        {
            // Bind and close a listener to get a port nobody listens on.
            boost::asio::io_context io;
            boost::asio::ip::tcp::acceptor acc(
                io, {boost::asio::ip::make_address("127.0.0.1"), 0});
            dead.port = acc.local_endpoint().port();
        }
        auto failed = cache.obtain(dead, options);
        ASSERT_TRUE(failed.has_error());
        EXPECT_EQ(failed.error().code, Error::Code::ConnectionFailed);
        EXPECT_EQ(cache.live_count(), 0u);

        EXPECT_TRUE(cache.obtain(key(), options).has_value());
    }

}  // namespace
