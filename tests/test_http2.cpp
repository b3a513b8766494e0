#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "netcall/client.hpp"
#include "netcall/http2/call_chain.hpp"
#include "netcall/protocol_negotiator.hpp"
#include "support/h2_test_server.hpp"

using namespace netcall;
using namespace std::chrono_literals;
using netcall::test::Http2TestServer;

namespace {

    /// /echo answers "<method> <body>"; /bytes/<n> answers n bytes;
    /// /trailers adds a trailer field; /slow answers after 500 ms.
    void routes(const Http2TestServer::Request& req,
                Http2TestServer::Reply& reply) {
        reply.headers.emplace_back("x-protocol", req.http2 ? "h2" : "http/1.1");
        if (req.path == "/echo") {
            reply.body = req.method + " " + req.body;
        } else if (req.path.rfind("/bytes/", 0) == 0) {
            reply.body = std::string(std::stoul(req.path.substr(7)), 'b');
        } else if (req.path == "/trailers") {
            reply.body = "with trailers";
            reply.trailers.emplace_back("x-checksum", "abc123");
        } else if (req.path == "/slow") {
            reply.delay = 500ms;
            reply.body = "slow";
        } else if (req.path == "/redirect") {
            reply.status = 307;
            reply.headers.emplace_back("location", "/echo");
        } else {
            reply.status = 404;
        }
    }

    bool has_header(const Http2TestServer::Request& req, const char* name) {
        return req.has_header(name);
    }

    class Http2Test : public ::testing::Test {
       protected:
        explicit Http2Test(bool accept_upgrade = true)
            : server(routes, accept_upgrade) {}

        ClientConfiguration config(
            ProtocolMode mode = ProtocolMode::PriorKnowledge) const {
            ClientConfiguration cfg;
            cfg.base_url = server.url("");
            cfg.protocol = mode;
            cfg.read_timeout = 5000ms;
            return cfg;
        }

        Http2TestServer server;
    };

    TEST_F(Http2Test, PriorKnowledgeGet) {
        Client client(config());
        auto r = client.get("/echo");
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value().status(), 200);
        EXPECT_EQ(r.value().version(), HttpVersion::Http2);
        EXPECT_EQ(r.value().header("x-protocol"), "h2");
        auto body = r.value().as_string();
        ASSERT_TRUE(body.has_value());
        EXPECT_EQ(body.value(), "GET ");

        auto received = server.received();
        ASSERT_EQ(received.size(), 1u);
        EXPECT_EQ(received[0].method, "GET");
        EXPECT_EQ(received[0].scheme, "http");
        EXPECT_EQ(received[0].authority,
                  "127.0.0.1:" + std::to_string(server.port()));
        EXPECT_EQ(received[0].path, "/echo");
        EXPECT_EQ(received[0].header("user-agent"), "netcall/1.0");
        EXPECT_FALSE(has_header(received[0], "connection"));
        EXPECT_FALSE(has_header(received[0], "host"));
    }

    TEST_F(Http2Test, Http2OnlyUsesPriorKnowledgeInClearText) {
        Client client(config(ProtocolMode::Http2Only));
        auto r = client.get("/echo");
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value().version(), HttpVersion::Http2);
        EXPECT_EQ(server.upgrades(), 0);
    }

    TEST_F(Http2Test, BufferedEntityKeepsContentLength) {
        auto cfg = config();
        cfg.send_expect_continue = false;
        Client client(cfg);
        auto r = client.post("/echo", "payload");
        ASSERT_TRUE(r.has_value()) << r.error().message;
        auto body = r.value().as_string();
        ASSERT_TRUE(body.has_value());
        EXPECT_EQ(body.value(), "POST payload");

        auto received = server.received();
        ASSERT_EQ(received.size(), 1u);
        EXPECT_EQ(received[0].header("content-length"), "7");
        EXPECT_FALSE(has_header(received[0], "expect"));
    }

    TEST_F(Http2Test, ExpectContinueWaitsForInterimResponse) {
        Client client(config());
        auto r = client.put("/echo", "after continue");
        ASSERT_TRUE(r.has_value()) << r.error().message;
        auto body = r.value().as_string();
        ASSERT_TRUE(body.has_value());
        EXPECT_EQ(body.value(), "PUT after continue");

        auto received = server.received();
        ASSERT_EQ(received.size(), 1u);
        EXPECT_EQ(received[0].header("expect"), "100-continue");
    }

    TEST_F(Http2Test, OutputStreamIsSentAsDataFrames) {
        Client client(config());
        ServiceRequest req;
        req.method = HttpMethod::Post;
        req.uri = "/echo";

        auto r = client.output_stream(req, [](ClientOutputStream& out) {
            for (int i = 0; i < 3; ++i) {
                if (auto st = out.write("part" + std::to_string(i) + ";"); !st)
                    return st;
            }
            return out.close();
        });
        ASSERT_TRUE(r.has_value()) << r.error().message;
        auto body = r.value().as_string();
        ASSERT_TRUE(body.has_value());
        EXPECT_EQ(body.value(), "POST part0;part1;part2;");

        auto received = server.received();
        ASSERT_EQ(received.size(), 1u);
        EXPECT_FALSE(has_header(received[0], "transfer-encoding"));
        EXPECT_FALSE(has_header(received[0], "content-length"));
    }

    TEST_F(Http2Test, UnclosedOutputStreamFails) {
        Client client(config());
        ServiceRequest req;
        req.method = HttpMethod::Post;
        req.uri = "/echo";

        auto r = client.output_stream(
            req, [](ClientOutputStream& out) { return out.write("x"); });
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::InvalidState);
    }

    TEST_F(Http2Test, LargeEntitiesRespectFlowControl) {
        auto cfg = config();
        cfg.send_expect_continue = false;
        Client client(cfg);

        const std::string upload(300 * 1024, 'u');
        auto r = client.post("/echo", upload);
        ASSERT_TRUE(r.has_value()) << r.error().message;
        auto echoed = r.value().as_string();
        ASSERT_TRUE(echoed.has_value());
        EXPECT_EQ(echoed.value().size(), upload.size() + 5);

        auto big = client.get("/bytes/1048576");
        ASSERT_TRUE(big.has_value()) << big.error().message;
        auto body = big.value().as_string();
        ASSERT_TRUE(body.has_value());
        EXPECT_EQ(body.value().size(), 1048576u);
        EXPECT_TRUE(std::all_of(body.value().begin(), body.value().end(),
                                [](char c) { return c == 'b'; }));
    }

    TEST_F(Http2Test, TrailersFollowEntity) {
        Client client(config());
        auto r = client.get("/trailers");
        ASSERT_TRUE(r.has_value()) << r.error().message;
        auto body = r.value().as_string();
        ASSERT_TRUE(body.has_value());
        EXPECT_EQ(body.value(), "with trailers");

        auto trailers = r.value().trailers();
        ASSERT_TRUE(trailers.has_value());
        auto value = trailers.value()["x-checksum"];
        EXPECT_EQ(std::string(value.data(), value.size()), "abc123");
    }

    TEST_F(Http2Test, StreamsShareOneConnection) {
        Client client(config());
        {
            auto first = client.get("/echo");
            ASSERT_TRUE(first.has_value()) << first.error().message;
            ASSERT_TRUE(first.value().as_string().has_value());
        }

        std::vector<ResponseFuture> futures;
        for (int i = 0; i < 8; ++i) {
            ServiceRequest req;
            req.uri = "/bytes/" + std::to_string(100 + i);
            futures.push_back(client.submit_async(std::move(req)));
        }
        for (int i = 0; i < 8; ++i) {
            auto r = futures[i].get();
            ASSERT_TRUE(r.has_value()) << r.error().message;
            auto body = r.value().as_string();
            ASSERT_TRUE(body.has_value());
            EXPECT_EQ(body.value().size(), static_cast<std::size_t>(100 + i));
        }
        EXPECT_EQ(server.connections(), 1);
    }

    TEST_F(Http2Test, ClosingUnreadEntityKeepsConnection) {
        Client client(config());
        {
            auto r = client.get("/bytes/500000");
            ASSERT_TRUE(r.has_value()) << r.error().message;
            r.value().close();
        }
        auto next = client.get("/echo");
        ASSERT_TRUE(next.has_value()) << next.error().message;
        EXPECT_EQ(next.value().status(), 200);
        EXPECT_EQ(server.connections(), 1);
    }

    TEST_F(Http2Test, RedirectKeepsEntityOnSameConnection) {
        auto cfg = config();
        cfg.send_expect_continue = false;
        Client client(cfg);
        ServiceRequest req;
        req.method = HttpMethod::Put;
        req.uri = "/redirect";
        req.entity = std::string("Test entity");

        auto r = client.submit(req);
        ASSERT_TRUE(r.has_value()) << r.error().message;
        auto body = r.value().as_string();
        ASSERT_TRUE(body.has_value());
        EXPECT_EQ(body.value(), "PUT Test entity");
        EXPECT_EQ(server.connections(), 1);
    }

    TEST_F(Http2Test, ReadTimeoutRetiresConnection) {
        Client client(config());
        ServiceRequest req;
        req.uri = "/slow";
        req.read_timeout = 50ms;

        auto r = client.submit(req);
        ASSERT_TRUE(r.has_error());
        EXPECT_EQ(r.error().code, Error::Code::ReadTimeout);

        ServiceRequest next;
        next.uri = "/echo";
        next.read_timeout = 50ms;
        auto ok = client.submit(next);
        ASSERT_TRUE(ok.has_value()) << ok.error().message;
        EXPECT_EQ(server.connections(), 2);
    }

    TEST_F(Http2Test, UpgradeSwitchesToHttp2) {
        Client client(config(ProtocolMode::Upgrade));
        for (int i = 0; i < 2; ++i) {
            auto r = client.get("/echo");
            ASSERT_TRUE(r.has_value()) << r.error().message;
            EXPECT_EQ(r.value().version(), HttpVersion::Http2);
            EXPECT_EQ(r.value().header("x-protocol"), "h2");
            auto body = r.value().as_string();
            ASSERT_TRUE(body.has_value());
            EXPECT_EQ(body.value(), "GET ");
        }
        EXPECT_EQ(server.upgrades(), 1);
        EXPECT_EQ(server.connections(), 1);

        auto received = server.received();
        ASSERT_EQ(received.size(), 2u);
        EXPECT_TRUE(received[0].upgraded);
        EXPECT_FALSE(received[1].upgraded);
        EXPECT_TRUE(received[1].http2);
    }

    TEST_F(Http2Test, UpgradeIsNotOfferedForOutputStreams) {
        Client client(config(ProtocolMode::Upgrade));
        ServiceRequest req;
        req.method = HttpMethod::Post;
        req.uri = "/echo";
        req.send_expect_continue = false;

        auto r = client.output_stream(req, [](ClientOutputStream& out) {
            if (auto st = out.write("streamed"); !st) return st;
            return out.close();
        });
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value().version(), HttpVersion::Http11);
        EXPECT_EQ(server.upgrades(), 0);
    }

    class Http2RefusedUpgradeTest : public Http2Test {
       protected:
        Http2RefusedUpgradeTest() : Http2Test(false) {}
    };

    TEST_F(Http2RefusedUpgradeTest, FallsBackToHttp1AndStopsOffering) {
        Client client(config(ProtocolMode::Upgrade));
        for (int i = 0; i < 2; ++i) {
            auto r = client.get("/echo");
            ASSERT_TRUE(r.has_value()) << r.error().message;
            EXPECT_EQ(r.value().version(), HttpVersion::Http11);
            EXPECT_EQ(r.value().header("x-protocol"), "http/1.1");
            ASSERT_TRUE(r.value().as_string().has_value());
        }
        auto received = server.received();
        ASSERT_EQ(received.size(), 2u);
        EXPECT_TRUE(has_header(received[0], "upgrade"));
        EXPECT_FALSE(has_header(received[1], "upgrade"));
        EXPECT_EQ(server.connections(), 1);
    }

    TEST(Http2HeaderListTest, PseudoHeadersFirstAndConnectionFieldsDropped) {
        ClientConfiguration cfg;
        ServiceRequest req;
        req.method = HttpMethod::Post;
        req.entity = std::string("abc");
        req.headers.set("X-Custom", "Value");
        req.headers.set("TE", "trailers");
        req.headers.set("Proxy-Connection", "keep-alive");
        auto uri = parse_uri("http://h:8080/p?q=1");
        ASSERT_TRUE(uri.has_value());

        auto prepared = prepare_request(req, uri.value(), cfg);
        ASSERT_TRUE(prepared.has_value());

        auto list = h2_header_list(prepared.value(), true);
        ASSERT_GE(list.size(), 4u);
        EXPECT_EQ(list[0], std::make_pair(std::string(":method"),
                                          std::string("POST")));
        EXPECT_EQ(list[1], std::make_pair(std::string(":scheme"),
                                          std::string("http")));
        EXPECT_EQ(list[2], std::make_pair(std::string(":authority"),
                                          std::string("h:8080")));
        EXPECT_EQ(list[3], std::make_pair(std::string(":path"),
                                          std::string("/p?q=1")));

        auto contains = [&](const char* name, const char* value) {
            return std::find(list.begin(), list.end(),
                             std::make_pair(std::string(name),
                                            std::string(value))) != list.end();
        };
        auto has_name = [&](const char* name) {
            return std::any_of(list.begin(), list.end(), [&](const auto& h) {
                return h.first == name;
            });
        };
        EXPECT_TRUE(contains("x-custom", "Value"));
        EXPECT_TRUE(contains("te", "trailers"));
        EXPECT_TRUE(contains("content-length", "3"));
        EXPECT_TRUE(contains("expect", "100-continue"));
        EXPECT_FALSE(has_name("connection"));
        EXPECT_FALSE(has_name("proxy-connection"));
        EXPECT_FALSE(has_name("host"));
    }

    TEST(Http2HeaderListTest, TeOtherThanTrailersIsDropped) {
        ClientConfiguration cfg;
        ServiceRequest req;
        req.headers.set("TE", "gzip");
        auto uri = parse_uri("https://secure/");
        ASSERT_TRUE(uri.has_value());
        auto prepared = prepare_request(req, uri.value(), cfg);
        ASSERT_TRUE(prepared.has_value());

        auto list = h2_header_list(prepared.value(), false);
        EXPECT_EQ(list[1].second, "https");
        EXPECT_EQ(list[2].second, "secure");
        EXPECT_TRUE(std::none_of(list.begin(), list.end(), [](const auto& h) {
            return h.first == "te" || h.first == "expect";
        }));
    }

    TEST(Base64UrlTest, UnpaddedUrlAlphabet) {
        EXPECT_EQ(base64url_encode(""), "");
        EXPECT_EQ(base64url_encode("f"), "Zg");
        EXPECT_EQ(base64url_encode("fo"), "Zm8");
        EXPECT_EQ(base64url_encode("foo"), "Zm9v");
        EXPECT_EQ(base64url_encode(std::string("\xfb\xff", 2)), "-_8");
    }

}  // namespace
