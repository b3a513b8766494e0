#pragma once

#include <nghttp2/nghttp2.h>
#include <openssl/evp.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace netcall::test {

    /**
     * @brief Clear-text HTTP/2 server on 127.0.0.1 built on an nghttp2
     * server session, one thread per connection.
     *
     * Accepts prior-knowledge connections and h2c upgrades. Requests that
     * arrive as plain HTTP/1.1 without an upgrade (or when upgrades are
     * refused) are answered over HTTP/1.1 by the same handler.
     */
    class Http2TestServer {
       public:
        using tcp = boost::asio::ip::tcp;
        using HeaderList = std::vector<std::pair<std::string, std::string>>;

        struct Request {
            std::string method;
            std::string scheme;
            std::string authority;
            std::string path;
            HeaderList headers;
            std::string body;
            bool http2{true};
            bool upgraded{false};

            std::string header(std::string_view name) const {
                for (const auto& [n, v] : headers) {
                    if (boost::beast::iequals(n, boost::beast::string_view(name.data(), name.size()))) return v;
                }
                return {};
            }

            bool has_header(std::string_view name) const {
                return std::any_of(headers.begin(), headers.end(),
                                   [&](const auto& h) {
                                       return boost::beast::iequals(h.first, boost::beast::string_view(
                                                                    name.data(), name.size()));
                                   });
            }
        };

        struct Reply {
            int status{200};
            HeaderList headers;
            std::string body;
            HeaderList trailers;
            std::chrono::milliseconds delay{0};
        };

        using Handler = std::function<void(const Request&, Reply&)>;

        explicit Http2TestServer(Handler handler, bool accept_upgrade = true,
                                 std::uint32_t max_concurrent_streams = 100)
            : handler_(std::move(handler)),
              accept_upgrade_(accept_upgrade),
              max_concurrent_streams_(max_concurrent_streams),
              acceptor_(ioc_) {
            tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
            acceptor_.open(ep.protocol());
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
            acceptor_.bind(ep);
            acceptor_.listen(boost::asio::socket_base::max_listen_connections);
            port_ = acceptor_.local_endpoint().port();
            accept_thread_ = std::thread([this] { accept_loop(); });
        }

        ~Http2TestServer() {
            stop_.store(true);
            {
                boost::asio::io_context tmp;
                tcp::socket s(tmp);
                boost::beast::error_code ec;
                s.connect(tcp::endpoint(
                              boost::asio::ip::make_address("127.0.0.1"), port_),
                          ec);
            }
            if (accept_thread_.joinable()) accept_thread_.join();

            std::vector<std::thread> threads;
            {
                std::lock_guard<std::mutex> lk(mu_);
                for (auto& sock : sockets_) {
                    boost::beast::error_code ec;
                    sock->shutdown(tcp::socket::shutdown_both, ec);
                }
                threads.swap(threads_);
            }
            for (auto& t : threads) {
                if (t.joinable()) t.join();
            }
        }

        Http2TestServer(const Http2TestServer&) = delete;
        Http2TestServer& operator=(const Http2TestServer&) = delete;

        std::uint16_t port() const noexcept { return port_; }

        std::string url(std::string_view path = "/") const {
            return "http://127.0.0.1:" + std::to_string(port_) +
                   std::string(path);
        }

        int connections() const { return connections_.load(); }

        int upgrades() const { return upgrades_.load(); }

        std::vector<Request> received() const {
            std::lock_guard<std::mutex> lk(mu_);
            return received_;
        }

       private:
        struct StreamData {
            Request request;
            std::string out;
            std::size_t offset{0};
            HeaderList trailers;
        };

        struct Session {
            Http2TestServer* server{nullptr};
            tcp::socket* sock{nullptr};
            nghttp2_session* ng{nullptr};
            std::map<std::int32_t, std::unique_ptr<StreamData>> streams;
        };

        static std::string base64url_decode(std::string in) {
            for (auto& c : in) {
                if (c == '-') c = '+';
                if (c == '_') c = '/';
            }
            std::size_t pad = 0;
            while (in.size() % 4 != 0) {
                in.push_back('=');
                ++pad;
            }
            std::string out(in.size() / 4 * 3, '\0');
            const int n = EVP_DecodeBlock(
                reinterpret_cast<unsigned char*>(out.data()),
                reinterpret_cast<const unsigned char*>(in.data()),
                static_cast<int>(in.size()));
            if (n < 0) return {};
            out.resize(static_cast<std::size_t>(n) - pad);
            return out;
        }

        static nghttp2_nv nv(const std::string& name, const std::string& value) {
            nghttp2_nv out;
            out.name = reinterpret_cast<std::uint8_t*>(
                const_cast<char*>(name.data()));
            out.value = reinterpret_cast<std::uint8_t*>(
                const_cast<char*>(value.data()));
            out.namelen = name.size();
            out.valuelen = value.size();
            out.flags = NGHTTP2_NV_FLAG_NONE;
            return out;
        }

        void accept_loop() {
            while (!stop_.load()) {
                auto sock = std::make_shared<tcp::socket>(ioc_);
                boost::beast::error_code ec;
                acceptor_.accept(*sock, ec);
                if (ec) continue;
                if (stop_.load()) break;

                connections_.fetch_add(1);
                std::lock_guard<std::mutex> lk(mu_);
                sockets_.push_back(sock);
                threads_.emplace_back([this, sock] { serve(*sock); });
            }
        }

        void record(const Request& req) {
            std::lock_guard<std::mutex> lk(mu_);
            received_.push_back(req);
        }

        void serve(tcp::socket& sock) {
            namespace http = boost::beast::http;
            boost::beast::flat_buffer buffer;
            boost::beast::error_code ec;

            while (buffer.size() < 3) {
                auto n = sock.read_some(buffer.prepare(4096), ec);
                if (ec) return;
                buffer.commit(n);
            }
            const char* head = static_cast<const char*>(buffer.data().data());
            if (std::memcmp(head, "PRI", 3) == 0) {
                run_session(sock, buffer, nullptr);
                return;
            }

            for (;;) {
                http::request_parser<http::string_body> parser;
                http::read(sock, buffer, parser, ec);
                if (ec) return;
                auto msg = parser.release();

                Request req;
                req.method = std::string(msg.method_string());
                req.path = std::string(msg.target());
                req.scheme = "http";
                req.authority = std::string(msg[http::field::host]);
                req.http2 = false;
                for (const auto& f : msg) {
                    req.headers.emplace_back(std::string(f.name_string()),
                                             std::string(f.value()));
                }
                req.body = msg.body();

                const bool wants_upgrade =
                    boost::beast::iequals(msg[http::field::upgrade], "h2c") &&
                    msg.find("HTTP2-Settings") != msg.end();
                if (wants_upgrade && accept_upgrade_) {
                    static const std::string k101 =
                        "HTTP/1.1 101 Switching Protocols\r\n"
                        "Connection: Upgrade\r\nUpgrade: h2c\r\n\r\n";
                    boost::asio::write(sock, boost::asio::buffer(k101), ec);
                    if (ec) return;
                    upgrades_.fetch_add(1);
                    req.http2 = true;
                    req.upgraded = true;
                    run_session(sock, buffer, &req,
                                base64url_decode(std::string(msg["HTTP2-Settings"])),
                                msg.method() == http::verb::head);
                    return;
                }

                record(req);
                Reply reply;
                handler_(req, reply);
                if (reply.delay.count() > 0)
                    std::this_thread::sleep_for(reply.delay);

                http::response<http::string_body> res{
                    static_cast<http::status>(reply.status), 11};
                for (const auto& [n, v] : reply.headers) res.set(n, v);
                res.body() = reply.body;
                res.prepare_payload();
                res.keep_alive(msg.keep_alive());
                http::write(sock, res, ec);
                if (ec || !msg.keep_alive()) return;
            }
        }

        void run_session(tcp::socket& sock, boost::beast::flat_buffer& buffer,
                         const Request* upgraded,
                         const std::string& settings = {},
                         bool head_request = false) {
            Session session;
            session.server = this;
            session.sock = &sock;

            nghttp2_session_callbacks* cbs = nullptr;
            nghttp2_session_callbacks_new(&cbs);
            nghttp2_session_callbacks_set_on_begin_headers_callback(
                cbs, &on_begin_headers);
            nghttp2_session_callbacks_set_on_header_callback(cbs, &on_header);
            nghttp2_session_callbacks_set_on_data_chunk_recv_callback(
                cbs, &on_data_chunk);
            nghttp2_session_callbacks_set_on_frame_recv_callback(cbs,
                                                                 &on_frame);
            nghttp2_session_callbacks_set_on_stream_close_callback(
                cbs, &on_stream_close);
            nghttp2_session_server_new(&session.ng, cbs, &session);
            nghttp2_session_callbacks_del(cbs);

            if (upgraded) {
                nghttp2_session_upgrade2(
                    session.ng,
                    reinterpret_cast<const std::uint8_t*>(settings.data()),
                    settings.size(), head_request ? 1 : 0, nullptr);
            }

            nghttp2_settings_entry iv[] = {
                {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS,
                 max_concurrent_streams_}};
            nghttp2_submit_settings(session.ng, NGHTTP2_FLAG_NONE, iv, 1);

            if (upgraded) {
                auto data = std::make_unique<StreamData>();
                data->request = *upgraded;
                session.streams.emplace(1, std::move(data));
                respond(session, 1);
            }

            if (buffer.size() > 0) {
                auto bytes = buffer.data();
                nghttp2_session_mem_recv(
                    session.ng, static_cast<const std::uint8_t*>(bytes.data()),
                    bytes.size());
                buffer.consume(buffer.size());
            }

            std::uint8_t in[16384];
            for (;;) {
                if (!flush(session)) break;
                if (nghttp2_session_want_read(session.ng) == 0 &&
                    nghttp2_session_want_write(session.ng) == 0) {
                    break;
                }
                boost::beast::error_code ec;
                auto n = sock.read_some(boost::asio::buffer(in), ec);
                if (ec) break;
                if (nghttp2_session_mem_recv(session.ng, in, n) < 0) break;
            }
            nghttp2_session_del(session.ng);
        }

        static bool flush(Session& session) {
            for (;;) {
                const std::uint8_t* data = nullptr;
                auto n = nghttp2_session_mem_send(session.ng, &data);
                if (n < 0) return false;
                if (n == 0) return true;
                boost::beast::error_code ec;
                boost::asio::write(*session.sock,
                                   boost::asio::buffer(data, n), ec);
                if (ec) return false;
            }
        }

        static Session& session_of(void* user_data) {
            return *static_cast<Session*>(user_data);
        }

        static int on_begin_headers(nghttp2_session*, const nghttp2_frame* frame,
                                    void* user_data) {
            if (frame->hd.type != NGHTTP2_HEADERS ||
                frame->headers.cat != NGHTTP2_HCAT_REQUEST) {
                return 0;
            }
            session_of(user_data).streams[frame->hd.stream_id] =
                std::make_unique<StreamData>();
            return 0;
        }

        static int on_header(nghttp2_session*, const nghttp2_frame* frame,
                             const std::uint8_t* name, std::size_t namelen,
                             const std::uint8_t* value, std::size_t valuelen,
                             std::uint8_t, void* user_data) {
            auto& s = session_of(user_data);
            auto it = s.streams.find(frame->hd.stream_id);
            if (it == s.streams.end()) return 0;
            std::string n(reinterpret_cast<const char*>(name), namelen);
            std::string v(reinterpret_cast<const char*>(value), valuelen);
            auto& req = it->second->request;
            if (n == ":method") {
                req.method = v;
            } else if (n == ":path") {
                req.path = v;
            } else if (n == ":scheme") {
                req.scheme = v;
            } else if (n == ":authority") {
                req.authority = v;
            } else {
                req.headers.emplace_back(std::move(n), std::move(v));
            }
            return 0;
        }

        static int on_data_chunk(nghttp2_session*, std::uint8_t,
                                 std::int32_t stream_id, const std::uint8_t* data,
                                 std::size_t len, void* user_data) {
            auto& s = session_of(user_data);
            auto it = s.streams.find(stream_id);
            if (it != s.streams.end()) {
                it->second->request.body.append(
                    reinterpret_cast<const char*>(data), len);
            }
            return 0;
        }

        static int on_frame(nghttp2_session* ng, const nghttp2_frame* frame,
                            void* user_data) {
            auto& s = session_of(user_data);
            const auto id = frame->hd.stream_id;
            auto it = s.streams.find(id);
            if (it == s.streams.end()) return 0;
            const bool end_stream =
                (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) != 0;

            if (frame->hd.type == NGHTTP2_HEADERS && !end_stream &&
                it->second->request.header("expect") == "100-continue") {
                std::string status = ":status";
                std::string code = "100";
                nghttp2_nv cont = nv(status, code);
                nghttp2_submit_headers(ng, NGHTTP2_FLAG_NONE, id, nullptr,
                                       &cont, 1, nullptr);
            }
            if ((frame->hd.type == NGHTTP2_HEADERS ||
                 frame->hd.type == NGHTTP2_DATA) &&
                end_stream) {
                s.server->respond(s, id);
            }
            return 0;
        }

        static int on_stream_close(nghttp2_session*, std::int32_t stream_id,
                                   std::uint32_t, void* user_data) {
            session_of(user_data).streams.erase(stream_id);
            return 0;
        }

        static ssize_t read_body(nghttp2_session* ng, std::int32_t stream_id,
                                 std::uint8_t* buf, std::size_t length,
                                 std::uint32_t* flags,
                                 nghttp2_data_source* source, void*) {
            auto* data = static_cast<StreamData*>(source->ptr);
            const std::size_t n =
                std::min(length, data->out.size() - data->offset);
            std::memcpy(buf, data->out.data() + data->offset, n);
            data->offset += n;
            if (data->offset == data->out.size()) {
                *flags |= NGHTTP2_DATA_FLAG_EOF;
                if (!data->trailers.empty()) {
                    *flags |= NGHTTP2_DATA_FLAG_NO_END_STREAM;
                    std::vector<nghttp2_nv> nva;
                    for (const auto& [k, v] : data->trailers) {
                        nva.push_back(nv(k, v));
                    }
                    nghttp2_submit_trailer(ng, stream_id, nva.data(),
                                           nva.size());
                }
            }
            return static_cast<ssize_t>(n);
        }

        void respond(Session& s, std::int32_t id) {
            auto& data = *s.streams.at(id);
            record(data.request);

            Reply reply;
            handler_(data.request, reply);
            if (reply.delay.count() > 0) std::this_thread::sleep_for(reply.delay);

            data.out = std::move(reply.body);
            data.trailers = std::move(reply.trailers);

            const std::string status_name = ":status";
            const std::string status_value = std::to_string(reply.status);
            std::vector<nghttp2_nv> nva{nv(status_name, status_value)};
            for (const auto& [k, v] : reply.headers) nva.push_back(nv(k, v));

            if (data.out.empty() && data.trailers.empty()) {
                nghttp2_submit_response(s.ng, id, nva.data(), nva.size(),
                                        nullptr);
                return;
            }
            nghttp2_data_provider provider;
            provider.source.ptr = &data;
            provider.read_callback = &read_body;
            nghttp2_submit_response(s.ng, id, nva.data(), nva.size(),
                                    &provider);
        }

        Handler handler_;
        bool accept_upgrade_;
        std::uint32_t max_concurrent_streams_;

        boost::asio::io_context ioc_;
        tcp::acceptor acceptor_;
        std::uint16_t port_{0};
        std::thread accept_thread_;
        std::atomic<bool> stop_{false};
        std::atomic<int> connections_{0};
        std::atomic<int> upgrades_{0};

        mutable std::mutex mu_;
        std::vector<std::shared_ptr<tcp::socket>> sockets_;
        std::vector<std::thread> threads_;
        std::vector<Request> received_;
    };

}  // namespace netcall::test
