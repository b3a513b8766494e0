#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace netcall::test {

    namespace net = boost::asio;
    namespace beast = boost::beast;
    namespace http = beast::http;

    /**
     * @brief HTTP/1.1 server on 127.0.0.1 serving every connection on its
     * own thread. Connections stay open while the client keeps them alive.
     *
     * Every response carries "X-Connection: <n>", the accept index of the
     * connection that served it.
     */
    class HttpTestServer {
       public:
        using tcp = net::ip::tcp;
        using Request = http::request<http::string_body>;

        struct Reply {
            http::response<http::string_body> res{http::status::ok, 11};
            /// Sleep before answering.
            std::chrono::milliseconds delay{0};
            /// Bytes written instead of res.
            std::optional<std::string> raw;
            /// Close the connection after answering.
            bool close{false};
        };

        /// What to do with `Expect: 100-continue`.
        enum class ContinueMode {
            Send,        ///< Answer 100 Continue, then read the entity.
            Ignore,      ///< Wait for the entity without answering.
            RejectEarly  ///< Answer the final response before the entity.
        };

        using Handler = std::function<void(const Request&, Reply&)>;

        explicit HttpTestServer(Handler handler,
                                ContinueMode mode = ContinueMode::Send)
            : handler_(std::move(handler)), mode_(mode), acceptor_(ioc_) {
            tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};
            acceptor_.open(ep.protocol());
            acceptor_.set_option(net::socket_base::reuse_address(true));
            acceptor_.bind(ep);
            acceptor_.listen(net::socket_base::max_listen_connections);
            port_ = acceptor_.local_endpoint().port();
            accept_thread_ = std::thread([this] { accept_loop(); });
        }

        ~HttpTestServer() {
            stop_.store(true);
            {
                // Wake the blocking accept().
                net::io_context tmp;
                tcp::socket s(tmp);
                beast::error_code ec;
                s.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"),
                                        port_),
                          ec);
            }
            if (accept_thread_.joinable()) accept_thread_.join();

            std::vector<std::thread> threads;
            {
                std::lock_guard<std::mutex> lk(mu_);
                for (auto& sock : sockets_) {
                    beast::error_code ec;
                    sock->shutdown(tcp::socket::shutdown_both, ec);
                }
                threads.swap(threads_);
            }
            for (auto& t : threads) {
                if (t.joinable()) t.join();
            }
        }

        HttpTestServer(const HttpTestServer&) = delete;
        HttpTestServer& operator=(const HttpTestServer&) = delete;

        std::uint16_t port() const noexcept { return port_; }

        std::string url(std::string_view path = "/") const {
            return "http://127.0.0.1:" + std::to_string(port_) +
                   std::string(path);
        }

        int connections() const { return connections_.load(); }

        int requests() const { return requests_.load(); }

        /// Requests received so far, in arrival order.
        std::vector<Request> received() const {
            std::lock_guard<std::mutex> lk(mu_);
            return received_;
        }

       private:
        void accept_loop() {
            while (!stop_.load()) {
                auto sock = std::make_shared<tcp::socket>(ioc_);
                beast::error_code ec;
                acceptor_.accept(*sock, ec);
                if (ec) continue;
                if (stop_.load()) break;

                const int index = connections_.fetch_add(1);
                std::lock_guard<std::mutex> lk(mu_);
                sockets_.push_back(sock);
                threads_.emplace_back(
                    [this, sock, index] { serve(*sock, index); });
            }
        }

        void record(const Request& req) {
            requests_.fetch_add(1);
            std::lock_guard<std::mutex> lk(mu_);
            received_.push_back(req);
        }

        void serve(tcp::socket& sock, int index) {
            beast::flat_buffer buffer;
            beast::error_code ec;

            for (;;) {
                http::request_parser<http::string_body> parser;
                parser.body_limit(64 * 1024 * 1024);
                http::read_header(sock, buffer, parser, ec);
                if (ec) break;

                const bool expect =
                    beast::iequals(parser.get()[http::field::expect],
                                   "100-continue");

                Reply reply;
                reply.res.set("X-Connection", std::to_string(index));

                if (expect && mode_ == ContinueMode::RejectEarly) {
                    Request req = parser.release();
                    record(req);
                    handler_(req, reply);
                    reply.close = true;
                    if (!answer(sock, req, reply)) break;
                    break;
                }
                if (expect && mode_ == ContinueMode::Send) {
                    static const std::string kContinue =
                        "HTTP/1.1 100 Continue\r\n\r\n";
                    net::write(sock, net::buffer(kContinue), ec);
                    if (ec) break;
                }

                if (!parser.is_done()) {
                    http::read(sock, buffer, parser, ec);
                    if (ec) break;
                }

                Request req = parser.release();
                record(req);
                handler_(req, reply);
                if (!answer(sock, req, reply)) break;
                if (reply.close || !req.keep_alive()) break;
            }

            beast::error_code ignored;
            sock.shutdown(tcp::socket::shutdown_send, ignored);
        }

        bool answer(tcp::socket& sock, const Request& req, Reply& reply) {
            if (reply.delay.count() > 0) {
                std::this_thread::sleep_for(reply.delay);
            }
            beast::error_code ec;
            if (reply.raw) {
                net::write(sock, net::buffer(*reply.raw), ec);
                return !ec;
            }

            auto& res = reply.res;
            res.version(11);
            if (res.find(http::field::content_length) == res.end() &&
                !res.chunked() && req.method() != http::verb::head) {
                res.prepare_payload();
            }
            if (reply.close || !req.keep_alive()) res.keep_alive(false);
            http::write(sock, res, ec);
            return !ec;
        }

        Handler handler_;
        ContinueMode mode_;

        net::io_context ioc_;
        tcp::acceptor acceptor_;
        std::uint16_t port_{0};
        std::thread accept_thread_;
        std::atomic<bool> stop_{false};
        std::atomic<int> connections_{0};
        std::atomic<int> requests_{0};

        mutable std::mutex mu_;
        std::vector<std::shared_ptr<tcp::socket>> sockets_;
        std::vector<std::thread> threads_;
        std::vector<Request> received_;
    };

}  // namespace netcall::test
