#include "netcall/transport/tcp_connection.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>

#include "netcall/log.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace netcall {

    namespace {

        std::atomic<std::uint64_t> g_next_id{1};
        std::atomic<std::size_t> g_round_robin{0};

        bool is_ip_literal(const std::string& host) {
            boost::system::error_code ec;
            net::ip::make_address(host, ec);
            return !ec;
        }

    }  // namespace

    TcpConnection::TcpConnection(ConnectionKey key)
        : m_key(std::move(key)),
          m_id(g_next_id.fetch_add(1, std::memory_order_relaxed)),
          m_channel(fmt::format("[0x{:08x}]", m_id)) {}

    TcpConnection::~TcpConnection() noexcept { close(); }

    bool TcpConnection::is_open() const noexcept {
        if (auto* tls = std::get_if<TlsStream>(&m_stream)) {
            return beast::get_lowest_layer(*tls).socket().is_open();
        }
        if (auto* plain = std::get_if<PlainStream>(&m_stream)) {
            return plain->socket().is_open();
        }
        return false;
    }

    void TcpConnection::close() noexcept {
        boost::system::error_code ec;
        with_stream([&](auto& s) {
            auto& sock = beast::get_lowest_layer(s).socket();
            if (!sock.is_open()) return;
            sock.shutdown(tcp::socket::shutdown_both, ec);
            sock.close(ec);
        });
        m_state.store(State::Closed, std::memory_order_release);
    }

    void TcpConnection::abort() noexcept {
        if (m_aborted.exchange(true, std::memory_order_acq_rel)) return;
        net::post(m_ioc, [this] { close(); });
    }

    void TcpConnection::disable_timeouts() noexcept {
        with_stream(
            [](auto& s) { beast::get_lowest_layer(s).expires_never(); });
    }

    bool TcpConnection::is_alive() {
        if (!is_open() || aborted()) return false;
        if (m_buffer.size() > 0) return false;

        bool alive = false;
        with_stream([&](auto& s) {
            auto& sock = beast::get_lowest_layer(s).socket();
            boost::system::error_code ec;
            sock.non_blocking(true, ec);
            if (ec) return;

            char probe = 0;
            sock.receive(net::buffer(&probe, 1), tcp::socket::message_peek, ec);
            alive = ec == net::error::would_block;

            boost::system::error_code restore;
            sock.non_blocking(false, restore);
        });
        return alive;
    }

    Error TcpConnection::io_error(Error::Code code, const char* what,
                                  const boost::system::error_code& ec) const {
        if (aborted()) {
            return Error{Error::Code::Cancelled, "Request was cancelled"};
        }
        if (ec == beast::error::timeout) {
            if (code == Error::Code::ConnectionFailed ||
                code == Error::Code::TlsHandshakeFailed) {
                return Error{Error::Code::ConnectTimeout,
                             std::string(what) + ": connect timed out"};
            }
            return Error{Error::Code::ReadTimeout,
                         std::string(what) + ": read timed out"};
        }
        return Error{code, std::string(what) + ": " + ec.message()};
    }

    Result<std::vector<tcp::endpoint>> TcpConnection::resolve(
        const std::string& host, std::uint16_t port) {
        tcp::resolver resolver(m_ioc);
        boost::system::error_code ec;
        auto results = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            return Result<std::vector<tcp::endpoint>>::err(
                Error::Code::ConnectionFailed,
                "Failed to resolve " + host + ": " + ec.message());
        }

        std::vector<tcp::endpoint> v4;
        std::vector<tcp::endpoint> v6;
        for (const auto& entry : results) {
            auto ep = entry.endpoint();
            (ep.address().is_v4() ? v4 : v6).push_back(ep);
        }

        std::vector<tcp::endpoint> out;
        switch (m_key.address_family) {
            case AddressFamily::Ipv4Only:
                out = std::move(v4);
                break;
            case AddressFamily::Ipv6Only:
                out = std::move(v6);
                break;
            case AddressFamily::Ipv4Preferred:
                out = std::move(v4);
                out.insert(out.end(), v6.begin(), v6.end());
                break;
            case AddressFamily::Ipv6Preferred:
                out = std::move(v6);
                out.insert(out.end(), v4.begin(), v4.end());
                break;
            case AddressFamily::Any:
                for (const auto& entry : results)
                    out.push_back(entry.endpoint());
                break;
        }

        if (out.empty()) {
            return Result<std::vector<tcp::endpoint>>::err(
                Error::Code::ConnectionFailed,
                "No address of the requested family for " + host);
        }

        if (m_key.dns_strategy == DnsStrategy::RoundRobin && out.size() > 1) {
            auto shift =
                g_round_robin.fetch_add(1, std::memory_order_relaxed) %
                out.size();
            std::rotate(out.begin(),
                        out.begin() + static_cast<std::ptrdiff_t>(shift),
                        out.end());
        }
        return Result<std::vector<tcp::endpoint>>::ok(std::move(out));
    }

    Status TcpConnection::open_tunnel(PlainStream& stream,
                                      std::chrono::milliseconds timeout) {
        const std::string target = m_key.authority();

        http::request<http::empty_body> req{http::verb::connect, target, 11};
        req.set(http::field::host, target);
        req.set(http::field::proxy_connection, "keep-alive");

        boost::system::error_code result = net::error::would_block;
        stream.expires_after(timeout);
        http::async_write(stream, req,
                          [&](boost::system::error_code ec, std::size_t) {
                              result = ec;
                          });
        m_ioc.restart();
        m_ioc.run();
        if (result) {
            return Status::err(io_error(Error::Code::ConnectionFailed,
                                        "Proxy CONNECT write failed", result));
        }

        http::response_parser<http::empty_body> parser;
        parser.skip(true);
        result = net::error::would_block;
        stream.expires_after(timeout);
        http::async_read_header(stream, m_buffer, parser,
                                [&](boost::system::error_code ec, std::size_t) {
                                    result = ec;
                                });
        m_ioc.restart();
        m_ioc.run();
        if (result) {
            return Status::err(io_error(Error::Code::ConnectionFailed,
                                        "Proxy CONNECT read failed", result));
        }

        auto status = parser.get().result_int();
        if (status < 200 || status >= 300) {
            return Status::err(Error::Code::ConnectionFailed,
                               "Proxy CONNECT to " + target +
                                   " failed with status " +
                                   std::to_string(status));
        }
        m_buffer.consume(m_buffer.size());
        return Status::ok();
    }

    Status TcpConnection::connect(const ConnectOptions& options) {
        const bool proxied = m_key.proxy.applies_to(m_key.host);
        const std::string& host = proxied ? m_key.proxy.host : m_key.host;
        const std::uint16_t port = proxied ? m_key.proxy.port : m_key.port;

        auto endpoints = resolve(host, port);
        if (endpoints.has_error()) return endpoints.propagate<std::monostate>();

        PlainStream stream(m_ioc);
        boost::system::error_code result = net::error::would_block;
        stream.expires_after(options.connect_timeout);
        stream.async_connect(
            endpoints.value(),
            [&](boost::system::error_code ec, const tcp::endpoint&) {
                result = ec;
            });
        m_ioc.restart();
        m_ioc.run();
        if (result) {
            return Status::err(io_error(Error::Code::ConnectionFailed,
                                        "Connect failed", result));
        }

        boost::system::error_code opt_ec;
        stream.socket().set_option(tcp::no_delay(true), opt_ec);

        if (proxied && m_key.https()) {
            if (auto st = open_tunnel(stream, options.connect_timeout);
                st.has_error()) {
                return st;
            }
        }
        m_via_proxy = proxied && !m_key.https();

        if (!m_key.https()) {
            m_stream.emplace<PlainStream>(std::move(stream));
            log::logger()->debug("{} connected to {}{}", m_channel,
                                 m_key.authority(),
                                 proxied ? " through proxy" : "");
            return Status::ok();
        }

        if (!options.tls_context) {
            return Status::err(Error::Code::InvalidState,
                               "https connection requires a TLS context");
        }

        auto& tls = m_stream.emplace<TlsStream>(std::move(stream),
                                                *options.tls_context);
        boost::system::error_code ec;
        if (!is_ip_literal(m_key.host) && !set_sni(tls, m_key.host, ec)) {
            close();
            return Status::err(Error::Code::TlsHandshakeFailed,
                               "Failed to set SNI: " + ec.message());
        }
        if (!set_alpn(tls, options.alpn, ec)) {
            close();
            return Status::err(Error::Code::TlsHandshakeFailed,
                               "Failed to set ALPN: " + ec.message());
        }
        if (m_key.tls.verify_peer && m_key.tls.verify_hostname) {
            tls.set_verify_callback(ssl::host_name_verification(m_key.host));
        }

        result = net::error::would_block;
        beast::get_lowest_layer(tls).expires_after(options.connect_timeout);
        tls.async_handshake(ssl::stream_base::client,
                            [&](boost::system::error_code hec) {
                                result = hec;
                            });
        m_ioc.restart();
        m_ioc.run();
        if (result) {
            auto err = io_error(Error::Code::TlsHandshakeFailed,
                                "TLS handshake failed", result);
            close();
            return Status::err(std::move(err));
        }

        m_alpn = selected_alpn(tls);
        log::logger()->debug("{} connected to {} (TLS, alpn '{}')", m_channel,
                             m_key.authority(), m_alpn);
        return Status::ok();
    }

}  // namespace netcall
