#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "netcall/connection_key.hpp"
#include "netcall/result.hpp"
#include "netcall/tls.hpp"

namespace netcall {

    /** @brief What a transport needs to open. */
    struct ConnectOptions {
        std::chrono::milliseconds connect_timeout{10000};
        /// Required for https keys.
        std::shared_ptr<boost::asio::ssl::context> tls_context;
        /// Offered through ALPN, in preference order. Empty disables ALPN.
        std::vector<std::string> alpn;
    };

    /**
     * @brief A single plain or TLS socket to a ConnectionKey.
     *
     * Each connection owns its io_context. Blocking operations start the
     * asynchronous Beast operation and run the io_context until it finishes,
     * which gives every read and write a timeout. Once handed to HTTP/2 the
     * io_context is run by a dedicated thread and only the async_* members
     * are used.
     *
     * @note Blocking operations must not be called concurrently; abort() may
     * be called from any thread.
     */
    class TcpConnection {
       private:
        using tcp = boost::asio::ip::tcp;
        using PlainStream = boost::beast::tcp_stream;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    PlainStream, TlsStream>;

       public:
        /** @brief Lifecycle as seen by the connection cache. */
        enum class State { Idle, Leased, Closed };

        explicit TcpConnection(ConnectionKey key);

        TcpConnection(const TcpConnection&) = delete;
        TcpConnection& operator=(const TcpConnection&) = delete;
        TcpConnection(TcpConnection&&) = delete;
        TcpConnection& operator=(TcpConnection&&) = delete;

        ~TcpConnection() noexcept;

        /**
         * @brief Resolve, connect (through the proxy when configured) and
         * perform the TLS handshake for https keys.
         * @return ConnectTimeout, ConnectionFailed or TlsHandshakeFailed.
         */
        Status connect(const ConnectOptions& options);

        std::uint64_t id() const noexcept { return m_id; }

        /// @brief "[0x0000002a]"-style prefix used in log lines.
        const std::string& channel_id() const noexcept { return m_channel; }

        const ConnectionKey& key() const noexcept { return m_key; }

        /// @brief Protocol selected through ALPN; empty when not negotiated.
        const std::string& alpn() const noexcept { return m_alpn; }

        /// @brief Plain HTTP sent to a proxy: requests use absolute-form.
        bool via_proxy() const noexcept { return m_via_proxy; }

        State state() const noexcept {
            return m_state.load(std::memory_order_acquire);
        }

        void state(State s) noexcept {
            m_state.store(s, std::memory_order_release);
        }

        bool is_open() const noexcept;

        /**
         * @brief Whether an idle connection can be reused: open, no buffered
         * bytes, and a non-blocking peek finds neither EOF nor unexpected
         * data.
         */
        bool is_alive();

        /// @brief Close the socket (no TLS shutdown). Not thread-safe.
        void close() noexcept;

        /// @brief Close from any thread; pending blocking operations fail.
        void abort() noexcept;

        bool aborted() const noexcept {
            return m_aborted.load(std::memory_order_acquire);
        }

        /// @brief Bytes read from the socket but not yet parsed.
        boost::beast::flat_buffer& buffer() noexcept { return m_buffer; }

        boost::asio::io_context& io() noexcept { return m_ioc; }

        /// @brief Disable stream timeouts before async use.
        void disable_timeouts() noexcept;

        /**
         * @brief Map an I/O failure to an Error.
         * @param code Code used when the failure is neither a timeout nor an
         * abort.
         */
        Error io_error(Error::Code code, const char* what,
                       const boost::system::error_code& ec) const;

        // -------- blocking operations --------

        template <class ConstBufferSequence>
        Status write(const ConstBufferSequence& buffers,
                     std::chrono::milliseconds timeout) {
            auto ec = run_with_timeout(
                [&](auto& s, auto handler) {
                    boost::asio::async_write(s, buffers, std::move(handler));
                },
                timeout);
            if (ec) return fail(Error::Code::SendFailed, "Write failed", ec);
            return Status::ok();
        }

        template <class Serializer>
        Status write_header(Serializer& sr, std::chrono::milliseconds timeout) {
            auto ec = run_with_timeout(
                [&](auto& s, auto handler) {
                    boost::beast::http::async_write_header(s, sr,
                                                           std::move(handler));
                },
                timeout);
            if (ec) return fail(Error::Code::SendFailed, "Write failed", ec);
            return Status::ok();
        }

        /// @brief Read a complete header into @p parser.
        template <class Parser>
        Status read_header(Parser& parser, std::chrono::milliseconds timeout) {
            auto ec = run_with_timeout(
                [&](auto& s, auto handler) {
                    boost::beast::http::async_read_header(s, m_buffer, parser,
                                                          std::move(handler));
                },
                timeout);
            if (ec) return fail(Error::Code::ReceiveFailed, "Read failed", ec);
            return Status::ok();
        }

        /**
         * @brief Wait up to @p wait for a header without closing the
         * connection when the wait expires.
         * @param timed_out Set when nothing complete arrived in time.
         */
        template <class Parser>
        Status await_header(Parser& parser, std::chrono::milliseconds wait,
                            bool& timed_out) {
            timed_out = false;
            if (!is_open())
                return Status::err(Error::Code::InvalidState,
                                   "Connection is closed");

            boost::system::error_code result = boost::asio::error::would_block;
            bool fired = false;
            boost::asio::steady_timer timer(m_ioc);

            with_stream([&](auto& s) {
                boost::beast::get_lowest_layer(s).expires_never();
                timer.expires_after(wait);
                timer.async_wait([&](boost::system::error_code tec) {
                    if (tec) return;
                    fired = true;
                    boost::system::error_code cec;
                    boost::beast::get_lowest_layer(s).socket().cancel(cec);
                });
                boost::beast::http::async_read_header(
                    s, m_buffer, parser,
                    [&](boost::system::error_code ec, std::size_t) {
                        result = ec;
                        timer.cancel();
                    });
            });
            m_ioc.restart();
            m_ioc.run();

            if (fired && result == boost::asio::error::operation_aborted &&
                !aborted()) {
                timed_out = true;
                return Status::ok();
            }
            if (result)
                return fail(Error::Code::ReceiveFailed, "Read failed", result);
            return Status::ok();
        }

        /// @brief Read and parse some body bytes into @p parser.
        /// @return Bytes consumed from the wire.
        template <class Parser>
        Result<std::size_t> read_some(Parser& parser,
                                      std::chrono::milliseconds timeout) {
            std::size_t n = 0;
            auto ec = run_with_timeout(
                [&](auto& s, auto handler) {
                    boost::beast::http::async_read_some(s, m_buffer, parser,
                                                        std::move(handler));
                },
                timeout, &n);
            if (ec && ec != boost::beast::http::error::need_buffer) {
                return fail(Error::Code::ReceiveFailed, "Read failed", ec)
                    .template propagate<std::size_t>();
            }
            return Result<std::size_t>::ok(n);
        }

        // -------- asynchronous operations (HTTP/2 io thread) --------

        template <class MutableBufferSequence, class Handler>
        void async_read_some(const MutableBufferSequence& buffers,
                             Handler&& handler) {
            with_stream([&](auto& s) {
                s.async_read_some(buffers, std::forward<Handler>(handler));
            });
        }

        template <class ConstBufferSequence, class Handler>
        void async_write(const ConstBufferSequence& buffers,
                         Handler&& handler) {
            with_stream([&](auto& s) {
                boost::asio::async_write(s, buffers,
                                         std::forward<Handler>(handler));
            });
        }

       private:
        template <class F>
        void with_stream(F&& f) {
            if (auto* tls = std::get_if<TlsStream>(&m_stream)) {
                f(*tls);
            } else if (auto* plain = std::get_if<PlainStream>(&m_stream)) {
                f(*plain);
            }
        }

        template <class Initiate>
        boost::system::error_code run_with_timeout(
            Initiate&& initiate, std::chrono::milliseconds timeout,
            std::size_t* transferred = nullptr) {
            if (!is_open()) return boost::asio::error::not_connected;

            boost::system::error_code result = boost::asio::error::would_block;
            with_stream([&](auto& s) {
                if (timeout.count() > 0) {
                    boost::beast::get_lowest_layer(s).expires_after(timeout);
                } else {
                    boost::beast::get_lowest_layer(s).expires_never();
                }
                initiate(s, [&result, transferred](boost::system::error_code ec,
                                                   std::size_t n) {
                    result = ec;
                    if (transferred) *transferred = n;
                });
            });
            m_ioc.restart();
            m_ioc.run();
            return result;
        }

        Status fail(Error::Code code, const char* what,
                    const boost::system::error_code& ec) {
            Error e = io_error(code, what, ec);
            if (e.code == Error::Code::ReadTimeout) close();
            return Status::err(std::move(e));
        }

        Result<std::vector<tcp::endpoint>> resolve(const std::string& host,
                                                   std::uint16_t port);
        Status open_tunnel(PlainStream& stream,
                           std::chrono::milliseconds timeout);

        boost::asio::io_context m_ioc{1};
        ConnectionKey m_key;
        std::uint64_t m_id;
        std::string m_channel;
        std::string m_alpn;
        bool m_via_proxy{false};
        std::atomic<State> m_state{State::Leased};
        std::atomic<bool> m_aborted{false};

        boost::beast::flat_buffer m_buffer{};
        Stream m_stream;
    };

}  // namespace netcall
