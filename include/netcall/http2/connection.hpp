#pragma once

#include <nghttp2/nghttp2.h>

#include <array>
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "netcall/config.hpp"
#include "netcall/http2/stream.hpp"
#include "netcall/result.hpp"
#include "netcall/transport/tcp_connection.hpp"

namespace netcall {

    struct NgSessionDeleter {
        void operator()(nghttp2_session* session) const noexcept {
            nghttp2_session_del(session);
        }
    };

    using NgSessionPtr = std::unique_ptr<nghttp2_session, NgSessionDeleter>;

    /**
     * @brief A client HTTP/2 session multiplexing streams over one transport.
     *
     * The transport's io_context is run by a dedicated thread that owns all
     * socket reads and writes. Callers open and drive streams from their own
     * threads; the nghttp2 session is only touched with mu_ held, so HEADERS
     * frames of different streams are never interleaved on the wire.
     *
     * Inbound flow control is manual: WINDOW_UPDATE frames are sent for bytes
     * the consumer actually read (consume()).
     */
    class Http2Connection
        : public std::enable_shared_from_this<Http2Connection> {
       public:
        using HeaderList = std::vector<std::pair<std::string, std::string>>;

        /// @brief Stream 1 of a connection upgraded from HTTP/1.1.
        struct Upgraded {
            std::shared_ptr<Http2Connection> connection;
            std::shared_ptr<Http2Stream> stream;
        };

        /**
         * @brief Start a session on an open transport (ALPN h2 or prior
         * knowledge). Sends the preface and SETTINGS.
         */
        static Result<std::shared_ptr<Http2Connection>> create(
            std::shared_ptr<TcpConnection> transport,
            const Http2Configuration& cfg);

        /**
         * @brief Continue as HTTP/2 after a 101 response to an h2c upgrade.
         *
         * @param settings_payload The decoded HTTP2-Settings value that was
         * sent with the upgrade request.
         * @param head_request The upgrade request was a HEAD.
         * Bytes already buffered by the transport are fed to the session.
         */
        static Result<Upgraded> from_upgrade(
            std::shared_ptr<TcpConnection> transport,
            const Http2Configuration& cfg, const std::string& settings_payload,
            bool head_request);

        /// @brief SETTINGS payload (not base64 encoded) for @p cfg.
        static std::string settings_payload(const Http2Configuration& cfg);

        ~Http2Connection();

        Http2Connection(const Http2Connection&) = delete;
        Http2Connection& operator=(const Http2Connection&) = delete;

        /**
         * @brief Submit a request HEADERS frame.
         * @param headers Pseudo-headers first, names lower case.
         * @param has_entity DATA frames follow, fed through Http2Stream::push.
         * @param expect_continue Hold DATA until 100-Continue or
         * Http2Stream::open_continue_gate().
         */
        Result<std::shared_ptr<Http2Stream>> open_stream(
            const HeaderList& headers, bool has_entity, bool expect_continue);

        /// @brief Wake the data source of @p stream after it got more output.
        void resume(const Http2Stream& stream);

        /// @brief Return @p n read bytes to the flow-control windows.
        void consume(const Http2Stream& stream, std::size_t n);

        /// @brief Send RST_STREAM for @p stream.
        void reset(const Http2Stream& stream,
                   std::uint32_t error_code = NGHTTP2_CANCEL);

        /// @brief Reset @p stream and fail its waiters with Cancelled.
        void cancel(const std::shared_ptr<Http2Stream>& stream);

        /**
         * @brief Round-trip a PING frame.
         * @return ReadTimeout when no ACK arrived within @p timeout.
         */
        Status ping(std::chrono::milliseconds timeout);

        /// @brief Open, no GOAWAY received, not retired and below the peer's
        /// concurrent stream limit.
        bool accepts_streams() const;

        /// @brief Whether the session is still usable for existing streams.
        bool is_open() const;

        /// @brief Take no new streams; existing streams finish normally.
        void retire();

        /// @brief Fail all streams and close the transport.
        void close();

        const std::string& channel_id() const noexcept {
            return transport_->channel_id();
        }

        const ConnectionKey& key() const noexcept { return transport_->key(); }

        std::chrono::steady_clock::time_point last_used() const {
            return std::chrono::steady_clock::time_point(
                std::chrono::steady_clock::duration(
                    last_used_.load(std::memory_order_relaxed)));
        }

        std::size_t active_streams() const;

       private:
        struct PrivateTag {};

       public:
        Http2Connection(PrivateTag, std::shared_ptr<TcpConnection> transport,
                        const Http2Configuration& cfg);

       private:
        Status init_session(const std::string* upgrade_settings,
                            bool head_request);
        void start();
        void touch() noexcept;

        std::shared_ptr<Http2Stream> find_locked(std::int32_t id) const;
        void fail_locked(const Error& error, bool close_transport = true);

        // io thread
        void post_flush();
        void do_flush();
        void start_read();
        void on_read(const boost::system::error_code& ec,
                     const std::uint8_t* data, std::size_t n);

        static int on_header_cb(nghttp2_session*, const nghttp2_frame* frame,
                                const std::uint8_t* name, std::size_t namelen,
                                const std::uint8_t* value, std::size_t valuelen,
                                std::uint8_t flags, void* user_data);
        static int on_frame_recv_cb(nghttp2_session*,
                                    const nghttp2_frame* frame,
                                    void* user_data);
        static int on_data_chunk_recv_cb(nghttp2_session*, std::uint8_t flags,
                                         std::int32_t stream_id,
                                         const std::uint8_t* data,
                                         std::size_t len, void* user_data);
        static int on_stream_close_cb(nghttp2_session*, std::int32_t stream_id,
                                      std::uint32_t error_code,
                                      void* user_data);
        static ssize_t data_source_read_cb(nghttp2_session*,
                                           std::int32_t stream_id,
                                           std::uint8_t* buf,
                                           std::size_t length,
                                           std::uint32_t* data_flags,
                                           nghttp2_data_source* source,
                                           void* user_data);

        using WorkGuard = boost::asio::executor_work_guard<
            boost::asio::io_context::executor_type>;

        std::shared_ptr<TcpConnection> transport_;
        Http2Configuration cfg_;

        mutable std::mutex mu_;
        std::condition_variable ping_cv_;
        NgSessionPtr session_;
        std::unordered_map<std::int32_t, std::shared_ptr<Http2Stream>>
            streams_;
        bool started_{false};
        bool closed_{false};
        bool goaway_{false};
        bool retired_{false};
        bool writing_{false};
        std::uint64_t pings_sent_{0};
        std::uint64_t pings_acked_{0};

        std::atomic<std::chrono::steady_clock::rep> last_used_{0};

        std::unique_ptr<WorkGuard> work_;
        std::thread io_thread_;
        std::shared_ptr<std::array<std::uint8_t, 16384>> read_buf_;
    };

}  // namespace netcall
