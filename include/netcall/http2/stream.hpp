#pragma once

#include <boost/beast/http/fields.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "netcall/result.hpp"

namespace netcall {

    class Http2Connection;

    /**
     * @brief One HTTP/2 request/response exchange inside a connection.
     *
     * The connection's io thread fills the inbound side and drains the
     * outbound side; the thread owning the request reads and writes through
     * the public members. All state is guarded by the stream mutex, which is
     * always taken after the connection mutex.
     */
    class Http2Stream {
       public:
        enum class State { Idle, Open, HalfClosedLocal, HalfClosedRemote, Closed };

        /** @brief Outcome of waiting for 100-Continue. */
        enum class ContinueWait { Continue, FinalResponse, TimedOut };

        explicit Http2Stream(bool expect_continue = false)
            : continue_gate_(expect_continue) {}

        Http2Stream(const Http2Stream&) = delete;
        Http2Stream& operator=(const Http2Stream&) = delete;

        std::int32_t id() const {
            std::lock_guard<std::mutex> lk(m_);
            return id_;
        }

        State state() const {
            std::lock_guard<std::mutex> lk(m_);
            return state_;
        }

        // -------- response side --------

        /// @brief Wait for the final (non-1xx) response header block.
        Status await_headers(std::chrono::milliseconds timeout);

        /// @brief Wait for 100-Continue, an early final response or
        /// @p timeout, whichever comes first.
        Result<ContinueWait> await_continue(std::chrono::milliseconds timeout);

        /**
         * @brief Read buffered DATA, waiting up to @p timeout for more.
         * @return Bytes copied; 0 once the peer ended the stream and all
         * data was read. ReadTimeout when nothing arrived in time.
         */
        Result<std::size_t> read(void* data, std::size_t size,
                                 std::chrono::milliseconds timeout);

        /// @brief Drop unread DATA; returns the number of bytes dropped.
        std::size_t discard_buffered();

        /// @brief Peer ended the stream and every byte was read.
        bool entity_ended() const;

        int status() const {
            std::lock_guard<std::mutex> lk(m_);
            return status_;
        }

        /// @note Stable once await_headers() returned successfully.
        const boost::beast::http::fields& headers() const noexcept {
            return headers_;
        }

        /// @note Stable once entity_ended() is true.
        const boost::beast::http::fields& trailers() const noexcept {
            return trailers_;
        }

        // -------- request side --------

        /**
         * @brief Queue entity bytes, blocking while more than @p queue_limit
         * bytes are waiting to be framed.
         * @return No-op success once output was dropped.
         */
        Status push(std::string_view data, std::size_t queue_limit,
                    std::chrono::milliseconds timeout);

        /// @brief No more entity bytes follow.
        void close_output();

        /// @brief Discard queued and future entity bytes (final response
        /// arrived before the entity was sent).
        void drop_output();

        /// @brief Let the entity flow without a 100-Continue.
        void open_continue_gate();

        bool output_dropped() const {
            std::lock_guard<std::mutex> lk(m_);
            return output_dropped_;
        }

       private:
        friend class Http2Connection;

        // Called by the connection with its mutex held.
        void on_header(std::string_view name, std::string_view value);
        /// @return true when a 100-Continue opened the gate.
        bool on_headers_end(bool end_stream);
        void on_data(const std::uint8_t* data, std::size_t len);
        void on_remote_end_locked();
        void on_close(std::uint32_t error_code);
        void fail(const Error& error);
        /// @return Bytes copied, or -1 when the data source must defer.
        long fill(std::uint8_t* buf, std::size_t length, bool& eof);

        mutable std::mutex m_;
        std::condition_variable cv_;

        std::int32_t id_{-1};
        State state_{State::Idle};

        int block_status_{0};
        boost::beast::http::fields block_headers_;
        int status_{0};
        bool headers_done_{false};
        boost::beast::http::fields headers_;
        boost::beast::http::fields trailers_;

        std::deque<std::string> inbound_;
        std::size_t inbound_offset_{0};
        bool remote_ended_{false};
        std::optional<Error> error_;

        std::deque<std::string> outbound_;
        std::size_t outbound_offset_{0};
        std::size_t outbound_bytes_{0};
        bool output_closed_{false};
        bool output_dropped_{false};
        bool continue_gate_{false};
        bool got_continue_{false};
    };

}  // namespace netcall
