#include "netcall/http2/stream.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>

#include <nghttp2/nghttp2.h>

namespace netcall {

    namespace {

        Error timeout_error(const char* what) {
            return Error{Error::Code::ReadTimeout,
                         std::string(what) + ": read timed out"};
        }

    }  // namespace

    Status Http2Stream::await_headers(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_);
        auto ready = [&] { return headers_done_ || error_.has_value(); };
        if (timeout.count() > 0) {
            if (!cv_.wait_for(lk, timeout, ready))
                return Status::err(timeout_error("Response headers"));
        } else {
            cv_.wait(lk, ready);
        }
        if (!headers_done_) return Status::err(*error_);
        return Status::ok();
    }

    Result<Http2Stream::ContinueWait> Http2Stream::await_continue(
        std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_);
        auto ready = [&] {
            return got_continue_ || headers_done_ || error_.has_value();
        };
        if (!cv_.wait_for(lk, timeout, ready)) {
            return Result<ContinueWait>::ok(ContinueWait::TimedOut);
        }
        if (headers_done_) {
            return Result<ContinueWait>::ok(ContinueWait::FinalResponse);
        }
        if (got_continue_) {
            return Result<ContinueWait>::ok(ContinueWait::Continue);
        }
        return Result<ContinueWait>::err(*error_);
    }

    Result<std::size_t> Http2Stream::read(void* data, std::size_t size,
                                          std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_);
        auto ready = [&] {
            return !inbound_.empty() || remote_ended_ || error_.has_value();
        };
        if (timeout.count() > 0) {
            if (!cv_.wait_for(lk, timeout, ready))
                return Result<std::size_t>::err(timeout_error("Entity"));
        } else {
            cv_.wait(lk, ready);
        }

        if (inbound_.empty()) {
            if (remote_ended_) return Result<std::size_t>::ok(0);
            return Result<std::size_t>::err(*error_);
        }

        auto* out = static_cast<char*>(data);
        std::size_t copied = 0;
        while (copied < size && !inbound_.empty()) {
            const auto& front = inbound_.front();
            const std::size_t n =
                std::min(size - copied, front.size() - inbound_offset_);
            std::memcpy(out + copied, front.data() + inbound_offset_, n);
            copied += n;
            inbound_offset_ += n;
            if (inbound_offset_ == front.size()) {
                inbound_.pop_front();
                inbound_offset_ = 0;
            }
        }
        return Result<std::size_t>::ok(copied);
    }

    std::size_t Http2Stream::discard_buffered() {
        std::lock_guard<std::mutex> lk(m_);
        std::size_t dropped = 0;
        for (const auto& chunk : inbound_) dropped += chunk.size();
        dropped -= inbound_offset_;
        inbound_.clear();
        inbound_offset_ = 0;
        return dropped;
    }

    bool Http2Stream::entity_ended() const {
        std::lock_guard<std::mutex> lk(m_);
        return remote_ended_ && inbound_.empty();
    }

    Status Http2Stream::push(std::string_view data, std::size_t queue_limit,
                             std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_);
        auto has_room = [&] {
            return output_dropped_ || error_.has_value() ||
                   outbound_bytes_ < queue_limit;
        };
        if (timeout.count() > 0) {
            if (!cv_.wait_for(lk, timeout, has_room)) {
                return Status::err(Error::Code::SendFailed,
                                   "Timed out waiting for flow-control window");
            }
        } else {
            cv_.wait(lk, has_room);
        }

        if (output_dropped_) return Status::ok();
        if (error_) return Status::err(*error_);
        if (output_closed_) {
            return Status::err(Error::Code::InvalidState,
                               "Stream output is closed");
        }
        outbound_.emplace_back(data);
        outbound_bytes_ += data.size();
        return Status::ok();
    }

    void Http2Stream::close_output() {
        std::lock_guard<std::mutex> lk(m_);
        output_closed_ = true;
    }

    void Http2Stream::drop_output() {
        std::lock_guard<std::mutex> lk(m_);
        output_dropped_ = true;
        output_closed_ = true;
        continue_gate_ = false;
        outbound_.clear();
        outbound_offset_ = 0;
        outbound_bytes_ = 0;
        cv_.notify_all();
    }

    void Http2Stream::open_continue_gate() {
        std::lock_guard<std::mutex> lk(m_);
        continue_gate_ = false;
    }

    // -------- io thread side --------

    void Http2Stream::on_header(std::string_view name, std::string_view value) {
        std::lock_guard<std::mutex> lk(m_);
        if (headers_done_) {
            trailers_.insert(boost::beast::string_view(name.data(), name.size()),
                             boost::beast::string_view(value.data(),
                                                       value.size()));
            return;
        }
        if (name == ":status") {
            int code = 0;
            std::from_chars(value.data(), value.data() + value.size(), code);
            block_status_ = code;
            return;
        }
        if (!name.empty() && name.front() == ':') return;
        block_headers_.insert(boost::beast::string_view(name.data(), name.size()),
                              boost::beast::string_view(value.data(),
                                                        value.size()));
    }

    bool Http2Stream::on_headers_end(bool end_stream) {
        std::lock_guard<std::mutex> lk(m_);
        bool opened_gate = false;

        if (!headers_done_) {
            if (block_status_ >= 100 && block_status_ < 200) {
                if (block_status_ == 100 && !got_continue_) {
                    got_continue_ = true;
                    opened_gate = continue_gate_;
                    continue_gate_ = false;
                }
                block_headers_.clear();
                block_status_ = 0;
            } else {
                status_ = block_status_;
                headers_ = std::move(block_headers_);
                block_headers_.clear();
                headers_done_ = true;
            }
        }
        if (end_stream) on_remote_end_locked();
        cv_.notify_all();
        return opened_gate;
    }

    void Http2Stream::on_data(const std::uint8_t* data, std::size_t len) {
        std::lock_guard<std::mutex> lk(m_);
        inbound_.emplace_back(reinterpret_cast<const char*>(data), len);
        cv_.notify_all();
    }

    void Http2Stream::on_remote_end_locked() {
        remote_ended_ = true;
        if (state_ == State::Open) {
            state_ = State::HalfClosedRemote;
        } else if (state_ == State::HalfClosedLocal) {
            state_ = State::Closed;
        }
    }

    void Http2Stream::on_close(std::uint32_t error_code) {
        std::lock_guard<std::mutex> lk(m_);
        state_ = State::Closed;
        if (error_code != NGHTTP2_NO_ERROR && !remote_ended_ && !error_) {
            error_ = Error{Error::Code::StreamReset,
                           std::string("Stream reset: ") +
                               nghttp2_http2_strerror(error_code)};
        } else if (!remote_ended_ && !error_) {
            error_ = Error{Error::Code::ReceiveFailed,
                           "Stream closed before the response ended"};
        }
        cv_.notify_all();
    }

    void Http2Stream::fail(const Error& error) {
        std::lock_guard<std::mutex> lk(m_);
        state_ = State::Closed;
        if (!error_ && !remote_ended_) error_ = error;
        cv_.notify_all();
    }

    long Http2Stream::fill(std::uint8_t* buf, std::size_t length, bool& eof) {
        std::lock_guard<std::mutex> lk(m_);
        eof = false;

        if (output_dropped_) {
            eof = true;
        } else if (continue_gate_) {
            return -1;
        } else {
            std::size_t copied = 0;
            while (copied < length && !outbound_.empty()) {
                const auto& front = outbound_.front();
                const std::size_t n =
                    std::min(length - copied, front.size() - outbound_offset_);
                std::memcpy(buf + copied, front.data() + outbound_offset_, n);
                copied += n;
                outbound_offset_ += n;
                if (outbound_offset_ == front.size()) {
                    outbound_.pop_front();
                    outbound_offset_ = 0;
                }
            }
            outbound_bytes_ -= copied;
            cv_.notify_all();

            if (outbound_.empty() && output_closed_) {
                eof = true;
            } else if (copied == 0) {
                return -1;
            }
            if (!eof) return static_cast<long>(copied);
            if (copied > 0) {
                if (state_ == State::Open) {
                    state_ = State::HalfClosedLocal;
                } else if (state_ == State::HalfClosedRemote) {
                    state_ = State::Closed;
                }
                return static_cast<long>(copied);
            }
        }

        if (state_ == State::Open) {
            state_ = State::HalfClosedLocal;
        } else if (state_ == State::HalfClosedRemote) {
            state_ = State::Closed;
        }
        return 0;
    }

}  // namespace netcall
