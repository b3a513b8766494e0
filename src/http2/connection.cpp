#include "netcall/http2/connection.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <string_view>

#include "netcall/log.hpp"

namespace net = boost::asio;

namespace netcall {

    namespace {

        constexpr std::size_t kMaxWriteBatch = 64 * 1024;

        std::vector<nghttp2_settings_entry> settings_entries(
            const Http2Configuration& cfg) {
            return {
                {NGHTTP2_SETTINGS_ENABLE_PUSH, 0},
                {NGHTTP2_SETTINGS_INITIAL_WINDOW_SIZE, cfg.initial_window_size},
                {NGHTTP2_SETTINGS_MAX_FRAME_SIZE, cfg.max_frame_size},
                {NGHTTP2_SETTINGS_MAX_HEADER_LIST_SIZE,
                 cfg.max_header_list_size},
            };
        }

        nghttp2_nv make_nv(const std::string& name, const std::string& value) {
            nghttp2_nv nv;
            nv.name = const_cast<std::uint8_t*>(
                reinterpret_cast<const std::uint8_t*>(name.data()));
            nv.value = const_cast<std::uint8_t*>(
                reinterpret_cast<const std::uint8_t*>(value.data()));
            nv.namelen = name.size();
            nv.valuelen = value.size();
            nv.flags = NGHTTP2_NV_FLAG_NONE;
            return nv;
        }

        Http2Connection* self_of(void* user_data) {
            return static_cast<Http2Connection*>(user_data);
        }

    }  // namespace

    std::string Http2Connection::settings_payload(
        const Http2Configuration& cfg) {
        auto iv = settings_entries(cfg);
        std::string out(iv.size() * 6, '\0');
        auto n = nghttp2_pack_settings_payload(
            reinterpret_cast<std::uint8_t*>(out.data()), out.size(), iv.data(),
            iv.size());
        if (n < 0) return {};
        out.resize(static_cast<std::size_t>(n));
        return out;
    }

    Http2Connection::Http2Connection(PrivateTag,
                                     std::shared_ptr<TcpConnection> transport,
                                     const Http2Configuration& cfg)
        : transport_(std::move(transport)),
          cfg_(cfg),
          read_buf_(std::make_shared<std::array<std::uint8_t, 16384>>()) {}

    Http2Connection::~Http2Connection() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!closed_) {
                fail_locked(Error{Error::Code::ReceiveFailed,
                                  "HTTP/2 connection closed"});
            }
        }
        if (io_thread_.joinable()) {
            if (io_thread_.get_id() == std::this_thread::get_id()) {
                io_thread_.detach();
            } else {
                io_thread_.join();
            }
        }
    }

    Result<std::shared_ptr<Http2Connection>> Http2Connection::create(
        std::shared_ptr<TcpConnection> transport,
        const Http2Configuration& cfg) {
        auto conn = std::make_shared<Http2Connection>(
            PrivateTag{}, std::move(transport), cfg);
        {
            std::lock_guard<std::mutex> lk(conn->mu_);
            if (auto st = conn->init_session(nullptr, false); st.has_error()) {
                return st.propagate<std::shared_ptr<Http2Connection>>();
            }
        }
        conn->start();
        return Result<std::shared_ptr<Http2Connection>>::ok(std::move(conn));
    }

    Result<Http2Connection::Upgraded> Http2Connection::from_upgrade(
        std::shared_ptr<TcpConnection> transport, const Http2Configuration& cfg,
        const std::string& settings_payload, bool head_request) {
        auto conn = std::make_shared<Http2Connection>(
            PrivateTag{}, std::move(transport), cfg);
        auto stream = std::make_shared<Http2Stream>(false);
        {
            std::lock_guard<std::mutex> lk(conn->mu_);
            if (auto st = conn->init_session(&settings_payload, head_request);
                st.has_error()) {
                return st.propagate<Upgraded>();
            }

            {
                std::lock_guard<std::mutex> slk(stream->m_);
                stream->id_ = 1;
                stream->state_ = Http2Stream::State::HalfClosedLocal;
            }
            conn->streams_.emplace(1, stream);

            // Frames the server sent right behind the 101 response.
            auto& buffered = conn->transport_->buffer();
            if (buffered.size() > 0) {
                auto data = buffered.data();
                auto rv = nghttp2_session_mem_recv(
                    conn->session_.get(),
                    static_cast<const std::uint8_t*>(data.data()), data.size());
                buffered.consume(buffered.size());
                if (rv < 0) {
                    return Result<Upgraded>::err(
                        Error::Code::ProtocolError,
                        std::string("HTTP/2 protocol error after upgrade: ") +
                            nghttp2_strerror(static_cast<int>(rv)));
                }
            }
        }
        conn->start();
        return Result<Upgraded>::ok(Upgraded{std::move(conn), std::move(stream)});
    }

    Status Http2Connection::init_session(const std::string* upgrade_settings,
                                         bool head_request) {
        nghttp2_session_callbacks* callbacks = nullptr;
        if (nghttp2_session_callbacks_new(&callbacks) != 0) {
            return Status::err(Error::Code::Unknown,
                               "Failed to create nghttp2 callbacks");
        }
        nghttp2_session_callbacks_set_on_header_callback(callbacks,
                                                         &on_header_cb);
        nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks,
                                                             &on_frame_recv_cb);
        nghttp2_session_callbacks_set_on_data_chunk_recv_callback(
            callbacks, &on_data_chunk_recv_cb);
        nghttp2_session_callbacks_set_on_stream_close_callback(
            callbacks, &on_stream_close_cb);

        nghttp2_option* option = nullptr;
        if (nghttp2_option_new(&option) != 0) {
            nghttp2_session_callbacks_del(callbacks);
            return Status::err(Error::Code::Unknown,
                               "Failed to create nghttp2 options");
        }
        nghttp2_option_set_no_auto_window_update(option, 1);

        nghttp2_session* raw = nullptr;
        int rv = nghttp2_session_client_new2(&raw, callbacks, this, option);
        nghttp2_session_callbacks_del(callbacks);
        nghttp2_option_del(option);
        if (rv != 0) {
            return Status::err(Error::Code::Unknown,
                               std::string("Failed to create HTTP/2 session: ") +
                                   nghttp2_strerror(rv));
        }
        session_.reset(raw);

        if (upgrade_settings) {
            rv = nghttp2_session_upgrade2(
                raw,
                reinterpret_cast<const std::uint8_t*>(upgrade_settings->data()),
                upgrade_settings->size(), head_request ? 1 : 0, nullptr);
            if (rv != 0) {
                return Status::err(Error::Code::ProtocolError,
                                   std::string("HTTP/2 upgrade failed: ") +
                                       nghttp2_strerror(rv));
            }
        }

        auto iv = settings_entries(cfg_);
        rv = nghttp2_submit_settings(raw, NGHTTP2_FLAG_NONE, iv.data(),
                                     iv.size());
        if (rv != 0) {
            return Status::err(Error::Code::ProtocolError,
                               std::string("Failed to submit SETTINGS: ") +
                                   nghttp2_strerror(rv));
        }

        if (cfg_.initial_window_size > NGHTTP2_INITIAL_CONNECTION_WINDOW_SIZE) {
            rv = nghttp2_session_set_local_window_size(
                raw, NGHTTP2_FLAG_NONE, 0,
                static_cast<std::int32_t>(cfg_.initial_window_size));
            if (rv != 0) {
                return Status::err(Error::Code::ProtocolError,
                                   std::string("Failed to set window: ") +
                                       nghttp2_strerror(rv));
            }
        }
        return Status::ok();
    }

    void Http2Connection::start() {
        touch();
        transport_->disable_timeouts();
        transport_->io().restart();
        work_ = std::make_unique<WorkGuard>(
            net::make_work_guard(transport_->io()));

        start_read();
        post_flush();

        std::lock_guard<std::mutex> lk(mu_);
        started_ = true;
        io_thread_ = std::thread([transport = transport_] {
            transport->io().run();
        });
        log::logger()->debug("{} HTTP/2 session started for {}",
                             channel_id(), key().authority());
    }

    void Http2Connection::touch() noexcept {
        last_used_.store(
            std::chrono::steady_clock::now().time_since_epoch().count(),
            std::memory_order_relaxed);
    }

    std::shared_ptr<Http2Stream> Http2Connection::find_locked(
        std::int32_t id) const {
        auto it = streams_.find(id);
        return it == streams_.end() ? nullptr : it->second;
    }

    void Http2Connection::fail_locked(const Error& error,
                                      bool close_transport) {
        if (closed_) return;
        closed_ = true;
        log::logger()->debug("{} HTTP/2 session closed: {}", channel_id(),
                             error.message);

        for (auto& [id, stream] : streams_) stream->fail(error);
        streams_.clear();
        ping_cv_.notify_all();

        if (!started_) {
            transport_->close();
        } else if (close_transport) {
            net::post(transport_->io(), [t = transport_] { t->close(); });
        }
        work_.reset();
    }

    // -------- caller side --------

    Result<std::shared_ptr<Http2Stream>> Http2Connection::open_stream(
        const HeaderList& headers, bool has_entity, bool expect_continue) {
        auto stream =
            std::make_shared<Http2Stream>(has_entity && expect_continue);

        std::vector<nghttp2_nv> nva;
        nva.reserve(headers.size());
        for (const auto& [name, value] : headers) {
            nva.push_back(make_nv(name, value));
        }

        nghttp2_data_provider provider;
        provider.source.ptr = nullptr;
        provider.read_callback = &data_source_read_cb;

        std::int32_t id = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_ || goaway_ || retired_) {
                return Result<std::shared_ptr<Http2Stream>>::err(
                    Error::Code::InvalidState,
                    "HTTP/2 connection does not accept new streams");
            }

            id = nghttp2_submit_request(session_.get(), nullptr, nva.data(),
                                        nva.size(),
                                        has_entity ? &provider : nullptr,
                                        nullptr);
            if (id < 0) {
                return Result<std::shared_ptr<Http2Stream>>::err(
                    Error::Code::SendFailed,
                    std::string("Failed to submit HTTP/2 request: ") +
                        nghttp2_strerror(id));
            }

            {
                std::lock_guard<std::mutex> slk(stream->m_);
                stream->id_ = id;
                stream->state_ = has_entity
                                     ? Http2Stream::State::Open
                                     : Http2Stream::State::HalfClosedLocal;
            }
            streams_.emplace(id, stream);
        }

        touch();
        log::logger()->trace("{} stream {} opened", channel_id(), id);
        post_flush();
        return Result<std::shared_ptr<Http2Stream>>::ok(std::move(stream));
    }

    void Http2Connection::resume(const Http2Stream& stream) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return;
            int rv = nghttp2_session_resume_data(session_.get(), stream.id());
            if (rv != 0 && rv != NGHTTP2_ERR_INVALID_ARGUMENT) {
                log::logger()->trace("{} stream {} resume: {}", channel_id(),
                                     stream.id(), nghttp2_strerror(rv));
            }
        }
        post_flush();
    }

    void Http2Connection::consume(const Http2Stream& stream, std::size_t n) {
        if (n == 0) return;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return;
            int rv = nghttp2_session_consume(session_.get(), stream.id(), n);
            if (rv != 0) {
                log::logger()->trace("{} stream {} consume: {}", channel_id(),
                                     stream.id(), nghttp2_strerror(rv));
            }
        }
        post_flush();
    }

    void Http2Connection::reset(const Http2Stream& stream,
                                std::uint32_t error_code) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return;
            int rv = nghttp2_submit_rst_stream(session_.get(),
                                               NGHTTP2_FLAG_NONE, stream.id(),
                                               error_code);
            if (rv != 0) {
                log::logger()->trace("{} stream {} reset: {}", channel_id(),
                                     stream.id(), nghttp2_strerror(rv));
                return;
            }
        }
        log::logger()->debug("{} stream {} reset ({})", channel_id(),
                             stream.id(), nghttp2_http2_strerror(error_code));
        post_flush();
    }

    void Http2Connection::cancel(const std::shared_ptr<Http2Stream>& stream) {
        reset(*stream);
        std::lock_guard<std::mutex> lk(mu_);
        stream->fail(Error{Error::Code::Cancelled, "Request was cancelled"});
    }

    Status Http2Connection::ping(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        if (closed_) {
            return Status::err(Error::Code::ReceiveFailed,
                               "HTTP/2 connection closed");
        }
        int rv = nghttp2_submit_ping(session_.get(), NGHTTP2_FLAG_NONE, nullptr);
        if (rv != 0) {
            return Status::err(Error::Code::SendFailed,
                               std::string("Failed to submit PING: ") +
                                   nghttp2_strerror(rv));
        }
        const auto target = ++pings_sent_;
        post_flush();

        if (!ping_cv_.wait_for(lk, timeout, [&] {
                return closed_ || pings_acked_ >= target;
            })) {
            return Status::err(Error::Code::ReadTimeout,
                               "HTTP/2 PING was not acknowledged");
        }
        if (pings_acked_ < target) {
            return Status::err(Error::Code::ReceiveFailed,
                               "HTTP/2 connection closed");
        }
        return Status::ok();
    }

    bool Http2Connection::accepts_streams() const {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_ || goaway_ || retired_) return false;
        if (nghttp2_session_check_request_allowed(session_.get()) == 0)
            return false;
        const auto max = nghttp2_session_get_remote_settings(
            session_.get(), NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS);
        return streams_.size() < max;
    }

    bool Http2Connection::is_open() const {
        std::lock_guard<std::mutex> lk(mu_);
        return !closed_;
    }

    void Http2Connection::retire() {
        std::lock_guard<std::mutex> lk(mu_);
        if (!retired_) {
            retired_ = true;
            log::logger()->debug("{} retired", channel_id());
        }
        if (!closed_ && streams_.empty()) {
            fail_locked(Error{Error::Code::ReceiveFailed,
                              "HTTP/2 connection retired"});
        }
    }

    void Http2Connection::close() {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return;

        // GOAWAY is sent only when no write is in flight; the transport is
        // closed once it was written.
        auto out = std::make_shared<std::string>();
        if (!writing_ && nghttp2_session_terminate_session(
                             session_.get(), NGHTTP2_NO_ERROR) == 0) {
            for (;;) {
                const std::uint8_t* data = nullptr;
                auto len = nghttp2_session_mem_send(session_.get(), &data);
                if (len <= 0) break;
                out->append(reinterpret_cast<const char*>(data),
                            static_cast<std::size_t>(len));
            }
        }
        if (!out->empty()) {
            writing_ = true;
            auto t = transport_;
            net::post(t->io(), [t, out] {
                t->async_write(
                    net::buffer(*out),
                    [t, out](boost::system::error_code, std::size_t) {
                        t->close();
                    });
            });
        }
        fail_locked(
            Error{Error::Code::ReceiveFailed, "HTTP/2 connection closed"},
            out->empty());
    }

    std::size_t Http2Connection::active_streams() const {
        std::lock_guard<std::mutex> lk(mu_);
        return streams_.size();
    }

    // -------- io thread --------

    void Http2Connection::post_flush() {
        std::weak_ptr<Http2Connection> weak = weak_from_this();
        net::post(transport_->io(), [weak] {
            if (auto self = weak.lock()) self->do_flush();
        });
    }

    void Http2Connection::do_flush() {
        auto out = std::make_shared<std::string>();
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_ || writing_) return;
            for (;;) {
                const std::uint8_t* data = nullptr;
                auto len = nghttp2_session_mem_send(session_.get(), &data);
                if (len < 0) {
                    fail_locked(Error{
                        Error::Code::ProtocolError,
                        std::string("HTTP/2 send failed: ") +
                            nghttp2_strerror(static_cast<int>(len))});
                    return;
                }
                if (len == 0) break;
                out->append(reinterpret_cast<const char*>(data),
                            static_cast<std::size_t>(len));
                if (out->size() >= kMaxWriteBatch) break;
            }
            if (out->empty()) return;
            writing_ = true;
        }

        std::weak_ptr<Http2Connection> weak = weak_from_this();
        transport_->async_write(
            net::buffer(*out),
            [weak, out](boost::system::error_code ec, std::size_t) {
                auto self = weak.lock();
                if (!self) return;
                {
                    std::lock_guard<std::mutex> lk(self->mu_);
                    self->writing_ = false;
                    if (ec) {
                        self->fail_locked(self->transport_->io_error(
                            Error::Code::SendFailed, "HTTP/2 write failed",
                            ec));
                        return;
                    }
                }
                self->do_flush();
            });
    }

    void Http2Connection::start_read() {
        std::weak_ptr<Http2Connection> weak = weak_from_this();
        auto buf = read_buf_;
        transport_->async_read_some(
            net::buffer(*buf),
            [weak, buf](boost::system::error_code ec, std::size_t n) {
                if (auto self = weak.lock()) {
                    self->on_read(ec, buf->data(), n);
                }
            });
    }

    void Http2Connection::on_read(const boost::system::error_code& ec,
                                  const std::uint8_t* data, std::size_t n) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return;
            if (ec) {
                fail_locked(transport_->io_error(Error::Code::ReceiveFailed,
                                                 "HTTP/2 read failed", ec));
                return;
            }

            auto rv = nghttp2_session_mem_recv(session_.get(), data, n);
            if (rv < 0) {
                fail_locked(Error{Error::Code::ProtocolError,
                                  std::string("HTTP/2 protocol error: ") +
                                      nghttp2_strerror(static_cast<int>(rv))});
                return;
            }
            if (nghttp2_session_want_read(session_.get()) == 0 &&
                nghttp2_session_want_write(session_.get()) == 0) {
                fail_locked(Error{Error::Code::ReceiveFailed,
                                  "HTTP/2 session ended"});
                return;
            }
        }
        do_flush();
        start_read();
    }

    // -------- nghttp2 callbacks (mu_ held) --------

    int Http2Connection::on_header_cb(nghttp2_session*,
                                      const nghttp2_frame* frame,
                                      const std::uint8_t* name,
                                      std::size_t namelen,
                                      const std::uint8_t* value,
                                      std::size_t valuelen, std::uint8_t,
                                      void* user_data) {
        if (frame->hd.type != NGHTTP2_HEADERS) return 0;
        auto stream = self_of(user_data)->find_locked(frame->hd.stream_id);
        if (!stream) return 0;
        stream->on_header(
            std::string_view(reinterpret_cast<const char*>(name), namelen),
            std::string_view(reinterpret_cast<const char*>(value), valuelen));
        return 0;
    }

    int Http2Connection::on_frame_recv_cb(nghttp2_session* session,
                                          const nghttp2_frame* frame,
                                          void* user_data) {
        auto* self = self_of(user_data);
        const bool end_stream = (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) != 0;

        switch (frame->hd.type) {
            case NGHTTP2_HEADERS: {
                auto stream = self->find_locked(frame->hd.stream_id);
                if (!stream) break;
                if (stream->on_headers_end(end_stream)) {
                    log::logger()->trace("{} stream {} 100-Continue",
                                         self->channel_id(),
                                         frame->hd.stream_id);
                    if (nghttp2_session_resume_data(
                            session, frame->hd.stream_id) != 0) {
                        log::logger()->trace("{} stream {} has no deferred data",
                                             self->channel_id(),
                                             frame->hd.stream_id);
                    }
                }
                break;
            }
            case NGHTTP2_DATA: {
                if (!end_stream) break;
                auto stream = self->find_locked(frame->hd.stream_id);
                if (!stream) break;
                std::lock_guard<std::mutex> slk(stream->m_);
                stream->on_remote_end_locked();
                stream->cv_.notify_all();
                break;
            }
            case NGHTTP2_GOAWAY:
                self->goaway_ = true;
                log::logger()->debug("{} GOAWAY received ({})",
                                     self->channel_id(),
                                     nghttp2_http2_strerror(
                                         frame->goaway.error_code));
                break;
            case NGHTTP2_PING:
                if ((frame->hd.flags & NGHTTP2_FLAG_ACK) != 0) {
                    ++self->pings_acked_;
                    self->ping_cv_.notify_all();
                }
                break;
            default:
                break;
        }
        return 0;
    }

    int Http2Connection::on_data_chunk_recv_cb(nghttp2_session* session,
                                               std::uint8_t,
                                               std::int32_t stream_id,
                                               const std::uint8_t* data,
                                               std::size_t len,
                                               void* user_data) {
        auto stream = self_of(user_data)->find_locked(stream_id);
        if (!stream) {
            return nghttp2_session_consume_connection(session, len) == 0
                       ? 0
                       : NGHTTP2_ERR_CALLBACK_FAILURE;
        }
        stream->on_data(data, len);
        return 0;
    }

    int Http2Connection::on_stream_close_cb(nghttp2_session*,
                                            std::int32_t stream_id,
                                            std::uint32_t error_code,
                                            void* user_data) {
        auto* self = self_of(user_data);
        auto it = self->streams_.find(stream_id);
        if (it == self->streams_.end()) return 0;
        it->second->on_close(error_code);
        self->streams_.erase(it);
        log::logger()->trace("{} stream {} closed", self->channel_id(),
                             stream_id);
        if (self->retired_ && self->streams_.empty()) {
            self->fail_locked(Error{Error::Code::ReceiveFailed,
                                    "HTTP/2 connection retired"});
        }
        return 0;
    }

    ssize_t Http2Connection::data_source_read_cb(nghttp2_session*,
                                                 std::int32_t stream_id,
                                                 std::uint8_t* buf,
                                                 std::size_t length,
                                                 std::uint32_t* data_flags,
                                                 nghttp2_data_source*,
                                                 void* user_data) {
        auto stream = self_of(user_data)->find_locked(stream_id);
        if (!stream) return NGHTTP2_ERR_TEMPORAL_CALLBACK_FAILURE;

        bool eof = false;
        const long n = stream->fill(buf, length, eof);
        if (n < 0) return NGHTTP2_ERR_DEFERRED;
        if (eof) *data_flags |= NGHTTP2_DATA_FLAG_EOF;
        return static_cast<ssize_t>(n);
    }

}  // namespace netcall
