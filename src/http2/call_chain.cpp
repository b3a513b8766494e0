#include "netcall/http2/call_chain.hpp"

#include <boost/beast/http/status.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string_view>

#include "netcall/http1/call_chain.hpp"
#include "netcall/log.hpp"

namespace http = boost::beast::http;

namespace netcall {

    namespace {

        /// Fields that only have meaning for a single HTTP/1.1 connection.
        constexpr std::array<std::string_view, 8> kConnectionSpecific = {
            "connection", "keep-alive", "proxy-connection", "transfer-encoding",
            "upgrade",    "host",       "http2-settings",   "expect"};

        std::string lower(std::string_view in) {
            std::string out(in);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        class Http2Exchange {
           public:
            Http2Exchange(std::shared_ptr<Http2Connection> connection,
                          const PreparedRequest& request,
                          const ClientConfiguration& cfg,
                          CancellationToken* cancel)
                : conn_(std::move(connection)),
                  request_(request),
                  cfg_(cfg),
                  cancel_(cancel) {}

            Status open(bool has_entity) {
                const bool expect = has_entity && request_.expect_continue;
                auto opened = conn_->open_stream(
                    h2_header_list(request_, expect), has_entity, expect);
                if (opened.has_error()) return opened.propagate<std::monostate>();
                stream_ = std::move(opened).value();

                if (cancel_) {
                    registration_ = cancel_->on_cancel(
                        [conn = conn_, stream = stream_] {
                            conn->cancel(stream);
                        });
                }
                if (expect) return await_continue();
                return Status::ok();
            }

            Status write(std::string_view data) {
                if (data.empty()) return Status::ok();
                if (request_.framing.framing == Framing::ContentLength) {
                    const auto declared =
                        request_.framing.content_length.value_or(0);
                    if (written_ + data.size() > declared) {
                        return Status::err(
                            Error::Code::InvalidArgument,
                            "Entity exceeds Content-Length of " +
                                std::to_string(declared) + " bytes");
                    }
                }
                written_ += data.size();
                auto st = stream_->push(data, cfg_.http2.write_queue_limit,
                                        request_.read_timeout);
                conn_->resume(*stream_);
                return st;
            }

            Status end() {
                if (request_.framing.framing == Framing::ContentLength &&
                    !stream_->output_dropped() &&
                    written_ != request_.framing.content_length.value_or(0)) {
                    return Status::err(
                        Error::Code::InvalidState,
                        "Entity ended after " + std::to_string(written_) +
                            " of " +
                            std::to_string(*request_.framing.content_length) +
                            " bytes declared by Content-Length");
                }
                stream_->close_output();
                conn_->resume(*stream_);
                return Status::ok();
            }

            bool opened() const noexcept { return stream_ != nullptr; }

            /// Reset the stream of a request that failed while sending.
            void abandon() {
                if (stream_) conn_->reset(*stream_);
            }

            const std::shared_ptr<Http2Stream>& stream() const noexcept {
                return stream_;
            }

           private:
            Status await_continue() {
                auto waited = stream_->await_continue(cfg_.read_continue_timeout);
                if (waited.has_error()) return waited.propagate<std::monostate>();

                switch (waited.value()) {
                    case Http2Stream::ContinueWait::Continue:
                        return Status::ok();
                    case Http2Stream::ContinueWait::FinalResponse:
                        log::logger()->debug(
                            "{} stream {} final response received before "
                            "the entity",
                            conn_->channel_id(), stream_->id());
                        stream_->drop_output();
                        conn_->resume(*stream_);
                        return Status::ok();
                    case Http2Stream::ContinueWait::TimedOut:
                        break;
                }

                if (cfg_.continue_timeout_policy ==
                    ContinueTimeoutPolicy::Fail) {
                    return Status::err(
                        Error::Code::ReadTimeout,
                        "100-Continue not received within " +
                            std::to_string(cfg_.read_continue_timeout.count()) +
                            " ms");
                }
                log::logger()->warn(
                    "{} stream {} 100-Continue not received within {} ms, "
                    "sending entity",
                    conn_->channel_id(), stream_->id(),
                    cfg_.read_continue_timeout.count());
                stream_->open_continue_gate();
                conn_->resume(*stream_);
                return Status::ok();
            }

            std::shared_ptr<Http2Connection> conn_;
            const PreparedRequest& request_;
            const ClientConfiguration& cfg_;
            CancellationToken* cancel_;
            CancellationToken::Registration registration_;
            std::shared_ptr<Http2Stream> stream_;
            std::uint64_t written_{0};
        };

        /// Opens the stream on the first write() or on close().
        class Http2EntitySink final : public ClientOutputStream::Sink {
           public:
            explicit Http2EntitySink(Http2Exchange& exchange)
                : exchange_(exchange) {}

            Status write(std::string_view data) override {
                if (auto st = start(true); st.has_error())
                    return record(std::move(st));
                return record(exchange_.write(data));
            }

            Status flush() override { return failure_or_ok(); }

            Status close() override {
                if (failure_) return Status::err(*failure_);
                if (!exchange_.opened()) return record(exchange_.open(false));
                return record(exchange_.end());
            }

            Status failure_or_ok() const {
                if (failure_) return Status::err(*failure_);
                return Status::ok();
            }

           private:
            Status start(bool has_entity) {
                if (failure_) return Status::err(*failure_);
                if (exchange_.opened()) return Status::ok();
                return exchange_.open(has_entity);
            }

            Status record(Status st) {
                if (st.has_error() && !failure_) failure_ = st.error();
                return st;
            }

            Http2Exchange& exchange_;
            std::optional<Error> failure_;
        };

        Status send(Http2Exchange& exchange, const PreparedRequest& request) {
            switch (request.entity_kind()) {
                case EntityKind::None:
                    return exchange.open(false);
                case EntityKind::Buffered: {
                    const auto& body = *request.buffered_entity();
                    if (body.empty()) return exchange.open(false);
                    if (auto st = exchange.open(true); st.has_error()) return st;
                    if (auto st = exchange.write(body); st.has_error())
                        return st;
                    return exchange.end();
                }
                case EntityKind::OutputStream: {
                    const auto& handler =
                        std::get<OutputStreamHandler>(*request.entity);
                    Http2EntitySink sink(exchange);
                    ClientOutputStream stream(sink);
                    if (auto st = handler(stream); st.has_error()) return st;
                    if (auto failed = sink.failure_or_ok(); failed.has_error())
                        return failed;
                    if (!stream.closed()) {
                        return Status::err(
                            Error::Code::InvalidState,
                            "Output stream was not closed in handler");
                    }
                    return Status::ok();
                }
            }
            return Status::ok();
        }

    }  // namespace

    Http2Connection::HeaderList h2_header_list(const PreparedRequest& request,
                                               bool expect_continue) {
        Http2Connection::HeaderList out;
        out.emplace_back(":method", std::string(method_name(request.method)));
        if (request.method == HttpMethod::Connect) {
            out.emplace_back(":authority",
                             request_target(request, false, false));
        } else {
            out.emplace_back(":scheme", request.uri.scheme);
            auto host = request.headers.find(http::field::host);
            out.emplace_back(":authority", host != request.headers.end()
                                               ? std::string(host->value())
                                               : request.uri.authority());
            out.emplace_back(":path", request.uri.path_and_query());
        }

        for (const auto& field : request.headers) {
            auto name = lower(std::string_view(field.name_string().data(),
                                               field.name_string().size()));
            if (std::find(kConnectionSpecific.begin(), kConnectionSpecific.end(),
                          name) != kConnectionSpecific.end()) {
                continue;
            }
            std::string value(field.value());
            if (name == "te" && lower(value) != "trailers") continue;
            out.emplace_back(std::move(name), std::move(value));
        }
        if (expect_continue) out.emplace_back("expect", "100-continue");
        return out;
    }

    Result<ClientResponse> Http2CallChain::proceed(
        const PreparedRequest& request,
        const std::shared_ptr<Http2Connection>& connection,
        CancellationToken* cancel) {
        Http2Exchange exchange(connection, request, cfg_, cancel);

        if (auto st = send(exchange, request); st.has_error()) {
            log::logger()->debug("{} HTTP/2 request failed: {}",
                                 connection->channel_id(),
                                 st.error().message);
            exchange.abandon();
            return st.propagate<ClientResponse>();
        }
        return await_response(request, connection, exchange.stream());
    }

    Result<ClientResponse> Http2CallChain::upgraded_response(
        const PreparedRequest& request,
        const std::shared_ptr<Http2Connection>& connection,
        const std::shared_ptr<Http2Stream>& stream, CancellationToken* cancel) {
        CancellationToken::Registration registration;
        if (cancel) {
            registration = cancel->on_cancel(
                [connection, stream] { connection->cancel(stream); });
        }
        return await_response(request, connection, stream);
    }

    Result<ClientResponse> Http2CallChain::await_response(
        const PreparedRequest& request,
        const std::shared_ptr<Http2Connection>& connection,
        const std::shared_ptr<Http2Stream>& stream) {
        if (auto st = stream->await_headers(request.read_timeout);
            st.has_error()) {
            log::logger()->debug("{} stream {} response failed: {}",
                                 connection->channel_id(), stream->id(),
                                 st.error().message);
            connection->reset(*stream);
            if (st.error().code == Error::Code::ReadTimeout) connection->retire();
            return st.propagate<ClientResponse>();
        }

        const int status = stream->status();
        log::logger()->trace("{} stream {} response {}",
                             connection->channel_id(), stream->id(), status);

        auto reason = http::obsolete_reason(http::int_to_status(
            static_cast<unsigned>(status)));
        auto processed = std::make_shared<Completion<Status>>();
        Http2Source source(connection, stream,
                           Http2Source::Options{request.read_timeout},
                           processed);

        return Result<ClientResponse>::ok(
            status, std::string(reason.data(), reason.size()),
            stream->headers(), HttpVersion::Http2, request.uri,
            EntityStream(std::move(source)), std::move(processed));
    }

}  // namespace netcall
