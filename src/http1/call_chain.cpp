#include "netcall/http1/call_chain.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/serializer.hpp>
#include <algorithm>
#include <iterator>
#include <limits>
#include <optional>

#include "netcall/log.hpp"

namespace http = boost::beast::http;
namespace net = boost::asio;

namespace netcall {

    namespace {

        using Parser = Http1Source::Parser;
        using Lease = Http1ConnectionCache::Lease;

        std::string_view to_std(boost::beast::string_view sv) {
            return {sv.data(), sv.size()};
        }

        std::unique_ptr<Parser> make_parser(const ClientConfiguration& cfg,
                                            bool head) {
            auto parser = std::make_unique<Parser>();
            parser->header_limit(
                static_cast<std::uint32_t>(std::min<std::size_t>(
                    cfg.max_header_size,
                    std::numeric_limits<std::uint32_t>::max())));
            parser->body_limit(std::numeric_limits<std::uint64_t>::max());
            if (head) parser->skip(true);
            return parser;
        }

        /**
         * Prologue, entity and response header of one exchange on a leased
         * connection.
         */
        class Http1Exchange {
           public:
            Http1Exchange(Lease& lease, const PreparedRequest& request,
                          const ClientConfiguration& cfg,
                          const UpgradeOffer* upgrade)
                : lease_(lease),
                  request_(request),
                  cfg_(cfg),
                  upgrade_(upgrade) {}

            Status send_headers(bool expect_continue) {
                http::request<http::empty_body> req{
                    to_beast_verb(request_.method),
                    request_target(request_, lease_->via_proxy(),
                                   cfg_.relative_uris),
                    11};
                for (const auto& field : request_.headers) {
                    req.insert(field.name_string(), field.value());
                }
                if (expect_continue) {
                    req.set(http::field::expect, "100-continue");
                }
                if (upgrade_) {
                    req.set(http::field::connection, "Upgrade, HTTP2-Settings");
                    req.set(http::field::upgrade, "h2c");
                    req.set("HTTP2-Settings", upgrade_->http2_settings);
                }

                log::logger()->trace("{} {} {}{}", lease_->channel_id(),
                                     method_name(request_.method),
                                     to_std(req.target()),
                                     upgrade_ ? " (h2c upgrade)" : "");

                http::request_serializer<http::empty_body> sr{req};
                headers_sent_ = true;
                return lease_->write_header(sr, request_.read_timeout);
            }

            /// Wait for 100-Continue. A final response arriving instead
            /// interrupts the entity.
            Status await_continue() {
                const bool head = request_.method == HttpMethod::Head;
                for (;;) {
                    auto parser = make_parser(cfg_, head);
                    bool timed_out = false;
                    auto st = lease_->await_header(
                        *parser, cfg_.read_continue_timeout, timed_out);
                    if (st.has_error()) return st;

                    if (timed_out) {
                        if (cfg_.continue_timeout_policy ==
                            ContinueTimeoutPolicy::Fail) {
                            return Status::err(
                                Error::Code::ReadTimeout,
                                "100-Continue not received within " +
                                    std::to_string(
                                        cfg_.read_continue_timeout.count()) +
                                    " ms");
                        }
                        log::logger()->warn(
                            "{} 100-Continue not received within {} ms, "
                            "sending entity",
                            lease_->channel_id(),
                            cfg_.read_continue_timeout.count());
                        return Status::ok();
                    }

                    const int status = parser->get().result_int();
                    if (status == 100) {
                        log::logger()->trace("{} 100-Continue",
                                             lease_->channel_id());
                        return Status::ok();
                    }
                    if (status > 100 && status < 200 && status != 101)
                        continue;

                    log::logger()->debug(
                        "{} final response {} received before the entity",
                        lease_->channel_id(), status);
                    interrupted_ = true;
                    parser_ = std::move(parser);
                    return Status::ok();
                }
            }

            Status write_entity(std::string_view data) {
                if (interrupted_ || data.empty()) return Status::ok();
                if (request_.framing.chunked()) {
                    auto chunk = encode_chunk(data);
                    return lease_->write(net::buffer(chunk),
                                         request_.read_timeout);
                }
                const auto declared = request_.framing.content_length.value_or(0);
                if (written_ + data.size() > declared) {
                    return Status::err(
                        Error::Code::InvalidArgument,
                        "Entity exceeds Content-Length of " +
                            std::to_string(declared) + " bytes");
                }
                written_ += data.size();
                return lease_->write(net::buffer(data.data(), data.size()),
                                     request_.read_timeout);
            }

            Status end_entity() {
                if (interrupted_ || entity_ended_) return Status::ok();
                entity_ended_ = true;
                if (request_.framing.chunked()) {
                    auto last = encode_last_chunk();
                    return lease_->write(net::buffer(last),
                                         request_.read_timeout);
                }
                if (request_.framing.framing == Framing::ContentLength &&
                    written_ != request_.framing.content_length.value_or(0)) {
                    return Status::err(
                        Error::Code::InvalidState,
                        "Entity ended after " + std::to_string(written_) +
                            " of " +
                            std::to_string(*request_.framing.content_length) +
                            " bytes declared by Content-Length");
                }
                return Status::ok();
            }

            Status read_response() {
                if (parser_) return Status::ok();
                const bool head = request_.method == HttpMethod::Head;
                for (;;) {
                    auto parser = make_parser(cfg_, head);
                    auto st = lease_->read_header(*parser, request_.read_timeout);
                    if (st.has_error()) return st;

                    const int status = parser->get().result_int();
                    if (status >= 100 && status < 200 && status != 101) {
                        log::logger()->trace("{} skipping interim response {}",
                                             lease_->channel_id(), status);
                        continue;
                    }
                    parser_ = std::move(parser);
                    break;
                }

                const auto status_line =
                    parser_->get().reason().size() + 15;  // "HTTP/1.1 NNN " CRLF
                if (status_line > cfg_.max_status_line_length) {
                    return Status::err(Error::Code::ProtocolError,
                                       "Response status line is too long");
                }
                return Status::ok();
            }

            bool headers_sent() const noexcept { return headers_sent_; }

            bool interrupted() const noexcept { return interrupted_; }

            bool entity_complete() const noexcept {
                return interrupted_ || entity_ended_;
            }

            std::unique_ptr<Parser> take_parser() { return std::move(parser_); }

           private:
            Lease& lease_;
            const PreparedRequest& request_;
            const ClientConfiguration& cfg_;
            const UpgradeOffer* upgrade_;

            bool headers_sent_{false};
            bool interrupted_{false};
            bool entity_ended_{false};
            std::uint64_t written_{0};
            std::unique_ptr<Parser> parser_;
        };

        /// Sends headers on the first write() or on close().
        class Http1EntitySink final : public ClientOutputStream::Sink {
           public:
            Http1EntitySink(Http1Exchange& exchange, bool expect_continue)
                : exchange_(exchange), expect_continue_(expect_continue) {}

            Status write(std::string_view data) override {
                if (auto st = start(expect_continue_); st.has_error())
                    return record(std::move(st));
                return record(exchange_.write_entity(data));
            }

            Status flush() override { return failure_or_ok(); }

            Status close() override {
                if (auto st = start(false); st.has_error())
                    return record(std::move(st));
                return record(exchange_.end_entity());
            }

            Status failure_or_ok() const {
                if (failure_) return Status::err(*failure_);
                return Status::ok();
            }

           private:
            Status start(bool expect_continue) {
                if (failure_) return Status::err(*failure_);
                if (exchange_.headers_sent()) return Status::ok();
                if (auto st = exchange_.send_headers(expect_continue);
                    st.has_error()) {
                    return st;
                }
                if (expect_continue) return exchange_.await_continue();
                return Status::ok();
            }

            Status record(Status st) {
                if (st.has_error() && !failure_) failure_ = st.error();
                return st;
            }

            Http1Exchange& exchange_;
            bool expect_continue_;
            std::optional<Error> failure_;
        };

        Status send_no_entity(Http1Exchange& exchange) {
            if (auto st = exchange.send_headers(false); st.has_error()) return st;
            // Transfer-Encoding: chunked on a request without entity.
            return exchange.end_entity();
        }

        Status send_buffered(Http1Exchange& exchange,
                             const PreparedRequest& request) {
            if (auto st = exchange.send_headers(request.expect_continue);
                st.has_error()) {
                return st;
            }
            if (request.expect_continue) {
                if (auto st = exchange.await_continue(); st.has_error())
                    return st;
            }
            if (const auto* body = request.buffered_entity()) {
                if (auto st = exchange.write_entity(*body); st.has_error())
                    return st;
            }
            return exchange.end_entity();
        }

        Status send_output_stream(Http1Exchange& exchange,
                                  const PreparedRequest& request) {
            const auto& handler = std::get<OutputStreamHandler>(*request.entity);
            Http1EntitySink sink(exchange, request.expect_continue);
            ClientOutputStream stream(sink);

            auto st = handler(stream);
            if (st.has_error()) return st;
            if (auto failed = sink.failure_or_ok(); failed.has_error())
                return failed;
            if (!stream.closed()) {
                return Status::err(Error::Code::InvalidState,
                                   "Output stream was not closed in handler");
            }
            return Status::ok();
        }

    }  // namespace

    std::string request_target(const PreparedRequest& request, bool via_proxy,
                               bool relative_uris) {
        if (request.method == HttpMethod::Connect) {
            const auto& host = request.uri.host;
            std::string out = host.find(':') != std::string::npos
                                  ? "[" + host + "]"
                                  : host;
            return out + ":" + std::to_string(request.uri.port);
        }
        if (via_proxy && !relative_uris) return request.uri.to_string();
        return request.uri.path_and_query();
    }

    Http1CallChain::Strategy Http1CallChain::strategy_for(
        const PreparedRequest& request) noexcept {
        switch (request.entity_kind()) {
            case EntityKind::Buffered:
                return Strategy::BufferedEntity;
            case EntityKind::OutputStream:
                return Strategy::OutputStream;
            case EntityKind::None:
                break;
        }
        return Strategy::NoEntity;
    }

    Result<Http1Outcome> Http1CallChain::proceed(const PreparedRequest& request,
                                                 const ConnectionKey& key,
                                                 const ConnectOptions& connect,
                                                 const UpgradeOffer* upgrade,
                                                 CancellationToken* cancel) {
        auto obtained = cache_.obtain(key, connect, request.keep_alive);
        if (obtained.has_error()) return obtained.propagate<Http1Outcome>();
        return proceed(request, std::move(obtained).value(), upgrade, cancel);
    }

    Result<Http1Outcome> Http1CallChain::proceed(const PreparedRequest& request,
                                                 Lease lease,
                                                 const UpgradeOffer* upgrade,
                                                 CancellationToken* cancel) {
        const auto strategy = strategy_for(request);

        CancellationToken::Registration registration;
        if (cancel) {
            registration = cancel->on_cancel(
                [conn = lease.shared()] { conn->abort(); });
        }

        Http1Exchange exchange(lease, request, cfg_, upgrade);
        Status sent = Status::ok();
        switch (strategy) {
            case Strategy::NoEntity:
                sent = send_no_entity(exchange);
                break;
            case Strategy::BufferedEntity:
                sent = send_buffered(exchange, request);
                break;
            case Strategy::OutputStream:
                sent = send_output_stream(exchange, request);
                break;
        }
        if (sent.has_error()) {
            log::logger()->debug("{} request failed: {}", lease->channel_id(),
                                 sent.error().message);
            lease.discard();
            return sent.propagate<Http1Outcome>();
        }

        if (auto st = exchange.read_response(); st.has_error()) {
            log::logger()->debug("{} response failed: {}", lease->channel_id(),
                                 st.error().message);
            lease.discard();
            return st.propagate<Http1Outcome>();
        }

        auto parser = exchange.take_parser();
        const auto& head = parser->get();
        const int status = head.result_int();
        log::logger()->trace("{} response {} {}", lease->channel_id(), status,
                             to_std(head.reason()));

        if (status == 101) {
            if (!upgrade) {
                lease.discard();
                return Result<Http1Outcome>::err(
                    Error::Code::ProtocolError,
                    "Unexpected 101 Switching Protocols");
            }
            auto proto = head.find(http::field::upgrade);
            if (proto == head.end() ||
                !header_has_token(to_std(proto->value()), "h2c")) {
                lease.discard();
                return Result<Http1Outcome>::err(
                    Error::Code::NegotiationFailed,
                    "Invalid protocol switch, Upgrade: " +
                        (proto == head.end() ? std::string("<missing>")
                                             : std::string(proto->value())));
            }
            log::logger()->debug("{} switching to HTTP/2 (h2c)",
                                 lease->channel_id());
            return Result<Http1Outcome>::ok(SwitchedProtocols{
                lease.detach(), request.method == HttpMethod::Head});
        }

        const std::size_t header_fields = static_cast<std::size_t>(
            std::distance(head.begin(), head.end()));
        http::fields headers = head.base();
        std::string reason(head.reason());

        Http1Source::Options options;
        options.read_timeout = request.read_timeout;
        options.drain_limit = cfg_.drain_limit;
        options.reusable = exchange.entity_complete() && !exchange.interrupted();

        auto processed = std::make_shared<Completion<Status>>();
        Http1Source source(std::move(lease), std::move(parser), header_fields,
                           options, processed);

        return Result<Http1Outcome>::ok(std::in_place_type<ClientResponse>,
                                        status, std::move(reason),
                                        std::move(headers),
                                        HttpVersion::Http11, request.uri,
                                        EntityStream(std::move(source)),
                                        std::move(processed));
    }

}  // namespace netcall
