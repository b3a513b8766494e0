#include "netcall/http2/body_reader.hpp"

#include "netcall/log.hpp"

namespace netcall {

    namespace {
        const boost::beast::http::fields kNoTrailers;
    }

    Http2Source::Http2Source(std::shared_ptr<Http2Connection> connection,
                             std::shared_ptr<Http2Stream> stream,
                             Options options,
                             std::shared_ptr<Completion<Status>> processed)
        : connection_(std::move(connection)),
          stream_(std::move(stream)),
          options_(options),
          processed_(std::move(processed)) {
        if (stream_ && stream_->entity_ended()) finish(Status::ok());
    }

    const boost::beast::http::fields& Http2Source::trailers() const noexcept {
        if (!done_ || !stream_) return kNoTrailers;
        return stream_->trailers();
    }

    Result<std::size_t> Http2Source::read(void* data, std::size_t size) {
        if (done_ || !stream_) return Result<std::size_t>::ok(0);
        if (size == 0) return Result<std::size_t>::ok(0);

        auto r = stream_->read(data, size, options_.read_timeout);
        if (r.has_error()) {
            Error err = r.error();
            log::logger()->debug("{} stream {} entity read failed: {}",
                                 connection_->channel_id(), stream_->id(),
                                 err.message);
            if (err.code == Error::Code::ReadTimeout) {
                connection_->reset(*stream_);
                connection_->retire();
            }
            finish(Status::err(err));
            return Result<std::size_t>::err(std::move(err));
        }

        const std::size_t n = r.value();
        if (n == 0) {
            finish(Status::ok());
            return Result<std::size_t>::ok(0);
        }
        connection_->consume(*stream_, n);
        if (stream_->entity_ended()) finish(Status::ok());
        return Result<std::size_t>::ok(n);
    }

    void Http2Source::finish(Status status) {
        if (done_) return;
        done_ = true;
        log::logger()->trace("{} stream {} entity processed",
                             connection_->channel_id(), stream_->id());
        if (processed_) processed_->complete(std::move(status));
    }

    void Http2Source::close() {
        if (done_ || !stream_) return;

        if (stream_->state() != Http2Stream::State::Closed) {
            connection_->reset(*stream_);
        }
        // Discarded DATA goes back to the connection window.
        connection_->consume(*stream_, stream_->discard_buffered());
        done_ = true;
        if (processed_) processed_->complete(Status::ok());
    }

}  // namespace netcall
