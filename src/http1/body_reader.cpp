#include "netcall/http1/body_reader.hpp"

#include <array>

#include "netcall/log.hpp"

namespace http = boost::beast::http;

namespace netcall {

    Http1Source::Http1Source(Http1ConnectionCache::Lease lease,
                             std::unique_ptr<Parser> parser,
                             std::size_t header_fields, Options options,
                             std::shared_ptr<Completion<Status>> processed)
        : lease_(std::move(lease)),
          parser_(std::move(parser)),
          header_fields_(header_fields),
          options_(options),
          processed_(std::move(processed)) {
        // Responses without an entity are complete as soon as the header is.
        if (parser_ && parser_->is_done()) finish(Status::ok());
    }

    Result<std::size_t> Http1Source::read(void* data, std::size_t size) {
        if (done_ || !parser_) return Result<std::size_t>::ok(0);
        if (size == 0) return Result<std::size_t>::ok(0);

        auto& body = parser_->get().body();
        for (;;) {
            body.data = data;
            body.size = size;

            auto r = lease_->read_some(*parser_, options_.read_timeout);
            if (r.has_error()) {
                log::logger()->debug("{} entity read failed: {}",
                                     lease_->channel_id(), r.error().message);
                Error err = r.error();
                finish(Status::err(err));
                return Result<std::size_t>::err(std::move(err));
            }

            const std::size_t produced = size - body.size;
            body.data = nullptr;
            body.size = 0;

            if (parser_->is_done()) {
                finish(Status::ok());
                return Result<std::size_t>::ok(produced);
            }
            if (produced > 0) return Result<std::size_t>::ok(produced);
        }
    }

    void Http1Source::finish(Status status) {
        if (done_) return;
        done_ = true;

        if (status.has_value() && parser_) {
            std::size_t index = 0;
            for (const auto& field : parser_->get().base()) {
                if (index++ >= header_fields_) {
                    trailers_.insert(field.name_string(), field.value());
                }
            }

            const bool reusable = options_.reusable &&
                                  parser_->keep_alive() &&
                                  lease_ && lease_->buffer().size() == 0;
            log::logger()->trace("{} entity processed, reusable={}",
                                 lease_ ? lease_->channel_id() : "",
                                 reusable);
            lease_.release(reusable);
        } else {
            lease_.discard();
        }

        if (processed_) processed_->complete(std::move(status));
    }

    void Http1Source::close() {
        if (done_ || !parser_) return;

        std::array<char, 8192> scratch{};
        std::size_t drained = 0;
        while (!done_ && drained < options_.drain_limit) {
            auto r = read(scratch.data(), scratch.size());
            if (r.has_error()) return;  // finish() already discarded
            drained += r.value();
            if (r.value() == 0) break;
        }

        if (!done_) {
            log::logger()->debug("{} closed with unread entity",
                                 lease_->channel_id());
            done_ = true;
            lease_.discard();
            if (processed_) processed_->complete(Status::ok());
        }
    }

}  // namespace netcall
