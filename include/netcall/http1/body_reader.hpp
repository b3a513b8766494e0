#pragma once

#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/parser.hpp>
#include <chrono>
#include <cstddef>
#include <memory>

#include "netcall/completion.hpp"
#include "netcall/connection_cache.hpp"
#include "netcall/result.hpp"

namespace netcall {

    /**
     * @brief Pull-based reader of an HTTP/1.1 response entity.
     *
     * Bytes are requested from the connection only when the consumer reads.
     * When the entity ends, "entity processed" is signalled exactly once and
     * the connection is released to the cache if the exchange allows reuse;
     * later reads return 0.
     */
    class Http1Source {
       public:
        using Parser = boost::beast::http::response_parser<
            boost::beast::http::buffer_body>;

        struct Options {
            std::chrono::milliseconds read_timeout{0};
            std::size_t drain_limit{0};
            /// Both sides agreed on keep-alive and the request was complete.
            bool reusable{true};
        };

        Http1Source(Http1ConnectionCache::Lease lease,
                    std::unique_ptr<Parser> parser, std::size_t header_fields,
                    Options options,
                    std::shared_ptr<Completion<Status>> processed);

        Http1Source(Http1Source&&) noexcept = default;
        Http1Source& operator=(Http1Source&&) noexcept = default;

        /// @brief Read up to @p size bytes. 0 means end of entity.
        Result<std::size_t> read(void* data, std::size_t size);

        bool done() const noexcept { return done_; }

        /// @brief Trailer fields; empty until done().
        const boost::beast::http::fields& trailers() const noexcept {
            return trailers_;
        }

        /// @brief Drain up to the drain limit and release, else close the
        /// connection.
        void close();

       private:
        void finish(Status status);

        Http1ConnectionCache::Lease lease_;
        std::unique_ptr<Parser> parser_;
        std::size_t header_fields_{0};
        Options options_;
        std::shared_ptr<Completion<Status>> processed_;
        boost::beast::http::fields trailers_;
        bool done_{false};
    };

}  // namespace netcall
