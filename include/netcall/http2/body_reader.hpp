#pragma once

#include <boost/beast/http/fields.hpp>
#include <chrono>
#include <cstddef>
#include <memory>

#include "netcall/completion.hpp"
#include "netcall/http2/connection.hpp"
#include "netcall/http2/stream.hpp"
#include "netcall/result.hpp"

namespace netcall {

    /**
     * @brief Pull-based reader of an HTTP/2 response entity.
     *
     * DATA already received is handed out first; the flow-control window is
     * reopened only for bytes the consumer read. A read timeout resets the
     * stream and retires the connection.
     */
    class Http2Source {
       public:
        struct Options {
            std::chrono::milliseconds read_timeout{0};
        };

        Http2Source(std::shared_ptr<Http2Connection> connection,
                    std::shared_ptr<Http2Stream> stream, Options options,
                    std::shared_ptr<Completion<Status>> processed);

        Http2Source(Http2Source&&) noexcept = default;
        Http2Source& operator=(Http2Source&&) noexcept = default;

        /// @brief Read up to @p size bytes. 0 means end of entity.
        Result<std::size_t> read(void* data, std::size_t size);

        bool done() const noexcept { return done_; }

        const boost::beast::http::fields& trailers() const noexcept;

        /// @brief Reset the stream unless the peer already ended it.
        void close();

       private:
        void finish(Status status);

        std::shared_ptr<Http2Connection> connection_;
        std::shared_ptr<Http2Stream> stream_;
        Options options_;
        std::shared_ptr<Completion<Status>> processed_;
        bool done_{false};
    };

}  // namespace netcall
