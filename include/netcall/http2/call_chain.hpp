#pragma once

#include <memory>

#include "netcall/cancellation.hpp"
#include "netcall/client_response.hpp"
#include "netcall/config.hpp"
#include "netcall/http2/connection.hpp"
#include "netcall/http2/stream.hpp"
#include "netcall/prepared_request.hpp"
#include "netcall/result.hpp"

namespace netcall {

    /**
     * @brief Runs one request as a stream of an HTTP/2 connection.
     *
     * Headers are translated to an HTTP/2 header list (pseudo-headers
     * first, lower-case names, connection-specific fields removed). The
     * entity is framed by DATA frames; Content-Length is kept when known and
     * chunked coding never goes on the wire.
     */
    class Http2CallChain {
       public:
        explicit Http2CallChain(const ClientConfiguration& cfg) : cfg_(cfg) {}

        Result<ClientResponse> proceed(
            const PreparedRequest& request,
            const std::shared_ptr<Http2Connection>& connection,
            CancellationToken* cancel);

        /// @brief Response of the request that was upgraded to HTTP/2; it
        /// arrives on stream 1.
        Result<ClientResponse> upgraded_response(
            const PreparedRequest& request,
            const std::shared_ptr<Http2Connection>& connection,
            const std::shared_ptr<Http2Stream>& stream,
            CancellationToken* cancel);

       private:
        Result<ClientResponse> await_response(
            const PreparedRequest& request,
            const std::shared_ptr<Http2Connection>& connection,
            const std::shared_ptr<Http2Stream>& stream);

        const ClientConfiguration& cfg_;
    };

    /// @brief HTTP/2 header list for @p request.
    Http2Connection::HeaderList h2_header_list(const PreparedRequest& request,
                                               bool expect_continue);

}  // namespace netcall
