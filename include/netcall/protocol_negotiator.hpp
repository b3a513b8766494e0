#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "netcall/cancellation.hpp"
#include "netcall/client_response.hpp"
#include "netcall/config.hpp"
#include "netcall/connection_cache.hpp"
#include "netcall/http1/call_chain.hpp"
#include "netcall/http2/call_chain.hpp"
#include "netcall/http2/connection_cache.hpp"
#include "netcall/prepared_request.hpp"
#include "netcall/tls.hpp"

namespace netcall {

    /**
     * @brief Decides per request whether it runs over HTTP/1.1 or HTTP/2
     * and hands it to the matching call chain.
     *
     * - TLS: ALPN offers h2 and http/1.1; an h2 selection turns the new
     *   connection into an HTTP/2 session.
     * - Clear text: prior knowledge opens an HTTP/2 session directly; the
     *   upgrade mode offers h2c on a fresh connection and falls back to the
     *   HTTP/1.1 response when the server does not switch.
     * - Existing HTTP/2 sessions for the key are always preferred.
     *
     * ERRORS:
     * - NegotiationFailed: HTTP/2 was required and the server did not agree
     * - anything the call chains report
     */
    class ProtocolNegotiator {
       public:
        ProtocolNegotiator(Http1ConnectionCache& http1,
                           Http2ConnectionCache& http2,
                           TlsContextProvider& tls,
                           const ClientConfiguration& cfg);

        Result<ClientResponse> execute(const PreparedRequest& request,
                                       const ConnectionKey& key,
                                       ProtocolMode mode,
                                       CancellationToken* cancel);

       private:
        Result<ConnectOptions> connect_options(
            const ConnectionKey& key, std::vector<std::string> alpn);

        Result<ClientResponse> over_http1(const PreparedRequest& request,
                                          const ConnectionKey& key,
                                          CancellationToken* cancel);
        Result<ClientResponse> over_tls(const PreparedRequest& request,
                                        const ConnectionKey& key,
                                        ProtocolMode mode,
                                        CancellationToken* cancel);
        Result<ClientResponse> prior_knowledge(const PreparedRequest& request,
                                               const ConnectionKey& key,
                                               CancellationToken* cancel);
        Result<ClientResponse> upgrade(const PreparedRequest& request,
                                       const ConnectionKey& key,
                                       CancellationToken* cancel);

        Result<std::shared_ptr<Http2Connection>> start_session(
            std::shared_ptr<TcpConnection> transport);

        bool may_offer_upgrade(const PreparedRequest& request,
                               const ConnectionKey& key) const;

        Http1ConnectionCache& http1_cache_;
        Http2ConnectionCache& http2_cache_;
        TlsContextProvider& tls_;
        const ClientConfiguration& cfg_;
        Http1CallChain http1_;
        Http2CallChain http2_;
    };

    /// @brief Unpadded base64url (RFC 4648 section 5), as required for the
    /// HTTP2-Settings header.
    std::string base64url_encode(std::string_view data);

}  // namespace netcall
