#pragma once

#include <memory>
#include <string>
#include <variant>

#include "netcall/cancellation.hpp"
#include "netcall/client_response.hpp"
#include "netcall/config.hpp"
#include "netcall/connection_cache.hpp"
#include "netcall/prepared_request.hpp"
#include "netcall/result.hpp"

namespace netcall {

    /// @brief Offer of an h2c upgrade sent along with an HTTP/1.1 request.
    struct UpgradeOffer {
        /// base64url of the SETTINGS payload.
        std::string http2_settings;
        /// The decoded payload, needed to start the session on 101.
        std::string settings_payload;
    };

    /**
     * @brief The server accepted the h2c upgrade. The transport is out of
     * the HTTP/1.1 cache and holds any bytes received after the 101.
     */
    struct SwitchedProtocols {
        std::shared_ptr<TcpConnection> transport;
        bool head_request{false};
    };

    using Http1Outcome = std::variant<ClientResponse, SwitchedProtocols>;

    /**
     * @brief Runs one physical HTTP/1.1 exchange: lease a connection, send
     * the prologue and entity, read the response header.
     *
     * The entity strategy is picked from the request once and never changes.
     * A request that fails leaves no connection behind in the cache.
     */
    class Http1CallChain {
       public:
        enum class Strategy { NoEntity, BufferedEntity, OutputStream };

        Http1CallChain(Http1ConnectionCache& cache,
                       const ClientConfiguration& cfg)
            : cache_(cache), cfg_(cfg) {}

        static Strategy strategy_for(const PreparedRequest& request) noexcept;

        /**
         * @param key Destination of @p request.
         * @param upgrade Offer an h2c upgrade with this request (nullable).
         * @param cancel Aborts the connection on cancellation (nullable).
         * @return The final response, or SwitchedProtocols after a 101 to an
         * upgrade offer.
         */
        Result<Http1Outcome> proceed(const PreparedRequest& request,
                                     const ConnectionKey& key,
                                     const ConnectOptions& connect,
                                     const UpgradeOffer* upgrade,
                                     CancellationToken* cancel);

        /// @brief Run @p request on a connection that was already leased.
        Result<Http1Outcome> proceed(const PreparedRequest& request,
                                     Http1ConnectionCache::Lease lease,
                                     const UpgradeOffer* upgrade,
                                     CancellationToken* cancel);

       private:
        Http1ConnectionCache& cache_;
        const ClientConfiguration& cfg_;
    };

    /// @brief Request target for @p request on a connection (origin-form,
    /// absolute-form through a proxy, authority-form for CONNECT).
    std::string request_target(const PreparedRequest& request, bool via_proxy,
                               bool relative_uris);

}  // namespace netcall
