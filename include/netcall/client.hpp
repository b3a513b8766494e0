#pragma once

#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <memory>
#include <optional>
#include <string>

#include "netcall/client_response.hpp"
#include "netcall/config.hpp"
#include "netcall/connection_cache.hpp"
#include "netcall/http2/connection_cache.hpp"
#include "netcall/protocol_negotiator.hpp"
#include "netcall/response_future.hpp"
#include "netcall/result.hpp"
#include "netcall/service_request.hpp"
#include "netcall/tls.hpp"
#include "netcall/url.hpp"

namespace netcall {

    /**
     * @brief An HTTP/1.1 and HTTP/2 client with connection reuse.
     *
     * Requests block the calling thread; submit_async() runs them on an
     * internal worker pool. The client is thread-safe: any number of
     * threads may submit requests concurrently and share its connections.
     */
    class Client {
       public:
        /**
         * @brief Constructs a Client with the given configuration.
         * @param config The configuration for the client (e.g., base URL,
         * timeouts, protocol selection).
         * @throws std::invalid_argument if the base URL cannot be parsed.
         */
        explicit Client(ClientConfiguration config);
        ~Client() noexcept;

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        Client(Client&&) = delete;
        Client& operator=(Client&&) = delete;

        /**
         * @brief Returns the client's configuration.
         * @return A constant reference to the configuration.
         */
        [[nodiscard]] const ClientConfiguration& config() const noexcept {
            return cfg_;
        }

        /**
         * @brief Sends a request, following redirects as configured.
         * @param request Method, URI, headers and entity.
         * @return The final response, or the Error that stopped the request.
         */
        [[nodiscard]] Result<ClientResponse> submit(
            const ServiceRequest& request);

        /**
         * @brief Sends a request whose entity is written by @p handler while
         * the request is in flight. The handler must close the stream.
         * @param request Method, URI and headers; its entity is replaced.
         * @param handler Writes the entity.
         * @return The final response, or the Error that stopped the request.
         */
        [[nodiscard]] Result<ClientResponse> output_stream(
            ServiceRequest request, OutputStreamHandler handler);

        /**
         * @brief Sends a request on the worker pool.
         * @param request The request to send.
         * @return A future completing with the response.
         */
        [[nodiscard]] ResponseFuture submit_async(ServiceRequest request);

        /**
         * @brief Convenience methods for common HTTP verbs.
         * @{
         */

        /**
         * @brief Performs a GET request.
         * @param uri The target URI or path (if base_url is set).
         * @return The result of the request.
         */
        [[nodiscard]] Result<ClientResponse> get(const std::string& uri);

        /**
         * @brief Performs a HEAD request.
         * @param uri The target URI or path.
         * @return The result of the request.
         */
        [[nodiscard]] Result<ClientResponse> head(const std::string& uri);

        /**
         * @brief Performs a DELETE request.
         * @param uri The target URI or path.
         * @return The result of the request.
         */
        [[nodiscard]] Result<ClientResponse> del(const std::string& uri);

        /**
         * @brief Performs an OPTIONS request.
         * @param uri The target URI or path.
         * @return The result of the request.
         */
        [[nodiscard]] Result<ClientResponse> options(const std::string& uri);

        /**
         * @brief Performs a POST request.
         * @param uri The target URI or path.
         * @param body The request entity.
         * @return The result of the request.
         */
        [[nodiscard]] Result<ClientResponse> post(const std::string& uri,
                                                  std::string body);

        /**
         * @brief Performs a PUT request.
         * @param uri The target URI or path.
         * @param body The request entity.
         * @return The result of the request.
         */
        [[nodiscard]] Result<ClientResponse> put(const std::string& uri,
                                                 std::string body);

        /**
         * @brief Performs a PATCH request.
         * @param uri The target URI or path.
         * @param body The request entity.
         * @return The result of the request.
         */
        [[nodiscard]] Result<ClientResponse> patch(const std::string& uri,
                                                   std::string body);
        /** @} */

        /// @brief Close every cached connection and wait for the worker pool
        /// to finish. Later requests fail with CacheClosed.
        void close();

        Http1ConnectionCache& http1_cache() noexcept { return http1_; }

        Http2ConnectionCache& http2_cache() noexcept { return http2_; }

       private:
        Result<ClientResponse> execute(const ServiceRequest& request,
                                       CancellationToken* cancel);

        ConnectionKey key_for(const ClientUri& uri,
                              const ServiceRequest& request) const;

        ClientConfiguration cfg_;
        std::optional<ClientUri> base_uri_;

        TlsContextProvider tls_;
        Http1ConnectionCache http1_;
        Http2ConnectionCache http2_;
        ProtocolNegotiator negotiator_;
        std::unique_ptr<boost::asio::thread_pool> workers_;
        std::atomic<bool> closed_{false};
    };

}  // namespace netcall
