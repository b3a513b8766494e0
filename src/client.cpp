#include "netcall/client.hpp"

#include <boost/asio/post.hpp>
#include <stdexcept>

#include "netcall/log.hpp"
#include "netcall/prepared_request.hpp"
#include "netcall/redirect.hpp"

namespace net = boost::asio;

namespace netcall {

    Client::Client(ClientConfiguration config)
        : cfg_(std::move(config)),
          http1_(cfg_.cache),
          http2_(cfg_.http2, cfg_.cache.remember_http1_only),
          negotiator_(http1_, http2_, tls_, cfg_),
          workers_(std::make_unique<net::thread_pool>(
              cfg_.async_workers == 0 ? 1 : cfg_.async_workers)) {
        if (cfg_.base_url) {
            auto base = parse_base_uri(*cfg_.base_url);
            if (base.has_error()) {
                throw std::invalid_argument("Invalid base_url: " +
                                            base.error().message);
            }
            base_uri_ = std::move(base).value();
        }
    }

    Client::~Client() noexcept { close(); }

    void Client::close() {
        if (closed_.exchange(true)) return;
        http1_.close();
        http2_.close();
        // Queued requests fail fast on the closed caches.
        workers_->join();
        log::logger()->debug("client closed");
    }

    ConnectionKey Client::key_for(const ClientUri& uri,
                                  const ServiceRequest& request) const {
        ConnectionKey key;
        key.scheme = uri.scheme;
        key.host = uri.host;
        key.port = uri.port;
        key.read_timeout = request.read_timeout.value_or(cfg_.read_timeout);
        key.tls = request.tls.value_or(cfg_.tls);
        key.proxy = request.proxy.value_or(cfg_.proxy);
        key.dns_strategy = cfg_.dns_strategy;
        key.address_family = cfg_.address_family;
        key.normalize();
        return key;
    }

    Result<ClientResponse> Client::execute(const ServiceRequest& request,
                                           CancellationToken* cancel) {
        auto resolved =
            resolve_uri(request.uri, base_uri_ ? &*base_uri_ : nullptr);
        if (resolved.has_error()) return resolved.propagate<ClientResponse>();
        ClientUri uri = std::move(resolved).value();

        const bool follow =
            request.follow_redirects.value_or(cfg_.follow_redirects);
        const int max_redirects =
            request.max_redirects.value_or(cfg_.max_redirects);

        const ServiceRequest* hop = &request;
        std::optional<ServiceRequest> redirected;

        for (int redirects = 0;; ++redirects) {
            auto prepared = prepare_request(*hop, uri, cfg_);
            if (prepared.has_error()) return prepared.propagate<ClientResponse>();

            const auto key = key_for(uri, *hop);
            const auto mode = hop->protocol.value_or(cfg_.protocol);
            log::logger()->debug("{} {}", method_name(hop->method),
                                 uri.to_string());

            auto response =
                negotiator_.execute(prepared.value(), key, mode, cancel);
            if (response.has_error()) return response;

            const int status = response.value().status();
            if (!follow || !is_redirect_status(status)) return response;

            if (redirects >= max_redirects) {
                response.value().close();
                return Result<ClientResponse>::err(
                    Error::Code::RedirectLimit,
                    "Maximum number of request redirections (" +
                        std::to_string(max_redirects) + ") reached.");
            }

            auto next = next_hop(hop->method, uri, status,
                                 response.value().header("Location"));
            response.value().close();
            if (next.has_error()) return next.propagate<ClientResponse>();

            log::logger()->debug("redirect {} from {} to {}", status,
                                 uri.to_string(), next.value().uri.to_string());

            ServiceRequest following = redirected_request(*hop, next.value());
            redirected = std::move(following);
            hop = &*redirected;
            uri = std::move(next).value().uri;
        }
    }

    Result<ClientResponse> Client::submit(const ServiceRequest& request) {
        return execute(request, nullptr);
    }

    Result<ClientResponse> Client::output_stream(ServiceRequest request,
                                                 OutputStreamHandler handler) {
        request.entity = std::move(handler);
        return execute(request, nullptr);
    }

    ResponseFuture Client::submit_async(ServiceRequest request) {
        auto state = std::make_shared<ResponseFuture::State>();
        if (closed_.load()) {
            state->complete(Result<ClientResponse>::err(
                Error::Code::CacheClosed, "Client is closed"));
            return ResponseFuture(state);
        }
        net::post(*workers_, [this, state, request = std::move(request)] {
            if (!state->should_run()) return;
            state->complete(execute(request, &state->token()));
        });
        return ResponseFuture(state);
    }

    Result<ClientResponse> Client::get(const std::string& uri) {
        ServiceRequest request;
        request.method = HttpMethod::Get;
        request.uri = uri;
        return submit(request);
    }

    Result<ClientResponse> Client::head(const std::string& uri) {
        ServiceRequest request;
        request.method = HttpMethod::Head;
        request.uri = uri;
        return submit(request);
    }

    Result<ClientResponse> Client::del(const std::string& uri) {
        ServiceRequest request;
        request.method = HttpMethod::Delete;
        request.uri = uri;
        return submit(request);
    }

    Result<ClientResponse> Client::options(const std::string& uri) {
        ServiceRequest request;
        request.method = HttpMethod::Options;
        request.uri = uri;
        return submit(request);
    }

    Result<ClientResponse> Client::post(const std::string& uri,
                                        std::string body) {
        ServiceRequest request;
        request.method = HttpMethod::Post;
        request.uri = uri;
        request.entity = std::move(body);
        return submit(request);
    }

    Result<ClientResponse> Client::put(const std::string& uri,
                                       std::string body) {
        ServiceRequest request;
        request.method = HttpMethod::Put;
        request.uri = uri;
        request.entity = std::move(body);
        return submit(request);
    }

    Result<ClientResponse> Client::patch(const std::string& uri,
                                         std::string body) {
        ServiceRequest request;
        request.method = HttpMethod::Patch;
        request.uri = uri;
        request.entity = std::move(body);
        return submit(request);
    }

}  // namespace netcall
