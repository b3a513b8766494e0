#include "netcall/protocol_negotiator.hpp"

#include <openssl/evp.h>

#include <exception>
#include <variant>

#include "netcall/log.hpp"

namespace netcall {

    std::string base64url_encode(std::string_view data) {
        std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
        const int n = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(out.data()),
            reinterpret_cast<const unsigned char*>(data.data()),
            static_cast<int>(data.size()));
        out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
        while (!out.empty() && out.back() == '=') out.pop_back();
        for (auto& c : out) {
            if (c == '+') {
                c = '-';
            } else if (c == '/') {
                c = '_';
            }
        }
        return out;
    }

    ProtocolNegotiator::ProtocolNegotiator(Http1ConnectionCache& http1,
                                           Http2ConnectionCache& http2,
                                           TlsContextProvider& tls,
                                           const ClientConfiguration& cfg)
        : http1_cache_(http1),
          http2_cache_(http2),
          tls_(tls),
          cfg_(cfg),
          http1_(http1, cfg),
          http2_(cfg) {}

    Result<ClientResponse> ProtocolNegotiator::execute(
        const PreparedRequest& request, const ConnectionKey& key,
        ProtocolMode mode, CancellationToken* cancel) {
        if (mode == ProtocolMode::Http1Only) {
            return over_http1(request, key, cancel);
        }

        if (auto existing = http2_cache_.find(key)) {
            log::logger()->trace("{} reusing HTTP/2 session for {}",
                                 existing->channel_id(), key.authority());
            return http2_.proceed(request, existing, cancel);
        }

        if (key.https()) return over_tls(request, key, mode, cancel);
        if (mode == ProtocolMode::Upgrade) return upgrade(request, key, cancel);
        return prior_knowledge(request, key, cancel);
    }

    Result<ConnectOptions> ProtocolNegotiator::connect_options(
        const ConnectionKey& key, std::vector<std::string> alpn) {
        ConnectOptions options;
        options.connect_timeout = cfg_.connect_timeout;
        if (!key.https()) return Result<ConnectOptions>::ok(std::move(options));

        options.alpn = std::move(alpn);
        try {
            options.tls_context = tls_.context_for(key.tls);
        } catch (const std::exception& e) {
            return Result<ConnectOptions>::err(
                Error::Code::TlsHandshakeFailed,
                std::string("Invalid TLS configuration: ") + e.what());
        }
        return Result<ConnectOptions>::ok(std::move(options));
    }

    Result<ClientResponse> ProtocolNegotiator::over_http1(
        const PreparedRequest& request, const ConnectionKey& key,
        CancellationToken* cancel) {
        auto options = connect_options(key, {std::string(kAlpnHttp11)});
        if (options.has_error()) return options.propagate<ClientResponse>();

        auto outcome =
            http1_.proceed(request, key, options.value(), nullptr, cancel);
        if (outcome.has_error()) return outcome.propagate<ClientResponse>();
        return Result<ClientResponse>::ok(
            std::get<ClientResponse>(std::move(outcome).value()));
    }

    Result<ClientResponse> ProtocolNegotiator::over_tls(
        const PreparedRequest& request, const ConnectionKey& key,
        ProtocolMode mode, CancellationToken* cancel) {
        std::vector<std::string> alpn{std::string(kAlpnHttp2)};
        if (mode != ProtocolMode::Http2Only) {
            alpn.emplace_back(kAlpnHttp11);
        }
        auto options = connect_options(key, std::move(alpn));
        if (options.has_error()) return options.propagate<ClientResponse>();

        auto obtained =
            http1_cache_.obtain(key, options.value(), request.keep_alive);
        if (obtained.has_error()) return obtained.propagate<ClientResponse>();
        auto lease = std::move(obtained).value();

        if (lease.is_new() && lease->alpn() == kAlpnHttp2) {
            log::logger()->debug("{} ALPN selected h2", lease->channel_id());
            auto session = start_session(lease.detach());
            if (session.has_error()) return session.propagate<ClientResponse>();
            return http2_.proceed(request, session.value(), cancel);
        }

        if (mode == ProtocolMode::Http2Only) {
            const std::string selected =
                lease->alpn().empty() ? "no protocol" : lease->alpn();
            lease.discard();
            return Result<ClientResponse>::err(
                Error::Code::NegotiationFailed,
                "Failed to negotiate h2 with " + key.authority() +
                    ", server selected " + selected);
        }

        auto outcome = http1_.proceed(request, std::move(lease), nullptr, cancel);
        if (outcome.has_error()) return outcome.propagate<ClientResponse>();
        return Result<ClientResponse>::ok(
            std::get<ClientResponse>(std::move(outcome).value()));
    }

    Result<ClientResponse> ProtocolNegotiator::prior_knowledge(
        const PreparedRequest& request, const ConnectionKey& key,
        CancellationToken* cancel) {
        auto options = connect_options(key, {});
        if (options.has_error()) return options.propagate<ClientResponse>();

        auto transport = http1_cache_.open_unpooled(key, options.value());
        if (transport.has_error()) return transport.propagate<ClientResponse>();

        auto session = start_session(std::move(transport).value());
        if (session.has_error()) return session.propagate<ClientResponse>();
        return http2_.proceed(request, session.value(), cancel);
    }

    bool ProtocolNegotiator::may_offer_upgrade(const PreparedRequest& request,
                                               const ConnectionKey& key) const {
        return !http2_cache_.is_http1_only(key) && request.keep_alive &&
               request.method != HttpMethod::Connect &&
               request.entity_kind() != EntityKind::OutputStream &&
               !key.proxy.applies_to(key.host);
    }

    Result<ClientResponse> ProtocolNegotiator::upgrade(
        const PreparedRequest& request, const ConnectionKey& key,
        CancellationToken* cancel) {
        if (!may_offer_upgrade(request, key)) {
            return over_http1(request, key, cancel);
        }

        auto options = connect_options(key, {});
        if (options.has_error()) return options.propagate<ClientResponse>();

        auto obtained = http1_cache_.obtain(key, options.value(), true);
        if (obtained.has_error()) return obtained.propagate<ClientResponse>();
        auto lease = std::move(obtained).value();

        // An idle HTTP/1.1 connection already exists for this destination.
        if (!lease.is_new()) {
            auto outcome =
                http1_.proceed(request, std::move(lease), nullptr, cancel);
            if (outcome.has_error()) return outcome.propagate<ClientResponse>();
            return Result<ClientResponse>::ok(
                std::get<ClientResponse>(std::move(outcome).value()));
        }

        UpgradeOffer offer;
        offer.settings_payload = Http2Connection::settings_payload(cfg_.http2);
        offer.http2_settings = base64url_encode(offer.settings_payload);

        PreparedRequest upgrade_request = request;
        upgrade_request.expect_continue = false;

        auto outcome =
            http1_.proceed(upgrade_request, std::move(lease), &offer, cancel);
        if (outcome.has_error()) return outcome.propagate<ClientResponse>();
        auto result = std::move(outcome).value();

        if (auto* response = std::get_if<ClientResponse>(&result)) {
            log::logger()->debug("{} did not switch to h2c, continuing with "
                                 "HTTP/1.1",
                                 key.authority());
            http2_cache_.remember_http1_only(key);
            return Result<ClientResponse>::ok(std::move(*response));
        }

        auto& switched = std::get<SwitchedProtocols>(result);
        auto upgraded = Http2Connection::from_upgrade(
            std::move(switched.transport), cfg_.http2, offer.settings_payload,
            switched.head_request);
        if (upgraded.has_error()) return upgraded.propagate<ClientResponse>();
        auto session = std::move(upgraded).value();

        http2_cache_.add(session.connection);
        return http2_.upgraded_response(request, session.connection,
                                        session.stream, cancel);
    }

    Result<std::shared_ptr<Http2Connection>> ProtocolNegotiator::start_session(
        std::shared_ptr<TcpConnection> transport) {
        auto created = Http2Connection::create(std::move(transport), cfg_.http2);
        if (created.has_error()) return created;
        http2_cache_.add(created.value());
        return created;
    }

}  // namespace netcall
