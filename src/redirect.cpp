#include "netcall/redirect.hpp"

#include <boost/beast/http/field.hpp>
#include <string>

namespace http = boost::beast::http;

namespace netcall {

    bool is_redirect_status(int status) noexcept {
        switch (status) {
            case 301:
            case 302:
            case 303:
            case 307:
            case 308:
                return true;
            default:
                return false;
        }
    }

    Result<RedirectHop> next_hop(HttpMethod method, const ClientUri& current,
                                 int status,
                                 std::optional<std::string_view> location) {
        if (!location || location->empty()) {
            return Result<RedirectHop>::err(
                Error::Code::ProtocolError,
                "Redirect " + std::to_string(status) +
                    " without a Location header. It is not clear where to "
                    "redirect.");
        }

        auto uri = resolve_location(current, *location);
        if (uri.has_error()) return uri.propagate<RedirectHop>();

        RedirectHop hop;
        hop.uri = std::move(uri).value();
        if (status == 307 || status == 308) {
            hop.method = method;
            hop.keep_entity = true;
        } else {
            hop.method = HttpMethod::Get;
        }
        return Result<RedirectHop>::ok(std::move(hop));
    }

    ServiceRequest redirected_request(const ServiceRequest& previous,
                                      const RedirectHop& hop) {
        ServiceRequest next = previous;
        next.method = hop.method;
        next.uri = hop.uri.to_string();
        next.headers.erase(http::field::host);
        if (!hop.keep_entity) {
            next.entity = std::monostate{};
            next.headers.erase(http::field::content_length);
            next.headers.erase(http::field::transfer_encoding);
            next.headers.erase(http::field::content_type);
            next.headers.erase(http::field::expect);
        }
        return next;
    }

}  // namespace netcall
