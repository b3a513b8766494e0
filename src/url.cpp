#include "netcall/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace netcall {

    namespace {

        Result<ClientUri> make_err(std::string msg) {
            return Result<ClientUri>::err(Error::Code::InvalidUrl,
                                          std::move(msg));
        }

        std::string lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        /// Split "scheme://rest"; returns false if there is no scheme.
        bool split_scheme(std::string_view s, std::string_view& scheme,
                          std::string_view& rest) {
            auto pos = s.find("://");
            if (pos == std::string_view::npos || pos == 0) return false;
            for (char c : s.substr(0, pos)) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' &&
                    c != '-' && c != '.') {
                    return false;
                }
            }
            scheme = s.substr(0, pos);
            rest = s.substr(pos + 3);
            return true;
        }

        /// Parse "[userinfo@]host[:port]" into @p out. Empty authority is
        /// accepted here and checked by callers.
        Status parse_authority(std::string_view authority, ClientUri& out) {
            if (auto at = authority.rfind('@'); at != std::string_view::npos) {
                authority.remove_prefix(at + 1);
            }

            std::string_view host = authority;
            std::string_view port;

            if (!authority.empty() && authority.front() == '[') {
                auto close = authority.find(']');
                if (close == std::string_view::npos) {
                    return Status::err(Error::Code::InvalidUrl,
                                       "Unterminated IPv6 literal in URI");
                }
                host = authority.substr(1, close - 1);
                auto after = authority.substr(close + 1);
                if (!after.empty()) {
                    if (after.front() != ':') {
                        return Status::err(Error::Code::InvalidUrl,
                                           "Invalid characters after IPv6 "
                                           "literal");
                    }
                    port = after.substr(1);
                    if (port.empty()) {
                        return Status::err(Error::Code::InvalidUrl,
                                           "URI has empty port");
                    }
                }
            } else if (auto colon = authority.rfind(':');
                       colon != std::string_view::npos) {
                host = authority.substr(0, colon);
                port = authority.substr(colon + 1);
                if (port.empty()) {
                    return Status::err(Error::Code::InvalidUrl,
                                       "URI has empty port");
                }
            }

            out.host = lower(host);
            out.port = out.default_port();
            if (!port.empty()) {
                unsigned value = 0;
                auto [ptr, ec] =
                    std::from_chars(port.data(), port.data() + port.size(), value);
                if (ec != std::errc() || ptr != port.data() + port.size() ||
                    value == 0 || value > 65535) {
                    return Status::err(Error::Code::InvalidUrl,
                                       "Invalid port in URI: " +
                                           std::string(port));
                }
                out.port = static_cast<std::uint16_t>(value);
            }
            return Status::ok();
        }

        /// Split "path?query#fragment" into path and query.
        void split_path(std::string_view s, std::string& path,
                        std::string& query) {
            if (auto hash = s.find('#'); hash != std::string_view::npos) {
                s = s.substr(0, hash);
            }
            query.clear();
            if (auto q = s.find('?'); q != std::string_view::npos) {
                query = std::string(s.substr(q + 1));
                s = s.substr(0, q);
            }
            path = std::string(s);
        }

        std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

    }  // namespace

    std::string ClientUri::authority() const {
        std::string out;
        if (host.find(':') != std::string::npos) {
            out.append("[").append(host).append("]");
        } else {
            out.append(host);
        }
        if (port != 0 && port != default_port()) {
            out.append(":").append(std::to_string(port));
        }
        return out;
    }

    std::string ClientUri::path_and_query() const {
        std::string out = path.empty() ? std::string("/") : path;
        if (!query.empty()) out.append("?").append(query);
        return out;
    }

    std::string ClientUri::to_string() const {
        return scheme + "://" + authority() + path_and_query();
    }

    Result<ClientUri> parse_uri(std::string_view uri) {
        std::string_view scheme;
        std::string_view rest;
        if (!split_scheme(uri, scheme, rest)) {
            return make_err("URI must start with http:// or https://");
        }

        ClientUri out;
        out.scheme = lower(scheme);
        if (out.scheme != "http" && out.scheme != "https") {
            return make_err("Unsupported URI scheme: " + out.scheme);
        }

        auto end = rest.find_first_of("/?#");
        std::string_view authority = rest.substr(0, end);
        std::string_view tail =
            end == std::string_view::npos ? std::string_view{} : rest.substr(end);

        if (auto st = parse_authority(authority, out); st.has_error()) {
            return st.propagate<ClientUri>();
        }
        if (out.host.empty()) return make_err("URI missing host");

        split_path(tail, out.path, out.query);
        if (out.path.empty()) out.path = "/";
        return Result<ClientUri>::ok(std::move(out));
    }

    Result<ClientUri> parse_base_uri(std::string_view base_uri) {
        if (base_uri.empty()) return make_err("base_url is empty");

        auto parsed = parse_uri(base_uri);
        if (parsed.has_error()) return parsed;

        ClientUri b = std::move(parsed).value();
        if (!b.query.empty()) {
            return make_err("base_url must not include query parameters");
        }
        b.path = trim_trailing_slashes(std::move(b.path));
        return Result<ClientUri>::ok(std::move(b));
    }

    Result<ClientUri> resolve_uri(std::string_view uri_or_path,
                                  const ClientUri* base) {
        std::string_view scheme;
        std::string_view rest;
        if (split_scheme(uri_or_path, scheme, rest)) {
            return parse_uri(uri_or_path);
        }

        if (base == nullptr || base->host.empty()) {
            return make_err("Relative URI provided but base_url is empty");
        }

        ClientUri out = *base;
        std::string path;
        split_path(uri_or_path, path, out.query);
        if (path.empty() || path.front() != '/') path.insert(path.begin(), '/');
        out.path = base->path + path;
        return Result<ClientUri>::ok(std::move(out));
    }

    Result<ClientUri> resolve_location(const ClientUri& current,
                                       std::string_view location) {
        if (location.empty()) {
            return make_err("Redirect Location header is empty");
        }

        ClientUri out;
        std::string_view scheme;
        std::string_view rest;

        if (split_scheme(location, scheme, rest)) {
            auto end = rest.find_first_of("/?#");
            std::string_view authority = rest.substr(0, end);
            if (!authority.empty()) return parse_uri(location);

            // Host-less absolute URI: keep the current destination.
            out = current;
            std::string_view tail = end == std::string_view::npos
                                        ? std::string_view{}
                                        : rest.substr(end);
            split_path(tail, out.path, out.query);
            out.path = remove_dot_segments(out.path.empty() ? "/" : out.path);
            return Result<ClientUri>::ok(std::move(out));
        }

        if (location.rfind("//", 0) == 0) {
            // Scheme-relative reference.
            std::string absolute = current.scheme + ":" + std::string(location);
            return parse_uri(absolute);
        }

        out = current;
        std::string path;
        std::string query;
        split_path(location, path, query);

        if (path.empty()) {
            // "?query" or "#fragment" only: same path.
            if (location.front() == '?') out.query = std::move(query);
            return Result<ClientUri>::ok(std::move(out));
        }

        if (path.front() == '/') {
            out.path = remove_dot_segments(path);
        } else {
            auto slash = current.path.rfind('/');
            std::string merged = slash == std::string::npos
                                     ? "/"
                                     : current.path.substr(0, slash + 1);
            merged += path;
            out.path = remove_dot_segments(merged);
        }
        out.query = std::move(query);
        return Result<ClientUri>::ok(std::move(out));
    }

    std::string remove_dot_segments(std::string_view path) {
        std::vector<std::string_view> segments;
        bool trailing_slash = false;

        std::size_t pos = 0;
        while (pos <= path.size()) {
            auto next = path.find('/', pos);
            std::string_view seg = path.substr(
                pos, next == std::string_view::npos ? std::string_view::npos
                                                    : next - pos);
            bool last = next == std::string_view::npos;

            if (seg == "..") {
                if (!segments.empty()) segments.pop_back();
                trailing_slash = last;
            } else if (seg == ".") {
                trailing_slash = last;
            } else if (!seg.empty() || last) {
                if (!seg.empty()) segments.push_back(seg);
                trailing_slash = last && seg.empty();
            }

            if (last) break;
            pos = next + 1;
        }

        std::string out;
        for (auto seg : segments) {
            out.push_back('/');
            out.append(seg);
        }
        if (out.empty() || trailing_slash) out.push_back('/');
        return out;
    }

}  // namespace netcall
