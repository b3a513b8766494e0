#include "netcall/prepared_request.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace http = boost::beast::http;

namespace netcall {

    namespace {

        std::string_view to_std(boost::beast::string_view sv) {
            return {sv.data(), sv.size()};
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
                s.remove_suffix(1);
            return s;
        }

    }  // namespace

    bool is_valid_header_name(std::string_view name) {
        if (name.empty()) return false;
        static constexpr const char* kTokenExtras = "!#$%&'*+-.^_`|~";
        return std::all_of(name.begin(), name.end(), [](char c) {
            auto u = static_cast<unsigned char>(c);
            return std::isalnum(u) || std::strchr(kTokenExtras, c) != nullptr;
        });
    }

    bool is_valid_header_value(std::string_view value) {
        return value.find_first_of(std::string_view("\r\n\0", 3)) ==
               std::string_view::npos;
    }

    bool header_has_token(std::string_view value, std::string_view token) {
        std::size_t pos = 0;
        while (pos <= value.size()) {
            auto comma = value.find(',', pos);
            auto item = trim(value.substr(
                pos, comma == std::string_view::npos ? std::string_view::npos
                                                     : comma - pos));
            if (item.size() == token.size() &&
                std::equal(item.begin(), item.end(), token.begin(),
                           [](char a, char b) {
                               return std::tolower(
                                          static_cast<unsigned char>(a)) ==
                                      std::tolower(
                                          static_cast<unsigned char>(b));
                           })) {
                return true;
            }
            if (comma == std::string_view::npos) break;
            pos = comma + 1;
        }
        return false;
    }

    Result<PreparedRequest> prepare_request(const ServiceRequest& request,
                                            const ClientUri& uri,
                                            const ClientConfiguration& cfg) {
        const auto kind = request.entity_kind();
        std::uint64_t buffered_size = 0;
        if (const auto* body = std::get_if<std::string>(&request.entity)) {
            buffered_size = body->size();
        }

        auto framing =
            decide_framing(request.method, request.headers, kind, buffered_size);
        if (framing.has_error()) return framing.propagate<PreparedRequest>();

        for (const auto& field : request.headers) {
            if (!is_valid_header_name(to_std(field.name_string()))) {
                return Result<PreparedRequest>::err(
                    Error::Code::InvalidArgument,
                    "Invalid header name: " + std::string(field.name_string()));
            }
            if (!is_valid_header_value(to_std(field.value()))) {
                return Result<PreparedRequest>::err(
                    Error::Code::InvalidArgument,
                    "Invalid value for header " +
                        std::string(field.name_string()));
            }
        }

        PreparedRequest out;
        out.method = request.method;
        out.uri = uri;
        out.headers = request.headers;
        out.framing = framing.value();
        out.entity = &request.entity;
        out.read_timeout = request.read_timeout.value_or(cfg.read_timeout);

        for (const auto& [name, value] : cfg.default_headers) {
            if (out.headers.find(name) == out.headers.end()) {
                out.headers.insert(name, value);
            }
        }
        if (out.headers.find(http::field::user_agent) == out.headers.end() &&
            !cfg.user_agent.empty()) {
            out.headers.set(http::field::user_agent, cfg.user_agent);
        }
        if (out.headers.find(http::field::host) == out.headers.end()) {
            out.headers.set(http::field::host, uri.authority());
        }

        auto connection = out.headers.find(http::field::connection);
        if (connection != out.headers.end() &&
            header_has_token(to_std(connection->value()), "close")) {
            out.keep_alive = false;
        } else if (request.keep_alive.value_or(cfg.default_keep_alive)) {
            out.keep_alive = true;
            if (connection == out.headers.end()) {
                out.headers.set(http::field::connection, "keep-alive");
            }
        } else {
            out.keep_alive = false;
            out.headers.set(http::field::connection, "close");
        }

        apply_framing(out.framing, out.headers);

        out.expect_continue =
            request.send_expect_continue.value_or(cfg.send_expect_continue) &&
            kind != EntityKind::None && out.framing.framing != Framing::None &&
            !(kind == EntityKind::Buffered && buffered_size == 0);

        return Result<PreparedRequest>::ok(std::move(out));
    }

}  // namespace netcall
