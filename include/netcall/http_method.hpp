#pragma once
#include <boost/beast/http/verb.hpp>
#include <string_view>

namespace netcall {
    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
        Trace,
        Connect,
    };

    inline constexpr boost::beast::http::verb to_beast_verb(HttpMethod method) {
        namespace http = boost::beast::http;
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
            case HttpMethod::Trace:
                return http::verb::trace;
            case HttpMethod::Connect:
                return http::verb::connect;
            default:
                return http::verb::unknown;
        }
    }

    /// @brief Upper-case method token as sent on the wire.
    inline std::string_view method_name(HttpMethod method) {
        auto name = boost::beast::http::to_string(to_beast_verb(method));
        return std::string_view(name.data(), name.size());
    }

}  // namespace netcall
