#include "netcall/framing.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/chunk_encode.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace http = boost::beast::http;

namespace netcall {

    namespace {

        bool iequals_token(std::string_view a, std::string_view b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                       return std::tolower(static_cast<unsigned char>(x)) ==
                              std::tolower(static_cast<unsigned char>(y));
                   });
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
                s.remove_suffix(1);
            return s;
        }

        std::string_view to_std(boost::beast::string_view sv) {
            return {sv.data(), sv.size()};
        }

        /// Chunked must be the final transfer coding of a request.
        bool ends_with_chunked(std::string_view transfer_encoding) {
            auto comma = transfer_encoding.rfind(',');
            auto last = comma == std::string_view::npos
                            ? transfer_encoding
                            : transfer_encoding.substr(comma + 1);
            return iequals_token(trim(last), "chunked");
        }

    }  // namespace

    bool has_chunked_coding(std::string_view transfer_encoding) {
        std::size_t pos = 0;
        while (pos <= transfer_encoding.size()) {
            auto comma = transfer_encoding.find(',', pos);
            auto token = trim(transfer_encoding.substr(
                pos, comma == std::string_view::npos ? std::string_view::npos
                                                     : comma - pos));
            if (iequals_token(token, "chunked")) return true;
            if (comma == std::string_view::npos) break;
            pos = comma + 1;
        }
        return false;
    }

    Result<FramingDecision> decide_framing(HttpMethod method,
                                           const http::fields& headers,
                                           EntityKind kind,
                                           std::uint64_t buffered_size) {
        FramingDecision out;

        if (method == HttpMethod::Head) {
            // An empty buffered entity sends nothing and is accepted.
            if (kind == EntityKind::OutputStream ||
                (kind == EntityKind::Buffered && buffered_size > 0)) {
                return Result<FramingDecision>::err(
                    Error::Code::InvalidArgument,
                    "HEAD request cannot have an entity");
            }
            out.framing = Framing::None;
            return Result<FramingDecision>::ok(out);
        }

        auto te = headers.find(http::field::transfer_encoding);
        if (te != headers.end() && has_chunked_coding(to_std(te->value()))) {
            out.framing = Framing::ForcedChunked;
            return Result<FramingDecision>::ok(out);
        }

        std::optional<std::uint64_t> declared;
        auto cl = headers.find(http::field::content_length);
        if (cl != headers.end()) {
            auto value = trim(to_std(cl->value()));
            std::uint64_t n = 0;
            auto [ptr, ec] =
                std::from_chars(value.data(), value.data() + value.size(), n);
            if (value.empty() || ec != std::errc() ||
                ptr != value.data() + value.size()) {
                return Result<FramingDecision>::err(
                    Error::Code::InvalidArgument,
                    "Invalid Content-Length header: " + std::string(value));
            }
            declared = n;
        }

        switch (kind) {
            case EntityKind::None:
                out.framing = Framing::None;
                break;
            case EntityKind::Buffered:
                if (declared && *declared != buffered_size) {
                    return Result<FramingDecision>::err(
                        Error::Code::InvalidArgument,
                        "Content-Length header (" + std::to_string(*declared) +
                            ") does not match entity size (" +
                            std::to_string(buffered_size) + ")");
                }
                out.framing = Framing::ContentLength;
                out.content_length = buffered_size;
                break;
            case EntityKind::OutputStream:
                if (declared) {
                    out.framing = Framing::ContentLength;
                    out.content_length = declared;
                } else {
                    out.framing = Framing::Chunked;
                }
                break;
        }
        return Result<FramingDecision>::ok(out);
    }

    void apply_framing(const FramingDecision& decision, http::fields& headers) {
        switch (decision.framing) {
            case Framing::None:
                headers.erase(http::field::transfer_encoding);
                break;
            case Framing::ContentLength:
                headers.erase(http::field::transfer_encoding);
                headers.set(http::field::content_length,
                            std::to_string(decision.content_length.value_or(0)));
                break;
            case Framing::Chunked:
            case Framing::ForcedChunked: {
                headers.erase(http::field::content_length);
                auto te = headers.find(http::field::transfer_encoding);
                if (te == headers.end() ||
                    !ends_with_chunked(to_std(te->value()))) {
                    headers.set(http::field::transfer_encoding, "chunked");
                }
                break;
            }
        }
    }

    std::string encode_chunk(std::string_view data) {
        if (data.empty()) return {};
        return boost::beast::buffers_to_string(
            http::make_chunk(boost::asio::buffer(data.data(), data.size())));
    }

    std::string encode_last_chunk() {
        return boost::beast::buffers_to_string(http::make_chunk_last());
    }

}  // namespace netcall
