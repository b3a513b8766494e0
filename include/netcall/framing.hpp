#pragma once

#include <boost/beast/http/fields.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "netcall/http_method.hpp"
#include "netcall/result.hpp"

namespace netcall {

    /** @brief How a request entity is delimited on the wire. */
    enum class Framing {
        None,           ///< No entity.
        ContentLength,  ///< Length known up front.
        Chunked,        ///< Length unknown (streamed entity).
        ForcedChunked   ///< Caller asked for `Transfer-Encoding: chunked`.
    };

    /** @brief Kind of entity a request carries. */
    enum class EntityKind { None, Buffered, OutputStream };

    /**
     * @brief Framing chosen for one request. Computed once, never changed.
     */
    struct FramingDecision {
        Framing framing{Framing::None};
        /// Set for Framing::ContentLength.
        std::optional<std::uint64_t> content_length;

        bool chunked() const noexcept {
            return framing == Framing::Chunked ||
                   framing == Framing::ForcedChunked;
        }
    };

    /**
     * @brief Decide the framing of a request.
     *
     * @param method Request method; HEAD with a non-empty buffered entity or
     * an output stream is rejected.
     * @param headers Caller headers; `Content-Length` and
     * `Transfer-Encoding` are inspected.
     * @param kind Entity kind.
     * @param buffered_size Size of a buffered entity.
     * @return InvalidArgument for HEAD with an entity, an unparseable
     * Content-Length, or a Content-Length that contradicts a buffered entity.
     */
    Result<FramingDecision> decide_framing(
        HttpMethod method, const boost::beast::http::fields& headers,
        EntityKind kind, std::uint64_t buffered_size = 0);

    /// @brief Make @p headers agree with @p decision (set/erase
    /// Content-Length and Transfer-Encoding).
    void apply_framing(const FramingDecision& decision,
                       boost::beast::http::fields& headers);

    /// @brief One chunk in chunked transfer coding. Empty input yields an
    /// empty string (an empty chunk would terminate the body).
    std::string encode_chunk(std::string_view data);

    /// @brief The terminating zero-length chunk without trailers.
    std::string encode_last_chunk();

    /// @brief True when a Transfer-Encoding value names chunked.
    bool has_chunked_coding(std::string_view transfer_encoding);

}  // namespace netcall
