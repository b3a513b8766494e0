#pragma once

#include <boost/beast/http/fields.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "netcall/completion.hpp"
#include "netcall/http1/body_reader.hpp"
#include "netcall/http2/body_reader.hpp"
#include "netcall/result.hpp"
#include "netcall/url.hpp"

namespace netcall {

    /** @brief Protocol a response was received over. */
    enum class HttpVersion { Http11, Http2 };

    const char* to_string(HttpVersion version) noexcept;

    /**
     * @brief Response entity, read on demand from the connection.
     */
    class EntityStream {
       public:
        /// @brief A response without an entity.
        EntityStream() = default;

        explicit EntityStream(Http1Source source)
            : source_(std::move(source)) {}

        explicit EntityStream(Http2Source source)
            : source_(std::move(source)) {}

        /// @brief Read up to @p size bytes; 0 once the entity ended.
        Result<std::size_t> read(void* data, std::size_t size);

        /// @brief Read the remaining entity into a string.
        Result<std::string> read_all();

        bool done() const noexcept;

        /// @brief Trailer fields; empty until done().
        const boost::beast::http::fields& trailers() const noexcept;

        /// @brief Stop reading. Unread bytes are drained (HTTP/1.1, within
        /// the drain limit) or the stream is reset (HTTP/2).
        void close();

       private:
        std::variant<std::monostate, Http1Source, Http2Source> source_;
    };

    /**
     * @brief Status, headers and entity of the final response of a request.
     *
     * The connection is held until the entity was read to the end or
     * close() is called; the destructor closes.
     */
    class ClientResponse {
       public:
        ClientResponse(int status, std::string reason,
                       boost::beast::http::fields headers, HttpVersion version,
                       ClientUri last_endpoint, EntityStream entity,
                       std::shared_ptr<Completion<Status>> processed);

        ClientResponse(ClientResponse&&) noexcept = default;
        ClientResponse& operator=(ClientResponse&& other) noexcept;

        ClientResponse(const ClientResponse&) = delete;
        ClientResponse& operator=(const ClientResponse&) = delete;

        ~ClientResponse();

        int status() const noexcept { return status_; }

        const std::string& reason() const noexcept { return reason_; }

        const boost::beast::http::fields& headers() const noexcept {
            return headers_;
        }

        /// @brief First value of header @p name, if present.
        std::optional<std::string> header(std::string_view name) const;

        HttpVersion version() const noexcept { return version_; }

        /// @brief URI of the request that produced this response, after
        /// redirects.
        const ClientUri& last_endpoint() const noexcept {
            return last_endpoint_;
        }

        EntityStream& entity() noexcept { return entity_; }

        /// @brief Read the whole entity.
        Result<std::string> as_string() { return entity_.read_all(); }

        /// @brief Trailer fields. InvalidState until the entity was read.
        Result<boost::beast::http::fields> trailers() const;

        /// @brief Fires once when the entity was fully read or discarded.
        const Completion<Status>& entity_processed() const noexcept {
            return *processed_;
        }

        void close();

       private:
        int status_{0};
        std::string reason_;
        boost::beast::http::fields headers_;
        HttpVersion version_{HttpVersion::Http11};
        ClientUri last_endpoint_;
        EntityStream entity_;
        std::shared_ptr<Completion<Status>> processed_;
    };

}  // namespace netcall
