#pragma once

#include <boost/beast/http/fields.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "netcall/config.hpp"
#include "netcall/framing.hpp"
#include "netcall/http_method.hpp"
#include "netcall/result.hpp"

namespace netcall {

    /**
     * @brief Caller-facing stream for entities produced while the request is
     * in flight.
     *
     * Headers are sent on the first write() or on close(), whichever comes
     * first. The handler that receives the stream must close() it.
     */
    class ClientOutputStream {
       public:
        /// @brief Protocol-specific destination of the entity bytes.
        class Sink {
           public:
            virtual ~Sink() = default;
            virtual Status write(std::string_view data) = 0;
            virtual Status flush() = 0;
            virtual Status close() = 0;
        };

        explicit ClientOutputStream(Sink& sink) : sink_(sink) {}

        ClientOutputStream(const ClientOutputStream&) = delete;
        ClientOutputStream& operator=(const ClientOutputStream&) = delete;

        Status write(std::string_view data) {
            if (closed_) {
                return Status::err(Error::Code::InvalidState,
                                   "Output stream is closed");
            }
            if (data.empty()) return Status::ok();
            auto st = sink_.write(data);
            if (st) written_ += data.size();
            return st;
        }

        Status flush() {
            if (closed_) return Status::ok();
            return sink_.flush();
        }

        /// @brief Finish the entity. Closing twice is a no-op.
        Status close() {
            if (closed_) return Status::ok();
            closed_ = true;
            return sink_.close();
        }

        bool closed() const noexcept { return closed_; }

        std::uint64_t bytes_written() const noexcept { return written_; }

       private:
        Sink& sink_;
        bool closed_{false};
        std::uint64_t written_{0};
    };

    /// @brief Produces the entity of an output-stream request. Invoked again
    /// when a 307/308 redirect requires the entity to be resent.
    using OutputStreamHandler = std::function<Status(ClientOutputStream&)>;

    /// @brief No entity, a buffered entity, or an output-stream handler.
    using Entity = std::variant<std::monostate, std::string, OutputStreamHandler>;

    /**
     * @brief A fully qualified request handed to the Client.
     *
     * Unset overrides fall back to the ClientConfiguration.
     */
    struct ServiceRequest {
        HttpMethod method{HttpMethod::Get};
        /// Absolute URI, or a path relative to the configured base URL.
        std::string uri;
        boost::beast::http::fields headers;
        Entity entity;

        std::optional<std::chrono::milliseconds> read_timeout;
        std::optional<bool> follow_redirects;
        std::optional<int> max_redirects;
        std::optional<bool> send_expect_continue;
        std::optional<bool> keep_alive;
        std::optional<ProtocolMode> protocol;
        std::optional<TlsConfig> tls;
        std::optional<ProxyConfiguration> proxy;

        EntityKind entity_kind() const noexcept {
            if (std::holds_alternative<std::string>(entity))
                return EntityKind::Buffered;
            if (std::holds_alternative<OutputStreamHandler>(entity))
                return EntityKind::OutputStream;
            return EntityKind::None;
        }
    };

}  // namespace netcall
