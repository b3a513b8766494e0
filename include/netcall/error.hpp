#pragma once
#include <string>

namespace netcall {
    /**
     * @brief Represents an error occurred while executing an HTTP exchange.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,         /**< The provided URL is malformed or invalid. */
            InvalidArgument,    /**< The request is malformed (e.g. HEAD with entity). */
            InvalidState,       /**< An object was used in a state that forbids it. */
            ConnectionFailed,   /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed, /**< Failed to perform TLS handshake. */
            ConnectTimeout,     /**< Connecting did not finish in time. */
            ReadTimeout,        /**< No data received within the read timeout. */
            AcquireTimeout,     /**< No connection could be obtained in time. */
            SendFailed,         /**< Failed to send the request. */
            ReceiveFailed,      /**< Failed to receive the response. */
            ProtocolError,      /**< The peer violated HTTP framing rules. */
            NegotiationFailed,  /**< Protocol selection failed (ALPN, upgrade). */
            RedirectLimit,      /**< Maximum number of redirects exceeded. */
            StreamReset,        /**< The HTTP/2 stream was reset by the peer. */
            Cancelled,          /**< The exchange was cancelled by the caller. */
            CacheClosed,        /**< The connection cache was closed. */
            Unknown,            /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::InvalidArgument:
                return "InvalidArgument";
            case Error::Code::InvalidState:
                return "InvalidState";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::ConnectTimeout:
                return "ConnectTimeout";
            case Error::Code::ReadTimeout:
                return "ReadTimeout";
            case Error::Code::AcquireTimeout:
                return "AcquireTimeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::ProtocolError:
                return "ProtocolError";
            case Error::Code::NegotiationFailed:
                return "NegotiationFailed";
            case Error::Code::RedirectLimit:
                return "RedirectLimit";
            case Error::Code::StreamReset:
                return "StreamReset";
            case Error::Code::Cancelled:
                return "Cancelled";
            case Error::Code::CacheClosed:
                return "CacheClosed";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /// @brief True for the timeout family callers usually retry on.
    inline bool is_timeout(Error::Code code) noexcept {
        return code == Error::Code::ReadTimeout ||
               code == Error::Code::ConnectTimeout ||
               code == Error::Code::AcquireTimeout;
    }
}  // namespace netcall
