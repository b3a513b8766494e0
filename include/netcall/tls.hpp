#pragma once

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "netcall/connection_key.hpp"

namespace netcall {

    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    /// @brief ALPN identifiers.
    inline constexpr std::string_view kAlpnHttp11 = "http/1.1";
    inline constexpr std::string_view kAlpnHttp2 = "h2";

    /// @brief Set the SNI host name on a client stream.
    bool set_sni(TlsStream& stream, const std::string& host,
                 boost::system::error_code& ec);

    /// @brief Offer @p protocols (in preference order) through ALPN.
    bool set_alpn(TlsStream& stream, const std::vector<std::string>& protocols,
                  boost::system::error_code& ec);

    /// @brief Protocol selected by the server, empty when ALPN was not used.
    std::string selected_alpn(TlsStream& stream);

    /// @brief Load trust anchors, client identity and verification mode.
    /// @throws std::runtime_error when a configured file cannot be loaded.
    void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                 const TlsConfig& config);

    /**
     * @brief Shares one SSL context per distinct TlsConfig.
     * @note Thread-safe.
     */
    class TlsContextProvider {
       public:
        /// @throws std::runtime_error when the context cannot be initialized.
        std::shared_ptr<boost::asio::ssl::context> context_for(
            const TlsConfig& config);

       private:
        std::mutex mu_;
        std::vector<std::pair<TlsConfig,
                              std::shared_ptr<boost::asio::ssl::context>>>
            contexts_;
    };

}  // namespace netcall
