#include "netcall/tls.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace netcall {

    bool set_sni(TlsStream& stream, const std::string& host,
                 boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    bool set_alpn(TlsStream& stream, const std::vector<std::string>& protocols,
                  boost::system::error_code& ec) {
        // Wire format: length-prefixed protocol names.
        std::vector<unsigned char> wire;
        for (const auto& p : protocols) {
            wire.push_back(static_cast<unsigned char>(p.size()));
            wire.insert(wire.end(), p.begin(), p.end());
        }
        if (wire.empty()) return true;

        // SSL_set_alpn_protos returns 0 on success.
        if (SSL_set_alpn_protos(stream.native_handle(), wire.data(),
                                static_cast<unsigned int>(wire.size())) != 0) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    std::string selected_alpn(TlsStream& stream) {
        const unsigned char* data = nullptr;
        unsigned int len = 0;
        SSL_get0_alpn_selected(stream.native_handle(), &data, &len);
        if (data == nullptr || len == 0) return {};
        return std::string(reinterpret_cast<const char*>(data), len);
    }

    void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                 const TlsConfig& config) {
        try {
            if (config.ca_file || config.ca_path) {
                if (config.ca_file)
                    ssl_context.load_verify_file(*config.ca_file);
                if (config.ca_path)
                    ssl_context.add_verify_path(*config.ca_path);
            } else {
                ssl_context.set_default_verify_paths();
            }

            if (config.certificate_file) {
                ssl_context.use_certificate_chain_file(
                    *config.certificate_file);
                ssl_context.use_private_key_file(
                    config.private_key_file.value_or(*config.certificate_file),
                    boost::asio::ssl::context::pem);
            }
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to initialize TLS context: ") + e.what());
        }

        ssl_context.set_verify_mode(config.verify_peer
                                        ? boost::asio::ssl::verify_peer
                                        : boost::asio::ssl::verify_none);
    }

    std::shared_ptr<boost::asio::ssl::context> TlsContextProvider::context_for(
        const TlsConfig& config) {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [cfg, ctx] : contexts_) {
            if (cfg == config) return ctx;
        }

        auto ctx = std::make_shared<boost::asio::ssl::context>(
            boost::asio::ssl::context::tls_client);
        init_tls_on_ssl_context(*ctx, config);
        contexts_.emplace_back(config, ctx);
        return ctx;
    }

}  // namespace netcall
