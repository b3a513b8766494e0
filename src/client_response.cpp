#include "netcall/client_response.hpp"

#include <array>
#include <type_traits>

namespace netcall {

    namespace {
        const boost::beast::http::fields kEmptyFields;
    }

    const char* to_string(HttpVersion version) noexcept {
        return version == HttpVersion::Http2 ? "HTTP/2" : "HTTP/1.1";
    }

    // ---------------- EntityStream ----------------

    Result<std::size_t> EntityStream::read(void* data, std::size_t size) {
        return std::visit(
            [&](auto& s) -> Result<std::size_t> {
                if constexpr (std::is_same_v<std::decay_t<decltype(s)>,
                                             std::monostate>) {
                    return Result<std::size_t>::ok(0);
                } else {
                    return s.read(data, size);
                }
            },
            source_);
    }

    Result<std::string> EntityStream::read_all() {
        std::string out;
        std::array<char, 16384> buf{};
        for (;;) {
            auto r = read(buf.data(), buf.size());
            if (r.has_error()) return r.propagate<std::string>();
            if (r.value() == 0) break;
            out.append(buf.data(), r.value());
        }
        return Result<std::string>::ok(std::move(out));
    }

    bool EntityStream::done() const noexcept {
        return std::visit(
            [](const auto& s) {
                if constexpr (std::is_same_v<std::decay_t<decltype(s)>,
                                             std::monostate>) {
                    return true;
                } else {
                    return s.done();
                }
            },
            source_);
    }

    const boost::beast::http::fields& EntityStream::trailers() const noexcept {
        if (auto* h1 = std::get_if<Http1Source>(&source_)) return h1->trailers();
        if (auto* h2 = std::get_if<Http2Source>(&source_)) return h2->trailers();
        return kEmptyFields;
    }

    void EntityStream::close() {
        if (auto* h1 = std::get_if<Http1Source>(&source_)) {
            h1->close();
        } else if (auto* h2 = std::get_if<Http2Source>(&source_)) {
            h2->close();
        }
    }

    // ---------------- ClientResponse ----------------

    ClientResponse::ClientResponse(int status, std::string reason,
                                   boost::beast::http::fields headers,
                                   HttpVersion version, ClientUri last_endpoint,
                                   EntityStream entity,
                                   std::shared_ptr<Completion<Status>> processed)
        : status_(status),
          reason_(std::move(reason)),
          headers_(std::move(headers)),
          version_(version),
          last_endpoint_(std::move(last_endpoint)),
          entity_(std::move(entity)),
          processed_(std::move(processed)) {
        if (!processed_) processed_ = std::make_shared<Completion<Status>>();
        if (entity_.done()) processed_->complete(Status::ok());
    }

    ClientResponse& ClientResponse::operator=(ClientResponse&& other) noexcept {
        if (this != &other) {
            close();
            status_ = other.status_;
            reason_ = std::move(other.reason_);
            headers_ = std::move(other.headers_);
            version_ = other.version_;
            last_endpoint_ = std::move(other.last_endpoint_);
            entity_ = std::move(other.entity_);
            processed_ = std::move(other.processed_);
        }
        return *this;
    }

    ClientResponse::~ClientResponse() { close(); }

    std::optional<std::string> ClientResponse::header(
        std::string_view name) const {
        auto it = headers_.find(
            boost::beast::string_view(name.data(), name.size()));
        if (it == headers_.end()) return std::nullopt;
        return std::string(it->value());
    }

    Result<boost::beast::http::fields> ClientResponse::trailers() const {
        if (!entity_.done()) {
            return Result<boost::beast::http::fields>::err(
                Error::Code::InvalidState,
                "Trailers are available once the entity was fully read");
        }
        return Result<boost::beast::http::fields>::ok(entity_.trailers());
    }

    void ClientResponse::close() { entity_.close(); }

}  // namespace netcall
