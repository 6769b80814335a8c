#pragma once

#include "bind_address.hpp"
#include "oauth2_server_config.hpp"
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace oauth2_loopback {

// A server that is bound and listening but not yet accepting
struct BoundListener {
    BoundListener();
    ~BoundListener();
    BoundListener(BoundListener&&) noexcept;
    BoundListener& operator=(BoundListener&&) noexcept;

    std::unique_ptr<httplib::Server> server;
    BindAddress address;   // the candidate that won, with the real port
    std::string scheme;    // "http" or "https"

    // scheme://host:port, without a path
    std::string BaseUrl() const;
};

// Binds the first available candidate of the configuration
class AddressResolver {
public:
    explicit AddressResolver(const ServerConfig& config);

    // Throws ConfigurationError for unusable TLS material (before any bind)
    // and AllAddressesUnavailable when no candidate can be bound.
    BoundListener Resolve() const;

private:
    void ValidateTlsMaterial() const;
    std::unique_ptr<httplib::Server> CreateServer() const;
    // Returns the bound port, or -1 with reason filled in
    int TryBind(httplib::Server& server, const BindAddress& candidate, std::string& reason) const;

    const ServerConfig& config_;
};

} // namespace oauth2_loopback
