#include "address_resolver.hpp"
#include "oauth2_errors.hpp"
#include "error_context.hpp"
#include "loopback_tracing.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include <sys/socket.h>
#include <httplib.h>

namespace oauth2_loopback {

BoundListener::BoundListener() = default;
BoundListener::~BoundListener() = default;
BoundListener::BoundListener(BoundListener&&) noexcept = default;
BoundListener& BoundListener::operator=(BoundListener&&) noexcept = default;

std::string BoundListener::BaseUrl() const {
    return scheme + "://" + address.UrlHost() + ":" + std::to_string(address.port);
}

AddressResolver::AddressResolver(const ServerConfig& config) : config_(config) {
}

BoundListener AddressResolver::Resolve() const {
    if (config_.HasTls()) {
        ValidateTlsMaterial();
    }

    auto server = CreateServer();

    std::vector<BindFailure> failures;
    for (const auto& candidate : config_.BindCandidates()) {
        std::string reason;
        int port = TryBind(*server, candidate, reason);
        if (port < 0) {
            OAUTH2_LOOPBACK_TRACE_DEBUG("ADDRESS_RESOLVER",
                "Could not bind " + candidate.ToString() + ": " + reason);
            failures.push_back(BindFailure{candidate.ToString(), reason});
            continue;
        }

        BoundListener listener;
        listener.server = std::move(server);
        listener.address = candidate;
        listener.address.port = port;
        listener.scheme = config_.Scheme();
        OAUTH2_LOOPBACK_TRACE_INFO("ADDRESS_RESOLVER",
            "Bound " + listener.address.ToString() + " (candidate " + candidate.ToString() + ")");
        return listener;
    }

    AllAddressesUnavailable error(std::move(failures));
    OAUTH2_LOOPBACK_TRACE_ERROR("ADDRESS_RESOLVER", error.what());
    throw error;
}

void AddressResolver::ValidateTlsMaterial() const {
    ErrorContext ctx;
    ctx.Set("cert_file", config_.CertFile()).Set("key_file", config_.KeyFile());

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_.CertFile(), ec)) {
        throw ConfigurationError(ctx.Format("TLS certificate file not found"));
    }
    if (!std::filesystem::is_regular_file(config_.KeyFile(), ec)) {
        throw ConfigurationError(ctx.Format("TLS private key file not found"));
    }
}

std::unique_ptr<httplib::Server> AddressResolver::CreateServer() const {
    std::unique_ptr<httplib::Server> server;
    if (config_.HasTls()) {
        auto ssl_server = std::make_unique<httplib::SSLServer>(
            config_.CertFile().c_str(), config_.KeyFile().c_str());
        if (!ssl_server->is_valid()) {
            ErrorContext ctx;
            ctx.Set("cert_file", config_.CertFile()).Set("key_file", config_.KeyFile());
            throw ConfigurationError(ctx.Format(
                "TLS certificate or private key could not be loaded"));
        }
        server = std::move(ssl_server);
    } else {
        server = std::make_unique<httplib::Server>();
    }

    // SO_REUSEADDR only: a port held by another listener must fail to bind
    server->set_socket_options([](socket_t sock) {
        int yes = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const void*>(&yes), sizeof(yes));
    });

    server->set_read_timeout(config_.ReadTimeout());
    server->set_write_timeout(config_.WriteTimeout());
    server->set_keep_alive_max_count(1);
    return server;
}

int AddressResolver::TryBind(httplib::Server& server, const BindAddress& candidate, std::string& reason) const {
    std::string host = candidate.host;
    if (host.empty()) {
        host = "0.0.0.0";
    }

    errno = 0;
    int port = -1;
    if (candidate.port == 0) {
        port = server.bind_to_any_port(host);
    } else if (server.bind_to_port(host, candidate.port)) {
        port = candidate.port;
    }

    if (port < 0) {
        reason = errno != 0 ? std::strerror(errno) : "bind failed";
    }
    return port;
}

} // namespace oauth2_loopback
