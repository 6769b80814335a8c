#pragma once

#include "bind_address.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace httplib {
struct Request;
struct Response;
}

namespace oauth2_loopback {

// Same signature as httplib::Server::Handler
using RequestHandler = std::function<void(const httplib::Request&, httplib::Response&)>;

extern const char* const DEFAULT_SUCCESS_HTML;

// Wraps the callback handler, e.g. to add response headers or access logs
class Middleware {
public:
    virtual ~Middleware() = default;
    virtual RequestHandler Wrap(RequestHandler handler) const = 0;
};

class IdentityMiddleware : public Middleware {
public:
    RequestHandler Wrap(RequestHandler handler) const override { return handler; }
};

// Slot for the URL of the attempt that is currently serving. Publishing
// never blocks; the consumer may wait for the value or ignore it entirely.
// A server withdraws its URL when it closes, so one signal can be reused
// across attempts and never hands out the URL of a closed server.
class ReadySignal {
public:
    // Returns false if a URL is already published
    bool Publish(const std::string& url);

    // Clears the slot if it still holds url. Returns false otherwise.
    bool Withdraw(const std::string& url);

    std::optional<std::string> TryGet() const;
    std::optional<std::string> WaitFor(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<std::string> url_;
};

// Caller-facing options. Empty fields take defaults in ServerConfig::FromOptions.
struct ServerOptions {
    // Candidates of host:port to bind, tried in order. Port 0 picks a free port.
    // Defaults to "127.0.0.1:0".
    std::vector<std::string> bind_addresses;

    // PEM certificate chain and private key. Both or neither.
    std::string cert_file;
    std::string key_file;

    // Response body on a completed redirect. Defaults to DEFAULT_SUCCESS_HTML.
    std::string success_html;

    // Redirect path registered with the provider. Defaults to "/".
    std::string callback_path;

    std::shared_ptr<const Middleware> middleware;
    std::shared_ptr<ReadySignal> ready_signal;

    std::chrono::milliseconds shutdown_grace{3000};
    std::chrono::milliseconds read_timeout{5000};
    std::chrono::milliseconds write_timeout{5000};

    // Deprecated: use bind_addresses. Host used with local_server_ports,
    // defaults to "127.0.0.1".
    std::string local_server_address;
    // Deprecated: use bind_addresses. Each port is appended as a candidate.
    std::vector<int> local_server_ports;
};

// Validated, immutable server configuration
class ServerConfig {
public:
    // Throws ConfigurationError on malformed addresses, partial TLS
    // material, invalid callback path or non-positive timeouts
    static ServerConfig FromOptions(const ServerOptions& options);

    const std::vector<BindAddress>& BindCandidates() const { return bind_candidates_; }
    bool HasTls() const { return !cert_file_.empty(); }
    const std::string& CertFile() const { return cert_file_; }
    const std::string& KeyFile() const { return key_file_; }
    std::string Scheme() const { return HasTls() ? "https" : "http"; }
    const std::string& SuccessHtml() const { return success_html_; }
    const std::string& CallbackPath() const { return callback_path_; }
    const Middleware& GetMiddleware() const { return *middleware_; }
    std::shared_ptr<ReadySignal> GetReadySignal() const { return ready_signal_; }
    std::chrono::milliseconds ShutdownGrace() const { return shutdown_grace_; }
    std::chrono::milliseconds ReadTimeout() const { return read_timeout_; }
    std::chrono::milliseconds WriteTimeout() const { return write_timeout_; }

private:
    ServerConfig() = default;

    static std::vector<BindAddress> ResolveCandidates(const ServerOptions& options);
    static std::string ValidateCallbackPath(const std::string& path);

    std::vector<BindAddress> bind_candidates_;
    std::string cert_file_;
    std::string key_file_;
    std::string success_html_;
    std::string callback_path_;
    std::shared_ptr<const Middleware> middleware_;
    std::shared_ptr<ReadySignal> ready_signal_;
    std::chrono::milliseconds shutdown_grace_{0};
    std::chrono::milliseconds read_timeout_{0};
    std::chrono::milliseconds write_timeout_{0};
};

} // namespace oauth2_loopback
