#include "oauth2_server_config.hpp"
#include "oauth2_errors.hpp"
#include "error_context.hpp"
#include "loopback_tracing.hpp"
#include <cctype>

namespace oauth2_loopback {

const char* const DEFAULT_SUCCESS_HTML = "<html><body>OK<script>window.close()</script></body></html>";

namespace {
const char* const DEFAULT_DEPRECATED_HOST = "127.0.0.1";
}

bool ReadySignal::Publish(const std::string& url) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (url_) {
            return false;
        }
        url_ = url;
    }
    cv_.notify_all();
    return true;
}

bool ReadySignal::Withdraw(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!url_ || *url_ != url) {
        return false;
    }
    url_.reset();
    return true;
}

std::optional<std::string> ReadySignal::TryGet() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return url_;
}

std::optional<std::string> ReadySignal::WaitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return url_.has_value(); });
    return url_;
}

ServerConfig ServerConfig::FromOptions(const ServerOptions& options) {
    ServerConfig config;
    config.bind_candidates_ = ResolveCandidates(options);

    if (options.cert_file.empty() != options.key_file.empty()) {
        ErrorContext ctx;
        ctx.Set("cert_file", options.cert_file).Set("key_file", options.key_file);
        throw ConfigurationError(ctx.Format(
            "TLS requires both a certificate and a private key"));
    }
    config.cert_file_ = options.cert_file;
    config.key_file_ = options.key_file;

    config.success_html_ = options.success_html.empty() ? DEFAULT_SUCCESS_HTML : options.success_html;
    config.callback_path_ = ValidateCallbackPath(options.callback_path);
    config.middleware_ = options.middleware ? options.middleware : std::make_shared<IdentityMiddleware>();
    config.ready_signal_ = options.ready_signal;

    if (options.shutdown_grace.count() < 0) {
        throw ConfigurationError("shutdown_grace must not be negative");
    }
    if (options.read_timeout.count() <= 0 || options.write_timeout.count() <= 0) {
        throw ConfigurationError("read_timeout and write_timeout must be positive");
    }
    config.shutdown_grace_ = options.shutdown_grace;
    config.read_timeout_ = options.read_timeout;
    config.write_timeout_ = options.write_timeout;

    return config;
}

std::vector<BindAddress> ServerConfig::ResolveCandidates(const ServerOptions& options) {
    std::vector<BindAddress> candidates;
    for (const auto& text : options.bind_addresses) {
        auto address = BindAddress::Parse(text);
        if (!address) {
            throw ConfigurationError("invalid bind address '" + text +
                                     "', expected host:port or [ipv6]:port");
        }
        candidates.push_back(*address);
    }

    if (!options.local_server_ports.empty()) {
        OAUTH2_LOOPBACK_TRACE_WARN("SERVER_CONFIG",
            "local_server_address/local_server_ports are deprecated, use bind_addresses");
        std::string host = options.local_server_address.empty()
            ? DEFAULT_DEPRECATED_HOST : options.local_server_address;
        for (int port : options.local_server_ports) {
            if (port < 0 || port > 65535) {
                throw ConfigurationError("invalid local server port " + std::to_string(port));
            }
            BindAddress address;
            address.host = host;
            address.port = port;
            candidates.push_back(address);
        }
    }

    if (candidates.empty()) {
        BindAddress address;
        address.host = "127.0.0.1";
        address.port = 0;
        candidates.push_back(address);
    }
    return candidates;
}

std::string ServerConfig::ValidateCallbackPath(const std::string& path) {
    if (path.empty()) {
        return "/";
    }
    if (path.front() != '/') {
        throw ConfigurationError("callback path must start with '/': " + path);
    }
    for (unsigned char c : path) {
        if (std::isspace(c) || std::iscntrl(c) || c == '?' || c == '#') {
            throw ConfigurationError("callback path contains an invalid character: " + path);
        }
    }
    return path;
}

} // namespace oauth2_loopback
