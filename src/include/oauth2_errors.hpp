#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace oauth2_loopback {

// Base of every error raised while receiving an authorization response
class OAuth2LoopbackError : public std::runtime_error {
public:
    explicit OAuth2LoopbackError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid configuration detected before any network operation
class ConfigurationError : public OAuth2LoopbackError {
public:
    explicit ConfigurationError(const std::string& message) : OAuth2LoopbackError(message) {}
};

struct BindFailure {
    std::string candidate;
    std::string reason;
};

// Every bind candidate was tried and none could be bound
class AllAddressesUnavailable : public OAuth2LoopbackError {
public:
    explicit AllAddressesUnavailable(std::vector<BindFailure> failures);

    const std::vector<BindFailure>& Failures() const { return failures_; }

private:
    std::vector<BindFailure> failures_;

    static std::string BuildMessage(const std::vector<BindFailure>& failures);
};

// The provider redirected back with an error parameter
class AuthorizationDenied : public OAuth2LoopbackError {
public:
    AuthorizationDenied(std::string error_code, std::string description);

    const std::string& ErrorCode() const { return error_code_; }
    const std::string& Description() const { return description_; }

private:
    std::string error_code_;
    std::string description_;
};

// The caller's cancellation token fired before a result was published
class Cancelled : public OAuth2LoopbackError {
public:
    explicit Cancelled(std::string reason);

    const std::string& Reason() const { return reason_; }

private:
    std::string reason_;
};

// The token exchanger failed after a code was received
class TokenExchangeError : public OAuth2LoopbackError {
public:
    explicit TokenExchangeError(const std::string& message) : OAuth2LoopbackError(message) {}
};

// Non-fatal: shutdown after the outcome was decided did not go cleanly
struct ShutdownWarning {
    std::string message;
};

} // namespace oauth2_loopback
