#pragma once

#include <string>
#include <cstdint>

namespace oauth2_loopback {

enum class CallbackOutcome {
    authorized,
    denied
};

// Outcome of one redirect to the local server
struct CallbackResult {
    CallbackOutcome outcome;
    std::string code;              // set when authorized
    std::string error_code;        // set when denied
    std::string error_description; // optional, when denied
    std::string state;             // passed through, never validated here

    CallbackResult() : outcome(CallbackOutcome::denied) {}

    static CallbackResult Authorized(const std::string& code, const std::string& state = "");
    static CallbackResult Denied(const std::string& error_code,
                                 const std::string& error_description,
                                 const std::string& state = "");

    bool IsAuthorized() const { return outcome == CallbackOutcome::authorized; }
};

std::string CallbackOutcomeToString(CallbackOutcome outcome);

// Tokens returned by the exchanger
struct OAuth2Tokens {
    std::string access_token;
    std::string refresh_token;
    std::string id_token;        // OIDC providers only
    std::string token_type;
    std::string scope;
    int expires_in;              // Seconds until token expires, 0 if unknown
    int64_t expires_after;       // Unix timestamp when token expires

    OAuth2Tokens() : expires_in(0), expires_after(0) {}

    bool IsExpired() const;

    // Sets expires_after from expires_in relative to now
    void CalculateExpiresAfter();
};

} // namespace oauth2_loopback
