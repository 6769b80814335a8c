#include "oauth2_types.hpp"
#include <chrono>

namespace oauth2_loopback {

CallbackResult CallbackResult::Authorized(const std::string& code, const std::string& state) {
    CallbackResult result;
    result.outcome = CallbackOutcome::authorized;
    result.code = code;
    result.state = state;
    return result;
}

CallbackResult CallbackResult::Denied(const std::string& error_code,
                                      const std::string& error_description,
                                      const std::string& state) {
    CallbackResult result;
    result.outcome = CallbackOutcome::denied;
    result.error_code = error_code;
    result.error_description = error_description;
    result.state = state;
    return result;
}

std::string CallbackOutcomeToString(CallbackOutcome outcome) {
    switch (outcome) {
        case CallbackOutcome::authorized: return "authorized";
        case CallbackOutcome::denied: return "denied";
        default: return "unknown";
    }
}

bool OAuth2Tokens::IsExpired() const {
    if (expires_after == 0) {
        return false; // Provider did not report an expiry
    }
    auto now_timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return now_timestamp >= expires_after;
}

void OAuth2Tokens::CalculateExpiresAfter() {
    if (expires_in > 0) {
        auto future_time = std::chrono::system_clock::now() + std::chrono::seconds(expires_in);
        expires_after = std::chrono::duration_cast<std::chrono::seconds>(
            future_time.time_since_epoch()).count();
    }
}

} // namespace oauth2_loopback
