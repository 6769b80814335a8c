#include "oauth2_errors.hpp"
#include "error_context.hpp"
#include <utility>

namespace oauth2_loopback {

AllAddressesUnavailable::AllAddressesUnavailable(std::vector<BindFailure> failures)
    : OAuth2LoopbackError(BuildMessage(failures)), failures_(std::move(failures)) {
}

std::string AllAddressesUnavailable::BuildMessage(const std::vector<BindFailure>& failures) {
    ErrorContext ctx;
    for (const auto& failure : failures) {
        ctx.Set(failure.candidate, failure.reason);
    }
    return ctx.Format("no available address to bind the local server (tried " +
                      std::to_string(failures.size()) + " candidates)");
}

AuthorizationDenied::AuthorizationDenied(std::string error_code, std::string description)
    : OAuth2LoopbackError("authorization denied by provider: " + error_code +
                          (description.empty() ? "" : " (" + description + ")")),
      error_code_(std::move(error_code)),
      description_(std::move(description)) {
}

Cancelled::Cancelled(std::string reason)
    : OAuth2LoopbackError("cancelled while waiting for the authorization response: " + reason),
      reason_(std::move(reason)) {
}

} // namespace oauth2_loopback
