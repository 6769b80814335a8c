#include "oauth2_callback_handler.hpp"
#include "result_coordinator.hpp"
#include "loopback_tracing.hpp"
#include <utility>

#include <httplib.h>

namespace oauth2_loopback {

OAuth2CallbackHandler::OAuth2CallbackHandler(std::shared_ptr<ResultCoordinator> coordinator, std::string success_html)
    : coordinator_(std::move(coordinator)), success_html_(std::move(success_html)) {
}

std::string OAuth2CallbackHandler::GetParam(const QueryParams& params, const std::string& key) {
    auto it = params.find(key);
    if (it != params.end()) {
        return it->second;
    }
    return "";
}

std::optional<CallbackResult> OAuth2CallbackHandler::ParseCallback(const QueryParams& params) {
    std::string state = GetParam(params, "state");

    std::string error = GetParam(params, "error");
    if (!error.empty()) {
        return CallbackResult::Denied(error, GetParam(params, "error_description"), state);
    }

    std::string code = GetParam(params, "code");
    if (!code.empty()) {
        return CallbackResult::Authorized(code, state);
    }

    return std::nullopt;
}

void OAuth2CallbackHandler::HandleRequest(const httplib::Request& req, httplib::Response& res) const {
    OAUTH2_LOOPBACK_TRACE_DEBUG("OAUTH2_CALLBACK", "Received HTTP request: " + req.method + " " + req.path);

    auto result = ParseCallback(req.params);
    if (!result) {
        OAUTH2_LOOPBACK_TRACE_WARN("OAUTH2_CALLBACK", "Callback carries neither code nor error, ignoring");
        res.status = 400;
        res.set_content("Bad Request: the authorization response contains neither code nor error\n", "text/plain");
        return;
    }

    callback_count_.fetch_add(1);
    if (result->IsAuthorized()) {
        OAUTH2_LOOPBACK_TRACE_INFO("OAUTH2_CALLBACK",
            "Received authorization code=" + RedactSecret(result->code) + " state=" + result->state);
    } else {
        OAUTH2_LOOPBACK_TRACE_WARN("OAUTH2_CALLBACK",
            "Received authorization error: " + result->error_code + " - " + result->error_description);
    }

    if (!coordinator_->Publish(*result)) {
        OAUTH2_LOOPBACK_TRACE_DEBUG("OAUTH2_CALLBACK", "Outcome already decided, responding without publishing");
    }

    res.status = 200;
    res.set_content(success_html_, "text/html");
}

} // namespace oauth2_loopback
