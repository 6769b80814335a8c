#include "oauth2_flow.hpp"
#include "oauth2_errors.hpp"
#include "oauth2_server.hpp"
#include "loopback_tracing.hpp"
#include <utility>

namespace oauth2_loopback {

OAuth2Flow::OAuth2Flow(FlowConfig config) : config_(std::move(config)) {
}

OAuth2Tokens OAuth2Flow::GetToken(const CancellationToken& token) {
    if (!config_.exchanger) {
        throw ConfigurationError("a token exchanger is required to complete the authorization flow");
    }

    auto server_config = ServerConfig::FromOptions(config_.server);
    OAuth2Server server(server_config);

    OAUTH2_LOOPBACK_TRACE_INFO("OAUTH2_FLOW", "Starting authorization code flow");
    std::string code;
    try {
        code = server.ReceiveCode(token);
    } catch (const OAuth2LoopbackError& e) {
        OAUTH2_LOOPBACK_TRACE_ERROR("OAUTH2_FLOW", std::string("authorization error: ") + e.what());
        throw;
    }

    auto redirect_uri = server.GetUrl();
    OAUTH2_LOOPBACK_TRACE_INFO("OAUTH2_FLOW", "Exchanging authorization code " + RedactSecret(code) +
                               " (redirect_uri " + redirect_uri + ")");

    OAuth2Tokens tokens;
    try {
        tokens = config_.exchanger->Exchange(token, code, redirect_uri);
    } catch (const std::exception& e) {
        OAUTH2_LOOPBACK_TRACE_ERROR("OAUTH2_FLOW", std::string("Token exchange failed: ") + e.what());
        throw TokenExchangeError(std::string("could not exchange the code and token: ") + e.what());
    }

    if (tokens.expires_after == 0) {
        tokens.CalculateExpiresAfter();
    }
    OAUTH2_LOOPBACK_TRACE_INFO("OAUTH2_FLOW", "Flow completed successfully");
    return tokens;
}

OAuth2Tokens GetToken(const CancellationToken& token, const FlowConfig& config) {
    OAuth2Flow flow(config);
    return flow.GetToken(token);
}

} // namespace oauth2_loopback
