#pragma once

#include "cancellation.hpp"
#include "oauth2_server_config.hpp"
#include "oauth2_types.hpp"
#include <memory>
#include <string>

namespace oauth2_loopback {

// Exchanges an authorization code for tokens at the provider's token endpoint.
// Implemented by the application with its own HTTP/OAuth2 client.
class TokenExchanger {
public:
    virtual ~TokenExchanger() = default;

    // redirect_uri is the local server URL the code was delivered to
    virtual OAuth2Tokens Exchange(const CancellationToken& token,
                                  const std::string& code,
                                  const std::string& redirect_uri) = 0;
};

struct FlowConfig {
    ServerOptions server;
    std::shared_ptr<TokenExchanger> exchanger;
};

class OAuth2Flow {
public:
    explicit OAuth2Flow(FlowConfig config);

    // 1. Start the local server and publish its URL.
    // 2. Wait for the authorization response.
    // 3. Exchange the code for tokens.
    OAuth2Tokens GetToken(const CancellationToken& token);

private:
    FlowConfig config_;
};

// Shorthand for OAuth2Flow(config).GetToken(token)
OAuth2Tokens GetToken(const CancellationToken& token, const FlowConfig& config);

} // namespace oauth2_loopback
