#pragma once

#include "oauth2_server_config.hpp"
#include "oauth2_types.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace oauth2_loopback {

class ResultCoordinator;

// Handles the provider's redirect to the local server
class OAuth2CallbackHandler {
public:
    // Same shape as httplib::Params
    using QueryParams = std::multimap<std::string, std::string>;

    OAuth2CallbackHandler(std::shared_ptr<ResultCoordinator> coordinator, std::string success_html);
    ~OAuth2CallbackHandler() = default;

    // Non-copyable, non-movable
    OAuth2CallbackHandler(const OAuth2CallbackHandler&) = delete;
    OAuth2CallbackHandler& operator=(const OAuth2CallbackHandler&) = delete;
    OAuth2CallbackHandler(OAuth2CallbackHandler&&) = delete;
    OAuth2CallbackHandler& operator=(OAuth2CallbackHandler&&) = delete;

    // error -> Denied, else code -> Authorized, else nothing (malformed)
    static std::optional<CallbackResult> ParseCallback(const QueryParams& params);

    void HandleRequest(const httplib::Request& req, httplib::Response& res) const;

    // Number of well-formed callbacks seen, the authoritative one included
    size_t CallbackCount() const { return callback_count_.load(); }

private:
    static std::string GetParam(const QueryParams& params, const std::string& key);

    std::shared_ptr<ResultCoordinator> coordinator_;
    std::string success_html_;
    mutable std::atomic<size_t> callback_count_{0};
};

} // namespace oauth2_loopback
