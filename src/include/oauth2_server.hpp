#pragma once

#include "bind_address.hpp"
#include "cancellation.hpp"
#include "oauth2_errors.hpp"
#include "oauth2_server_config.hpp"
#include "oauth2_types.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Forward declaration
namespace httplib {
class Server;
}

namespace oauth2_loopback {

class OAuth2CallbackHandler;
class ResultCoordinator;

enum class ServerState {
    idle,
    bound,
    serving,
    awaiting,
    succeeded,
    denied,
    cancelled,
    failed,
    closed
};

std::string ServerStateToString(ServerState state);

// Runs the local redirect server for exactly one authorization attempt:
// resolve -> listen -> notify ready -> await result -> shut down.
class OAuth2Server {
public:
    explicit OAuth2Server(ServerConfig config);
    ~OAuth2Server();

    // Non-copyable, non-movable
    OAuth2Server(const OAuth2Server&) = delete;
    OAuth2Server& operator=(const OAuth2Server&) = delete;
    OAuth2Server(OAuth2Server&&) = delete;
    OAuth2Server& operator=(OAuth2Server&&) = delete;

    // Runs the whole lifecycle and returns the outcome of the redirect.
    // A Denied outcome is returned, not thrown. Throws ConfigurationError,
    // AllAddressesUnavailable, Cancelled, or OAuth2LoopbackError when the
    // server stops accepting on its own. The server is closed on return.
    // May be called once per instance. To abort it from another thread,
    // cancel its token.
    CallbackResult ReceiveResult(const CancellationToken& token);

    // Like ReceiveResult, but throws AuthorizationDenied for a denied outcome
    std::string ReceiveCode(const CancellationToken& token);

    ServerState GetState() const;

    // The terminal state the attempt reached before closing
    // (succeeded, denied, cancelled or failed), idle while undecided
    ServerState GetOutcomeState() const;

    // scheme://host:port/path, empty until the server is bound
    std::string GetUrl() const;

    std::optional<ShutdownWarning> GetShutdownWarning() const;

private:
    void Start();
    void Serve();

    // Stops accepting, waits for in-flight requests and releases the
    // listener. Runs on the thread that owns the lifecycle (ReceiveResult
    // or the destructor); later calls are no-ops.
    //
    // The wait is bounded by the in-flight requests themselves: read and
    // write timeouts plus the time the handler (and middleware) takes.
    // shutdown_grace only decides when a slow shutdown is recorded as a
    // ShutdownWarning; the listener thread is always joined.
    void Stop();
    void SetState(ServerState state);
    void SetOutcome(ServerState state);
    void RecordShutdownWarning(const std::string& message);

    const ServerConfig config_;
    std::shared_ptr<ResultCoordinator> coordinator_;
    std::unique_ptr<OAuth2CallbackHandler> callback_handler_;
    std::unique_ptr<httplib::Server> server_instance_;
    BindAddress bound_address_;
    std::thread server_thread_;
    std::future<bool> listen_result_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex state_mutex_;
    ServerState state_ = ServerState::idle;
    ServerState outcome_state_ = ServerState::idle;
    std::string url_;
    bool url_published_ = false;
    bool started_ = false;
    bool closed_ = false;
    std::optional<ShutdownWarning> shutdown_warning_;
};

// Convenience wrapper: builds an OAuth2Server for config and returns the code
std::string ReceiveCodeViaLocalServer(const CancellationToken& token, const ServerConfig& config);

} // namespace oauth2_loopback
