#include "oauth2_server.hpp"
#include "address_resolver.hpp"
#include "oauth2_callback_handler.hpp"
#include "result_coordinator.hpp"
#include "loopback_tracing.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

#include <httplib.h>

namespace oauth2_loopback {

namespace {

// httplib treats route patterns as regular expressions
std::string EscapeRoutePattern(const std::string& path) {
    static const std::string special = ".^$|()[]{}*+?\\";
    std::string pattern;
    pattern.reserve(path.size() * 2);
    for (char c : path) {
        if (special.find(c) != std::string::npos) {
            pattern += '\\';
        }
        pattern += c;
    }
    return pattern;
}

} // namespace

std::string ServerStateToString(ServerState state) {
    switch (state) {
        case ServerState::idle: return "idle";
        case ServerState::bound: return "bound";
        case ServerState::serving: return "serving";
        case ServerState::awaiting: return "awaiting";
        case ServerState::succeeded: return "succeeded";
        case ServerState::denied: return "denied";
        case ServerState::cancelled: return "cancelled";
        case ServerState::failed: return "failed";
        case ServerState::closed: return "closed";
        default: return "unknown";
    }
}

OAuth2Server::OAuth2Server(ServerConfig config)
    : config_(std::move(config)),
      coordinator_(std::make_shared<ResultCoordinator>()) {
    callback_handler_ = std::make_unique<OAuth2CallbackHandler>(coordinator_, config_.SuccessHtml());
    OAUTH2_LOOPBACK_TRACE_DEBUG("OAUTH2_SERVER", "Created server with " +
        std::to_string(config_.BindCandidates().size()) + " bind candidates");
}

OAuth2Server::~OAuth2Server() {
    Stop();
}

CallbackResult OAuth2Server::ReceiveResult(const CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (started_ || closed_) {
            throw std::logic_error("OAuth2Server instances serve a single authorization attempt");
        }
        started_ = true;
    }

    try {
        Start();
    } catch (const std::exception& e) {
        OAUTH2_LOOPBACK_TRACE_ERROR("OAUTH2_SERVER", std::string("Failed to start local server: ") + e.what());
        SetOutcome(ServerState::failed);
        Stop();
        throw;
    }

    SetState(ServerState::awaiting);
    OAUTH2_LOOPBACK_TRACE_INFO("OAUTH2_SERVER", "Waiting for authorization response at " + GetUrl());

    CallbackResult result;
    try {
        result = coordinator_->Await(token);
    } catch (const Cancelled& e) {
        OAUTH2_LOOPBACK_TRACE_WARN("OAUTH2_SERVER", e.what());
        SetOutcome(ServerState::cancelled);
        Stop();
        throw;
    } catch (const OAuth2LoopbackError& e) {
        OAUTH2_LOOPBACK_TRACE_ERROR("OAUTH2_SERVER", e.what());
        SetOutcome(ServerState::failed);
        Stop();
        throw;
    }

    SetOutcome(result.IsAuthorized() ? ServerState::succeeded : ServerState::denied);
    OAUTH2_LOOPBACK_TRACE_INFO("OAUTH2_SERVER",
        "Authorization response received: " + CallbackOutcomeToString(result.outcome));
    Stop();
    return result;
}

std::string OAuth2Server::ReceiveCode(const CancellationToken& token) {
    auto result = ReceiveResult(token);
    if (!result.IsAuthorized()) {
        throw AuthorizationDenied(result.error_code, result.error_description);
    }
    return result.code;
}

void OAuth2Server::Start() {
    auto* handler = callback_handler_.get();
    RequestHandler callback = [handler](const httplib::Request& req, httplib::Response& res) {
        handler->HandleRequest(req, res);
    };
    auto wrapped = config_.GetMiddleware().Wrap(callback);
    if (!wrapped) {
        throw ConfigurationError("middleware returned an empty request handler");
    }

    AddressResolver resolver(config_);
    auto listener = resolver.Resolve();

    server_instance_ = std::move(listener.server);
    bound_address_ = listener.address;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        url_ = listener.BaseUrl() + config_.CallbackPath();
    }
    SetState(ServerState::bound);

    server_instance_->Get(EscapeRoutePattern(config_.CallbackPath()), wrapped);
    server_instance_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        OAUTH2_LOOPBACK_TRACE_DEBUG("OAUTH2_SERVER",
            req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    Serve();
}

void OAuth2Server::Serve() {
    auto* server = server_instance_.get();
    auto coordinator = coordinator_;
    auto address = bound_address_.ToString();
    std::packaged_task<bool()> listen_task([this, server, coordinator, address] {
        bool listened = server->listen_after_bind();
        // Only Stop() may end the accept loop while a caller is waiting
        if (!stopping_.load()) {
            coordinator->Fail("local server on " + address + " stopped accepting connections");
        }
        return listened;
    });
    listen_result_ = listen_task.get_future();

    OAUTH2_LOOPBACK_TRACE_DEBUG("OAUTH2_SERVER", "Starting server thread on " + bound_address_.ToString());
    server_thread_ = std::thread(std::move(listen_task));

    // Connections queue in the backlog until the accept loop runs
    while (!server->is_running()) {
        if (listen_result_.wait_for(std::chrono::milliseconds(1)) == std::future_status::ready) {
            throw OAuth2LoopbackError("local server on " + bound_address_.ToString() +
                                      " stopped before accepting connections");
        }
    }
    SetState(ServerState::serving);

    auto url = GetUrl();
    OAUTH2_LOOPBACK_TRACE_INFO("OAUTH2_SERVER", "Local server is ready at " + url);
    if (auto ready_signal = config_.GetReadySignal()) {
        if (ready_signal->Publish(url)) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            url_published_ = true;
        } else {
            OAUTH2_LOOPBACK_TRACE_WARN("OAUTH2_SERVER",
                "Ready signal holds the URL of another running server, not overwritten");
        }
    }
}

void OAuth2Server::Stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    stopping_.store(true);

    if (server_instance_) {
        OAUTH2_LOOPBACK_TRACE_DEBUG("OAUTH2_SERVER", "Stopping httplib server...");
        server_instance_->stop();
    }

    if (server_thread_.joinable()) {
        auto grace = config_.ShutdownGrace();
        if (listen_result_.wait_for(grace) == std::future_status::timeout) {
            RecordShutdownWarning("local server did not stop within " + std::to_string(grace.count()) +
                                  "ms, waiting for in-flight requests");
        }
        server_thread_.join();

        try {
            if (!listen_result_.get()) {
                RecordShutdownWarning("local server reported an error while listening");
            }
        } catch (const std::exception& e) {
            RecordShutdownWarning(std::string("local server thread failed: ") + e.what());
        }
    }

    server_instance_.reset();

    bool withdraw = false;
    std::string url;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        withdraw = url_published_;
        url = url_;
        url_published_ = false;
    }
    if (withdraw) {
        config_.GetReadySignal()->Withdraw(url);
    }

    SetState(ServerState::closed);
    OAUTH2_LOOPBACK_TRACE_INFO("OAUTH2_SERVER", "Server stopped");
}

ServerState OAuth2Server::GetState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

ServerState OAuth2Server::GetOutcomeState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return outcome_state_;
}

std::string OAuth2Server::GetUrl() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return url_;
}

std::optional<ShutdownWarning> OAuth2Server::GetShutdownWarning() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return shutdown_warning_;
}

void OAuth2Server::SetState(ServerState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    OAUTH2_LOOPBACK_TRACE_DEBUG("OAUTH2_SERVER",
        "State " + ServerStateToString(state_) + " -> " + ServerStateToString(state));
    state_ = state;
}

void OAuth2Server::SetOutcome(ServerState state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        outcome_state_ = state;
    }
    SetState(state);
}

void OAuth2Server::RecordShutdownWarning(const std::string& message) {
    OAUTH2_LOOPBACK_TRACE_WARN("OAUTH2_SERVER", message);
    std::lock_guard<std::mutex> lock(state_mutex_);
    // Keep the first warning, later ones are usually consequences of it
    if (!shutdown_warning_) {
        shutdown_warning_ = ShutdownWarning{message};
    }
}

std::string ReceiveCodeViaLocalServer(const CancellationToken& token, const ServerConfig& config) {
    OAuth2Server server(config);
    return server.ReceiveCode(token);
}

} // namespace oauth2_loopback
