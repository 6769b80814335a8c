#pragma once

#include "cancellation.hpp"
#include "oauth2_types.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace oauth2_loopback {

// Single-assignment handoff between the HTTP handler threads and the caller
// blocked in Await(). The first of a published result, a server failure or
// cancellation wins.
class ResultCoordinator {
public:
    ResultCoordinator();
    ~ResultCoordinator() = default;

    // Non-copyable, non-movable
    ResultCoordinator(const ResultCoordinator&) = delete;
    ResultCoordinator& operator=(const ResultCoordinator&) = delete;
    ResultCoordinator(ResultCoordinator&&) = delete;
    ResultCoordinator& operator=(ResultCoordinator&&) = delete;

    // Records the result if nothing was decided yet. Returns false for
    // duplicates and for results arriving after cancellation.
    bool Publish(const CallbackResult& result);

    // Ends the wait with an error, e.g. when the server stops on its own.
    // Returns false if the outcome was already decided.
    bool Fail(const std::string& reason);

    // Blocks until a result is published, the server fails or the token
    // fires. Throws OAuth2LoopbackError on failure, Cancelled when the token
    // wins.
    CallbackResult Await(const CancellationToken& token);

    bool IsDecided() const;
    std::optional<CallbackResult> PeekResult() const;

private:
    enum class SlotState { pending, published, failed, cancelled };

    // Shared with cancellation callbacks, which may outlive an Await() call
    struct Slot {
        std::mutex mutex;
        std::condition_variable cv;
        SlotState state = SlotState::pending;
        bool cancel_requested = false;
        std::optional<CallbackResult> result;
        std::string cancel_reason;
        std::string failure_reason;
    };

    std::shared_ptr<Slot> slot_;
};

} // namespace oauth2_loopback
