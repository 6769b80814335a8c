#include "cancellation.hpp"
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace oauth2_loopback {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    bool cancelled = false;
    std::optional<CancellationToken::Clock::time_point> deadline;
    CancellationToken::RegistrationId next_id = 1;
    std::map<CancellationToken::RegistrationId, std::function<void()>> callbacks;
};

} // namespace detail

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {
}

CancellationToken CancellationToken::None() {
    return CancellationToken(nullptr);
}

bool CancellationToken::IsCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return true;
    }
    return state_->deadline && Clock::now() >= *state_->deadline;
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::Deadline() const {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

std::string CancellationToken::Reason() const {
    if (!state_) {
        return "";
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return "cancelled";
    }
    if (state_->deadline && Clock::now() >= *state_->deadline) {
        return "deadline exceeded";
    }
    return "";
}

CancellationToken::RegistrationId CancellationToken::Register(std::function<void()> callback) const {
    if (!state_) {
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::Unregister(RegistrationId id) const {
    if (!state_ || id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {
}

CancellationSource CancellationSource::WithTimeout(std::chrono::milliseconds timeout) {
    return WithDeadline(Clock::now() + timeout);
}

CancellationSource CancellationSource::WithDeadline(Clock::time_point deadline) {
    CancellationSource source;
    source.state_->deadline = deadline;
    return source;
}

void CancellationSource::Cancel() {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        for (auto& entry : state_->callbacks) {
            to_run.push_back(std::move(entry.second));
        }
        state_->callbacks.clear();
    }
    // Callbacks run outside the lock so they may touch the token again
    for (auto& callback : to_run) {
        callback();
    }
}

CancellationToken CancellationSource::Token() const {
    return CancellationToken(state_);
}

} // namespace oauth2_loopback
