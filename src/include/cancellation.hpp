#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace oauth2_loopback {

namespace detail {
struct CancellationState;
}

// Read side of a cancellation signal. Copies share the same state.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;
    using RegistrationId = uint64_t;

    // A token that never fires
    static CancellationToken None();

    // True once Cancel() was called on the source or the deadline has passed
    bool IsCancelled() const;

    std::optional<Clock::time_point> Deadline() const;

    // "cancelled", "deadline exceeded" or empty while not cancelled
    std::string Reason() const;

    // Runs callback on explicit cancellation. Runs it immediately when the
    // token is already cancelled. Deadlines do not trigger callbacks; waiters
    // combine Register() with Deadline().
    RegistrationId Register(std::function<void()> callback) const;
    void Unregister(RegistrationId id) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
};

// Write side of a cancellation signal, owned by whoever decides to abort
class CancellationSource {
public:
    using Clock = CancellationToken::Clock;

    CancellationSource();

    static CancellationSource WithTimeout(std::chrono::milliseconds timeout);
    static CancellationSource WithDeadline(Clock::time_point deadline);

    void Cancel();

    CancellationToken Token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

// Removes a registration when leaving scope
class ScopedCancellationRegistration {
public:
    ScopedCancellationRegistration(const CancellationToken& token, std::function<void()> callback)
        : token_(token), id_(token.Register(std::move(callback))) {}
    ~ScopedCancellationRegistration() { token_.Unregister(id_); }

    ScopedCancellationRegistration(const ScopedCancellationRegistration&) = delete;
    ScopedCancellationRegistration& operator=(const ScopedCancellationRegistration&) = delete;

private:
    CancellationToken token_;
    CancellationToken::RegistrationId id_;
};

} // namespace oauth2_loopback
