#include "result_coordinator.hpp"
#include "oauth2_errors.hpp"
#include "loopback_tracing.hpp"

namespace oauth2_loopback {

ResultCoordinator::ResultCoordinator() : slot_(std::make_shared<Slot>()) {
}

bool ResultCoordinator::Publish(const CallbackResult& result) {
    {
        std::lock_guard<std::mutex> lock(slot_->mutex);
        if (slot_->state != SlotState::pending) {
            OAUTH2_LOOPBACK_TRACE_DEBUG("RESULT_COORDINATOR",
                "Discarding " + CallbackOutcomeToString(result.outcome) + " result, outcome already decided");
            return false;
        }
        slot_->state = SlotState::published;
        slot_->result = result;
    }
    slot_->cv.notify_all();
    OAUTH2_LOOPBACK_TRACE_DEBUG("RESULT_COORDINATOR",
        "Published " + CallbackOutcomeToString(result.outcome) + " result");
    return true;
}

bool ResultCoordinator::Fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(slot_->mutex);
        if (slot_->state != SlotState::pending) {
            return false;
        }
        slot_->state = SlotState::failed;
        slot_->failure_reason = reason;
    }
    slot_->cv.notify_all();
    OAUTH2_LOOPBACK_TRACE_DEBUG("RESULT_COORDINATOR", "Wait ended by failure: " + reason);
    return true;
}

CallbackResult ResultCoordinator::Await(const CancellationToken& token) {
    std::weak_ptr<Slot> weak_slot = slot_;
    ScopedCancellationRegistration registration(token, [weak_slot] {
        if (auto slot = weak_slot.lock()) {
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                slot->cancel_requested = true;
            }
            slot->cv.notify_all();
        }
    });

    auto deadline = token.Deadline();
    std::unique_lock<std::mutex> lock(slot_->mutex);

    while (slot_->state == SlotState::pending) {
        if (slot_->cancel_requested) {
            slot_->state = SlotState::cancelled;
            slot_->cancel_reason = "cancelled";
            break;
        }
        if (deadline) {
            if (CancellationToken::Clock::now() >= *deadline) {
                slot_->state = SlotState::cancelled;
                slot_->cancel_reason = "deadline exceeded";
                break;
            }
            slot_->cv.wait_until(lock, *deadline);
        } else {
            slot_->cv.wait(lock);
        }
    }

    if (slot_->state == SlotState::cancelled) {
        throw Cancelled(slot_->cancel_reason);
    }
    if (slot_->state == SlotState::failed) {
        throw OAuth2LoopbackError(slot_->failure_reason);
    }
    return *slot_->result;
}

bool ResultCoordinator::IsDecided() const {
    std::lock_guard<std::mutex> lock(slot_->mutex);
    return slot_->state != SlotState::pending;
}

std::optional<CallbackResult> ResultCoordinator::PeekResult() const {
    std::lock_guard<std::mutex> lock(slot_->mutex);
    return slot_->result;
}

} // namespace oauth2_loopback
