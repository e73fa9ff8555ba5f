#include "cancel_scope.hpp"
#include <algorithm>

// Parent cancellation does not notify children; waiters re-check at this interval.
static constexpr std::chrono::milliseconds WAIT_SLICE{20};

CancelScope CancelScope::root() {
    return CancelScope(std::make_shared<State>());
}

CancelScope CancelScope::child(std::chrono::milliseconds timeout) const {
    auto state = std::make_shared<State>();
    state->parent = state_;
    if (timeout.count() > 0) {
        state->deadline = Clock::now() + timeout;
    }
    return CancelScope(std::move(state));
}

void CancelScope::cancel() const {
    if (!state_) return;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

CancelReason CancelScope::reason_of(const State* state, Clock::time_point now) {
    for (const State* s = state; s; s = s->parent.get()) {
        if (s->cancelled) return CancelReason::Cancelled;
        if (s->deadline && now >= *s->deadline) return CancelReason::DeadlineExceeded;
    }
    return CancelReason::None;
}

bool CancelScope::cancelled() const {
    return reason() != CancelReason::None;
}

CancelReason CancelScope::reason() const {
    if (!state_) return CancelReason::Cancelled;
    return reason_of(state_.get(), Clock::now());
}

bool CancelScope::wait_for(std::chrono::milliseconds duration) const {
    if (!state_) return true;

    auto until = Clock::now() + duration;
    std::unique_lock<std::mutex> lock(state_->mutex);
    while (true) {
        auto now = Clock::now();
        if (reason_of(state_.get(), now) != CancelReason::None) return true;
        if (now >= until) return false;
        auto slice = std::min<Clock::duration>(until - now, WAIT_SLICE);
        state_->cv.wait_for(lock, slice);
    }
}
