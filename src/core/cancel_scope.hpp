#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

enum class CancelReason {
    None,
    Cancelled,         // cancel() was called on this scope or an ancestor
    DeadlineExceeded,  // this scope's (or an ancestor's) deadline passed
};

// Cancellable scope with an optional deadline. Copies share state.
//
// A child observes its parent: cancelling the parent (or the parent's
// deadline passing) cancels every scope derived from it. A child's deadline
// never extends its parent's.
//
// Usage:
//   auto lifetime = CancelScope::root();
//   auto call = lifetime.child(std::chrono::seconds(30));
//   while (!call.cancelled()) { ... }
//   lifetime.cancel();   // call.cancelled() is now true too
//
class CancelScope {
public:
    using Clock = std::chrono::steady_clock;

    // An empty handle; cancelled() is always true
    CancelScope() = default;

    static CancelScope root();

    // timeout of zero means no deadline of its own
    CancelScope child(std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) const;

    void cancel() const;

    bool valid() const { return state_ != nullptr; }
    bool cancelled() const;
    CancelReason reason() const;

    // Sleep for up to `duration`. Returns true if the scope was cancelled
    // before the duration elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::shared_ptr<State> parent;
        std::optional<Clock::time_point> deadline;
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    explicit CancelScope(std::shared_ptr<State> state) : state_(std::move(state)) {}

    static CancelReason reason_of(const State* state, Clock::time_point now);

    std::shared_ptr<State> state_;
};
