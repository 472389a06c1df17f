#pragma once

#include "core/clock.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace auctionsim {

/// Cancellation scope: a copyable handle that becomes "done" when its
/// deadline passes or when it (or any ancestor) is cancelled explicitly.
/// Every copy observes the same state, so an auction and all of its bidders
/// share one signal.
///
/// A child's deadline never exceeds its parent's, and cancelling a parent
/// cancels every live child.
class CancelScope {
    struct State;

public:
    using TimePoint = SteadyClock::time_point;

    /// RAII registration of a cancellation callback. Destroying it
    /// unregisters the callback and waits for an in-progress invocation.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

    private:
        friend class CancelScope;
        Subscription(std::weak_ptr<State> state, uint64_t id);
        void reset();

        std::weak_ptr<State> state_;
        uint64_t id_ = 0;
    };

    /// Root scope with no deadline; done only once cancelled.
    static CancelScope background();

    /// Child scope: deadline = min(parent deadline, now + timeout).
    static CancelScope withTimeout(const CancelScope& parent,
                                   std::chrono::nanoseconds timeout);

    /// Child scope: deadline = min(parent deadline, deadline).
    static CancelScope withDeadline(const CancelScope& parent, TimePoint deadline);

    /// Cancel this scope and all of its descendants. Idempotent.
    void cancel() const;

    /// True once cancelled or past the deadline.
    bool done() const;

    /// True only for explicit cancellation (this scope or an ancestor).
    bool cancelled() const;

    TimePoint deadline() const;
    bool hasDeadline() const { return deadline() != TimePoint::max(); }

    /// Time left until the deadline; zero when done.
    std::chrono::nanoseconds remaining() const;

    /// Sleep for d, racing the scope. Returns true only if the whole duration
    /// elapsed without the scope becoming done first.
    bool sleepFor(std::chrono::nanoseconds d) const;

    /// Block until the scope is done.
    void wait() const;

    /// Register a callback fired once on explicit cancellation. If the scope
    /// is already cancelled the callback runs immediately and an empty
    /// subscription is returned. Deadline expiry does not fire callbacks;
    /// waiters observe it through deadline().
    Subscription subscribe(std::function<void()> callback) const;

private:
    explicit CancelScope(std::shared_ptr<State> state);

    static void cancelState(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

}  // namespace auctionsim
