#include "sync/cancel_scope.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace auctionsim {

struct CancelScope::State {
    TimePoint deadline = TimePoint::max();
    std::atomic<bool> cancelled{false};

    std::mutex mu;
    std::condition_variable cv;
    uint64_t next_subscription_id = 1;
    std::map<uint64_t, std::function<void()>> subscribers;
    std::vector<std::weak_ptr<State>> children;

    // Held while callbacks run so Subscription teardown can wait them out.
    std::mutex callback_mu;
};

namespace {

// Prune expired children once the list grows past this many entries.
constexpr size_t kChildPruneThreshold = 256;

template <typename Pred>
void waitUntilLocked(std::condition_variable& cv,
                     std::unique_lock<std::mutex>& lock,
                     CancelScope::TimePoint tp,
                     Pred pred) {
    if (tp == CancelScope::TimePoint::max())
        cv.wait(lock, pred);
    else
        cv.wait_until(lock, tp, pred);
}

}  // namespace

// ---------------------------------------------------------------------------
// Subscription
// ---------------------------------------------------------------------------

CancelScope::Subscription::Subscription(std::weak_ptr<State> state, uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancelScope::Subscription::~Subscription() {
    reset();
}

CancelScope::Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancelScope::Subscription& CancelScope::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancelScope::Subscription::reset() {
    if (id_ == 0)
        return;
    if (auto state = state_.lock()) {
        {
            std::lock_guard<std::mutex> g(state->mu);
            state->subscribers.erase(id_);
        }
        // Wait for a concurrent cancel() that already took our callback.
        std::lock_guard<std::mutex> cg(state->callback_mu);
    }
    state_.reset();
    id_ = 0;
}

// ---------------------------------------------------------------------------
// CancelScope
// ---------------------------------------------------------------------------

CancelScope::CancelScope(std::shared_ptr<State> state) : state_(std::move(state)) {}

CancelScope CancelScope::background() {
    return CancelScope(std::make_shared<State>());
}

CancelScope CancelScope::withTimeout(const CancelScope& parent,
                                     std::chrono::nanoseconds timeout) {
    const TimePoint now = SteadyClock::now();
    TimePoint deadline = TimePoint::max();
    if (timeout < TimePoint::max() - now)
        deadline = now + std::max(timeout, std::chrono::nanoseconds::zero());
    return withDeadline(parent, deadline);
}

CancelScope CancelScope::withDeadline(const CancelScope& parent, TimePoint deadline) {
    auto child = std::make_shared<State>();
    child->deadline = std::min(deadline, parent.state_->deadline);

    bool parent_cancelled = false;
    {
        std::lock_guard<std::mutex> g(parent.state_->mu);
        if (parent.state_->cancelled.load(std::memory_order_acquire)) {
            parent_cancelled = true;
        } else {
            auto& kids = parent.state_->children;
            if (kids.size() >= kChildPruneThreshold) {
                kids.erase(std::remove_if(kids.begin(), kids.end(),
                                          [](const std::weak_ptr<State>& w) { return w.expired(); }),
                           kids.end());
            }
            kids.push_back(child);
        }
    }
    if (parent_cancelled)
        child->cancelled.store(true, std::memory_order_release);

    return CancelScope(std::move(child));
}

void CancelScope::cancel() const {
    cancelState(state_);
}

void CancelScope::cancelState(const std::shared_ptr<State>& state) {
    std::map<uint64_t, std::function<void()>> callbacks;
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> g(state->mu);
        if (state->cancelled.load(std::memory_order_acquire))
            return;
        state->cancelled.store(true, std::memory_order_release);
        callbacks.swap(state->subscribers);
        children.swap(state->children);
    }
    state->cv.notify_all();

    {
        std::lock_guard<std::mutex> cg(state->callback_mu);
        for (auto& entry : callbacks)
            entry.second();
    }

    for (const auto& weak : children) {
        if (auto child = weak.lock())
            cancelState(child);
    }
}

bool CancelScope::done() const {
    return state_->cancelled.load(std::memory_order_acquire) ||
           SteadyClock::now() >= state_->deadline;
}

bool CancelScope::cancelled() const {
    return state_->cancelled.load(std::memory_order_acquire);
}

CancelScope::TimePoint CancelScope::deadline() const {
    return state_->deadline;
}

std::chrono::nanoseconds CancelScope::remaining() const {
    if (cancelled())
        return std::chrono::nanoseconds::zero();
    if (!hasDeadline())
        return std::chrono::nanoseconds::max();
    const TimePoint now = SteadyClock::now();
    if (now >= state_->deadline)
        return std::chrono::nanoseconds::zero();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(state_->deadline - now);
}

bool CancelScope::sleepFor(std::chrono::nanoseconds d) const {
    const TimePoint target = SteadyClock::now() + std::max(d, std::chrono::nanoseconds::zero());
    const TimePoint wake = std::min(target, state_->deadline);

    std::unique_lock<std::mutex> lock(state_->mu);
    waitUntilLocked(state_->cv, lock, wake, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });

    if (state_->cancelled.load(std::memory_order_acquire))
        return false;
    return target <= state_->deadline && SteadyClock::now() >= target;
}

void CancelScope::wait() const {
    std::unique_lock<std::mutex> lock(state_->mu);
    waitUntilLocked(state_->cv, lock, state_->deadline, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

CancelScope::Subscription CancelScope::subscribe(std::function<void()> callback) const {
    {
        std::lock_guard<std::mutex> g(state_->mu);
        if (!state_->cancelled.load(std::memory_order_acquire)) {
            const uint64_t id = state_->next_subscription_id++;
            state_->subscribers.emplace(id, std::move(callback));
            return Subscription(state_, id);
        }
    }
    callback();
    return Subscription();
}

}  // namespace auctionsim
