#pragma once

#include "sync/cancel_scope.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace auctionsim {

/// Fixed set of worker threads serving two queues:
/// - immediate tasks, run in FIFO order;
/// - timed tasks, kept in a min-heap on their wake-up time and run once that
///   time is reached or their scope is done, whichever comes first.
///
/// A timed task is told whether its full delay elapsed with the scope still
/// live, matching CancelScope::sleepFor. Many thousands of waiting tasks cost
/// heap entries, not threads.
class WorkerPool {
public:
    using TimePoint = SteadyClock::time_point;

    /// 0 = hardware concurrency (4 if unknown).
    explicit WorkerPool(size_t threads = 0);

    /// Stops accepting work, runs what is queued (timed tasks are woken
    /// early with elapsed = false) and joins the workers.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void post(std::function<void()> task);

    /// Run task(elapsed) at `at`, or earlier once `scope` is done.
    void postAt(TimePoint at, const CancelScope& scope, std::function<void(bool)> task);

    /// Block until both queues are empty and no task is running. Rethrows
    /// the first task failure as std::runtime_error.
    void waitIdle();

    size_t threadCount() const { return workers_.size(); }
    size_t pendingTimers() const;

private:
    struct Timer {
        TimePoint wake;    // min(at, scope deadline)
        TimePoint at;
        uint64_t seq;
        CancelScope scope;
        std::function<void(bool)> task;
        CancelScope::Subscription subscription;
    };
    using TimerPtr = std::shared_ptr<Timer>;

    struct Later {
        bool operator()(const TimerPtr& a, const TimerPtr& b) const {
            if (a->wake != b->wake) return a->wake > b->wake;
            return a->seq > b->seq;
        }
    };

    void workerLoop();
    void runTimer(const TimerPtr& timer);
    void requestRescan();
    void releaseCancelledLocked();

    mutable std::mutex mu_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<TimerPtr> timers_;   // heap ordered by Later
    uint64_t next_seq_ = 0;
    size_t outstanding_ = 0;         // queued + waiting + running
    bool rescan_ = false;
    bool stop_ = false;
    std::string first_error_;

    std::vector<std::thread> workers_;
};

}  // namespace auctionsim
