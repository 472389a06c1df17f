#include "sync/worker_pool.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace auctionsim {

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 4;
    }
    workers_.reserve(threads);
    try {
        for (size_t i = 0; i < threads; ++i)
            workers_.emplace_back([this] { workerLoop(); });
    } catch (...) {
        {
            std::lock_guard<std::mutex> g(mu_);
            stop_ = true;
        }
        work_cv_.notify_all();
        for (auto& t : workers_)
            t.join();
        throw;
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> g(mu_);
        stop_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : workers_)
        t.join();
}

void WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> g(mu_);
        if (stop_)
            throw std::runtime_error("WorkerPool: post on stopped pool");
        tasks_.push_back(std::move(task));
        ++outstanding_;
    }
    work_cv_.notify_one();
}

void WorkerPool::postAt(TimePoint at, const CancelScope& scope, std::function<void(bool)> task) {
    auto timer = std::make_shared<Timer>(Timer{std::min(at, scope.deadline()), at, 0, scope,
                                               std::move(task), CancelScope::Subscription()});
    // Registered before the timer is queued; a cancel in between is caught
    // by the cancelled() check below.
    timer->subscription = scope.subscribe([this] { requestRescan(); });

    bool new_front = false;
    {
        std::lock_guard<std::mutex> g(mu_);
        if (stop_)
            throw std::runtime_error("WorkerPool: postAt on stopped pool");
        timer->seq = next_seq_++;
        timers_.push_back(timer);
        std::push_heap(timers_.begin(), timers_.end(), Later());
        ++outstanding_;
        if (scope.cancelled())
            rescan_ = true;
        new_front = timers_.front() == timer || rescan_;
    }
    if (new_front)
        work_cv_.notify_all();
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mu_);
    idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
    if (!first_error_.empty()) {
        std::string err;
        err.swap(first_error_);
        throw std::runtime_error("WorkerPool: task failed: " + err);
    }
}

size_t WorkerPool::pendingTimers() const {
    std::lock_guard<std::mutex> g(mu_);
    return timers_.size();
}

// ---------------------------------------------------------------------------
// Worker side
// ---------------------------------------------------------------------------

void WorkerPool::workerLoop() {
    std::unique_lock<std::mutex> lock(mu_);
    for (;;) {
        if (rescan_)
            releaseCancelledLocked();

        if (!tasks_.empty()) {
            std::function<void()> task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();

            std::string error;
            try {
                task();
            } catch (const std::exception& e) {
                error = e.what();
            }
            // Dropping the task may release a timer and its subscription;
            // that must not happen under mu_.
            task = nullptr;

            lock.lock();
            if (!error.empty() && first_error_.empty())
                first_error_ = std::move(error);
            if (--outstanding_ == 0)
                idle_cv_.notify_all();
            continue;
        }

        if (!timers_.empty()) {
            const TimePoint wake = timers_.front()->wake;
            if (stop_ || SteadyClock::now() >= wake) {
                std::pop_heap(timers_.begin(), timers_.end(), Later());
                TimerPtr timer = std::move(timers_.back());
                timers_.pop_back();
                tasks_.push_back([this, timer] { runTimer(timer); });
                continue;
            }
            work_cv_.wait_until(lock, wake);
            continue;
        }

        if (stop_)
            return;
        work_cv_.wait(lock);
    }
}

void WorkerPool::runTimer(const TimerPtr& timer) {
    const bool elapsed = !timer->scope.cancelled() &&
                         timer->at <= timer->scope.deadline() &&
                         SteadyClock::now() >= timer->at;
    timer->task(elapsed);
}

void WorkerPool::requestRescan() {
    {
        std::lock_guard<std::mutex> g(mu_);
        rescan_ = true;
    }
    work_cv_.notify_all();
}

void WorkerPool::releaseCancelledLocked() {
    rescan_ = false;
    auto mid = std::partition(timers_.begin(), timers_.end(),
                              [](const TimerPtr& t) { return !t->scope.cancelled(); });
    if (mid == timers_.end())
        return;
    for (auto it = mid; it != timers_.end(); ++it) {
        TimerPtr timer = std::move(*it);
        tasks_.push_back([this, timer] { runTimer(timer); });
    }
    timers_.erase(mid, timers_.end());
    std::make_heap(timers_.begin(), timers_.end(), Later());
    work_cv_.notify_all();
}

}  // namespace auctionsim
