#pragma once

#include "sync/cancel_scope.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace auctionsim {

enum class RecvStatus { ITEM, CLOSED, CANCELLED };

/// Bounded multi-producer / multi-consumer channel.
/// - Blocking operations race a CancelScope: they give up at its deadline or
///   on explicit cancellation, whichever comes first.
/// - A send attempted under a scope that is already done never enqueues.
/// - Buffered items are delivered before cancellation or closure is reported.
/// - After close(), sends fail and receives return what is left, then CLOSED.
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0)
            throw std::invalid_argument("Channel: capacity must be positive");
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Enqueue without waiting. False if full or closed.
    bool trySend(T value) {
        {
            std::lock_guard<std::mutex> g(mu_);
            if (closed_ || buf_.size() >= capacity_)
                return false;
            buf_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Enqueue, waiting for space until the scope is done.
    /// False if the scope finished first or the channel is closed.
    bool send(T value, const CancelScope& scope) {
        if (scope.done())
            return false;
        auto sub = scope.subscribe([this] { wakeAll(); });
        {
            std::unique_lock<std::mutex> lock(mu_);
            for (;;) {
                if (closed_)
                    return false;
                if (buf_.size() < capacity_) {
                    buf_.push_back(std::move(value));
                    break;
                }
                if (scope.done())
                    return false;
                waitLocked(not_full_, lock, scope);
            }
        }
        not_empty_.notify_one();
        return true;
    }

    /// Dequeue without waiting. Works on a closed channel until it is empty.
    bool tryRecv(T& out) {
        {
            std::lock_guard<std::mutex> g(mu_);
            if (buf_.empty())
                return false;
            out = std::move(buf_.front());
            buf_.pop_front();
        }
        not_full_.notify_one();
        return true;
    }

    /// Dequeue, waiting until an item arrives, the channel is closed or the
    /// scope is done.
    RecvStatus recv(T& out, const CancelScope& scope) {
        auto sub = scope.subscribe([this] { wakeAll(); });
        {
            std::unique_lock<std::mutex> lock(mu_);
            for (;;) {
                if (!buf_.empty()) {
                    out = std::move(buf_.front());
                    buf_.pop_front();
                    break;
                }
                if (closed_)
                    return RecvStatus::CLOSED;
                if (scope.done())
                    return RecvStatus::CANCELLED;
                waitLocked(not_empty_, lock, scope);
            }
        }
        not_full_.notify_one();
        return RecvStatus::ITEM;
    }

    /// Reject further sends and wake every waiter. Idempotent.
    void close() {
        {
            std::lock_guard<std::mutex> g(mu_);
            closed_ = true;
        }
        wakeAll();
    }

    bool closed() const {
        std::lock_guard<std::mutex> g(mu_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> g(mu_);
        return buf_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    void waitLocked(std::condition_variable& cv,
                    std::unique_lock<std::mutex>& lock,
                    const CancelScope& scope) {
        if (scope.hasDeadline())
            cv.wait_until(lock, scope.deadline());
        else
            cv.wait(lock);
    }

    void wakeAll() {
        // Taking the lock orders the wakeup after a waiter's predicate check.
        { std::lock_guard<std::mutex> g(mu_); }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    const size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> buf_;
    bool closed_ = false;
};

}  // namespace auctionsim
