#pragma once

#include <coroutine>
#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace ssebus::runtime {
class scheduler;  // Forward declaration

// Defined in scheduler.hpp
void schedule_handle(std::coroutine_handle<> handle, scheduler* home) noexcept;
scheduler* get_current_scheduler() noexcept;
}

namespace ssebus::sync {

/// Multi-producer queue with a coroutine-aware receive side
///
/// Producers never block: post() either enqueues, or fails because the
/// mailbox is closed or full. Receivers suspend until an item arrives or the
/// mailbox is closed, and items queued before close() are still handed out.
/// A receiver that suspended on a scheduler worker is resumed on that
/// scheduler, never on the posting thread.
template<typename T>
class mailbox {
public:
    /// @param capacity Maximum number of queued items (0 = unbounded)
    explicit mailbox(size_t capacity = 0)
        : capacity_(capacity) {}

    ~mailbox() {
        close();
    }

    mailbox(const mailbox&) = delete;
    mailbox& operator=(const mailbox&) = delete;

    /// Outcome of a post
    enum class post_result {
        accepted,
        full,
        closed
    };

    class recv_awaitable {
    public:
        explicit recv_awaitable(mailbox& box) : box_(box) {}

        bool await_ready() const noexcept {
            std::lock_guard<std::mutex> guard(box_.mutex_);
            return !box_.queue_.empty() || box_.closed_;
        }

        bool await_suspend(std::coroutine_handle<> awaiter) noexcept {
            std::lock_guard<std::mutex> guard(box_.mutex_);
            if (!box_.queue_.empty() || box_.closed_) {
                return false;
            }
            box_.waiters_.push(waiter{awaiter, runtime::get_current_scheduler()});
            return true;
        }

        /// nullopt once the mailbox is closed and drained
        std::optional<T> await_resume() {
            std::lock_guard<std::mutex> guard(box_.mutex_);
            if (box_.queue_.empty()) {
                return std::nullopt;
            }
            std::optional<T> result(std::move(box_.queue_.front()));
            box_.queue_.pop_front();
            return result;
        }

    private:
        mailbox& box_;
    };

    /// Enqueue without waiting
    post_result post(T value) {
        std::optional<waiter> to_wake;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return post_result::closed;
            }
            if (capacity_ > 0 && queue_.size() >= capacity_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return post_result::full;
            }
            queue_.push_back(std::move(value));
            if (!waiters_.empty()) {
                to_wake = waiters_.front();
                waiters_.pop();
            }
        }
        // Resume outside the lock
        if (to_wake) {
            runtime::schedule_handle(to_wake->handle, to_wake->home);
        }
        return post_result::accepted;
    }

    /// Wait for the next item
    auto recv() {
        return recv_awaitable(*this);
    }

    /// Take an item if one is queued
    std::optional<T> try_recv() {
        std::lock_guard<std::mutex> guard(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> result(std::move(queue_.front()));
        queue_.pop_front();
        return result;
    }

    /// Refuse further posts and wake every receiver
    void close() {
        std::vector<waiter> to_resume;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            while (!waiters_.empty()) {
                to_resume.push_back(waiters_.front());
                waiters_.pop();
            }
        }
        for (auto& w : to_resume) {
            runtime::schedule_handle(w.handle, w.home);
        }
    }

    bool is_closed() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return closed_;
    }

    size_t size() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return queue_.size();
    }

    bool empty() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return queue_.empty();
    }

    size_t capacity() const noexcept {
        return capacity_;
    }

    /// Number of posts refused because the mailbox was full
    size_t dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    struct waiter {
        std::coroutine_handle<> handle;
        runtime::scheduler* home;
    };

    mutable std::mutex mutex_;
    std::deque<T> queue_;
    std::queue<waiter> waiters_;
    const size_t capacity_;
    std::atomic<size_t> dropped_{0};
    bool closed_ = false;
};

} // namespace ssebus::sync

// schedule_handle() definition
#include <ssebus/runtime/scheduler.hpp>
