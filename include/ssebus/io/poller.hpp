#pragma once

#include <ssebus/coro/cancel_token.hpp>
#include <ssebus/log/macros.hpp>

#include <sys/epoll.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <coroutine>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace ssebus::runtime {
class scheduler;

// Defined in scheduler.hpp
void schedule_handle(std::coroutine_handle<> handle, scheduler* home) noexcept;
}

namespace ssebus::io {

/// Writability readiness over epoll
///
/// A coroutine whose non-blocking write hit EAGAIN parks here until its
/// descriptor can take more bytes. Parked coroutines are resumed on the
/// scheduler they were suspended on, with 0 once the descriptor is writable
/// (or hung up, so the retried write reports the real error) and
/// -ECANCELED when the wait is cancelled.
///
/// Any thread may arm or cancel waits; one thread at a time polls.
class poller {
public:
    static constexpr size_t MAX_EVENTS = 256;

    poller() : events_(MAX_EVENTS) {
        epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            throw std::runtime_error(
                std::string("epoll_create1 failed: ") + std::strerror(errno));
        }
    }

    ~poller() {
        cancel_all();
        ::close(epoll_fd_);
    }

    poller(const poller&) = delete;
    poller& operator=(const poller&) = delete;

    /// Park `awaiter` until `fd` is writable
    ///
    /// Returns false without parking when `cancelled` has already fired or
    /// the descriptor cannot be watched; `*result` then holds the negative
    /// errno. Otherwise `*result` is written just before the awaiter resumes.
    bool arm_writable(int fd, std::coroutine_handle<> awaiter, int* result,
                      runtime::scheduler* home, const coro::cancel_token& cancelled) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled.is_cancelled()) {
            *result = -ECANCELED;
            return false;
        }

        auto& state = fds_[fd];
        if (!state.registered) {
            struct epoll_event ev{};
            ev.events = EPOLLOUT;
            ev.data.fd = fd;
            if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
                int saved_errno = errno;
                SSEBUS_LOG_WARNING("epoll_ctl failed for fd {}: {}", fd, std::strerror(saved_errno));
                if (state.waiters.empty()) {
                    fds_.erase(fd);
                }
                *result = -saved_errno;
                return false;
            }
            state.registered = true;
        }
        state.waiters.push_back(waiter{awaiter, result, home});
        ++pending_;
        SSEBUS_LOG_DEBUG("fd {} waiting for writability", fd);
        return true;
    }

    /// Resume every coroutine parked on `fd` with -ECANCELED
    size_t cancel(int fd) {
        std::vector<waiter> woken;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = fds_.find(fd);
            if (it == fds_.end()) {
                return 0;
            }
            woken = take(it);
        }
        resume_all(woken, -ECANCELED);
        return woken.size();
    }

    /// Cancel every parked wait
    void cancel_all() {
        std::vector<waiter> woken;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            while (!fds_.empty()) {
                auto batch = take(fds_.begin());
                woken.insert(woken.end(), batch.begin(), batch.end());
            }
        }
        resume_all(woken, -ECANCELED);
    }

    /// Wait up to `timeout` for descriptors to become writable
    /// @return Number of waits completed, or -1 on epoll failure
    int poll(std::chrono::milliseconds timeout) {
        int nfds = ::epoll_wait(epoll_fd_, events_.data(),
                                static_cast<int>(events_.size()),
                                static_cast<int>(timeout.count()));
        if (nfds < 0) {
            if (errno == EINTR) {
                return 0;
            }
            SSEBUS_LOG_ERROR("epoll_wait failed: {}", std::strerror(errno));
            return -1;
        }

        std::vector<waiter> woken;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int i = 0; i < nfds; ++i) {
                int fd = events_[i].data.fd;
                // Cancelled between epoll_wait and the lock
                auto it = fds_.find(fd);
                if (it == fds_.end()) {
                    continue;
                }
                auto batch = take(it);
                woken.insert(woken.end(), batch.begin(), batch.end());
            }
        }

        resume_all(woken, 0);
        return static_cast<int>(woken.size());
    }

    bool has_pending() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_ > 0;
    }

    size_t pending_count() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_;
    }

private:
    struct waiter {
        std::coroutine_handle<> handle;
        int* result;
        runtime::scheduler* home;
    };

    struct fd_state {
        std::vector<waiter> waiters;
        bool registered = false;
    };

    /// Unregister one descriptor and hand back its waiters; lock held
    std::vector<waiter> take(std::unordered_map<int, fd_state>::iterator it) {
        if (it->second.registered) {
            ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, it->first, nullptr);
        }
        std::vector<waiter> woken = std::move(it->second.waiters);
        pending_ -= woken.size();
        fds_.erase(it);
        return woken;
    }

    static void resume_all(std::vector<waiter>& woken, int result) {
        for (auto& w : woken) {
            *w.result = result;
            runtime::schedule_handle(w.handle, w.home);
        }
    }

    int epoll_fd_ = -1;
    std::vector<struct epoll_event> events_;
    mutable std::mutex mutex_;
    std::unordered_map<int, fd_state> fds_;
    size_t pending_ = 0;
};

} // namespace ssebus::io

// schedule_handle() definition
#include <ssebus/runtime/scheduler.hpp>
