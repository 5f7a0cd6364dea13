#pragma once

#include "poller.hpp"
#include <ssebus/runtime/scheduler.hpp>

#include <poll.h>
#include <cerrno>
#include <coroutine>

namespace ssebus::io {

/// Awaitable that suspends until a descriptor is writable
///
/// Yields 0 when the descriptor is writable or hung up, -ECANCELED when
/// `cancelled` fires first, or another negative errno if it cannot be watched.
class writable_awaitable {
public:
    writable_awaitable(poller& p, int fd, coro::cancel_token cancelled) noexcept
        : poller_(p), fd_(fd), cancelled_(std::move(cancelled)) {}

    bool await_ready() const noexcept {
        return false;
    }

    bool await_suspend(std::coroutine_handle<> awaiter) {
        return poller_.arm_writable(fd_, awaiter, &result_,
                                    runtime::scheduler::current(), cancelled_);
    }

    int await_resume() const noexcept {
        return result_;
    }

private:
    poller& poller_;
    int fd_;
    coro::cancel_token cancelled_;
    int result_ = 0;
};

inline writable_awaitable wait_writable(poller& p, int fd, coro::cancel_token cancelled = {}) {
    return writable_awaitable(p, fd, std::move(cancelled));
}

/// Poller of the scheduler running on this thread, if any
inline poller* current_poller() noexcept {
    auto* sched = runtime::scheduler::current();
    return sched ? &sched->io_poller() : nullptr;
}

/// Block the calling thread until `fd` is writable
///
/// For code running with no scheduler, where there is nothing else to run.
/// @return 0, or the negative errno of poll(2)
inline int block_until_writable(int fd) noexcept {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    while (::poll(&pfd, 1, -1) < 0) {
        if (errno != EINTR) {
            return -errno;
        }
    }
    return 0;
}

} // namespace ssebus::io
