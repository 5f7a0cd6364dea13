#pragma once

#include <ssebus/transport/transport.hpp>
#include <ssebus/io/io_awaitables.hpp>
#include <ssebus/log/macros.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <string_view>
#include <fcntl.h>
#include <unistd.h>

namespace ssebus::transport {

/// Transport over a POSIX descriptor (socket, pipe, stdout)
///
/// The descriptor is switched to non-blocking mode for the transport's
/// lifetime. When the peer stops reading, write() parks the stream on the
/// scheduler's poller until the descriptor drains, so a slow client holds up
/// only its own stream. With no scheduler on the calling thread the write
/// waits on that thread instead.
///
/// close() interrupts a parked write. Any write error other than EINTR or
/// EAGAIN closes the transport. SIGPIPE must be ignored by the process for
/// EPIPE to surface here instead of terminating it.
class fd_transport final : public transport {
public:
    /// @param fd Descriptor to write to
    /// @param owns_fd Close the descriptor on destruction
    explicit fd_transport(int fd, bool owns_fd = false)
        : fd_(fd), owns_fd_(owns_fd) {
        if (fd_ >= 0) {
            saved_flags_ = ::fcntl(fd_, F_GETFL);
            if (saved_flags_ >= 0 && !(saved_flags_ & O_NONBLOCK)) {
                ::fcntl(fd_, F_SETFL, saved_flags_ | O_NONBLOCK);
            }
        }
        on_close_ = closed_.get_token().on_cancel([this] { interrupt_write(); });
    }

    ~fd_transport() override {
        close();
        on_close_.unregister();
        if (fd_ < 0) {
            return;
        }
        if (owns_fd_) {
            ::close(fd_);
        } else if (saved_flags_ >= 0 && !(saved_flags_ & O_NONBLOCK)) {
            // Hand the descriptor back the way it was given
            ::fcntl(fd_, F_SETFL, saved_flags_);
        }
    }

    fd_transport(const fd_transport&) = delete;
    fd_transport& operator=(const fd_transport&) = delete;

    coro::task<bool> write(std::string_view bytes) override {
        if (closed_.is_cancelled() || fd_ < 0) {
            co_return false;
        }
        size_t sent = 0;
        while (sent < bytes.size()) {
            ssize_t n = ::write(fd_, bytes.data() + sent, bytes.size() - sent);
            if (n > 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                int rc = co_await writable();
                if (rc < 0) {
                    if (rc != -ECANCELED) {
                        SSEBUS_LOG_INFO("waiting on fd {} failed: {}", fd_, std::strerror(-rc));
                    }
                    close();
                    co_return false;
                }
                continue;
            }
            if (n < 0) {
                int saved_errno = errno;
                SSEBUS_LOG_INFO("write to fd {} failed: {}", fd_, std::strerror(saved_errno));
            }
            close();
            co_return false;
        }
        bytes_written_.fetch_add(sent, std::memory_order_relaxed);
        co_return true;
    }

    coro::cancel_token closed_token() const noexcept override {
        return closed_.get_token();
    }

    void close() override {
        closed_.cancel();
    }

    int fd() const noexcept { return fd_; }

    size_t bytes_written() const noexcept {
        return bytes_written_.load(std::memory_order_relaxed);
    }

private:
    /// Wait until the descriptor takes more bytes; 0, or a negative errno
    coro::task<int> writable() {
        io::poller* p = io::current_poller();
        if (!p) {
            co_return io::block_until_writable(fd_);
        }
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            if (closed_.is_cancelled()) {
                co_return -ECANCELED;
            }
            waiting_on_ = p;
        }
        int rc = co_await io::wait_writable(*p, fd_, closed_.get_token());
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            waiting_on_ = nullptr;
        }
        co_return rc;
    }

    void interrupt_write() {
        io::poller* p = nullptr;
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            p = waiting_on_;
        }
        if (p) {
            p->cancel(fd_);
        }
    }

    int fd_;
    bool owns_fd_;
    int saved_flags_ = -1;
    coro::cancel_source closed_;
    coro::cancel_registration on_close_;
    std::mutex wait_mutex_;
    io::poller* waiting_on_ = nullptr;
    std::atomic<size_t> bytes_written_{0};
};

} // namespace ssebus::transport
