#pragma once

#include <ssebus/coro/task.hpp>
#include <ssebus/coro/cancel_token.hpp>

#include <string_view>

namespace ssebus::transport {

/// The open HTTP response a stream writes to
///
/// Owned by the HTTP layer; a stream only borrows it. Implementations fire
/// closed_token() exactly once, when the peer goes away or close() is
/// called, so a stream can wait for disconnect alongside bus messages.
class transport {
public:
    virtual ~transport() = default;

    /// Write all of `bytes`; false if the transport failed or is closed
    virtual coro::task<bool> write(std::string_view bytes) = 0;

    /// Fires when the transport closes
    virtual coro::cancel_token closed_token() const noexcept = 0;

    /// Mark the transport closed
    virtual void close() = 0;

    bool is_closed() const noexcept {
        return closed_token().is_cancelled();
    }
};

} // namespace ssebus::transport
