#pragma once

#include <ssebus/stream/subscription_loop.hpp>

#include <optional>
#include <utility>

namespace ssebus::stream {

/// Relay `topics` from `target` to `conn` until the stream ends
///
/// This is what an HTTP handler calls once it has sent the SSE response
/// head. `conn` and `target` must outlive the returned task.
///
/// ```cpp
/// coro::task<void> events_handler(transport::transport& conn, std::string_view query) {
///     auto result = co_await stream::stream(conn, bus, http::parse_topics(query));
///     SSEBUS_LOG_INFO("stream ended: {}", stream::cause_to_string(result.cause));
/// }
/// ```
inline coro::task<stream_result> stream(transport::transport& conn, bus::bus& target,
                                        subscription_set topics,
                                        std::optional<sse::chunk> initial = std::nullopt,
                                        coro::cancel_token shutdown = {},
                                        stream_config config = {}) {
    subscription_loop loop(conn, target, std::move(topics), std::move(config));
    co_return co_await loop.run(std::move(shutdown), std::move(initial));
}

} // namespace ssebus::stream
