#pragma once

/// @file chunk.hpp
/// @brief The SSE payload value published on the bus
///
/// A chunk is built once by a publisher, shared immutably by every
/// subscriber of the topic it was published on, and turned into wire bytes
/// by the encoder at each connection.

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ssebus::sse {

/// Raised when a caller names a chunk kind other than "message" or "event"
class invalid_chunk_kind : public std::runtime_error {
public:
    explicit invalid_chunk_kind(std::string kind)
        : std::runtime_error("unknown chunk kind: '" + kind + "'")
        , kind_(std::move(kind)) {}

    invalid_chunk_kind(std::string kind, const std::string& reason)
        : std::runtime_error(reason)
        , kind_(std::move(kind)) {}

    /// The offending kind value
    const std::string& kind() const noexcept { return kind_; }

private:
    std::string kind_;
};

/// Raised for a chunk that cannot be put on the wire
class invalid_chunk : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Closed set of chunk kinds
enum class chunk_type : uint8_t {
    message,  ///< Untyped; clients see it as "message"
    event     ///< Carries an event name
};

constexpr const char* chunk_type_to_string(chunk_type type) noexcept {
    switch (type) {
        case chunk_type::message: return "message";
        case chunk_type::event:   return "event";
        default:                  return "unknown";
    }
}

/// Parse the string form used at API boundaries
inline std::optional<chunk_type> parse_chunk_type(std::string_view kind) noexcept {
    if (kind == "message") return chunk_type::message;
    if (kind == "event") return chunk_type::event;
    return std::nullopt;
}

/// One SSE event before encoding
class chunk {
public:
    using lines = std::vector<std::string>;

    /// A single line, or an ordered sequence of lines
    using payload = std::variant<std::string, lines>;

    /// Untyped chunk
    static chunk message(payload data) {
        return chunk{std::move(data), std::nullopt};
    }

    /// Chunk with an event name
    static chunk event(std::string name, payload data) {
        return chunk{std::move(data), std::move(name)};
    }

    /// Copy carrying an `id:` field
    [[nodiscard]] chunk with_id(std::string id) const {
        chunk copy = *this;
        copy.id_ = std::move(id);
        return copy;
    }

    /// Copy carrying a `retry:` field
    [[nodiscard]] chunk with_retry(std::chrono::milliseconds retry) const {
        chunk copy = *this;
        copy.retry_ = retry;
        return copy;
    }

    chunk_type type() const noexcept {
        return event_ ? chunk_type::event : chunk_type::message;
    }

    const payload& data() const noexcept { return data_; }
    const std::optional<std::string>& event_name() const noexcept { return event_; }
    const std::optional<std::string>& id() const noexcept { return id_; }
    const std::optional<std::chrono::milliseconds>& retry() const noexcept { return retry_; }

    /// True for a single line
    bool is_single_line() const noexcept {
        return std::holds_alternative<std::string>(data_);
    }

    /// True when encoding emits no data lines at all
    bool empty() const noexcept {
        auto* seq = std::get_if<lines>(&data_);
        return seq && seq->empty();
    }

    friend bool operator==(const chunk&, const chunk&) = default;

private:
    chunk(payload data, std::optional<std::string> event)
        : data_(std::move(data)), event_(std::move(event)) {}

    payload data_;
    std::optional<std::string> event_;
    std::optional<std::string> id_;
    std::optional<std::chrono::milliseconds> retry_;
};

/// Build a chunk from an already validated kind
///
/// `event_name` is required for chunk_type::event and ignored otherwise.
inline chunk build_chunk(chunk::payload data, chunk_type type,
                         std::optional<std::string> event_name = std::nullopt) {
    if (type == chunk_type::message) {
        return chunk::message(std::move(data));
    }
    if (!event_name || event_name->empty()) {
        throw invalid_chunk_kind(chunk_type_to_string(type),
                                 "event chunk requires a non-empty event name");
    }
    return chunk::event(std::move(*event_name), std::move(data));
}

/// Build a chunk from the string kind used by callers ("message" / "event")
///
/// @throws invalid_chunk_kind for any other kind, carrying the value
inline chunk build_chunk(chunk::payload data, std::string_view kind,
                         std::optional<std::string> event_name = std::nullopt) {
    auto type = parse_chunk_type(kind);
    if (!type) {
        throw invalid_chunk_kind(std::string(kind));
    }
    return build_chunk(std::move(data), *type, std::move(event_name));
}

} // namespace ssebus::sse
