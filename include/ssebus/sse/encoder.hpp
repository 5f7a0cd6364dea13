#pragma once

/// @file encoder.hpp
/// @brief Chunk to SSE wire format
///
/// Frame layout (fields only present when set on the chunk):
///
///     id: <id>\n
///     event: <name>\n
///     retry: <ms>\n
///     data: <line>\n      (one per line)
///     \n
///
/// CR, LF and CRLF inside a data element always start a new `data:` line.
/// The SSE grammar ends a field at any of them, so leaving one in place
/// would let a payload inject fields into the frame.

#include <ssebus/sse/chunk.hpp>

#include <fmt/format.h>

#include <memory>
#include <string>
#include <string_view>

namespace ssebus::sse {

/// MIME type for SSE
inline constexpr std::string_view SSE_CONTENT_TYPE = "text/event-stream";

namespace detail {

inline bool has_line_break(std::string_view value) noexcept {
    return value.find_first_of("\r\n") != std::string_view::npos;
}

/// Append one `data:` line per line of `text`
inline void append_data_lines(std::string& out, std::string_view text) {
    size_t start = 0;
    while (true) {
        size_t end = text.find_first_of("\r\n", start);
        out += "data: ";
        if (end == std::string_view::npos) {
            out += text.substr(start);
            out += '\n';
            return;
        }
        out += text.substr(start, end - start);
        out += '\n';
        // CRLF is one break
        if (text[end] == '\r' && end + 1 < text.size() && text[end + 1] == '\n') {
            ++end;
        }
        start = end + 1;
    }
}

inline void append_field(std::string& out, std::string_view name,
                         std::string_view value) {
    if (has_line_break(value)) {
        throw invalid_chunk(fmt::format("'{}' field must be a single line", name));
    }
    out += name;
    out += ": ";
    out += value;
    out += '\n';
}

} // namespace detail

/// Append the wire bytes of `c` to `out`
///
/// On failure `out` is left as it was.
/// @throws invalid_chunk if the event name or id contains a line break
inline void encode_to(const chunk& c, std::string& out) {
    std::string frame;

    if (c.id()) {
        detail::append_field(frame, "id", *c.id());
    }
    if (c.event_name()) {
        detail::append_field(frame, "event", *c.event_name());
    }
    if (c.retry()) {
        detail::append_field(frame, "retry", std::to_string(c.retry()->count()));
    }

    if (auto* line = std::get_if<std::string>(&c.data())) {
        detail::append_data_lines(frame, *line);
    } else {
        for (const auto& element : std::get<chunk::lines>(c.data())) {
            detail::append_data_lines(frame, element);
        }
    }

    // End of event (blank line)
    frame += '\n';

    out += frame;
}

/// Wire bytes of one chunk
inline std::string encode(const chunk& c) {
    std::string out;
    encode_to(c, out);
    return out;
}

/// Wire bytes of a shared chunk as delivered by a bus
/// @throws invalid_chunk if the payload is missing
inline std::string encode(const std::shared_ptr<const chunk>& c) {
    if (!c) {
        throw invalid_chunk("chunk has no data");
    }
    return encode(*c);
}

/// A comment frame; clients ignore it, proxies see traffic
inline std::string encode_comment(std::string_view text = {}) {
    std::string out;
    size_t start = 0;
    do {
        size_t end = text.find_first_of("\r\n", start);
        out += ':';
        auto part = text.substr(start, end == std::string_view::npos ? end : end - start);
        if (!part.empty()) {
            out += ' ';
            out += part;
        }
        out += '\n';
        if (end == std::string_view::npos) break;
        if (text[end] == '\r' && end + 1 < text.size() && text[end + 1] == '\n') {
            ++end;
        }
        start = end + 1;
    } while (start <= text.size());
    out += '\n';
    return out;
}

} // namespace ssebus::sse
