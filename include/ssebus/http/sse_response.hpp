#pragma once

/// @file sse_response.hpp
/// @brief Glue between an HTTP handler and a stream
///
/// The HTTP server is not part of this library. These helpers cover the two
/// things every SSE handler does before calling stream::stream(): work out
/// the topic list from the request and send the response head.

#include <ssebus/sse/encoder.hpp>
#include <ssebus/stream/subscription_loop.hpp>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ssebus::http {

/// Query parameter holding the comma separated topic list
inline constexpr std::string_view TOPICS_PARAM = "topics";

/// URL-decode a query component ('+' is a space)
inline std::string url_decode(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = 0, lo = 0;
            auto [p1, e1] = std::from_chars(&str[i + 1], &str[i + 2], hi, 16);
            auto [p2, e2] = std::from_chars(&str[i + 2], &str[i + 3], lo, 16);
            if (e1 == std::errc{} && e2 == std::errc{} &&
                p1 == &str[i + 2] && p2 == &str[i + 3]) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
            result += str[i];
        } else if (str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }

    return result;
}

/// Split a decoded `topics` value on commas; empty segments are skipped
inline stream::subscription_set parse_topics(std::string_view value) {
    stream::subscription_set topics;
    while (true) {
        auto comma = value.find(',');
        auto part = value.substr(0, comma);
        if (!part.empty()) {
            topics.emplace_back(part);
        }
        if (comma == std::string_view::npos) break;
        value.remove_prefix(comma + 1);
    }
    return topics;
}

/// Look up the raw (still encoded) value of `key` in a query string
inline std::optional<std::string_view> find_query_param(std::string_view query,
                                                        std::string_view key) {
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        auto eq = pair.find('=');
        auto name = pair.substr(0, eq);
        if (name == key) {
            return eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

/// Topic list of a request query string (`a=1&topics=x,y`)
///
/// A request without the parameter subscribes to nothing.
inline stream::subscription_set topics_from_query(std::string_view query) {
    auto raw = find_query_param(query, TOPICS_PARAM);
    if (!raw) {
        return {};
    }
    return parse_topics(url_decode(*raw));
}

/// Headers of an SSE response
inline std::vector<std::pair<std::string, std::string>> sse_headers() {
    return {
        {"Content-Type", std::string(sse::SSE_CONTENT_TYPE)},
        {"Cache-Control", "no-cache"},
        {"Connection", "keep-alive"},
        // Allow EventSource from any origin
        {"Access-Control-Allow-Origin", "*"},
    };
}

/// Full HTTP/1.1 response head, written before the first frame
inline std::string sse_response_head() {
    std::string head = "HTTP/1.1 200 OK\r\n";
    for (const auto& [name, value] : sse_headers()) {
        head += name;
        head += ": ";
        head += value;
        head += "\r\n";
    }
    head += "\r\n";
    return head;
}

} // namespace ssebus::http
