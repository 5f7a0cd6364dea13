#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <chrono>
#include <system_error>

namespace ssebus::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Convert log level to ANSI color code
constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";  // Cyan
        case level::info:    return "\033[32m";  // Green
        case level::warning: return "\033[33m";  // Yellow
        case level::error:   return "\033[31m";  // Red
        default:             return "\033[0m";   // Reset
    }
}

/// Process-wide logger
///
/// Streams write SSE frames to descriptors that may be stdout, so log output
/// defaults to stderr and can be redirected with set_output().
class logger {
public:
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Check whether a message at this level would be written
    bool enabled(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed);
    }

    /// Redirect output (nullptr restores stderr)
    void set_output(std::FILE* out) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : stderr;
    }

    /// Enable or disable ANSI colors
    void set_color(bool enabled) noexcept {
        color_.store(enabled, std::memory_order_relaxed);
    }

    /// Lines lost because the output could not be written
    size_t failed_writes() const noexcept {
        return failed_writes_.load(std::memory_order_relaxed);
    }

    /// Log a message with formatting
    ///
    /// Never throws on a failed write to the output, so it is safe to call
    /// from destructors and cleanup paths.
    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        bool color = color_.load(std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(mutex_);

        // Format: [TIMESTAMP] [LEVEL] [file:line] message
        try {
            fmt::print(out_,
                "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}{}\n",
                color ? level_to_color(lvl) : "",
                fmt::localtime(time),
                ms.count(),
                level_to_string(lvl),
                file,
                line,
                msg,
                color ? "\033[0m" : ""
            );
        } catch (const std::system_error&) {
            // The log sink is gone; the line is lost but the caller carries on
            std::clearerr(out_);
            failed_writes_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        std::fflush(out_);
    }

private:
    logger() noexcept : min_level_(level::info), color_(true) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    std::atomic<level> min_level_;
    std::atomic<bool> color_;
    std::atomic<size_t> failed_writes_{0};
    std::mutex mutex_;  // Serializes writes to out_
    std::FILE* out_ = stderr;
};

} // namespace ssebus::log
