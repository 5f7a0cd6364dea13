/// @file sse_ticker.cpp
/// @brief Clock ticks streamed as Server-Sent Events on stdout
///
/// A publisher thread broadcasts the current time on the "time" topic and a
/// single stream relays it to stdout until SIGINT/SIGTERM or until stdout
/// goes away. The publisher is a plain thread: the stream still runs on the
/// scheduler's workers, and a stalled reader never blocks the publisher.
///
/// Usage: ./sse_ticker [--http] [interval_ms]
///
/// With --http the HTTP response head is written first, so the ticker can be
/// served by an inetd-style launcher:
///
///     socat TCP-LISTEN:8080,reuseaddr,fork EXEC:"./sse_ticker --http"
///     curl -N http://localhost:8080/

#include <ssebus/ssebus.hpp>

#include <fmt/chrono.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <ctime>
#include <string>
#include <thread>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

using namespace ssebus;
using namespace std::chrono_literals;

namespace {

std::atomic<bool> g_stream_done{false};

/// "HH:MM:SS.uuuuuu" in local time
std::string clock_reading() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()) % 1000000;
    return fmt::format("{:%H:%M:%S}.{:06d}", fmt::localtime(secs), micros.count());
}

coro::task<void> serve_stdout(transport::transport& out, bus::bus& hub,
                              coro::cancel_token shutdown, bool send_head) {
    if (send_head && !co_await out.write(http::sse_response_head())) {
        SSEBUS_LOG_ERROR("could not write response head");
        g_stream_done = true;
        co_return;
    }

    auto hello = sse::chunk::event("hello", "ticker ready").with_retry(3000ms);
    try {
        stream::subscription_set topics{"time"};
        auto result = co_await stream::stream(out, hub, std::move(topics), std::move(hello),
                                              std::move(shutdown));
        SSEBUS_LOG_INFO("stream finished ({}), {} frames / {} bytes",
                        stream::cause_to_string(result.cause),
                        result.frames_written, result.bytes_written);
    } catch (const bus::bus_error& e) {
        SSEBUS_LOG_ERROR("stream could not start: {}", e.what());
    }
    g_stream_done = true;
}

} // namespace

int main(int argc, char* argv[]) {
    bool send_head = false;
    auto interval = 1000ms;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--http") == 0) {
            send_head = true;
        } else {
            interval = std::chrono::milliseconds(std::stoi(argv[i]));
        }
    }

    log::logger::instance().set_color(::isatty(STDERR_FILENO) != 0);

    // A vanished reader must surface as EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    // Block signals BEFORE creating scheduler threads
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    bus::local_bus hub;
    transport::fd_transport out(STDOUT_FILENO);
    coro::cancel_source shutdown;

    runtime::scheduler sched(2);
    sched.start();
    sched.spawn(serve_stdout(out, hub, shutdown.get_token(), send_head).release());

    std::thread publisher([&] {
        while (!shutdown.is_cancelled() && !g_stream_done) {
            bus::broadcast(hub, "time", clock_reading(), "event", "tick");
            std::this_thread::sleep_for(interval);
        }
    });

    SSEBUS_LOG_INFO("ticking every {} ms, press Ctrl+C to stop", interval.count());

    // Wait for a signal, or for the stream to end on its own
    timespec poll_interval{0, 100 * 1000 * 1000};
    while (!g_stream_done) {
        int sig = sigtimedwait(&sigs, nullptr, &poll_interval);
        if (sig > 0) {
            SSEBUS_LOG_INFO("received {} - shutting down", strsignal(sig));
            shutdown.cancel();
            break;
        }
    }

    publisher.join();
    while (!g_stream_done) {
        std::this_thread::sleep_for(10ms);
    }

    sched.shutdown();
    hub.shutdown();
    SSEBUS_LOG_INFO("{} messages published", hub.published());
    return 0;
}
