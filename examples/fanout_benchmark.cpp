#include <ssebus/ssebus.hpp>
#include <iostream>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ssebus;
using namespace std::chrono;

// Transport that only counts what it is given
class counting_transport final : public transport::transport {
public:
    coro::task<bool> write(std::string_view bytes) override {
        frames_.fetch_add(1, std::memory_order_relaxed);
        bytes_.fetch_add(bytes.size(), std::memory_order_relaxed);
        co_return !closed_.is_cancelled();
    }

    coro::cancel_token closed_token() const noexcept override {
        return closed_.get_token();
    }

    void close() override {
        closed_.cancel();
    }

    size_t frames() const noexcept { return frames_.load(std::memory_order_relaxed); }
    size_t bytes() const noexcept { return bytes_.load(std::memory_order_relaxed); }

private:
    coro::cancel_source closed_;
    std::atomic<size_t> frames_{0};
    std::atomic<size_t> bytes_{0};
};

std::atomic<size_t> g_ready{0};
std::atomic<size_t> g_done{0};

coro::task<void> client_stream(counting_transport& conn, bus::bus& hub,
                               coro::cancel_token shutdown) {
    stream::stream_config config;
    config.on_state_change = [](stream::stream_state s) {
        if (s == stream::stream_state::streaming) g_ready.fetch_add(1);
    };
    stream::subscription_set topics{"bench"};
    co_await stream::stream(conn, hub, std::move(topics), std::nullopt, std::move(shutdown),
                            std::move(config));
    g_done.fetch_add(1);
}

void run_fanout(size_t clients, size_t messages, size_t threads) {
    g_ready = 0;
    g_done = 0;

    runtime::scheduler sched(threads);
    sched.start();

    bus::local_bus hub;
    coro::cancel_source shutdown;
    std::vector<std::unique_ptr<counting_transport>> conns;
    conns.reserve(clients);

    for (size_t i = 0; i < clients; ++i) {
        conns.push_back(std::make_unique<counting_transport>());
        sched.spawn(client_stream(*conns.back(), hub, shutdown.get_token()).release());
    }
    while (g_ready.load() < clients) {
        std::this_thread::sleep_for(milliseconds(1));
    }

    auto start = high_resolution_clock::now();

    for (size_t i = 0; i < messages; ++i) {
        bus::broadcast(hub, "bench", std::to_string(i), "event", "bench");
    }

    size_t expected = clients * messages;
    size_t delivered = 0;
    while (delivered < expected) {
        delivered = 0;
        for (auto& c : conns) {
            delivered += c->frames();
        }
        if (delivered < expected) {
            std::this_thread::sleep_for(microseconds(200));
        }
    }

    auto elapsed = duration_cast<microseconds>(high_resolution_clock::now() - start).count();

    shutdown.cancel();
    while (g_done.load() < clients) {
        std::this_thread::sleep_for(milliseconds(1));
    }
    sched.shutdown();

    size_t bytes = 0;
    for (auto& c : conns) {
        bytes += c->bytes();
    }

    double secs = static_cast<double>(elapsed) / 1e6;
    std::cout << std::setw(8) << clients << " clients  "
              << std::setw(8) << messages << " msgs  "
              << std::setw(10) << std::fixed << std::setprecision(0)
              << (static_cast<double>(expected) / secs) << " frames/s  "
              << std::setw(8) << std::setprecision(1)
              << (static_cast<double>(bytes) / secs / (1024 * 1024)) << " MiB/s  "
              << std::setw(8) << std::setprecision(2)
              << (static_cast<double>(elapsed) * 1000.0 / static_cast<double>(expected))
              << " ns/frame" << std::endl;
}

int main(int argc, char* argv[]) {
    size_t threads = argc > 1 ? std::stoul(argv[1]) : 4;
    size_t messages = argc > 2 ? std::stoul(argv[2]) : 10000;

    log::logger::instance().set_level(log::level::warning);

    std::cout << "=== ssebus fan-out benchmark (" << threads << " threads) ===" << std::endl;
    for (size_t clients : {1, 10, 100, 1000}) {
        run_fanout(clients, messages, threads);
    }
    return 0;
}
