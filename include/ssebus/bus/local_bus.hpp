#pragma once

#include <ssebus/bus/bus.hpp>
#include <ssebus/log/macros.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ssebus::bus {

/// In-process bus
///
/// Topic table guarded by a shared_mutex. publish() copies the subscriber
/// list under a shared lock and posts outside it, so a subscriber that is
/// resumed inline by the post may unsubscribe without deadlocking.
class local_bus : public bus {
public:
    using bus::publish;

    local_bus() = default;

    ~local_bus() override {
        shutdown();
    }

    local_bus(const local_bus&) = delete;
    local_bus& operator=(const local_bus&) = delete;

    void subscribe(std::string_view topic, std::shared_ptr<subscriber> sub) override {
        if (!sub) {
            throw bus_error("subscribe: null subscriber");
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (stopped_) {
            throw bus_error(fmt::format("subscribe to '{}': bus is shut down", topic));
        }
        auto& list = topics_[std::string(topic)];
        auto it = std::find_if(list.begin(), list.end(),
            [&](const auto& s) { return s->id() == sub->id(); });
        if (it == list.end()) {
            list.push_back(std::move(sub));
        }
    }

    bool unsubscribe(std::string_view topic, subscriber_id id) noexcept override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto entry = topics_.find(topic);
        if (entry == topics_.end()) {
            return false;
        }
        auto& list = entry->second;
        auto it = std::find_if(list.begin(), list.end(),
            [id](const auto& s) { return s->id() == id; });
        if (it == list.end()) {
            return false;
        }
        list.erase(it);
        if (list.empty()) {
            topics_.erase(entry);
        }
        return true;
    }

    void publish(std::string_view topic, std::shared_ptr<const sse::chunk> chunk) override {
        std::vector<std::shared_ptr<subscriber>> targets;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (stopped_) {
                throw bus_error(fmt::format("publish to '{}': bus is shut down", topic));
            }
            auto entry = topics_.find(topic);
            if (entry != topics_.end()) {
                targets = entry->second;
            }
        }

        published_.fetch_add(1, std::memory_order_relaxed);
        for (auto& sub : targets) {
            auto result = sub->deliver(envelope{std::string(topic), chunk});
            if (result == subscriber::inbox_type::post_result::full) {
                SSEBUS_LOG_WARNING("subscriber {} mailbox full, dropped message on '{}'",
                                   sub->id(), topic);
            }
        }
    }

    /// Close every subscriber mailbox and refuse further requests
    void shutdown() {
        std::map<std::string, std::vector<std::shared_ptr<subscriber>>, std::less<>> topics;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (stopped_) {
                return;
            }
            stopped_ = true;
            topics.swap(topics_);
        }
        for (auto& [name, list] : topics) {
            for (auto& sub : list) {
                sub->inbox().close();
            }
        }
        SSEBUS_LOG_DEBUG("local bus shut down, {} topics released", topics.size());
    }

    bool is_shut_down() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return stopped_;
    }

    size_t subscriber_count(std::string_view topic) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto entry = topics_.find(topic);
        return entry == topics_.end() ? 0 : entry->second.size();
    }

    size_t topic_count() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return topics_.size();
    }

    /// Number of accepted publish calls
    size_t published() const noexcept {
        return published_.load(std::memory_order_relaxed);
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::vector<std::shared_ptr<subscriber>>, std::less<>> topics_;
    std::atomic<size_t> published_{0};
    bool stopped_ = false;
};

} // namespace ssebus::bus
