#pragma once

#include "playnite/models.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace playnite {

// Everything the bridge loop reacts to. Transport threads and the operator input thread only
// push; the loop thread pops and applies in arrival order.
enum class BridgeEventKind {
    Connected,
    ConnectFailed,
    ConnectionLost,
    SubscribeFailed,
    Message,
    UserCommand,
    LibraryRefresh,
    ListEntities,
    Shutdown
};

struct BridgeEvent {
    BridgeEventKind kind{BridgeEventKind::Message};
    std::string topic;                  // Message, SubscribeFailed (filter)
    std::vector<unsigned char> payload; // Message
    std::string detail;                 // failure cause
    std::string id;                     // UserCommand
    CommandKind command{CommandKind::Start};
};

class EventQueue {
public:
    void push(BridgeEvent ev) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(ev));
        }
        cv_.notify_one();
    }

    std::optional<BridgeEvent> pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        BridgeEvent ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    // Blocks up to `timeout` for the next event.
    std::optional<BridgeEvent> waitPop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) return std::nullopt;
        BridgeEvent ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<BridgeEvent> queue_;
};

} // namespace playnite
