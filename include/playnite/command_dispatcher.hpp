#pragma once

#include "playnite/connection_supervisor.hpp"
#include "playnite/platform.hpp"
#include "playnite/registry.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <string>

namespace playnite {

struct DispatcherOptions {
    std::string topicBase;
    int publishRetries{3};
    std::chrono::milliseconds retryDelay{500};
    std::chrono::seconds commandTimeout{30};
};

struct DispatcherStats {
    uint64_t published{0};
    uint64_t publishFailures{0};
    uint64_t retries{0};
    uint64_t timeouts{0};
};

// Turns user intents into MQTT requests. Start/stop flip the registry optimistically; the
// router's next state message confirms or rolls back.
class CommandDispatcher {
public:
    CommandDispatcher(Publisher& publisher, EntityRegistry& registry, EntityPlatform& platform,
                      DispatcherOptions options);

    // Return false when the request was dropped: unknown id, or a publish that failed with no
    // retry left. A rejected publish with attempts remaining is queued for tick() and counts as sent.
    bool requestStart(const std::string& id, Clock::time_point now = Clock::now());
    bool requestStop(const std::string& id, Clock::time_point now = Clock::now());
    bool requestInstall(const std::string& id, Clock::time_point now = Clock::now());
    bool requestUninstall(const std::string& id, Clock::time_point now = Clock::now());
    bool requestLibraryRefresh(Clock::time_point now = Clock::now());

    // Entry points for the platform collaborator.
    void onUserCommand(const std::string& id, CommandKind kind);
    void onLibraryRefreshRequested();

    // Retries due publishes, then soft-expires pending confirmations. Returns the number expired.
    size_t tick(Clock::time_point now);

    size_t queuedRetries() const { return retryQueue_.size(); }
    DispatcherStats stats() const;

private:
    bool dispatchToggle(const std::string& id, CommandKind kind, Clock::time_point now);
    bool dispatchPlain(const std::string& id, CommandKind kind, Clock::time_point now);
    struct QueuedPublish {
        std::string topic;
        std::string payload;
        int attempts;
        Clock::time_point due;
    };

    bool publishWithRetry(const std::string& topic, const std::string& payload, Clock::time_point now);
    // One attempt; on failure either requeues the publish or gives up. Never blocks.
    bool attemptPublish(QueuedPublish item, Clock::time_point now);
    void retryDue(Clock::time_point now);

    Publisher& publisher_;
    EntityRegistry& registry_;
    EntityPlatform& platform_;
    DispatcherOptions options_;
    std::deque<QueuedPublish> retryQueue_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> publishFailures_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> timeouts_{0};
};

} // namespace playnite
