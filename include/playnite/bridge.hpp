#pragma once

#include "playnite/command_dispatcher.hpp"
#include "playnite/config.hpp"
#include "playnite/connection_supervisor.hpp"
#include "playnite/cover_pipeline.hpp"
#include "playnite/events.hpp"
#include "playnite/registry.hpp"
#include "playnite/router.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace playnite {

// Composition root. One loop thread owns the supervisor, router and dispatcher; everything else
// talks to it by posting events.
class Bridge {
public:
    Bridge(const Config& cfg, std::unique_ptr<MqttTransport> transport, EntityPlatform& platform,
           EncodeFn encode = encodeJpeg);
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // Wire transport callbacks into the queue and start the first connect attempt.
    void start(Clock::time_point now = Clock::now());
    // Loop until a Shutdown event or `stop` becomes true, then tear the session down.
    void run(const std::atomic<bool>& stop);
    void teardown();

    // Thread-safe entry points.
    void post(BridgeEvent ev) { queue_.push(std::move(ev)); }
    void postUserCommand(const std::string& id, CommandKind kind);
    void postLibraryRefresh();
    void postList();
    void postShutdown();

    // Apply one event on the calling thread. Returns false for Shutdown.
    bool handle(const BridgeEvent& ev, Clock::time_point now = Clock::now());
    // Apply everything queued right now without blocking. Returns the number handled.
    size_t drain(Clock::time_point now = Clock::now());
    void tick(Clock::time_point now);

    void logDiagnostics() const;

    const std::string& deviceName() const { return deviceName_; }
    EntityRegistry& registry() { return registry_; }
    ConnectionSupervisor& supervisor() { return supervisor_; }
    CommandDispatcher& dispatcher() { return dispatcher_; }
    TopicRouter& router() { return router_; }
    CoverPipeline& covers() { return covers_; }
    EventQueue& queue() { return queue_; }

private:
    std::string deviceName_;
    EntityRegistry registry_;
    EventQueue queue_;
    ConnectionSupervisor supervisor_;
    CoverPipeline covers_;
    CommandDispatcher dispatcher_;
    TopicRouter router_;
    bool started_{false};
};

TranscodeOptions transcodeOptionsFrom(const Config& cfg);
DispatcherOptions dispatcherOptionsFrom(const Config& cfg);

} // namespace playnite
