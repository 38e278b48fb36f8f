#include "playnite/bridge.hpp"
#include "playnite/logger.hpp"
#include "playnite/util.hpp"

namespace playnite {

namespace {
constexpr auto kTickInterval = std::chrono::milliseconds(250);
constexpr auto kWaitSlice = std::chrono::milliseconds(250);
} // namespace

TranscodeOptions transcodeOptionsFrom(const Config& cfg) {
    TranscodeOptions o;
    o.maxSizeBytes = cfg.maxImageSize;
    o.minQuality = cfg.minQuality;
    o.initialQuality = cfg.initialQuality;
    o.qualityStep = cfg.qualityStep;
    o.allowDownscale = cfg.allowDownscale;
    return o;
}

DispatcherOptions dispatcherOptionsFrom(const Config& cfg) {
    DispatcherOptions o;
    o.topicBase = cfg.topicBase;
    o.publishRetries = cfg.publishRetries;
    o.retryDelay = std::chrono::milliseconds(cfg.publishRetryDelayMs);
    o.commandTimeout = std::chrono::seconds(cfg.commandTimeoutSeconds);
    return o;
}

Bridge::Bridge(const Config& cfg, std::unique_ptr<MqttTransport> transport, EntityPlatform& platform,
               EncodeFn encode)
    : deviceName_(util::humanizeTopicBase(cfg.topicBase)),
      supervisor_(std::move(transport), cfg.topicBase, std::chrono::seconds(cfg.reconnectDelaySeconds)),
      covers_(registry_, platform, transcodeOptionsFrom(cfg), std::move(encode)),
      dispatcher_(supervisor_, registry_, platform, dispatcherOptionsFrom(cfg)),
      router_(cfg.topicBase, registry_, platform, covers_) {
    // Both a fresh subscription and the remote coming back online mean our view may be stale.
    supervisor_.setSubscribedHandler([this]() { dispatcher_.requestLibraryRefresh(); });
    router_.setRemoteOnlineHandler([this]() { dispatcher_.requestLibraryRefresh(); });
}

Bridge::~Bridge() {
    teardown();
}

void Bridge::start(Clock::time_point now) {
    if (started_) return;
    started_ = true;
    logInfo("Bridge for " + deviceName_ + " (" + supervisor_.topicBase() + ")", "APP");
    supervisor_.init([this](BridgeEvent ev) { queue_.push(std::move(ev)); });
    supervisor_.connect(now);
}

void Bridge::teardown() {
    if (!started_) return;
    started_ = false;
    supervisor_.teardown();
    queue_.clear();
}

void Bridge::postUserCommand(const std::string& id, CommandKind kind) {
    BridgeEvent ev;
    ev.kind = BridgeEventKind::UserCommand;
    ev.id = id;
    ev.command = kind;
    post(std::move(ev));
}

void Bridge::postLibraryRefresh() {
    BridgeEvent ev;
    ev.kind = BridgeEventKind::LibraryRefresh;
    post(std::move(ev));
}

void Bridge::postList() {
    BridgeEvent ev;
    ev.kind = BridgeEventKind::ListEntities;
    post(std::move(ev));
}

void Bridge::postShutdown() {
    BridgeEvent ev;
    ev.kind = BridgeEventKind::Shutdown;
    post(std::move(ev));
}

bool Bridge::handle(const BridgeEvent& ev, Clock::time_point now) {
    switch (ev.kind) {
        case BridgeEventKind::Connected: supervisor_.handleConnected(); break;
        case BridgeEventKind::ConnectFailed: supervisor_.handleConnectFailed(ev.detail, now); break;
        case BridgeEventKind::ConnectionLost: supervisor_.handleConnectionLost(ev.detail, now); break;
        case BridgeEventKind::SubscribeFailed: supervisor_.handleSubscribeFailed(ev.topic, ev.detail, now); break;
        case BridgeEventKind::Message: router_.route(ev.topic, ev.payload); break;
        case BridgeEventKind::UserCommand: dispatcher_.onUserCommand(ev.id, ev.command); break;
        case BridgeEventKind::LibraryRefresh: dispatcher_.onLibraryRefreshRequested(); break;
        case BridgeEventKind::ListEntities: logDiagnostics(); break;
        case BridgeEventKind::Shutdown: return false;
    }
    return true;
}

size_t Bridge::drain(Clock::time_point now) {
    size_t n = 0;
    while (auto ev = queue_.pop()) {
        n++;
        if (!handle(*ev, now)) break;
    }
    return n;
}

void Bridge::tick(Clock::time_point now) {
    dispatcher_.tick(now);
    supervisor_.tick(now);
}

void Bridge::run(const std::atomic<bool>& stop) {
    auto nextTick = Clock::now() + kTickInterval;
    while (!stop.load()) {
        if (auto ev = queue_.waitPop(kWaitSlice)) {
            if (!handle(*ev)) break;
        }
        const auto now = Clock::now();
        if (now >= nextTick) {
            tick(now);
            nextTick = now + kTickInterval;
        }
    }
    logInfo("Shutting down", "APP");
    teardown();
}

void Bridge::logDiagnostics() const {
    for (const auto& e : registry_.snapshot()) {
        std::string line = e.id + "  " + util::ellipsize(e.name, 40) + "  " + gameStateLabel(e.displayState);
        if (e.pendingCommand) line += " (pending " + std::string(commandKindLabel(e.pendingCommand->kind)) + ")";
        if (e.installed) line += *e.installed ? "  installed" : "  not installed";
        if (!e.coverDigest.empty()) line += "  cover q" + std::to_string(e.coverQuality);
        logInfo(line, "APP");
    }
    const RouterStats r = router_.stats();
    const CoverStats c = covers_.stats();
    const DispatcherStats d = dispatcher_.stats();
    logInfo("Session " + std::string(connectionStateLabel(supervisor_.state())) +
                ", reconnects=" + std::to_string(supervisor_.reconnects()) + ", games=" +
                std::to_string(registry_.size()),
            "APP");
    logInfo("Router dispatched=" + std::to_string(r.dispatched) + " ignored=" + std::to_string(r.ignored) +
                " malformed=" + std::to_string(r.malformed) + " payloadErrors=" + std::to_string(r.payloadErrors),
            "APP");
    logInfo("Covers transcodes=" + std::to_string(c.transcodes) + " published=" + std::to_string(c.published) +
                " skipped=" + std::to_string(c.skipped) + " failed=" + std::to_string(c.failed) +
                " oversized=" + std::to_string(c.oversized),
            "APP");
    logInfo("Commands published=" + std::to_string(d.published) + " publishFailures=" +
                std::to_string(d.publishFailures) + " retries=" + std::to_string(d.retries) + " timeouts=" + std::to_string(d.timeouts),
            "APP");
}

} // namespace playnite
