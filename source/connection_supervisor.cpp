#include "playnite/connection_supervisor.hpp"
#include "playnite/errors.hpp"
#include "playnite/logger.hpp"
#include "playnite/topic.hpp"

namespace playnite {

namespace {
constexpr int kSubscribeQos = 1;
constexpr int kPublishQos = 1;
} // namespace

const char* connectionStateLabel(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Subscribed: return "subscribed";
        default: return "unknown";
    }
}

ConnectionSupervisor::ConnectionSupervisor(std::unique_ptr<MqttTransport> transport, std::string topicBase,
                                           std::chrono::seconds reconnectDelay)
    : transport_(std::move(transport)), topicBase_(std::move(topicBase)), reconnectDelay_(reconnectDelay) {}

ConnectionSupervisor::~ConnectionSupervisor() {
    teardown();
}

void ConnectionSupervisor::init(EventSink sink) {
    MqttTransport::Callbacks cb;
    cb.onConnected = [sink]() {
        BridgeEvent ev;
        ev.kind = BridgeEventKind::Connected;
        sink(std::move(ev));
    };
    cb.onConnectFailed = [sink](const std::string& cause) {
        BridgeEvent ev;
        ev.kind = BridgeEventKind::ConnectFailed;
        ev.detail = cause;
        sink(std::move(ev));
    };
    cb.onConnectionLost = [sink](const std::string& cause) {
        BridgeEvent ev;
        ev.kind = BridgeEventKind::ConnectionLost;
        ev.detail = cause;
        sink(std::move(ev));
    };
    cb.onSubscribeFailed = [sink](const std::string& filter, const std::string& cause) {
        BridgeEvent ev;
        ev.kind = BridgeEventKind::SubscribeFailed;
        ev.topic = filter;
        ev.detail = cause;
        sink(std::move(ev));
    };
    cb.onMessage = [sink](const std::string& topic, std::vector<unsigned char> payload) {
        BridgeEvent ev;
        ev.kind = BridgeEventKind::Message;
        ev.topic = topic;
        ev.payload = std::move(payload);
        sink(std::move(ev));
    };
    transport_->setCallbacks(std::move(cb));
}

bool ConnectionSupervisor::connect(Clock::time_point now) {
    wantConnected_ = true;
    if (state_ != ConnectionState::Disconnected) return true;

    state_ = ConnectionState::Connecting;
    std::string err;
    if (!transport_->connect(err)) {
        ErrorInfo info = classifyError(err, ErrorCategory::Connection);
        logWarn(std::string(errorCodeLabel(info.code)) + ": " + err, "MQTT");
        state_ = ConnectionState::Disconnected;
        scheduleRetry(now, false);
        return false;
    }
    return true;
}

void ConnectionSupervisor::teardown() {
    const bool wasActive = wantConnected_ || state_ != ConnectionState::Disconnected;
    wantConnected_ = false;
    if (!transport_) return;
    transport_->disconnect();
    if (wasActive) logInfo("MQTT session closed", "MQTT");
    state_ = ConnectionState::Disconnected;
}

void ConnectionSupervisor::handleConnected() {
    if (!wantConnected_) return;
    const std::string filter = subscriptionFilter(topicBase_);
    std::string err;
    if (!transport_->subscribe(filter, kSubscribeQos, err)) {
        handleSubscribeFailed(filter, err);
        return;
    }
    state_ = ConnectionState::Subscribed;
    subscriptions_++;
    logInfo(std::string(hadSession_ ? "Resubscribed to " : "Subscribed to ") + filter, "MQTT");
    hadSession_ = true;
    if (onSubscribed_) onSubscribed_();
}

void ConnectionSupervisor::handleConnectFailed(const std::string& cause, Clock::time_point now) {
    if (!wantConnected_) return;
    ErrorInfo info = classifyError(cause, ErrorCategory::Connection);
    const std::string msg = std::string(errorCodeLabel(info.code)) + ": " + cause + " (retrying in " +
                            std::to_string(reconnectDelay_.count()) + "s)";
    if (info.retryable)
        logWarn(msg, "MQTT");
    else
        logError(msg + "; " + info.userMessage, "MQTT");
    state_ = ConnectionState::Disconnected;
    scheduleRetry(now, false);
}

void ConnectionSupervisor::handleConnectionLost(const std::string& cause, Clock::time_point now) {
    if (!wantConnected_) return;
    if (state_ == ConnectionState::Disconnected) return;
    logWarn("Connection lost: " + (cause.empty() ? std::string("no cause given") : cause), "MQTT");
    state_ = ConnectionState::Disconnected;
    reconnects_++;
    scheduleRetry(now, true);
}

void ConnectionSupervisor::handleSubscribeFailed(const std::string& filter, const std::string& cause,
                                                 Clock::time_point now) {
    if (!wantConnected_) return;
    logError(std::string(errorCodeLabel(ErrorCode::SubscribeFailure)) + " for " + filter + ": " + cause +
                 "; dropping session",
             "MQTT");
    transport_->disconnect();
    state_ = ConnectionState::Disconnected;
    scheduleRetry(now, false);
}

void ConnectionSupervisor::tick(Clock::time_point now) {
    if (!wantConnected_ || state_ != ConnectionState::Disconnected) return;
    if (now < nextAttempt_) return;
    logInfo("Reconnecting to broker", "MQTT");
    connect(now);
}

bool ConnectionSupervisor::publish(const std::string& topic, const std::string& payload, std::string& outError) {
    if (state_ != ConnectionState::Subscribed) {
        outError = "Cannot publish to " + topic + ": not connected";
        return false;
    }
    return transport_->publish(topic, payload, kPublishQos, false, outError);
}

void ConnectionSupervisor::scheduleRetry(Clock::time_point now, bool immediate) {
    nextAttempt_ = immediate ? now : now + reconnectDelay_;
}

} // namespace playnite
