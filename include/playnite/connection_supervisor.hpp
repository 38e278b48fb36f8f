#pragma once

#include "playnite/events.hpp"
#include "playnite/models.hpp"
#include "playnite/mqtt_transport.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace playnite {

enum class ConnectionState { Disconnected, Connecting, Subscribed };

const char* connectionStateLabel(ConnectionState s);

// Outbound side of the session as the dispatcher sees it.
class Publisher {
public:
    virtual ~Publisher() = default;
    virtual bool publish(const std::string& topic, const std::string& payload, std::string& outError) = 0;
    virtual bool connected() const = 0;
};

// Owns the MQTT session. Transport callbacks are turned into BridgeEvents through the sink
// given to init(); the handle* methods apply them and must run on the loop thread.
class ConnectionSupervisor : public Publisher {
public:
    using EventSink = std::function<void(BridgeEvent)>;

    ConnectionSupervisor(std::unique_ptr<MqttTransport> transport, std::string topicBase,
                         std::chrono::seconds reconnectDelay);
    ~ConnectionSupervisor() override;

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    void init(EventSink sink);
    // Invoked every time the wildcard subscription is (re)established.
    void setSubscribedHandler(std::function<void()> handler) { onSubscribed_ = std::move(handler); }

    bool connect(Clock::time_point now = Clock::now());
    void teardown();

    void handleConnected();
    void handleConnectFailed(const std::string& cause, Clock::time_point now = Clock::now());
    void handleConnectionLost(const std::string& cause, Clock::time_point now = Clock::now());
    void handleSubscribeFailed(const std::string& filter, const std::string& cause,
                               Clock::time_point now = Clock::now());

    // Starts a new attempt once the reconnect delay has passed.
    void tick(Clock::time_point now);

    bool publish(const std::string& topic, const std::string& payload, std::string& outError) override;
    bool connected() const override { return state_ == ConnectionState::Subscribed; }

    ConnectionState state() const { return state_; }
    uint64_t reconnects() const { return reconnects_; }
    uint64_t subscriptions() const { return subscriptions_; }
    const std::string& topicBase() const { return topicBase_; }

private:
    void scheduleRetry(Clock::time_point now, bool immediate);

    std::unique_ptr<MqttTransport> transport_;
    std::string topicBase_;
    std::chrono::seconds reconnectDelay_;
    std::function<void()> onSubscribed_;
    ConnectionState state_{ConnectionState::Disconnected};
    bool wantConnected_{false};
    bool hadSession_{false};
    Clock::time_point nextAttempt_{};
    uint64_t reconnects_{0};
    uint64_t subscriptions_{0};
};

} // namespace playnite
