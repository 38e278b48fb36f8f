#include "catch.hpp"
#include "fakes.hpp"
#include "playnite/connection_supervisor.hpp"
#include <memory>

namespace {

const std::string kBase = "playnite/playniteweb_my-pc";

// Applies transport events synchronously, the way the bridge loop would.
struct SupervisorFixture {
    FakeTransport* transport;
    playnite::ConnectionSupervisor supervisor;
    int refreshes{0};
    std::vector<playnite::BridgeEvent> messages;

    SupervisorFixture() : SupervisorFixture(std::make_unique<FakeTransport>()) {}

    explicit SupervisorFixture(std::unique_ptr<FakeTransport> t)
        : transport(t.get()), supervisor(std::move(t), kBase, std::chrono::seconds(5)) {
        supervisor.setSubscribedHandler([this]() { refreshes++; });
        supervisor.init([this](playnite::BridgeEvent ev) {
            const auto now = playnite::Clock::now();
            switch (ev.kind) {
                case playnite::BridgeEventKind::Connected: supervisor.handleConnected(); break;
                case playnite::BridgeEventKind::ConnectFailed: supervisor.handleConnectFailed(ev.detail, now); break;
                case playnite::BridgeEventKind::ConnectionLost: supervisor.handleConnectionLost(ev.detail, now); break;
                case playnite::BridgeEventKind::SubscribeFailed:
                    supervisor.handleSubscribeFailed(ev.topic, ev.detail, now);
                    break;
                default: messages.push_back(std::move(ev)); break;
            }
        });
    }
};

} // namespace

TEST_CASE("connect subscribes to the wildcard root and requests a refresh") {
    SupervisorFixture f;
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Disconnected);
    REQUIRE(f.supervisor.connect());
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Connecting);
    REQUIRE_FALSE(f.supervisor.connected());

    f.transport->fireConnected();
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Subscribed);
    REQUIRE(f.supervisor.connected());
    REQUIRE(f.transport->subscriptions.size() == 1);
    REQUIRE(f.transport->subscriptions[0] == kBase + "/#");
    REQUIRE(f.refreshes == 1);
}

TEST_CASE("reconnect after connection loss replays the subscription and refreshes exactly once") {
    SupervisorFixture f;
    const auto t0 = playnite::Clock::now();
    f.supervisor.connect(t0);
    f.transport->fireConnected();
    REQUIRE(f.refreshes == 1);

    f.supervisor.handleConnectionLost("connection lost: keepalive timeout", t0);
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Disconnected);
    REQUIRE(f.supervisor.reconnects() == 1);

    // A second loss report for the same outage is not counted again.
    f.supervisor.handleConnectionLost("connection lost", t0);
    REQUIRE(f.supervisor.reconnects() == 1);

    f.supervisor.tick(t0);
    REQUIRE(f.transport->connectCalls == 2);
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Connecting);
    REQUIRE(f.refreshes == 1);

    f.transport->fireConnected();
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Subscribed);
    REQUIRE(f.transport->subscriptions.size() == 2);
    REQUIRE(f.transport->subscriptions[1] == kBase + "/#");
    REQUIRE(f.refreshes == 2);
    REQUIRE(f.supervisor.subscriptions() == 2);
}

TEST_CASE("failed connects are retried after the reconnect delay") {
    auto transport = std::make_unique<FakeTransport>();
    transport->failConnect = true;
    SupervisorFixture f(std::move(transport));
    const auto t0 = playnite::Clock::now();

    REQUIRE_FALSE(f.supervisor.connect(t0));
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Disconnected);
    REQUIRE(f.transport->connectCalls == 1);

    f.supervisor.tick(t0 + std::chrono::seconds(4));
    REQUIRE(f.transport->connectCalls == 1);

    f.transport->failConnect = false;
    f.supervisor.tick(t0 + std::chrono::seconds(5));
    REQUIRE(f.transport->connectCalls == 2);
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Connecting);

    f.transport->fireConnectFailed("Not authorized");
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Disconnected);
    REQUIRE(f.refreshes == 0);
}

TEST_CASE("a rejected subscription drops the session") {
    SupervisorFixture f;
    f.transport->failSubscribe = true;
    const auto t0 = playnite::Clock::now();
    f.supervisor.connect(t0);
    f.transport->fireConnected();
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Disconnected);
    REQUIRE(f.transport->disconnectCalls == 1);
    REQUIRE(f.refreshes == 0);

    f.transport->failSubscribe = false;
    f.supervisor.tick(t0 + std::chrono::seconds(30));
    f.transport->fireConnected();
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Subscribed);
    REQUIRE(f.refreshes == 1);
}

TEST_CASE("publish only goes out on a subscribed session") {
    SupervisorFixture f;
    std::string err;
    REQUIRE_FALSE(f.supervisor.publish(kBase + "/request/library", "", err));
    REQUIRE(err.find("not connected") != std::string::npos);
    REQUIRE(f.transport->publishAttempts == 0);

    f.supervisor.connect();
    f.transport->fireConnected();
    err.clear();
    REQUIRE(f.supervisor.publish(kBase + "/request/game/start", "g1", err));
    REQUIRE(f.transport->published.size() == 1);
    REQUIRE(f.transport->published[0].qos == 1);
    REQUIRE_FALSE(f.transport->published[0].retain);
}

TEST_CASE("inbound messages are forwarded to the event sink") {
    SupervisorFixture f;
    f.supervisor.connect();
    f.transport->fireConnected();
    f.transport->fireMessage(kBase + "/entity/release/g1/state", "started");
    REQUIRE(f.messages.size() == 1);
    REQUIRE(f.messages[0].kind == playnite::BridgeEventKind::Message);
    REQUIRE(f.messages[0].topic == kBase + "/entity/release/g1/state");
    REQUIRE(std::string(f.messages[0].payload.begin(), f.messages[0].payload.end()) == "started");
}

TEST_CASE("teardown stops reconnect attempts") {
    SupervisorFixture f;
    const auto t0 = playnite::Clock::now();
    f.supervisor.connect(t0);
    f.transport->fireConnected();
    f.supervisor.teardown();
    REQUIRE(f.supervisor.state() == playnite::ConnectionState::Disconnected);
    REQUIRE(f.transport->disconnectCalls >= 1);

    f.transport->fireConnectionLost();
    f.supervisor.tick(t0 + std::chrono::seconds(60));
    REQUIRE(f.transport->connectCalls == 1);
    REQUIRE(f.supervisor.reconnects() == 0);
}
