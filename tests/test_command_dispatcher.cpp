#include "catch.hpp"
#include "fakes.hpp"
#include "playnite/command_dispatcher.hpp"

namespace {

const std::string kBase = "playnite/playniteweb_my-pc";

class FakePublisher : public playnite::Publisher {
public:
    bool publish(const std::string& topic, const std::string& payload, std::string& outError) override {
        attempts++;
        if (failures > 0) {
            failures--;
            outError = "publish rejected";
            return false;
        }
        sent.emplace_back(topic, payload);
        return true;
    }
    bool connected() const override { return online; }

    bool online{true};
    int failures{0};
    int attempts{0};
    std::vector<std::pair<std::string, std::string>> sent;
};

struct DispatcherFixture {
    playnite::EntityRegistry reg;
    RecordingPlatform platform;
    FakePublisher publisher;
    playnite::CommandDispatcher dispatcher{publisher, reg, platform, options()};

    static playnite::DispatcherOptions options() {
        playnite::DispatcherOptions o;
        o.topicBase = kBase;
        o.publishRetries = 3;
        o.retryDelay = std::chrono::milliseconds(0);
        o.commandTimeout = std::chrono::seconds(30);
        return o;
    }
};

} // namespace

TEST_CASE("requestStart publishes and flips state optimistically") {
    DispatcherFixture f;
    f.reg.upsertState("g1", playnite::GameState::Stopped);

    REQUIRE(f.dispatcher.requestStart("g1"));
    REQUIRE(f.publisher.sent.size() == 1);
    REQUIRE(f.publisher.sent[0].first == kBase + "/request/game/start");
    REQUIRE(f.publisher.sent[0].second == "g1");

    auto e = f.reg.get("g1");
    REQUIRE(e->displayState == playnite::GameState::Started);
    REQUIRE(e->pendingCommand.has_value());
    REQUIRE(f.platform.states["g1"] == playnite::GameState::Started);
    REQUIRE(f.dispatcher.stats().published == 1);
}

TEST_CASE("start and stop run the command hooks around the publish") {
    DispatcherFixture f;
    f.reg.upsertState("g1", playnite::GameState::Stopped);
    f.dispatcher.requestStart("g1");
    f.dispatcher.requestStop("g1");
    REQUIRE(f.platform.hooks.size() == 4);
    REQUIRE(f.platform.hooks[0].first == playnite::CommandHook::BeforeStart);
    REQUIRE(f.platform.hooks[1].first == playnite::CommandHook::AfterStart);
    REQUIRE(f.platform.hooks[2].first == playnite::CommandHook::BeforeStop);
    REQUIRE(f.platform.hooks[3].first == playnite::CommandHook::AfterStop);
    REQUIRE(f.platform.hooks[3].second == "g1");
    REQUIRE(f.publisher.sent[1].first == kBase + "/request/game/stop");
}

TEST_CASE("commands for unknown games publish nothing") {
    DispatcherFixture f;
    REQUIRE_FALSE(f.dispatcher.requestStart("nope"));
    REQUIRE_FALSE(f.dispatcher.requestInstall("nope"));
    REQUIRE(f.publisher.attempts == 0);
    REQUIRE_FALSE(f.reg.contains("nope"));
    REQUIRE(f.platform.hooks.empty());
}

TEST_CASE("install and uninstall publish without optimistic state") {
    DispatcherFixture f;
    f.reg.upsertState("g1", playnite::GameState::Stopped);
    REQUIRE(f.dispatcher.requestInstall("g1"));
    REQUIRE(f.dispatcher.requestUninstall("g1"));
    REQUIRE(f.publisher.sent.size() == 2);
    REQUIRE(f.publisher.sent[0].first == kBase + "/request/game/install");
    REQUIRE(f.publisher.sent[1].first == kBase + "/request/game/uninstall");
    REQUIRE_FALSE(f.reg.get("g1")->pendingCommand.has_value());
    REQUIRE(f.reg.get("g1")->displayState == playnite::GameState::Stopped);
    REQUIRE(f.platform.stateCalls.empty());
}

TEST_CASE("requestLibraryRefresh publishes an empty request") {
    DispatcherFixture f;
    REQUIRE(f.dispatcher.requestLibraryRefresh());
    REQUIRE(f.publisher.sent.size() == 1);
    REQUIRE(f.publisher.sent[0].first == kBase + "/request/library");
    REQUIRE(f.publisher.sent[0].second.empty());

    f.dispatcher.onLibraryRefreshRequested();
    REQUIRE(f.publisher.sent.size() == 2);
}

TEST_CASE("rejected publishes are retried from tick") {
    DispatcherFixture f;
    f.reg.upsertState("g1", playnite::GameState::Stopped);
    f.publisher.failures = 2;
    const auto t0 = playnite::Clock::now();
    REQUIRE(f.dispatcher.requestStart("g1", t0));
    REQUIRE(f.publisher.attempts == 1);
    REQUIRE(f.publisher.sent.empty());
    REQUIRE(f.dispatcher.queuedRetries() == 1);

    // One attempt per queued publish per tick.
    f.dispatcher.tick(t0);
    REQUIRE(f.publisher.attempts == 2);
    f.dispatcher.tick(t0);
    REQUIRE(f.publisher.attempts == 3);
    REQUIRE(f.publisher.sent.size() == 1);
    REQUIRE(f.publisher.sent[0].first == kBase + "/request/game/start");
    REQUIRE(f.dispatcher.queuedRetries() == 0);
    REQUIRE(f.dispatcher.stats().retries == 2);
    REQUIRE(f.dispatcher.stats().publishFailures == 0);
}

TEST_CASE("publishing gives up after the last retry") {
    DispatcherFixture f;
    f.reg.upsertState("g1", playnite::GameState::Stopped);
    f.publisher.failures = 5;
    const auto t0 = playnite::Clock::now();
    REQUIRE(f.dispatcher.requestStop("g1", t0));
    f.dispatcher.tick(t0);
    f.dispatcher.tick(t0);
    REQUIRE(f.publisher.attempts == 3);
    REQUIRE(f.dispatcher.queuedRetries() == 0);
    REQUIRE(f.dispatcher.stats().publishFailures == 1);
    f.dispatcher.tick(t0);
    REQUIRE(f.publisher.attempts == 3);
    // Fire-and-forget: the optimistic state stands.
    REQUIRE(f.reg.get("g1")->displayState == playnite::GameState::Stopped);
    REQUIRE(f.reg.get("g1")->pendingCommand.has_value());
}

TEST_CASE("retries wait for their delay instead of blocking the caller") {
    playnite::EntityRegistry reg;
    RecordingPlatform platform;
    FakePublisher publisher;
    playnite::DispatcherOptions o = DispatcherFixture::options();
    o.retryDelay = std::chrono::milliseconds(500);
    playnite::CommandDispatcher dispatcher{publisher, reg, platform, o};

    publisher.failures = 1;
    const auto t0 = playnite::Clock::now();
    REQUIRE(dispatcher.requestLibraryRefresh(t0));
    REQUIRE(publisher.attempts == 1);

    dispatcher.tick(t0 + std::chrono::milliseconds(100));
    REQUIRE(publisher.attempts == 1);
    REQUIRE(dispatcher.queuedRetries() == 1);

    dispatcher.tick(t0 + std::chrono::milliseconds(500));
    REQUIRE(publisher.attempts == 2);
    REQUIRE(publisher.sent.size() == 1);
    REQUIRE(publisher.sent[0].first == kBase + "/request/library");
}

TEST_CASE("publishing gives up at once while disconnected") {
    DispatcherFixture f;
    f.publisher.online = false;
    f.publisher.failures = 10;
    REQUIRE_FALSE(f.dispatcher.requestLibraryRefresh());
    REQUIRE(f.publisher.attempts == 1);
    REQUIRE(f.dispatcher.queuedRetries() == 0);
}

TEST_CASE("queued retries are dropped once the session goes away") {
    DispatcherFixture f;
    f.publisher.failures = 10;
    const auto t0 = playnite::Clock::now();
    REQUIRE(f.dispatcher.requestLibraryRefresh(t0));
    REQUIRE(f.dispatcher.queuedRetries() == 1);

    f.publisher.online = false;
    f.dispatcher.tick(t0);
    REQUIRE(f.publisher.attempts == 2);
    REQUIRE(f.dispatcher.queuedRetries() == 0);
    REQUIRE(f.dispatcher.stats().publishFailures == 1);
}

TEST_CASE("onUserCommand routes intents by kind") {
    DispatcherFixture f;
    f.reg.upsertState("g1", playnite::GameState::Stopped);
    f.dispatcher.onUserCommand("g1", playnite::CommandKind::Start);
    f.dispatcher.onUserCommand("g1", playnite::CommandKind::Uninstall);
    REQUIRE(f.publisher.sent.size() == 2);
    REQUIRE(f.publisher.sent[0].first == kBase + "/request/game/start");
    REQUIRE(f.publisher.sent[1].first == kBase + "/request/game/uninstall");
}

TEST_CASE("tick expires unconfirmed commands without touching state") {
    DispatcherFixture f;
    f.reg.upsertState("g1", playnite::GameState::Stopped);
    const auto t0 = playnite::Clock::now();
    f.dispatcher.requestStart("g1", t0);

    REQUIRE(f.dispatcher.tick(t0 + std::chrono::seconds(10)) == 0);
    REQUIRE(f.dispatcher.tick(t0 + std::chrono::seconds(31)) == 1);
    REQUIRE(f.dispatcher.stats().timeouts == 1);
    REQUIRE_FALSE(f.reg.get("g1")->pendingCommand.has_value());
    REQUIRE(f.reg.get("g1")->displayState == playnite::GameState::Started);
    REQUIRE(f.dispatcher.tick(t0 + std::chrono::seconds(60)) == 0);
}
