#include "catch.hpp"
#include "playnite/registry.hpp"
#include <chrono>

using playnite::Clock;
using playnite::CommandKind;
using playnite::GameState;

TEST_CASE("upsertState creates on first sight and reports changes") {
    playnite::EntityRegistry reg;
    REQUIRE_FALSE(reg.get("g1").has_value());

    auto r = reg.upsertState("g1", GameState::Stopped);
    REQUIRE(r.created);
    REQUIRE(r.changed);
    REQUIRE(reg.contains("g1"));
    REQUIRE(reg.get("g1")->displayState == GameState::Stopped);
    REQUIRE(reg.get("g1")->name == "g1");

    r = reg.upsertState("g1", GameState::Stopped);
    REQUIRE_FALSE(r.created);
    REQUIRE_FALSE(r.changed);
}

TEST_CASE("upsertState is last-write-wins") {
    playnite::EntityRegistry reg;
    reg.upsertState("g1", GameState::Started);
    reg.upsertState("g1", GameState::Stopped);
    REQUIRE(reg.get("g1")->displayState == GameState::Stopped);
    reg.upsertState("g1", GameState::Unknown);
    REQUIRE(reg.get("g1")->displayState == GameState::Unknown);
}

TEST_CASE("issueCommand flips state optimistically and a later state overrides it") {
    playnite::EntityRegistry reg;
    reg.upsertState("g1", GameState::Stopped);
    const auto now = Clock::now();

    playnite::CommandToken token = reg.issueCommand("g1", CommandKind::Start, now);
    REQUIRE(token.valid);
    REQUIRE(token.sequence > 0);
    auto e = reg.get("g1");
    REQUIRE(e->displayState == GameState::Started);
    REQUIRE(e->pendingCommand.has_value());
    REQUIRE(e->pendingCommand->target == GameState::Started);

    auto r = reg.upsertState("g1", GameState::Stopped);
    REQUIRE(r.pendingCleared);
    REQUIRE(r.rolledBack);
    e = reg.get("g1");
    REQUIRE(e->displayState == GameState::Stopped);
    REQUIRE_FALSE(e->pendingCommand.has_value());
}

TEST_CASE("a confirming state clears the pending command without rollback") {
    playnite::EntityRegistry reg;
    reg.upsertState("g1", GameState::Started);
    reg.issueCommand("g1", CommandKind::Stop, Clock::now());
    auto r = reg.upsertState("g1", GameState::Stopped);
    REQUIRE(r.pendingCleared);
    REQUIRE_FALSE(r.rolledBack);
    REQUIRE_FALSE(r.changed);
    REQUIRE_FALSE(reg.get("g1")->pendingCommand.has_value());
}

TEST_CASE("Unknown observations neither confirm nor clear a pending command") {
    playnite::EntityRegistry reg;
    reg.upsertState("g1", GameState::Stopped);
    reg.issueCommand("g1", CommandKind::Start, Clock::now());
    auto r = reg.upsertState("g1", GameState::Unknown);
    REQUIRE_FALSE(r.pendingCleared);
    REQUIRE(reg.get("g1")->pendingCommand.has_value());
    REQUIRE(reg.get("g1")->displayState == GameState::Unknown);
}

TEST_CASE("issueCommand rejects unknown ids and kinds without a target state") {
    playnite::EntityRegistry reg;
    REQUIRE_FALSE(reg.issueCommand("missing", CommandKind::Start, Clock::now()).valid);
    REQUIRE_FALSE(reg.contains("missing"));

    reg.upsertState("g1", GameState::Stopped);
    REQUIRE_FALSE(reg.issueCommand("g1", CommandKind::Install, Clock::now()).valid);
    REQUIRE_FALSE(reg.get("g1")->pendingCommand.has_value());
    REQUIRE(reg.get("g1")->displayState == GameState::Stopped);
}

TEST_CASE("confirmCommand settles a pending command") {
    playnite::EntityRegistry reg;
    reg.upsertState("g1", GameState::Stopped);
    REQUIRE_FALSE(reg.confirmCommand("g1", GameState::Started));
    reg.issueCommand("g1", CommandKind::Start, Clock::now());
    REQUIRE(reg.confirmCommand("g1", GameState::Started));
    REQUIRE_FALSE(reg.get("g1")->pendingCommand.has_value());
    REQUIRE(reg.get("g1")->displayState == GameState::Started);
    REQUIRE_FALSE(reg.confirmCommand("nope", GameState::Started));
}

TEST_CASE("expirePending clears stale commands without touching displayState") {
    playnite::EntityRegistry reg;
    reg.upsertState("g1", GameState::Stopped);
    reg.upsertState("g2", GameState::Stopped);
    const auto t0 = Clock::now();
    reg.issueCommand("g1", CommandKind::Start, t0);
    reg.issueCommand("g2", CommandKind::Start, t0 + std::chrono::seconds(20));

    auto expired = reg.expirePending(t0 + std::chrono::seconds(29), std::chrono::seconds(30));
    REQUIRE(expired.empty());

    expired = reg.expirePending(t0 + std::chrono::seconds(30), std::chrono::seconds(30));
    REQUIRE(expired.size() == 1);
    REQUIRE(expired[0].id == "g1");
    REQUIRE(expired[0].kind == CommandKind::Start);
    REQUIRE_FALSE(reg.get("g1")->pendingCommand.has_value());
    REQUIRE(reg.get("g1")->displayState == GameState::Started);
    REQUIRE(reg.get("g2")->pendingCommand.has_value());
}

TEST_CASE("upsertCover records digest and coverMatches compares it") {
    playnite::EntityRegistry reg;
    auto r = reg.upsertCover("g1", "abcd", 80);
    REQUIRE(r.created);
    REQUIRE(reg.coverMatches("g1", "abcd"));
    REQUIRE_FALSE(reg.coverMatches("g1", "ef01"));
    REQUIRE_FALSE(reg.coverMatches("g2", "abcd"));
    REQUIRE_FALSE(reg.coverMatches("g1", ""));
    REQUIRE(reg.get("g1")->coverQuality == 80);
    REQUIRE(reg.get("g1")->displayState == GameState::Unknown);
}

TEST_CASE("upsertMetadata records name and install flag") {
    playnite::EntityRegistry reg;
    playnite::GameRecord rec;
    rec.id = "g1";
    rec.name = "Hades";
    rec.installed = true;
    auto r = reg.upsertMetadata(rec);
    REQUIRE(r.created);
    auto e = reg.get("g1");
    REQUIRE(e->name == "Hades");
    REQUIRE(e->installed.has_value());
    REQUIRE(*e->installed);

    playnite::GameRecord bare;
    bare.id = "g1";
    r = reg.upsertMetadata(bare);
    REQUIRE_FALSE(r.created);
    REQUIRE_FALSE(r.changed);
    REQUIRE(reg.get("g1")->name == "Hades");
}

TEST_CASE("bulkUpsert replaces state per record and keeps absent entities") {
    playnite::EntityRegistry reg;
    reg.upsertState("old", GameState::Started);
    reg.upsertState("g1", GameState::Started);

    std::vector<playnite::GameRecord> records(3);
    records[0].id = "g1";
    records[0].stateToken = std::string("stopped");
    records[1].id = "g2";
    records[1].name = "Celeste";
    records[1].stateToken = std::string("running");
    records[2].id = "g3";

    auto out = reg.bulkUpsert(records);
    REQUIRE(out.size() == 3);
    REQUIRE_FALSE(out[0].result.created);
    REQUIRE(out[0].result.changed);
    REQUIRE(out[1].result.created);
    REQUIRE(out[2].result.created);

    REQUIRE(reg.size() == 4);
    REQUIRE(reg.get("old")->displayState == GameState::Started);
    REQUIRE(reg.get("g1")->displayState == GameState::Stopped);
    REQUIRE(reg.get("g2")->displayState == GameState::Started);
    REQUIRE(reg.get("g2")->name == "Celeste");
    // No state token: created but left Unknown.
    REQUIRE(reg.get("g3")->displayState == GameState::Unknown);
}

TEST_CASE("snapshot lists entities in id order") {
    playnite::EntityRegistry reg;
    reg.upsertState("b", GameState::Stopped);
    reg.upsertState("a", GameState::Started);
    auto all = reg.snapshot();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].id == "a");
    REQUIRE(all[1].id == "b");
}
