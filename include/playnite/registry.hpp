#pragma once

#include "playnite/models.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace playnite {

// Outcome of a single-entity mutation. `created` means the caller must announce the entity.
struct UpsertResult {
    bool created{false};
    bool changed{false};
    GameState previous{GameState::Unknown};
    GameState current{GameState::Unknown};
    bool pendingCleared{false};
    bool rolledBack{false};   // confirmation disagreed with the optimistic target
};

struct BulkUpsertEntry {
    std::string id;
    UpsertResult result;
};

struct ExpiredCommand {
    std::string id;
    CommandKind kind{CommandKind::Start};
    uint64_t sequence{0};
};

// Single source of truth for every discovered game. Readers (the platform querying state)
// share the lock; the router and dispatcher take it exclusively. Entities are never removed.
class EntityRegistry {
public:
    EntityRegistry() = default;
    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    // Creates the entity if absent, then overwrites displayState (last write wins).
    // Started/Stopped also settle any pending command.
    UpsertResult upsertState(const std::string& id, GameState state);
    // Records the digest of a successfully published cover. Creates the entity if absent.
    UpsertResult upsertCover(const std::string& id, const std::string& digest, int quality);
    // Records discovery metadata (name, installed). Creates the entity if absent.
    UpsertResult upsertMetadata(const GameRecord& record);
    // Applies a library snapshot. Records with a state token replace displayState; entities
    // missing from the snapshot are left untouched.
    std::vector<BulkUpsertEntry> bulkUpsert(const std::vector<GameRecord>& records);

    std::optional<GameEntity> get(const std::string& id) const;
    std::vector<GameEntity> snapshot() const;
    bool contains(const std::string& id) const;
    bool coverMatches(const std::string& id, const std::string& digest) const;
    size_t size() const;

    // Optimistically flips displayState to the command's target and records it as pending.
    // Invalid token for unknown ids or kinds without a target state.
    CommandToken issueCommand(const std::string& id, CommandKind kind, Clock::time_point now);
    // Settles a pending command with an authoritative observation. Returns true if one was pending.
    bool confirmCommand(const std::string& id, GameState observed);
    // Clears pending commands older than `timeout` without touching displayState.
    std::vector<ExpiredCommand> expirePending(Clock::time_point now, Clock::duration timeout);

private:
    GameEntity& findOrCreateLocked(const std::string& id, bool& created);
    bool confirmLocked(GameEntity& e, GameState observed, bool& rolledBack);

    mutable std::shared_mutex mutex_;
    std::map<std::string, GameEntity> entities_;
    uint64_t nextSequence_{1};
};

} // namespace playnite
