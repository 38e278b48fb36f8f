#include "playnite/registry.hpp"
#include "playnite/logger.hpp"
#include <mutex>

namespace playnite {

GameEntity& EntityRegistry::findOrCreateLocked(const std::string& id, bool& created) {
    auto it = entities_.find(id);
    if (it != entities_.end()) {
        created = false;
        return it->second;
    }
    GameEntity e;
    e.id = id;
    e.name = id;
    created = true;
    logDebug("Discovered game " + id, "REG");
    return entities_.emplace(id, std::move(e)).first->second;
}

bool EntityRegistry::confirmLocked(GameEntity& e, GameState observed, bool& rolledBack) {
    rolledBack = false;
    if (!e.pendingCommand) return false;
    if (observed == GameState::Unknown) return false; // neither confirms nor refutes
    if (observed != e.pendingCommand->target) {
        rolledBack = true;
        logInfo("Game " + e.id + ": " + commandKindLabel(e.pendingCommand->kind) +
                " not confirmed, remote reports " + gameStateLabel(observed), "REG");
    } else {
        logDebug("Game " + e.id + ": " + commandKindLabel(e.pendingCommand->kind) + " confirmed", "REG");
    }
    e.pendingCommand.reset();
    return true;
}

UpsertResult EntityRegistry::upsertState(const std::string& id, GameState state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    UpsertResult r;
    GameEntity& e = findOrCreateLocked(id, r.created);
    r.previous = e.displayState;
    e.displayState = state;
    r.current = state;
    r.changed = r.created || r.previous != state;
    r.pendingCleared = confirmLocked(e, state, r.rolledBack);
    return r;
}

UpsertResult EntityRegistry::upsertCover(const std::string& id, const std::string& digest, int quality) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    UpsertResult r;
    GameEntity& e = findOrCreateLocked(id, r.created);
    r.previous = r.current = e.displayState;
    r.changed = e.coverDigest != digest;
    e.coverDigest = digest;
    e.coverQuality = quality;
    return r;
}

UpsertResult EntityRegistry::upsertMetadata(const GameRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    UpsertResult r;
    GameEntity& e = findOrCreateLocked(record.id, r.created);
    r.previous = r.current = e.displayState;
    if (!record.name.empty() && record.name != e.name) {
        e.name = record.name;
        r.changed = true;
    }
    if (record.installed && e.installed != record.installed) {
        e.installed = record.installed;
        r.changed = true;
    }
    r.changed = r.changed || r.created;
    return r;
}

std::vector<BulkUpsertEntry> EntityRegistry::bulkUpsert(const std::vector<GameRecord>& records) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<BulkUpsertEntry> out;
    out.reserve(records.size());
    for (const auto& rec : records) {
        if (rec.id.empty()) continue;
        BulkUpsertEntry entry;
        entry.id = rec.id;
        UpsertResult& r = entry.result;
        GameEntity& e = findOrCreateLocked(rec.id, r.created);
        r.previous = e.displayState;
        if (!rec.name.empty() && rec.name != e.name) {
            e.name = rec.name;
            r.changed = true;
        }
        if (rec.installed) e.installed = rec.installed;
        if (rec.stateToken) {
            const GameState s = parseStateToken(*rec.stateToken);
            if (s == GameState::Unknown) {
                logWarn("Game " + rec.id + ": unrecognized state token '" + *rec.stateToken + "'", "REG");
            }
            e.displayState = s;
            r.pendingCleared = confirmLocked(e, s, r.rolledBack);
        }
        r.current = e.displayState;
        r.changed = r.changed || r.created || r.previous != r.current;
        out.push_back(std::move(entry));
    }
    return out;
}

std::optional<GameEntity> EntityRegistry::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end()) return std::nullopt;
    return it->second;
}

std::vector<GameEntity> EntityRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<GameEntity> out;
    out.reserve(entities_.size());
    for (const auto& kv : entities_) out.push_back(kv.second);
    return out;
}

bool EntityRegistry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entities_.count(id) > 0;
}

bool EntityRegistry::coverMatches(const std::string& id, const std::string& digest) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entities_.find(id);
    return it != entities_.end() && !digest.empty() && it->second.coverDigest == digest;
}

size_t EntityRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entities_.size();
}

CommandToken EntityRegistry::issueCommand(const std::string& id, CommandKind kind, Clock::time_point now) {
    CommandToken token;
    token.id = id;
    token.kind = kind;
    token.issuedAt = now;
    const GameState target = targetStateFor(kind);
    if (target == GameState::Unknown) return token;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end()) return token;

    PendingCommand pending;
    pending.kind = kind;
    pending.target = target;
    pending.sequence = nextSequence_++;
    pending.issuedAt = now;
    it->second.pendingCommand = pending;
    it->second.displayState = target;

    token.sequence = pending.sequence;
    token.valid = true;
    return token;
}

bool EntityRegistry::confirmCommand(const std::string& id, GameState observed) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end()) return false;
    bool rolledBack = false;
    const bool settled = confirmLocked(it->second, observed, rolledBack);
    if (settled) it->second.displayState = observed;
    return settled;
}

std::vector<ExpiredCommand> EntityRegistry::expirePending(Clock::time_point now, Clock::duration timeout) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<ExpiredCommand> out;
    for (auto& kv : entities_) {
        auto& pending = kv.second.pendingCommand;
        if (!pending) continue;
        if (now - pending->issuedAt < timeout) continue;
        out.push_back(ExpiredCommand{kv.first, pending->kind, pending->sequence});
        pending.reset();
    }
    return out;
}

} // namespace playnite
