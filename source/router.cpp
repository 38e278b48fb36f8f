#include "playnite/router.hpp"
#include "playnite/logger.hpp"
#include "playnite/util.hpp"
#include "mini/json.hpp"

namespace playnite {

namespace {

std::string payloadText(const std::vector<unsigned char>& payload) {
    return std::string(payload.begin(), payload.end());
}

// State tokens are short printable words; anything with control bytes is corrupt.
bool isPrintableToken(const std::string& s) {
    for (unsigned char c : s) {
        if (c < 0x20 || c == 0x7f) return false;
    }
    return true;
}

bool recordFromObject(const mini::Object& o, GameRecord& rec) {
    if (!mini::get_id(o, "id", rec.id)) return false;
    mini::get_string(o, "name", rec.name);
    std::string state;
    if (mini::get_string(o, "state", state)) rec.stateToken = state;
    bool installed = false;
    if (mini::get_bool(o, "isInstalled", installed)) rec.installed = installed;
    return true;
}

void collectRecords(const mini::Array& arr, std::vector<GameRecord>& out, size_t& skipped) {
    for (const auto& v : arr) {
        GameRecord rec;
        if (v.type == mini::Value::Type::Object && recordFromObject(v.object, rec)) {
            out.push_back(std::move(rec));
        } else {
            skipped++;
        }
    }
}

} // namespace

bool parseSnapshotRecords(const std::string& body, std::vector<GameRecord>& out, size_t& skipped) {
    out.clear();
    skipped = 0;
    mini::Value root;
    if (!mini::parse(body, root)) return false;
    if (root.type == mini::Value::Type::Array) {
        collectRecords(root.array, out, skipped);
        return true;
    }
    if (root.type != mini::Value::Type::Object) return false;

    auto games = root.object.find("games");
    if (games != root.object.end()) {
        if (games->second.type != mini::Value::Type::Array) return false;
        collectRecords(games->second.array, out, skipped);
        return true;
    }
    GameRecord rec;
    if (recordFromObject(root.object, rec))
        out.push_back(std::move(rec));
    else
        skipped++;
    return true;
}

TopicRouter::TopicRouter(std::string topicBase, EntityRegistry& registry, EntityPlatform& platform,
                         CoverPipeline& covers)
    : topicBase_(std::move(topicBase)), registry_(registry), platform_(platform), covers_(covers) {}

RouteResult TopicRouter::route(const std::string& topic, const std::vector<unsigned char>& payload) {
    RouteResult result;
    TopicAddress addr;
    result.match = parseTopic(topicBase_, topic, addr);

    switch (result.match) {
        case TopicMatch::NotUnderBase:
        case TopicMatch::Unrecognized:
            ignored_++;
            logDebug("Ignoring " + topic, "ROUTER");
            return result;
        case TopicMatch::Malformed:
            malformed_++;
            logWarn(std::string(errorCodeLabel(ErrorCode::ParseError)) + ": malformed topic " + topic, "ROUTER");
            return result;
        case TopicMatch::Matched:
            break;
    }

    dispatched_++;
    result.status = RouteStatus::Dispatched;
    result.kind = addr.kind;
    result.id = addr.id;
    switch (addr.kind) {
        case TopicKind::ReleaseState: result.error = handleState(addr.id, payload); break;
        case TopicKind::ReleaseCover: result.error = handleCover(addr.id, payload); break;
        case TopicKind::ReleaseDiscovery: result.error = handleDiscovery(addr.id, payload); break;
        case TopicKind::LibrarySnapshot: result.error = handleSnapshot(payload); break;
        case TopicKind::ConnectionStatus: result.error = handleConnection(payload); break;
    }
    if (result.error == ErrorCode::PayloadError) payloadErrors_++;
    return result;
}

void TopicRouter::publishUpsert(const std::string& id, const UpsertResult& r) {
    if (r.created) {
        if (auto entity = registry_.get(id)) platform_.announceEntity(*entity);
    } else if (r.changed) {
        platform_.setState(id, r.current);
    }
}

ErrorCode TopicRouter::handleState(const std::string& id, const std::vector<unsigned char>& payload) {
    std::string token = util::trim(payloadText(payload));
    if (token.empty() || !isPrintableToken(token)) {
        logWarn(std::string(errorCodeLabel(ErrorCode::PayloadError)) + ": unreadable state for " + id +
                    "; keeping " + (registry_.contains(id) ? "last known state" : "game undiscovered"),
                "ROUTER");
        return ErrorCode::PayloadError;
    }
    // Some publishers wrap the token: {"id": "...", "state": "..."}.
    if (token.front() == '{') {
        mini::Object o;
        std::string bodyId;
        if (!mini::parse(token, o) || !mini::get_string(o, "state", token) ||
            (mini::get_id(o, "id", bodyId) && bodyId != id)) {
            logWarn(std::string(errorCodeLabel(ErrorCode::PayloadError)) + ": bad state object for " + id + ": " +
                        util::ellipsize(payloadText(payload), 80),
                    "ROUTER");
            return ErrorCode::PayloadError;
        }
    }

    const GameState state = parseStateToken(token);
    if (state == GameState::Unknown) {
        logWarn("Game " + id + ": unrecognized state token '" + util::ellipsize(token, 40) + "'", "ROUTER");
    }
    UpsertResult r = registry_.upsertState(id, state);
    logDebug("Game " + id + " -> " + gameStateLabel(state), "ROUTER");
    publishUpsert(id, r);
    return ErrorCode::None;
}

ErrorCode TopicRouter::handleCover(const std::string& id, const std::vector<unsigned char>& payload) {
    if (payload.empty()) {
        logWarn(std::string(errorCodeLabel(ErrorCode::PayloadError)) + ": empty cover for " + id, "ROUTER");
        return ErrorCode::PayloadError;
    }
    CoverOutcome outcome = covers_.handleCover(id, payload);
    return outcome == CoverOutcome::Failed ? ErrorCode::UnsupportedImage : ErrorCode::None;
}

ErrorCode TopicRouter::handleDiscovery(const std::string& id, const std::vector<unsigned char>& payload) {
    mini::Object o;
    if (!mini::parse(payloadText(payload), o)) {
        logWarn(std::string(errorCodeLabel(ErrorCode::PayloadError)) + ": invalid release JSON for " + id, "ROUTER");
        return ErrorCode::PayloadError;
    }
    GameRecord rec;
    std::string bodyId;
    if (mini::get_id(o, "id", bodyId) && bodyId != id) {
        logWarn(std::string(errorCodeLabel(ErrorCode::PayloadError)) + ": release " + id + " carries id " + bodyId,
                "ROUTER");
        return ErrorCode::PayloadError;
    }
    rec.id = id;
    mini::get_string(o, "name", rec.name);
    bool installed = false;
    if (mini::get_bool(o, "isInstalled", installed)) rec.installed = installed;

    UpsertResult r = registry_.upsertMetadata(rec);
    if (r.created) {
        logInfo("Discovered " + (rec.name.empty() ? id : rec.name + " (" + id + ")"), "ROUTER");
        if (auto entity = registry_.get(id)) platform_.announceEntity(*entity);
    }
    return ErrorCode::None;
}

ErrorCode TopicRouter::handleSnapshot(const std::vector<unsigned char>& payload) {
    std::vector<GameRecord> records;
    size_t skipped = 0;
    if (!parseSnapshotRecords(payloadText(payload), records, skipped)) {
        logWarn(std::string(errorCodeLabel(ErrorCode::PayloadError)) + ": library snapshot is not valid JSON",
                "ROUTER");
        return ErrorCode::PayloadError;
    }
    if (skipped > 0) logWarn("Library snapshot: skipped " + std::to_string(skipped) + " record(s) without id", "ROUTER");
    if (records.empty()) {
        logWarn(std::string(errorCodeLabel(ErrorCode::PayloadError)) + ": library snapshot has no usable records",
                "ROUTER");
        return ErrorCode::PayloadError;
    }

    size_t created = 0;
    for (const auto& entry : registry_.bulkUpsert(records)) {
        if (entry.result.created) created++;
        publishUpsert(entry.id, entry.result);
    }
    logInfo("Library snapshot: " + std::to_string(records.size()) + " game(s), " + std::to_string(created) + " new",
            "ROUTER");
    return ErrorCode::None;
}

ErrorCode TopicRouter::handleConnection(const std::vector<unsigned char>& payload) {
    const std::string status = util::toLower(util::trim(payloadText(payload)));
    if (status != "online") {
        logDebug("Remote connection status: " + util::ellipsize(status, 40), "ROUTER");
        return ErrorCode::None;
    }
    logInfo("Remote library is online", "ROUTER");
    if (onRemoteOnline_) onRemoteOnline_();
    return ErrorCode::None;
}

RouterStats TopicRouter::stats() const {
    RouterStats s;
    s.dispatched = dispatched_.load();
    s.ignored = ignored_.load();
    s.malformed = malformed_.load();
    s.payloadErrors = payloadErrors_.load();
    return s;
}

} // namespace playnite
