#pragma once

#include "playnite/cover_pipeline.hpp"
#include "playnite/errors.hpp"
#include "playnite/platform.hpp"
#include "playnite/registry.hpp"
#include "playnite/topic.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace playnite {

enum class RouteStatus { Dispatched, Ignored };

struct RouteResult {
    RouteStatus status{RouteStatus::Ignored};
    ErrorCode error{ErrorCode::None};   // set on Dispatched when the payload was bad
    TopicMatch match{TopicMatch::NotUnderBase};
    TopicKind kind{TopicKind::ReleaseState};
    std::string id;
};

struct RouterStats {
    uint64_t dispatched{0};
    uint64_t ignored{0};
    uint64_t malformed{0};
    uint64_t payloadErrors{0};
};

// Classifies inbound messages and applies them to the registry, the cover pipeline and the
// platform. Called from the loop thread only, one message at a time.
class TopicRouter {
public:
    TopicRouter(std::string topicBase, EntityRegistry& registry, EntityPlatform& platform, CoverPipeline& covers);

    // Fired when the remote library reports itself online.
    void setRemoteOnlineHandler(std::function<void()> handler) { onRemoteOnline_ = std::move(handler); }

    RouteResult route(const std::string& topic, const std::vector<unsigned char>& payload);

    RouterStats stats() const;

private:
    ErrorCode handleState(const std::string& id, const std::vector<unsigned char>& payload);
    ErrorCode handleCover(const std::string& id, const std::vector<unsigned char>& payload);
    ErrorCode handleDiscovery(const std::string& id, const std::vector<unsigned char>& payload);
    ErrorCode handleSnapshot(const std::vector<unsigned char>& payload);
    ErrorCode handleConnection(const std::vector<unsigned char>& payload);

    void publishUpsert(const std::string& id, const UpsertResult& r);

    std::string topicBase_;
    EntityRegistry& registry_;
    EntityPlatform& platform_;
    CoverPipeline& covers_;
    std::function<void()> onRemoteOnline_;

    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> ignored_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> payloadErrors_{0};
};

// Extracts game records from a library snapshot body: an array, {"games": [...]}, or a single
// record object. Returns false if the body is not JSON of one of those shapes.
bool parseSnapshotRecords(const std::string& body, std::vector<GameRecord>& out, size_t& skipped);

} // namespace playnite
