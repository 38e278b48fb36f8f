#pragma once

#include "playnite/models.hpp"
#include <string>
#include <vector>

namespace playnite {

enum class TopicCategory { Entity, Response, Connection };

enum class TopicKind {
    ReleaseDiscovery,   // entity/release/<id>
    ReleaseState,       // entity/release/<id>/state
    ReleaseCover,       // entity/release/<id>/asset/cover[/<variant>]
    LibrarySnapshot,    // response/game/state
    ConnectionStatus    // connection
};

// Parsed, immutable view of an inbound topic relative to the configured base.
struct TopicAddress {
    std::string base;
    TopicCategory category{TopicCategory::Entity};
    TopicKind kind{TopicKind::ReleaseState};
    std::string id;      // empty for non-entity topics
    std::string suffix;  // trailing variant segment of a cover topic, if any
};

enum class TopicMatch {
    Matched,
    NotUnderBase,   // unrelated broker traffic
    Unrecognized,   // under the base but not a shape we consume (including our own requests)
    Malformed       // entity/release/... with the wrong segment count or an empty id
};

const char* topicKindLabel(TopicKind k);
const char* topicMatchLabel(TopicMatch m);

std::vector<std::string> splitTopic(const std::string& topic);

TopicMatch parseTopic(const std::string& base, const std::string& topic, TopicAddress& out);

// Wildcard filter covering every topic under the base: "<base>/#".
std::string subscriptionFilter(const std::string& base);
// "<base>/request/game/<start|stop|install|uninstall>"
std::string commandTopic(const std::string& base, CommandKind kind);
// "<base>/request/library"
std::string libraryRequestTopic(const std::string& base);

} // namespace playnite
