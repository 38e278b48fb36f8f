#include "playnite/topic.hpp"

namespace playnite {

namespace {

struct TopicPattern {
    const char* pattern;   // '+' marks the game id segment
    TopicCategory category;
    TopicKind kind;
    bool allowVariant;     // accept one extra trailing segment
};

const TopicPattern kPatterns[] = {
    {"entity/release/+", TopicCategory::Entity, TopicKind::ReleaseDiscovery, false},
    {"entity/release/+/state", TopicCategory::Entity, TopicKind::ReleaseState, false},
    {"entity/release/+/asset/cover", TopicCategory::Entity, TopicKind::ReleaseCover, true},
    {"response/game/state", TopicCategory::Response, TopicKind::LibrarySnapshot, false},
    {"connection", TopicCategory::Connection, TopicKind::ConnectionStatus, false},
};

bool matchPattern(const TopicPattern& p, const std::vector<std::string>& segs, TopicAddress& out) {
    const std::vector<std::string> pat = splitTopic(p.pattern);
    if (segs.size() != pat.size() && !(p.allowVariant && segs.size() == pat.size() + 1)) return false;
    std::string id;
    for (size_t i = 0; i < pat.size(); ++i) {
        if (pat[i] == "+") {
            if (segs[i].empty()) return false;
            id = segs[i];
        } else if (pat[i] != segs[i]) {
            return false;
        }
    }
    out.category = p.category;
    out.kind = p.kind;
    out.id = id;
    out.suffix = segs.size() > pat.size() ? segs.back() : std::string();
    return true;
}

} // namespace

const char* topicKindLabel(TopicKind k) {
    switch (k) {
        case TopicKind::ReleaseDiscovery: return "release";
        case TopicKind::ReleaseState: return "state";
        case TopicKind::ReleaseCover: return "cover";
        case TopicKind::LibrarySnapshot: return "snapshot";
        case TopicKind::ConnectionStatus: return "connection";
        default: return "unknown";
    }
}

const char* topicMatchLabel(TopicMatch m) {
    switch (m) {
        case TopicMatch::Matched: return "matched";
        case TopicMatch::NotUnderBase: return "not-under-base";
        case TopicMatch::Unrecognized: return "unrecognized";
        case TopicMatch::Malformed: return "malformed";
        default: return "unknown";
    }
}

std::vector<std::string> splitTopic(const std::string& topic) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t slash = topic.find('/', start);
        if (slash == std::string::npos) {
            out.push_back(topic.substr(start));
            break;
        }
        out.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }
    return out;
}

TopicMatch parseTopic(const std::string& base, const std::string& topic, TopicAddress& out) {
    if (base.empty() || topic.size() <= base.size() + 1) return TopicMatch::NotUnderBase;
    if (topic.compare(0, base.size(), base) != 0 || topic[base.size()] != '/') return TopicMatch::NotUnderBase;

    const std::vector<std::string> segs = splitTopic(topic.substr(base.size() + 1));
    for (const auto& p : kPatterns) {
        TopicAddress addr;
        if (matchPattern(p, segs, addr)) {
            addr.base = base;
            out = std::move(addr);
            return TopicMatch::Matched;
        }
    }

    // Everything under entity/release must fit one of the release shapes; other asset names are
    // legitimate traffic we simply do not consume.
    if (segs.size() >= 2 && segs[0] == "entity" && segs[1] == "release") {
        if (segs.size() >= 5 && !segs[2].empty() && segs[3] == "asset" && !segs[4].empty() && segs[4] != "cover") {
            return TopicMatch::Unrecognized;
        }
        return TopicMatch::Malformed;
    }
    return TopicMatch::Unrecognized;
}

std::string subscriptionFilter(const std::string& base) {
    return base + "/#";
}

std::string commandTopic(const std::string& base, CommandKind kind) {
    return base + "/request/game/" + commandKindLabel(kind);
}

std::string libraryRequestTopic(const std::string& base) {
    return base + "/request/library";
}

} // namespace playnite
