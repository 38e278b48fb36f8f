#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace playnite {

using Clock = std::chrono::steady_clock;

enum class GameState { Unknown, Stopped, Started };

// Requests the user can make against one game. Only Start/Stop carry optimistic state.
enum class CommandKind { Start, Stop, Install, Uninstall };

struct PendingCommand {
    CommandKind kind{CommandKind::Start};
    GameState target{GameState::Unknown};
    uint64_t sequence{0};
    Clock::time_point issuedAt{};
};

struct GameEntity {
    std::string id;
    std::string name;            // display name; id until a discovery record names it
    std::optional<bool> installed;
    GameState displayState{GameState::Unknown};
    std::string coverDigest;     // digest of the raw cover last transcoded and published
    int coverQuality{0};
    std::optional<PendingCommand> pendingCommand;
};

// One entry of a library snapshot (response/game/state) or a release discovery message.
struct GameRecord {
    std::string id;
    std::string name;
    std::optional<std::string> stateToken;
    std::optional<bool> installed;
};

// Handle returned by EntityRegistry::issueCommand. Invalid when the id is unknown.
struct CommandToken {
    std::string id;
    CommandKind kind{CommandKind::Start};
    uint64_t sequence{0};
    Clock::time_point issuedAt{};
    bool valid{false};
};

const char* gameStateLabel(GameState s);
const char* commandKindLabel(CommandKind k);

// Map a remote state token to a GameState; unrecognized tokens map to Unknown.
GameState parseStateToken(const std::string& token);

inline GameState targetStateFor(CommandKind k) {
    switch (k) {
        case CommandKind::Start: return GameState::Started;
        case CommandKind::Stop: return GameState::Stopped;
        default: return GameState::Unknown;
    }
}

} // namespace playnite
