#include "playnite/models.hpp"
#include "playnite/util.hpp"

namespace playnite {

const char* gameStateLabel(GameState s) {
    switch (s) {
        case GameState::Unknown: return "unknown";
        case GameState::Stopped: return "stopped";
        case GameState::Started: return "started";
        default: return "unknown";
    }
}

const char* commandKindLabel(CommandKind k) {
    switch (k) {
        case CommandKind::Start: return "start";
        case CommandKind::Stop: return "stop";
        case CommandKind::Install: return "install";
        case CommandKind::Uninstall: return "uninstall";
        default: return "unknown";
    }
}

GameState parseStateToken(const std::string& token) {
    const std::string t = util::toLower(util::trim(token));
    if (t == "started" || t == "starting" || t == "running" || t == "on") return GameState::Started;
    if (t == "stopped" || t == "stopping" || t == "not_running" || t == "off" ||
        t == "installed" || t == "uninstalled") {
        return GameState::Stopped;
    }
    return GameState::Unknown;
}

} // namespace playnite
