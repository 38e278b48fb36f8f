#pragma once

#include "playnite/models.hpp"
#include <string>
#include <vector>

namespace playnite {

enum class CommandHook { BeforeStart, AfterStart, BeforeStop, AfterStop };

inline const char* commandHookLabel(CommandHook h) {
    switch (h) {
        case CommandHook::BeforeStart: return "before_start";
        case CommandHook::AfterStart: return "after_start";
        case CommandHook::BeforeStop: return "before_stop";
        case CommandHook::AfterStop: return "after_stop";
        default: return "unknown";
    }
}

// Home-automation side of the bridge. The core pushes entity changes through this interface;
// the platform calls back into CommandDispatcher for user intents.
class EntityPlatform {
public:
    virtual ~EntityPlatform() = default;

    virtual void announceEntity(const GameEntity& entity) = 0;
    virtual void setState(const std::string& id, GameState state) = 0;
    virtual void setCover(const std::string& id, const std::vector<unsigned char>& jpeg) = 0;
    virtual void onCommandHook(CommandHook hook, const std::string& id) {
        (void)hook;
        (void)id;
    }
};

} // namespace playnite
