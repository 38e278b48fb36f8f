#pragma once

#include "playnite/platform.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace playnite {

// Stand-alone platform: logs entity changes and keeps each cover as <coverDir>/<id>.jpg.
class FilePlatform : public EntityPlatform {
public:
    FilePlatform(std::string coverDir, std::string deviceName);

    void announceEntity(const GameEntity& entity) override;
    void setState(const std::string& id, GameState state) override;
    void setCover(const std::string& id, const std::vector<unsigned char>& jpeg) override;
    void onCommandHook(CommandHook hook, const std::string& id) override;

    std::string coverPath(const std::string& id) const;
    size_t announced() const;
    GameState stateOf(const std::string& id) const;

private:
    std::string displayName(const std::string& id) const;

    std::string coverDir_;
    std::string deviceName_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> names_;
    std::map<std::string, GameState> states_;
};

} // namespace playnite
