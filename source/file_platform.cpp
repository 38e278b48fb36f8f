#include "playnite/file_platform.hpp"
#include "playnite/filesystem.hpp"
#include "playnite/logger.hpp"

namespace playnite {

FilePlatform::FilePlatform(std::string coverDir, std::string deviceName)
    : coverDir_(std::move(coverDir)), deviceName_(std::move(deviceName)) {
    if (coverDir_.empty()) coverDir_ = ".";
    while (coverDir_.size() > 1 && coverDir_.back() == '/') coverDir_.pop_back();
}

std::string FilePlatform::displayName(const std::string& id) const {
    auto it = names_.find(id);
    return it == names_.end() || it->second == id ? id : it->second + " (" + id + ")";
}

void FilePlatform::announceEntity(const GameEntity& entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    names_[entity.id] = entity.name.empty() ? entity.id : entity.name;
    states_[entity.id] = entity.displayState;
    logInfo(deviceName_ + ": new game " + displayName(entity.id) + " [" + gameStateLabel(entity.displayState) + "]",
            "PLAT");
}

void FilePlatform::setState(const std::string& id, GameState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_[id] = state;
    logInfo(deviceName_ + ": " + displayName(id) + " is " + gameStateLabel(state), "PLAT");
}

void FilePlatform::setCover(const std::string& id, const std::vector<unsigned char>& jpeg) {
    if (!ensureDirectory(coverDir_)) {
        logError("Cannot create cover directory " + coverDir_, "PLAT");
        return;
    }
    const std::string path = coverPath(id);
    std::string err;
    if (!writeFileAtomic(path, jpeg, err)) {
        logError("Failed to store cover for " + id + ": " + err, "PLAT");
        return;
    }
    logDebug("Stored cover " + path, "PLAT");
}

void FilePlatform::onCommandHook(CommandHook hook, const std::string& id) {
    logDebug(std::string("Hook ") + commandHookLabel(hook) + " for " + id, "PLAT");
}

std::string FilePlatform::coverPath(const std::string& id) const {
    return coverDir_ + "/" + safeFileName(id) + ".jpg";
}

size_t FilePlatform::announced() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.size();
}

GameState FilePlatform::stateOf(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(id);
    return it == states_.end() ? GameState::Unknown : it->second;
}

} // namespace playnite
