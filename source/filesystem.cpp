#include "playnite/filesystem.hpp"
#include "playnite/logger.hpp"
#include "playnite/raii.hpp"
#include <filesystem>
#include <fstream>

namespace playnite {

std::string safeFileName(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (c <= 31 || c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' ||
            c == '"' || c == '<' || c == '>' || c == '|') continue;
        out.push_back(static_cast<char>(c));
    }
    if (out.empty() || out == "." || out == "..") out = "game";
    return out;
}

bool ensureDirectory(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    bool ok = std::filesystem::create_directories(p, ec) || std::filesystem::is_directory(p, ec);
    if (!ok) logWarn("Failed to ensure directory: " + path, "FS");
    return ok;
}

bool fileExists(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    return std::filesystem::exists(p, ec);
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) return false;
    std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    out.swap(data);
    return true;
}

bool writeFileAtomic(const std::string& path, const std::vector<unsigned char>& bytes, std::string& outError) {
    const std::string tmp = path + ".tmp";
    UniqueFile file(std::fopen(tmp.c_str(), "wb"));
    if (!file) {
        outError = "open failed: " + tmp;
        return false;
    }
    auto removeTmp = makeScopeGuard([&tmp]() {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
    });
    if (!bytes.empty() && std::fwrite(bytes.data(), 1, bytes.size(), file.get()) != bytes.size()) {
        outError = "write failed: " + tmp;
        file.reset();
        return false;
    }
    if (!file.close()) {
        outError = "close failed: " + tmp;
        return false;
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        outError = "rename failed: " + ec.message();
        return false;
    }
    removeTmp.dismiss();
    return true;
}

} // namespace playnite
