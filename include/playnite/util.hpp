#pragma once

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace playnite::util {

inline std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

// 64-bit FNV-1a over raw bytes, rendered as 16 lowercase hex digits.
inline std::string contentDigest(const unsigned char* data, size_t len) {
    uint64_t h = 14695981039346656037ull;
    for (size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= 1099511628211ull;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << h;
    return oss.str();
}

inline std::string contentDigest(const std::vector<unsigned char>& bytes) {
    return contentDigest(bytes.data(), bytes.size());
}

// "playnite/playniteweb_my-pc" -> "Playniteweb My-Pc"
inline std::string humanizeTopicBase(const std::string& topicBase) {
    std::string last = topicBase;
    auto slash = last.find_last_of('/');
    if (slash != std::string::npos) last = last.substr(slash + 1);
    bool startOfWord = true;
    for (auto& c : last) {
        if (c == '_') c = ' ';
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc));
            startOfWord = false;
        } else {
            startOfWord = true;
        }
    }
    return last;
}

inline std::string ellipsize(const std::string& s, size_t maxlen) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

inline std::string formatBytes(size_t n) {
    std::ostringstream oss;
    if (n >= 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (static_cast<double>(n) / (1024.0 * 1024.0)) << " MiB";
    } else if (n >= 1024) {
        oss << std::fixed << std::setprecision(1) << (static_cast<double>(n) / 1024.0) << " KiB";
    } else {
        oss << n << " B";
    }
    return oss.str();
}

} // namespace playnite::util
