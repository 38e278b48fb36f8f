#pragma once

#include <string>
#include <vector>

namespace playnite {

// Ensure a directory exists, creating it if necessary.
bool ensureDirectory(const std::string& path);
// Check if a file exists.
bool fileExists(const std::string& path);
// Read a whole file; false if it cannot be opened.
bool readFile(const std::string& path, std::string& out);
// Write bytes to <path>.tmp then rename over <path> so readers never see a partial file.
bool writeFileAtomic(const std::string& path, const std::vector<unsigned char>& bytes, std::string& outError);
// Strip path separators and control characters so a remote id is usable as a file name.
std::string safeFileName(const std::string& in);

} // namespace playnite
