#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace romfetch {

// Ensure a directory exists, creating it if necessary.
bool ensureDirectory(const std::string& path);
// Ensure the parent directory of a file path exists.
bool ensureParentDirectory(const std::string& filePath);
bool fileExists(const std::string& path);
// Size of a regular file in bytes; 0 when missing or unreadable.
uint64_t fileSizeOnDisk(const std::string& path);
bool isExecutableFile(const std::string& path);
// Deepest directory shared by every path's parent; empty when there is none.
std::string commonParentDirectory(const std::vector<std::string>& filePaths);

} // namespace romfetch
