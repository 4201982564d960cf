#include "romfetch/filesystem.hpp"
#include "romfetch/logger.hpp"
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace romfetch {

bool ensureDirectory(const std::string& path) {
    if (path.empty()) return true;
    std::filesystem::path p(path);
    std::error_code ec;
    bool ok = std::filesystem::create_directories(p, ec) || std::filesystem::is_directory(p, ec);
    if (!ok) logWarn("Failed to ensure directory: " + path, "FS");
    return ok;
}

bool ensureParentDirectory(const std::string& filePath) {
    std::filesystem::path p(filePath);
    if (!p.has_parent_path()) return true;
    return ensureDirectory(p.parent_path().string());
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(path), ec);
}

uint64_t fileSizeOnDisk(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    if (!S_ISREG(st.st_mode)) return 0;
    return static_cast<uint64_t>(st.st_size);
}

bool isExecutableFile(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

std::string commonParentDirectory(const std::vector<std::string>& filePaths) {
    if (filePaths.empty()) return {};
    std::vector<std::filesystem::path> parts;
    bool first = true;
    for (const auto& fp : filePaths) {
        std::filesystem::path parent = std::filesystem::path(fp).parent_path();
        if (parent.empty()) return {};
        std::vector<std::filesystem::path> segs(parent.begin(), parent.end());
        if (first) {
            parts = segs;
            first = false;
            continue;
        }
        size_t n = 0;
        while (n < parts.size() && n < segs.size() && parts[n] == segs[n]) ++n;
        parts.resize(n);
        if (parts.empty()) return {};
    }
    std::filesystem::path out;
    for (const auto& s : parts) out /= s;
    return out.string();
}

} // namespace romfetch
