#include "romfetch/transport_resolver.hpp"
#include "romfetch/filesystem.hpp"
#include "romfetch/logger.hpp"
#include <cstdlib>
#include <filesystem>

namespace romfetch {

TransportResolver::TransportResolver(const Config& cfg)
    : toolDir_(cfg.toolDir), toolName_(cfg.transferTool) {}

std::vector<std::string> TransportResolver::candidateNames() const {
#ifdef _WIN32
    return {toolName_ + ".exe", toolName_};
#else
    return {toolName_, toolName_ + ".exe"};
#endif
}

std::string findOnPath(const std::string& name, const char* pathEnv) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos) return isExecutableFile(name) ? name : std::string();
    const char* path = pathEnv ? pathEnv : std::getenv("PATH");
    if (!path) return {};
    std::string dirs(path);
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        std::string dir = dirs.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = (std::filesystem::path(dir) / name).string();
        if (isExecutableFile(candidate)) return candidate;
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return {};
}

bool TransportResolver::resolve(std::string& outPath, std::string& err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cached_.empty()) {
        if (isExecutableFile(cached_)) {
            outPath = cached_;
            return true;
        }
        logWarn("Cached transfer tool vanished: " + cached_, "DL");
        cached_.clear();
    }

    const auto names = candidateNames();
    if (!toolDir_.empty()) {
        for (const auto& n : names) {
            std::string local = (std::filesystem::path(toolDir_) / n).string();
            if (isExecutableFile(local)) {
                cached_ = local;
                outPath = local;
                logDebug("Using project-local transfer tool " + local, "DL");
                return true;
            }
        }
    }
    for (const auto& n : names) {
        std::string found = findOnPath(n);
        if (!found.empty()) {
            cached_ = found;
            outPath = found;
            logDebug("Using transfer tool from PATH: " + found, "DL");
            return true;
        }
    }

    err = toolName_ + " binary not found (expected in " + (toolDir_.empty() ? std::string("tool dir") : toolDir_) + " or PATH)";
    return false;
}

} // namespace romfetch
