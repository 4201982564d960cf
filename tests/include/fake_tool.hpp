#pragma once

// Helpers for tests that drive a real subprocess: a scratch directory and a
// /bin/sh stand-in for the transfer tool that records its argument vectors.

#include "romfetch/config.hpp"
#include "romfetch/metadata_probe.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace romfetch_test {

struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path() /
               ("romfetch_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }
};

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << content;
}

inline void writeZeros(const std::string& path, size_t bytes) {
    writeFile(path, std::string(bytes, '\0'));
}

inline std::vector<std::string> readLines(const std::string& path) {
    std::vector<std::string> out;
    std::ifstream f(path);
    std::string line;
    while (std::getline(f, line)) out.push_back(line);
    return out;
}

// Shell fragment writing `bytes` zero bytes to "$dest".
inline std::string writeBytesAction(size_t bytes) {
    return "head -c " + std::to_string(bytes) + " /dev/zero > \"$dest\"; exit 0";
}

inline std::string failAction(const std::string& message) {
    return "echo 'Config file \"/root/.config/rclone/rclone.conf\" not found - using defaults' >&2\n"
           "echo '" + message + "' >&2\nexit 1";
}

// Install a fake transfer tool named cfg.transferTool in dir. Each call appends
// its arguments to <dir>/calls.log, then runs the case branch for its call
// number; `fallback` runs for numbers without a branch.
inline std::string installFakeTool(const TempDir& dir,
                                   const std::vector<std::string>& perCall,
                                   const std::string& fallback,
                                   const std::string& toolName = "rclone") {
    const std::string log = dir.file("calls.log");
    std::ostringstream s;
    s << "#!/bin/sh\n"
      << "echo \"$*\" >> '" << log << "'\n"
      << "n=$(wc -l < '" << log << "' | tr -d ' ')\n"
      << "if [ \"$1\" = \"copyurl\" ]; then dest=\"$3\"; else dest=\"$6\"; fi\n"
      << "case $n in\n";
    for (size_t i = 0; i < perCall.size(); ++i) {
        s << "  " << (i + 1) << ")\n" << perCall[i] << "\n  ;;\n";
    }
    s << "  *)\n" << fallback << "\n  ;;\nesac\n";

    const std::string tool = dir.file(toolName);
    writeFile(tool, s.str());
    std::filesystem::permissions(tool, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace);
    return log;
}

inline romfetch::Config fastConfig(const TempDir& toolDir) {
    romfetch::Config cfg;
    cfg.toolDir = toolDir.path.string();
    cfg.pollIntervalMs = 20;
    cfg.terminateGraceMs = 300;
    cfg.userAgent = "romfetch-test";
    return cfg;
}

inline romfetch::ProbeFn fixedProbe(std::optional<uint64_t> size, int status = 200) {
    return [size, status](const std::string& url) {
        romfetch::RemoteMetadata m;
        m.httpStatus = status;
        if (status >= 400) {
            m.error = "HTTP " + std::to_string(status) + " (HEAD " + url + ")";
            return m;
        }
        m.remoteSize = size;
        return m;
    };
}

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace romfetch_test
