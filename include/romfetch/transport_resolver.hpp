#pragma once

#include "romfetch/config.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace romfetch {

// Locates the external transfer tool: cached path, project-local tool
// directory, then PATH. Thread-safe; the cache is shared by all workers.
class TransportResolver {
public:
    explicit TransportResolver(const Config& cfg);

    bool resolve(std::string& outPath, std::string& err);

    // Candidate file names for the current platform, preferred first.
    std::vector<std::string> candidateNames() const;

private:
    std::string toolDir_;
    std::string toolName_;
    mutable std::mutex mutex_;
    std::string cached_;
};

// First executable named `name` on PATH (or the given path list); empty when absent.
std::string findOnPath(const std::string& name, const char* pathEnv = nullptr);

} // namespace romfetch
