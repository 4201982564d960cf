#pragma once

#include "romfetch/command_builder.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace romfetch {

enum class JobStatus { Queued, Downloading, Done, Error, Halted };

inline const char* jobStatusLabel(JobStatus s) {
    switch (s) {
        case JobStatus::Queued: return "QUEUED";
        case JobStatus::Downloading: return "DOWNLOADING";
        case JobStatus::Done: return "DONE";
        case JobStatus::Error: return "ERROR";
        case JobStatus::Halted: return "HALTED";
        default: return "UNKNOWN";
    }
}

inline bool isTerminal(JobStatus s) {
    return s == JobStatus::Done || s == JobStatus::Error || s == JobStatus::Halted;
}

// (filename, percent in [0,100], speed text, status). On ERROR the speed slot
// carries the diagnostic line.
using ProgressCallback = std::function<void(const std::string& filename, double percent,
                                            const std::string& speed, JobStatus status)>;

// State of one logical job across its whole retry chain. Owned by the worker running it.
struct TransferJob {
    std::string url;          // current target; rewritten by mirror/host-hop stages
    std::string originalUrl;
    std::string destPath;
    std::string filename;
    int attempt{0};
    bool troubleshoot{false};
    TransportKind transport{TransportKind::CopyUrl};
    std::set<std::string> triedHosts;
    bool probed{false};
    std::optional<uint64_t> remoteSize;
    uint64_t localBytes{0};
    // Floor for displayed percent across retries.
    double percentFloor{0.0};
    JobStatus status{JobStatus::Queued};
};

struct TransferResult {
    std::string url;
    std::string destPath;
    std::string filename;
    JobStatus status{JobStatus::Queued};
    bool skipped{false};
    bool resumed{false};
    uint64_t bytes{0};
    std::optional<uint64_t> remoteSize;
    std::string transport;
    int attempts{0};
    int exitCode{0};
    std::string error;

    bool ok() const { return status == JobStatus::Done; }
};

} // namespace romfetch
