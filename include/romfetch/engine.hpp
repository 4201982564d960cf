#pragma once

#include "romfetch/config.hpp"
#include "romfetch/job_scheduler.hpp"
#include "romfetch/metadata_probe.hpp"
#include <cstdint>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace romfetch {

struct DownloadTarget {
    std::string url;
    std::string destPath;
};

struct BatchSubmitResult {
    std::vector<JobHandle> handles;
    std::vector<std::string> errors;
};

struct RemoteFileCheck {
    bool exists{false};
    uint64_t localSize{0};
    std::optional<uint64_t> remoteSize;
    std::optional<std::time_t> remoteLastModified;
    bool sameSize{false};
    std::string error;
};

// Owns the active JobScheduler. A halt retires the current scheduler and
// installs a fresh one, so later submissions never inherit the cancel flag.
class DownloadEngine {
public:
    explicit DownloadEngine(const Config& cfg, ProbeFn probe = ProbeFn());
    ~DownloadEngine();

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    JobHandle submit(const std::string& url, const std::string& destPath, ProgressCallback onProgress = ProgressCallback());
    BatchSubmitResult submitBatch(const std::vector<DownloadTarget>& targets, const ProgressCallback& onProgress);

    HaltSummary haltTraffic();

    RemoteFileCheck checkRemoteFile(const std::string& url, const std::string& localPath) const;

    size_t activeCount() const;
    size_t retiredCount() const;

private:
    void reapRetiredLocked();

    Config cfg_;
    ProbeFn probe_;
    mutable std::mutex mutex_;
    std::unique_ptr<JobScheduler> scheduler_;
    std::vector<std::unique_ptr<JobScheduler>> retired_;
};

} // namespace romfetch
