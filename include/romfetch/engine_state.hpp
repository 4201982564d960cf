#pragma once

#include "romfetch/models.hpp"
#include "romfetch/process.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace romfetch {

using JobId = uint64_t;

struct RegistryEntry {
    std::string url;
    std::string destPath;
    std::string filename;
    bool started{false};
};

struct EmitRecord {
    std::chrono::steady_clock::time_point at;
    double percent{0.0};
    std::string speed;
    JobStatus status{JobStatus::Queued};
};

// Shared engine state for one scheduler instance. A single mutex guards the
// cancel flag, the job registry, the live subprocess map and the progress
// dedup table.
struct EngineState {
    mutable std::mutex mutex;

    // Once set, no new DOWNLOADING transition may begin.
    bool cancelRequested{false};

    std::map<JobId, RegistryEntry> registry;
    // Keyed by destination path.
    std::unordered_map<std::string, std::shared_ptr<ChildProcess>> activeProcesses;
    // Keyed by filename.
    std::unordered_map<std::string, EmitRecord> lastEmitted;
};

// Run a callable while holding the state mutex, returning its result.
template <typename F>
auto withStateLock(EngineState& st, F&& fn) -> decltype(fn()) {
    std::lock_guard<std::mutex> lock(st.mutex);
    return fn();
}

// View of the cancel flag inside EngineState.
class CancelToken {
public:
    explicit CancelToken(EngineState& st) : st_(st) {}

    bool isSet() const {
        std::lock_guard<std::mutex> lock(st_.mutex);
        return st_.cancelRequested;
    }
    void set() {
        std::lock_guard<std::mutex> lock(st_.mutex);
        st_.cancelRequested = true;
    }

private:
    EngineState& st_;
};

} // namespace romfetch
