#include "romfetch/progress.hpp"
#include "romfetch/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>

namespace romfetch {

void ThroughputWindow::push(std::chrono::steady_clock::time_point at, uint64_t bytes) {
    // A shrinking file (tool restarted the write) invalidates the window.
    if (!samples_.empty() && bytes < samples_.back().bytes) samples_.clear();
    samples_.push_back(ProgressSample{at, bytes});
    while (samples_.size() > 2 && at - samples_.front().at > span_) samples_.pop_front();
}

double ThroughputWindow::bytesPerSecond() const {
    if (samples_.size() < 2) return 0.0;
    const auto& first = samples_.front();
    const auto& last = samples_.back();
    const double secs = std::chrono::duration<double>(last.at - first.at).count();
    if (secs <= 0.0) return 0.0;
    return static_cast<double>(last.bytes - first.bytes) / secs;
}

std::string formatSpeed(double bps) {
    if (!(bps > 0.0)) bps = 0.0;
    char buf[32];
    if (bps >= 1024.0 * 1024.0) {
        std::snprintf(buf, sizeof(buf), "%.1f MiB/s", bps / (1024.0 * 1024.0));
    } else if (bps >= 1024.0) {
        std::snprintf(buf, sizeof(buf), "%.0f KiB/s", bps / 1024.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.0f B/s", bps);
    }
    return buf;
}

bool ProgressEmitter::emit(const ProgressCallback& cb, const std::string& filename, double percent,
                           const std::string& speed, JobStatus status) {
    if (std::isnan(percent)) percent = 0.0;
    percent = std::min(100.0, std::max(0.0, percent));
    const auto now = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        auto it = state_.lastEmitted.find(filename);
        if (isTerminal(status)) {
            if (it != state_.lastEmitted.end()) state_.lastEmitted.erase(it);
        } else if (it == state_.lastEmitted.end()) {
            state_.lastEmitted[filename] = EmitRecord{now, percent, speed, status};
        } else {
            EmitRecord& prev = it->second;
            bool statusChanged = prev.status != status;
            bool percentMoved = std::fabs(percent - prev.percent) >= kMinPercentStep;
            bool speedChanged = status == JobStatus::Downloading && speed != prev.speed &&
                                now - prev.at >= kMinSpeedInterval;
            if (!statusChanged && !percentMoved && !speedChanged) return false;
            prev = EmitRecord{now, percent, speed, status};
        }
    }

    if (!cb) return true;
    // Callbacks belong to the caller; a throwing one must not take a worker down.
    try {
        cb(filename, percent, speed, status);
    } catch (const std::exception& e) {
        logWarn("Progress callback threw for " + filename + ": " + e.what(), "DL");
    } catch (...) {
        logWarn("Progress callback threw a non-standard exception for " + filename, "DL");
    }
    return true;
}

} // namespace romfetch
