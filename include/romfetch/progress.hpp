#pragma once

#include "romfetch/engine_state.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <string>

namespace romfetch {

struct ProgressSample {
    std::chrono::steady_clock::time_point at;
    uint64_t bytes{0};
};

// Bytes-on-disk samples over a short sliding window, used only for throughput.
class ThroughputWindow {
public:
    explicit ThroughputWindow(std::chrono::milliseconds span = std::chrono::milliseconds(1500)) : span_(span) {}

    void push(std::chrono::steady_clock::time_point at, uint64_t bytes);
    // Bytes per second across the window; 0 with fewer than two samples.
    double bytesPerSecond() const;
    void clear() { samples_.clear(); }
    size_t size() const { return samples_.size(); }

private:
    std::chrono::milliseconds span_;
    std::deque<ProgressSample> samples_;
};

// "12.3 MiB/s", "512 KiB/s", "80 B/s".
std::string formatSpeed(double bytesPerSecond);

// Coalesces progress samples into a bounded-rate callback stream. The dedup
// table lives in EngineState and shares its mutex.
class ProgressEmitter {
public:
    static constexpr double kMinPercentStep = 1.0;
    static constexpr std::chrono::milliseconds kMinSpeedInterval{200};

    explicit ProgressEmitter(EngineState& state) : state_(state) {}

    // Returns true when the callback was invoked.
    bool emit(const ProgressCallback& cb, const std::string& filename, double percent,
              const std::string& speed, JobStatus status);

private:
    EngineState& state_;
};

} // namespace romfetch
