#pragma once

#include "romfetch/raii.hpp"
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

namespace romfetch {

// One supervised child process with combined stdout/stderr captured into a
// bounded tail buffer. All methods are safe to call from several threads;
// halt() terminates children owned by worker threads.
class ChildProcess {
public:
    static constexpr size_t kMaxTailBytes = 64 * 1024;

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // argv[0] must be a path to an executable; PATH is not searched.
    bool spawn(const std::vector<std::string>& argv, std::string& err);

    // Reaps the child without blocking; false once it has exited.
    bool running();
    // Blocks up to timeoutMs; true when the child has exited.
    bool waitFor(int timeoutMs);
    // SIGTERM to the child's process group, bounded wait, then SIGKILL.
    void terminate(int graceMs);

    // Read whatever output is available without blocking.
    void drainOutput();
    std::string outputTail() const;

    pid_t pid() const;
    // Exit status, or 128 + signal number when killed; -1 while running.
    int exitCode() const;

private:
    bool reapLocked(bool block);
    void signalLocked(int sig);

    mutable std::mutex mutex_;
    pid_t pid_{-1};
    bool exited_{false};
    int exitCode_{-1};
    UniqueFd outFd_;
    std::string tail_;
};

// Last non-empty output line, skipping startup banners such as
// "Config file ... not found - using defaults".
std::string lastMeaningfulLine(const std::string& output);

} // namespace romfetch
