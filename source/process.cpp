#include "romfetch/process.hpp"
#include "romfetch/logger.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace romfetch {

ChildProcess::~ChildProcess() {
    bool alive = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alive = pid_ > 0 && !exited_;
    }
    if (alive) terminate(0);
}

bool ChildProcess::spawn(const std::vector<std::string>& argv, std::string& err) {
    if (argv.empty() || argv.front().empty()) {
        err = "spawn failed: empty command";
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0 && !exited_) {
        err = "spawn failed: process already running";
        return false;
    }

    UniqueFd readEnd;
    UniqueFd writeEnd;
    if (!makePipe(readEnd, writeEnd, true, err)) {
        err = "spawn failed: " + err;
        return false;
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argvStorage(argv);
    std::vector<char*> argvPtrs;
    argvPtrs.reserve(argvStorage.size() + 1);
    for (auto& value : argvStorage) argvPtrs.push_back(value.data());
    argvPtrs.push_back(nullptr);
    const std::string execFailMsg = "spawn failed: could not execute " + argvStorage.front() + "\n";

    pid_t child = ::fork();
    if (child < 0) {
        err = std::string("spawn failed: fork: ") + std::strerror(errno);
        return false;
    }
    if (child == 0) {
        ::setpgid(0, 0);
        const int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            if (devNull > STDERR_FILENO) ::close(devNull);
        }
        ::dup2(writeEnd.fd, STDOUT_FILENO);
        ::dup2(writeEnd.fd, STDERR_FILENO);
        ::execv(argvStorage.front().c_str(), argvPtrs.data());
        ssize_t ignored = ::write(STDERR_FILENO, execFailMsg.data(), execFailMsg.size());
        (void)ignored;
        _exit(127);
    }

    ::setpgid(child, child); // also done by the child; whichever runs first wins
    pid_ = child;
    exited_ = false;
    exitCode_ = -1;
    tail_.clear();
    outFd_ = std::move(readEnd);
    return true;
}

bool ChildProcess::reapLocked(bool block) {
    if (pid_ <= 0 || exited_) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == 0) return false;
    if (r < 0) {
        // Already reaped elsewhere (ECHILD); nothing left to wait for.
        exited_ = true;
        exitCode_ = -1;
        return true;
    }
    exited_ = true;
    if (WIFEXITED(status)) exitCode_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exitCode_ = 128 + WTERMSIG(status);
    else exitCode_ = -1;
    return true;
}

void ChildProcess::signalLocked(int sig) {
    if (pid_ <= 0 || exited_) return;
    if (::kill(-pid_, sig) != 0) ::kill(pid_, sig);
}

bool ChildProcess::running() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) return false;
    return !reapLocked(false);
}

bool ChildProcess::waitFor(int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true) {
        if (!running()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void ChildProcess::terminate(int graceMs) {
    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_ <= 0 || exited_) return;
        pid = pid_;
        signalLocked(SIGTERM);
    }
    if (graceMs > 0 && waitFor(graceMs)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) return;
    logDebug("pid " + std::to_string(pid) + " ignored SIGTERM; sending SIGKILL", "PROC");
    signalLocked(SIGKILL);
    reapLocked(true);
}

void ChildProcess::drainOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!outFd_) return;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(outFd_.fd, buf, sizeof(buf));
        if (n > 0) {
            tail_.append(buf, static_cast<size_t>(n));
            if (tail_.size() > kMaxTailBytes) tail_.erase(0, tail_.size() - kMaxTailBytes);
            continue;
        }
        if (n == 0) {
            outFd_.reset();
            return;
        }
        if (errno == EINTR) continue;
        return; // EAGAIN: nothing more for now
    }
}

std::string ChildProcess::outputTail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tail_;
}

pid_t ChildProcess::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

int ChildProcess::exitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_ ? exitCode_ : -1;
}

std::string lastMeaningfulLine(const std::string& output) {
    std::string best;
    size_t start = 0;
    while (start <= output.size()) {
        size_t end = output.find_first_of("\r\n", start);
        std::string line = output.substr(start, end == std::string::npos ? std::string::npos : end - start);
        size_t b = line.find_first_not_of(" \t");
        size_t e = line.find_last_not_of(" \t");
        line = (b == std::string::npos) ? std::string() : line.substr(b, e - b + 1);
        bool banner = line.find("Config file") != std::string::npos && line.find("using defaults") != std::string::npos;
        if (!line.empty() && !banner) best = line;
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return best;
}

} // namespace romfetch
