#pragma once

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <unistd.h>
#include <utility>

namespace romfetch {

struct UniqueFd {
    int fd{-1};
    UniqueFd() = default;
    explicit UniqueFd(int f) : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.fd);
            other.fd = -1;
        }
        return *this;
    }

    void reset(int newFd = -1) {
        if (fd >= 0 && fd != newFd) ::close(fd);
        fd = newFd;
    }

    int release() {
        int out = fd;
        fd = -1;
        return out;
    }

    int get() const { return fd; }
    explicit operator bool() const { return fd >= 0; }
};

// Create a close-on-exec pipe; the read end is optionally non-blocking.
inline bool makePipe(UniqueFd& readEnd, UniqueFd& writeEnd, bool nonBlockingRead, std::string& err) {
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    for (int fd : fds) {
        int flags = ::fcntl(fd, F_GETFD);
        if (flags < 0 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != 0) {
            err = std::string("fcntl(FD_CLOEXEC) failed: ") + std::strerror(errno);
            return false;
        }
    }
    if (nonBlockingRead) {
        int fl = ::fcntl(readEnd.fd, F_GETFL);
        if (fl < 0 || ::fcntl(readEnd.fd, F_SETFL, fl | O_NONBLOCK) != 0) {
            err = std::string("fcntl(O_NONBLOCK) failed: ") + std::strerror(errno);
            return false;
        }
    }
    return true;
}

template <class F>
class ScopeGuard {
public:
    explicit ScopeGuard(F&& fn) : fn_(std::forward<F>(fn)) {}
    ~ScopeGuard() { if (active_) fn_(); }
    void dismiss() { active_ = false; }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    ScopeGuard(ScopeGuard&& other) noexcept
        : fn_(std::move(other.fn_)), active_(other.active_) {
        other.active_ = false;
    }

private:
    F fn_;
    bool active_{true};
};

template <class F>
ScopeGuard<F> make_scope_guard(F&& fn) {
    return ScopeGuard<F>(std::forward<F>(fn));
}

} // namespace romfetch
