#include "romfetch/logger.hpp"
#include "romfetch/version.hpp"
#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace romfetch {

static constexpr size_t kMaxLogBytes = 512 * 1024;
static std::atomic<int> gMinLevel{static_cast<int>(LogLevel::Info)};
static std::mutex gLogMutex;
static std::string gLogPath;
static std::ofstream gLogFile;
static size_t gLogBytes = 0;
static bool gLogReady = false;

static void writeBanner(const char* suffix) {
    gLogFile << "romfetch " << appVersion() << " log start" << suffix << "\n";
    gLogFile.flush();
    gLogBytes = static_cast<size_t>(gLogFile.tellp());
}

bool initLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
    gLogPath = path;
    if (path.empty()) return true;

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        // ensureDirectory logs on failure; this lock is not reentrant.
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    gLogFile.open(path, std::ios::trunc);
    if (!gLogFile) return false;
    writeBanner("");
    gLogReady = true;
    return true;
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
}

void setLogLevel(LogLevel level) { gMinLevel = static_cast<int>(level); }

LogLevel logLevel() { return static_cast<LogLevel>(gMinLevel.load()); }

void setLogLevelFromString(const std::string& level) {
    std::string l;
    l.reserve(level.size());
    for (char c : level) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (l == "debug") setLogLevel(LogLevel::Debug);
    else if (l == "warn" || l == "warning") setLogLevel(LogLevel::Warn);
    else if (l == "error") setLogLevel(LogLevel::Error);
    else setLogLevel(LogLevel::Info);
}

static void rotateLocked() {
    if (gLogFile.is_open()) gLogFile.close();
    std::error_code ec;
    std::filesystem::path p(gLogPath);
    std::filesystem::path rotated = p;
    rotated += ".1";
    std::filesystem::remove(rotated, ec);
    ec.clear();
    std::filesystem::rename(p, rotated, ec); // best-effort
    gLogFile.open(gLogPath, std::ios::trunc);
    gLogBytes = 0;
    if (gLogFile) writeBanner(" (rotated)");
    else gLogReady = false;
}

static void logInternal(LogLevel level, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < gMinLevel.load()) return;
    std::string line = "[" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(gLogMutex);
    std::cerr << line << "\n";
    if (!gLogReady) return;

    size_t writeBytes = line.size() + 1;
    if (gLogBytes + writeBytes > kMaxLogBytes) rotateLocked();
    if (gLogReady && gLogFile) {
        gLogFile << line << "\n";
        gLogFile.flush();
        gLogBytes += writeBytes;
    }
}

void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

} // namespace romfetch
