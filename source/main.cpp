#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "romfetch/config.hpp"
#include "romfetch/engine.hpp"
#include "romfetch/handoff.hpp"
#include "romfetch/logger.hpp"
#include "romfetch/url.hpp"
#include "romfetch/util.hpp"
#include "romfetch/version.hpp"

using romfetch::Config;
using romfetch::DownloadTarget;

static volatile std::sig_atomic_t gInterrupted = 0;
static std::mutex gPrintMutex;

static void onSignal(int) { gInterrupted = 1; }

struct CliOptions {
    std::string configPath{".env"};
    std::string logLevel;
    std::string destDir{"."};
    std::string batchFile;
    bool fallback{false};
    bool handoff{false};
    bool check{false};
    bool showHelp{false};
    bool showVersion{false};
    std::vector<std::string> urls;
};

static void printUsage() {
    std::printf(
        "usage: romfetch [options] URL...\n"
        "  --config FILE     .env-style config (default .env)\n"
        "  --log-level L     debug|info|warn|error\n"
        "  --dest DIR        destination directory (default .)\n"
        "  --batch FILE      lines of 'URL<TAB>DEST' or 'URL'\n"
        "  --fallback        allow the native HTTP client fallback\n"
        "  --handoff         send the batch to a local download manager instead\n"
        "  --check           compare local files with remote metadata only\n"
        "  --version         print version\n");
}

static bool parseArgs(int argc, char** argv, CliOptions& opts, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto needValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                err = a + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };
        if (a == "--config") { if (!needValue(opts.configPath)) return false; }
        else if (a == "--log-level") { if (!needValue(opts.logLevel)) return false; }
        else if (a == "--dest") { if (!needValue(opts.destDir)) return false; }
        else if (a == "--batch") { if (!needValue(opts.batchFile)) return false; }
        else if (a == "--fallback") opts.fallback = true;
        else if (a == "--handoff") opts.handoff = true;
        else if (a == "--check") opts.check = true;
        else if (a == "-h" || a == "--help") opts.showHelp = true;
        else if (a == "--version") opts.showVersion = true;
        else if (romfetch::util::startsWith(a, "--")) {
            err = "unknown option " + a;
            return false;
        } else {
            opts.urls.push_back(a);
        }
    }
    return true;
}

static bool loadBatch(const std::string& path, const std::string& destDir, std::vector<DownloadTarget>& out, std::string& err) {
    std::ifstream f(path);
    if (!f) {
        err = "cannot open batch file " + path;
        return false;
    }
    std::string line;
    while (std::getline(f, line)) {
        line = romfetch::util::trimCopy(line);
        if (line.empty() || line[0] == '#') continue;
        auto tab = line.find('\t');
        DownloadTarget t;
        t.url = romfetch::util::trimCopy(line.substr(0, tab));
        if (tab != std::string::npos) t.destPath = romfetch::util::trimCopy(line.substr(tab + 1));
        if (t.destPath.empty()) {
            t.destPath = (std::filesystem::path(destDir) / romfetch::filenameForJob(t.url, "")).string();
        }
        out.push_back(t);
    }
    return true;
}

static void printProgress(const std::string& filename, double percent, const std::string& speed, romfetch::JobStatus status) {
    std::lock_guard<std::mutex> lock(gPrintMutex);
    std::printf("%-11s %6.1f%%  %-12s %s\n", romfetch::jobStatusLabel(status), percent,
                status == romfetch::JobStatus::Error ? "" : speed.c_str(), filename.c_str());
    if (status == romfetch::JobStatus::Error && !speed.empty()) std::printf("            %s\n", speed.c_str());
    std::fflush(stdout);
}

int main(int argc, char** argv) {
    CliOptions opts;
    std::string err;
    if (!parseArgs(argc, argv, opts, err)) {
        std::fprintf(stderr, "romfetch: %s\n", err.c_str());
        printUsage();
        return 2;
    }
    if (opts.showHelp) {
        printUsage();
        return 0;
    }
    if (opts.showVersion) {
        std::printf("%s %s\n", romfetch::kAppName, romfetch::appVersion());
        return 0;
    }

    Config cfg;
    if (!romfetch::loadConfig(opts.configPath, cfg, err)) {
        std::fprintf(stderr, "romfetch: %s\n", err.c_str());
        return 2;
    }
    if (opts.fallback) cfg.enableNativeFallback = true;
    if (!opts.logLevel.empty()) cfg.logLevel = opts.logLevel;
    romfetch::setLogLevelFromString(cfg.logLevel);
    if (!romfetch::initLogFile(cfg.logFile)) {
        romfetch::logWarn("Could not open log file " + cfg.logFile, "CLI");
    }

    std::vector<DownloadTarget> targets;
    if (!opts.batchFile.empty() && !loadBatch(opts.batchFile, opts.destDir, targets, err)) {
        std::fprintf(stderr, "romfetch: %s\n", err.c_str());
        return 2;
    }
    for (const auto& u : opts.urls) {
        targets.push_back(DownloadTarget{u, (std::filesystem::path(opts.destDir) / romfetch::filenameForJob(u, "")).string()});
    }
    if (targets.empty()) {
        printUsage();
        return 2;
    }

    if (opts.handoff) {
        std::vector<std::string> errors;
        romfetch::HandoffRequest req = romfetch::makeHandoffRequest(targets, true, "", errors);
        for (const auto& e : errors) romfetch::logWarn(e, "HANDOFF");
        romfetch::HandoffResult res;
        if (!romfetch::postHandoff(cfg.handoffEndpoint, req, 4, res, err)) {
            for (const auto& a : res.attempts) std::fprintf(stderr, "  %s\n", a.c_str());
            std::fprintf(stderr, "romfetch: %s\n", err.c_str());
            return 1;
        }
        std::printf("handed off %zu link(s) to %s\n", req.entries.size(), res.endpoint.c_str());
        return 0;
    }

    romfetch::DownloadEngine engine(cfg);

    if (opts.check) {
        int mismatches = 0;
        for (const auto& t : targets) {
            romfetch::RemoteFileCheck chk = engine.checkRemoteFile(t.url, t.destPath);
            std::string remote = chk.remoteSize ? std::to_string(*chk.remoteSize) : std::string("?");
            std::printf("%-9s local=%llu remote=%s %s%s%s\n", chk.sameSize ? "SAME" : "DIFF",
                        static_cast<unsigned long long>(chk.localSize), remote.c_str(), t.destPath.c_str(),
                        chk.error.empty() ? "" : "  ", chk.error.c_str());
            if (!chk.sameSize) ++mismatches;
        }
        return mismatches == 0 ? 0 : 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    romfetch::BatchSubmitResult batch = engine.submitBatch(targets, printProgress);
    for (const auto& e : batch.errors) std::fprintf(stderr, "romfetch: %s\n", e.c_str());
    if (batch.handles.empty()) return 1;

    bool halted = false;
    while (true) {
        bool allReady = true;
        for (const auto& h : batch.handles) {
            if (!h.ready()) {
                allReady = false;
                break;
            }
        }
        if (allReady) break;
        if (gInterrupted && !halted) {
            romfetch::HaltSummary s = engine.haltTraffic();
            romfetch::logWarn("Interrupted: cancelled " + std::to_string(s.cancelled) + ", signalled " +
                                  std::to_string(s.activeSignalled),
                              "CLI");
            halted = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    int failed = 0;
    int done = 0;
    for (const auto& h : batch.handles) {
        const romfetch::TransferResult& r = h.result.get();
        if (r.status == romfetch::JobStatus::Done) ++done;
        else if (r.status == romfetch::JobStatus::Error) ++failed;
    }
    romfetch::logInfo(std::to_string(done) + " done, " + std::to_string(failed) + " failed", "CLI");
    romfetch::closeLogFile();
    if (halted) return 130;
    return (failed == 0 && batch.errors.empty()) ? 0 : 1;
}
