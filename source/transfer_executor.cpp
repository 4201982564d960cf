#include "romfetch/transfer_executor.hpp"
#include "romfetch/filesystem.hpp"
#include "romfetch/logger.hpp"
#include "romfetch/process.hpp"
#include "romfetch/raii.hpp"
#include "romfetch/url.hpp"
#include "romfetch/util.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

namespace romfetch {

TransferExecutor::TransferExecutor(const Config& cfg,
                                   EngineState& state,
                                   ProgressEmitter& emitter,
                                   TransportResolver& resolver,
                                   ProbeFn probe)
    : cfg_(cfg), state_(state), emitter_(emitter), resolver_(resolver), probe_(std::move(probe)), builder_(cfg) {}

TransferResult TransferExecutor::halted(TransferJob& job, TransferResult result, const ProgressCallback& cb) {
    job.status = JobStatus::Halted;
    result.status = JobStatus::Halted;
    emitter_.emit(cb, job.filename, job.percentFloor, "", JobStatus::Halted);
    logInfo("Halted " + job.filename, "DL");
    return result;
}

TransferResult TransferExecutor::failed(TransferJob& job, TransferResult result, const std::string& error) {
    job.status = JobStatus::Error;
    result.status = JobStatus::Error;
    result.error = error;
    return result;
}

bool TransferExecutor::resolveExecutable(TransferJob& job, std::string& outExe, std::string& err) {
    if (job.transport != TransportKind::Native) {
        if (resolver_.resolve(outExe, err)) return true;
        if (!cfg_.enableNativeFallback) return false;
        logWarn(err + "; switching " + job.filename + " to native client", "DL");
        job.transport = TransportKind::Native;
        err.clear();
    }
#ifdef _WIN32
    const std::string client = "powershell.exe";
#else
    const std::string client = cfg_.nativeClient;
#endif
    outExe = findOnPath(client);
    if (outExe.empty()) {
        err = client + " binary not found (native fallback client)";
        return false;
    }
    return true;
}

TransferResult TransferExecutor::run(TransferJob& job, const ProgressCallback& cb) {
    TransferResult result;
    result.url = job.url;
    result.destPath = job.destPath;
    if (job.filename.empty()) job.filename = filenameForJob(job.url, job.destPath);
    result.filename = job.filename;
    result.attempts = job.attempt + 1;

    if (CancelToken(state_).isSet()) return halted(job, result, cb);

    if (!ensureParentDirectory(job.destPath)) {
        return failed(job, result, "write failed: cannot create directory for " + job.destPath);
    }
    job.localBytes = fileSizeOnDisk(job.destPath);

    if (!job.probed) {
        job.probed = true;
        RemoteMetadata meta = probe_ ? probe_(job.url) : RemoteMetadata{};
        if (meta.notFound()) {
            logWarn("Probe says " + job.url + " is gone: " + meta.error, "PROBE");
            return failed(job, result, meta.error);
        }
        if (!meta.ok()) {
            logDebug("Probe failed, continuing without remote size: " + meta.error, "PROBE");
        } else if (meta.remoteSize) {
            job.remoteSize = meta.remoteSize;
        }
    }
    result.remoteSize = job.remoteSize;

    if (job.remoteSize && *job.remoteSize > 0) {
        const uint64_t remote = *job.remoteSize;
        if (job.localBytes == remote) {
            logInfo("Skip " + job.filename + ": local size matches remote (" + std::to_string(remote) + " bytes)", "DL");
            job.status = JobStatus::Done;
            result.status = JobStatus::Done;
            result.skipped = true;
            result.bytes = remote;
            result.transport = "skip";
            job.percentFloor = 100.0;
            emitter_.emit(cb, job.filename, 100.0, "", JobStatus::Done);
            return result;
        }
        if (job.localBytes > 0) {
            result.resumed = true;
            double initial = static_cast<double>(std::min(job.localBytes, remote)) / static_cast<double>(remote) * 100.0;
            job.percentFloor = std::max(job.percentFloor, std::min(100.0, initial));
        }
    }

    std::string exe;
    std::string err;
    if (!resolveExecutable(job, exe, err)) return failed(job, result, err);
    if (job.transport != TransportKind::Native) job.transport = builder_.primaryKindFor(job.url);
    result.transport = transportKindLabel(job.transport);

    CommandSpec spec;
    spec.kind = job.transport;
    spec.url = job.url;
    spec.destPath = job.destPath;
    spec.troubleshoot = job.troubleshoot;
    std::vector<std::string> args;
    if (!builder_.build(exe, spec, args, err)) return failed(job, result, err);

    auto proc = std::make_shared<ChildProcess>();
    bool cancelled = false;
    bool spawned = withStateLock(state_, [&]() {
        // Spawn and register under the lock so halt() either sees the process or
        // the process never starts.
        if (state_.cancelRequested) {
            cancelled = true;
            return false;
        }
        if (!proc->spawn(args, err)) return false;
        state_.activeProcesses[job.destPath] = proc;
        return true;
    });
    if (cancelled) return halted(job, result, cb);
    if (!spawned) return failed(job, result, err);

    auto unregister = make_scope_guard([&]() {
        withStateLock(state_, [&]() {
            auto it = state_.activeProcesses.find(job.destPath);
            if (it != state_.activeProcesses.end() && it->second == proc) state_.activeProcesses.erase(it);
        });
    });

    logInfo("Start " + job.filename + " via " + result.transport + (job.troubleshoot ? " (troubleshoot)" : "") +
                " attempt " + std::to_string(job.attempt + 1),
            "DL");
    logDebug("pid " + std::to_string(proc->pid()) + ": " + util::joinArgs(args), "DL");

    job.status = JobStatus::Downloading;
    emitter_.emit(cb, job.filename, job.percentFloor, "", JobStatus::Downloading);

    ThroughputWindow window;
    double percent = job.percentFloor;
    bool haltedMidFlight = false;
    const auto pollInterval = std::chrono::milliseconds(cfg_.pollIntervalMs);

    while (true) {
        proc->drainOutput();
        if (!proc->running()) break;
        if (CancelToken(state_).isSet()) {
            proc->terminate(cfg_.terminateGraceMs);
            haltedMidFlight = true;
            break;
        }
        const uint64_t bytes = fileSizeOnDisk(job.destPath);
        window.push(std::chrono::steady_clock::now(), bytes);
        if (job.remoteSize && *job.remoteSize > 0) {
            double computed = static_cast<double>(bytes) / static_cast<double>(*job.remoteSize) * 100.0;
            percent = std::max(percent, std::min(100.0, computed));
        }
        emitter_.emit(cb, job.filename, percent, formatSpeed(window.bytesPerSecond()), JobStatus::Downloading);
        std::this_thread::sleep_for(pollInterval);
    }
    job.percentFloor = percent;

    proc->drainOutput();
    result.bytes = fileSizeOnDisk(job.destPath);
    result.exitCode = proc->exitCode();

    // halt() may have killed the child directly between two ticks.
    if (!haltedMidFlight && result.exitCode != 0 && CancelToken(state_).isSet()) haltedMidFlight = true;
    if (haltedMidFlight) return halted(job, result, cb);

    if (result.exitCode == 0) {
        job.status = JobStatus::Done;
        job.percentFloor = 100.0;
        result.status = JobStatus::Done;
        emitter_.emit(cb, job.filename, 100.0, "", JobStatus::Done);
        logInfo("Done " + job.filename + " (" + std::to_string(result.bytes) + " bytes)", "DL");
        return result;
    }

    std::string diagnostic = lastMeaningfulLine(proc->outputTail());
    if (diagnostic.empty()) {
        diagnostic = std::string(transportKindLabel(job.transport)) + " exited with code " + std::to_string(result.exitCode);
    }
    logWarn(job.filename + " attempt " + std::to_string(job.attempt + 1) + " failed (exit " +
                std::to_string(result.exitCode) + "): " + diagnostic,
            "DL");
    return failed(job, result, diagnostic);
}

} // namespace romfetch
