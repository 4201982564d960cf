#include "romfetch/engine.hpp"
#include "romfetch/filesystem.hpp"
#include "romfetch/logger.hpp"
#include "romfetch/url.hpp"

namespace romfetch {

DownloadEngine::DownloadEngine(const Config& cfg, ProbeFn probe)
    : cfg_(cfg), probe_(probe ? std::move(probe) : makeHttpProbe(cfg)) {
    scheduler_ = std::make_unique<JobScheduler>(cfg_, probe_);
}

DownloadEngine::~DownloadEngine() {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduler_.reset();
    retired_.clear();
}

void DownloadEngine::reapRetiredLocked() {
    for (auto it = retired_.begin(); it != retired_.end();) {
        if ((*it)->activeCount() == 0 && (*it)->pendingCount() == 0) it = retired_.erase(it);
        else ++it;
    }
}

JobHandle DownloadEngine::submit(const std::string& url, const std::string& destPath, ProgressCallback onProgress) {
    std::lock_guard<std::mutex> lock(mutex_);
    reapRetiredLocked();
    return scheduler_->submit(url, destPath, std::move(onProgress));
}

BatchSubmitResult DownloadEngine::submitBatch(const std::vector<DownloadTarget>& targets, const ProgressCallback& onProgress) {
    BatchSubmitResult out;
    std::lock_guard<std::mutex> lock(mutex_);
    reapRetiredLocked();

    if (!cfg_.enableNativeFallback) {
        std::string exe;
        std::string err;
        if (!scheduler_->resolver().resolve(exe, err)) {
            logError(err, "SCHED");
            out.errors.push_back(err);
            return out;
        }
    }

    for (const auto& t : targets) {
        if (t.url.empty() || t.destPath.empty()) {
            out.errors.push_back("Skipping target with empty url or destination: '" + t.url + "'");
            continue;
        }
        UrlParts parts;
        std::string err;
        if (!parseUrl(t.url, parts, err)) {
            out.errors.push_back(err);
            continue;
        }
        out.handles.push_back(scheduler_->submit(t.url, t.destPath, onProgress));
    }
    logInfo("Queued " + std::to_string(out.handles.size()) + " of " + std::to_string(targets.size()) + " downloads",
            "SCHED");
    return out;
}

HaltSummary DownloadEngine::haltTraffic() {
    std::lock_guard<std::mutex> lock(mutex_);
    HaltSummary summary = scheduler_->halt();
    if (scheduler_->activeCount() > 0) {
        // Workers still unwinding; keep the old pool alive until they finish.
        retired_.push_back(std::move(scheduler_));
    } else {
        scheduler_.reset();
    }
    scheduler_ = std::make_unique<JobScheduler>(cfg_, probe_);
    reapRetiredLocked();
    return summary;
}

RemoteFileCheck DownloadEngine::checkRemoteFile(const std::string& url, const std::string& localPath) const {
    RemoteFileCheck out;
    out.exists = fileExists(localPath);
    out.localSize = fileSizeOnDisk(localPath);
    RemoteMetadata meta = probe_(url);
    out.error = meta.error;
    out.remoteSize = meta.remoteSize;
    out.remoteLastModified = meta.lastModified;
    out.sameSize = out.exists && meta.remoteSize && *meta.remoteSize == out.localSize;
    return out;
}

size_t DownloadEngine::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = scheduler_->activeCount();
    for (const auto& r : retired_) n += r->activeCount();
    return n;
}

size_t DownloadEngine::retiredCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_.size();
}

} // namespace romfetch
