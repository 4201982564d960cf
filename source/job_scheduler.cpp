#include "romfetch/job_scheduler.hpp"
#include "romfetch/logger.hpp"
#include "romfetch/transfer_chain.hpp"
#include "romfetch/url.hpp"
#include <utility>

namespace romfetch {

JobScheduler::JobScheduler(const Config& cfg, ProbeFn probe)
    : cfg_(cfg),
      emitter_(state_),
      resolver_(cfg),
      policy_(cfg),
      executor_(cfg, state_, emitter_, resolver_, probe ? std::move(probe) : makeHttpProbe(cfg)) {
    const int n = cfg_.workers > 0 ? cfg_.workers : 1;
    workers_.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) workers_.emplace_back(&JobScheduler::workerLoop, this);
    logDebug("Scheduler started with " + std::to_string(n) + " workers", "SCHED");
}

JobScheduler::~JobScheduler() {
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        stopping_ = true;
    }
    halt();
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

TransferResult JobScheduler::haltedResult(const TransferJob& job) {
    TransferResult r;
    r.url = job.url;
    r.destPath = job.destPath;
    r.filename = job.filename;
    r.status = JobStatus::Halted;
    return r;
}

JobHandle JobScheduler::submit(const std::string& url, const std::string& destPath, ProgressCallback onProgress) {
    auto queued = std::make_unique<QueuedJob>();
    queued->job.url = url;
    queued->job.originalUrl = url;
    queued->job.destPath = destPath;
    queued->job.filename = filenameForJob(url, destPath);
    queued->onProgress = std::move(onProgress);

    JobHandle handle;
    handle.filename = queued->job.filename;
    handle.result = queued->promise.get_future().share();

    bool rejected = false;
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        if (stopping_) {
            rejected = true;
        } else {
            if (state_.cancelRequested && running_ == 0 && queue_.empty()) {
                // Previous halt fully drained; start a fresh batch.
                state_.cancelRequested = false;
                state_.lastEmitted.clear();
                logInfo("Cleared halt flag for new batch", "SCHED");
            }
            queued->id = nextId_++;
            handle.id = queued->id;
            state_.registry[queued->id] = RegistryEntry{url, destPath, queued->job.filename, false};
        }
    }
    if (rejected) {
        queued->promise.set_value(haltedResult(queued->job));
        return handle;
    }

    queued->job.status = JobStatus::Queued;
    emitter_.emit(queued->onProgress, queued->job.filename, 0.0, "", JobStatus::Queued);
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        queue_.push_back(std::move(queued));
    }
    cv_.notify_one();
    return handle;
}

void JobScheduler::finishJob(QueuedJob& queued, TransferResult result) {
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        state_.registry.erase(queued.id);
        if (running_ > 0) --running_;
    }
    // Registry is clean before the caller can observe completion.
    queued.promise.set_value(std::move(result));
}

void JobScheduler::workerLoop() {
    while (true) {
        std::unique_ptr<QueuedJob> queued;
        {
            std::unique_lock<std::mutex> lock(state_.mutex);
            cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break; // stopping
            queued = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
            auto it = state_.registry.find(queued->id);
            if (it != state_.registry.end()) it->second.started = true;
        }

        TransferResult result = runTransferChain(executor_, policy_, emitter_, queued->job, queued->onProgress,
                                                 chainInvocationCap(cfg_));
        finishJob(*queued, std::move(result));
    }
}

HaltSummary JobScheduler::halt() {
    HaltSummary summary;
    std::deque<std::unique_ptr<QueuedJob>> cancelled;
    std::vector<std::shared_ptr<ChildProcess>> processes;
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        state_.cancelRequested = true;
        cancelled.swap(queue_);
        for (const auto& q : cancelled) state_.registry.erase(q->id);
        summary.activeSignalled = static_cast<int>(running_);
        for (const auto& kv : state_.activeProcesses) processes.push_back(kv.second);
    }
    summary.cancelled = static_cast<int>(cancelled.size());

    for (auto& q : cancelled) {
        emitter_.emit(q->onProgress, q->job.filename, 0.0, "", JobStatus::Halted);
        q->promise.set_value(haltedResult(q->job));
    }
    for (auto& p : processes) p->terminate(cfg_.terminateGraceMs);

    if (summary.cancelled > 0 || summary.activeSignalled > 0) {
        logInfo("Halt: cancelled " + std::to_string(summary.cancelled) + " queued, signalled " +
                    std::to_string(summary.activeSignalled) + " active",
                "SCHED");
    }
    return summary;
}

size_t JobScheduler::activeCount() const {
    std::lock_guard<std::mutex> lock(state_.mutex);
    return running_;
}

size_t JobScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(state_.mutex);
    return queue_.size();
}

size_t JobScheduler::registrySize() const {
    std::lock_guard<std::mutex> lock(state_.mutex);
    return state_.registry.size();
}

bool JobScheduler::cancelRequested() const {
    std::lock_guard<std::mutex> lock(state_.mutex);
    return state_.cancelRequested;
}

} // namespace romfetch
