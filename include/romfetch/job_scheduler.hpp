#pragma once

#include "romfetch/config.hpp"
#include "romfetch/engine_state.hpp"
#include "romfetch/failover_policy.hpp"
#include "romfetch/metadata_probe.hpp"
#include "romfetch/models.hpp"
#include "romfetch/progress.hpp"
#include "romfetch/transfer_executor.hpp"
#include "romfetch/transport_resolver.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace romfetch {

struct JobHandle {
    JobId id{0};
    std::string filename;
    std::shared_future<TransferResult> result;

    bool valid() const { return result.valid(); }
    bool ready() const {
        return valid() && result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

struct HaltSummary {
    int cancelled{0};
    int activeSignalled{0};
};

// Fixed-size worker pool running transfer chains. The pool size is a rate
// limit against the remote service.
class JobScheduler {
public:
    // probe defaults to a libcurl HEAD probe.
    explicit JobScheduler(const Config& cfg, ProbeFn probe = ProbeFn());
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    // Queue a job. Emits QUEUED before returning. Clears a previous halt when
    // nothing is queued or running.
    JobHandle submit(const std::string& url, const std::string& destPath, ProgressCallback onProgress = ProgressCallback());

    // Cancel queued jobs, flag running ones, terminate every tracked subprocess.
    HaltSummary halt();

    size_t activeCount() const;
    size_t pendingCount() const;
    // Jobs queued or running.
    size_t registrySize() const;
    bool cancelRequested() const;
    int workerCount() const { return static_cast<int>(workers_.size()); }

    TransportResolver& resolver() { return resolver_; }

private:
    struct QueuedJob {
        JobId id{0};
        TransferJob job;
        ProgressCallback onProgress;
        std::promise<TransferResult> promise;
    };

    void workerLoop();
    void finishJob(QueuedJob& queued, TransferResult result);
    static TransferResult haltedResult(const TransferJob& job);

    Config cfg_;
    EngineState state_;
    ProgressEmitter emitter_;
    TransportResolver resolver_;
    FailoverPolicy policy_;
    TransferExecutor executor_;

    // Guarded by state_.mutex.
    std::deque<std::unique_ptr<QueuedJob>> queue_;
    size_t running_{0};
    bool stopping_{false};
    JobId nextId_{1};

    std::condition_variable cv_;
    std::vector<std::thread> workers_;
};

} // namespace romfetch
