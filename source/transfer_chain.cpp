#include "romfetch/transfer_chain.hpp"
#include "romfetch/logger.hpp"
#include "romfetch/url.hpp"
#include <exception>

namespace romfetch {

TransferResult runTransferChain(TransferExecutor& executor,
                                const FailoverPolicy& policy,
                                ProgressEmitter& emitter,
                                TransferJob job,
                                const ProgressCallback& cb,
                                int maxInvocations) {
    if (job.originalUrl.empty()) job.originalUrl = job.url;
    if (job.filename.empty()) job.filename = filenameForJob(job.url, job.destPath);

    std::string primaryError;
    TransferResult result;
    for (int invocation = 0;; ++invocation) {
        const std::string host = hostOf(job.url);
        if (!host.empty()) job.triedHosts.insert(host);

        try {
            result = executor.run(job, cb);
        } catch (const std::exception& e) {
            result = TransferResult{};
            result.url = job.url;
            result.destPath = job.destPath;
            result.filename = job.filename;
            result.status = JobStatus::Error;
            result.error = std::string("internal error: ") + e.what();
            job.status = JobStatus::Error;
            logError(job.filename + ": " + result.error, "DL");
        }
        result.attempts = invocation + 1;
        if (result.status != JobStatus::Error) return result;

        if (job.transport == TransportKind::Native && !primaryError.empty()) {
            result.error = primaryError + " | native fallback: " + result.error;
        }

        NextAction next;
        if (invocation + 1 >= maxInvocations) {
            next.reason = "attempt cap " + std::to_string(maxInvocations) + " reached";
        } else {
            next = policy.decide(job, result.error, job.attempt);
        }

        const std::string label = failoverActionLabel(next.action);
        if (next.action == FailoverAction::GiveUp) {
            logError(label + " " + job.filename + " after " + std::to_string(invocation + 1) +
                         " attempt(s) [" + next.reason + "]: " + result.error,
                     "FAILOVER");
            emitter.emit(cb, job.filename, job.percentFloor, result.error, JobStatus::Error);
            return result;
        }

        const std::string fromUrl = job.url;
        if (next.action == FailoverAction::RetryFallbackTransport) primaryError = result.error;
        policy.apply(next, job);

        std::string detail;
        switch (next.action) {
            case FailoverAction::RetrySameWithTroubleshoot:
                detail = "--disable-http2 --user-agent on " + host;
                break;
            case FailoverAction::RetryMirror:
            case FailoverAction::RetryHostHop:
                detail = hostOf(fromUrl) + " -> " + hostOf(job.url);
                break;
            case FailoverAction::RetryFallbackTransport:
                detail = "native client on " + job.url;
                break;
            case FailoverAction::GiveUp:
                break;
        }
        logWarn(label + " " + job.filename + " [" + next.reason + "]: " + detail, "FAILOVER");
    }
}

} // namespace romfetch
