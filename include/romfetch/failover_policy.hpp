#pragma once

#include "romfetch/config.hpp"
#include "romfetch/models.hpp"
#include "romfetch/provider.hpp"
#include <string>

namespace romfetch {

enum class FailoverAction {
    GiveUp,
    RetrySameWithTroubleshoot,
    RetryMirror,
    RetryHostHop,
    RetryFallbackTransport
};

const char* failoverActionLabel(FailoverAction a);

struct NextAction {
    FailoverAction action{FailoverAction::GiveUp};
    // Target for the next attempt; equals the job's URL for RetrySameWithTroubleshoot.
    std::string url;
    // Host the tool reported as failing (`Get "<url>"`); recorded as tried by apply().
    std::string failedHost;
    std::string reason;
};

// Staged escalation after a failed attempt:
// troubleshoot profile -> canonical mirror -> edge host rotation -> native client.
class FailoverPolicy {
public:
    explicit FailoverPolicy(const Config& cfg);

    NextAction decide(const TransferJob& job, const std::string& errorMessage, int attempt) const;

    // Mutate the job for the chosen action and record the failed host in its
    // tried set. Returns false for GiveUp.
    bool apply(const NextAction& next, TransferJob& job) const;

    // URL quoted by the tool as `Get "<url>"` or `Head "<url>"`; empty when absent.
    static std::string extractErrorUrl(const std::string& message);

    // Edge-host URL rewritten onto the canonical host; other URLs unchanged.
    std::string canonicalize(const std::string& url) const;

    const ProviderTopology& topology() const { return topology_; }

private:
    std::string nextUntriedHost(const TransferJob& job, const std::string& errorMessage) const;

    ProviderTopology topology_;
    int maxAttempts_;
    bool fallbackEnabled_;
};

} // namespace romfetch
