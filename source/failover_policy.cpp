#include "romfetch/failover_policy.hpp"
#include "romfetch/errors.hpp"
#include "romfetch/logger.hpp"
#include "romfetch/url.hpp"
#include <cctype>
#include <set>

namespace romfetch {

const char* failoverActionLabel(FailoverAction a) {
    switch (a) {
        case FailoverAction::GiveUp: return "give_up";
        case FailoverAction::RetrySameWithTroubleshoot: return "retry_profile";
        case FailoverAction::RetryMirror: return "retry_mirror";
        case FailoverAction::RetryHostHop: return "retry_host_hop";
        case FailoverAction::RetryFallbackTransport: return "retry_fallback_transport";
        default: return "unknown";
    }
}

FailoverPolicy::FailoverPolicy(const Config& cfg)
    : topology_(cfg), maxAttempts_(cfg.maxAttempts), fallbackEnabled_(cfg.enableNativeFallback) {}

std::string FailoverPolicy::extractErrorUrl(const std::string& message) {
    for (const char* verb : {"Get", "Head"}) {
        const std::string v(verb);
        size_t pos = 0;
        while ((pos = message.find(v, pos)) != std::string::npos) {
            size_t i = pos + v.size();
            bool boundary = pos == 0 || !std::isalnum(static_cast<unsigned char>(message[pos - 1]));
            size_t ws = i;
            while (ws < message.size() && (message[ws] == ' ' || message[ws] == '\t')) ++ws;
            if (boundary && ws > i && ws < message.size() && message[ws] == '"') {
                size_t close = message.find('"', ws + 1);
                if (close != std::string::npos && close > ws + 1) return message.substr(ws + 1, close - ws - 1);
            }
            pos = i;
        }
    }
    return {};
}

std::string FailoverPolicy::canonicalize(const std::string& url) const {
    const std::string host = hostOf(url);
    if (!topology_.isEdgeHost(host)) return url;
    std::string out;
    std::string err;
    if (!replaceHost(url, topology_.canonicalHost(), out, err)) return url;
    return out;
}

std::string FailoverPolicy::nextUntriedHost(const TransferJob& job, const std::string& errorMessage) const {
    const std::string currentHost = hostOf(job.url);
    std::string referenceHost = hostOf(extractErrorUrl(errorMessage));
    if (referenceHost.empty()) referenceHost = currentHost;

    std::set<std::string> tried = job.triedHosts;
    tried.insert(currentHost);
    tried.insert(referenceHost);
    for (const auto& candidate : topology_.hopRotation(referenceHost)) {
        if (tried.count(candidate) == 0) return candidate;
    }
    return {};
}

NextAction FailoverPolicy::decide(const TransferJob& job, const std::string& errorMessage, int attempt) const {
    NextAction out;
    out.url = job.url;
    out.failedHost = hostOf(extractErrorUrl(errorMessage));

    const ErrorInfo info = classifyError(errorMessage);
    if (!info.retryable) {
        out.reason = std::string("non-retryable ") + errorCodeLabel(info.code);
        return out;
    }
    if (job.transport == TransportKind::Native) {
        out.reason = "fallback transport failed";
        return out;
    }

    const std::string host = hostOf(job.url);
    const bool provider = topology_.isProviderHost(host);
    const bool edge = topology_.isEdgeHost(host);

    if (attempt == 0 && !job.troubleshoot && provider && !edge) {
        out.action = FailoverAction::RetrySameWithTroubleshoot;
        out.reason = std::string("first attempt ") + errorCodeLabel(info.code);
        return out;
    }

    if (attempt == 0 && edge) {
        std::string mirror;
        std::string err;
        const std::string canonical = topology_.canonicalHost();
        if (job.triedHosts.count(canonical) == 0 && replaceHost(job.url, canonical, mirror, err)) {
            out.action = FailoverAction::RetryMirror;
            out.url = mirror;
            out.reason = "edge host " + host + " failed";
            return out;
        }
    }

    bool rotationExhausted = false;
    if (attempt < maxAttempts_ && provider) {
        const std::string next = nextUntriedHost(job, errorMessage);
        std::string hopUrl;
        std::string err;
        if (!next.empty() && replaceHost(job.url, next, hopUrl, err)) {
            out.action = FailoverAction::RetryHostHop;
            out.url = hopUrl;
            out.reason = "attempt " + std::to_string(attempt + 1) + "/" + std::to_string(maxAttempts_);
            return out;
        }
        rotationExhausted = true;
    }

    if ((attempt >= maxAttempts_ || rotationExhausted) && provider && fallbackEnabled_) {
        std::string source = extractErrorUrl(errorMessage);
        if (hostOf(source).empty()) source = job.url;
        out.action = FailoverAction::RetryFallbackTransport;
        out.url = canonicalize(source);
        out.reason = rotationExhausted ? "host rotation exhausted" : "attempts exhausted";
        return out;
    }

    out.reason = provider ? "attempts exhausted" : "no alternate route";
    return out;
}

bool FailoverPolicy::apply(const NextAction& next, TransferJob& job) const {
    if (!next.failedHost.empty()) job.triedHosts.insert(next.failedHost);
    switch (next.action) {
        case FailoverAction::GiveUp:
            return false;
        case FailoverAction::RetrySameWithTroubleshoot:
            job.troubleshoot = true;
            break;
        case FailoverAction::RetryMirror:
        case FailoverAction::RetryHostHop:
            job.url = next.url;
            job.troubleshoot = true;
            break;
        case FailoverAction::RetryFallbackTransport:
            job.url = next.url;
            job.transport = TransportKind::Native;
            break;
    }
    job.attempt += 1;
    return true;
}

} // namespace romfetch
