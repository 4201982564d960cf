#pragma once

#include "romfetch/config.hpp"
#include <string>
#include <vector>

namespace romfetch {

// Host naming of the mirrored provider: a canonical host plus numbered
// edge hosts f1..fN under one domain.
class ProviderTopology {
public:
    explicit ProviderTopology(const Config& cfg);

    bool isProviderHost(const std::string& host) const;
    // N for "f<N>.<domain>", 0 otherwise.
    int edgeIndex(const std::string& host) const;
    bool isEdgeHost(const std::string& host) const { return edgeIndex(host) > 0; }
    std::string edgeHost(int n) const;
    const std::string& canonicalHost() const { return canonicalHost_; }

    // Candidate order for a host hop away from referenceHost; canonical host last.
    std::vector<std::string> hopRotation(const std::string& referenceHost) const;

private:
    std::string domain_;
    std::string canonicalHost_;
    int edgeCount_;
};

} // namespace romfetch
