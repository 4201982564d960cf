#include "romfetch/provider.hpp"
#include "romfetch/errors.hpp"
#include "romfetch/util.hpp"
#include <cctype>

namespace romfetch {

ProviderTopology::ProviderTopology(const Config& cfg)
    : domain_(toLowerCopy(cfg.providerDomain)),
      canonicalHost_(toLowerCopy(cfg.canonicalHost)),
      edgeCount_(cfg.edgeHostCount > 0 ? cfg.edgeHostCount : 1) {}

bool ProviderTopology::isProviderHost(const std::string& host) const {
    const std::string h = toLowerCopy(host);
    if (h.empty()) return false;
    if (h == canonicalHost_ || h == domain_) return true;
    return util::endsWith(h, "." + domain_);
}

int ProviderTopology::edgeIndex(const std::string& host) const {
    const std::string h = toLowerCopy(host);
    const std::string suffix = "." + domain_;
    if (h.size() < 2 + suffix.size() || h[0] != 'f' || !util::endsWith(h, suffix)) return 0;
    const std::string digits = h.substr(1, h.size() - 1 - suffix.size());
    if (digits.empty() || digits.size() > 4) return 0;
    int n = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
        n = n * 10 + (c - '0');
    }
    return n;
}

std::string ProviderTopology::edgeHost(int n) const {
    return "f" + std::to_string(n) + "." + domain_;
}

std::vector<std::string> ProviderTopology::hopRotation(const std::string& referenceHost) const {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(edgeCount_) + 1);
    const int ref = edgeIndex(referenceHost);
    if (ref > 0) {
        // Start just after the failed edge and wrap around.
        for (int k = 1; k <= edgeCount_; ++k) out.push_back(edgeHost(((ref - 1 + k) % edgeCount_) + 1));
    } else {
        for (int k = 1; k <= edgeCount_; ++k) out.push_back(edgeHost(k));
    }
    out.push_back(canonicalHost_);
    return out;
}

} // namespace romfetch
