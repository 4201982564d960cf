#pragma once

#include "romfetch/config.hpp"
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>

namespace romfetch {

struct RemoteMetadata {
    int httpStatus{0};
    std::optional<uint64_t> remoteSize;
    std::optional<std::time_t> lastModified;
    // Empty on success. Set for transport failures and HTTP >= 400.
    std::string error;

    bool ok() const { return error.empty(); }
    // 404/410: the file is gone; no transport will do better.
    bool notFound() const { return httpStatus == 404 || httpStatus == 410; }
};

using ProbeFn = std::function<RemoteMetadata(const std::string& url)>;

// Single HEAD request with a short timeout; never retries.
class RemoteMetadataProbe {
public:
    explicit RemoteMetadataProbe(const Config& cfg);

    RemoteMetadata probe(const std::string& url) const;

private:
    int timeoutSeconds_;
    std::string userAgent_;
};

// Wrap a RemoteMetadataProbe as the injectable probe function.
ProbeFn makeHttpProbe(const Config& cfg);

// Parse an RFC 7231 date ("Sun, 06 Nov 1994 08:49:37 GMT").
std::optional<std::time_t> parseHttpDate(const std::string& value);

} // namespace romfetch
