#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace romfetch {

// Send entire buffer, handling short writes and EINTR.
bool sendAll(int fd, const char* data, size_t len);

struct ParsedHttpResponse {
    int statusCode{0};
    std::string statusText;
    bool hasContentLength{false};
    uint64_t contentLength{0};
    bool chunked{false};
    bool acceptRanges{false};
    std::string lastModified;
    std::string location;
    std::string headersRaw;
};

// Parse HTTP status line + headers (headerBlock excludes the trailing CRLFCRLF).
// Returns false and sets err on malformed input.
bool parseHttpResponseHeaders(const std::string& headerBlock, ParsedHttpResponse& out, std::string& err);

// Plain-socket request over http:// (no TLS). Fills the parsed status and body.
// Returns true when any HTTP response was received, including 4xx/5xx.
bool httpPlainRequest(const std::string& method,
                      const std::string& url,
                      const std::string& contentType,
                      const std::string& body,
                      int timeoutSec,
                      ParsedHttpResponse& outResp,
                      std::string& outBody,
                      std::string& err);

} // namespace romfetch
