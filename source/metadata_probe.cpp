#include "romfetch/metadata_probe.hpp"
#include "romfetch/http_common.hpp"
#include "romfetch/logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace romfetch {

namespace {

std::once_flag gCurlInitOnce;

struct CurlEasyDeleter {
    void operator()(CURL* h) const { if (h) curl_easy_cleanup(h); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Keeps only the header block of the final response in a redirect chain.
size_t onHeaderLine(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* block = static_cast<std::string*>(userdata);
    size_t n = size * nitems;
    std::string line(buffer, n);
    if (line.rfind("HTTP/", 0) == 0) block->clear();
    block->append(line);
    return n;
}

} // namespace

std::optional<std::time_t> parseHttpDate(const std::string& value) {
    if (value.empty()) return std::nullopt;
    std::call_once(gCurlInitOnce, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    time_t t = curl_getdate(value.c_str(), nullptr);
    if (t < 0) return std::nullopt;
    return static_cast<std::time_t>(t);
}

RemoteMetadataProbe::RemoteMetadataProbe(const Config& cfg)
    : timeoutSeconds_(cfg.probeTimeoutSeconds),
      userAgent_(cfg.userAgent.empty() ? defaultUserAgent() : cfg.userAgent) {}

RemoteMetadata RemoteMetadataProbe::probe(const std::string& url) const {
    RemoteMetadata out;
    std::call_once(gCurlInitOnce, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        out.error = "curl_easy_init failed";
        return out;
    }
    std::string headerBlock;
    CurlSlistPtr headers(curl_slist_append(nullptr, "Accept: */*"));
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, onHeaderLine);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headerBlock);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        out.error = std::string("HEAD ") + url + " failed: " + curl_easy_strerror(rc);
        logDebug(out.error, "PROBE");
        return out;
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    out.httpStatus = static_cast<int>(status);
    if (status >= 400) {
        out.error = "HTTP " + std::to_string(status) + " (HEAD " + url + ")";
        logDebug(out.error, "PROBE");
        return out;
    }

    auto hdrEnd = headerBlock.find("\r\n\r\n");
    ParsedHttpResponse parsed;
    std::string parseErr;
    if (parseHttpResponseHeaders(headerBlock.substr(0, hdrEnd), parsed, parseErr)) {
        if (parsed.hasContentLength && parsed.contentLength > 0) out.remoteSize = parsed.contentLength;
        out.lastModified = parseHttpDate(parsed.lastModified);
    } else {
        logDebug("HEAD " + url + ": " + parseErr, "PROBE");
    }
    logDebug("HEAD " + url + " -> " + std::to_string(status) + " size=" +
                 (out.remoteSize ? std::to_string(*out.remoteSize) : std::string("?")),
             "PROBE");
    return out;
}

ProbeFn makeHttpProbe(const Config& cfg) {
    auto probe = std::make_shared<RemoteMetadataProbe>(cfg);
    return [probe](const std::string& url) { return probe->probe(url); };
}

} // namespace romfetch
