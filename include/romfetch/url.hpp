#pragma once

#include <string>

namespace romfetch {

struct UrlParts {
    std::string scheme;   // lowercase, e.g. "https"
    std::string userinfo; // without the trailing '@'
    std::string host;     // lowercase
    int port{0};          // 0 when not given
    std::string path;     // without the leading '/'
    std::string query;    // without '?'
    std::string fragment; // without '#'
};

// Split an absolute http(s) URL. Returns false and sets err on malformed input.
bool parseUrl(const std::string& url, UrlParts& out, std::string& err);
std::string buildUrl(const UrlParts& parts);

// "scheme://[userinfo@]host[:port]/"
std::string urlOrigin(const UrlParts& parts);

// Lowercase host, or empty when the URL does not parse.
std::string hostOf(const std::string& url);

// Swap the host, keeping userinfo, port, path and query.
bool replaceHost(const std::string& url, const std::string& newHost, std::string& outUrl, std::string& err);

// Basename of dest when present, else the decoded last URL path segment, else "download.bin".
std::string filenameForJob(const std::string& url, const std::string& destPath);

} // namespace romfetch
