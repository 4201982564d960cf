#include "romfetch/http_common.hpp"
#include "romfetch/raii.hpp"
#include "romfetch/url.hpp"
#include "romfetch/version.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace romfetch {

bool sendAll(int fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool parseHttpResponseHeaders(const std::string& headerBlock, ParsedHttpResponse& out, std::string& err) {
    out = ParsedHttpResponse{};
    auto firstCrLf = headerBlock.find("\r\n");
    std::string statusLine = headerBlock.substr(0, firstCrLf);
    if (!statusLine.empty() && statusLine.back() == '\r') statusLine.pop_back();
    if (statusLine.rfind("HTTP/", 0) != 0) {
        err = "Malformed HTTP response (bad status line)";
        return false;
    }
    std::istringstream sl(statusLine);
    std::string httpVer;
    sl >> httpVer >> out.statusCode;
    if (!sl || out.statusCode < 100 || out.statusCode > 999) {
        err = "Malformed HTTP response (bad status code)";
        return false;
    }
    std::getline(sl, out.statusText);
    if (!out.statusText.empty() && out.statusText.front() == ' ') out.statusText.erase(out.statusText.begin());
    if (firstCrLf == std::string::npos) return true;

    std::istringstream hs(headerBlock.substr(firstCrLf + 2));
    std::string line;
    std::ostringstream raw;
    bool firstHeader = true;
    while (std::getline(hs, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (!firstHeader) raw << "\r\n";
        raw << line;
        firstHeader = false;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = line.substr(0, colon);
        std::string val = line.substr(colon + 1);
        while (!val.empty() && (val.front() == ' ' || val.front() == '\t')) val.erase(val.begin());
        while (!val.empty() && (val.back() == ' ' || val.back() == '\t')) val.pop_back();
        std::string keyLower = key;
        for (auto& c : keyLower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        std::string valLower = val;
        for (auto& c : valLower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (keyLower == "content-length") {
            char* end = nullptr;
            unsigned long long n = std::strtoull(val.c_str(), &end, 10);
            if (!val.empty() && end && *end == '\0') {
                out.contentLength = static_cast<uint64_t>(n);
                out.hasContentLength = true;
            }
        } else if (keyLower == "transfer-encoding" && valLower.find("chunked") != std::string::npos) {
            out.chunked = true;
        } else if (keyLower == "accept-ranges" && valLower.find("bytes") != std::string::npos) {
            out.acceptRanges = true;
        } else if (keyLower == "last-modified") {
            out.lastModified = val;
        } else if (keyLower == "location") {
            out.location = val;
        }
    }
    out.headersRaw = raw.str();
    return true;
}

bool httpPlainRequest(const std::string& method,
                      const std::string& url,
                      const std::string& contentType,
                      const std::string& body,
                      int timeoutSec,
                      ParsedHttpResponse& outResp,
                      std::string& outBody,
                      std::string& err) {
    outResp = ParsedHttpResponse{};
    outBody.clear();
    UrlParts parts;
    if (!parseUrl(url, parts, err)) return false;
    if (parts.scheme != "http") {
        err = "https:// not supported for plain requests: " + url;
        return false;
    }
    std::string portStr = std::to_string(parts.port > 0 ? parts.port : 80);

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    int ret = getaddrinfo(parts.host.c_str(), portStr.c_str(), &hints, &res);
    if (ret != 0 || !res) {
        err = "DNS lookup failed for host: " + parts.host + " (could not resolve)";
        if (res) freeaddrinfo(res);
        return false;
    }
    auto freeRes = make_scope_guard([&]() { freeaddrinfo(res); });

    UniqueFd sockFd;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        UniqueFd candidate(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!candidate) continue;
        if (timeoutSec > 0) {
            timeval tv{};
            tv.tv_sec = timeoutSec;
            tv.tv_usec = 0;
            setsockopt(candidate.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(candidate.fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }
        if (connect(candidate.fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            sockFd = std::move(candidate);
            break;
        }
    }
    if (!sockFd) {
        err = "Connect failed: connection refused by " + parts.host + ":" + portStr;
        return false;
    }

    std::ostringstream req;
    req << method << " /" << parts.path;
    if (!parts.query.empty()) req << "?" << parts.query;
    req << " HTTP/1.1\r\n";
    req << "Host: " << parts.host;
    if (parts.port > 0) req << ":" << parts.port;
    req << "\r\n";
    req << "User-Agent: " << productToken() << "\r\n";
    req << "Connection: close\r\n";
    if (!contentType.empty()) req << "Content-Type: " << contentType << "\r\n";
    if (!body.empty() || method == "POST") req << "Content-Length: " << body.size() << "\r\n";
    req << "\r\n";
    req << body;
    std::string reqStr = req.str();
    if (!sendAll(sockFd.fd, reqStr.data(), reqStr.size())) {
        err = "Send failed";
        return false;
    }

    std::string raw;
    char buf[8192];
    while (true) {
        ssize_t n = recv(sockFd.fd, buf, sizeof(buf), 0);
        if (n > 0) {
            raw.append(buf, buf + n);
        } else if (n == 0) {
            break;
        } else {
            if (errno == EINTR) continue;
            // A server that answered but kept the socket open still counts.
            if (raw.find("\r\n\r\n") != std::string::npos) break;
            err = "Recv failed or timed out";
            return false;
        }
    }

    auto hdrEnd = raw.find("\r\n\r\n");
    if (hdrEnd == std::string::npos) {
        err = raw.empty() ? "Empty HTTP response" : "Malformed HTTP response (no header/body separator)";
        return false;
    }
    if (!parseHttpResponseHeaders(raw.substr(0, hdrEnd), outResp, err)) return false;
    outBody = raw.substr(hdrEnd + 4);
    return true;
}

} // namespace romfetch
