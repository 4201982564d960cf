#include "romfetch/url.hpp"
#include "romfetch/errors.hpp"
#include "romfetch/util.hpp"
#include <cstdlib>
#include <filesystem>

namespace romfetch {

bool parseUrl(const std::string& url, UrlParts& out, std::string& err) {
    out = UrlParts{};
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        err = "Invalid URL (missing scheme): " + url;
        return false;
    }
    out.scheme = toLowerCopy(url.substr(0, schemeEnd));
    if (out.scheme != "http" && out.scheme != "https") {
        err = "Unsupported protocol '" + out.scheme + "' in " + url;
        return false;
    }

    size_t authStart = schemeEnd + 3;
    size_t authEnd = url.find_first_of("/?#", authStart);
    std::string authority = url.substr(authStart, authEnd == std::string::npos ? std::string::npos : authEnd - authStart);
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        out.userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    std::string hostPart = authority;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            err = "Invalid URL (unterminated IPv6 host): " + url;
            return false;
        }
        hostPart = authority.substr(0, close + 1);
        std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                err = "Invalid URL (bad authority): " + url;
                return false;
            }
            authority = rest;
        } else {
            authority.clear();
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            hostPart = authority.substr(0, colon);
            authority = authority.substr(colon);
        } else {
            authority.clear();
        }
    }
    if (!authority.empty()) {
        std::string portStr = authority.substr(1);
        char* end = nullptr;
        long p = std::strtol(portStr.c_str(), &end, 10);
        if (portStr.empty() || *end != '\0' || p <= 0 || p > 65535) {
            err = "Invalid URL (bad port): " + url;
            return false;
        }
        out.port = static_cast<int>(p);
    }
    out.host = toLowerCopy(hostPart);
    if (out.host.empty()) {
        err = "Invalid URL (missing host): " + url;
        return false;
    }

    if (authEnd == std::string::npos) return true;
    std::string rest = url.substr(authEnd);
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        out.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    auto q = rest.find('?');
    if (q != std::string::npos) {
        out.query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }
    if (!rest.empty() && rest.front() == '/') rest.erase(rest.begin());
    out.path = rest;
    return true;
}

std::string urlOrigin(const UrlParts& parts) {
    std::string out = parts.scheme + "://";
    if (!parts.userinfo.empty()) out += parts.userinfo + "@";
    out += parts.host;
    if (parts.port > 0) out += ":" + std::to_string(parts.port);
    out += "/";
    return out;
}

std::string buildUrl(const UrlParts& parts) {
    std::string out = urlOrigin(parts) + parts.path;
    if (!parts.query.empty()) out += "?" + parts.query;
    if (!parts.fragment.empty()) out += "#" + parts.fragment;
    return out;
}

std::string hostOf(const std::string& url) {
    UrlParts parts;
    std::string err;
    if (!parseUrl(url, parts, err)) return {};
    return parts.host;
}

bool replaceHost(const std::string& url, const std::string& newHost, std::string& outUrl, std::string& err) {
    UrlParts parts;
    if (!parseUrl(url, parts, err)) return false;
    if (newHost.empty()) {
        err = "Invalid URL (empty replacement host)";
        return false;
    }
    parts.host = toLowerCopy(newHost);
    outUrl = buildUrl(parts);
    return true;
}

std::string filenameForJob(const std::string& url, const std::string& destPath) {
    if (!destPath.empty()) {
        std::string name = std::filesystem::path(destPath).filename().string();
        if (!name.empty()) return name;
    }
    UrlParts parts;
    std::string err;
    if (parseUrl(url, parts, err)) {
        std::string path = parts.path;
        while (!path.empty() && path.back() == '/') path.pop_back();
        auto slash = path.rfind('/');
        std::string tail = util::urlDecode(slash == std::string::npos ? path : path.substr(slash + 1));
        if (!tail.empty()) return tail;
    }
    return "download.bin";
}

} // namespace romfetch
