#include "romfetch/handoff.hpp"
#include "romfetch/filesystem.hpp"
#include "romfetch/http_common.hpp"
#include "romfetch/logger.hpp"
#include "romfetch/url.hpp"
#include "romfetch/util.hpp"

namespace romfetch {

HandoffRequest makeHandoffRequest(const std::vector<DownloadTarget>& targets, bool autostart,
                                  const std::string& packageName, std::vector<std::string>& errors) {
    HandoffRequest req;
    req.autostart = autostart;
    if (!util::trimCopy(packageName).empty()) req.packageName = util::trimCopy(packageName);
    for (const auto& t : targets) {
        const std::string url = util::trimCopy(t.url);
        const std::string dest = util::trimCopy(t.destPath);
        if (url.empty() || dest.empty()) {
            errors.push_back("url and dest_path are required (url='" + url + "')");
            continue;
        }
        req.entries.push_back(HandoffEntry{url, dest, filenameForJob(url, dest)});
        if (req.referer.empty()) {
            UrlParts parts;
            std::string err;
            if (parseUrl(url, parts, err)) req.referer = parts.scheme + "://" + parts.host + "/";
        }
    }
    return req;
}

std::string buildHandoffForm(const HandoffRequest& req) {
    std::string urls;
    std::string descriptions;
    std::vector<std::string> dests;
    for (const auto& e : req.entries) {
        if (!urls.empty()) {
            urls += "\n";
            descriptions += "\n";
        }
        urls += e.url;
        descriptions += e.filename;
        dests.push_back(e.destPath);
    }

    std::vector<std::pair<std::string, std::string>> fields = {
        {"urls", urls},
        {"description", descriptions},
        {"autostart", req.autostart ? "1" : "0"},
        {"package", req.packageName},
        {"source", req.source},
        {"referer", req.referer},
    };
    const std::string dir = commonParentDirectory(dests);
    if (!dir.empty()) fields.emplace_back("dir", dir);

    std::string out;
    for (const auto& kv : fields) {
        if (!out.empty()) out += "&";
        out += util::urlEncode(kv.first) + "=" + util::urlEncode(kv.second);
    }
    return out;
}

std::vector<std::string> handoffEndpointCandidates(const std::string& endpoint) {
    std::vector<std::string> out;
    auto push = [&](const std::string& u) {
        for (const auto& e : out) {
            if (e == u) return;
        }
        out.push_back(u);
    };

    UrlParts parts;
    std::string err;
    std::string seed = util::trimCopy(endpoint);
    if (seed.empty() || !parseUrl(seed, parts, err)) {
        parseUrl("http://127.0.0.1:9666/flashgot", parts, err);
    }
    while (!parts.path.empty() && parts.path.back() == '/') parts.path.pop_back();
    if (parts.path.empty()) parts.path = "flashgot";
    else if (!util::endsWith(parts.path, "flashgot")) parts.path += "/flashgot";
    parts.query.clear();
    parts.fragment.clear();
    push(buildUrl(parts));

    if (parts.host == "127.0.0.1" || parts.host == "localhost") {
        UrlParts alt = parts;
        alt.host = parts.host == "localhost" ? "127.0.0.1" : "localhost";
        push(buildUrl(alt));
    }
    return out;
}

bool postHandoff(const std::string& endpoint, const HandoffRequest& req, int timeoutSec,
                 HandoffResult& out, std::string& err) {
    out = HandoffResult{};
    if (req.entries.empty()) {
        err = "no valid targets for hand-off";
        return false;
    }
    const std::string form = buildHandoffForm(req);
    logInfo("flashgot start count=" + std::to_string(req.entries.size()) +
                " autostart=" + (req.autostart ? "1" : "0"),
            "HANDOFF");

    for (const auto& candidate : handoffEndpointCandidates(endpoint)) {
        out.endpoint = candidate;
        ParsedHttpResponse resp;
        std::string body;
        std::string reqErr;
        if (!httpPlainRequest("POST", candidate, "application/x-www-form-urlencoded", form, timeoutSec, resp, body, reqErr)) {
            out.attempts.push_back(candidate + " -> " + reqErr);
            out.error = reqErr;
            continue;
        }
        out.statusCode = resp.statusCode;
        out.body = util::ellipsize(util::trimCopy(body), 4096);
        if (resp.statusCode < 400) {
            out.success = true;
            out.error.clear();
            logInfo("flashgot accepted " + std::to_string(req.entries.size()) + " link(s) at " + candidate, "HANDOFF");
            return true;
        }
        out.error = "HTTP " + std::to_string(resp.statusCode);
        out.attempts.push_back(candidate + " -> " + out.error);
    }
    err = "download manager hand-off failed: " + out.error;
    logError(err, "HANDOFF");
    return false;
}

} // namespace romfetch
