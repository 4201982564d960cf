#include "romfetch/command_builder.hpp"
#include "romfetch/errors.hpp"
#include "romfetch/url.hpp"
#include "romfetch/util.hpp"

namespace romfetch {

const char* transportKindLabel(TransportKind kind) {
    switch (kind) {
        case TransportKind::CopyUrl: return "copyurl";
        case TransportKind::HttpCopyTo: return "http-copyto";
        case TransportKind::Native: return "native";
        default: return "unknown";
    }
}

CommandBuilder::CommandBuilder(const Config& cfg) : cfg_(cfg), topology_(cfg) {
    if (cfg_.userAgent.empty()) cfg_.userAgent = defaultUserAgent();
}

TransportKind CommandBuilder::primaryKindFor(const std::string& url) const {
    return topology_.isProviderHost(hostOf(url)) ? TransportKind::HttpCopyTo : TransportKind::CopyUrl;
}

bool CommandBuilder::splitHttpRemote(const std::string& url, std::string& outRoot, std::string& outRel, std::string& err) {
    UrlParts parts;
    if (!parseUrl(url, parts, err)) return false;
    UrlParts rootParts = parts;
    rootParts.path.clear();
    rootParts.query.clear();
    rootParts.fragment.clear();
    std::string root = urlOrigin(rootParts);

    std::string path = parts.path;
    if (toLowerCopy(path).rfind("files/", 0) == 0) {
        root += path.substr(0, 6);
        path = path.substr(6);
    }
    std::string rel = util::urlDecode(path);
    if (rel.empty()) {
        err = "Invalid URL (empty relative path for HTTP remote): " + url;
        return false;
    }
    outRoot = root;
    outRel = rel;
    return true;
}

void CommandBuilder::appendCommonFlags(std::vector<std::string>& args, bool troubleshoot) const {
    // The engine owns retry policy; the tool gets exactly one try.
    args.insert(args.end(), {
        "--retries", "1",
        "--low-level-retries", "1",
        "--retries-sleep", std::to_string(cfg_.retriesSleepSeconds) + "s",
        "--contimeout", std::to_string(cfg_.connectTimeoutSeconds) + "s",
        "--timeout", std::to_string(cfg_.transferTimeoutSeconds) + "s",
        "--multi-thread-streams", "0",
    });
    if (troubleshoot) {
        args.insert(args.end(), {"--disable-http2", "--user-agent", cfg_.troubleshootUserAgent});
    }
}

bool CommandBuilder::buildNative(const std::string& executable, const CommandSpec& spec,
                                 std::vector<std::string>& outArgs, std::string& err) const {
    UrlParts parts;
    if (!parseUrl(spec.url, parts, err)) return false;
#ifdef _WIN32
    auto quote = [](const std::string& s) {
        std::string out = "'";
        for (char c : s) {
            if (c == '\'') out += "''";
            else out.push_back(c);
        }
        return out + "'";
    };
    std::string script = "$ProgressPreference='SilentlyContinue'; "
                         "Invoke-WebRequest -Uri " + quote(spec.url) +
                         " -OutFile " + quote(spec.destPath) +
                         " -Headers @{'User-Agent'=" + quote(cfg_.userAgent) + "}" +
                         " -TimeoutSec " + std::to_string(cfg_.transferTimeoutSeconds) +
                         " -MaximumRedirection 10 -UseBasicParsing";
    outArgs = {executable, "-NoProfile", "-ExecutionPolicy", "Bypass", "-Command", script};
#else
    outArgs = {
        executable,
        "--location",
        "--fail",
        "--silent",
        "--show-error",
        "--max-redirs", "10",
        "--connect-timeout", std::to_string(cfg_.connectTimeoutSeconds),
        // Stall detection rather than a whole-file deadline.
        "--speed-limit", "1",
        "--speed-time", std::to_string(cfg_.transferTimeoutSeconds),
        "--user-agent", spec.troubleshoot ? cfg_.troubleshootUserAgent : cfg_.userAgent,
        "--output", spec.destPath,
        spec.url,
    };
    if (spec.troubleshoot) outArgs.insert(outArgs.begin() + 1, "--http1.1");
#endif
    return true;
}

bool CommandBuilder::build(const std::string& executable,
                           const CommandSpec& spec,
                           std::vector<std::string>& outArgs,
                           std::string& err) const {
    outArgs.clear();
    if (executable.empty()) {
        err = "spawn failed: no executable for " + std::string(transportKindLabel(spec.kind));
        return false;
    }
    if (spec.destPath.empty()) {
        err = "Invalid destination path (empty)";
        return false;
    }

    switch (spec.kind) {
        case TransportKind::CopyUrl: {
            UrlParts parts;
            if (!parseUrl(spec.url, parts, err)) return false;
            outArgs = {executable, "copyurl", spec.url, spec.destPath};
            appendCommonFlags(outArgs, spec.troubleshoot);
            return true;
        }
        case TransportKind::HttpCopyTo: {
            std::string root;
            std::string rel;
            if (!splitHttpRemote(spec.url, root, rel, err)) return false;
            outArgs = {executable, "copyto", "--http-url", root, "--http-no-head", ":http:" + rel, spec.destPath};
            appendCommonFlags(outArgs, spec.troubleshoot);
            return true;
        }
        case TransportKind::Native:
            return buildNative(executable, spec, outArgs, err);
    }
    err = "Unknown transport kind";
    return false;
}

} // namespace romfetch
