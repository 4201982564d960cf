#include "romfetch/config.hpp"
#include "romfetch/logger.hpp"
#include "romfetch/util.hpp"
#include "romfetch/version.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace romfetch {

static std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static void trim(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) i++;
    s = s.substr(i);
}

static bool parseInt(const std::string& key, const std::string& val, int& out, std::string& err) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(val.c_str(), &end, 10);
    if (val.empty() || end == val.c_str() || *end != '\0' || errno == ERANGE || v < -1000000 || v > 1000000) {
        err = "Invalid config value for " + key + ": '" + val + "'";
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

// Keys are shared between the .env file (lowercase) and ROMFETCH_* variables.
static bool applyKey(const std::string& key, const std::string& val, Config& cfg, std::string& err) {
    if (key == "tool_dir") cfg.toolDir = val;
    else if (key == "transfer_tool") cfg.transferTool = val;
    else if (key == "enable_native_fallback") cfg.enableNativeFallback = util::isTruthy(val);
    else if (key == "native_client") cfg.nativeClient = val;
    else if (key == "connect_timeout_seconds") return parseInt(key, val, cfg.connectTimeoutSeconds, err);
    else if (key == "transfer_timeout_seconds") return parseInt(key, val, cfg.transferTimeoutSeconds, err);
    else if (key == "retries_sleep_seconds") return parseInt(key, val, cfg.retriesSleepSeconds, err);
    else if (key == "probe_timeout_seconds") return parseInt(key, val, cfg.probeTimeoutSeconds, err);
    else if (key == "workers") return parseInt(key, val, cfg.workers, err);
    else if (key == "max_attempts") return parseInt(key, val, cfg.maxAttempts, err);
    else if (key == "edge_host_count") return parseInt(key, val, cfg.edgeHostCount, err);
    else if (key == "provider_domain") cfg.providerDomain = toLower(val);
    else if (key == "canonical_host") cfg.canonicalHost = toLower(val);
    else if (key == "poll_interval_ms") return parseInt(key, val, cfg.pollIntervalMs, err);
    else if (key == "terminate_grace_ms") return parseInt(key, val, cfg.terminateGraceMs, err);
    else if (key == "user_agent") cfg.userAgent = val;
    else if (key == "troubleshoot_user_agent") cfg.troubleshootUserAgent = val;
    else if (key == "handoff_endpoint") cfg.handoffEndpoint = val;
    else if (key == "log_level") cfg.logLevel = toLower(val);
    else if (key == "log_file") cfg.logFile = val;
    else logDebug("Ignoring unknown config key: " + key, "CFG");
    return true;
}

std::string defaultUserAgent() {
    return productToken() + " (+local desktop app)";
}

bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError) {
    std::istringstream in(contents);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        trim(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            outError = "Invalid config line " + std::to_string(lineNo) + ": missing '='";
            return false;
        }
        std::string key = toLower(line.substr(0, pos));
        std::string val = line.substr(pos + 1);
        trim(key); trim(val);
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }
        if (!applyKey(key, val, outCfg, outError)) return false;
    }
    return true;
}

bool applyEnvironment(Config& cfg, std::string& outError, const EnvLookup& lookup) {
    static const char* kKeys[] = {
        "tool_dir", "transfer_tool", "enable_native_fallback", "native_client",
        "connect_timeout_seconds", "transfer_timeout_seconds", "retries_sleep_seconds",
        "probe_timeout_seconds", "workers", "max_attempts", "edge_host_count",
        "provider_domain", "canonical_host", "poll_interval_ms", "terminate_grace_ms",
        "user_agent", "troubleshoot_user_agent", "handoff_endpoint", "log_level", "log_file",
    };
    // Short aliases for the most common switches.
    static const std::pair<const char*, const char*> kAliases[] = {
        {"ROMFETCH_CONNECT_TIMEOUT", "connect_timeout_seconds"},
        {"ROMFETCH_TRANSFER_TIMEOUT", "transfer_timeout_seconds"},
        {"ROMFETCH_RETRIES_SLEEP", "retries_sleep_seconds"},
        {"ROMFETCH_PROBE_TIMEOUT", "probe_timeout_seconds"},
    };
    auto get = [&](const std::string& name) -> const char* {
        if (lookup) return lookup(name.c_str());
        return std::getenv(name.c_str());
    };

    for (const auto& alias : kAliases) {
        const char* v = get(alias.first);
        if (v && !applyKey(alias.second, v, cfg, outError)) return false;
    }
    for (const char* key : kKeys) {
        std::string name = "ROMFETCH_";
        for (const char* p = key; *p; ++p) name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
        const char* v = get(name);
        if (!v) continue;
        if (!applyKey(key, v, cfg, outError)) return false;
    }
    return true;
}

bool validateConfig(const Config& cfg, std::string& outError) {
    auto fail = [&](const std::string& why) {
        outError = "Invalid config: " + why;
        return false;
    };
    if (cfg.transferTool.empty()) return fail("transfer_tool must not be empty");
    if (cfg.workers < 1) return fail("workers must be >= 1");
    if (cfg.maxAttempts < 1) return fail("max_attempts must be >= 1");
    if (cfg.edgeHostCount < 1 || cfg.edgeHostCount > 64) return fail("edge_host_count must be within 1..64");
    if (cfg.connectTimeoutSeconds <= 0) return fail("connect_timeout_seconds must be > 0");
    if (cfg.transferTimeoutSeconds <= 0) return fail("transfer_timeout_seconds must be > 0");
    if (cfg.retriesSleepSeconds < 0) return fail("retries_sleep_seconds must be >= 0");
    if (cfg.probeTimeoutSeconds <= 0) return fail("probe_timeout_seconds must be > 0");
    if (cfg.pollIntervalMs < 10 || cfg.pollIntervalMs > 5000) return fail("poll_interval_ms must be within 10..5000");
    if (cfg.terminateGraceMs < 0) return fail("terminate_grace_ms must be >= 0");
    if (cfg.providerDomain.empty()) return fail("provider_domain must not be empty");
    if (cfg.canonicalHost.empty()) return fail("canonical_host must not be empty");
    return true;
}

bool loadConfig(const std::string& path, Config& outCfg, std::string& outError) {
    if (!path.empty()) {
        std::ifstream f(path, std::ios::in | std::ios::binary);
        if (f) {
            std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
            if (!parseEnvString(content, outCfg, outError)) {
                outError = path + ": " + outError;
                return false;
            }
            logInfo("Loaded config from " + path, "CFG");
        } else {
            logDebug("No config file at " + path + "; using defaults", "CFG");
        }
    }

    if (!applyEnvironment(outCfg, outError)) return false;
    if (outCfg.userAgent.empty()) outCfg.userAgent = defaultUserAgent();
    return validateConfig(outCfg, outError);
}

} // namespace romfetch
