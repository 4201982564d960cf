#pragma once

#include <functional>
#include <string>

namespace romfetch {

struct Config {
    // Project-local directory searched for the transfer tool before PATH.
    std::string toolDir{"."};
    // Base name of the transfer tool binary.
    std::string transferTool{"rclone"};
    // Permit the OS-native HTTP client when the transfer tool is missing or exhausted.
    bool enableNativeFallback{false};
    std::string nativeClient{"curl"};
    // Passed to every tool invocation.
    int connectTimeoutSeconds{15};
    int transferTimeoutSeconds{45};
    int retriesSleepSeconds{0};
    // HEAD probe budget.
    int probeTimeoutSeconds{3};
    // Concurrent transfers; a rate limit against the remote, not a throughput knob.
    int workers{4};
    // Host-hop is allowed while the attempt counter is below this.
    int maxAttempts{3};
    // Numbered edge hosts f1..fN under the provider domain.
    int edgeHostCount{8};
    std::string providerDomain{"erista.me"};
    std::string canonicalHost{"myrient.erista.me"};
    int pollIntervalMs{250};
    int terminateGraceMs{1000};
    std::string userAgent;
    std::string troubleshootUserAgent{"curl"};
    std::string handoffEndpoint{"http://127.0.0.1:9666/flashgot"};
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    std::string logFile;
};

using EnvLookup = std::function<const char*(const char*)>;

std::string defaultUserAgent();

// Load defaults, then the .env file at path (if present), then ROMFETCH_* variables.
bool loadConfig(const std::string& path, Config& outCfg, std::string& outError);

// Parse .env-style content from an in-memory string.
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError);

// Apply ROMFETCH_* overrides. lookup defaults to std::getenv.
bool applyEnvironment(Config& cfg, std::string& outError, const EnvLookup& lookup = EnvLookup());

bool validateConfig(const Config& cfg, std::string& outError);

} // namespace romfetch
