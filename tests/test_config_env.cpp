#include "catch.hpp"
#include "romfetch/config.hpp"
#include <map>

TEST_CASE("parseEnvString reads transfer settings") {
    const std::string env =
        "# transfer tool\n"
        "tool_dir=/opt/tools\n"
        "transfer_tool=rclone\n"
        "connect_timeout_seconds=10\n"
        "transfer_timeout_seconds=60\n"
        "retries_sleep_seconds=2\n"
        "workers=2\n"
        "edge_host_count=12\n"
        "LOG_LEVEL=DeBuG\n"
        "user_agent=\"my agent/1.0\"\n";

    romfetch::Config cfg;
    std::string err;
    REQUIRE(romfetch::parseEnvString(env, cfg, err));
    REQUIRE(err.empty());
    REQUIRE(cfg.toolDir == "/opt/tools");
    REQUIRE(cfg.connectTimeoutSeconds == 10);
    REQUIRE(cfg.transferTimeoutSeconds == 60);
    REQUIRE(cfg.retriesSleepSeconds == 2);
    REQUIRE(cfg.workers == 2);
    REQUIRE(cfg.edgeHostCount == 12);
    REQUIRE(cfg.logLevel == "debug");
    REQUIRE(cfg.userAgent == "my agent/1.0");
}

TEST_CASE("parseEnvString normalizes fallback switch") {
    for (const char* v : {"1", "true", "Yes", "ON"}) {
        romfetch::Config cfg;
        std::string err;
        REQUIRE(romfetch::parseEnvString(std::string("enable_native_fallback=") + v + "\n", cfg, err));
        REQUIRE(cfg.enableNativeFallback);
    }
    romfetch::Config cfg;
    std::string err;
    REQUIRE(romfetch::parseEnvString("enable_native_fallback=nope\n", cfg, err));
    REQUIRE_FALSE(cfg.enableNativeFallback);
}

TEST_CASE("parseEnvString rejects bad numbers and lines") {
    romfetch::Config cfg;
    std::string err;
    REQUIRE_FALSE(romfetch::parseEnvString("workers=four\n", cfg, err));
    REQUIRE(err.find("workers") != std::string::npos);

    err.clear();
    REQUIRE_FALSE(romfetch::parseEnvString("just some text\n", cfg, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("applyEnvironment overrides file values") {
    std::map<std::string, std::string> env = {
        {"ROMFETCH_ENABLE_NATIVE_FALLBACK", "yes"},
        {"ROMFETCH_CONNECT_TIMEOUT", "7"},
        {"ROMFETCH_EDGE_HOST_COUNT", "4"},
        {"ROMFETCH_CANONICAL_HOST", "Mirror.Example.org"},
    };
    auto lookup = [&](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };

    romfetch::Config cfg;
    cfg.connectTimeoutSeconds = 30;
    std::string err;
    REQUIRE(romfetch::applyEnvironment(cfg, err, lookup));
    REQUIRE(cfg.enableNativeFallback);
    REQUIRE(cfg.connectTimeoutSeconds == 7);
    REQUIRE(cfg.edgeHostCount == 4);
    REQUIRE(cfg.canonicalHost == "mirror.example.org");
}

TEST_CASE("validateConfig enforces ranges") {
    romfetch::Config cfg;
    std::string err;
    REQUIRE(romfetch::validateConfig(cfg, err));

    cfg.workers = 0;
    REQUIRE_FALSE(romfetch::validateConfig(cfg, err));
    REQUIRE(err.find("Invalid config") == 0);

    cfg = romfetch::Config{};
    cfg.edgeHostCount = 0;
    REQUIRE_FALSE(romfetch::validateConfig(cfg, err));

    cfg = romfetch::Config{};
    cfg.pollIntervalMs = 1;
    REQUIRE_FALSE(romfetch::validateConfig(cfg, err));
}

TEST_CASE("loadConfig tolerates a missing file") {
    romfetch::Config cfg;
    std::string err;
    REQUIRE(romfetch::loadConfig("/nonexistent/romfetch/.env", cfg, err));
    REQUIRE_FALSE(cfg.userAgent.empty());
}
