#include "catch.hpp"
#include "romfetch/failover_policy.hpp"
#include "romfetch/url.hpp"

using romfetch::FailoverAction;

namespace {

romfetch::Config providerConfig() {
    romfetch::Config cfg;
    cfg.providerDomain = "example.org";
    cfg.canonicalHost = "mirror.example.org";
    cfg.edgeHostCount = 8;
    cfg.maxAttempts = 3;
    return cfg;
}

romfetch::TransferJob jobFor(const std::string& url) {
    romfetch::TransferJob job;
    job.url = url;
    job.originalUrl = url;
    job.destPath = "/tmp/x.zip";
    job.transport = romfetch::TransportKind::HttpCopyTo;
    job.triedHosts.insert(romfetch::hostOf(url));
    return job;
}

} // namespace

TEST_CASE("first timeout on the canonical host retries with the troubleshoot profile") {
    romfetch::FailoverPolicy policy(providerConfig());
    auto job = jobFor("https://mirror.example.org/files/x.zip");
    auto next = policy.decide(job, "dial tcp: i/o timeout", 0);
    REQUIRE(next.action == FailoverAction::RetrySameWithTroubleshoot);
    REQUIRE(next.url == job.url);

    REQUIRE(policy.apply(next, job));
    REQUIRE(job.troubleshoot);
    REQUIRE(job.attempt == 1);
    REQUIRE(job.url == "https://mirror.example.org/files/x.zip");
}

TEST_CASE("first failure on an edge host substitutes the canonical mirror") {
    romfetch::FailoverPolicy policy(providerConfig());
    auto job = jobFor("https://f3.example.org/files/x.zip");
    auto next = policy.decide(job, "dial tcp 1.2.3.4:443: connect: connection refused", 0);
    REQUIRE(next.action == FailoverAction::RetryMirror);
    REQUIRE(romfetch::hostOf(next.url) == "mirror.example.org");
}

TEST_CASE("host hop rotates after the failed edge and skips tried hosts") {
    romfetch::FailoverPolicy policy(providerConfig());
    auto job = jobFor("https://mirror.example.org/files/x.zip");
    job.attempt = 1;
    job.troubleshoot = true;
    job.triedHosts.insert("f4.example.org");

    // The tool followed a redirect to f3 and failed there.
    auto next = policy.decide(job, "Failed to copy: Get \"https://f3.example.org/files/x.zip\": i/o timeout", 1);
    REQUIRE(next.action == FailoverAction::RetryHostHop);
    REQUIRE(romfetch::hostOf(next.url) == "f5.example.org");
    REQUIRE(next.url == "https://f5.example.org/files/x.zip");

    REQUIRE(policy.apply(next, job));
    REQUIRE(job.attempt == 2);
    REQUIRE(job.troubleshoot);
}

TEST_CASE("host hop from a non-edge reference starts at f1") {
    romfetch::FailoverPolicy policy(providerConfig());
    auto job = jobFor("https://mirror.example.org/files/x.zip");
    auto next = policy.decide(job, "no such host", 2);
    REQUIRE(next.action == FailoverAction::RetryHostHop);
    REQUIRE(romfetch::hostOf(next.url) == "f1.example.org");
}

TEST_CASE("edge host count comes from configuration") {
    auto cfg = providerConfig();
    cfg.edgeHostCount = 2;
    romfetch::FailoverPolicy policy(cfg);
    auto rot = policy.topology().hopRotation("f2.example.org");
    REQUIRE(rot.size() == 3);
    REQUIRE(rot[0] == "f1.example.org");
    REQUIRE(rot[1] == "f2.example.org");
    REQUIRE(rot[2] == "mirror.example.org");
}

TEST_CASE("exhausted attempts give up unless fallback is enabled") {
    auto cfg = providerConfig();
    {
        romfetch::FailoverPolicy policy(cfg);
        auto job = jobFor("https://f2.example.org/files/x.zip");
        job.attempt = 3;
        auto next = policy.decide(job, "timeout", 3);
        REQUIRE(next.action == FailoverAction::GiveUp);
    }
    cfg.enableNativeFallback = true;
    {
        romfetch::FailoverPolicy policy(cfg);
        auto job = jobFor("https://f2.example.org/files/x.zip");
        job.attempt = 3;
        auto next = policy.decide(job, "Get \"https://f7.example.org/files/x.zip\": timeout", 3);
        REQUIRE(next.action == FailoverAction::RetryFallbackTransport);
        REQUIRE(next.url == "https://mirror.example.org/files/x.zip");
        REQUIRE(policy.apply(next, job));
        REQUIRE(job.transport == romfetch::TransportKind::Native);

        // A failing native attempt ends the chain.
        auto after = policy.decide(job, "timeout", job.attempt);
        REQUIRE(after.action == FailoverAction::GiveUp);
    }
}

TEST_CASE("rotation exhausted before the attempt limit falls back when allowed") {
    auto cfg = providerConfig();
    cfg.edgeHostCount = 1;
    cfg.maxAttempts = 5;
    cfg.enableNativeFallback = true;
    romfetch::FailoverPolicy policy(cfg);
    auto job = jobFor("https://mirror.example.org/files/x.zip");
    job.triedHosts.insert("f1.example.org");
    auto next = policy.decide(job, "timeout", 2);
    REQUIRE(next.action == FailoverAction::RetryFallbackTransport);
}

TEST_CASE("non-retryable errors give up at any attempt") {
    romfetch::FailoverPolicy policy(providerConfig());
    auto job = jobFor("https://mirror.example.org/files/x.zip");
    REQUIRE(policy.decide(job, "HTTP error 404 (404 Not Found)", 0).action == FailoverAction::GiveUp);
    REQUIRE(policy.decide(job, "rclone binary not found (expected in . or PATH)", 0).action == FailoverAction::GiveUp);
    REQUIRE(policy.decide(job, "HTTP 403 Forbidden", 1).action == FailoverAction::GiveUp);
}

TEST_CASE("hosts outside the provider only get one attempt") {
    romfetch::FailoverPolicy policy(providerConfig());
    auto job = jobFor("https://downloads.other.net/x.zip");
    job.transport = romfetch::TransportKind::CopyUrl;
    REQUIRE(policy.decide(job, "i/o timeout", 0).action == FailoverAction::GiveUp);
}

TEST_CASE("a full chain never proposes a tried host") {
    romfetch::FailoverPolicy policy(providerConfig());
    auto job = jobFor("https://f3.example.org/files/x.zip");
    std::vector<std::string> contacted = {"f3.example.org"};
    for (int i = 0; i < 10; ++i) {
        auto next = policy.decide(job, "connection refused", job.attempt);
        if (!policy.apply(next, job)) break;
        const std::string host = romfetch::hostOf(job.url);
        REQUIRE(job.triedHosts.count(host) == 0);
        job.triedHosts.insert(host);
        contacted.push_back(host);
    }
    REQUIRE(contacted.size() == 4);
    REQUIRE(contacted[1] == "mirror.example.org");
    REQUIRE(contacted[2] == "f1.example.org");
    REQUIRE(contacted[3] == "f2.example.org");
}

TEST_CASE("apply records the host named in the tool error as tried") {
    romfetch::FailoverPolicy policy(providerConfig());
    auto job = jobFor("https://mirror.example.org/files/x.zip");
    auto next = policy.decide(job, "Get \"https://f1.example.org/files/x.zip\": i/o timeout", 0);
    REQUIRE(next.action == FailoverAction::RetrySameWithTroubleshoot);
    REQUIRE(next.failedHost == "f1.example.org");

    REQUIRE(policy.apply(next, job));
    REQUIRE(job.triedHosts.count("f1.example.org") == 1);

    // The next hop must skip f1 even though the new error names no host.
    next = policy.decide(job, "i/o timeout", job.attempt);
    REQUIRE(next.action == FailoverAction::RetryHostHop);
    REQUIRE(romfetch::hostOf(next.url) == "f2.example.org");
}

TEST_CASE("failover actions have stable log labels") {
    REQUIRE(std::string(romfetch::failoverActionLabel(FailoverAction::GiveUp)) == "give_up");
    REQUIRE(std::string(romfetch::failoverActionLabel(FailoverAction::RetrySameWithTroubleshoot)) == "retry_profile");
    REQUIRE(std::string(romfetch::failoverActionLabel(FailoverAction::RetryMirror)) == "retry_mirror");
    REQUIRE(std::string(romfetch::failoverActionLabel(FailoverAction::RetryHostHop)) == "retry_host_hop");
    REQUIRE(std::string(romfetch::failoverActionLabel(FailoverAction::RetryFallbackTransport)) ==
            "retry_fallback_transport");
}

TEST_CASE("extractErrorUrl finds quoted Get/Head targets") {
    using romfetch::FailoverPolicy;
    REQUIRE(FailoverPolicy::extractErrorUrl("Failed: Get \"https://f1.erista.me/a\": EOF") == "https://f1.erista.me/a");
    REQUIRE(FailoverPolicy::extractErrorUrl("Head  \"http://x/y\" failed") == "http://x/y");
    REQUIRE(FailoverPolicy::extractErrorUrl("TargetGet \"http://x/y\"").empty());
    REQUIRE(FailoverPolicy::extractErrorUrl("no url here").empty());
}
