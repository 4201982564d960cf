#include "catch.hpp"
#include "romfetch/errors.hpp"

TEST_CASE("classifyError treats transfer tool timeouts as retryable") {
    romfetch::ErrorInfo info = romfetch::classifyError(
        "Failed to copyurl: Get \"https://f3.erista.me/files/a.zip\": dial tcp 1.2.3.4:443: i/o timeout");
    REQUIRE(info.category == romfetch::ErrorCategory::Network);
    REQUIRE(info.code == romfetch::ErrorCode::Timeout);
    REQUIRE(info.retryable);
}

TEST_CASE("classifyError maps DNS and connection failures") {
    auto dns = romfetch::classifyError("dial tcp: lookup f9.erista.me: no such host");
    REQUIRE(dns.code == romfetch::ErrorCode::DnsFailure);
    REQUIRE(dns.retryable);

    auto refused = romfetch::classifyError("dial tcp 10.0.0.1:443: connect: connection refused");
    REQUIRE(refused.code == romfetch::ErrorCode::ConnectFailure);
    REQUIRE(refused.retryable);

    auto windows = romfetch::classifyError("connectex: A connection attempt failed because the connected party did not properly respond");
    REQUIRE(windows.retryable);

    REQUIRE(romfetch::isRetryableTransportError("the server failed to respond"));
}

TEST_CASE("classifyError never retries HTTP client and server errors") {
    auto nf = romfetch::classifyError("Failed to copyurl: HTTP error 404 (404 Not Found) returned");
    REQUIRE(nf.category == romfetch::ErrorCategory::Http);
    REQUIRE(nf.code == romfetch::ErrorCode::HttpNotFound);
    REQUIRE(nf.httpStatus == 404);
    REQUIRE_FALSE(nf.retryable);

    auto forbidden = romfetch::classifyError("HTTP 403 Forbidden");
    REQUIRE(forbidden.code == romfetch::ErrorCode::HttpForbidden);
    REQUIRE_FALSE(forbidden.retryable);

    // An HTTP status wins over a timeout marker in the same line.
    auto busy = romfetch::classifyError("HTTP 503 after timeout");
    REQUIRE(busy.code == romfetch::ErrorCode::HttpStatus);
    REQUIRE_FALSE(busy.retryable);
}

TEST_CASE("classifyError marks setup and URL failures fatal") {
    auto missing = romfetch::classifyError("rclone binary not found (expected in . or PATH)");
    REQUIRE(missing.category == romfetch::ErrorCategory::Setup);
    REQUIRE(missing.code == romfetch::ErrorCode::MissingBinary);
    REQUIRE_FALSE(missing.retryable);

    auto url = romfetch::classifyError("Invalid URL (empty relative path for HTTP remote): https://h/");
    REQUIRE(url.code == romfetch::ErrorCode::InvalidUrl);
    REQUIRE_FALSE(url.retryable);
}

TEST_CASE("classifyError falls back to non-retryable internal") {
    auto info = romfetch::classifyError("something odd happened");
    REQUIRE(info.category == romfetch::ErrorCategory::Internal);
    REQUIRE_FALSE(info.retryable);
    REQUIRE_FALSE(info.userMessage.empty());
}

TEST_CASE("parseHttpStatusFromMessage ignores non-status digits") {
    REQUIRE(romfetch::parseHttpStatusFromMessage("(HTTP 404)") == 404);
    REQUIRE(romfetch::parseHttpStatusFromMessage("HTTP/1.1 200 OK") == 0);
    REQUIRE(romfetch::parseHttpStatusFromMessage("no status here 404") == 0);
}
