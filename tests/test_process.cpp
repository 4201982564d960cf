#include "catch.hpp"
#include "romfetch/process.hpp"
#include <chrono>

TEST_CASE("ChildProcess captures combined output and exit code") {
    romfetch::ChildProcess proc;
    std::string err;
    REQUIRE(proc.spawn({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, err));
    REQUIRE(proc.waitFor(5000));
    proc.drainOutput();
    REQUIRE(proc.exitCode() == 3);
    const std::string out = proc.outputTail();
    REQUIRE(out.find("out") != std::string::npos);
    REQUIRE(out.find("err") != std::string::npos);
    REQUIRE_FALSE(proc.running());
}

TEST_CASE("ChildProcess reports exec failure through its output") {
    romfetch::ChildProcess proc;
    std::string err;
    REQUIRE(proc.spawn({"/nonexistent/romfetch-tool", "copyurl"}, err));
    REQUIRE(proc.waitFor(5000));
    proc.drainOutput();
    REQUIRE(proc.exitCode() == 127);
    REQUIRE(proc.outputTail().find("spawn failed") != std::string::npos);
}

TEST_CASE("ChildProcess terminate stops a sleeping child promptly") {
    romfetch::ChildProcess proc;
    std::string err;
    REQUIRE(proc.spawn({"/bin/sh", "-c", "sleep 30"}, err));
    REQUIRE(proc.running());
    auto start = std::chrono::steady_clock::now();
    proc.terminate(500);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE_FALSE(proc.running());
    REQUIRE(elapsed < std::chrono::seconds(3));
    REQUIRE(proc.exitCode() != 0);
}

TEST_CASE("ChildProcess escalates to SIGKILL when SIGTERM is ignored") {
    romfetch::ChildProcess proc;
    std::string err;
    REQUIRE(proc.spawn({"/bin/sh", "-c", "trap '' TERM; while true; do sleep 1; done"}, err));
    REQUIRE(proc.waitFor(200) == false);
    proc.terminate(200);
    REQUIRE_FALSE(proc.running());
    REQUIRE(proc.exitCode() == 128 + 9);
}

TEST_CASE("spawn rejects an empty command") {
    romfetch::ChildProcess proc;
    std::string err;
    REQUIRE_FALSE(proc.spawn({}, err));
    REQUIRE(err.find("spawn failed") != std::string::npos);
}

TEST_CASE("lastMeaningfulLine skips banners and blank lines") {
    const std::string out =
        "2024/05/01 NOTICE: Config file \"/home/u/.config/rclone/rclone.conf\" not found - using defaults\n"
        "Transferred: 10 MiB\r\n"
        "2024/05/01 ERROR : Attempt 1/1 failed: Get \"https://f2.erista.me/x\": i/o timeout\n"
        "\n   \n";
    REQUIRE(romfetch::lastMeaningfulLine(out) ==
            "2024/05/01 ERROR : Attempt 1/1 failed: Get \"https://f2.erista.me/x\": i/o timeout");
    REQUIRE(romfetch::lastMeaningfulLine("Config file x not found - using defaults\n").empty());
    REQUIRE(romfetch::lastMeaningfulLine("progress 10%\rprogress 20%\r") == "progress 20%");
}
