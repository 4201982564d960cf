#include "catch.hpp"
#include "fake_tool.hpp"
#include "romfetch/transport_resolver.hpp"

using romfetch_test::TempDir;

TEST_CASE("resolver prefers the project-local tool and caches it") {
    TempDir dir("resolver");
    romfetch_test::installFakeTool(dir, {}, "exit 0");
    auto cfg = romfetch_test::fastConfig(dir);

    romfetch::TransportResolver resolver(cfg);
    std::string path;
    std::string err;
    REQUIRE(resolver.resolve(path, err));
    REQUIRE(path == dir.file("rclone"));

    std::string again;
    REQUIRE(resolver.resolve(again, err));
    REQUIRE(again == path);
}

TEST_CASE("resolver notices a vanished tool") {
    TempDir dir("vanish");
    romfetch_test::installFakeTool(dir, {}, "exit 0", "romfetch-vanishing-tool");
    auto cfg = romfetch_test::fastConfig(dir);
    cfg.transferTool = "romfetch-vanishing-tool";

    romfetch::TransportResolver resolver(cfg);
    std::string path;
    std::string err;
    REQUIRE(resolver.resolve(path, err));
    std::filesystem::remove(path);
    REQUIRE_FALSE(resolver.resolve(path, err));
    REQUIRE(err.find("binary not found") != std::string::npos);
}

TEST_CASE("resolver reports a missing tool with the searched locations") {
    TempDir dir("notool");
    auto cfg = romfetch_test::fastConfig(dir);
    cfg.transferTool = "romfetch-no-such-tool";
    romfetch::TransportResolver resolver(cfg);
    std::string path;
    std::string err;
    REQUIRE_FALSE(resolver.resolve(path, err));
    REQUIRE(err == "romfetch-no-such-tool binary not found (expected in " + dir.path.string() + " or PATH)");

    auto names = resolver.candidateNames();
    REQUIRE(names.size() == 2);
    REQUIRE(names[0] == "romfetch-no-such-tool");
}

TEST_CASE("findOnPath walks an explicit path list") {
    TempDir a("path_a");
    TempDir b("path_b");
    romfetch_test::installFakeTool(b, {}, "exit 0", "mytool");
    romfetch_test::writeFile(a.file("mytool"), "not executable");

    const std::string list = a.path.string() + ":" + b.path.string();
    REQUIRE(romfetch::findOnPath("mytool", list.c_str()) == b.file("mytool"));
    REQUIRE(romfetch::findOnPath("othertool", list.c_str()).empty());
    REQUIRE(romfetch::findOnPath(b.file("mytool")) == b.file("mytool"));
    REQUIRE(romfetch::findOnPath("").empty());
}
