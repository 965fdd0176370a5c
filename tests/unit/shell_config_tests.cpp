#include <doctest/doctest.h>
#include <zshrcman/shell_config.hpp>

#include "../test_support.hpp"

using namespace zshrcman;
using namespace zshrcman::testing;

TEST_CASE("strip_profile_marker") {
    SUBCASE("removes the marker line with its newline") {
        CHECK(strip_profile_marker("a\n# ZSHRCMAN_PROFILE: work\nb\n") == "a\nb\n");
    }

    SUBCASE("marker at end of file without newline") {
        CHECK(strip_profile_marker("a\n# ZSHRCMAN_PROFILE: work") == "a\n");
    }

    SUBCASE("only the first marker goes") {
        CHECK(strip_profile_marker("# ZSHRCMAN_PROFILE: a\n# ZSHRCMAN_PROFILE: b\n") ==
              "# ZSHRCMAN_PROFILE: b\n");
    }

    SUBCASE("mid-line occurrences are not markers") {
        std::string content = "echo '# ZSHRCMAN_PROFILE: x'\n";
        CHECK(strip_profile_marker(content) == content);
    }
}

TEST_CASE("ShellConfigMarker: update on a missing file") {
    TempTestDir tmp;
    ShellConfigMarker marker(tmp.path(".zshrc"));

    REQUIRE(marker.update("work").isOk());
    CHECK(tmp.read(".zshrc") == "# ZSHRCMAN_PROFILE: work\n");
    CHECK(marker.current() == std::optional<std::string>("work"));
}

TEST_CASE("ShellConfigMarker: update keeps other content verbatim") {
    TempTestDir tmp;
    tmp.write(".zshrc", "export A=1\n# ZSHRCMAN_PROFILE: work\nalias g=git");
    ShellConfigMarker marker(tmp.path(".zshrc"));

    REQUIRE(marker.update("personal").isOk());
    CHECK(tmp.read(".zshrc") == "export A=1\nalias g=git\n# ZSHRCMAN_PROFILE: personal\n");

    REQUIRE(marker.update("personal").isOk());
    CHECK(tmp.read(".zshrc") == "export A=1\nalias g=git\n# ZSHRCMAN_PROFILE: personal\n");
}

TEST_CASE("ShellConfigMarker: clear") {
    TempTestDir tmp;
    tmp.write(".bashrc", "x\n# ZSHRCMAN_PROFILE: work\ny\n");
    ShellConfigMarker marker(tmp.path(".bashrc"));

    REQUIRE(marker.clear().isOk());
    CHECK(tmp.read(".bashrc") == "x\ny\n");
    CHECK_FALSE(marker.current().has_value());

    REQUIRE(marker.clear().isOk());
    CHECK(tmp.read(".bashrc") == "x\ny\n");
}

TEST_CASE("ShellConfigMarker: clear on a missing file creates nothing") {
    TempTestDir tmp;
    ShellConfigMarker marker(tmp.path(".zshrc"));
    REQUIRE(marker.clear().isOk());
    CHECK_FALSE(fs::exists(tmp.path(".zshrc")));
}

TEST_CASE("ShellConfigMarker: ensure_source_line is idempotent") {
    TempTestDir tmp;
    tmp.write(".zshrc", "export A=1");
    ShellConfigMarker marker(tmp.path(".zshrc"));
    std::string line = "[ -f /r/env/active.sh ] && source /r/env/active.sh";

    auto first = marker.ensure_source_line(line);
    REQUIRE(first.isOk());
    CHECK(first.value());
    CHECK(tmp.read(".zshrc") == "export A=1\n\n# zshrcman environment\n" + line + "\n");

    auto second = marker.ensure_source_line(line);
    REQUIRE(second.isOk());
    CHECK_FALSE(second.value());
    CHECK(tmp.read(".zshrc") == "export A=1\n\n# zshrcman environment\n" + line + "\n");
}

TEST_CASE("ShellConfigMarker: marker and source line coexist") {
    TempTestDir tmp;
    ShellConfigMarker marker(tmp.path("config.fish"));
    std::string line = "test -f /r/env/active.fish; and source /r/env/active.fish";

    REQUIRE(marker.ensure_source_line(line).isOk());
    REQUIRE(marker.update("work").isOk());
    REQUIRE(marker.update("home").isOk());

    std::string content = tmp.read("config.fish");
    CHECK(content.find(line) != std::string::npos);
    CHECK(content.find("# ZSHRCMAN_PROFILE: work") == std::string::npos);
    CHECK(marker.current() == std::optional<std::string>("home"));
}

TEST_CASE("ShellConfigMarker: unwritable path is an IO error") {
    TempTestDir tmp;
    tmp.write("blocker", "file");
    ShellConfigMarker marker(tmp.path("blocker/.zshrc"));
    auto r = marker.update("work");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::IO_ERROR);
}

TEST_CASE("ShellConfigMarker: update refuses names that would add lines") {
    TempTestDir tmp;
    std::string path = tmp.write(".zshrc", "export A=1\n");
    ShellConfigMarker marker(path);

    auto r = marker.update("work\nrm -rf ~");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::INVALID_OPERATION);
    CHECK(tmp.read(".zshrc") == "export A=1\n");
}
