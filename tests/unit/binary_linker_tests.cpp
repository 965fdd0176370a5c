#include <doctest/doctest.h>
#include <zshrcman/binary_linker.hpp>

#include "../test_support.hpp"

using namespace zshrcman;
using namespace zshrcman::testing;

TEST_CASE("BinaryLinker: bin_dir layout") {
    BinaryLinker linker("/data/profiles");
    CHECK(linker.bin_dir("work") == (fs::path("/data/profiles") / "work" / "bin").string());
}

TEST_CASE("BinaryLinker: link creates one symlink per entry") {
    TempTestDir tmp;
    std::string node = tmp.write("opt/node", "#!/bin/sh\n");
    std::string git = tmp.write("opt/git", "#!/bin/sh\n");
    BinaryLinker linker(tmp.path("profiles"));

    REQUIRE(linker.link("work", {{"nodejs", node}, {"git", git}}).isOk());

    fs::path bin(linker.bin_dir("work"));
    REQUIRE(fs::is_symlink(bin / "nodejs"));
    CHECK(fs::read_symlink(bin / "nodejs").string() == node);
    CHECK(fs::read_symlink(bin / "git").string() == git);
    CHECK(linker.linked("work") == std::vector<std::string>{"git", "nodejs"});
}

TEST_CASE("BinaryLinker: relinking replaces the previous set") {
    TempTestDir tmp;
    std::string node = tmp.write("opt/node", "");
    std::string git = tmp.write("opt/git", "");
    BinaryLinker linker(tmp.path("profiles"));

    REQUIRE(linker.link("work", {{"nodejs", node}, {"git", git}}).isOk());
    REQUIRE(linker.link("work", {{"git", git}}).isOk());
    CHECK(linker.linked("work") == std::vector<std::string>{"git"});

    REQUIRE(linker.link("work", {}).isOk());
    CHECK(linker.linked("work").empty());
    CHECK(fs::is_directory(linker.bin_dir("work")));
}

TEST_CASE("BinaryLinker: clear removes files and links but keeps directories") {
    TempTestDir tmp;
    BinaryLinker linker(tmp.path("profiles"));
    std::string target = tmp.write("opt/tool", "");
    REQUIRE(linker.link("work", {{"tool", target}}).isOk());

    fs::path bin(linker.bin_dir("work"));
    std::ofstream(bin / "stray") << "x";
    fs::create_directories(bin / "keep");

    REQUIRE(linker.clear("work").isOk());
    CHECK_FALSE(fs::exists(fs::symlink_status(bin / "tool")));
    CHECK_FALSE(fs::exists(bin / "stray"));
    CHECK(fs::is_directory(bin / "keep"));
    CHECK(fs::exists(target));
}

TEST_CASE("BinaryLinker: clear on a missing directory is fine") {
    TempTestDir tmp;
    BinaryLinker linker(tmp.path("profiles"));
    CHECK(linker.clear("nobody").isOk());
    CHECK(linker.linked("nobody").empty());
}

TEST_CASE("BinaryLinker: dangling targets are still linked") {
    TempTestDir tmp;
    BinaryLinker linker(tmp.path("profiles"));
    REQUIRE(linker.link("work", {{"ghost", tmp.path("does/not/exist")}}).isOk());
    CHECK(linker.linked("work") == std::vector<std::string>{"ghost"});
}

TEST_CASE("BinaryLinker: a directory in the way is an IO error") {
    TempTestDir tmp;
    BinaryLinker linker(tmp.path("profiles"));
    fs::create_directories(fs::path(linker.bin_dir("work")) / "nodejs");

    auto r = linker.link("work", {{"nodejs", tmp.path("opt/node")}});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::IO_ERROR);
    CHECK(r.error().message().find("nodejs") != std::string::npos);
}

TEST_CASE("BinaryLinker: unwritable root is an IO error") {
    TempTestDir tmp;
    // A regular file where the profiles directory should be
    tmp.write("profiles", "not a directory");
    BinaryLinker linker(tmp.path("profiles"));

    auto r = linker.link("work", {});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::IO_ERROR);
}

TEST_CASE("BinaryLinker: refuses profiles that resolve outside the profiles root") {
    TempTestDir tmp;
    std::string precious = tmp.write("victim/bin/precious", "keep me");
    BinaryLinker linker(tmp.path("root/profiles"));

    for (const char* profile : {"../../victim", "..", ".", "/usr/local", "a/../../../victim"}) {
        CAPTURE(profile);
        auto cleared = linker.clear(profile);
        REQUIRE(cleared.isErr());
        CHECK(cleared.error().code() == ErrorCode::INVALID_OPERATION);
        CHECK(linker.link(profile, {}).isErr());
        CHECK(linker.linked(profile).empty());
    }
    CHECK(fs::exists(precious));
    CHECK(tmp.read("victim/bin/precious") == "keep me");
}

TEST_CASE("BinaryLinker: refuses a bin directory symlinked out of the root") {
    TempTestDir tmp;
    std::string precious = tmp.write("elsewhere/precious", "keep me");
    fs::create_directories(tmp.path("profiles/work"));
    fs::create_directory_symlink(tmp.path("elsewhere"), tmp.path("profiles/work/bin"));
    BinaryLinker linker(tmp.path("profiles"));

    CHECK(linker.clear("work").isErr());
    CHECK(fs::exists(precious));
}

TEST_CASE("BinaryLinker: refuses link names that are not a single component") {
    TempTestDir tmp;
    std::string target = tmp.write("opt/tool", "");
    BinaryLinker linker(tmp.path("root/profiles"));

    for (const char* package : {"../../../escaped", "sub/tool", "..", ""}) {
        CAPTURE(package);
        auto r = linker.link("work", {{"ok", target}, {package, target}});
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::INVALID_OPERATION);
    }
    CHECK_FALSE(fs::exists(tmp.path("escaped")));
    CHECK_FALSE(fs::exists(tmp.path("root/escaped")));
    CHECK(linker.linked("work").empty());
}
