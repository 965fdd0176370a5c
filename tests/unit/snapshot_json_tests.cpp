#include <doctest/doctest.h>
#include <zshrcman/installation_state.hpp>
#include <zshrcman/snapshot_json.hpp>
#include <zshrcman/snapshot_store.hpp>

#include "../test_support.hpp"

using namespace zshrcman;
using namespace zshrcman::testing;

namespace {

Snapshot sample_snapshot() {
    Snapshot snap;

    InstallationRecord node;
    node.package = "nodejs";
    node.version = "20.1.0";
    node.installed_at = "2025-03-01T10:00:00Z";
    node.installed_by = InstallationSource::profile("work");
    node.active_for = {"work", "personal"};
    node.scope = InstallScope::Global;
    node.location = "/opt/homebrew/bin/node";
    node.installer_type = "brew";
    snap.installations["nodejs"] = node;

    InstallationRecord ssl;
    ssl.package = "openssl";
    ssl.installed_at = "2025-03-01T10:05:00Z";
    ssl.installed_by = InstallationSource::dependency("nodejs");
    ssl.scope = InstallScope::System;
    snap.installations["openssl"] = ssl;

    Profile work;
    work.name = "work";
    work.packages = {"nodejs"};
    work.environment.paths_prepend = {"~/work/bin"};
    work.environment.paths_append = {"/opt/tools"};
    work.environment.variables = {{"EDITOR", "vim"}, {"AWS_PROFILE", "corp"}};
    work.environment.aliases = {{"k", "kubectl"}};
    OsOverride mac;
    mac.packages = {"coreutils"};
    EnvironmentState mac_env;
    mac_env.variables["HOMEBREW_NO_ANALYTICS"] = "1";
    mac.environment = mac_env;
    work.os_overrides["macos"] = mac;
    snap.profiles["work"] = work;

    Profile personal;
    personal.name = "personal";
    personal.parent = "work";
    personal.packages = {"nodejs"};
    personal.environment.active = false;
    snap.profiles["personal"] = personal;

    snap.active_profile = "work";
    return snap;
}

} // namespace

TEST_CASE("snapshot survives serialize and parse unchanged") {
    Snapshot snap = sample_snapshot();
    auto parsed = parse_snapshot(serialize_snapshot(snap));
    REQUIRE(parsed.ok);
    CHECK(parsed.warnings.empty());
    CHECK(parsed.snapshot == snap);
}

TEST_CASE("serialized snapshot layout") {
    std::string text = serialize_snapshot(sample_snapshot());
    CHECK(text.find("\"$schema\": \"zshrcman.state.v1\"") != std::string::npos);
    CHECK(text.find("\"active_profile\": \"work\"") != std::string::npos);
    CHECK(text.find("\"kind\": \"dependency\"") != std::string::npos);
    CHECK(text.back() == '\n');
}

TEST_CASE("parse_snapshot error handling") {
    SUBCASE("invalid JSON") {
        auto r = parse_snapshot("{not json", "state.json");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("state.json") != std::string::npos);
    }

    SUBCASE("wrong schema") {
        auto r = parse_snapshot(R"({"$schema": "other.v9"})");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("$schema") != std::string::npos);
    }

    SUBCASE("missing schema only warns") {
        auto r = parse_snapshot(R"({"installations": {}, "profiles": {}})");
        CHECK(r.ok);
        CHECK(r.warnings.size() == 1);
    }

    SUBCASE("dangling active profile is dropped") {
        auto r = parse_snapshot(
            R"({"$schema": "zshrcman.state.v1", "active_profile": "gone", "profiles": {}})");
        REQUIRE(r.ok);
        CHECK_FALSE(r.snapshot.active_profile.has_value());
        CHECK(r.warnings.size() == 1);
    }

    SUBCASE("bad scope falls back to global with a warning") {
        auto r = parse_snapshot(R"({
            "$schema": "zshrcman.state.v1",
            "installations": {"git": {"installed_at": "x", "scope": "galaxy"}}
        })");
        REQUIRE(r.ok);
        CHECK(r.snapshot.installations.at("git").scope == InstallScope::Global);
        CHECK(r.snapshot.installations.at("git").installer_type == "auto");
        CHECK(r.warnings.size() == 1);
    }
}

TEST_CASE("environment state JSON") {
    EnvironmentState env;
    env.paths_prepend = {"$HOME/bin"};
    env.variables["LANG"] = "C";
    env.active = false;

    auto parsed = parse_environment_state(serialize_environment_state(env));
    REQUIRE(parsed.ok);
    CHECK(parsed.environment == env);

    CHECK_FALSE(parse_environment_state("[1,2]").ok);
}

// ============================================================================
// JsonSnapshotStore
// ============================================================================

TEST_CASE("JsonSnapshotStore: missing file loads an empty snapshot") {
    TempTestDir tmp;
    JsonSnapshotStore store(tmp.path("state.json"));
    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    CHECK(loaded.value() == Snapshot{});
}

TEST_CASE("JsonSnapshotStore: save then load") {
    TempTestDir tmp;
    JsonSnapshotStore store(tmp.path("nested/dir/state.json"));
    Snapshot snap = sample_snapshot();

    REQUIRE(store.save(snap).isOk());
    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    CHECK(loaded.value() == snap);
}

TEST_CASE("JsonSnapshotStore: corrupt file is a persistence error") {
    TempTestDir tmp;
    tmp.write("state.json", "{{{");
    JsonSnapshotStore store(tmp.path("state.json"));
    auto loaded = store.load();
    REQUIRE(loaded.isErr());
    CHECK(loaded.error().code() == ErrorCode::PERSISTENCE_ERROR);
}

TEST_CASE("persisting then reloading yields identical ledger, registry and pointer") {
    TempTestDir tmp;
    RecordingInstaller installer;
    JsonSnapshotStore store(tmp.path("state.json"));

    Snapshot expected;
    {
        auto loaded = InstallationState::load(store);
        REQUIRE(loaded.isOk());
        auto& state = loaded.value();
        state.create_profile("work", std::nullopt);
        state.create_profile("personal", std::string("work"));
        state.select_profile("work");
        state.smart_install("nodejs", InstallScope::Global, {}, installer);
        state.select_profile("personal");
        state.smart_install("nodejs", InstallScope::Global, {}, installer);
        expected = state.snapshot();
    }

    JsonSnapshotStore reopened(tmp.path("state.json"));
    auto again = InstallationState::load(reopened);
    REQUIRE(again.isOk());
    CHECK(again.value().snapshot() == expected);
    CHECK(again.value().active_profile() == std::optional<std::string>("personal"));
}

TEST_CASE("parse_snapshot skips entries whose names are unsafe") {
    auto r = parse_snapshot(R"({
        "$schema": "zshrcman.state.v1",
        "installations": {"../../x": {"installed_at": "x"}, "git": {"installed_at": "x"}},
        "profiles": {"../../victim": {}, "work": {}},
        "active_profile": "../../victim"
    })");
    REQUIRE(r.ok);
    CHECK(r.snapshot.installations.size() == 1);
    CHECK(r.snapshot.installations.count("git") == 1);
    CHECK(r.snapshot.profiles.size() == 1);
    CHECK(r.snapshot.profiles.count("work") == 1);
    CHECK_FALSE(r.snapshot.active_profile.has_value());
    CHECK(r.warnings.size() == 3);
}

TEST_CASE("JsonSnapshotStore: invalid UTF-8 is a persistence error, not an exception") {
    TempTestDir tmp;
    JsonSnapshotStore store(tmp.path("state.json"));

    Snapshot snap;
    InstallationRecord rec;
    rec.package = "\xff\xfe";
    rec.installed_at = "2024-01-01T00:00:00Z";
    snap.installations[rec.package] = rec;

    Result<void> saved = Result<void>::ok();
    CHECK_NOTHROW(saved = store.save(snap));
    REQUIRE(saved.isErr());
    CHECK(saved.error().code() == ErrorCode::PERSISTENCE_ERROR);
    CHECK_FALSE(fs::exists(tmp.path("state.json")));
}

TEST_CASE("InstallationState surfaces an unencodable value as a persistence error") {
    TempTestDir tmp;
    JsonSnapshotStore store(tmp.path("state.json"));
    RecordingInstaller installer;
    InstallationState state{Snapshot{}, store};

    InstallOptions options;
    options.version = "1.0\xc3";  // truncated sequence
    auto r = state.smart_install("git", InstallScope::Global, options, installer);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::PERSISTENCE_ERROR);
}
