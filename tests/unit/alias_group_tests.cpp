#include <doctest/doctest.h>
#include <zshrcman/installation_state.hpp>
#include <zshrcman/profile_transition.hpp>
#include <zshrcman/snapshot_json.hpp>

#include "../test_support.hpp"

using namespace zshrcman;
using namespace zshrcman::testing;

namespace {

// "git" group with two aliases, only "gs" active, enabled for "work"
struct AliasFixture {
    MemorySnapshotStore store;
    InstallationState state{Snapshot{}, store};

    AliasFixture() {
        state.create_profile("work", std::nullopt);
        state.create_profile("personal", std::nullopt);
        state.add_alias("git", "gs=git status");
        state.add_alias("git", "gl=git log --oneline");
        state.set_active_aliases("git", {"gs=git status"});
        state.enable_alias_group("work", "git");
    }
};

} // namespace

TEST_CASE("add_alias creates the group and ignores duplicates") {
    MemorySnapshotStore store;
    InstallationState state{Snapshot{}, store};

    auto first = state.add_alias("docker", "dc=docker compose");
    REQUIRE(first.isOk());
    CHECK(first.value());
    int saves = store.save_count;

    auto again = state.add_alias("docker", "dc=docker compose");
    REQUIRE(again.isOk());
    CHECK_FALSE(again.value());
    CHECK(store.save_count == saves);

    const auto* group = state.alias_group("docker");
    REQUIRE(group != nullptr);
    CHECK(group->name == "docker");
    CHECK(group->items == std::vector<std::string>{"dc=docker compose"});
    CHECK(group->active.empty());
    CHECK(store.saved.alias_groups.count("docker") == 1);
}

TEST_CASE("add_alias rejects bad groups and definitions") {
    MemorySnapshotStore store;
    InstallationState state{Snapshot{}, store};

    CHECK(state.add_alias("../git", "gs=git status").error().code() ==
          ErrorCode::INVALID_OPERATION);
    CHECK(state.add_alias("git", "gs").error().code() == ErrorCode::INVALID_OPERATION);
    CHECK(state.add_alias("git", "gs=echo 'x'").error().code() == ErrorCode::INVALID_OPERATION);
    CHECK(state.alias_groups().empty());
    CHECK(store.save_count == 0);
}

TEST_CASE_FIXTURE(AliasFixture, "set_active_aliases keeps items order and checks membership") {
    REQUIRE(state.set_active_aliases("git", {"gl=git log --oneline", "gs=git status"}).isOk());
    CHECK(state.alias_group("git")->active ==
          std::vector<std::string>{"gs=git status", "gl=git log --oneline"});

    auto unknown = state.set_active_aliases("git", {"gp=git push"});
    REQUIRE(unknown.isErr());
    CHECK(unknown.error().code() == ErrorCode::INVALID_OPERATION);
    CHECK(state.alias_group("git")->active.size() == 2);

    CHECK(state.set_active_aliases("nope", {}).error().code() == ErrorCode::NOT_FOUND);

    REQUIRE(state.set_active_aliases("git", {}).isOk());
    CHECK(state.alias_group("git")->active.empty());
}

TEST_CASE_FIXTURE(AliasFixture, "remove_alias drops the item and its active entry") {
    REQUIRE(state.remove_alias("git", "gs=git status").isOk());
    const auto* group = state.alias_group("git");
    CHECK(group->items == std::vector<std::string>{"gl=git log --oneline"});
    CHECK(group->active.empty());

    CHECK(state.remove_alias("git", "gs=git status").error().code() == ErrorCode::NOT_FOUND);
    CHECK(state.remove_alias("nope", "gs=git status").error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE_FIXTURE(AliasFixture, "group_aliases merges active aliases of enabled groups") {
    CHECK(state.group_aliases("work") ==
          std::map<std::string, std::string>{{"gs", "git status"}});
    CHECK(state.group_aliases("personal").empty());
    CHECK(state.group_aliases("ghost").empty());

    SUBCASE("first group in name order wins a name clash") {
        state.add_alias("abbrev", "gs=git switch");
        state.set_active_aliases("abbrev", {"gs=git switch"});
        state.enable_alias_group("work", "abbrev");
        CHECK(state.group_aliases("work").at("gs") == "git switch");
    }
}

TEST_CASE_FIXTURE(AliasFixture, "enable and disable alias groups") {
    CHECK(state.enable_alias_group("ghost", "git").error().code() == ErrorCode::NOT_FOUND);
    CHECK(state.enable_alias_group("personal", "nope").error().code() == ErrorCode::NOT_FOUND);

    REQUIRE(state.enable_alias_group("personal", "git").isOk());
    CHECK(state.registry().find("personal")->alias_groups.count("git") == 1);

    REQUIRE(state.disable_alias_group("work", "git").isOk());
    CHECK(state.registry().find("work")->alias_groups.empty());
    CHECK(state.verify_consistency().empty());
}

TEST_CASE_FIXTURE(AliasFixture, "delete_alias_group disables it everywhere") {
    state.enable_alias_group("personal", "git");
    REQUIRE(state.delete_alias_group("git").isOk());

    CHECK(state.alias_group("git") == nullptr);
    CHECK(state.registry().find("work")->alias_groups.empty());
    CHECK(state.registry().find("personal")->alias_groups.empty());
    CHECK(state.verify_consistency().empty());
    CHECK(state.delete_alias_group("git").error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("verify_consistency reports an enabled group that does not exist") {
    Snapshot snap;
    Profile work;
    work.name = "work";
    work.alias_groups = {"ghost"};
    snap.profiles["work"] = work;

    MemorySnapshotStore store;
    InstallationState state{snap, store};
    auto problems = state.verify_consistency();
    REQUIRE(problems.size() == 1);
    CHECK(problems[0].find("ghost") != std::string::npos);
}

TEST_CASE_FIXTURE(AliasFixture, "alias groups survive a JSON round trip") {
    auto parsed = parse_snapshot(serialize_snapshot(state.snapshot()));
    REQUIRE(parsed.ok);
    CHECK(parsed.snapshot.alias_groups == state.snapshot().alias_groups);
    CHECK(parsed.snapshot.profiles.at("work").alias_groups == std::set<std::string>{"git"});
}

TEST_CASE("parse_snapshot drops active aliases that are not items") {
    auto parsed = parse_snapshot(R"({
        "$schema": "zshrcman.state.v1",
        "alias_groups": {"git": {"items": ["gs=git status"], "active": ["gs=git status", "gp=git push"]}}
    })");
    REQUIRE(parsed.ok);
    CHECK(parsed.snapshot.alias_groups.at("git").active ==
          std::vector<std::string>{"gs=git status"});
    CHECK(parsed.warnings.size() == 1);
}

TEST_CASE_FIXTURE(AliasFixture, "projected environment carries group aliases") {
    TempTestDir tmp;
    Layout layout = make_layout(tmp.path("data"), tmp.path("home/.zshrc"));
    EnvironmentDelta env{std::map<std::string, std::string>{{"PATH", "/usr/bin"}}};
    ProfileTransitionOrchestrator orch{state, env, layout, ShellKind::Zsh};

    EnvironmentState own;
    own.aliases["gl"] = "git log";
    REQUIRE(state.set_profile_environment("work", own).isOk());
    REQUIRE(state.set_active_aliases("git", {"gs=git status", "gl=git log --oneline"}).isOk());

    auto projected = orch.projected_environment("work");
    REQUIRE(projected.isOk());
    CHECK(projected.value().aliases ==
          std::map<std::string, std::string>{{"gl", "git log"}, {"gs", "git status"}});

    SUBCASE("disabled environment contributes no aliases") {
        own.active = false;
        REQUIRE(state.set_profile_environment("work", own).isOk());
        CHECK(orch.projected_environment("work").value().aliases.empty());
    }

    SUBCASE("switching writes them into the script") {
        REQUIRE(orch.switch_profile("work").isOk());
        std::string script = tmp.read("data/env/active.sh");
        CHECK(script.find("alias gs='git status'\n") != std::string::npos);
        CHECK(script.find("alias gl='git log'\n") != std::string::npos);
    }
}
