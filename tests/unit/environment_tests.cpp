#include <doctest/doctest.h>
#include <zshrcman/environment.hpp>

#include "../test_support.hpp"

using namespace zshrcman;
using namespace zshrcman::testing;

namespace {

EnvironmentDelta make_delta(const std::string& path) {
    std::map<std::string, std::string> vars{
        {"PATH", path}, {"HOME", "/home/dev"}, {"TOOLS", "/opt/tools"}};
    return EnvironmentDelta(vars);
}

EnvironmentState sample_state() {
    EnvironmentState env;
    env.paths_prepend = {"/a", "/b"};
    env.paths_append = {"/z"};
    env.variables = {{"EDITOR", "vim"}, {"GOPATH", "/go"}};
    env.aliases = {{"ll", "ls -la"}};
    return env;
}

} // namespace

// ============================================================================
// EnvironmentDelta / expand_path
// ============================================================================

TEST_CASE("EnvironmentDelta: PATH entries") {
    auto env = make_delta("/usr/bin::/bin:");
    CHECK(env.path_entries() == std::vector<std::string>{"/usr/bin", "/bin"});
    CHECK(env.has_path_entry("/bin"));
    CHECK_FALSE(env.has_path_entry("/sbin"));

    env.set_path_entries({"/x", "/y"});
    CHECK(env.get("PATH") == std::optional<std::string>("/x:/y"));

    std::map<std::string, std::string> win_vars{{"PATH", "C:\\bin;D:\\tools"}};
    EnvironmentDelta windows(win_vars, ';');
    CHECK(windows.path_entries().size() == 2);
}

TEST_CASE("expand_path") {
    auto env = make_delta("/usr/bin");

    CHECK(expand_path("~", env).value() == "/home/dev");
    CHECK(expand_path("~/bin", env).value() == "/home/dev/bin");
    CHECK(expand_path("$TOOLS/bin", env).value() == "/opt/tools/bin");
    CHECK(expand_path("${TOOLS}/sbin", env).value() == "/opt/tools/sbin");
    CHECK(expand_path("/plain/path", env).value() == "/plain/path");
    CHECK(expand_path("~other/bin", env).value() == "~other/bin");

    auto missing = expand_path("$NOPE/bin", env);
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::NOT_FOUND);
    CHECK(missing.error().message().find("NOPE") != std::string::npos);

    std::map<std::string, std::string> no_home{{"PATH", "/bin"}};
    EnvironmentDelta homeless(no_home);
    CHECK(expand_path("~/bin", homeless).isErr());
}

// ============================================================================
// apply / reverse
// ============================================================================

TEST_CASE("apply: prepends, existing PATH, appends") {
    EnvironmentProjector projector(ShellKind::Zsh);
    auto env = make_delta("/usr/bin:/bin");

    REQUIRE(projector.apply(sample_state(), env).isOk());
    CHECK(env.path_entries() ==
          std::vector<std::string>{"/a", "/b", "/usr/bin", "/bin", "/z"});
    CHECK(env.get("EDITOR") == std::optional<std::string>("vim"));
    CHECK(env.get("GOPATH") == std::optional<std::string>("/go"));
}

TEST_CASE("apply: entries already on PATH are not duplicated") {
    EnvironmentProjector projector(ShellKind::Zsh);
    auto env = make_delta("/usr/bin:/b");

    REQUIRE(projector.apply(sample_state(), env).isOk());
    CHECK(env.path_entries() == std::vector<std::string>{"/a", "/usr/bin", "/b", "/z"});

    REQUIRE(projector.apply(sample_state(), env).isOk());
    CHECK(env.path_entries() == std::vector<std::string>{"/a", "/usr/bin", "/b", "/z"});
}

TEST_CASE("apply: expands paths against the delta") {
    EnvironmentProjector projector(ShellKind::Bash);
    auto env = make_delta("/bin");
    EnvironmentState state;
    state.paths_prepend = {"~/.cargo/bin"};
    state.paths_append = {"$TOOLS/bin"};

    REQUIRE(projector.apply(state, env).isOk());
    CHECK(env.path_entries() ==
          std::vector<std::string>{"/home/dev/.cargo/bin", "/bin", "/opt/tools/bin"});
}

TEST_CASE("apply: unexpandable path fails without touching the delta") {
    EnvironmentProjector projector(ShellKind::Bash);
    auto env = make_delta("/bin");
    EnvironmentState state;
    state.paths_prepend = {"/ok", "$MISSING/bin"};
    state.variables["X"] = "1";

    auto r = projector.apply(state, env);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::NOT_FOUND);
    CHECK(env.path_entries() == std::vector<std::string>{"/bin"});
    CHECK_FALSE(env.get("X").has_value());
}

TEST_CASE("apply: inactive state is a no-op") {
    EnvironmentProjector projector(ShellKind::Zsh);
    auto env = make_delta("/usr/bin");
    auto state = sample_state();
    state.active = false;

    REQUIRE(projector.apply(state, env).isOk());
    CHECK(env.path_entries() == std::vector<std::string>{"/usr/bin"});
    CHECK_FALSE(env.get("EDITOR").has_value());
}

TEST_CASE("reverse undoes apply") {
    EnvironmentProjector projector(ShellKind::Zsh);
    auto env = make_delta("/usr/bin:/bin");
    auto before = env.variables();

    REQUIRE(projector.apply(sample_state(), env).isOk());
    REQUIRE(projector.reverse(sample_state(), env).isOk());
    CHECK(env.variables() == before);
}

TEST_CASE("reverse keeps variables changed since apply") {
    EnvironmentProjector projector(ShellKind::Zsh);
    auto env = make_delta("/usr/bin");

    REQUIRE(projector.apply(sample_state(), env).isOk());
    env.set("EDITOR", "emacs");
    REQUIRE(projector.reverse(sample_state(), env).isOk());

    CHECK(env.get("EDITOR") == std::optional<std::string>("emacs"));
    CHECK_FALSE(env.get("GOPATH").has_value());
}

// ============================================================================
// Rendering
// ============================================================================

TEST_CASE("render: posix shells") {
    std::string expected =
        "# zshrcman profile environment\n"
        "\n"
        "export PATH=\"/a:$PATH\"\n"
        "export PATH=\"/b:$PATH\"\n"
        "export PATH=\"$PATH:/z\"\n"
        "\n"
        "export EDITOR=\"vim\"\n"
        "export GOPATH=\"/go\"\n"
        "\n"
        "alias ll='ls -la'\n";
    CHECK(render_environment(sample_state(), ShellKind::Zsh) == expected);
    CHECK(render_environment(sample_state(), ShellKind::Bash) == expected);
}

TEST_CASE("render: fish") {
    std::string expected =
        "# zshrcman profile environment\n"
        "\n"
        "set -gx PATH /a $PATH\n"
        "set -gx PATH /b $PATH\n"
        "set -gx PATH $PATH /z\n"
        "\n"
        "set -gx EDITOR \"vim\"\n"
        "set -gx GOPATH \"/go\"\n"
        "\n"
        "alias ll 'ls -la'\n";
    CHECK(render_environment(sample_state(), ShellKind::Fish) == expected);
}

TEST_CASE("render: powershell") {
    std::string expected =
        "# zshrcman profile environment\n"
        "\n"
        "$env:Path = @(\n"
        "    \"/a\",\n"
        "    \"/b\",\n"
        "    $env:Path,\n"
        "    \"/z\"\n"
        ") -join ';'\n"
        "\n"
        "$env:EDITOR = \"vim\"\n"
        "$env:GOPATH = \"/go\"\n"
        "\n"
        "function ll { ls -la }\n";
    CHECK(render_environment(sample_state(), ShellKind::PowerShell) == expected);
}

TEST_CASE("render: cmd notes aliases as comments") {
    std::string expected =
        "@echo off\n"
        "REM zshrcman profile environment\n"
        "\n"
        "set PATH=/a;/b;%PATH%;/z\n"
        "\n"
        "set EDITOR=vim\n"
        "set GOPATH=/go\n"
        "\n"
        "REM Aliases not supported in CMD batch files\n"
        "REM ll = ls -la\n";
    CHECK(render_environment(sample_state(), ShellKind::Cmd) == expected);
}

TEST_CASE("render: empty sections emit no blank lines") {
    EnvironmentState env;
    env.aliases["g"] = "git";
    CHECK(render_environment(env, ShellKind::Zsh) ==
          "# zshrcman profile environment\n\nalias g='git'\n");
    CHECK(render_environment(EnvironmentState{}, ShellKind::Fish) ==
          "# zshrcman profile environment\n\n");
}

TEST_CASE("source lines and config paths") {
    CHECK(source_line(ShellKind::Zsh, "/r/env/active.sh") ==
          "[ -f /r/env/active.sh ] && source /r/env/active.sh");
    CHECK(source_line(ShellKind::Fish, "/r/env/active.fish") ==
          "test -f /r/env/active.fish; and source /r/env/active.fish");
    CHECK(source_line(ShellKind::PowerShell, "/r/env/active.ps1") == ". \"/r/env/active.ps1\"");
    CHECK(source_line(ShellKind::Cmd, "/r/env/active.bat").empty());

    CHECK(detect_shell("/bin/zsh") == ShellKind::Zsh);
    CHECK(detect_shell("/usr/local/bin/fish") == ShellKind::Fish);
    CHECK(detect_shell("/usr/bin/pwsh") == ShellKind::PowerShell);
    CHECK(detect_shell("") == ShellKind::Bash);

    CHECK(shell_config_path("/home/dev", ShellKind::Zsh) == "/home/dev/.zshrc");
    CHECK(shell_config_path("/home/dev", ShellKind::Fish) == "/home/dev/.config/fish/config.fish");
    CHECK(std::string(script_extension(ShellKind::PowerShell)) == "ps1");
}

TEST_CASE("write_script writes the rendered text") {
    TempTestDir tmp;
    EnvironmentProjector projector(ShellKind::Bash);
    REQUIRE(projector.write_script(sample_state(), tmp.path("env/active.sh")).isOk());
    CHECK(tmp.read("env/active.sh") == render_environment(sample_state(), ShellKind::Bash));
}
