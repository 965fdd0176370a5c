/**
 * zshrcman CLI - env command
 *
 * Print the script a profile's environment renders to.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace zshrcman::cli::commands {

namespace {

int cmd_env_render(const GlobalOptions& opts, const std::string& name, const std::string& shell) {
    auto session = open_session(opts);
    if (!session) return 1;

    ShellKind kind = session->shell;
    if (!shell.empty()) {
        auto parsed = parse_shell_kind(shell);
        if (!parsed) {
            print_error("Unknown shell: " + shell, opts.json);
            return 1;
        }
        kind = *parsed;
    }

    std::string profile = name;
    if (profile.empty()) {
        const auto& active = session->state->active_profile();
        if (!active) {
            print_error("no active profile; pass a profile name", opts.json);
            return 1;
        }
        profile = *active;
    }

    auto orch = session->orchestrator();
    auto projected = orch.projected_environment(profile);
    if (projected.isErr()) {
        print_error(projected.error(), opts.json);
        return 1;
    }

    std::string script = render_environment(projected.value(), kind);
    if (opts.json) {
        nlohmann::json j;
        j["profile"] = profile;
        j["shell"] = shell_kind_to_string(kind);
        j["script"] = script;
        output_json(j);
    } else {
        std::cout << script;
    }
    return 0;
}

} // anonymous namespace

void setup_env(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    // env render [profile] [--shell S]
    static std::string render_profile;
    static std::string render_shell;
    auto* render_cmd = app->add_subcommand("render", "Print a profile's environment script");
    render_cmd->add_option("profile", render_profile, "Profile name (defaults to active)");
    render_cmd->add_option("--shell", render_shell, "zsh, bash, fish, powershell, cmd");
    render_cmd->callback([&opts]() {
        std::exit(cmd_env_render(opts, render_profile, render_shell));
    });
}

} // namespace zshrcman::cli::commands
