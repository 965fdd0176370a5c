/**
 * zshrcman CLI - Entry Point
 *
 * Profile-scoped package and shell environment manager.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace zshrcman::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_remove(CLI::App* app, GlobalOptions& opts);
    void setup_link(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_info(CLI::App* app, GlobalOptions& opts);
    void setup_status(CLI::App* app, GlobalOptions& opts);
    void setup_profile(CLI::App* app, GlobalOptions& opts);
    void setup_env(CLI::App* app, GlobalOptions& opts);
    void setup_alias(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace zshrcman::cli;

    CLI::App app{"zshrcman - profile-scoped package and environment manager"};
    app.set_version_flag("-V,--version", ZSHRCMAN_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "zshrcman data directory");
    app.add_option("--shell-config", opts.shell_config, "Shell startup file to manage");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install a package for the active profile");
    commands::setup_install(install_cmd, opts);

    auto* remove_cmd = app.add_subcommand("remove", "Remove a package using a removal strategy");
    commands::setup_remove(remove_cmd, opts);

    auto* link_cmd = app.add_subcommand("link", "Record the binary location of a package");
    commands::setup_link(link_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List installed packages");
    commands::setup_list(list_cmd, opts);

    auto* info_cmd = app.add_subcommand("info", "Show one installation record");
    commands::setup_info(info_cmd, opts);

    auto* status_cmd = app.add_subcommand("status", "Show the active profile and consistency");
    commands::setup_status(status_cmd, opts);

    auto* profile_cmd = app.add_subcommand("profile", "Manage profiles");
    commands::setup_profile(profile_cmd, opts);

    auto* env_cmd = app.add_subcommand("env", "Inspect generated environments");
    commands::setup_env(env_cmd, opts);

    auto* alias_cmd = app.add_subcommand("alias", "Manage alias groups");
    commands::setup_alias(alias_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
