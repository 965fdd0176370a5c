/**
 * zshrcman CLI - install command
 *
 * Install a package for the active profile, or attach an existing
 * installation to it.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <zshrcman/installer.hpp>

namespace zshrcman::cli::commands {

namespace {

struct InstallCmdOptions {
    std::string package;
    std::string scope = "global";
    std::string version;
    std::string location;
    std::string installer = "auto";
};

int cmd_install(const GlobalOptions& opts, const InstallCmdOptions& install_opts) {
    auto scope = parse_install_scope(install_opts.scope);
    if (!scope) {
        print_error("Unknown scope: " + install_opts.scope, opts.json);
        return 1;
    }

    auto session = open_session(opts);
    if (!session) return 1;
    auto& state = *session->state;

    InstallOptions options;
    if (!install_opts.version.empty()) options.version = install_opts.version;
    if (!install_opts.location.empty()) options.location = install_opts.location;
    options.installer_type = install_opts.installer;

    RecordOnlyInstaller installer;
    auto result = state.smart_install(install_opts.package, *scope, options, installer);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }
    const auto& outcome = result.value();

    // An existing installation keeps its record; only a new location is taken
    if (outcome.action == InstallAction::Activated && options.location) {
        auto located = state.set_location(install_opts.package, *options.location);
        if (located.isErr()) {
            print_error(located.error(), opts.json);
            return 1;
        }
    }

    auto orch = session->orchestrator();
    auto linked = orch.refresh_binaries();
    if (linked.isErr()) {
        print_error(linked.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["package"] = install_opts.package;
        j["profile"] = outcome.profile;
        j["action"] = outcome.action == InstallAction::Installed ? "installed" : "activated";
        output_json(j);
    } else if (outcome.action == InstallAction::Installed) {
        print_success("Installed " + install_opts.package + " for profile '" +
                      outcome.profile + "'", opts);
    } else {
        print_success(install_opts.package + " already installed, activated for profile '" +
                      outcome.profile + "'", opts);
    }

    return 0;
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallCmdOptions install_opts;

    app->add_option("package", install_opts.package, "Package name")->required();
    app->add_option("--scope", install_opts.scope,
                    "Install scope: system, global, profile, local, device");
    app->add_option("--version", install_opts.version, "Version to record");
    app->add_option("--location", install_opts.location, "Path of the installed binary");
    app->add_option("--installer", install_opts.installer, "Installer tag to record");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace zshrcman::cli::commands
