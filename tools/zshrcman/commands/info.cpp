/**
 * zshrcman CLI - info command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <zshrcman/snapshot_json.hpp>

namespace zshrcman::cli::commands {

namespace {

int cmd_info(const GlobalOptions& opts, const std::string& package) {
    auto session = open_session(opts);
    if (!session) return 1;
    const auto& state = *session->state;

    const auto* rec = state.package_info(package);
    if (!rec) {
        print_error("package not installed: " + package, opts.json);
        return 1;
    }

    if (opts.json) {
        output_json(nlohmann::json::parse(serialize_installation_record(*rec)));
        return 0;
    }

    std::cout << "Package: " << rec->package << std::endl;
    std::cout << "Version: " << rec->version.value_or("(unknown)") << std::endl;
    std::cout << "Installed: " << rec->installed_at << std::endl;
    std::cout << "Installed by: " << installation_source_to_string(rec->installed_by) << std::endl;
    std::cout << "Scope: " << install_scope_to_string(rec->scope) << std::endl;
    std::cout << "Installer: " << rec->installer_type << std::endl;
    std::cout << "Location: " << rec->location.value_or("(none)") << std::endl;
    std::cout << "Active for:";
    if (rec->active_for.empty()) std::cout << " (none)";
    for (const auto& profile : rec->active_for) std::cout << " " << profile;
    std::cout << std::endl;
    return 0;
}

} // anonymous namespace

void setup_info(CLI::App* app, GlobalOptions& opts) {
    static std::string package;

    app->add_option("package", package, "Package name")->required();

    app->callback([&opts]() {
        std::exit(cmd_info(opts, package));
    });
}

} // namespace zshrcman::cli::commands
