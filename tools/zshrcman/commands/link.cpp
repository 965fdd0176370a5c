/**
 * zshrcman CLI - link command
 *
 * Record where a package's binary lives and relink the active profile.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <filesystem>

namespace zshrcman::cli::commands {

namespace {

int cmd_link(const GlobalOptions& opts, const std::string& package, const std::string& location) {
    auto session = open_session(opts);
    if (!session) return 1;

    std::error_code ec;
    std::string absolute = std::filesystem::absolute(location, ec).string();
    if (ec) absolute = location;

    auto result = session->state->set_location(package, absolute);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
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
        j["package"] = package;
        j["location"] = absolute;
        output_json(j);
    } else {
        print_success(package + " -> " + absolute, opts);
    }
    return 0;
}

} // anonymous namespace

void setup_link(CLI::App* app, GlobalOptions& opts) {
    static std::string package;
    static std::string location;

    app->add_option("package", package, "Installed package")->required();
    app->add_option("location", location, "Path of the package binary")->required();

    app->callback([&opts]() {
        std::exit(cmd_link(opts, package, location));
    });
}

} // namespace zshrcman::cli::commands
