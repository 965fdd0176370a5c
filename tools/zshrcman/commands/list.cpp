/**
 * zshrcman CLI - list command
 *
 * List installed packages, or the packages of one profile.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <zshrcman/snapshot_json.hpp>

namespace zshrcman::cli::commands {

namespace {

std::string join(const std::set<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

int cmd_list(const GlobalOptions& opts, const std::string& profile) {
    auto session = open_session(opts);
    if (!session) return 1;
    const auto& state = *session->state;

    std::vector<std::string> packages;
    if (profile.empty()) {
        packages = state.ledger().package_names();
    } else {
        if (!state.registry().contains(profile)) {
            print_error("profile not found: " + profile, opts.json);
            return 1;
        }
        packages = state.active_packages(profile);
    }

    if (opts.json) {
        nlohmann::json j;
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& name : packages) {
            if (const auto* rec = state.package_info(name)) {
                arr.push_back(nlohmann::json::parse(serialize_installation_record(*rec)));
            }
        }
        j["packages"] = arr;
        if (!profile.empty()) j["profile"] = profile;
        output_json(j);
        return 0;
    }

    if (packages.empty()) {
        std::cout << "No packages installed." << std::endl;
        return 0;
    }

    for (const auto& name : packages) {
        const auto* rec = state.package_info(name);
        if (!rec) continue;
        std::cout << name;
        if (rec->version) std::cout << "@" << *rec->version;
        std::cout << " [" << install_scope_to_string(rec->scope) << "]";
        if (rec->active_for.empty()) {
            std::cout << " (unused)";
        } else {
            std::cout << " (" << join(rec->active_for) << ")";
        }
        std::cout << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static std::string profile;

    app->add_option("--profile", profile, "Only packages of this profile");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, profile));
    });
}

} // namespace zshrcman::cli::commands
