/**
 * zshrcman CLI - profile command
 *
 * Create, inspect and switch profiles, and edit their environment.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <zshrcman/snapshot_json.hpp>

#include <algorithm>

namespace zshrcman::cli::commands {

namespace {

// Split "KEY=VALUE"; nullopt when there is no '=' or the key is empty
std::optional<std::pair<std::string, std::string>> split_assignment(const std::string& s) {
    auto eq = s.find('=');
    if (eq == std::string::npos || eq == 0) return std::nullopt;
    return std::make_pair(s.substr(0, eq), s.substr(eq + 1));
}

int cmd_profile_list(const GlobalOptions& opts) {
    auto session = open_session(opts);
    if (!session) return 1;
    const auto& state = *session->state;

    auto names = state.registry().names();
    const auto& active = state.active_profile();

    if (opts.json) {
        nlohmann::json j;
        j["profiles"] = names;
        j["active"] = active ? nlohmann::json(*active) : nlohmann::json(nullptr);
        output_json(j);
        return 0;
    }

    if (names.empty()) {
        std::cout << "No profiles found." << std::endl;
        return 0;
    }

    std::cout << "Available profiles:" << std::endl;
    for (const auto& name : names) {
        std::string marker = state.registry().is_active(name) ? " (active)" : "";
        std::cout << "  " << name << marker << std::endl;
    }
    return 0;
}

int cmd_profile_current(const GlobalOptions& opts) {
    auto session = open_session(opts);
    if (!session) return 1;
    const auto& active = session->state->active_profile();

    if (opts.json) {
        nlohmann::json j;
        j["active"] = active ? nlohmann::json(*active) : nlohmann::json(nullptr);
        output_json(j);
    } else {
        std::cout << active.value_or("(none)") << std::endl;
    }
    return 0;
}

int cmd_profile_show(const GlobalOptions& opts, const std::string& name) {
    auto session = open_session(opts);
    if (!session) return 1;

    const auto* profile = session->state->registry().find(name);
    if (!profile) {
        print_error("profile not found: " + name, opts.json);
        return 1;
    }

    if (opts.json) {
        output_json(nlohmann::json::parse(serialize_profile(*profile)));
        return 0;
    }

    const auto& env = profile->environment;
    std::cout << "Profile: " << profile->name << std::endl;
    if (profile->parent) std::cout << "Parent: " << *profile->parent << std::endl;

    std::cout << "\nPackages:" << std::endl;
    if (profile->packages.empty()) std::cout << "  (none)" << std::endl;
    for (const auto& p : profile->packages) std::cout << "  " << p << std::endl;

    std::cout << "\nEnvironment" << (env.active ? "" : " (disabled)") << ":" << std::endl;
    for (const auto& p : env.paths_prepend) std::cout << "  PATH+ " << p << std::endl;
    for (const auto& p : env.paths_append) std::cout << "  +PATH " << p << std::endl;
    for (const auto& [key, value] : env.variables) {
        std::cout << "  " << key << "=" << value << std::endl;
    }
    for (const auto& [alias, command] : env.aliases) {
        std::cout << "  alias " << alias << "='" << command << "'" << std::endl;
    }

    if (!profile->alias_groups.empty()) {
        std::cout << "\nAlias groups:";
        for (const auto& group : profile->alias_groups) std::cout << " " << group;
        std::cout << std::endl;
    }

    if (!profile->os_overrides.empty()) {
        std::cout << "\nOS overrides:";
        for (const auto& [os, ovr] : profile->os_overrides) std::cout << " " << os;
        std::cout << std::endl;
    }
    return 0;
}

int cmd_profile_create(const GlobalOptions& opts, const std::string& name,
                       const std::string& parent) {
    auto session = open_session(opts);
    if (!session) return 1;

    std::optional<std::string> parent_name;
    if (!parent.empty()) parent_name = parent;

    auto result = session->state->create_profile(name, parent_name);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["profile"] = name;
        j["parent"] = parent_name ? nlohmann::json(*parent_name) : nlohmann::json(nullptr);
        output_json(j);
    } else {
        print_success("Created profile '" + name + "'", opts);
    }
    return 0;
}

int cmd_profile_delete(const GlobalOptions& opts, const std::string& name) {
    auto session = open_session(opts);
    if (!session) return 1;

    auto result = session->state->delete_profile(name);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["deleted"] = name;
        output_json(j);
    } else {
        print_success("Deleted profile '" + name + "'", opts);
    }
    return 0;
}

int report_transition(const GlobalOptions& opts, ProfileTransitionOrchestrator& orch,
                      const Result<void>& result, const std::string& message) {
    if (result.isErr()) {
        print_transition_error(orch, result.error(), opts);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        const auto& report = orch.last_report();
        nlohmann::json steps = nlohmann::json::array();
        if (report) {
            for (auto step : report->completed) steps.push_back(transition_step_to_string(step));
        }
        j["completed_steps"] = steps;
        output_json(j);
    } else {
        print_success(message, opts);
    }
    return 0;
}

int cmd_profile_switch(const GlobalOptions& opts, const std::string& name) {
    auto session = open_session(opts);
    if (!session) return 1;

    auto orch = session->orchestrator();
    auto result = orch.switch_profile(name);
    return report_transition(opts, orch, result, "Switched to profile '" + name + "'");
}

int cmd_profile_activate(const GlobalOptions& opts, const std::string& name) {
    auto session = open_session(opts);
    if (!session) return 1;

    auto orch = session->orchestrator();
    auto result = orch.activate_profile(name);
    return report_transition(opts, orch, result, "Profile '" + name + "' activated");
}

int cmd_profile_deactivate(const GlobalOptions& opts, bool clear_marker) {
    auto session = open_session(opts);
    if (!session) return 1;

    auto previous = session->state->active_profile();
    auto orch = session->orchestrator();
    auto result = orch.deactivate_current(clear_marker);
    std::string message = previous ? "Profile '" + *previous + "' deactivated"
                                   : std::string("No active profile");
    return report_transition(opts, orch, result, message);
}

int cmd_profile_resync(const GlobalOptions& opts) {
    auto session = open_session(opts);
    if (!session) return 1;

    auto active = session->state->active_profile();
    auto orch = session->orchestrator();
    if (!active) {
        return report_transition(opts, orch, Result<void>::ok(), "No active profile");
    }

    auto result = orch.activate_profile(*active);
    return report_transition(opts, orch, result, "Profile '" + *active + "' resynced");
}

struct EnvEditOptions {
    std::string name;
    std::vector<std::string> prepend;
    std::vector<std::string> append;
    std::vector<std::string> set;
    std::vector<std::string> unset;
    std::vector<std::string> alias;
    std::vector<std::string> unalias;
    bool enable = false;
    bool disable = false;
    bool clear_paths = false;
};

int cmd_profile_env(const GlobalOptions& opts, const EnvEditOptions& edit) {
    auto session = open_session(opts);
    if (!session) return 1;
    auto& state = *session->state;

    const auto* profile = state.registry().find(edit.name);
    if (!profile) {
        print_error("profile not found: " + edit.name, opts.json);
        return 1;
    }

    EnvironmentState env = profile->environment;

    if (edit.clear_paths) {
        env.paths_prepend.clear();
        env.paths_append.clear();
    }
    for (const auto& p : edit.prepend) {
        if (std::find(env.paths_prepend.begin(), env.paths_prepend.end(), p) ==
            env.paths_prepend.end()) {
            env.paths_prepend.push_back(p);
        }
    }
    for (const auto& p : edit.append) {
        if (std::find(env.paths_append.begin(), env.paths_append.end(), p) ==
            env.paths_append.end()) {
            env.paths_append.push_back(p);
        }
    }
    for (const auto& s : edit.set) {
        auto kv = split_assignment(s);
        if (!kv) {
            print_error("Expected KEY=VALUE, got: " + s, opts.json);
            return 1;
        }
        env.variables[kv->first] = kv->second;
    }
    for (const auto& key : edit.unset) env.variables.erase(key);
    for (const auto& a : edit.alias) {
        auto kv = split_assignment(a);
        if (!kv) {
            print_error("Expected NAME=COMMAND, got: " + a, opts.json);
            return 1;
        }
        env.aliases[kv->first] = kv->second;
    }
    for (const auto& name : edit.unalias) env.aliases.erase(name);
    if (edit.enable) env.active = true;
    if (edit.disable) env.active = false;

    auto result = state.set_profile_environment(edit.name, env);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    // The generated script of the active profile must follow the edit
    if (state.registry().is_active(edit.name)) {
        auto orch = session->orchestrator();
        auto applied = orch.activate_profile(edit.name);
        if (applied.isErr()) {
            print_transition_error(orch, applied.error(), opts);
            return 1;
        }
    }

    if (opts.json) {
        output_json(nlohmann::json::parse(serialize_environment_state(env)));
    } else {
        print_success("Updated environment of profile '" + edit.name + "'", opts);
    }
    return 0;
}

} // anonymous namespace

void setup_profile(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    // profile list
    auto* list_cmd = app->add_subcommand("list", "List profiles");
    list_cmd->callback([&opts]() {
        std::exit(cmd_profile_list(opts));
    });

    // profile current
    auto* current_cmd = app->add_subcommand("current", "Print the active profile");
    current_cmd->callback([&opts]() {
        std::exit(cmd_profile_current(opts));
    });

    // profile show <name>
    static std::string show_name;
    auto* show_cmd = app->add_subcommand("show", "Show profile details");
    show_cmd->add_option("name", show_name, "Profile name")->required();
    show_cmd->callback([&opts]() {
        std::exit(cmd_profile_show(opts, show_name));
    });

    // profile create <name> [--parent P]
    static std::string create_name;
    static std::string create_parent;
    auto* create_cmd = app->add_subcommand("create", "Create a profile");
    create_cmd->add_option("name", create_name, "Profile name")->required();
    create_cmd->add_option("--parent", create_parent, "Parent profile (recorded only)");
    create_cmd->callback([&opts]() {
        std::exit(cmd_profile_create(opts, create_name, create_parent));
    });

    // profile delete <name>
    static std::string delete_name;
    auto* delete_cmd = app->add_subcommand("delete", "Delete an inactive profile");
    delete_cmd->add_option("name", delete_name, "Profile name")->required();
    delete_cmd->callback([&opts]() {
        std::exit(cmd_profile_delete(opts, delete_name));
    });

    // profile switch <name>
    static std::string switch_name;
    auto* switch_cmd = app->add_subcommand("switch", "Switch the active profile");
    switch_cmd->add_option("name", switch_name, "Profile name")->required();
    switch_cmd->callback([&opts]() {
        std::exit(cmd_profile_switch(opts, switch_name));
    });

    // profile activate <name>
    static std::string activate_name;
    auto* activate_cmd = app->add_subcommand("activate",
                                             "Apply a profile's environment and binaries");
    activate_cmd->add_option("name", activate_name, "Profile name")->required();
    activate_cmd->callback([&opts]() {
        std::exit(cmd_profile_activate(opts, activate_name));
    });

    // profile deactivate [--clear-marker]
    static bool clear_marker = false;
    auto* deactivate_cmd = app->add_subcommand("deactivate", "Deactivate the active profile");
    deactivate_cmd->add_flag("--clear-marker", clear_marker,
                             "Also remove the profile marker from the shell config");
    deactivate_cmd->callback([&opts]() {
        std::exit(cmd_profile_deactivate(opts, clear_marker));
    });

    // profile resync
    auto* resync_cmd = app->add_subcommand("resync",
                                           "Regenerate script, links and marker of the active profile");
    resync_cmd->callback([&opts]() {
        std::exit(cmd_profile_resync(opts));
    });

    // profile env <name> [edits...]
    static EnvEditOptions edit;
    auto* env_cmd = app->add_subcommand("env", "Edit a profile's environment");
    env_cmd->add_option("name", edit.name, "Profile name")->required();
    env_cmd->add_option("--prepend", edit.prepend, "Path to prepend to PATH");
    env_cmd->add_option("--append", edit.append, "Path to append to PATH");
    env_cmd->add_option("--set", edit.set, "Variable as KEY=VALUE");
    env_cmd->add_option("--unset", edit.unset, "Variable to remove");
    env_cmd->add_option("--alias", edit.alias, "Alias as NAME=COMMAND");
    env_cmd->add_option("--unalias", edit.unalias, "Alias to remove");
    auto* enable_flag = env_cmd->add_flag("--enable", edit.enable, "Enable the environment");
    auto* disable_flag = env_cmd->add_flag("--disable", edit.disable, "Disable the environment");
    enable_flag->excludes(disable_flag);
    env_cmd->add_flag("--clear-paths", edit.clear_paths, "Drop all PATH entries first");
    env_cmd->callback([&opts]() {
        std::exit(cmd_profile_env(opts, edit));
    });
}

} // namespace zshrcman::cli::commands
