/**
 * zshrcman CLI - alias command
 *
 * Manage alias groups and which profiles enable them.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <algorithm>

namespace zshrcman::cli::commands {

namespace {

// Regenerate the active profile's script when it enables the group
int resync_if_enabled(Session& session, const std::string& group) {
    const auto& active = session.state->active_profile();
    if (!active) return 0;
    const auto* profile = session.state->registry().find(*active);
    if (!profile || profile->alias_groups.count(group) == 0) return 0;

    auto orch = session.orchestrator();
    auto applied = orch.activate_profile(*active);
    if (applied.isErr()) {
        print_transition_error(orch, applied.error(), session.opts);
        return 1;
    }
    return 0;
}

int cmd_alias_list(const GlobalOptions& opts, const std::string& group) {
    auto session = open_session(opts);
    if (!session) return 1;
    const auto& state = *session->state;

    if (!group.empty()) {
        const auto* entry = state.alias_group(group);
        if (!entry) {
            print_error("alias group not found: " + group, opts.json);
            return 1;
        }
        if (opts.json) {
            nlohmann::json j;
            j["name"] = entry->name;
            j["items"] = entry->items;
            j["active"] = entry->active;
            output_json(j);
            return 0;
        }

        std::cout << "Alias group '" << group << "': " << entry->items.size() << " total, "
                  << entry->active.size() << " active" << std::endl;
        for (const auto& def : entry->items) {
            bool on = std::find(entry->active.begin(), entry->active.end(), def) !=
                      entry->active.end();
            std::cout << "  [" << (on ? "x" : " ") << "] " << def << std::endl;
        }
        return 0;
    }

    if (opts.json) {
        nlohmann::json groups = nlohmann::json::array();
        for (const auto& [name, entry] : state.alias_groups()) {
            nlohmann::json g;
            g["name"] = name;
            g["total"] = entry.items.size();
            g["active"] = entry.active.size();
            groups.push_back(g);
        }
        nlohmann::json j;
        j["groups"] = groups;
        output_json(j);
        return 0;
    }

    if (state.alias_groups().empty()) {
        std::cout << "No alias groups." << std::endl;
        return 0;
    }
    for (const auto& [name, entry] : state.alias_groups()) {
        std::cout << name << ": " << entry.items.size() << " total, " << entry.active.size()
                  << " active" << std::endl;
    }
    return 0;
}

int cmd_alias_add(const GlobalOptions& opts, const std::string& group,
                  const std::string& definition) {
    auto session = open_session(opts);
    if (!session) return 1;

    auto added = session->state->add_alias(group, definition);
    if (added.isErr()) {
        print_error(added.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["added"] = added.value();
        output_json(j);
    } else if (added.value()) {
        print_success("Added alias to group '" + group + "': " + definition, opts);
    } else {
        print_success("Alias already in group '" + group + "'", opts);
    }
    return 0;
}

int cmd_alias_remove(const GlobalOptions& opts, const std::string& group,
                     const std::string& definition) {
    auto session = open_session(opts);
    if (!session) return 1;

    auto removed = session->state->remove_alias(group, definition);
    if (removed.isErr()) {
        print_error(removed.error(), opts.json);
        return 1;
    }
    if (resync_if_enabled(*session, group) != 0) return 1;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        output_json(j);
    } else {
        print_success("Removed alias from group '" + group + "': " + definition, opts);
    }
    return 0;
}

struct SelectOptions {
    std::string group;
    std::vector<std::string> definitions;
    bool all = false;
    bool none = false;
};

int cmd_alias_select(const GlobalOptions& opts, const SelectOptions& select) {
    auto session = open_session(opts);
    if (!session) return 1;

    const auto* entry = session->state->alias_group(select.group);
    if (!entry) {
        print_error("alias group not found: " + select.group, opts.json);
        return 1;
    }

    std::vector<std::string> chosen = select.definitions;
    if (select.all) chosen = entry->items;
    if (select.none) chosen.clear();

    auto result = session->state->set_active_aliases(select.group, chosen);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }
    if (resync_if_enabled(*session, select.group) != 0) return 1;

    const auto* updated = session->state->alias_group(select.group);
    if (opts.json) {
        nlohmann::json j;
        j["name"] = select.group;
        j["active"] = updated->active;
        output_json(j);
    } else {
        print_success("Group '" + select.group + "' has " +
                      std::to_string(updated->active.size()) + " active alias(es)", opts);
    }
    return 0;
}

int cmd_alias_delete(const GlobalOptions& opts, const std::string& group) {
    auto session = open_session(opts);
    if (!session) return 1;

    // Checked before deletion, the group is gone afterwards
    auto active = session->state->active_profile();
    bool affects_active = false;
    if (active) {
        const auto* profile = session->state->registry().find(*active);
        affects_active = profile && profile->alias_groups.count(group) != 0;
    }

    auto result = session->state->delete_alias_group(group);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (affects_active) {
        auto orch = session->orchestrator();
        auto applied = orch.activate_profile(*active);
        if (applied.isErr()) {
            print_transition_error(orch, applied.error(), opts);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        output_json(j);
    } else {
        print_success("Deleted alias group '" + group + "'", opts);
    }
    return 0;
}

int cmd_alias_enable(const GlobalOptions& opts, const std::string& group,
                     const std::string& profile_opt, bool enable) {
    auto session = open_session(opts);
    if (!session) return 1;
    auto& state = *session->state;

    std::string profile = profile_opt;
    if (profile.empty()) {
        if (!state.active_profile()) {
            print_error("no active profile; pass --profile", opts.json);
            return 1;
        }
        profile = *state.active_profile();
    }

    auto result = enable ? state.enable_alias_group(profile, group)
                         : state.disable_alias_group(profile, group);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (state.registry().is_active(profile)) {
        auto orch = session->orchestrator();
        auto applied = orch.activate_profile(profile);
        if (applied.isErr()) {
            print_transition_error(orch, applied.error(), opts);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["profile"] = profile;
        j["alias_groups"] = state.registry().find(profile)->alias_groups;
        output_json(j);
    } else {
        print_success(std::string(enable ? "Enabled" : "Disabled") + " alias group '" + group +
                      "' for profile '" + profile + "'", opts);
    }
    return 0;
}

} // anonymous namespace

void setup_alias(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    // alias list [group]
    static std::string list_group;
    auto* list_cmd = app->add_subcommand("list", "List alias groups, or the aliases of one");
    list_cmd->add_option("group", list_group, "Group name");
    list_cmd->callback([&opts]() {
        std::exit(cmd_alias_list(opts, list_group));
    });

    // alias add <group> <name=command>
    static std::string add_group;
    static std::string add_definition;
    auto* add_cmd = app->add_subcommand("add", "Add an alias to a group");
    add_cmd->add_option("group", add_group, "Group name")->required();
    add_cmd->add_option("definition", add_definition, "Alias as NAME=COMMAND")->required();
    add_cmd->callback([&opts]() {
        std::exit(cmd_alias_add(opts, add_group, add_definition));
    });

    // alias remove <group> <name=command>
    static std::string remove_group;
    static std::string remove_definition;
    auto* remove_cmd = app->add_subcommand("remove", "Remove an alias from a group");
    remove_cmd->add_option("group", remove_group, "Group name")->required();
    remove_cmd->add_option("definition", remove_definition, "Alias as NAME=COMMAND")->required();
    remove_cmd->callback([&opts]() {
        std::exit(cmd_alias_remove(opts, remove_group, remove_definition));
    });

    // alias select <group> [definitions...] [--all | --none]
    static SelectOptions select;
    auto* select_cmd = app->add_subcommand("select", "Choose the active aliases of a group");
    select_cmd->add_option("group", select.group, "Group name")->required();
    select_cmd->add_option("definitions", select.definitions, "Aliases to activate");
    auto* all_flag = select_cmd->add_flag("--all", select.all, "Activate every alias");
    auto* none_flag = select_cmd->add_flag("--none", select.none, "Deactivate every alias");
    all_flag->excludes(none_flag);
    select_cmd->callback([&opts]() {
        std::exit(cmd_alias_select(opts, select));
    });

    // alias delete <group>
    static std::string delete_group;
    auto* delete_cmd = app->add_subcommand("delete", "Delete a group");
    delete_cmd->add_option("group", delete_group, "Group name")->required();
    delete_cmd->callback([&opts]() {
        std::exit(cmd_alias_delete(opts, delete_group));
    });

    // alias enable|disable <group> [--profile P]
    static std::string enable_group;
    static std::string enable_profile;
    auto* enable_cmd = app->add_subcommand("enable", "Enable a group for a profile");
    enable_cmd->add_option("group", enable_group, "Group name")->required();
    enable_cmd->add_option("--profile", enable_profile, "Profile (defaults to the active one)");
    enable_cmd->callback([&opts]() {
        std::exit(cmd_alias_enable(opts, enable_group, enable_profile, true));
    });

    static std::string disable_group;
    static std::string disable_profile;
    auto* disable_cmd = app->add_subcommand("disable", "Disable a group for a profile");
    disable_cmd->add_option("group", disable_group, "Group name")->required();
    disable_cmd->add_option("--profile", disable_profile, "Profile (defaults to the active one)");
    disable_cmd->callback([&opts]() {
        std::exit(cmd_alias_enable(opts, disable_group, disable_profile, false));
    });
}

} // namespace zshrcman::cli::commands
