/**
 * zshrcman CLI - remove command
 *
 * Remove a package according to a removal strategy.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <zshrcman/installer.hpp>
#include <zshrcman/removal_policy.hpp>

namespace zshrcman::cli::commands {

namespace {

struct RemoveCmdOptions {
    std::string package;
    std::string strategy = "smart";
};

int cmd_remove(const GlobalOptions& opts, const RemoveCmdOptions& remove_opts) {
    auto strategy = parse_removal_strategy(remove_opts.strategy);
    if (!strategy) {
        print_error("Unknown removal strategy: " + remove_opts.strategy, opts.json);
        return 1;
    }

    auto session = open_session(opts);
    if (!session) return 1;

    RecordOnlyInstaller installer;
    RemovalPolicyResolver resolver(*session->state, installer);
    auto result = resolver.handle_removal(remove_opts.package, *strategy);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }
    const auto& outcome = result.value();

    auto orch = session->orchestrator();
    auto linked = orch.refresh_binaries();
    if (linked.isErr()) {
        print_error(linked.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["package"] = remove_opts.package;
        j["strategy"] = removal_strategy_to_string(*strategy);
        j["action"] = removal_action_to_string(outcome.action);
        j["remaining_references"] = outcome.remaining_references;
        j["orphaned"] = outcome.orphaned;
        output_json(j);
        return 0;
    }

    switch (outcome.action) {
        case RemovalAction::Uninstalled:
            print_success("Uninstalled " + remove_opts.package, opts);
            break;
        case RemovalAction::Deactivated:
        case RemovalAction::MarkedUnused:
            print_success(std::string(outcome.action == RemovalAction::MarkedUnused
                                          ? "Marked unused: "
                                          : "Deactivated: ") +
                          remove_opts.package + " (still used by " +
                          std::to_string(outcome.remaining_references) + " profile(s))", opts);
            if (outcome.orphaned) {
                print_success("  no profile uses it any more; 'zshrcman remove " +
                              remove_opts.package + " --strategy force' uninstalls it", opts);
            }
            break;
        case RemovalAction::Skipped:
            print_success("No active profile; " + remove_opts.package + " left unchanged", opts);
            break;
    }

    return 0;
}

} // anonymous namespace

void setup_remove(CLI::App* app, GlobalOptions& opts) {
    static RemoveCmdOptions remove_opts;

    app->add_option("package", remove_opts.package, "Package name")->required();
    app->add_option("--strategy", remove_opts.strategy,
                    "deactivate, remove-from-profile, smart, force, mark-unused");

    app->callback([&opts]() {
        std::exit(cmd_remove(opts, remove_opts));
    });
}

} // namespace zshrcman::cli::commands
