/**
 * zshrcman CLI - status command
 *
 * Active profile, paths, linked binaries and invariant check.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace zshrcman::cli::commands {

namespace {

int cmd_status(const GlobalOptions& opts) {
    auto session = open_session(opts);
    if (!session) return 1;
    const auto& state = *session->state;

    auto orch = session->orchestrator();
    auto marker = orch.marker().current();
    auto problems = state.verify_consistency();
    const auto& active = state.active_profile();

    std::vector<std::string> linked;
    if (active) linked = orch.linker().linked(*active);

    if (opts.json) {
        nlohmann::json j;
        j["root"] = session->layout.root;
        j["shell"] = shell_kind_to_string(session->shell);
        j["shell_config"] = session->layout.shell_config;
        j["os"] = os_type_to_string(detect_os());
        j["active_profile"] = active ? nlohmann::json(*active) : nlohmann::json(nullptr);
        j["shell_marker"] = marker ? nlohmann::json(*marker) : nlohmann::json(nullptr);
        j["packages"] = state.ledger().size();
        j["profiles"] = state.registry().size();
        j["linked"] = linked;
        j["problems"] = problems;
        output_json(j);
        return problems.empty() ? 0 : 1;
    }

    std::cout << "Root: " << session->layout.root << std::endl;
    std::cout << "Shell: " << shell_kind_to_string(session->shell)
              << " (" << session->layout.shell_config << ")" << std::endl;
    std::cout << "Active profile: " << active.value_or("(none)") << std::endl;
    if (marker != active) {
        std::cout << "Shell marker: " << marker.value_or("(none)")
                  << " (out of date, run 'zshrcman profile resync')" << std::endl;
    }
    std::cout << "Packages: " << state.ledger().size()
              << ", profiles: " << state.registry().size() << std::endl;

    if (!linked.empty()) {
        std::cout << "Linked binaries:" << std::endl;
        for (const auto& name : linked) std::cout << "  " << name << std::endl;
    }

    if (!problems.empty()) {
        std::cout << "Problems:" << std::endl;
        for (const auto& p : problems) std::cout << "  " << p << std::endl;
        return 1;
    }
    return 0;
}

} // anonymous namespace

void setup_status(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_status(opts));
    });
}

} // namespace zshrcman::cli::commands
