/**
 * zshrcman CLI - Common utilities and types
 */

#pragma once

#include <zshrcman/environment.hpp>
#include <zshrcman/installation_state.hpp>
#include <zshrcman/layout.hpp>
#include <zshrcman/platform.hpp>
#include <zshrcman/profile_transition.hpp>
#include <zshrcman/snapshot_store.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace zshrcman::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string shell_config;      // --shell-config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the zshrcman data root.
 * Priority: --root flag > ZSHRCMAN_ROOT env > $XDG_DATA_HOME/zshrcman > ~/.local/share/zshrcman
 */
inline std::string resolve_root(const std::string& override_root) {
    if (!override_root.empty()) {
        return override_root;
    }

    if (auto env_root = get_env("ZSHRCMAN_ROOT"); env_root && !env_root->empty()) {
        return *env_root;
    }

    if (auto xdg = get_env("XDG_DATA_HOME"); xdg && !xdg->empty()) {
        return join_path(*xdg, "zshrcman");
    }

    auto home = get_env("HOME");
    if (!home || home->empty()) home = get_env("USERPROFILE");
    if (home && !home->empty()) {
        return join_path(*home, ".local/share/zshrcman");
    }

    return ".zshrcman";
}

inline ShellKind resolve_shell() {
    return detect_shell(get_env("SHELL").value_or(""));
}

/**
 * Resolve the shell startup file.
 * Priority: --shell-config flag > ZSHRCMAN_SHELL_CONFIG env > derived from $SHELL
 */
inline std::string resolve_shell_config(const std::string& override_path, ShellKind shell) {
    if (!override_path.empty()) {
        return override_path;
    }

    if (auto env_path = get_env("ZSHRCMAN_SHELL_CONFIG"); env_path && !env_path->empty()) {
        return *env_path;
    }

    auto home = get_env("HOME");
    if (!home || home->empty()) home = get_env("USERPROFILE");
    return shell_config_path(home.value_or("."), shell);
}

/**
 * Route library logging to stderr and pick the level from the flags.
 */
inline void init_logging(const GlobalOptions& opts) {
    static bool initialized = false;
    if (!initialized) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("zshrcman"));
        spdlog::set_pattern("[%l] %v");
        initialized = true;
    }

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Output utilities.
 */
inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        output_json(j);
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& err, bool json_mode) {
    print_error(err.message(), json_mode);
}

inline void print_success(const std::string& msg, const GlobalOptions& opts) {
    if (!opts.json && !opts.quiet) {
        std::cout << msg << std::endl;
    }
}

/**
 * Everything a command needs: paths, the persisted state and the
 * in-memory environment. The store must outlive the state.
 */
struct Session {
    GlobalOptions opts;
    Layout layout;
    ShellKind shell = ShellKind::Bash;
    std::unique_ptr<JsonSnapshotStore> store;
    std::optional<InstallationState> state;
    EnvironmentDelta env;

    ProfileTransitionOrchestrator orchestrator() {
        return ProfileTransitionOrchestrator(*state, env, layout, shell);
    }
};

/**
 * Initialize logging and load state. Prints the error and returns nullptr
 * when the state cannot be loaded.
 */
inline std::unique_ptr<Session> open_session(const GlobalOptions& opts) {
    init_logging(opts);

    auto session = std::make_unique<Session>();
    session->opts = opts;
    session->shell = resolve_shell();
    session->layout = make_layout(resolve_root(opts.root),
                                  resolve_shell_config(opts.shell_config, session->shell));
    session->store = std::make_unique<JsonSnapshotStore>(session->layout.state_file);
    session->env = EnvironmentDelta::from_process();

    spdlog::debug("root: {}", session->layout.root);
    spdlog::debug("shell config: {}", session->layout.shell_config);

    auto loaded = InstallationState::load(*session->store);
    if (loaded.isErr()) {
        print_error(loaded.error(), opts.json);
        return nullptr;
    }
    session->state.emplace(std::move(loaded.value()));
    return session;
}

/**
 * Print a failed transition with a recovery hint.
 */
inline void print_transition_error(const ProfileTransitionOrchestrator& orch,
                                   const Error& err, const GlobalOptions& opts) {
    const auto& report = orch.last_report();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = err.message();
        if (report && report->failed_step) {
            j["failed_step"] = transition_step_to_string(*report->failed_step);
            nlohmann::json done = nlohmann::json::array();
            for (auto step : report->completed) done.push_back(transition_step_to_string(step));
            j["completed_steps"] = done;
        }
        output_json(j);
        return;
    }

    std::cerr << "Error: " << err.message() << std::endl;
    if (report && report->failed_step) {
        std::cerr << "  failed at step: " << transition_step_to_string(*report->failed_step)
                  << std::endl;
        std::cerr << "  run 'zshrcman profile resync' to restore a consistent state" << std::endl;
    }
}

} // namespace zshrcman::cli
