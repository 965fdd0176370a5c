#pragma once

/**
 * @file environment.hpp
 * @brief Projection of an EnvironmentState onto PATH/variables and shell text
 *
 * Two channels exist:
 * - EnvironmentDelta: an explicit in-memory copy of PATH and variables that
 *   apply()/reverse() mutate. It is bookkeeping only and does not outlive the
 *   process; nothing here writes to the real process environment.
 * - render(): the shell script text. Writing it to disk and sourcing it from
 *   the shell startup file is the only thing that affects future sessions.
 */

#include "zshrcman/models.hpp"
#include "zshrcman/result.hpp"
#include "zshrcman/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace zshrcman {

// ============================================================================
// Environment Delta
// ============================================================================

class EnvironmentDelta {
public:
    EnvironmentDelta() = default;
    explicit EnvironmentDelta(std::map<std::string, std::string> variables,
                              char path_separator = ':')
        : variables_(std::move(variables)), separator_(path_separator) {}

    /// Copy of the current process environment
    static EnvironmentDelta from_process();

    std::optional<std::string> get(const std::string& name) const;
    void set(const std::string& name, const std::string& value);
    void unset(const std::string& name);

    /// PATH split on the separator; empty segments are dropped
    std::vector<std::string> path_entries() const;
    void set_path_entries(const std::vector<std::string>& entries);
    bool has_path_entry(const std::string& entry) const;

    const std::map<std::string, std::string>& variables() const { return variables_; }
    char separator() const { return separator_; }

private:
    std::map<std::string, std::string> variables_;
    char separator_ = ':';
};

// ============================================================================
// Path Expansion
// ============================================================================

/**
 * Expand a leading "~" or a leading "$NAME" / "${NAME}" using the delta's
 * variables. Anything after the prefix is kept verbatim.
 * NOT_FOUND when the referenced variable is unset.
 */
Result<std::string> expand_path(const std::string& path, const EnvironmentDelta& env);

// ============================================================================
// Rendering
// ============================================================================

// Pure: the same state and shell always give the same text
std::string render_environment(const EnvironmentState& state, ShellKind shell);

// Line that sources the script from the startup file; empty for cmd
std::string source_line(ShellKind shell, const std::string& script_path);

// File extension used for generated scripts ("sh", "fish", "ps1", "bat")
const char* script_extension(ShellKind shell);

// Shell from a $SHELL value; bash when unrecognised
ShellKind detect_shell(const std::string& shell_env);

// Startup file for a shell, relative to home
std::string shell_config_path(const std::string& home, ShellKind shell);

// ============================================================================
// Environment Projector
// ============================================================================

class EnvironmentProjector {
public:
    explicit EnvironmentProjector(ShellKind shell) : shell_(shell) {}

    ShellKind shell() const { return shell_; }

    /**
     * Prepend/append the state's paths to PATH (skipping entries already
     * present) and set its variables. No-op when the state is inactive.
     */
    Result<void> apply(const EnvironmentState& state, EnvironmentDelta& env) const;

    /**
     * Remove the state's paths from PATH by exact match and erase variables
     * that still hold the value the state assigned.
     */
    Result<void> reverse(const EnvironmentState& state, EnvironmentDelta& env) const;

    std::string render(const EnvironmentState& state) const {
        return render_environment(state, shell_);
    }

    /// Render and atomically write the script, creating parent directories
    Result<void> write_script(const EnvironmentState& state, const std::string& path) const;

private:
    ShellKind shell_;
};

} // namespace zshrcman
