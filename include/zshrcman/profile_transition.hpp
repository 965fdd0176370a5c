#pragma once

/**
 * @file profile_transition.hpp
 * @brief Ordered profile switch / activate / deactivate protocol
 *
 * A switch runs five steps in order:
 *   1. DeactivateOld       reverse the old environment, clear its bin dir
 *   2. UpdatePointer       move the active-profile pointer, persist
 *   3. ActivateEnvironment apply the new environment, write the script
 *   4. RelinkBinaries      repopulate the new profile's bin dir
 *   5. UpdateShellMarker   rewrite the marker line in the startup file
 *
 * The first failing step aborts the rest. Completed steps are NOT rolled
 * back: a failure after step 2 leaves the pointer moved. The report records
 * the last completed step and resume() runs whatever is left; every step is
 * idempotent so re-running is safe.
 */

#include "zshrcman/binary_linker.hpp"
#include "zshrcman/environment.hpp"
#include "zshrcman/installation_state.hpp"
#include "zshrcman/layout.hpp"
#include "zshrcman/result.hpp"
#include "zshrcman/shell_config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace zshrcman {

enum class TransitionStep {
    DeactivateOld,
    UpdatePointer,
    ActivateEnvironment,
    RelinkBinaries,
    UpdateShellMarker,
    ClearPointer
};

inline const char* transition_step_to_string(TransitionStep s) {
    switch (s) {
        case TransitionStep::DeactivateOld: return "deactivate-old";
        case TransitionStep::UpdatePointer: return "update-pointer";
        case TransitionStep::ActivateEnvironment: return "activate-environment";
        case TransitionStep::RelinkBinaries: return "relink-binaries";
        case TransitionStep::UpdateShellMarker: return "update-shell-marker";
        case TransitionStep::ClearPointer: return "clear-pointer";
        default: return "unknown";
    }
}

enum class TransitionKind {
    Switch,
    Activate,
    Deactivate
};

struct TransitionReport {
    TransitionKind kind = TransitionKind::Switch;
    std::string target;                   // empty for Deactivate
    std::optional<std::string> previous;  // profile active before the transition
    std::vector<TransitionStep> completed;
    std::optional<TransitionStep> failed_step;
    std::string error;

    std::optional<TransitionStep> last_completed() const {
        if (completed.empty()) return std::nullopt;
        return completed.back();
    }
    bool complete() const;
};

// Steps making up a transition kind, in execution order
std::vector<TransitionStep> transition_steps(TransitionKind kind);

// ============================================================================
// Profile Transition Orchestrator
// ============================================================================

class ProfileTransitionOrchestrator {
public:
    ProfileTransitionOrchestrator(InstallationState& state,
                                  EnvironmentDelta& env,
                                  const Layout& layout,
                                  ShellKind shell);

    /// Full five-step switch. NOT_FOUND before any step if the target is unknown.
    Result<void> switch_profile(const std::string& name);

    /// Steps 3-5 only, for when no profile was active or it was deactivated already
    Result<void> activate_profile(const std::string& name);

    /**
     * Reverse the active environment, clear its bin dir and clear the
     * pointer. The marker line is removed only when clear_marker is set.
     * No-op when nothing is active.
     */
    Result<void> deactivate_current(bool clear_marker = false);

    /// Re-run the steps left over by the last failed transition
    Result<void> resume();

    /// Relink the active profile's bin dir after package changes
    Result<void> refresh_binaries();

    /// Profile environment with its bin dir prepended to PATH and the
    /// active aliases of its enabled alias groups merged in
    Result<EnvironmentState> projected_environment(const std::string& profile) const;

    const std::optional<TransitionReport>& last_report() const { return report_; }

    const BinaryLinker& linker() const { return linker_; }
    const ShellConfigMarker& marker() const { return marker_; }

private:
    Result<void> run(TransitionReport report);
    Result<void> run_remaining();
    Result<void> run_step(TransitionStep step);

    Result<void> step_deactivate_old();
    Result<void> step_activate_environment();
    Result<void> step_relink_binaries(const std::string& profile);
    Result<void> step_clear_pointer();

    InstallationState& state_;
    EnvironmentDelta& env_;
    Layout layout_;
    EnvironmentProjector projector_;
    BinaryLinker linker_;
    ShellConfigMarker marker_;
    bool clear_marker_ = false;
    std::optional<TransitionReport> report_;
};

} // namespace zshrcman
