#pragma once

#include "zshrcman/installation_state.hpp"
#include "zshrcman/installer.hpp"
#include "zshrcman/result.hpp"
#include "zshrcman/types.hpp"

#include <string>

namespace zshrcman {

// ============================================================================
// Removal Outcome
// ============================================================================

enum class RemovalAction {
    Deactivated,   // pair removed for the current profile only
    Uninstalled,   // ledger entry deleted
    MarkedUnused,  // flagged for collection and deactivated
    Skipped        // strategy needed an active profile and there was none
};

inline const char* removal_action_to_string(RemovalAction a) {
    switch (a) {
        case RemovalAction::Deactivated: return "deactivated";
        case RemovalAction::Uninstalled: return "uninstalled";
        case RemovalAction::MarkedUnused: return "marked-unused";
        case RemovalAction::Skipped: return "skipped";
        default: return "skipped";
    }
}

struct RemovalOutcome {
    RemovalAction action = RemovalAction::Skipped;
    size_t remaining_references = 0;  // active_for size after the operation
    bool orphaned = false;            // still installed, no profile references it
};

// ============================================================================
// Removal Policy Resolver
// ============================================================================

/**
 * @brief Maps a removal strategy onto concrete state mutations
 *
 * "Current profile" is always the registry's active-profile pointer.
 * Removing a package that is not in the ledger is NOT_FOUND.
 */
class RemovalPolicyResolver {
public:
    RemovalPolicyResolver(InstallationState& state, Installer& installer)
        : state_(state), installer_(installer) {}

    Result<RemovalOutcome> handle_removal(const std::string& package, RemovalStrategy strategy);

private:
    Result<RemovalOutcome> deactivate(const std::string& package);
    Result<RemovalOutcome> remove_from_profile(const std::string& package);
    Result<RemovalOutcome> smart_remove(const std::string& package);
    Result<RemovalOutcome> force_remove(const std::string& package);
    Result<RemovalOutcome> mark_unused(const std::string& package);

    bool used_by_other_profiles(const std::string& package) const;

    InstallationState& state_;
    Installer& installer_;
};

} // namespace zshrcman
