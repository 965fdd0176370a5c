#pragma once

/**
 * @file installation_state.hpp
 * @brief Profile-scoped installation state: ledger + registry + persistence
 *
 * InstallationState owns the PackageLedger and the ProfileRegistry and is the
 * only place where the two are mutated together. Every mutation is followed
 * by a full-snapshot save through the SnapshotStore; save failures propagate
 * unchanged as PERSISTENCE_ERROR.
 *
 * Symmetry invariant kept by every operation:
 *   profile f is in ledger[p].active_for  <=>  p is in profiles[f].packages
 */

#include "zshrcman/installer.hpp"
#include "zshrcman/models.hpp"
#include "zshrcman/package_ledger.hpp"
#include "zshrcman/profile_registry.hpp"
#include "zshrcman/result.hpp"
#include "zshrcman/snapshot_store.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zshrcman {

// Optional record fields supplied at install time
struct InstallOptions {
    std::optional<std::string> version;
    std::optional<std::string> location;
    std::string installer_type = "auto";
};

enum class InstallAction {
    Installed,  // installer invoked, new record
    Activated   // already installed, added to the current profile
};

struct InstallOutcome {
    InstallAction action = InstallAction::Installed;
    std::string profile;  // profile the package was attached to
};

class InstallationState {
public:
    /**
     * @brief Load state from a store
     * @return InstallationState or PERSISTENCE_ERROR
     */
    static Result<InstallationState> load(SnapshotStore& store);

    InstallationState(Snapshot snapshot, SnapshotStore& store);

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    const PackageLedger& ledger() const { return ledger_; }
    const ProfileRegistry& registry() const { return registry_; }
    const std::optional<std::string>& active_profile() const { return registry_.active(); }

    bool is_installed(const std::string& package) const { return ledger_.contains(package); }

    /// True when the package is active for the current profile
    bool is_active(const std::string& package) const;

    const InstallationRecord* package_info(const std::string& package) const {
        return ledger_.find(package);
    }

    /// Sorted package names of a profile (empty when the profile is unknown)
    std::vector<std::string> active_packages(const std::string& profile) const;

    Snapshot snapshot() const;

    /// Every violated invariant, one message per violation
    std::vector<std::string> verify_consistency() const;

    // ------------------------------------------------------------------------
    // Package operations
    // ------------------------------------------------------------------------

    /**
     * @brief Install a package for the current profile, or attach an
     *        existing installation to it
     *
     * Uses the default identity when no profile is active, creating the
     * default profile if needed. The installer is only invoked when the
     * package is not yet in the ledger. Names rejected by validate_name()
     * fail with INVALID_OPERATION before anything is touched.
     */
    Result<InstallOutcome> smart_install(const std::string& package,
                                         InstallScope scope,
                                         const InstallOptions& options,
                                         Installer& installer);

    /// Add the current profile to the package. No-op without an active profile.
    Result<void> activate_for_profile(const std::string& package);

    /// Remove the current profile from the package. No-op without an active profile.
    Result<void> deactivate_for_profile(const std::string& package);

    /**
     * @brief Uninstall a package through the installer and drop its record
     *
     * The package is also removed from every profile that lists it.
     */
    Result<void> uninstall(const std::string& package, Installer& installer);

    /// Remove the package from every profile's set and every active_for entry
    Result<void> remove_from_all_profiles(const std::string& package);

    /// Record where the package's binary lives
    Result<void> set_location(const std::string& package, const std::string& location);

    // ------------------------------------------------------------------------
    // Profile operations
    // ------------------------------------------------------------------------

    /// INVALID_OPERATION if the name is taken or invalid. The parent need not exist.
    Result<void> create_profile(const std::string& name, std::optional<std::string> parent);

    /// NOT_FOUND if unknown, INVALID_OPERATION if it is the active profile
    Result<void> delete_profile(const std::string& name);

    /// Move the active-profile pointer and persist. NOT_FOUND if unknown.
    Result<void> select_profile(const std::string& name);

    /// Clear the active-profile pointer and persist
    Result<void> clear_active_profile();

    /// Replace a profile's environment and persist. NOT_FOUND if unknown.
    Result<void> set_profile_environment(const std::string& name, const EnvironmentState& env);

    // ------------------------------------------------------------------------
    // Alias groups
    // ------------------------------------------------------------------------

    const std::map<std::string, AliasGroup>& alias_groups() const { return alias_groups_; }

    const AliasGroup* alias_group(const std::string& name) const;

    /**
     * @brief Add a "name=command" definition to a group, creating the group
     * @return false when the definition is already present (nothing saved)
     */
    Result<bool> add_alias(const std::string& group, const std::string& definition);

    /// Drop a definition from a group's items and active list
    Result<void> remove_alias(const std::string& group, const std::string& definition);

    /**
     * @brief Replace the active subset of a group
     *
     * Every definition must already be an item of the group
     * (INVALID_OPERATION otherwise). The stored order follows the items.
     */
    Result<void> set_active_aliases(const std::string& group,
                                    const std::vector<std::string>& definitions);

    /// Delete a group and disable it in every profile
    Result<void> delete_alias_group(const std::string& group);

    Result<void> enable_alias_group(const std::string& profile, const std::string& group);
    Result<void> disable_alias_group(const std::string& profile, const std::string& group);

    /**
     * @brief Active aliases from the groups a profile enables
     *
     * Groups are merged in name order and the first definition of a name
     * wins. Unknown profiles and groups contribute nothing.
     */
    std::map<std::string, std::string> group_aliases(const std::string& profile) const;

    /// Persist the current state
    Result<void> save();

private:
    AliasGroup* find_alias_group(const std::string& name);

    PackageLedger ledger_;
    ProfileRegistry registry_;
    std::map<std::string, AliasGroup> alias_groups_;
    SnapshotStore* store_;
};

} // namespace zshrcman
