#pragma once

#include "zshrcman/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zshrcman {

/// Name of the profile used when a package is installed with no active profile
constexpr const char* DEFAULT_PROFILE_NAME = "default";

/// Schema identifier written into the persisted state file
constexpr const char* STATE_SCHEMA = "zshrcman.state.v1";

// ============================================================================
// Environment State
// ============================================================================

/**
 * Abstract environment of a profile.
 *
 * Variables and aliases are kept in key order so that rendering the same
 * state always produces the same script.
 */
struct EnvironmentState {
    std::vector<std::string> paths_prepend;
    std::vector<std::string> paths_append;
    std::map<std::string, std::string> variables;
    std::map<std::string, std::string> aliases;
    bool active = true;  // when false, projection has no effect

    bool empty() const {
        return paths_prepend.empty() && paths_append.empty() &&
               variables.empty() && aliases.empty();
    }

    bool operator==(const EnvironmentState& other) const {
        return paths_prepend == other.paths_prepend &&
               paths_append == other.paths_append &&
               variables == other.variables &&
               aliases == other.aliases &&
               active == other.active;
    }
    bool operator!=(const EnvironmentState& other) const { return !(*this == other); }
};

// ============================================================================
// OS Override
// ============================================================================

// Stored and round-tripped only; no operation applies it.
struct OsOverride {
    std::set<std::string> packages;
    std::optional<EnvironmentState> environment;

    bool operator==(const OsOverride& other) const {
        return packages == other.packages && environment == other.environment;
    }
    bool operator!=(const OsOverride& other) const { return !(*this == other); }
};

// ============================================================================
// Installation Record
// ============================================================================

struct InstallationRecord {
    std::string package;
    std::optional<std::string> version;
    std::string installed_at;  // RFC3339 UTC
    InstallationSource installed_by;
    std::set<std::string> active_for;  // profiles currently depending on it
    InstallScope scope = InstallScope::Global;
    std::optional<std::string> location;  // installed binary, when known
    std::string installer_type = "auto";

    bool operator==(const InstallationRecord& other) const {
        return package == other.package &&
               version == other.version &&
               installed_at == other.installed_at &&
               installed_by == other.installed_by &&
               active_for == other.active_for &&
               scope == other.scope &&
               location == other.location &&
               installer_type == other.installer_type;
    }
    bool operator!=(const InstallationRecord& other) const { return !(*this == other); }
};

// ============================================================================
// Profile
// ============================================================================

struct Profile {
    std::string name;
    std::optional<std::string> parent;  // back-reference only, never resolved
    std::set<std::string> packages;
    EnvironmentState environment;
    std::map<std::string, OsOverride> os_overrides;  // keyed by os_type_to_string()
    std::set<std::string> alias_groups;  // enabled alias groups

    bool operator==(const Profile& other) const {
        return name == other.name &&
               parent == other.parent &&
               packages == other.packages &&
               environment == other.environment &&
               os_overrides == other.os_overrides &&
               alias_groups == other.alias_groups;
    }
    bool operator!=(const Profile& other) const { return !(*this == other); }
};

// ============================================================================
// Alias Group
// ============================================================================

/**
 * Named collection of "name=command" definitions. Only the active subset
 * reaches the environment of profiles that enable the group.
 */
struct AliasGroup {
    std::string name;
    std::vector<std::string> items;   // insertion order
    std::vector<std::string> active;  // subset of items, in items order

    bool operator==(const AliasGroup& other) const {
        return name == other.name && items == other.items && active == other.active;
    }
    bool operator!=(const AliasGroup& other) const { return !(*this == other); }
};

// ============================================================================
// Snapshot
// ============================================================================

/**
 * Everything the persistence contract loads and saves, as one unit.
 * There are no partial or delta updates.
 */
struct Snapshot {
    std::map<std::string, InstallationRecord> installations;
    std::map<std::string, Profile> profiles;
    std::map<std::string, AliasGroup> alias_groups;
    std::optional<std::string> active_profile;

    bool operator==(const Snapshot& other) const {
        return installations == other.installations &&
               profiles == other.profiles &&
               alias_groups == other.alias_groups &&
               active_profile == other.active_profile;
    }
    bool operator!=(const Snapshot& other) const { return !(*this == other); }
};

} // namespace zshrcman
