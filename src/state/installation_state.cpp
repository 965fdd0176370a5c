#include "zshrcman/installation_state.hpp"
#include "zshrcman/names.hpp"
#include "zshrcman/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace zshrcman {

Result<InstallationState> InstallationState::load(SnapshotStore& store) {
    auto loaded = store.load();
    if (loaded.isErr()) {
        return Result<InstallationState>::err(loaded.error());
    }
    return Result<InstallationState>::ok(InstallationState(std::move(loaded.value()), store));
}

InstallationState::InstallationState(Snapshot snapshot, SnapshotStore& store)
    : ledger_(std::move(snapshot.installations)),
      registry_(std::move(snapshot.profiles), std::move(snapshot.active_profile)),
      alias_groups_(std::move(snapshot.alias_groups)),
      store_(&store) {}

bool InstallationState::is_active(const std::string& package) const {
    const auto* rec = ledger_.find(package);
    const auto& active = registry_.active();
    return rec && active && rec->active_for.count(*active) != 0;
}

std::vector<std::string> InstallationState::active_packages(const std::string& profile) const {
    const auto* p = registry_.find(profile);
    if (!p) return {};
    return std::vector<std::string>(p->packages.begin(), p->packages.end());
}

Snapshot InstallationState::snapshot() const {
    Snapshot snap;
    snap.installations = ledger_.records();
    snap.profiles = registry_.profiles();
    snap.alias_groups = alias_groups_;
    snap.active_profile = registry_.active();
    return snap;
}

std::vector<std::string> InstallationState::verify_consistency() const {
    std::vector<std::string> problems;

    for (const auto& [package, rec] : ledger_.records()) {
        if (rec.package != package) {
            problems.push_back("record key '" + package + "' holds package '" + rec.package + "'");
        }
        for (const auto& profile : rec.active_for) {
            const auto* p = registry_.find(profile);
            if (!p) {
                problems.push_back("package '" + package + "' is active for unknown profile '" +
                                   profile + "'");
            } else if (p->packages.count(package) == 0) {
                problems.push_back("package '" + package + "' is active for '" + profile +
                                   "' but missing from its package set");
            }
        }
    }

    for (const auto& [name, profile] : registry_.profiles()) {
        for (const auto& package : profile.packages) {
            const auto* rec = ledger_.find(package);
            if (!rec) {
                problems.push_back("profile '" + name + "' lists '" + package +
                                   "' which is not installed");
            } else if (rec->active_for.count(name) == 0) {
                problems.push_back("profile '" + name + "' lists '" + package +
                                   "' but the package is not active for it");
            }
        }
    }

    for (const auto& [name, profile] : registry_.profiles()) {
        for (const auto& group : profile.alias_groups) {
            if (alias_groups_.count(group) == 0) {
                problems.push_back("profile '" + name + "' enables unknown alias group '" +
                                   group + "'");
            }
        }
    }

    const auto& active = registry_.active();
    if (active && !registry_.contains(*active)) {
        problems.push_back("active profile '" + *active + "' does not exist");
    }

    return problems;
}

// ============================================================================
// Package operations
// ============================================================================

Result<InstallOutcome> InstallationState::smart_install(const std::string& package,
                                                        InstallScope scope,
                                                        const InstallOptions& options,
                                                        Installer& installer) {
    if (auto valid = validate_name("package", package); valid.isErr()) {
        return Result<InstallOutcome>::err(valid.error());
    }

    InstallOutcome outcome;
    outcome.profile = registry_.active().value_or(DEFAULT_PROFILE_NAME);

    if (ledger_.contains(package)) {
        spdlog::info("{} already installed, activating for profile '{}'", package, outcome.profile);
        outcome.action = InstallAction::Activated;
    } else {
        spdlog::info("installing {} with scope {}", package, install_scope_to_string(scope));
        auto installed = installer.install({package}, scope);
        if (installed.isErr()) {
            Error e = installed.error();
            e.withContext("install " + package);
            spdlog::error("{}", e.message());
            return Result<InstallOutcome>::err(e);
        }

        InstallationRecord rec;
        rec.package = package;
        rec.version = options.version;
        rec.installed_at = get_current_timestamp();
        rec.installed_by = InstallationSource::profile(outcome.profile);
        rec.scope = scope;
        rec.location = options.location;
        rec.installer_type = options.installer_type;
        ledger_.insert(std::move(rec));
        outcome.action = InstallAction::Installed;
    }

    if (!registry_.contains(outcome.profile)) {
        // Only reachable for the default identity
        spdlog::debug("creating profile '{}'", outcome.profile);
        registry_.create(outcome.profile, std::nullopt);
    }
    ledger_.add_active(package, outcome.profile);
    registry_.add_package(outcome.profile, package);

    auto saved = save();
    if (saved.isErr()) {
        return Result<InstallOutcome>::err(saved.error());
    }
    return Result<InstallOutcome>::ok(outcome);
}

Result<void> InstallationState::activate_for_profile(const std::string& package) {
    if (!ledger_.contains(package)) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "package not installed: " + package));
    }
    const auto& active = registry_.active();
    if (!active) {
        spdlog::debug("no active profile, not activating {}", package);
        return Result<void>::ok();
    }

    ledger_.add_active(package, *active);
    registry_.add_package(*active, package);
    return save();
}

Result<void> InstallationState::deactivate_for_profile(const std::string& package) {
    if (!ledger_.contains(package)) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "package not installed: " + package));
    }
    const auto& active = registry_.active();
    if (!active) {
        spdlog::debug("no active profile, not deactivating {}", package);
        return Result<void>::ok();
    }

    ledger_.remove_active(package, *active);
    registry_.remove_package(*active, package);
    return save();
}

Result<void> InstallationState::uninstall(const std::string& package, Installer& installer) {
    const auto* rec = ledger_.find(package);
    if (!rec) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "package not installed: " + package));
    }

    auto removed = installer.uninstall({package});
    if (removed.isErr()) {
        Error e = removed.error();
        e.withContext("uninstall " + package);
        spdlog::error("{}", e.message());
        return Result<void>::err(e);
    }

    for (const auto& profile : rec->active_for) {
        registry_.remove_package(profile, package);
    }
    ledger_.erase(package);
    spdlog::info("uninstalled {}", package);
    return save();
}

Result<void> InstallationState::remove_from_all_profiles(const std::string& package) {
    registry_.remove_package_everywhere(package);
    if (auto* rec = ledger_.find(package)) {
        rec->active_for.clear();
    }
    return save();
}

Result<void> InstallationState::set_location(const std::string& package,
                                             const std::string& location) {
    auto* rec = ledger_.find(package);
    if (!rec) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "package not installed: " + package));
    }
    rec->location = location;
    return save();
}

// ============================================================================
// Profile operations
// ============================================================================

Result<void> InstallationState::create_profile(const std::string& name,
                                               std::optional<std::string> parent) {
    if (auto valid = validate_name("profile", name); valid.isErr()) {
        return valid;
    }
    if (parent) {
        if (auto valid = validate_name("parent profile", *parent); valid.isErr()) {
            return valid;
        }
    }
    if (!registry_.create(name, std::move(parent))) {
        return Result<void>::err(Error(ErrorCode::INVALID_OPERATION,
                                       "profile already exists: " + name));
    }
    spdlog::info("created profile '{}'", name);
    return save();
}

Result<void> InstallationState::delete_profile(const std::string& name) {
    if (!registry_.contains(name)) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "profile not found: " + name));
    }
    if (registry_.is_active(name)) {
        return Result<void>::err(Error(ErrorCode::INVALID_OPERATION,
                                       "cannot delete active profile '" + name +
                                       "'; switch to another profile first"));
    }

    ledger_.forget_profile(name);
    registry_.erase(name);
    spdlog::info("deleted profile '{}'", name);
    return save();
}

Result<void> InstallationState::select_profile(const std::string& name) {
    if (!registry_.set_active(name)) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "profile not found: " + name));
    }
    return save();
}

Result<void> InstallationState::clear_active_profile() {
    registry_.clear_active();
    return save();
}

Result<void> InstallationState::set_profile_environment(const std::string& name,
                                                        const EnvironmentState& env) {
    auto* profile = registry_.find(name);
    if (!profile) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "profile not found: " + name));
    }
    if (auto valid = validate_environment(env); valid.isErr()) {
        return valid;
    }
    profile->environment = env;
    return save();
}

// ============================================================================
// Alias groups
// ============================================================================

const AliasGroup* InstallationState::alias_group(const std::string& name) const {
    auto it = alias_groups_.find(name);
    return it == alias_groups_.end() ? nullptr : &it->second;
}

AliasGroup* InstallationState::find_alias_group(const std::string& name) {
    auto it = alias_groups_.find(name);
    return it == alias_groups_.end() ? nullptr : &it->second;
}

Result<bool> InstallationState::add_alias(const std::string& group,
                                          const std::string& definition) {
    if (auto valid = validate_name("alias group", group); valid.isErr()) {
        return Result<bool>::err(valid.error());
    }
    auto parsed = parse_alias_definition(definition);
    if (parsed.isErr()) {
        return Result<bool>::err(parsed.error());
    }

    auto& entry = alias_groups_[group];
    entry.name = group;
    if (std::find(entry.items.begin(), entry.items.end(), definition) != entry.items.end()) {
        spdlog::debug("alias already in group '{}': {}", group, definition);
        return Result<bool>::ok(false);
    }
    entry.items.push_back(definition);
    spdlog::info("added alias to group '{}': {}", group, definition);

    auto saved = save();
    if (saved.isErr()) return Result<bool>::err(saved.error());
    return Result<bool>::ok(true);
}

Result<void> InstallationState::remove_alias(const std::string& group,
                                             const std::string& definition) {
    auto* entry = find_alias_group(group);
    if (!entry) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "alias group not found: " + group));
    }
    auto it = std::find(entry->items.begin(), entry->items.end(), definition);
    if (it == entry->items.end()) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND,
                                       "alias not in group '" + group + "': " + definition));
    }
    entry->items.erase(it);
    entry->active.erase(std::remove(entry->active.begin(), entry->active.end(), definition),
                        entry->active.end());
    return save();
}

Result<void> InstallationState::set_active_aliases(const std::string& group,
                                                   const std::vector<std::string>& definitions) {
    auto* entry = find_alias_group(group);
    if (!entry) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "alias group not found: " + group));
    }
    for (const auto& def : definitions) {
        if (std::find(entry->items.begin(), entry->items.end(), def) == entry->items.end()) {
            return Result<void>::err(Error(ErrorCode::INVALID_OPERATION,
                                           "alias not in group '" + group + "': " + def));
        }
    }

    std::vector<std::string> active;
    for (const auto& item : entry->items) {
        if (std::find(definitions.begin(), definitions.end(), item) != definitions.end()) {
            active.push_back(item);
        }
    }
    entry->active = std::move(active);
    spdlog::info("group '{}' has {} active alias(es)", group, entry->active.size());
    return save();
}

Result<void> InstallationState::delete_alias_group(const std::string& group) {
    if (alias_groups_.erase(group) == 0) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "alias group not found: " + group));
    }
    for (const auto& [name, profile] : registry_.profiles()) {
        if (profile.alias_groups.count(group)) {
            registry_.find(name)->alias_groups.erase(group);
        }
    }
    return save();
}

Result<void> InstallationState::enable_alias_group(const std::string& profile,
                                                   const std::string& group) {
    auto* p = registry_.find(profile);
    if (!p) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "profile not found: " + profile));
    }
    if (!alias_group(group)) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "alias group not found: " + group));
    }
    p->alias_groups.insert(group);
    return save();
}

Result<void> InstallationState::disable_alias_group(const std::string& profile,
                                                    const std::string& group) {
    auto* p = registry_.find(profile);
    if (!p) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "profile not found: " + profile));
    }
    p->alias_groups.erase(group);
    return save();
}

std::map<std::string, std::string> InstallationState::group_aliases(
    const std::string& profile) const {
    std::map<std::string, std::string> aliases;
    const auto* p = registry_.find(profile);
    if (!p) return aliases;

    for (const auto& group : p->alias_groups) {
        const auto* entry = alias_group(group);
        if (!entry) continue;
        for (const auto& def : entry->active) {
            auto parsed = parse_alias_definition(def);
            if (parsed.isErr()) {
                spdlog::warn("group '{}': {}", group, parsed.error().message());
                continue;
            }
            aliases.emplace(parsed.value().name, parsed.value().command);
        }
    }
    return aliases;
}

Result<void> InstallationState::save() {
    auto saved = store_->save(snapshot());
    if (saved.isErr()) {
        spdlog::error("{}", saved.error().message());
    }
    return saved;
}

} // namespace zshrcman
