#include "zshrcman/removal_policy.hpp"

#include <spdlog/spdlog.h>

namespace zshrcman {

namespace {

Result<RemovalOutcome> not_installed(const std::string& package) {
    return Result<RemovalOutcome>::err(
        Error(ErrorCode::NOT_FOUND, "package not installed: " + package));
}

size_t reference_count(const InstallationState& state, const std::string& package) {
    const auto* rec = state.package_info(package);
    return rec ? rec->active_for.size() : 0;
}

} // namespace

Result<RemovalOutcome> RemovalPolicyResolver::handle_removal(const std::string& package,
                                                             RemovalStrategy strategy) {
    if (!state_.is_installed(package)) {
        return not_installed(package);
    }

    spdlog::debug("removing {} with strategy {}", package, removal_strategy_to_string(strategy));

    switch (strategy) {
        case RemovalStrategy::Deactivate: return deactivate(package);
        case RemovalStrategy::RemoveFromProfile: return remove_from_profile(package);
        case RemovalStrategy::SmartRemove: return smart_remove(package);
        case RemovalStrategy::ForceRemove: return force_remove(package);
        case RemovalStrategy::MarkUnused: return mark_unused(package);
    }
    return deactivate(package);
}

Result<RemovalOutcome> RemovalPolicyResolver::deactivate(const std::string& package) {
    RemovalOutcome outcome;
    if (!state_.active_profile()) {
        spdlog::warn("no active profile, {} left untouched", package);
        outcome.remaining_references = reference_count(state_, package);
        return Result<RemovalOutcome>::ok(outcome);
    }

    auto r = state_.deactivate_for_profile(package);
    if (r.isErr()) return Result<RemovalOutcome>::err(r.error());

    outcome.action = RemovalAction::Deactivated;
    outcome.remaining_references = reference_count(state_, package);
    outcome.orphaned = outcome.remaining_references == 0;
    return Result<RemovalOutcome>::ok(outcome);
}

Result<RemovalOutcome> RemovalPolicyResolver::remove_from_profile(const std::string& package) {
    RemovalOutcome outcome;
    if (!state_.active_profile()) {
        spdlog::warn("no active profile, {} left untouched", package);
        outcome.remaining_references = reference_count(state_, package);
        return Result<RemovalOutcome>::ok(outcome);
    }

    bool shared = used_by_other_profiles(package);

    auto r = state_.deactivate_for_profile(package);
    if (r.isErr()) return Result<RemovalOutcome>::err(r.error());

    outcome.action = RemovalAction::Deactivated;
    outcome.remaining_references = reference_count(state_, package);
    outcome.orphaned = !shared;
    if (outcome.orphaned) {
        spdlog::info("{} is no longer used by any profile", package);
    }
    return Result<RemovalOutcome>::ok(outcome);
}

Result<RemovalOutcome> RemovalPolicyResolver::smart_remove(const std::string& package) {
    size_t count = reference_count(state_, package);

    if (count <= 1) {
        auto r = state_.uninstall(package, installer_);
        if (r.isErr()) return Result<RemovalOutcome>::err(r.error());

        RemovalOutcome outcome;
        outcome.action = RemovalAction::Uninstalled;
        return Result<RemovalOutcome>::ok(outcome);
    }

    auto outcome = deactivate(package);
    if (outcome.isOk() && outcome.value().action == RemovalAction::Deactivated) {
        spdlog::info("{} still used by {} profile(s)", package,
                     outcome.value().remaining_references);
    }
    return outcome;
}

Result<RemovalOutcome> RemovalPolicyResolver::force_remove(const std::string& package) {
    auto r = state_.uninstall(package, installer_);
    if (r.isErr()) return Result<RemovalOutcome>::err(r.error());

    // Drop stray set entries not covered by the record's active_for
    auto cleared = state_.remove_from_all_profiles(package);
    if (cleared.isErr()) return Result<RemovalOutcome>::err(cleared.error());

    RemovalOutcome outcome;
    outcome.action = RemovalAction::Uninstalled;
    return Result<RemovalOutcome>::ok(outcome);
}

Result<RemovalOutcome> RemovalPolicyResolver::mark_unused(const std::string& package) {
    if (!state_.active_profile()) {
        spdlog::warn("no active profile, {} left untouched", package);
        RemovalOutcome outcome;
        outcome.remaining_references = reference_count(state_, package);
        return Result<RemovalOutcome>::ok(outcome);
    }

    // Garbage collection of unused packages is not tracked yet
    spdlog::info("marking {} as unused", package);

    auto outcome = deactivate(package);
    if (outcome.isOk()) {
        outcome.value().action = RemovalAction::MarkedUnused;
    }
    return outcome;
}

bool RemovalPolicyResolver::used_by_other_profiles(const std::string& package) const {
    const auto* rec = state_.package_info(package);
    const auto& current = state_.active_profile();
    if (!rec) return false;
    for (const auto& profile : rec->active_for) {
        if (!current || profile != *current) return true;
    }
    return false;
}

} // namespace zshrcman
