#include "zshrcman/profile_transition.hpp"

#include <spdlog/spdlog.h>

namespace zshrcman {

bool TransitionReport::complete() const {
    return !failed_step && completed.size() == transition_steps(kind).size();
}

std::vector<TransitionStep> transition_steps(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::Switch:
            return {TransitionStep::DeactivateOld, TransitionStep::UpdatePointer,
                    TransitionStep::ActivateEnvironment, TransitionStep::RelinkBinaries,
                    TransitionStep::UpdateShellMarker};
        case TransitionKind::Activate:
            return {TransitionStep::ActivateEnvironment, TransitionStep::RelinkBinaries,
                    TransitionStep::UpdateShellMarker};
        case TransitionKind::Deactivate:
            return {TransitionStep::DeactivateOld, TransitionStep::ClearPointer};
    }
    return {};
}

ProfileTransitionOrchestrator::ProfileTransitionOrchestrator(InstallationState& state,
                                                             EnvironmentDelta& env,
                                                             const Layout& layout,
                                                             ShellKind shell)
    : state_(state),
      env_(env),
      layout_(layout),
      projector_(shell),
      linker_(layout.profiles_dir),
      marker_(layout.shell_config) {}

// ============================================================================
// Transitions
// ============================================================================

Result<void> ProfileTransitionOrchestrator::switch_profile(const std::string& name) {
    if (!state_.registry().contains(name)) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "profile not found: " + name));
    }

    TransitionReport report;
    report.kind = TransitionKind::Switch;
    report.target = name;
    report.previous = state_.active_profile();
    clear_marker_ = false;

    spdlog::info("switching profile {} -> {}", report.previous.value_or("(none)"), name);
    return run(std::move(report));
}

Result<void> ProfileTransitionOrchestrator::activate_profile(const std::string& name) {
    if (!state_.registry().contains(name)) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "profile not found: " + name));
    }
    const auto& active = state_.active_profile();
    if (active && *active != name) {
        return Result<void>::err(Error(ErrorCode::INVALID_OPERATION,
                                       "profile '" + *active + "' is active; switch to '" +
                                       name + "' instead"));
    }

    TransitionReport report;
    report.kind = TransitionKind::Activate;
    report.target = name;
    report.previous = active;
    clear_marker_ = false;

    spdlog::info("activating profile {}", name);
    return run(std::move(report));
}

Result<void> ProfileTransitionOrchestrator::deactivate_current(bool clear_marker) {
    const auto& active = state_.active_profile();
    if (!active) {
        spdlog::debug("no active profile to deactivate");
        return Result<void>::ok();
    }

    TransitionReport report;
    report.kind = TransitionKind::Deactivate;
    report.previous = active;
    clear_marker_ = clear_marker;

    spdlog::info("deactivating profile {}", *active);
    return run(std::move(report));
}

Result<void> ProfileTransitionOrchestrator::resume() {
    if (!report_ || report_->complete()) {
        return Result<void>::err(Error(ErrorCode::INVALID_OPERATION,
                                       "no interrupted transition to resume"));
    }

    report_->failed_step.reset();
    report_->error.clear();
    spdlog::info("resuming transition after {} completed step(s)", report_->completed.size());
    return run_remaining();
}

Result<void> ProfileTransitionOrchestrator::refresh_binaries() {
    const auto& active = state_.active_profile();
    if (!active) return Result<void>::ok();
    return step_relink_binaries(*active);
}

Result<EnvironmentState> ProfileTransitionOrchestrator::projected_environment(
    const std::string& profile) const {
    const auto* p = state_.registry().find(profile);
    if (!p) {
        return Result<EnvironmentState>::err(
            Error(ErrorCode::NOT_FOUND, "profile not found: " + profile));
    }

    EnvironmentState projected = p->environment.active ? p->environment : EnvironmentState{};
    if (p->environment.active) {
        // The profile's own aliases take precedence over group aliases
        for (const auto& [name, command] : state_.group_aliases(profile)) {
            projected.aliases.emplace(name, command);
        }
    }
    projected.active = true;
    projected.paths_prepend.insert(projected.paths_prepend.begin(), linker_.bin_dir(profile));
    return Result<EnvironmentState>::ok(projected);
}

// ============================================================================
// Step Execution
// ============================================================================

Result<void> ProfileTransitionOrchestrator::run(TransitionReport report) {
    report_ = std::move(report);
    return run_remaining();
}

Result<void> ProfileTransitionOrchestrator::run_remaining() {
    auto steps = transition_steps(report_->kind);

    for (size_t i = report_->completed.size(); i < steps.size(); ++i) {
        auto r = run_step(steps[i]);
        if (r.isErr()) {
            report_->failed_step = steps[i];
            report_->error = r.error().message();
            spdlog::error("step {} failed: {}", transition_step_to_string(steps[i]),
                          r.error().message());
            return r;
        }
        spdlog::debug("step {} done", transition_step_to_string(steps[i]));
        report_->completed.push_back(steps[i]);
    }
    return Result<void>::ok();
}

Result<void> ProfileTransitionOrchestrator::run_step(TransitionStep step) {
    switch (step) {
        case TransitionStep::DeactivateOld:
            return step_deactivate_old();
        case TransitionStep::UpdatePointer:
            return state_.select_profile(report_->target);
        case TransitionStep::ActivateEnvironment:
            return step_activate_environment();
        case TransitionStep::RelinkBinaries:
            return step_relink_binaries(report_->target);
        case TransitionStep::UpdateShellMarker:
            return marker_.update(report_->target);
        case TransitionStep::ClearPointer:
            return step_clear_pointer();
    }
    return Result<void>::ok();
}

Result<void> ProfileTransitionOrchestrator::step_deactivate_old() {
    const auto& previous = report_->previous;
    if (!previous || !state_.registry().contains(*previous)) {
        return Result<void>::ok();
    }

    auto projected = projected_environment(*previous);
    if (projected.isErr()) return Result<void>::err(projected.error());

    auto reversed = projector_.reverse(projected.value(), env_);
    if (reversed.isErr()) return reversed;

    return linker_.clear(*previous);
}

Result<void> ProfileTransitionOrchestrator::step_activate_environment() {
    auto projected = projected_environment(report_->target);
    if (projected.isErr()) return Result<void>::err(projected.error());

    auto applied = projector_.apply(projected.value(), env_);
    if (applied.isErr()) return applied;

    std::string script = layout_.active_script(projector_.shell());
    auto written = projector_.write_script(projected.value(), script);
    if (written.isErr()) return written;

    std::string line = source_line(projector_.shell(), script);
    if (line.empty()) return Result<void>::ok();

    auto sourced = marker_.ensure_source_line(line);
    if (sourced.isErr()) return Result<void>::err(sourced.error());
    return Result<void>::ok();
}

Result<void> ProfileTransitionOrchestrator::step_relink_binaries(const std::string& profile) {
    std::vector<LinkEntry> entries;
    for (const auto& package : state_.active_packages(profile)) {
        const auto* rec = state_.package_info(package);
        if (rec && rec->location) {
            entries.emplace_back(package, *rec->location);
        }
    }
    return linker_.link(profile, entries);
}

Result<void> ProfileTransitionOrchestrator::step_clear_pointer() {
    auto cleared = state_.clear_active_profile();
    if (cleared.isErr()) return cleared;

    // Leave a script that sources cleanly but does nothing
    auto written = projector_.write_script(EnvironmentState{},
                                           layout_.active_script(projector_.shell()));
    if (written.isErr()) return written;

    if (clear_marker_) {
        return marker_.clear();
    }
    return Result<void>::ok();
}

} // namespace zshrcman
