#pragma once

#include <optional>
#include <string>

namespace zshrcman {

// ============================================================================
// Install Scope
// ============================================================================

// Why / where a package was installed
enum class InstallScope {
    System,
    Global,
    Profile,
    Local,
    Device
};

inline const char* install_scope_to_string(InstallScope s) {
    switch (s) {
        case InstallScope::System: return "system";
        case InstallScope::Global: return "global";
        case InstallScope::Profile: return "profile";
        case InstallScope::Local: return "local";
        case InstallScope::Device: return "device";
        default: return "global";
    }
}

// Parse scope string (case-insensitive)
std::optional<InstallScope> parse_install_scope(const std::string& s);

// ============================================================================
// Installation Source
// ============================================================================

enum class SourceKind {
    Profile,     // installed on behalf of a named profile
    Global,
    System,
    Manual,
    Dependency   // pulled in by another named package
};

struct InstallationSource {
    SourceKind kind = SourceKind::Manual;
    std::string name;  // set for Profile and Dependency only

    static InstallationSource profile(const std::string& n) { return {SourceKind::Profile, n}; }
    static InstallationSource dependency(const std::string& n) { return {SourceKind::Dependency, n}; }
    static InstallationSource of(SourceKind k) { return {k, {}}; }

    bool operator==(const InstallationSource& other) const {
        return kind == other.kind && name == other.name;
    }
    bool operator!=(const InstallationSource& other) const { return !(*this == other); }
};

inline const char* source_kind_to_string(SourceKind k) {
    switch (k) {
        case SourceKind::Profile: return "profile";
        case SourceKind::Global: return "global";
        case SourceKind::System: return "system";
        case SourceKind::Manual: return "manual";
        case SourceKind::Dependency: return "dependency";
        default: return "manual";
    }
}

std::optional<SourceKind> parse_source_kind(const std::string& s);

// "profile:work", "global", "dependency:openssl"
std::string installation_source_to_string(const InstallationSource& source);

// ============================================================================
// Removal Strategy
// ============================================================================

enum class RemovalStrategy {
    Deactivate,
    RemoveFromProfile,
    SmartRemove,
    ForceRemove,
    MarkUnused
};

inline const char* removal_strategy_to_string(RemovalStrategy s) {
    switch (s) {
        case RemovalStrategy::Deactivate: return "deactivate";
        case RemovalStrategy::RemoveFromProfile: return "remove-from-profile";
        case RemovalStrategy::SmartRemove: return "smart";
        case RemovalStrategy::ForceRemove: return "force";
        case RemovalStrategy::MarkUnused: return "mark-unused";
        default: return "smart";
    }
}

std::optional<RemovalStrategy> parse_removal_strategy(const std::string& s);

// ============================================================================
// Shell Kind
// ============================================================================

enum class ShellKind {
    Zsh,
    Bash,
    Fish,
    PowerShell,
    Cmd
};

inline const char* shell_kind_to_string(ShellKind k) {
    switch (k) {
        case ShellKind::Zsh: return "zsh";
        case ShellKind::Bash: return "bash";
        case ShellKind::Fish: return "fish";
        case ShellKind::PowerShell: return "powershell";
        case ShellKind::Cmd: return "cmd";
        default: return "bash";
    }
}

std::optional<ShellKind> parse_shell_kind(const std::string& s);

// ============================================================================
// Operating System
// ============================================================================

enum class OsType {
    MacOS,
    Linux,
    Windows
};

inline const char* os_type_to_string(OsType os) {
    switch (os) {
        case OsType::MacOS: return "macos";
        case OsType::Linux: return "linux";
        case OsType::Windows: return "windows";
        default: return "linux";
    }
}

std::optional<OsType> parse_os_type(const std::string& s);

// OS this binary was built for
OsType detect_os();

} // namespace zshrcman
