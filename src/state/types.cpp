#include "zshrcman/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace zshrcman {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<InstallScope> parse_install_scope(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "system") return InstallScope::System;
    if (lower == "global") return InstallScope::Global;
    if (lower == "profile") return InstallScope::Profile;
    if (lower == "local") return InstallScope::Local;
    if (lower == "device") return InstallScope::Device;
    return std::nullopt;
}

std::optional<SourceKind> parse_source_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "profile") return SourceKind::Profile;
    if (lower == "global") return SourceKind::Global;
    if (lower == "system") return SourceKind::System;
    if (lower == "manual") return SourceKind::Manual;
    if (lower == "dependency") return SourceKind::Dependency;
    return std::nullopt;
}

std::string installation_source_to_string(const InstallationSource& source) {
    std::string out = source_kind_to_string(source.kind);
    if (source.kind == SourceKind::Profile || source.kind == SourceKind::Dependency) {
        out += ":" + source.name;
    }
    return out;
}

std::optional<RemovalStrategy> parse_removal_strategy(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "deactivate") return RemovalStrategy::Deactivate;
    if (lower == "remove-from-profile") return RemovalStrategy::RemoveFromProfile;
    if (lower == "smart") return RemovalStrategy::SmartRemove;
    if (lower == "force") return RemovalStrategy::ForceRemove;
    if (lower == "mark-unused") return RemovalStrategy::MarkUnused;
    return std::nullopt;
}

std::optional<ShellKind> parse_shell_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "zsh") return ShellKind::Zsh;
    if (lower == "bash" || lower == "sh") return ShellKind::Bash;
    if (lower == "fish") return ShellKind::Fish;
    if (lower == "powershell" || lower == "pwsh") return ShellKind::PowerShell;
    if (lower == "cmd") return ShellKind::Cmd;
    return std::nullopt;
}

std::optional<OsType> parse_os_type(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "macos" || lower == "darwin") return OsType::MacOS;
    if (lower == "linux") return OsType::Linux;
    if (lower == "windows") return OsType::Windows;
    return std::nullopt;
}

} // namespace zshrcman
