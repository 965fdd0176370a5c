#include "zshrcman/environment.hpp"
#include "zshrcman/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace zshrcman {

namespace {

const char* PATH_VAR = "PATH";

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

Result<std::vector<std::string>> expand_all(const std::vector<std::string>& paths,
                                            const EnvironmentDelta& env) {
    std::vector<std::string> out;
    for (const auto& p : paths) {
        auto expanded = expand_path(p, env);
        if (expanded.isErr()) {
            return Result<std::vector<std::string>>::err(expanded.error());
        }
        out.push_back(expanded.value());
    }
    return Result<std::vector<std::string>>::ok(out);
}

bool has_paths(const EnvironmentState& state) {
    return !state.paths_prepend.empty() || !state.paths_append.empty();
}

// ============================================================================
// Script Generators
// ============================================================================

std::string render_posix(const EnvironmentState& state) {
    std::ostringstream out;
    out << "# zshrcman profile environment\n\n";

    for (const auto& p : state.paths_prepend) out << "export PATH=\"" << p << ":$PATH\"\n";
    for (const auto& p : state.paths_append) out << "export PATH=\"$PATH:" << p << "\"\n";
    if (has_paths(state)) out << "\n";

    for (const auto& [key, value] : state.variables) {
        out << "export " << key << "=\"" << value << "\"\n";
    }
    if (!state.variables.empty()) out << "\n";

    for (const auto& [alias, command] : state.aliases) {
        out << "alias " << alias << "='" << command << "'\n";
    }
    return out.str();
}

std::string render_fish(const EnvironmentState& state) {
    std::ostringstream out;
    out << "# zshrcman profile environment\n\n";

    for (const auto& p : state.paths_prepend) out << "set -gx PATH " << p << " $PATH\n";
    for (const auto& p : state.paths_append) out << "set -gx PATH $PATH " << p << "\n";
    if (has_paths(state)) out << "\n";

    for (const auto& [key, value] : state.variables) {
        out << "set -gx " << key << " \"" << value << "\"\n";
    }
    if (!state.variables.empty()) out << "\n";

    for (const auto& [alias, command] : state.aliases) {
        out << "alias " << alias << " '" << command << "'\n";
    }
    return out.str();
}

std::string render_powershell(const EnvironmentState& state) {
    std::ostringstream out;
    out << "# zshrcman profile environment\n\n";

    if (has_paths(state)) {
        out << "$env:Path = @(";
        for (const auto& p : state.paths_prepend) out << "\n    \"" << p << "\",";
        out << "\n    $env:Path";
        for (const auto& p : state.paths_append) out << ",\n    \"" << p << "\"";
        out << "\n) -join ';'\n\n";
    }

    for (const auto& [key, value] : state.variables) {
        out << "$env:" << key << " = \"" << value << "\"\n";
    }
    if (!state.variables.empty()) out << "\n";

    for (const auto& [alias, command] : state.aliases) {
        out << "function " << alias << " { " << command << " }\n";
    }
    return out.str();
}

std::string render_cmd(const EnvironmentState& state) {
    std::ostringstream out;
    out << "@echo off\nREM zshrcman profile environment\n\n";

    if (has_paths(state)) {
        out << "set PATH=";
        for (const auto& p : state.paths_prepend) out << p << ";";
        out << "%PATH%";
        for (const auto& p : state.paths_append) out << ";" << p;
        out << "\n\n";
    }

    for (const auto& [key, value] : state.variables) {
        out << "set " << key << "=" << value << "\n";
    }
    if (!state.variables.empty()) out << "\n";

    // Batch files have no alias mechanism
    if (!state.aliases.empty()) {
        out << "REM Aliases not supported in CMD batch files\n";
        for (const auto& [alias, command] : state.aliases) {
            out << "REM " << alias << " = " << command << "\n";
        }
    }
    return out.str();
}

} // namespace

// ============================================================================
// Environment Delta
// ============================================================================

EnvironmentDelta EnvironmentDelta::from_process() {
    auto env = get_all_env();
    std::map<std::string, std::string> vars(env.begin(), env.end());
    char sep = detect_os() == OsType::Windows ? ';' : ':';
    return EnvironmentDelta(std::move(vars), sep);
}

std::optional<std::string> EnvironmentDelta::get(const std::string& name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) return std::nullopt;
    return it->second;
}

void EnvironmentDelta::set(const std::string& name, const std::string& value) {
    variables_[name] = value;
}

void EnvironmentDelta::unset(const std::string& name) {
    variables_.erase(name);
}

std::vector<std::string> EnvironmentDelta::path_entries() const {
    std::vector<std::string> entries;
    auto path = get(PATH_VAR);
    if (!path) return entries;

    size_t start = 0;
    while (start <= path->size()) {
        size_t end = path->find(separator_, start);
        if (end == std::string::npos) end = path->size();
        if (end > start) entries.push_back(path->substr(start, end - start));
        start = end + 1;
    }
    return entries;
}

void EnvironmentDelta::set_path_entries(const std::vector<std::string>& entries) {
    std::string joined;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) joined += separator_;
        joined += entries[i];
    }
    set(PATH_VAR, joined);
}

bool EnvironmentDelta::has_path_entry(const std::string& entry) const {
    return contains(path_entries(), entry);
}

// ============================================================================
// Path Expansion
// ============================================================================

Result<std::string> expand_path(const std::string& path, const EnvironmentDelta& env) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        auto home = env.get("HOME");
        if (!home) home = env.get("USERPROFILE");
        if (!home) {
            return Result<std::string>::err(
                Error(ErrorCode::NOT_FOUND, "HOME is not set, cannot expand " + path));
        }
        return Result<std::string>::ok(*home + path.substr(1));
    }

    if (path.empty() || path[0] != '$') {
        return Result<std::string>::ok(path);
    }

    std::string name;
    size_t rest = 0;
    if (path.size() > 1 && path[1] == '{') {
        size_t close = path.find('}', 2);
        if (close == std::string::npos) {
            return Result<std::string>::ok(path);
        }
        name = path.substr(2, close - 2);
        rest = close + 1;
    } else {
        size_t end = 1;
        while (end < path.size() && is_name_char(path[end])) ++end;
        name = path.substr(1, end - 1);
        rest = end;
    }

    if (name.empty()) {
        return Result<std::string>::ok(path);
    }

    auto value = env.get(name);
    if (!value) {
        return Result<std::string>::err(
            Error(ErrorCode::NOT_FOUND, "environment variable " + name + " is not set, cannot expand " + path));
    }
    return Result<std::string>::ok(*value + path.substr(rest));
}

// ============================================================================
// Rendering
// ============================================================================

std::string render_environment(const EnvironmentState& state, ShellKind shell) {
    switch (shell) {
        case ShellKind::Zsh:
        case ShellKind::Bash:
            return render_posix(state);
        case ShellKind::Fish:
            return render_fish(state);
        case ShellKind::PowerShell:
            return render_powershell(state);
        case ShellKind::Cmd:
            return render_cmd(state);
    }
    return render_posix(state);
}

std::string source_line(ShellKind shell, const std::string& script_path) {
    switch (shell) {
        case ShellKind::Zsh:
        case ShellKind::Bash:
            return "[ -f " + script_path + " ] && source " + script_path;
        case ShellKind::Fish:
            return "test -f " + script_path + "; and source " + script_path;
        case ShellKind::PowerShell:
            return ". \"" + script_path + "\"";
        case ShellKind::Cmd:
            return "";
    }
    return "";
}

const char* script_extension(ShellKind shell) {
    switch (shell) {
        case ShellKind::Zsh:
        case ShellKind::Bash:
            return "sh";
        case ShellKind::Fish: return "fish";
        case ShellKind::PowerShell: return "ps1";
        case ShellKind::Cmd: return "bat";
    }
    return "sh";
}

ShellKind detect_shell(const std::string& shell_env) {
    if (shell_env.find("zsh") != std::string::npos) return ShellKind::Zsh;
    if (shell_env.find("bash") != std::string::npos) return ShellKind::Bash;
    if (shell_env.find("fish") != std::string::npos) return ShellKind::Fish;
    if (shell_env.find("pwsh") != std::string::npos ||
        shell_env.find("powershell") != std::string::npos) {
        return ShellKind::PowerShell;
    }
    if (shell_env.find("cmd") != std::string::npos) return ShellKind::Cmd;
    return ShellKind::Bash;
}

std::string shell_config_path(const std::string& home, ShellKind shell) {
    switch (shell) {
        case ShellKind::Zsh: return join_path(home, ".zshrc");
        case ShellKind::Bash: return join_path(home, ".bashrc");
        case ShellKind::Fish: return join_path(home, ".config/fish/config.fish");
        case ShellKind::PowerShell: return join_path(home, ".config/powershell/profile.ps1");
        case ShellKind::Cmd: return join_path(home, "zshrcman_env.bat");
    }
    return join_path(home, ".bashrc");
}

// ============================================================================
// Environment Projector
// ============================================================================

Result<void> EnvironmentProjector::apply(const EnvironmentState& state,
                                         EnvironmentDelta& env) const {
    if (!state.active) {
        spdlog::debug("environment inactive, nothing to apply");
        return Result<void>::ok();
    }

    auto prepend = expand_all(state.paths_prepend, env);
    if (prepend.isErr()) return Result<void>::err(prepend.error());
    auto append = expand_all(state.paths_append, env);
    if (append.isErr()) return Result<void>::err(append.error());

    std::vector<std::string> existing = env.path_entries();
    std::vector<std::string> result;

    for (const auto& p : prepend.value()) {
        if (!contains(existing, p) && !contains(result, p)) result.push_back(p);
    }
    result.insert(result.end(), existing.begin(), existing.end());
    for (const auto& p : append.value()) {
        if (!contains(result, p)) result.push_back(p);
    }
    env.set_path_entries(result);

    for (const auto& [key, value] : state.variables) {
        env.set(key, value);
    }
    return Result<void>::ok();
}

Result<void> EnvironmentProjector::reverse(const EnvironmentState& state,
                                           EnvironmentDelta& env) const {
    std::vector<std::string> remove;
    for (const auto* list : {&state.paths_prepend, &state.paths_append}) {
        for (const auto& p : *list) {
            auto expanded = expand_path(p, env);
            if (expanded.isErr()) {
                // Never applied, so nothing to take out
                spdlog::debug("{}", expanded.error().message());
                continue;
            }
            remove.push_back(expanded.value());
        }
    }

    auto entries = env.path_entries();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const std::string& e) { return contains(remove, e); }),
                  entries.end());
    env.set_path_entries(entries);

    for (const auto& [key, value] : state.variables) {
        auto current = env.get(key);
        if (current && *current == value) {
            env.unset(key);
        }
    }
    return Result<void>::ok();
}

Result<void> EnvironmentProjector::write_script(const EnvironmentState& state,
                                                const std::string& path) const {
    auto result = atomic_write_file(path, render(state));
    if (!result.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "failed to write environment script " + path + ": " +
                                       result.error));
    }
    spdlog::debug("wrote environment script {}", path);
    return Result<void>::ok();
}

} // namespace zshrcman
