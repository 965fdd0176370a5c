#include "zshrcman/shell_config.hpp"
#include "zshrcman/names.hpp"
#include "zshrcman/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <sstream>

namespace zshrcman {

namespace {

// Position of the first marker that begins a line, npos if none
size_t find_marker(const std::string& content) {
    const std::string prefix = PROFILE_MARKER_PREFIX;
    size_t pos = 0;
    while ((pos = content.find(prefix, pos)) != std::string::npos) {
        if (pos == 0 || content[pos - 1] == '\n') return pos;
        pos += prefix.size();
    }
    return std::string::npos;
}

bool has_line(const std::string& content, const std::string& line) {
    std::istringstream in(content);
    std::string current;
    while (std::getline(in, current)) {
        if (!current.empty() && current.back() == '\r') current.pop_back();
        if (current == line) return true;
    }
    return false;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string strip_profile_marker(const std::string& content) {
    size_t start = find_marker(content);
    if (start == std::string::npos) return content;

    size_t end = content.find('\n', start);
    std::string result = content.substr(0, start);
    if (end != std::string::npos) {
        result += content.substr(end + 1);
    }
    return result;
}

Result<std::string> ShellConfigMarker::read() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return Result<std::string>::ok("");
    }
    auto content = read_file(path_);
    if (!content) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                                              "failed to read shell config " + path_));
    }
    return Result<std::string>::ok(*content);
}

Result<void> ShellConfigMarker::write(const std::string& content) const {
    auto result = atomic_write_file(path_, content);
    if (!result.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "failed to write shell config " + path_ + ": " +
                                       result.error));
    }
    return Result<void>::ok();
}

Result<void> ShellConfigMarker::update(const std::string& profile) {
    if (auto valid = validate_name("profile", profile); valid.isErr()) {
        return valid;
    }

    auto content = read();
    if (content.isErr()) return Result<void>::err(content.error());

    std::string updated = strip_profile_marker(content.value());
    if (!updated.empty() && updated.back() != '\n') {
        updated += '\n';
    }
    updated += std::string(PROFILE_MARKER_PREFIX) + " " + profile + "\n";

    spdlog::debug("marking {} with profile {}", path_, profile);
    return write(updated);
}

Result<void> ShellConfigMarker::clear() {
    auto content = read();
    if (content.isErr()) return Result<void>::err(content.error());

    if (find_marker(content.value()) == std::string::npos) {
        return Result<void>::ok();
    }
    return write(strip_profile_marker(content.value()));
}

std::optional<std::string> ShellConfigMarker::current() const {
    auto content = read();
    if (content.isErr()) return std::nullopt;

    const std::string& text = content.value();
    size_t start = find_marker(text);
    if (start == std::string::npos) return std::nullopt;

    size_t value_start = start + std::string(PROFILE_MARKER_PREFIX).size();
    size_t end = text.find('\n', value_start);
    std::string name = trim(text.substr(value_start, end == std::string::npos
                                                         ? std::string::npos
                                                         : end - value_start));
    if (name.empty()) return std::nullopt;
    return name;
}

Result<bool> ShellConfigMarker::ensure_source_line(const std::string& line) {
    auto content = read();
    if (content.isErr()) return Result<bool>::err(content.error());

    std::string text = content.value();
    if (has_line(text, line)) {
        return Result<bool>::ok(false);
    }

    if (!text.empty() && text.back() != '\n') {
        text += '\n';
    }
    text += "\n" + std::string(SOURCE_LINE_COMMENT) + "\n" + line + "\n";

    auto written = write(text);
    if (written.isErr()) return Result<bool>::err(written.error());

    spdlog::info("added source line to {}", path_);
    return Result<bool>::ok(true);
}

} // namespace zshrcman
