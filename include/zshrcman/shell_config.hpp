#pragma once

#include "zshrcman/result.hpp"

#include <optional>
#include <string>

namespace zshrcman {

/// Prefix of the active-profile marker line
constexpr const char* PROFILE_MARKER_PREFIX = "# ZSHRCMAN_PROFILE:";

/// Comment written above the source line
constexpr const char* SOURCE_LINE_COMMENT = "# zshrcman environment";

// ============================================================================
// Shell Config Marker
// ============================================================================

/**
 * @brief Edits the user's shell startup file
 *
 * Keeps exactly one "# ZSHRCMAN_PROFILE: <name>" line and at most one
 * source line for the generated environment script. All other content is
 * preserved byte for byte. A missing file is treated as empty.
 */
class ShellConfigMarker {
public:
    explicit ShellConfigMarker(std::string config_path) : path_(std::move(config_path)) {}

    const std::string& path() const { return path_; }

    /// Replace the first marker line (if any) and append the new one at the end.
    /// INVALID_OPERATION for names validate_name() rejects; the file is untouched.
    Result<void> update(const std::string& profile);

    /// Drop the first marker line; no-op when absent
    Result<void> clear();

    /// Profile named by the first marker line
    std::optional<std::string> current() const;

    /// Append the source line unless the exact line is already present
    Result<bool> ensure_source_line(const std::string& line);

private:
    Result<std::string> read() const;
    Result<void> write(const std::string& content) const;

    std::string path_;
};

// Remove the first line starting with the marker prefix (through its newline)
std::string strip_profile_marker(const std::string& content);

} // namespace zshrcman
