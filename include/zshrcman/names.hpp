#pragma once

/**
 * @file names.hpp
 * @brief Validation of user-supplied names
 *
 * Profile and package names become path components (bin directories and
 * link names) and shell text (the marker line and generated scripts), so
 * they are restricted to a single safe path component.
 */

#include "zshrcman/models.hpp"
#include "zshrcman/result.hpp"

#include <string>

namespace zshrcman {

/**
 * @brief Check a profile or package name
 *
 * Rejects empty names, "." and "..", path separators, drive-style colons,
 * control characters, shell quoting characters and invalid UTF-8.
 *
 * @param kind Used in the error message ("profile", "package", ...)
 * @return INVALID_OPERATION naming the offending input
 */
Result<void> validate_name(const std::string& kind, const std::string& name);

/// True when the bytes form well-formed UTF-8
bool is_valid_utf8(const std::string& s);

// ============================================================================
// Alias definitions
// ============================================================================

struct AliasDefinition {
    std::string name;
    std::string command;
};

/**
 * @brief Split "name=command"
 *
 * The name may use letters, digits and "_-.:+@". The command must be
 * non-empty and may not contain control characters or single quotes
 * (renderers wrap it in single quotes).
 */
Result<AliasDefinition> parse_alias_definition(const std::string& definition);

/**
 * @brief Check an environment before it is stored
 *
 * Variable names must be identifiers. Paths and values may not contain
 * control characters, double quotes or backticks. Aliases follow
 * parse_alias_definition().
 */
Result<void> validate_environment(const EnvironmentState& env);

} // namespace zshrcman
