#pragma once

#include "zshrcman/types.hpp"

#include <string>

namespace zshrcman {

// ============================================================================
// On-disk Layout
// ============================================================================

/**
 * Paths under a zshrcman data root:
 *
 *   <root>/state.json                 persisted snapshot
 *   <root>/profiles/<name>/bin/       per-profile binary links
 *   <root>/env/active.<ext>           script for the active context
 *
 * The shell startup file lives outside the root.
 */
struct Layout {
    std::string root;
    std::string state_file;
    std::string profiles_dir;
    std::string env_dir;
    std::string shell_config;

    std::string active_script(ShellKind shell) const;
};

Layout make_layout(const std::string& root, const std::string& shell_config);

} // namespace zshrcman
