#pragma once

#include "zshrcman/result.hpp"

#include <string>
#include <utility>
#include <vector>

namespace zshrcman {

// (package name, binary location)
using LinkEntry = std::pair<std::string, std::string>;

// ============================================================================
// Binary Linker
// ============================================================================

/**
 * @brief Exposes a profile's package binaries as symlinks in its bin directory
 *
 * Layout: <profiles_root>/<profile>/bin/<package> -> <location>
 *
 * A profile whose bin directory would resolve outside profiles_root, or a
 * package that is not a single path component, is refused with
 * INVALID_OPERATION before anything on disk is touched.
 */
class BinaryLinker {
public:
    explicit BinaryLinker(std::string profiles_root) : profiles_root_(std::move(profiles_root)) {}

    std::string bin_dir(const std::string& profile) const;

    /// Remove files and symlinks from the bin directory (directories are kept)
    Result<void> clear(const std::string& profile) const;

    /**
     * Create the bin directory, clear it, then create one symlink per entry.
     * IO_ERROR when the directory is not writable or a link name is taken by
     * a real directory.
     */
    Result<void> link(const std::string& profile, const std::vector<LinkEntry>& entries) const;

    /// Names currently present in the bin directory, sorted
    std::vector<std::string> linked(const std::string& profile) const;

private:
    Result<std::string> contained_bin_dir(const std::string& profile) const;

    std::string profiles_root_;
};

} // namespace zshrcman
