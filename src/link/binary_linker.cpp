#include "zshrcman/binary_linker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace zshrcman {

namespace fs = std::filesystem;

namespace {

bool is_single_component(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    fs::path p(name);
    return !p.has_root_path() && p.filename() == p;
}

} // namespace

std::string BinaryLinker::bin_dir(const std::string& profile) const {
    return (fs::path(profiles_root_) / profile / "bin").string();
}

Result<std::string> BinaryLinker::contained_bin_dir(const std::string& profile) const {
    if (!is_single_component(profile)) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_OPERATION,
                                              "profile '" + profile +
                                              "' is not a single path component"));
    }

    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::path(profiles_root_), ec);
    if (ec) root = fs::path(profiles_root_).lexically_normal();
    fs::path dir = fs::weakly_canonical(fs::path(bin_dir(profile)), ec);
    if (ec) dir = fs::path(bin_dir(profile)).lexically_normal();

    fs::path rel = dir.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return Result<std::string>::err(Error(ErrorCode::INVALID_OPERATION,
                                              "bin directory of '" + profile + "' escapes " +
                                              profiles_root_));
    }
    return Result<std::string>::ok(dir.string());
}

Result<void> BinaryLinker::clear(const std::string& profile) const {
    auto checked = contained_bin_dir(profile);
    if (checked.isErr()) return Result<void>::err(checked.error());

    fs::path dir(checked.value());
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return Result<void>::ok();
    }

    std::vector<fs::path> doomed;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec) || !entry.is_directory(entry_ec)) {
            doomed.push_back(entry.path());
        }
    }
    if (ec) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "failed to read " + dir.string() + ": " + ec.message()));
    }

    for (const auto& path : doomed) {
        fs::remove(path, ec);
        if (ec) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                           "failed to remove " + path.string() + ": " +
                                           ec.message()));
        }
    }
    return Result<void>::ok();
}

Result<void> BinaryLinker::link(const std::string& profile,
                                const std::vector<LinkEntry>& entries) const {
    auto checked = contained_bin_dir(profile);
    if (checked.isErr()) return Result<void>::err(checked.error());

    for (const auto& entry : entries) {
        if (!is_single_component(entry.first)) {
            return Result<void>::err(Error(ErrorCode::INVALID_OPERATION,
                                           "cannot link '" + entry.first +
                                           "': not a single path component"));
        }
    }

    fs::path dir(checked.value());
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "failed to create " + dir.string() + ": " + ec.message()));
    }

    auto cleared = clear(profile);
    if (cleared.isErr()) return cleared;

    for (const auto& [package, location] : entries) {
        fs::path link_path = dir / package;

        if (fs::is_directory(fs::symlink_status(link_path, ec))) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                           "cannot link " + package + ": " + link_path.string() +
                                           " is a directory"));
        }

        fs::create_symlink(location, link_path, ec);
        if (ec) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                           "failed to link " + package + " -> " + location + ": " +
                                           ec.message()));
        }
        spdlog::debug("linked {} -> {}", link_path.string(), location);
    }
    return Result<void>::ok();
}

std::vector<std::string> BinaryLinker::linked(const std::string& profile) const {
    std::vector<std::string> names;
    auto checked = contained_bin_dir(profile);
    if (checked.isErr()) return names;

    fs::path dir(checked.value());
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return names;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec) || entry.is_regular_file(entry_ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace zshrcman
