#include "zshrcman/snapshot_store.hpp"
#include "zshrcman/platform.hpp"
#include "zshrcman/snapshot_json.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace zshrcman {

Result<Snapshot> JsonSnapshotStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::debug("no state at {}, starting empty", path_);
        return Result<Snapshot>::ok(Snapshot{});
    }

    auto content = read_file(path_);
    if (!content) {
        return Result<Snapshot>::err(Error(ErrorCode::PERSISTENCE_ERROR,
                                           "failed to read state: " + path_));
    }

    auto parsed = parse_snapshot(*content, path_);
    if (!parsed.ok) {
        return Result<Snapshot>::err(Error(ErrorCode::PERSISTENCE_ERROR, parsed.error));
    }
    for (const auto& w : parsed.warnings) {
        spdlog::warn("{}: {}", path_, w);
    }

    spdlog::debug("loaded {} packages, {} profiles from {}",
                  parsed.snapshot.installations.size(),
                  parsed.snapshot.profiles.size(), path_);
    return Result<Snapshot>::ok(std::move(parsed.snapshot));
}

Result<void> JsonSnapshotStore::save(const Snapshot& snapshot) {
    std::string content;
    try {
        content = serialize_snapshot(snapshot);
    } catch (const nlohmann::json::exception& e) {
        return Result<void>::err(Error(ErrorCode::PERSISTENCE_ERROR,
                                       "failed to encode state for " + path_ + ": " + e.what()));
    }

    auto written = atomic_write_file(path_, content);
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::PERSISTENCE_ERROR,
                                       "failed to save state to " + path_ + ": " + written.error));
    }
    return Result<void>::ok();
}

} // namespace zshrcman
