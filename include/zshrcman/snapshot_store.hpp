#pragma once

#include "zshrcman/models.hpp"
#include "zshrcman/result.hpp"

#include <string>

namespace zshrcman {

// ============================================================================
// Persistence Contract
// ============================================================================

/**
 * @brief Loads and saves the full snapshot as one unit
 *
 * Implementations must return a default Snapshot from load() when nothing
 * has been saved yet. Concurrent writers are not coordinated: the last save
 * overwrites the whole document.
 */
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual Result<Snapshot> load() = 0;
    virtual Result<void> save(const Snapshot& snapshot) = 0;
};

/**
 * @brief SnapshotStore backed by a JSON file written atomically
 */
class JsonSnapshotStore : public SnapshotStore {
public:
    explicit JsonSnapshotStore(std::string path) : path_(std::move(path)) {}

    const std::string& path() const { return path_; }

    Result<Snapshot> load() override;
    Result<void> save(const Snapshot& snapshot) override;

private:
    std::string path_;
};

} // namespace zshrcman
