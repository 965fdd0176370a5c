#pragma once

#include "zshrcman/models.hpp"

#include <string>
#include <vector>

namespace zshrcman {

// ============================================================================
// Snapshot Parsing Result
// ============================================================================

struct SnapshotParseResult {
    bool ok = false;
    std::string error;
    Snapshot snapshot;
    std::vector<std::string> warnings;
};

// Parse a state document (schema zshrcman.state.v1).
// Unknown enum values fall back to defaults and produce a warning.
SnapshotParseResult parse_snapshot(const std::string& json_str,
                                   const std::string& source_path = "");

// Serialize a snapshot as pretty-printed JSON.
// Throws nlohmann::json::type_error when a string is not valid UTF-8;
// JsonSnapshotStore::save converts that into PERSISTENCE_ERROR.
std::string serialize_snapshot(const Snapshot& snapshot);

// ============================================================================
// Environment State Parsing
// ============================================================================

struct EnvironmentParseResult {
    bool ok = false;
    std::string error;
    EnvironmentState environment;
};

EnvironmentParseResult parse_environment_state(const std::string& json_str);

std::string serialize_environment_state(const EnvironmentState& environment);

// Single entries, as stored in the state document plus their key
std::string serialize_installation_record(const InstallationRecord& record);
std::string serialize_profile(const Profile& profile);

} // namespace zshrcman
