#pragma once

#include "zshrcman/models.hpp"

#include <map>
#include <string>
#include <vector>

namespace zshrcman {

// ============================================================================
// Package Ledger
// ============================================================================

/**
 * @brief Package-name-keyed table of installation records
 *
 * The ledger alone does not keep profiles in sync; paired mutations go
 * through InstallationState so both sides change together.
 */
class PackageLedger {
public:
    PackageLedger() = default;
    explicit PackageLedger(std::map<std::string, InstallationRecord> records)
        : records_(std::move(records)) {}

    bool contains(const std::string& package) const;

    const InstallationRecord* find(const std::string& package) const;
    InstallationRecord* find(const std::string& package);

    // Returns false if a record with the same name already exists
    bool insert(InstallationRecord record);

    // Returns false if the package was not in the ledger
    bool erase(const std::string& package);

    // Membership of a profile in a record's active_for set.
    // Both return false when the package is unknown.
    bool add_active(const std::string& package, const std::string& profile);
    bool remove_active(const std::string& package, const std::string& profile);

    // Remove a profile from every active_for set
    void forget_profile(const std::string& profile);

    // Number of profiles depending on the package (0 when unknown)
    size_t usage_count(const std::string& package) const;

    std::vector<std::string> package_names() const;

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    const std::map<std::string, InstallationRecord>& records() const { return records_; }

private:
    std::map<std::string, InstallationRecord> records_;
};

} // namespace zshrcman
