#include "zshrcman/package_ledger.hpp"

namespace zshrcman {

bool PackageLedger::contains(const std::string& package) const {
    return records_.count(package) != 0;
}

const InstallationRecord* PackageLedger::find(const std::string& package) const {
    auto it = records_.find(package);
    return it == records_.end() ? nullptr : &it->second;
}

InstallationRecord* PackageLedger::find(const std::string& package) {
    auto it = records_.find(package);
    return it == records_.end() ? nullptr : &it->second;
}

bool PackageLedger::insert(InstallationRecord record) {
    std::string key = record.package;
    return records_.emplace(std::move(key), std::move(record)).second;
}

bool PackageLedger::erase(const std::string& package) {
    return records_.erase(package) != 0;
}

bool PackageLedger::add_active(const std::string& package, const std::string& profile) {
    auto* rec = find(package);
    if (!rec) return false;
    rec->active_for.insert(profile);
    return true;
}

bool PackageLedger::remove_active(const std::string& package, const std::string& profile) {
    auto* rec = find(package);
    if (!rec) return false;
    rec->active_for.erase(profile);
    return true;
}

void PackageLedger::forget_profile(const std::string& profile) {
    for (auto& [name, rec] : records_) {
        rec.active_for.erase(profile);
    }
}

size_t PackageLedger::usage_count(const std::string& package) const {
    const auto* rec = find(package);
    return rec ? rec->active_for.size() : 0;
}

std::vector<std::string> PackageLedger::package_names() const {
    std::vector<std::string> names;
    names.reserve(records_.size());
    for (const auto& [name, rec] : records_) {
        names.push_back(name);
    }
    return names;
}

} // namespace zshrcman
