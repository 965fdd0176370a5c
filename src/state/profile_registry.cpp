#include "zshrcman/profile_registry.hpp"

namespace zshrcman {

ProfileRegistry::ProfileRegistry(std::map<std::string, Profile> profiles,
                                 std::optional<std::string> active)
    : profiles_(std::move(profiles)) {
    if (active && profiles_.count(*active)) {
        active_ = std::move(active);
    }
}

bool ProfileRegistry::contains(const std::string& name) const {
    return profiles_.count(name) != 0;
}

const Profile* ProfileRegistry::find(const std::string& name) const {
    auto it = profiles_.find(name);
    return it == profiles_.end() ? nullptr : &it->second;
}

Profile* ProfileRegistry::find(const std::string& name) {
    auto it = profiles_.find(name);
    return it == profiles_.end() ? nullptr : &it->second;
}

bool ProfileRegistry::create(const std::string& name, std::optional<std::string> parent) {
    if (contains(name)) return false;

    Profile profile;
    profile.name = name;
    profile.parent = std::move(parent);
    profiles_.emplace(name, std::move(profile));
    return true;
}

bool ProfileRegistry::erase(const std::string& name) {
    if (is_active(name)) {
        active_.reset();
    }
    return profiles_.erase(name) != 0;
}

bool ProfileRegistry::set_active(const std::string& name) {
    if (!contains(name)) return false;
    active_ = name;
    return true;
}

bool ProfileRegistry::add_package(const std::string& profile, const std::string& package) {
    auto* p = find(profile);
    if (!p) return false;
    p->packages.insert(package);
    return true;
}

bool ProfileRegistry::remove_package(const std::string& profile, const std::string& package) {
    auto* p = find(profile);
    if (!p) return false;
    p->packages.erase(package);
    return true;
}

void ProfileRegistry::remove_package_everywhere(const std::string& package) {
    for (auto& [name, profile] : profiles_) {
        profile.packages.erase(package);
    }
}

std::vector<std::string> ProfileRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(profiles_.size());
    for (const auto& [name, profile] : profiles_) {
        out.push_back(name);
    }
    return out;
}

} // namespace zshrcman
