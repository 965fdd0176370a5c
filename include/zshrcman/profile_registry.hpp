#pragma once

#include "zshrcman/models.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zshrcman {

// ============================================================================
// Profile Registry
// ============================================================================

/**
 * @brief Profile-name-keyed table of profiles plus the active-profile pointer
 *
 * At most one profile is active. The pointer always names a registered
 * profile; set_active() refuses unknown names.
 */
class ProfileRegistry {
public:
    ProfileRegistry() = default;
    ProfileRegistry(std::map<std::string, Profile> profiles,
                    std::optional<std::string> active);

    bool contains(const std::string& name) const;

    const Profile* find(const std::string& name) const;
    Profile* find(const std::string& name);

    // Returns false if a profile with the same name already exists
    bool create(const std::string& name, std::optional<std::string> parent);

    // Returns false if the profile is unknown
    bool erase(const std::string& name);

    const std::optional<std::string>& active() const { return active_; }
    bool is_active(const std::string& name) const { return active_ && *active_ == name; }

    // Returns false if the profile is unknown
    bool set_active(const std::string& name);
    void clear_active() { active_.reset(); }

    // Package-set membership; both return false when the profile is unknown
    bool add_package(const std::string& profile, const std::string& package);
    bool remove_package(const std::string& profile, const std::string& package);

    // Remove a package from every profile's set
    void remove_package_everywhere(const std::string& package);

    std::vector<std::string> names() const;

    size_t size() const { return profiles_.size(); }

    const std::map<std::string, Profile>& profiles() const { return profiles_; }

private:
    std::map<std::string, Profile> profiles_;
    std::optional<std::string> active_;
};

} // namespace zshrcman
