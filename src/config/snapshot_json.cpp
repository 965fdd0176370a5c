#include "zshrcman/snapshot_json.hpp"
#include "zshrcman/names.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace zshrcman {

using json = nlohmann::json;

namespace {

std::optional<std::string> get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::map<std::string, std::string> get_string_map(const json& j, const std::string& key) {
    std::map<std::string, std::string> result;
    if (j.contains(key) && j[key].is_object()) {
        for (auto& [k, v] : j[key].items()) {
            if (v.is_string()) {
                result[k] = v.get<std::string>();
            }
        }
    }
    return result;
}

std::set<std::string> get_string_set(const json& j, const std::string& key) {
    auto items = get_string_array(j, key);
    return std::set<std::string>(items.begin(), items.end());
}

template<typename T>
void put_optional(json& j, const std::string& key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Environment
// ----------------------------------------------------------------------------

EnvironmentState environment_from_json(const json& j) {
    EnvironmentState env;
    if (!j.is_object()) return env;

    env.paths_prepend = get_string_array(j, "paths_prepend");
    env.paths_append = get_string_array(j, "paths_append");
    env.variables = get_string_map(j, "variables");
    env.aliases = get_string_map(j, "aliases");
    if (j.contains("active") && j["active"].is_boolean()) {
        env.active = j["active"].get<bool>();
    }
    return env;
}

json environment_to_json(const EnvironmentState& env) {
    json j;
    j["paths_prepend"] = env.paths_prepend;
    j["paths_append"] = env.paths_append;
    j["variables"] = env.variables;
    j["aliases"] = env.aliases;
    j["active"] = env.active;
    return j;
}

// ----------------------------------------------------------------------------
// Installation record
// ----------------------------------------------------------------------------

InstallationRecord record_from_json(const std::string& package,
                                    const json& j,
                                    std::vector<std::string>& warnings) {
    InstallationRecord rec;
    rec.package = package;
    rec.version = get_string(j, "version");
    rec.installed_at = get_string(j, "installed_at").value_or("");
    rec.active_for = get_string_set(j, "active_for");
    rec.location = get_string(j, "location");
    rec.installer_type = get_string(j, "installer_type").value_or("auto");

    if (auto scope = get_string(j, "scope")) {
        if (auto parsed = parse_install_scope(*scope)) {
            rec.scope = *parsed;
        } else {
            warnings.push_back("invalid scope '" + *scope + "' for " + package);
        }
    }

    if (j.contains("installed_by") && j["installed_by"].is_object()) {
        const auto& by = j["installed_by"];
        auto kind = get_string(by, "kind").value_or("manual");
        if (auto parsed = parse_source_kind(kind)) {
            rec.installed_by.kind = *parsed;
            rec.installed_by.name = get_string(by, "name").value_or("");
        } else {
            warnings.push_back("invalid installed_by kind '" + kind + "' for " + package);
        }
    }

    return rec;
}

json record_to_json(const InstallationRecord& rec) {
    json j;
    put_optional(j, "version", rec.version);
    j["installed_at"] = rec.installed_at;

    json by;
    by["kind"] = source_kind_to_string(rec.installed_by.kind);
    if (!rec.installed_by.name.empty()) {
        by["name"] = rec.installed_by.name;
    }
    j["installed_by"] = by;

    j["active_for"] = rec.active_for;
    j["scope"] = install_scope_to_string(rec.scope);
    put_optional(j, "location", rec.location);
    j["installer_type"] = rec.installer_type;
    return j;
}

// ----------------------------------------------------------------------------
// Profile
// ----------------------------------------------------------------------------

Profile profile_from_json(const std::string& name,
                          const json& j,
                          std::vector<std::string>& warnings) {
    Profile profile;
    profile.name = name;
    profile.parent = get_string(j, "parent");
    profile.packages = get_string_set(j, "packages");
    profile.alias_groups = get_string_set(j, "alias_groups");

    if (j.contains("environment")) {
        profile.environment = environment_from_json(j["environment"]);
    }

    if (j.contains("os_overrides") && j["os_overrides"].is_object()) {
        for (auto& [os_key, ovr] : j["os_overrides"].items()) {
            auto os = parse_os_type(os_key);
            if (!os) {
                warnings.push_back("unknown os '" + os_key + "' in profile " + name);
                continue;
            }
            OsOverride override_entry;
            override_entry.packages = get_string_set(ovr, "packages");
            if (ovr.contains("environment") && ovr["environment"].is_object()) {
                override_entry.environment = environment_from_json(ovr["environment"]);
            }
            profile.os_overrides[os_type_to_string(*os)] = std::move(override_entry);
        }
    }

    return profile;
}

json profile_to_json(const Profile& profile) {
    json j;
    put_optional(j, "parent", profile.parent);
    j["packages"] = profile.packages;
    j["environment"] = environment_to_json(profile.environment);

    json overrides = json::object();
    for (const auto& [os, ovr] : profile.os_overrides) {
        json o;
        o["packages"] = ovr.packages;
        if (ovr.environment) {
            o["environment"] = environment_to_json(*ovr.environment);
        }
        overrides[os] = o;
    }
    j["os_overrides"] = overrides;
    j["alias_groups"] = profile.alias_groups;
    return j;
}

// ----------------------------------------------------------------------------
// Alias group
// ----------------------------------------------------------------------------

AliasGroup alias_group_from_json(const std::string& name,
                                 const json& j,
                                 std::vector<std::string>& warnings) {
    AliasGroup group;
    group.name = name;
    group.items = get_string_array(j, "items");
    for (const auto& def : get_string_array(j, "active")) {
        if (std::find(group.items.begin(), group.items.end(), def) == group.items.end()) {
            warnings.push_back("alias group " + name + ": active alias not in items: " + def);
            continue;
        }
        group.active.push_back(def);
    }
    return group;
}

json alias_group_to_json(const AliasGroup& group) {
    json j;
    j["items"] = group.items;
    j["active"] = group.active;
    return j;
}

} // namespace

SnapshotParseResult parse_snapshot(const std::string& json_str, const std::string& source_path) {
    SnapshotParseResult result;
    std::string where = source_path.empty() ? std::string("state") : source_path;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = where + ": JSON must be an object";
            return result;
        }

        if (auto schema = get_string(j, "$schema")) {
            if (*schema != STATE_SCHEMA) {
                result.error = where + ": $schema mismatch: expected " + STATE_SCHEMA;
                return result;
            }
        } else {
            result.warnings.push_back("$schema missing");
        }

        if (j.contains("installations") && j["installations"].is_object()) {
            for (auto& [package, rec] : j["installations"].items()) {
                if (!rec.is_object()) {
                    result.warnings.push_back("ignoring malformed record: " + package);
                    continue;
                }
                if (auto valid = validate_name("package", package); valid.isErr()) {
                    result.warnings.push_back("ignoring record: " + valid.error().message());
                    continue;
                }
                result.snapshot.installations[package] =
                    record_from_json(package, rec, result.warnings);
            }
        }

        if (j.contains("profiles") && j["profiles"].is_object()) {
            for (auto& [name, prof] : j["profiles"].items()) {
                if (!prof.is_object()) {
                    result.warnings.push_back("ignoring malformed profile: " + name);
                    continue;
                }
                if (auto valid = validate_name("profile", name); valid.isErr()) {
                    result.warnings.push_back("ignoring profile: " + valid.error().message());
                    continue;
                }
                result.snapshot.profiles[name] = profile_from_json(name, prof, result.warnings);
            }
        }

        if (j.contains("alias_groups") && j["alias_groups"].is_object()) {
            for (auto& [name, group] : j["alias_groups"].items()) {
                if (!group.is_object()) {
                    result.warnings.push_back("ignoring malformed alias group: " + name);
                    continue;
                }
                result.snapshot.alias_groups[name] =
                    alias_group_from_json(name, group, result.warnings);
            }
        }

        if (auto active = get_string(j, "active_profile")) {
            if (result.snapshot.profiles.count(*active)) {
                result.snapshot.active_profile = *active;
            } else {
                result.warnings.push_back("active profile '" + *active + "' does not exist");
            }
        }

        result.ok = true;
        return result;

    } catch (const json::parse_error& e) {
        result.error = where + ": parse error: " + e.what();
        return result;
    } catch (const json::exception& e) {
        result.error = where + ": JSON error: " + e.what();
        return result;
    }
}

std::string serialize_snapshot(const Snapshot& snapshot) {
    json j;
    j["$schema"] = STATE_SCHEMA;
    put_optional(j, "active_profile", snapshot.active_profile);

    json installations = json::object();
    for (const auto& [package, rec] : snapshot.installations) {
        installations[package] = record_to_json(rec);
    }
    j["installations"] = installations;

    json profiles = json::object();
    for (const auto& [name, profile] : snapshot.profiles) {
        profiles[name] = profile_to_json(profile);
    }
    j["profiles"] = profiles;

    json groups = json::object();
    for (const auto& [name, group] : snapshot.alias_groups) {
        groups[name] = alias_group_to_json(group);
    }
    j["alias_groups"] = groups;

    return j.dump(2) + "\n";
}

EnvironmentParseResult parse_environment_state(const std::string& json_str) {
    EnvironmentParseResult result;
    try {
        auto j = json::parse(json_str);
        if (!j.is_object()) {
            result.error = "environment must be an object";
            return result;
        }
        result.environment = environment_from_json(j);
        result.ok = true;
    } catch (const json::exception& e) {
        result.error = std::string("parse error: ") + e.what();
    }
    return result;
}

std::string serialize_environment_state(const EnvironmentState& environment) {
    return environment_to_json(environment).dump(2);
}

std::string serialize_installation_record(const InstallationRecord& record) {
    json j = record_to_json(record);
    j["package"] = record.package;
    return j.dump(2);
}

std::string serialize_profile(const Profile& profile) {
    json j = profile_to_json(profile);
    j["name"] = profile.name;
    return j.dump(2);
}

} // namespace zshrcman
