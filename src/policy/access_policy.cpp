#include "policy/access_policy.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace askql {

AccessPolicy::AccessPolicy(std::vector<RoleGrant> grants) {
    for (auto& grant : grants) {
        RoleGrant normalized;
        normalized.role = utils::to_lower(grant.role);
        normalized.wildcard = grant.wildcard;
        for (const auto& table : grant.tables) {
            if (table == kWildcardTable) {
                normalized.wildcard = true;
            } else {
                normalized.tables.insert(utils::to_lower(table));
            }
        }
        if (normalized.wildcard) {
            normalized.tables.clear();
        }

        const std::string key = normalized.role;
        if (!grants_.emplace(key, std::move(normalized)).second) {
            utils::log::warn(std::format("AccessPolicy: duplicate role '{}' ignored", key));
        }
    }
}

std::vector<RoleGrant> AccessPolicy::default_grants() {
    return {
        {"analyst", false, {"sales", "users", "orders"}},
        {"admin", true, {}},
        {"readonly", false, {"sales", "users"}},
    };
}

AccessScope AccessPolicy::scope(const std::string& role, const CatalogSnapshot& catalog) const {
    AccessScope result;
    result.role = utils::to_lower(role);

    const auto it = grants_.find(result.role);
    if (it == grants_.end()) {
        return result;
    }
    const RoleGrant& grant = it->second;

    for (const auto& [name, table] : catalog.tables) {
        if (grant.wildcard || grant.tables.contains(name)) {
            result.tables.emplace(name, table);
        }
    }

    // SchemaMap is ordered, so allowed comes out sorted
    result.allowed.reserve(result.tables.size());
    for (const auto& [name, _] : result.tables) {
        result.allowed.push_back(name);
    }
    return result;
}

bool AccessPolicy::has_role(const std::string& role) const {
    return grants_.contains(utils::to_lower(role));
}

std::vector<std::string> AccessPolicy::roles() const {
    std::vector<std::string> names;
    names.reserve(grants_.size());
    for (const auto& [name, _] : grants_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace askql
