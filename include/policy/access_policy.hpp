#pragma once

#include "core/types.hpp"
#include "schema/schema_catalog.hpp"

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace askql {

inline constexpr std::string_view kWildcardTable = "*";

/// One row of the policy table: a role and the tables it may read.
struct RoleGrant {
    std::string role;
    bool wildcard = false;
    std::set<std::string> tables;   // lowercased
};

/**
 * @brief What one role may see of one catalog snapshot
 *
 * `tables` is what the candidate producer is shown; `allowed` is what the
 * validator permits. Both come from the same lookup, and `allowed` is
 * exactly the key set of `tables`.
 */
struct AccessScope {
    std::string role;
    SchemaMap tables;
    std::vector<std::string> allowed;   // sorted

    [[nodiscard]] bool empty() const { return allowed.empty(); }
};

/**
 * @brief Role-based table allowlist
 *
 * Data-driven: the only place a role name is interpreted. Unknown roles
 * resolve to empty access, never to wildcard. Immutable after construction.
 */
class AccessPolicy {
public:
    explicit AccessPolicy(std::vector<RoleGrant> grants);

    /**
     * @brief Built-in policy table used when configuration defines no roles
     *
     * analyst -> sales, users, orders; admin -> *; readonly -> sales, users
     */
    [[nodiscard]] static std::vector<RoleGrant> default_grants();

    /**
     * @brief Filter a catalog snapshot down to the role's tables
     *
     * Wildcard roles see the full catalog. Granted tables that are absent
     * from the catalog are not reported as allowed.
     */
    [[nodiscard]] AccessScope scope(const std::string& role,
                                    const CatalogSnapshot& catalog) const;

    [[nodiscard]] SchemaMap filtered_schema(const std::string& role,
                                            const CatalogSnapshot& catalog) const {
        return scope(role, catalog).tables;
    }

    [[nodiscard]] std::vector<std::string> allowed_tables(const std::string& role,
                                                          const CatalogSnapshot& catalog) const {
        return scope(role, catalog).allowed;
    }

    [[nodiscard]] bool has_role(const std::string& role) const;

    [[nodiscard]] std::vector<std::string> roles() const;

private:
    std::unordered_map<std::string, RoleGrant> grants_;   // keyed by lowercased role
};

} // namespace askql
