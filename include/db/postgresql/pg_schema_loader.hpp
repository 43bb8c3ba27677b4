#pragma once

#include "db/ischema_loader.hpp"
#include <chrono>
#include <vector>

namespace askql {

/**
 * @brief PostgreSQL schema loader
 *
 * Queries information_schema.columns for one schema and builds a
 * SchemaMap keyed by lowercased table name.
 */
class PgSchemaLoader : public ISchemaLoader {
public:
    explicit PgSchemaLoader(std::chrono::seconds connect_timeout = std::chrono::seconds{5})
        : connect_timeout_(connect_timeout) {}
    ~PgSchemaLoader() override = default;

    /**
     * @brief Load schema from PostgreSQL database
     * @param conn_string PostgreSQL connection string
     * @param schema Schema to introspect
     * @return Populated SchemaMap, or nullptr on failure
     */
    [[nodiscard]] std::shared_ptr<SchemaMap> load_schema(
        const std::string& conn_string, const std::string& schema) override;

    /// One information_schema.columns row, names as the catalog spells them
    struct ColumnRow {
        std::string table;
        std::string column;
        std::string data_type;
        bool nullable = true;
    };

    /**
     * @brief Group column rows into tables keyed by lowercased name
     *
     * Tables whose names differ only in case collide once lowercased. The one
     * already spelled in lowercase wins, since that is the one an unquoted
     * identifier resolves to; otherwise the first seen is kept. Colliding
     * columns keep the earlier one. The loser is skipped with a warning,
     * never merged.
     */
    [[nodiscard]] static std::shared_ptr<SchemaMap> build_schema_map(
        const std::vector<ColumnRow>& rows, const std::string& schema);

private:
    std::chrono::seconds connect_timeout_;
};

} // namespace askql
