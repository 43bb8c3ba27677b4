#pragma once

#include "core/types.hpp"
#include <memory>
#include <string>

namespace askql {

/**
 * @brief Abstract schema loader interface
 *
 * The backend introspects its own catalog (information_schema for PG).
 */
class ISchemaLoader {
public:
    virtual ~ISchemaLoader() = default;

    /**
     * @brief Load table metadata for one schema
     * @param conn_string Connection string for the database
     * @param schema Schema to introspect (e.g. "public")
     * @return Populated SchemaMap keyed by lowercased table name, or nullptr on failure
     */
    [[nodiscard]] virtual std::shared_ptr<SchemaMap> load_schema(
        const std::string& conn_string, const std::string& schema) = 0;
};

} // namespace askql
