#include "db/postgresql/pg_schema_loader.hpp"
#include "db/postgresql/pg_handles.hpp"
#include "core/utils.hpp"

#include <format>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace askql {

static constexpr std::string_view kYes = "YES";

std::shared_ptr<SchemaMap> PgSchemaLoader::load_schema(const std::string& conn_string,
                                                       const std::string& schema) {
    const std::string timeout = std::to_string(connect_timeout_.count());
    const char* const keywords[] = {"dbname", "connect_timeout", "application_name", nullptr};
    const char* const values[] = {conn_string.c_str(), timeout.c_str(), "askql-schema", nullptr};

    PGConnPtr conn(PQconnectdbParams(keywords, values, /*expand_dbname=*/1));
    if (!conn || PQstatus(conn.get()) != CONNECTION_OK) {
        utils::log::error(std::format("Schema load: connection failed: {}",
            conn ? utils::trim(PQerrorMessage(conn.get())) : "allocation failed"));
        return nullptr;
    }

    // Columns of every table and view in the requested schema
    static constexpr const char* SCHEMA_QUERY =
        "SELECT "
        "    table_name, "
        "    column_name, "
        "    data_type, "
        "    is_nullable "
        "FROM information_schema.columns "
        "WHERE table_schema = $1 "
        "ORDER BY table_name, ordinal_position";

    const char* const params[] = {schema.c_str()};
    PGResultPtr res(PQexecParams(conn.get(), SCHEMA_QUERY, 1, nullptr, params,
                                 nullptr, nullptr, 0));
    if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        utils::log::error(std::format("Schema load: introspection query failed: {}",
            res ? utils::trim(PQresultErrorMessage(res.get())) : "no result"));
        return nullptr;
    }

    // Column indices in the result set (matching the SELECT order)
    static constexpr int COL_TABLE       = 0;
    static constexpr int COL_COLUMN      = 1;
    static constexpr int COL_DATA_TYPE   = 2;
    static constexpr int COL_IS_NULLABLE = 3;

    std::vector<ColumnRow> rows;
    const int nrows = PQntuples(res.get());
    rows.reserve(static_cast<size_t>(nrows));
    for (int row = 0; row < nrows; ++row) {
        rows.push_back({PQgetvalue(res.get(), row, COL_TABLE),
                        PQgetvalue(res.get(), row, COL_COLUMN),
                        PQgetvalue(res.get(), row, COL_DATA_TYPE),
                        std::string_view(PQgetvalue(res.get(), row, COL_IS_NULLABLE)) == kYes});
    }

    auto tables = build_schema_map(rows, schema);
    const std::string schema_name = utils::to_lower(schema);
    utils::log::info(std::format("Schema load: {} table(s) from schema '{}'",
                                 tables->size(), schema_name));
    return tables;
}

std::shared_ptr<SchemaMap> PgSchemaLoader::build_schema_map(const std::vector<ColumnRow>& rows,
                                                            const std::string& schema) {
    const std::string schema_name = utils::to_lower(schema);
    const auto is_lower = [](const std::string& name) { return utils::to_lower(name) == name; };

    // Lowercased name -> the catalog spelling that owns it
    std::map<std::string, std::string> owner;
    std::map<std::string, std::shared_ptr<TableMetadata>> building;
    std::set<std::string> skipped;

    const auto skip = [&](const std::string& raw, const std::string& kept) {
        if (skipped.insert(raw).second) {
            utils::log::warn(std::format(
                "Schema load: table \"{}\" differs from \"{}\" only in case; skipping it",
                raw, kept));
        }
    };

    for (const auto& row : rows) {
        const std::string key = utils::to_lower(row.table);
        auto [it, inserted] = owner.try_emplace(key, row.table);
        if (!inserted && it->second != row.table) {
            if (is_lower(row.table) && !is_lower(it->second)) {
                skip(it->second, row.table);
                it->second = row.table;
                building.erase(key);
            } else {
                skip(row.table, it->second);
                continue;
            }
        }

        auto& table = building[key];
        if (!table) {
            table = std::make_shared<TableMetadata>();
            table->schema = schema_name;
            table->name = key;
        }

        std::string column = utils::to_lower(row.column);
        if (table->find_column(column)) {
            utils::log::warn(std::format(
                "Schema load: column \"{}\".\"{}\" differs from an earlier one only in case; skipping it",
                row.table, row.column));
            continue;
        }
        table->add_column(ColumnMetadata(std::move(column), utils::to_lower(row.data_type), row.nullable));
    }

    auto tables = std::make_shared<SchemaMap>();
    for (auto& [name, table] : building) {
        (*tables)[name] = std::move(table);
    }
    return tables;
}

} // namespace askql
