#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_schema_loader.hpp"

using namespace askql;

namespace {

std::vector<std::string> column_names(const TableMetadata& table) {
    std::vector<std::string> out;
    for (const auto& col : table.columns) out.push_back(col.name);
    return out;
}

} // anonymous namespace

TEST_CASE("PgSchemaLoader: rows group into lowercased tables", "[schema_loader]") {
    auto tables = PgSchemaLoader::build_schema_map({
        {"Orders", "ID", "INTEGER", false},
        {"Orders", "Status", "text", true},
        {"sales", "amount", "numeric", true},
    }, "Public");

    REQUIRE(tables->size() == 2);
    const auto& orders = *tables->at("orders");
    CHECK(orders.name == "orders");
    CHECK(orders.schema == "public");
    CHECK(column_names(orders) == std::vector<std::string>{"id", "status"});
    CHECK_FALSE(orders.find_column("id")->nullable);
    CHECK(orders.find_column("id")->type == "integer");
    CHECK(tables->at("sales")->find_column("amount")->type == "numeric");
}

TEST_CASE("PgSchemaLoader: names differing only in case are not merged", "[schema_loader]") {
    SECTION("the lowercase table wins even when it sorts second") {
        auto tables = PgSchemaLoader::build_schema_map({
            {"Sales", "secret", "text", true},
            {"sales", "id", "integer", false},
            {"sales", "amount", "numeric", true},
        }, "public");

        REQUIRE(tables->size() == 1);
        const auto& sales = *tables->at("sales");
        CHECK(column_names(sales) == std::vector<std::string>{"id", "amount"});
        CHECK(sales.find_column("secret") == nullptr);
    }

    SECTION("a later mixed-case twin is skipped") {
        auto tables = PgSchemaLoader::build_schema_map({
            {"sales", "id", "integer", false},
            {"SALES", "secret", "text", true},
        }, "public");

        REQUIRE(tables->size() == 1);
        CHECK(column_names(*tables->at("sales")) == std::vector<std::string>{"id"});
    }

    SECTION("with no lowercase spelling the first table is kept") {
        auto tables = PgSchemaLoader::build_schema_map({
            {"Sales", "id", "integer", false},
            {"SALES", "secret", "text", true},
        }, "public");

        REQUIRE(tables->size() == 1);
        CHECK(column_names(*tables->at("sales")) == std::vector<std::string>{"id"});
    }

    SECTION("colliding columns keep the earlier one") {
        auto tables = PgSchemaLoader::build_schema_map({
            {"users", "email", "text", false},
            {"users", "Email", "integer", true},
        }, "public");

        const auto& users = *tables->at("users");
        REQUIRE(users.columns.size() == 1);
        CHECK(users.find_column("email")->type == "text");
    }
}
