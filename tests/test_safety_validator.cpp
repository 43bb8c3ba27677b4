#include <catch2/catch_test_macros.hpp>
#include "security/safety_validator.hpp"

using namespace askql;

namespace {

const std::vector<std::string> kAnalystTables = {"orders", "sales", "users"};

SafetyValidator make_validator() {
    SafetyValidator::Config cfg;
    cfg.default_limit = 100;
    cfg.max_limit = 1000;
    cfg.default_schema = "public";
    return SafetyValidator(cfg);
}

Rejection rejected(std::string_view sql,
                   const std::vector<std::string>& allowed = kAnalystTables) {
    auto verdict = make_validator().validate(sql, allowed);
    REQUIRE_FALSE(verdict.is_accepted());
    return verdict.rejection;
}

SanitizedQuery accepted(std::string_view sql,
                        const std::vector<std::string>& allowed = kAnalystTables) {
    auto verdict = make_validator().validate(sql, allowed);
    INFO(verdict.rejection.message);
    REQUIRE(verdict.is_accepted());
    return *verdict.accepted;
}

} // anonymous namespace

// ============================================================================
// Statement shape
// ============================================================================

TEST_CASE("SafetyValidator: statement shape", "[validator]") {
    SECTION("empty and whitespace-only") {
        CHECK(rejected("").reason == RejectReason::EMPTY_QUERY);
        CHECK(rejected("   \n\t").reason == RejectReason::EMPTY_QUERY);
    }

    SECTION("unterminated literal is malformed") {
        auto r = rejected("SELECT * FROM sales WHERE region = 'west");
        CHECK(r.reason == RejectReason::MALFORMED_QUERY);
        CHECK(r.offending_fragment == "'west");
    }

    SECTION("stacked statements") {
        auto r = rejected("SELECT * FROM sales; DROP TABLE users");
        CHECK(r.reason == RejectReason::MULTIPLE_STATEMENTS);
        CHECK(r.offending_fragment == "; DROP TABLE users");
    }

    SECTION("a lone trailing semicolon is still a separator") {
        CHECK(rejected("SELECT * FROM sales;").reason == RejectReason::MULTIPLE_STATEMENTS);
    }

    SECTION("statements that are not SELECT") {
        auto r = rejected("DELETE FROM sales");
        CHECK(r.reason == RejectReason::NOT_READ_ONLY);
        CHECK(r.message == "Only SELECT queries are allowed.");
        CHECK(r.offending_fragment == "DELETE");

        CHECK(rejected("EXPLAIN SELECT * FROM sales").reason == RejectReason::NOT_READ_ONLY);
        CHECK(rejected("SHOW search_path").reason == RejectReason::NOT_READ_ONLY);
    }

    SECTION("parenthesized SELECT is fine") {
        CHECK(accepted("(SELECT id FROM sales)").sql() == "(SELECT id FROM sales) LIMIT 100");
    }
}

// ============================================================================
// Keywords
// ============================================================================

TEST_CASE("SafetyValidator: forbidden keywords", "[validator]") {
    SECTION("anywhere in the statement") {
        auto r = rejected("SELECT * FROM sales WHERE id IN (SELECT 1) AND delete");
        CHECK(r.reason == RejectReason::FORBIDDEN_KEYWORD);
        CHECK(r.offending_fragment == "DELETE");
        CHECK(r.message == "Keyword 'DELETE' is not allowed; only read-only queries can run.");
    }

    SECTION("row lock FOR UPDATE trips the keyword check first") {
        CHECK(rejected("SELECT * FROM sales FOR UPDATE").reason == RejectReason::FORBIDDEN_KEYWORD);
    }

    SECTION("every verb is covered") {
        for (const char* verb : {"INSERT", "UPDATE", "DELETE", "DROP", "ALTER", "TRUNCATE",
                                 "CREATE", "GRANT", "REVOKE", "COPY", "VACUUM", "ANALYZE", "LOCK"}) {
            INFO(verb);
            auto r = rejected(std::string("SELECT ") + verb + " FROM sales");
            CHECK(r.reason == RejectReason::FORBIDDEN_KEYWORD);
        }
    }

    SECTION("keywords inside string literals are data") {
        auto q = accepted("SELECT * FROM sales WHERE product = 'DROP TABLE users; --'");
        CHECK(q.limit_injected());
    }

    SECTION("keywords inside identifiers are not keywords") {
        accepted("SELECT updated_at, created_by FROM orders");
        accepted(R"(SELECT "delete" FROM orders)");
    }
}

// ============================================================================
// Constructs
// ============================================================================

TEST_CASE("SafetyValidator: forbidden constructs", "[validator]") {
    SECTION("comments") {
        auto line = rejected("SELECT * FROM sales -- drop everything");
        CHECK(line.reason == RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(line.message == "SQL comments are not allowed.");
        CHECK(rejected("SELECT /* hi */ * FROM sales").reason == RejectReason::FORBIDDEN_CONSTRUCT);
    }

    SECTION("set operations") {
        auto r = rejected("SELECT id FROM sales UNION SELECT id FROM users");
        CHECK(r.reason == RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(r.message == "Set operations (UNION) are not allowed.");
        CHECK(rejected("SELECT id FROM sales EXCEPT SELECT id FROM users").reason ==
              RejectReason::FORBIDDEN_CONSTRUCT);
    }

    SECTION("common table expressions") {
        auto r = rejected("WITH t AS (SELECT * FROM sales) SELECT * FROM t");
        CHECK(r.reason == RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(r.offending_fragment == "WITH");
    }

    SECTION("WITH as part of a type or clause is fine") {
        accepted("SELECT CAST(sold_at AS timestamp WITH TIME ZONE) FROM sales");
    }

    SECTION("functions that run a query or read a table by name") {
        auto r = rejected("SELECT query_to_xml('select * from customers', true, false, '') FROM sales");
        CHECK(r.reason == RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(r.offending_fragment == "query_to_xml");
        CHECK(r.message == "Function query_to_xml() is not allowed.");
        CHECK(rejected("SELECT table_to_xml('customers', true, false, '')").reason ==
              RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(rejected("SELECT cursor_to_xml(c, 10, true, false, '') FROM sales").reason ==
              RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(rejected("SELECT database_to_xml(true, false, '')").reason ==
              RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(rejected("SELECT * FROM dblink('dbname=x', 'select 1') AS t(a int)").reason ==
              RejectReason::FORBIDDEN_CONSTRUCT);
    }

    SECTION("a column sharing a function's name is fine") {
        accepted("SELECT query_to_xml FROM sales");
    }

    SECTION("INTO") {
        CHECK(rejected("SELECT * INTO backup FROM sales").message == "INTO clauses are not allowed.");
    }

    SECTION("row locks") {
        auto r = rejected("SELECT * FROM sales FOR SHARE");
        CHECK(r.reason == RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(r.offending_fragment == "FOR SHARE");
    }

    SECTION("system catalogs") {
        auto r = rejected("SELECT * FROM information_schema.tables");
        CHECK(r.reason == RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(r.offending_fragment == "information_schema");
        CHECK(rejected("SELECT * FROM pg_catalog.pg_user").reason == RejectReason::FORBIDDEN_CONSTRUCT);
        CHECK(rejected("SELECT pg_sleep(10) FROM sales").reason == RejectReason::FORBIDDEN_CONSTRUCT);
    }
}

// ============================================================================
// Table extraction and allowlist
// ============================================================================

TEST_CASE("SafetyValidator: extract_tables", "[validator]") {
    const auto tables = [](std::string_view sql) {
        auto lexed = SqlTokenizer::tokenize(sql);
        REQUIRE(lexed.success);
        return SafetyValidator::extract_tables(lexed.tokens, "public");
    };

    CHECK(tables("SELECT * FROM sales") == std::vector<std::string>{"sales"});
    CHECK(tables("SELECT * FROM sales s JOIN users u ON u.id = s.id") ==
          std::vector<std::string>{"sales", "users"});
    CHECK(tables("SELECT * FROM sales, orders o") == std::vector<std::string>{"sales", "orders"});
    CHECK(tables("SELECT * FROM public.sales") == std::vector<std::string>{"sales"});
    CHECK(tables("SELECT * FROM other.sales") == std::vector<std::string>{"other.sales"});
    CHECK(tables(R"(SELECT * FROM "Sales")") == std::vector<std::string>{"sales"});
    CHECK(tables("SELECT * FROM ONLY orders") == std::vector<std::string>{"orders"});
    CHECK(tables("SELECT * FROM users WHERE id IN (SELECT user_id FROM orders)") ==
          std::vector<std::string>{"users", "orders"});
    CHECK(tables("SELECT * FROM (SELECT * FROM sales) t") == std::vector<std::string>{"sales"});
    CHECK(tables("SELECT EXTRACT(YEAR FROM sold_at) FROM sales") ==
          std::vector<std::string>{"sales"});
    CHECK(tables("SELECT * FROM sales WHERE a IS DISTINCT FROM b") ==
          std::vector<std::string>{"sales"});
    CHECK(tables("SELECT * FROM (customers CROSS JOIN sales)") ==
          std::vector<std::string>{"customers", "sales"});
    CHECK(tables("SELECT * FROM ((customers c JOIN sales s ON true)), orders") ==
          std::vector<std::string>{"customers", "orders", "sales"});
    CHECK(tables("SELECT * FROM (TABLE customers) t") == std::vector<std::string>{"customers"});
    CHECK(tables("SELECT * FROM sales WHERE region IN (TABLE customers)") ==
          std::vector<std::string>{"sales", "customers"});
    CHECK(tables("SELECT 1from customers") == std::vector<std::string>{"customers"});
    CHECK(tables("SELECT 1").empty());
}

TEST_CASE("SafetyValidator: table allowlist", "[validator]") {
    SECTION("outside the allowlist") {
        auto r = rejected("SELECT * FROM audit_log");
        CHECK(r.reason == RejectReason::TABLE_NOT_ALLOWED);
        CHECK(r.offending_fragment == "audit_log");
        CHECK(r.message ==
              "Access to table 'audit_log' is not permitted. Available tables: orders, sales, users.");
        CHECK(r.permitted_tables == kAnalystTables);
    }

    SECTION("hidden in a join or subquery") {
        CHECK(rejected("SELECT * FROM sales s JOIN audit_log a ON a.id = s.id").offending_fragment ==
              "audit_log");
        CHECK(rejected("SELECT * FROM sales WHERE id IN (SELECT id FROM audit_log)").reason ==
              RejectReason::TABLE_NOT_ALLOWED);
        CHECK(rejected("SELECT * FROM sales, audit_log").reason == RejectReason::TABLE_NOT_ALLOWED);

        const std::vector<std::string> sales_only = {"sales"};
        CHECK(rejected("SELECT * FROM (customers CROSS JOIN sales)", sales_only).offending_fragment ==
              "customers");
        CHECK(rejected("SELECT * FROM (customers c JOIN sales s ON true)", sales_only).offending_fragment ==
              "customers");
        CHECK(rejected("SELECT * FROM (TABLE customers) t", sales_only).offending_fragment ==
              "customers");
        CHECK(rejected("SELECT * FROM sales WHERE region IN (TABLE customers)", sales_only)
                  .offending_fragment == "customers");
    }

    SECTION("a number glued to a keyword does not hide the FROM") {
        auto r = rejected("SELECT 1from customers", {"sales"});
        CHECK(r.reason == RejectReason::TABLE_NOT_ALLOWED);
        CHECK(rejected("SELECT 1union SELECT 2").reason == RejectReason::FORBIDDEN_CONSTRUCT);
    }

    SECTION("foreign schema is a different table") {
        CHECK(rejected("SELECT * FROM other.sales").offending_fragment == "other.sales");
    }

    SECTION("empty allowlist") {
        auto r = rejected("SELECT * FROM sales", {});
        CHECK(r.message ==
              "Access to table 'sales' is not permitted. No tables are available for your role.");
        CHECK(r.permitted_tables.empty());
    }

    SECTION("case and default schema do not matter") {
        accepted("select * from SALES");
        accepted("SELECT * FROM public.users");
    }
}

// ============================================================================
// Limit enforcement
// ============================================================================

TEST_CASE("SafetyValidator: limit enforcement", "[validator]") {
    SECTION("default appended when absent") {
        auto q = accepted("SELECT region, amount FROM sales");
        CHECK(q.sql() == "SELECT region, amount FROM sales LIMIT 100");
        CHECK(q.row_limit() == 100);
        CHECK(q.limit_injected());
    }

    SECTION("limit within ceiling is kept as written") {
        auto q = accepted("  SELECT * FROM sales LIMIT 50 ");
        CHECK(q.sql() == "SELECT * FROM sales LIMIT 50");
        CHECK(q.row_limit() == 50);
        CHECK_FALSE(q.limit_injected());
        CHECK(accepted("SELECT * FROM sales LIMIT 1000").row_limit() == 1000);
    }

    SECTION("limit above ceiling is rejected, not clamped") {
        auto r = rejected("SELECT * FROM sales LIMIT 5000");
        CHECK(r.reason == RejectReason::LIMIT_EXCEEDED);
        CHECK(r.offending_fragment == "LIMIT 5000");
        CHECK(r.message == "Requested LIMIT 5000 exceeds the maximum of 1000 rows. "
                           "Ask for at most 1000 rows or narrow the question.");
    }

    SECTION("LIMIT ALL and non-literal limits") {
        CHECK(rejected("SELECT * FROM sales LIMIT ALL").offending_fragment == "LIMIT ALL");
        auto r = rejected("SELECT * FROM sales LIMIT $1");
        CHECK(r.message == "LIMIT must be a literal row count of at most 1000.");
        CHECK(rejected("SELECT * FROM sales LIMIT").reason == RejectReason::LIMIT_EXCEEDED);
    }

    SECTION("FETCH FIRST") {
        CHECK(accepted("SELECT * FROM sales FETCH FIRST 10 ROWS ONLY").row_limit() == 10);
        CHECK(accepted("SELECT * FROM sales FETCH NEXT ROW ONLY").row_limit() == 1);
        CHECK(rejected("SELECT * FROM sales FETCH FIRST 2000 ROWS ONLY").reason ==
              RejectReason::LIMIT_EXCEEDED);
    }

    SECTION("FETCH ... WITH TIES is not a bound") {
        auto r = rejected("SELECT * FROM sales ORDER BY amount FETCH FIRST 10 ROWS WITH TIES");
        CHECK(r.reason == RejectReason::LIMIT_EXCEEDED);
        CHECK(r.offending_fragment == "WITH TIES");
    }

    SECTION("a statement wrapped in parentheses keeps its own limit") {
        auto r = rejected("(SELECT * FROM sales LIMIT 5000)");
        CHECK(r.reason == RejectReason::LIMIT_EXCEEDED);
        CHECK(r.offending_fragment == "LIMIT 5000");

        auto q = accepted("((SELECT * FROM sales LIMIT 5))");
        CHECK(q.sql() == "((SELECT * FROM sales LIMIT 5))");
        CHECK(q.row_limit() == 5);
        CHECK_FALSE(q.limit_injected());

        // Not a wrapper: two separate groups
        auto grouped = accepted("(SELECT 1 FROM sales LIMIT 5000) ORDER BY 1 LIMIT 10");
        CHECK(grouped.row_limit() == 10);
    }

    SECTION("a count glued to other text is not a literal") {
        CHECK(rejected("SELECT * FROM sales LIMIT 0x7fffffff").message ==
              "LIMIT must be a literal row count of at most 1000.");
        CHECK(rejected("SELECT * FROM sales LIMIT 1_000").reason == RejectReason::LIMIT_EXCEEDED);
    }

    SECTION("limit inside a subquery does not bound the outer query") {
        auto q = accepted("SELECT * FROM (SELECT * FROM sales LIMIT 5) t");
        CHECK(q.limit_injected());
        CHECK(q.sql().ends_with(") t LIMIT 100"));
    }

    SECTION("default above ceiling is clamped at construction") {
        SafetyValidator v({.default_limit = 5000, .max_limit = 200, .default_schema = "PUBLIC"});
        CHECK(v.config().default_limit == 200);
        CHECK(v.config().default_schema == "public");
        auto verdict = v.validate("SELECT * FROM sales", {"sales"});
        REQUIRE(verdict.is_accepted());
        CHECK(verdict.accepted->row_limit() == 200);
    }
}

// ============================================================================
// Ordering and determinism
// ============================================================================

TEST_CASE("SafetyValidator: first failing check wins", "[validator]") {
    // Keyword check runs before the allowlist and the limit
    CHECK(rejected("SELECT * FROM audit_log WHERE drop LIMIT 5000").reason ==
          RejectReason::FORBIDDEN_KEYWORD);
    // Allowlist runs before the limit
    CHECK(rejected("SELECT * FROM audit_log LIMIT 5000").reason == RejectReason::TABLE_NOT_ALLOWED);
}

TEST_CASE("SafetyValidator: identical input gives identical verdict", "[validator]") {
    const auto v = make_validator();
    for (const char* sql : {"SELECT * FROM sales", "SELECT * FROM audit_log",
                            "SELECT * FROM sales LIMIT 9999"}) {
        CHECK(v.validate(sql, kAnalystTables) == v.validate(sql, kAnalystTables));
    }
}
