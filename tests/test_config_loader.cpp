#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace askql;

namespace {

constexpr const char* kMinimal = R"(
[database]
connection_string = "host=localhost dbname=shop"
)";

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "askql_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

bool has_error(const ConfigLoader::LoadResult& result, const std::string& fragment) {
    return !result.success && result.error_message.find(fragment) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("ConfigLoader: defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(kMinimal);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "info");
    CHECK(cfg.database.schema == "public");
    CHECK(cfg.database.statement_timeout.count() == 5000);
    CHECK(cfg.limits.default_limit == 100);
    CHECK(cfg.limits.max_limit == 1000);
    CHECK(cfg.schema_catalog.ttl.count() == 3600);
    CHECK(cfg.schema_catalog.refresh_interval.count() == 0);
    CHECK_FALSE(cfg.generation.enabled);
    CHECK_FALSE(cfg.generation.active());
    CHECK(cfg.result_cache.enabled);
    CHECK(cfg.query_log.max_entries == 1000);
    CHECK(cfg.roles.empty());
}

TEST_CASE("ConfigLoader: sections", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"

[database]
connection_string = "host=db dbname=shop"
schema = "analytics"
statement_timeout_ms = 2500

[limits]
default_limit = 50
max_limit = 500

[generation]
enabled = true
provider = "Anthropic"
api_key = "k"
timeout_ms = 3000

[result_cache]
max_entries = 64
ttl_seconds = 120

[[roles]]
name = "analyst"
tables = ["sales", "orders"]

[[roles]]
name = "admin"
tables = ["*"]
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.database.schema == "analytics");
    CHECK(cfg.database.statement_timeout.count() == 2500);
    CHECK(cfg.limits.default_limit == 50);
    CHECK(cfg.limits.max_limit == 500);

    CHECK(cfg.generation.provider == "anthropic");
    CHECK(cfg.generation.endpoint == "https://api.anthropic.com");
    CHECK(cfg.generation.model == "claude-3-5-haiku-latest");
    CHECK(cfg.generation.timeout.count() == 3000);
    CHECK(cfg.generation.active());

    CHECK(cfg.result_cache.max_entries == 64);
    CHECK(cfg.result_cache.ttl.count() == 120);

    REQUIRE(cfg.roles.size() == 2);
    CHECK(cfg.roles[0].name == "analyst");
    CHECK(cfg.roles[0].tables == std::vector<std::string>{"sales", "orders"});
    CHECK(cfg.roles[1].tables == std::vector<std::string>{"*"});
}

TEST_CASE("ConfigLoader: template mode never generates", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=db"

[generation]
enabled = true
mode = "template"
api_key = "k"
)");
    REQUIRE(result.success);
    CHECK_FALSE(result.config.generation.active());
}

TEST_CASE("ConfigLoader: validation", "[config]") {

    SECTION("connection string required") {
        auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"info\"\n");
        CHECK(has_error(result, "database.connection_string is required"));
    }

    SECTION("default limit above ceiling") {
        auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[limits]
default_limit = 2000
max_limit = 1000
)");
        CHECK(has_error(result, "limits.default_limit must be 1-1000"));
    }

    SECTION("negative count") {
        auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[limits]
max_limit = -5
)");
        CHECK(has_error(result, "limits.max_limit must not be negative"));
    }

    SECTION("unknown provider and level") {
        auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[logging]
level = "loud"

[generation]
provider = "acme"
)");
        CHECK(has_error(result, "logging.level"));
        CHECK(has_error(result, "generation.provider"));
    }

    SECTION("duplicate role, case-insensitive") {
        auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[[roles]]
name = "analyst"
tables = ["sales"]

[[roles]]
name = "Analyst"
tables = ["users"]
)");
        CHECK(has_error(result, "duplicate role 'Analyst'"));
    }

    SECTION("wildcard mixed with named tables") {
        auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[[roles]]
name = "admin"
tables = ["*", "sales"]
)");
        CHECK(has_error(result, "mixes"));
    }

    SECTION("disabled cache skips its checks") {
        auto result = ConfigLoader::load_from_string(std::string(kMinimal) + R"(
[result_cache]
enabled = false
max_entries = 0
)");
        CHECK(result.success);
    }

    SECTION("malformed TOML") {
        auto result = ConfigLoader::load_from_string("[database\nconnection_string = 1");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: environment expansion", "[config][env]") {
    ::setenv("ASKQL_TEST_DB_PASSWORD", "s3cret", 1);
    ::unsetenv("ASKQL_TEST_UNSET_VAR");

    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=localhost password=${ASKQL_TEST_DB_PASSWORD} dbname=shop"

[generation]
api_key = "${ASKQL_TEST_UNSET_VAR}"
)");
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string ==
          "host=localhost password=s3cret dbname=shop");
    CHECK(result.config.generation.api_key.empty());

    auto unclosed = ConfigLoader::load_from_string(R"(
[database]
connection_string = "password=${UNCLOSED"
)");
    CHECK_FALSE(unclosed.success);

    ::unsetenv("ASKQL_TEST_DB_PASSWORD");
}

TEST_CASE("ConfigLoader: include files", "[config][include]") {
    TmpDir tmp;

    tmp.file("roles.toml", R"(
[[roles]]
name = "readonly"
tables = ["sales"]

[limits]
default_limit = 10
)");

    SECTION("included file sits underneath the main file") {
        auto main_path = tmp.file("main.toml", R"(
include = "roles.toml"

[database]
connection_string = "host=localhost"

[limits]
default_limit = 20

[[roles]]
name = "admin"
tables = ["*"]
)");

        auto result = ConfigLoader::load_from_file(main_path);
        REQUIRE(result.success);
        CHECK(result.config.limits.default_limit == 20);
        CHECK(result.config.roles.size() == 2);
    }

    SECTION("circular include is an error") {
        tmp.file("a.toml", "include = \"b.toml\"\n");
        tmp.file("b.toml", "include = \"a.toml\"\n");
        auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("Circular") != std::string::npos);
    }

    SECTION("missing file") {
        auto result = ConfigLoader::load_from_file((tmp.path / "nope.toml").string());
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("Failed to load config") != std::string::npos);
    }
}
