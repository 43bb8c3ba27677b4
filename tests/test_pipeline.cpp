#include <catch2/catch_test_macros.hpp>
#include "core/pipeline.hpp"
#include "core/response_json.hpp"
#include "generator/generation_producer.hpp"
#include "generator/template_producer.hpp"
#include "mocks/mock_db_connection.hpp"
#include "mocks/mock_schema_loader.hpp"
#include "mocks/mock_sql_generator.hpp"

#include <string>

using namespace askql;
using namespace askql::testing;

namespace {

struct PipelineFixture {
    std::shared_ptr<MockSchemaLoader> loader = std::make_shared<MockSchemaLoader>();
    std::shared_ptr<MockConnectionFactory> factory;
    std::shared_ptr<ResultCache> cache;
    std::shared_ptr<QueryLog> query_log = std::make_shared<QueryLog>();
    std::unique_ptr<QueryPipeline> pipeline;

    // Template-only when generated_sql is empty
    explicit PipelineFixture(SessionScript script = default_script(),
                             const std::string& generated_sql = "") {
        factory = std::make_shared<MockConnectionFactory>(std::move(script));

        SchemaCatalog::Config catalog_config;
        catalog_config.connection_string = "mock";
        catalog_config.retry_interval = std::chrono::seconds{0};

        BoundedExecutor::Config executor_config;
        executor_config.connection_string = "mock";
        executor_config.statement_timeout = std::chrono::milliseconds{2500};

        ResultCache::Config cache_config;
        cache_config.ttl = std::chrono::seconds{60};
        cache = std::make_shared<ResultCache>(cache_config);

        auto templates = std::make_shared<TemplateProducer>();
        std::shared_ptr<ICandidateProducer> producer = templates;
        if (!generated_sql.empty()) {
            producer = std::make_shared<GenerationProducer>(
                GenerationProducer::Config{std::chrono::milliseconds{1000}},
                std::make_shared<MockSqlGenerator>(generated_sql),
                templates);
        }

        PipelineComponents c;
        c.catalog = std::make_shared<SchemaCatalog>(catalog_config, loader);
        c.policy = std::make_shared<const AccessPolicy>(AccessPolicy::default_grants());
        c.producer = producer;
        c.validator = std::make_shared<const SafetyValidator>();
        c.executor = std::make_shared<BoundedExecutor>(executor_config, factory);
        c.cache = cache;
        c.explainer = std::make_shared<const ResultExplainer>();
        c.query_log = query_log;
        pipeline = std::make_unique<QueryPipeline>(std::move(c), QueryPipeline::Config{200});
    }

    static SessionScript default_script() {
        SessionScript script;
        script.result = make_rows({"count"}, {{"42"}});
        return script;
    }

    QuestionResponse ask(const std::string& question, const std::string& role = "analyst") {
        return pipeline->handle_question({"alice", role}, question);
    }
};

} // anonymous namespace

TEST_CASE("Pipeline: template question end to end", "[pipeline]") {
    PipelineFixture f;

    auto response = f.ask("How many users are there?");
    REQUIRE(response.success);
    CHECK(response.sql == "SELECT COUNT(*) AS count FROM users LIMIT 100");
    CHECK(response.column_names == std::vector<std::string>{"count"});
    CHECK(response.row_count == 1);
    CHECK_FALSE(response.cache_hit);
    REQUIRE(response.source.has_value());
    CHECK(*response.source == CandidateSource::TEMPLATE);
    CHECK(response.explanation == "Retrieved 1 record(s) with columns: count");

    // Executed text is exactly the sanitized text
    auto& log = f.factory->log();
    CHECK(log.calls[2] == "execute:SELECT COUNT(*) AS count FROM users LIMIT 100");
}

TEST_CASE("Pipeline: second identical question is a cache hit", "[pipeline]") {
    PipelineFixture f;

    auto first = f.ask("how many users are there?");
    REQUIRE(first.success);
    auto second = f.ask("  How many users are there?  ");
    REQUIRE(second.success);
    CHECK(second.cache_hit);
    CHECK(second.sql == first.sql);
    CHECK(second.rows == first.rows);

    // No second database session
    CHECK(f.factory->log().opened == 1);

    auto stats = f.pipeline->cache_stats();
    CHECK(stats.hit_count == 1);
    CHECK(stats.entry_count == 1);

    // Another role does not share the entry
    auto admin = f.ask("how many users are there?", "admin");
    REQUIRE(admin.success);
    CHECK_FALSE(admin.cache_hit);
    CHECK(f.factory->log().opened == 2);
}

TEST_CASE("Pipeline: clear cache", "[pipeline]") {
    PipelineFixture f;
    REQUIRE(f.ask("how many users are there?").success);
    f.pipeline->clear_cache();

    CHECK(f.pipeline->cache_stats().entry_count == 0);
    auto again = f.ask("how many users are there?");
    REQUIRE(again.success);
    CHECK_FALSE(again.cache_hit);
    CHECK(f.factory->log().opened == 2);
}

TEST_CASE("Pipeline: invalid requests", "[pipeline]") {
    PipelineFixture f;

    SECTION("empty question") {
        auto response = f.ask("   ");
        CHECK(response.error_code == ErrorCode::INVALID_REQUEST);
        CHECK(response.reason == RejectReason::INVALID_REQUEST);
    }

    SECTION("missing user id") {
        auto response = f.pipeline->handle_question({"", "analyst"}, "how many users");
        CHECK(response.error_code == ErrorCode::INVALID_REQUEST);
    }

    SECTION("question too long") {
        auto response = f.ask(std::string(201, 'a'));
        CHECK(response.error_code == ErrorCode::INVALID_REQUEST);
        CHECK(response.message == "The question is longer than 200 characters.");
    }

    CHECK(f.factory->log().opened == 0);
}

TEST_CASE("Pipeline: unknown role has no accessible tables", "[pipeline]") {
    PipelineFixture f;

    auto response = f.ask("how many users", "intern");
    REQUIRE_FALSE(response.success);
    CHECK(response.error_code == ErrorCode::VALIDATION_REJECTED);
    CHECK(response.reason == RejectReason::NO_ACCESSIBLE_TABLES);
    CHECK(f.factory->log().opened == 0);
}

TEST_CASE("Pipeline: generated query on a forbidden table", "[pipeline]") {
    PipelineFixture f(PipelineFixture::default_script(), "SELECT * FROM audit_log");

    auto response = f.ask("show me the audit log");
    REQUIRE_FALSE(response.success);
    CHECK(response.error_code == ErrorCode::VALIDATION_REJECTED);
    CHECK(response.reason == RejectReason::TABLE_NOT_ALLOWED);
    CHECK(response.offending_fragment == "audit_log");
    CHECK(response.permitted_tables == std::vector<std::string>{"orders", "sales", "users"});
    CHECK(f.factory->log().opened == 0);

    auto json = response_to_json(response);
    CHECK(json["error"] == "ValidationRejected");
    CHECK(json["reject_reason"] == "TableNotAllowed");
    CHECK(json["permitted_tables"].size() == 3);
    CHECK(json["sql"] == "SELECT * FROM audit_log");

    // Rejections are never cached
    CHECK(f.pipeline->cache_stats().entry_count == 0);
}

TEST_CASE("Pipeline: stacked statement never reaches the database", "[pipeline]") {
    PipelineFixture f(PipelineFixture::default_script(), "SELECT * FROM sales; DROP TABLE users");

    auto response = f.ask("sales then drop users");
    REQUIRE_FALSE(response.success);
    CHECK(response.reason == RejectReason::MULTIPLE_STATEMENTS);
    CHECK(f.factory->log().calls.empty());
}

TEST_CASE("Pipeline: generated candidate passes through", "[pipeline]") {
    SessionScript script;
    script.result = make_rows({"region", "total"}, {{"west", "10"}});
    PipelineFixture f(script, "```sql\nSELECT region, SUM(amount) AS total FROM sales GROUP BY region\n```");

    auto response = f.ask("revenue per region");
    REQUIRE(response.success);
    CHECK(*response.source == CandidateSource::GENERATED);
    CHECK(response.sql == "SELECT region, SUM(amount) AS total FROM sales GROUP BY region LIMIT 100");

    auto json = response_to_json(response);
    CHECK(json["source"] == "generated");
    CHECK(json["rows"][0]["region"] == "west");
    CHECK(json["cache_hit"] == false);
}

TEST_CASE("Pipeline: execution timeout keeps the query text", "[pipeline]") {
    SessionScript script;
    script.result.status = DbStatus::TIMEOUT;
    script.result.error_message = "canceling statement due to statement timeout";
    PipelineFixture f(script);

    auto response = f.ask("how many orders");
    REQUIRE_FALSE(response.success);
    CHECK(response.error_code == ErrorCode::EXECUTION_TIMEOUT);
    CHECK(response.reason == RejectReason::EXECUTION_TIMEOUT);
    CHECK(response.sql == "SELECT COUNT(*) AS count FROM orders LIMIT 100");
    CHECK(response.message.find("canceling") == std::string::npos);
    CHECK(f.pipeline->get_stats().execution_failures == 1);
    CHECK(f.pipeline->cache_stats().entry_count == 0);
}

TEST_CASE("Pipeline: unmatched question", "[pipeline]") {
    PipelineFixture f;

    auto response = f.ask("why is the sky blue");
    REQUIRE_FALSE(response.success);
    CHECK(response.error_code == ErrorCode::TEMPLATE_UNMATCHED);
    CHECK(response.reason == RejectReason::TEMPLATE_UNMATCHED);
    CHECK_FALSE(response.message.empty());
    CHECK(f.factory->log().opened == 0);
}

TEST_CASE("Pipeline: catalog outage leaves nothing to query", "[pipeline]") {
    PipelineFixture f;
    f.loader->set_should_throw(true);

    auto response = f.ask("how many users");
    REQUIRE_FALSE(response.success);
    CHECK(response.reason == RejectReason::NO_ACCESSIBLE_TABLES);
    CHECK(response.message.find("exploded") == std::string::npos);
    CHECK(f.factory->log().opened == 0);

    // The next request retries the load
    f.loader->set_should_throw(false);
    CHECK(f.ask("how many users").success);
}

TEST_CASE("Pipeline: every question lands in the query log", "[pipeline]") {
    PipelineFixture f;
    REQUIRE(f.ask("how many users are there?").success);
    REQUIRE(f.ask("how many users are there?").cache_hit);
    REQUIRE_FALSE(f.ask("how many users", "intern").success);

    auto entries = f.pipeline->recent_queries(0);
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].outcome == ErrorCode::NONE);
    CHECK(entries[0].row_count == 1);
    CHECK(entries[1].cache_hit);
    CHECK(entries[2].reason == RejectReason::NO_ACCESSIBLE_TABLES);
    CHECK(entries[2].role == "intern");

    auto json = query_log_to_json(f.pipeline->recent_queries(1));
    REQUIRE(json.size() == 1);
    CHECK(json[0]["outcome"] == "ValidationRejected");

    auto stats = cache_stats_to_json(f.pipeline->cache_stats());
    CHECK(stats["hit_count"] == 1);

    auto pipeline_stats = f.pipeline->get_stats();
    CHECK(pipeline_stats.total_requests == 3);
    CHECK(pipeline_stats.cache_hits == 1);
    CHECK(pipeline_stats.rejections == 1);
}

TEST_CASE("Pipeline: rows that are not UTF-8 still render", "[pipeline]") {
    SessionScript script;
    script.result = make_rows({"name"}, {{"caf\xe9"}});
    PipelineFixture f(script);

    auto response = f.ask("show name of users");
    REQUIRE(response.success);

    std::string text;
    REQUIRE_NOTHROW(text = dump_json(response_to_json(response)));
    const auto json = nlohmann::json::parse(text);
    CHECK(json["rows"][0]["name"] == "caf\xEF\xBF\xBD");
}
