#include "core/pipeline.hpp"
#include "core/response_json.hpp"
#include "core/llm_client.hpp"
#include "core/result_explainer.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_schema_loader.hpp"
#include "generator/generation_producer.hpp"
#include "generator/llm_sql_generator.hpp"
#include "generator/template_producer.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <signal.h>

using namespace askql;

// Set from the signal handler; everything else happens on the main thread
volatile std::sig_atomic_t g_signal = 0;

extern "C" void signal_handler(int signal) {
    g_signal = signal;
}

namespace {

// No SA_RESTART: the stdin read under std::getline fails with EINTR, so the
// question loop sees the signal without waiting for another line.
void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        utils::log::warn("Could not install SIGINT/SIGTERM handlers");
    }
}

// Threads inherit the mask, so one started inside this scope never takes
// SIGINT or SIGTERM away from the main thread.
class ShutdownSignalsBlocked {
public:
    ShutdownSignalsBlocked() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        blocked_ = pthread_sigmask(SIG_BLOCK, &set, &previous_) == 0;
        if (!blocked_) {
            utils::log::warn("Could not block SIGINT/SIGTERM for a worker thread");
        }
    }
    ~ShutdownSignalsBlocked() {
        if (blocked_) pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }
    ShutdownSignalsBlocked(const ShutdownSignalsBlocked&) = delete;
    ShutdownSignalsBlocked& operator=(const ShutdownSignalsBlocked&) = delete;

private:
    sigset_t previous_;
    bool blocked_ = false;
};

struct CliOptions {
    std::string config_file = "config/askql.toml";
    Identity identity{"cli", "analyst"};
    std::string question;       // empty = interactive
};

void print_usage() {
    std::cerr << "Usage: askql [config.toml] [--user ID] [--role ROLE] [question...]\n"
                 "Without a question, reads one question per line from stdin.\n"
                 "Commands: :stats  :clear  :logs [n]  :quit\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> words;
    int i = 1;
    if (argc > 1 && std::string_view(argv[1]).ends_with(".toml")) {
        opts.config_file = argv[1];
        i = 2;
    }
    for (; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if ((arg == "--user" || arg == "--role") && i + 1 < argc) {
            (arg == "--user" ? opts.identity.user_id : opts.identity.role) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else {
            words.emplace_back(arg);
        }
    }
    opts.question = utils::join(words, " ");
    return opts;
}

std::vector<RoleGrant> to_grants(const std::vector<RoleConfig>& roles) {
    if (roles.empty()) {
        return AccessPolicy::default_grants();
    }
    std::vector<RoleGrant> grants;
    grants.reserve(roles.size());
    for (const auto& role : roles) {
        RoleGrant grant;
        grant.role = role.name;
        for (const auto& table : role.tables) {
            grant.tables.insert(table);     // "*" becomes the wildcard in AccessPolicy
        }
        grants.push_back(std::move(grant));
    }
    return grants;
}

void print_json(const nlohmann::json& j) {
    std::cout << dump_json(j) << std::endl;
}

// Returns false when the session should end.
bool handle_line(QueryPipeline& pipeline, const Identity& identity, const std::string& line) {
    const std::string input = utils::trim(line);
    if (input.empty()) return true;

    if (input == ":quit" || input == ":exit") {
        return false;
    }
    if (input == ":stats") {
        print_json(cache_stats_to_json(pipeline.cache_stats()));
        return true;
    }
    if (input == ":clear") {
        pipeline.clear_cache();
        print_json({{"cleared", true}});
        return true;
    }
    if (input.starts_with(":logs")) {
        size_t limit = 10;
        const auto arg = utils::trim(std::string_view(input).substr(5));
        if (!arg.empty()) {
            const auto n = utils::try_parse_int<size_t>(arg);
            if (!n) {
                std::cerr << "usage: :logs [n]\n";
                return true;
            }
            limit = *n;
        }
        print_json(query_log_to_json(pipeline.recent_queries(limit)));
        return true;
    }

    print_json(response_to_json(pipeline.handle_question(identity, input)));
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto opts = parse_args(argc, argv);
        if (!opts) {
            print_usage();
            return 0;
        }

        utils::log::info("askql starting...");

        install_signal_handlers();

        // =====================================================================
        // [1/7] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/7] Loading configuration from {}", opts->config_file));
        const auto config_result = ConfigLoader::load_from_file(opts->config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const AskqlConfig& config = config_result.config;
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // =====================================================================
        // [2/7] Schema catalog
        // =====================================================================
        SchemaCatalog::Config catalog_config;
        catalog_config.connection_string = config.database.connection_string;
        catalog_config.schema = config.database.schema;
        catalog_config.ttl = config.schema_catalog.ttl;
        catalog_config.refresh_interval = config.schema_catalog.refresh_interval;
        auto catalog = std::make_shared<SchemaCatalog>(
            catalog_config,
            std::make_shared<PgSchemaLoader>(config.database.connect_timeout));
        if (catalog->refresh()) {
            utils::log::info(std::format("[2/7] Schema catalog: {} tables in schema '{}' (ttl {}s)",
                catalog->get_stats().table_count, config.database.schema,
                config.schema_catalog.ttl.count()));
        } else {
            utils::log::warn("[2/7] Schema catalog: initial load failed, will retry on demand");
        }
        {
            ShutdownSignalsBlocked blocked;
            catalog->start();
        }

        // =====================================================================
        // [3/7] Access policy
        // =====================================================================
        auto policy = std::make_shared<const AccessPolicy>(to_grants(config.roles));
        utils::log::info(std::format("[3/7] Access policy: roles {}{}",
            utils::join(policy->roles(), ", "),
            config.roles.empty() ? " (built-in defaults)" : ""));

        // =====================================================================
        // [4/7] Candidate producer
        // =====================================================================
        LlmClient::Config llm_config;
        llm_config.enabled = config.generation.enabled;
        llm_config.provider = config.generation.provider;
        llm_config.endpoint = config.generation.endpoint;
        llm_config.api_key = config.generation.api_key;
        llm_config.default_model = config.generation.model;
        llm_config.timeout_ms = static_cast<uint32_t>(config.generation.timeout.count());
        llm_config.temperature = config.generation.temperature;
        llm_config.max_tokens = config.generation.max_tokens;
        llm_config.max_requests_per_minute = config.generation.max_requests_per_minute;
        auto llm_client = std::make_shared<LlmClient>(llm_config);

        TemplateProducer::Config template_config;
        template_config.default_limit = config.limits.default_limit;
        auto templates = std::make_shared<TemplateProducer>(template_config);

        std::shared_ptr<ICandidateProducer> producer = templates;
        if (config.generation.active()) {
            producer = std::make_shared<GenerationProducer>(
                GenerationProducer::Config{config.generation.timeout},
                std::make_shared<LlmSqlGenerator>(llm_client),
                templates);
            utils::log::info(std::format("[4/7] Candidate producer: {} {} (timeout {}ms), template fallback",
                config.generation.provider, config.generation.model,
                config.generation.timeout.count()));
        } else {
            if (config.generation.enabled && config.generation.api_key.empty()) {
                utils::log::warn("Generation enabled but no api_key configured");
            }
            utils::log::info("[4/7] Candidate producer: templates only");
        }

        // =====================================================================
        // [5/7] Safety validator
        // =====================================================================
        SafetyValidator::Config validator_config;
        validator_config.default_limit = config.limits.default_limit;
        validator_config.max_limit = config.limits.max_limit;
        validator_config.default_schema = config.database.schema;
        auto validator = std::make_shared<const SafetyValidator>(validator_config);
        utils::log::info(std::format("[5/7] Safety validator: default limit {}, ceiling {}",
            config.limits.default_limit, config.limits.max_limit));

        // =====================================================================
        // [6/7] Executor
        // =====================================================================
        BoundedExecutor::Config executor_config;
        executor_config.connection_string = config.database.connection_string;
        executor_config.statement_timeout = config.database.statement_timeout;
        executor_config.connect_timeout = config.database.connect_timeout;
        executor_config.deadline_grace = config.database.deadline_grace;
        executor_config.max_rows = config.limits.max_limit;
        auto executor = std::make_shared<BoundedExecutor>(
            executor_config, std::make_shared<PgConnectionFactory>());
        utils::log::info(std::format("[6/7] Executor: read-only sessions, statement timeout {}ms",
            config.database.statement_timeout.count()));

        // =====================================================================
        // [7/7] Result cache, explainer, query log
        // =====================================================================
        ResultCache::Config cache_config;
        cache_config.enabled = config.result_cache.enabled;
        cache_config.max_entries = config.result_cache.max_entries;
        cache_config.num_shards = config.result_cache.num_shards;
        cache_config.ttl = config.result_cache.ttl;

        ResultExplainer::Config explainer_config;
        explainer_config.enabled = config.explanation.enabled && llm_client->is_enabled();
        explainer_config.timeout = config.explanation.timeout;
        explainer_config.sample_rows = config.explanation.sample_rows;

        PipelineComponents components;
        components.catalog = catalog;
        components.policy = policy;
        components.producer = producer;
        components.validator = validator;
        components.executor = executor;
        components.cache = std::make_shared<ResultCache>(cache_config);
        components.explainer = std::make_shared<const ResultExplainer>(explainer_config, llm_client);
        components.query_log = std::make_shared<QueryLog>(
            QueryLog::Config{config.query_log.max_entries});
        utils::log::info(std::format("[7/7] Result cache: {} ({} entries, ttl {}s), narration {}",
            cache_config.enabled ? "enabled" : "disabled", cache_config.max_entries,
            cache_config.ttl.count(), explainer_config.enabled ? "on" : "off"));

        QueryPipeline pipeline(std::move(components),
                               QueryPipeline::Config{config.limits.max_question_length});

        utils::log::info(std::format("Ready: user '{}', role '{}'",
            opts->identity.user_id, opts->identity.role));

        if (!opts->question.empty()) {
            const auto response = pipeline.handle_question(opts->identity, opts->question);
            print_json(response_to_json(response));
            catalog->stop();
            return response.success ? 0 : 2;
        }

        std::string line;
        while (g_signal == 0 && std::getline(std::cin, line)) {
            if (!handle_line(pipeline, opts->identity, line)) break;
        }
        if (g_signal != 0) {
            utils::log::info(std::format("Received signal {}, shutting down...",
                                         static_cast<int>(g_signal)));
        }
        catalog->stop();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
