#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace askql {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct DatabaseConfig {
    std::string connection_string;
    std::string schema = "public";
    std::chrono::milliseconds statement_timeout{5000};
    std::chrono::seconds connect_timeout{5};
    std::chrono::milliseconds deadline_grace{500};
};

struct LimitsConfig {
    uint64_t default_limit = 100;
    uint64_t max_limit = 1000;              // row ceiling
    size_t max_question_length = 2000;
};

struct SchemaCatalogConfig {
    std::chrono::seconds ttl{3600};
    std::chrono::seconds refresh_interval{0};   // 0 = refresh lazily on TTL
};

struct GenerationConfig {
    bool enabled = false;
    std::string mode = "generation";        // "generation" | "template"
    std::string provider = "openai";        // "openai" | "anthropic"
    std::string endpoint = "https://api.openai.com";
    std::string api_key;
    std::string model = "gpt-4o-mini";
    std::chrono::milliseconds timeout{10000};
    double temperature = 0.2;
    int max_tokens = 1024;
    uint32_t max_requests_per_minute = 60;

    /// Generation runs only when enabled, in generation mode, and keyed.
    [[nodiscard]] bool active() const {
        return enabled && mode == "generation" && !api_key.empty();
    }
};

struct ExplanationConfig {
    bool enabled = false;
    std::chrono::milliseconds timeout{10000};
    size_t sample_rows = 5;
};

struct ResultCacheConfig {
    bool enabled = true;
    size_t max_entries = 1000;
    size_t num_shards = 4;
    std::chrono::seconds ttl{3600};
};

struct QueryLogConfig {
    size_t max_entries = 1000;
};

/// [[roles]] entry. tables = ["*"] grants every table.
struct RoleConfig {
    std::string name;
    std::vector<std::string> tables;
};

// ============================================================================
// AskqlConfig - Complete parsed configuration
// ============================================================================

struct AskqlConfig {
    LoggingConfig logging;
    DatabaseConfig database;
    LimitsConfig limits;
    SchemaCatalogConfig schema_catalog;
    GenerationConfig generation;
    ExplanationConfig explanation;
    ResultCacheConfig result_cache;
    QueryLogConfig query_log;
    std::vector<RoleConfig> roles;          // empty = built-in defaults
};

} // namespace askql
