#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace askql {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Integer key that must not be negative (counts, sizes)
uint64_t toml_count(const toml::table& tbl, const std::string_view section,
                    const std::string_view key, const int64_t fallback) {
    const int64_t value = tbl[key].value_or(fallback);
    if (value < 0) {
        throw std::runtime_error(
            std::format("{}.{} must not be negative, got {}", section, key, value));
    }
    return static_cast<uint64_t>(value);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.schema = d["schema"].value_or("public"s);
    cfg.statement_timeout = std::chrono::milliseconds(d["statement_timeout_ms"].value_or(int64_t{5000}));
    cfg.connect_timeout = std::chrono::seconds(d["connect_timeout_s"].value_or(int64_t{5}));
    cfg.deadline_grace = std::chrono::milliseconds(d["deadline_grace_ms"].value_or(int64_t{500}));
    return cfg;
}

LimitsConfig ConfigLoader::extract_limits(const toml::table& root) {
    LimitsConfig cfg;
    const auto* limits = root["limits"].as_table();
    if (!limits) return cfg;
    const auto& l = *limits;

    cfg.default_limit = toml_count(l, "limits", "default_limit", 100);
    cfg.max_limit = toml_count(l, "limits", "max_limit", 1000);
    cfg.max_question_length = static_cast<size_t>(toml_count(l, "limits", "max_question_length", 2000));
    return cfg;
}

SchemaCatalogConfig ConfigLoader::extract_schema_catalog(const toml::table& root) {
    SchemaCatalogConfig cfg;
    const auto* catalog = root["schema_catalog"].as_table();
    if (!catalog) return cfg;
    const auto& c = *catalog;

    cfg.ttl = std::chrono::seconds(c["ttl_seconds"].value_or(int64_t{3600}));
    cfg.refresh_interval = std::chrono::seconds(c["refresh_interval_seconds"].value_or(int64_t{0}));
    return cfg;
}

GenerationConfig ConfigLoader::extract_generation(const toml::table& root) {
    GenerationConfig cfg;
    const auto* generation = root["generation"].as_table();
    if (!generation) return cfg;
    const auto& g = *generation;

    cfg.enabled = g["enabled"].value_or(false);
    cfg.mode = utils::to_lower(g["mode"].value_or("generation"s));
    cfg.provider = utils::to_lower(g["provider"].value_or("openai"s));
    cfg.endpoint = g["endpoint"].value_or(
        cfg.provider == "anthropic" ? "https://api.anthropic.com"s : "https://api.openai.com"s);
    cfg.api_key = g["api_key"].value_or(""s);
    cfg.model = g["model"].value_or(
        cfg.provider == "anthropic" ? "claude-3-5-haiku-latest"s : "gpt-4o-mini"s);
    cfg.timeout = std::chrono::milliseconds(g["timeout_ms"].value_or(int64_t{10000}));
    cfg.temperature = g["temperature"].value_or(0.2);
    cfg.max_tokens = static_cast<int>(toml_count(g, "generation", "max_tokens", 1024));
    cfg.max_requests_per_minute = static_cast<uint32_t>(
        toml_count(g, "generation", "max_requests_per_minute", 60));
    return cfg;
}

ExplanationConfig ConfigLoader::extract_explanation(const toml::table& root) {
    ExplanationConfig cfg;
    const auto* explanation = root["explanation"].as_table();
    if (!explanation) return cfg;
    const auto& e = *explanation;

    cfg.enabled = e["enabled"].value_or(false);
    cfg.timeout = std::chrono::milliseconds(e["timeout_ms"].value_or(int64_t{10000}));
    cfg.sample_rows = static_cast<size_t>(toml_count(e, "explanation", "sample_rows", 5));
    return cfg;
}

ResultCacheConfig ConfigLoader::extract_result_cache(const toml::table& root) {
    ResultCacheConfig cfg;
    const auto* cache = root["result_cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.enabled = c["enabled"].value_or(true);
    cfg.max_entries = static_cast<size_t>(toml_count(c, "result_cache", "max_entries", 1000));
    cfg.num_shards = static_cast<size_t>(toml_count(c, "result_cache", "num_shards", 4));
    cfg.ttl = std::chrono::seconds(c["ttl_seconds"].value_or(int64_t{3600}));
    return cfg;
}

QueryLogConfig ConfigLoader::extract_query_log(const toml::table& root) {
    QueryLogConfig cfg;
    const auto* log = root["query_log"].as_table();
    if (!log) return cfg;

    cfg.max_entries = static_cast<size_t>(toml_count(*log, "query_log", "max_entries", 1000));
    return cfg;
}

std::vector<RoleConfig> ConfigLoader::extract_roles(const toml::table& root) {
    std::vector<RoleConfig> result;
    const auto* arr = root["roles"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* role = elem.as_table();
        if (!role) continue;

        RoleConfig cfg;
        cfg.name = (*role)["name"].value_or(""s);
        cfg.tables = toml_string_array(*role, "tables");
        result.emplace_back(std::move(cfg));
    }
    return result;
}

AskqlConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AskqlConfig config;
    config.logging = extract_logging(root);
    config.database = extract_database(root);
    config.limits = extract_limits(root);
    config.schema_catalog = extract_schema_catalog(root);
    config.generation = extract_generation(root);
    config.explanation = extract_explanation(root);
    config.result_cache = extract_result_cache(root);
    config.query_log = extract_query_log(root);
    config.roles = extract_roles(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AskqlConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AskqlConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    // Database
    if (config.database.connection_string.empty()) {
        errors.emplace_back("database.connection_string is required");
    }
    if (config.database.schema.empty()) {
        errors.emplace_back("database.schema must not be empty");
    }
    if (config.database.statement_timeout.count() <= 0) {
        errors.push_back(std::format("database.statement_timeout_ms must be positive, got {}",
                                     config.database.statement_timeout.count()));
    }
    if (config.database.connect_timeout.count() <= 0) {
        errors.push_back(std::format("database.connect_timeout_s must be positive, got {}",
                                     config.database.connect_timeout.count()));
    }
    if (config.database.deadline_grace.count() < 0) {
        errors.push_back(std::format("database.deadline_grace_ms must not be negative, got {}",
                                     config.database.deadline_grace.count()));
    }

    // Limits
    if (config.limits.max_limit == 0) {
        errors.emplace_back("limits.max_limit must be positive");
    }
    if (config.limits.default_limit == 0 || config.limits.default_limit > config.limits.max_limit) {
        errors.push_back(std::format("limits.default_limit must be 1-{} (max_limit), got {}",
                                     config.limits.max_limit, config.limits.default_limit));
    }
    if (config.limits.max_question_length == 0) {
        errors.emplace_back("limits.max_question_length must be positive");
    }

    // Schema catalog
    if (config.schema_catalog.ttl.count() <= 0) {
        errors.push_back(std::format("schema_catalog.ttl_seconds must be positive, got {}",
                                     config.schema_catalog.ttl.count()));
    }
    if (config.schema_catalog.refresh_interval.count() < 0) {
        errors.push_back(std::format("schema_catalog.refresh_interval_seconds must not be negative, got {}",
                                     config.schema_catalog.refresh_interval.count()));
    }

    // Generation
    const auto& gen = config.generation;
    if (gen.mode != "generation" && gen.mode != "template") {
        errors.push_back(std::format("generation.mode must be 'generation' or 'template', got '{}'",
                                     gen.mode));
    }
    if (gen.provider != "openai" && gen.provider != "anthropic") {
        errors.push_back(std::format("generation.provider must be 'openai' or 'anthropic', got '{}'",
                                     gen.provider));
    }
    if (gen.timeout.count() <= 0) {
        errors.push_back(std::format("generation.timeout_ms must be positive, got {}",
                                     gen.timeout.count()));
    }
    if (gen.temperature < 0.0 || gen.temperature > 2.0) {
        errors.push_back(std::format("generation.temperature must be 0.0-2.0, got {}",
                                     gen.temperature));
    }
    if (gen.max_tokens <= 0) {
        errors.emplace_back("generation.max_tokens must be positive");
    }
    if (gen.enabled && gen.mode == "generation" && gen.endpoint.empty()) {
        errors.emplace_back("generation.endpoint is required when generation is enabled");
    }

    // Explanation
    if (config.explanation.timeout.count() <= 0) {
        errors.push_back(std::format("explanation.timeout_ms must be positive, got {}",
                                     config.explanation.timeout.count()));
    }

    // Result cache
    if (config.result_cache.enabled) {
        if (config.result_cache.max_entries == 0) {
            errors.emplace_back("result_cache.max_entries must be positive");
        }
        if (config.result_cache.num_shards == 0) {
            errors.emplace_back("result_cache.num_shards must be positive");
        }
        if (config.result_cache.ttl.count() <= 0) {
            errors.push_back(std::format("result_cache.ttl_seconds must be positive, got {}",
                                         config.result_cache.ttl.count()));
        }
    }

    // Roles
    std::unordered_set<std::string> role_names;
    for (const auto& role : config.roles) {
        if (role.name.empty()) {
            errors.emplace_back("roles: every role needs a name");
            continue;
        }
        if (!role_names.insert(utils::to_lower(role.name)).second) {
            errors.push_back(std::format("roles: duplicate role '{}'", role.name));
        }
        const bool wildcard = std::find(role.tables.begin(), role.tables.end(), "*") != role.tables.end();
        if (wildcard && role.tables.size() > 1) {
            errors.push_back(std::format("roles: role '{}' mixes \"*\" with named tables", role.name));
        }
    }

    return errors;
}

} // namespace askql
