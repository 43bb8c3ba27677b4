#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace askql {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads askql.toml
 *
 * Every string value goes through ${ENV_VAR} expansion; a top-level
 * `include = ["other.toml"]` is merged underneath the including file.
 * Missing keys take their defaults. All validation errors are collected
 * into one message.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AskqlConfig config;

        static LoadResult ok(AskqlConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to askql.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes not resolved)
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AskqlConfig& config);

private:
    static AskqlConfig extract_all_sections(const toml::table& root);

    static LoggingConfig extract_logging(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static LimitsConfig extract_limits(const toml::table& root);
    static SchemaCatalogConfig extract_schema_catalog(const toml::table& root);
    static GenerationConfig extract_generation(const toml::table& root);
    static ExplanationConfig extract_explanation(const toml::table& root);
    static ResultCacheConfig extract_result_cache(const toml::table& root);
    static QueryLogConfig extract_query_log(const toml::table& root);
    static std::vector<RoleConfig> extract_roles(const toml::table& root);

    static LoadResult validate_and_return(AskqlConfig config);
};

} // namespace askql
