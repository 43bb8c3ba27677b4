#pragma once

#include "core/llm_client.hpp"
#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace askql {

/**
 * @brief Short plain-language description of a query result
 *
 * With narration enabled, the generation engine is asked for a summary of
 * the first few rows under the same deadline discipline as SQL generation.
 * Any failure (disabled, timeout, engine error) yields the deterministic
 * summary instead.
 */
class ResultExplainer {
public:
    struct Config {
        bool enabled = false;
        std::chrono::milliseconds timeout{10000};
        size_t sample_rows = 5;
    };

    ResultExplainer() : ResultExplainer(Config{}, nullptr) {}
    ResultExplainer(Config config, std::shared_ptr<LlmClient> client);

    [[nodiscard]] std::string explain(const std::string& question,
                                      const std::string& sql,
                                      const QueryResult& result) const;

    /**
     * @brief "Retrieved 3 record(s) with columns: region, total"
     *
     * At most five column names, then "..." if there are more.
     */
    [[nodiscard]] static std::string summarize(const QueryResult& result);

    /// Column-keyed JSON objects for the first `max_rows` rows.
    [[nodiscard]] static std::string sample_rows_json(const QueryResult& result, size_t max_rows);

private:
    Config config_;
    std::shared_ptr<LlmClient> client_;
};

} // namespace askql
