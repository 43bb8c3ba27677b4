#pragma once

#include "audit/query_log.hpp"
#include "cache/result_cache.hpp"
#include "core/pipeline.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace askql {

/**
 * @brief JSON renderings for the command-line driver
 *
 * Rows become column-keyed objects; SQL NULL becomes JSON null.
 */
[[nodiscard]] nlohmann::json response_to_json(const QuestionResponse& response);

[[nodiscard]] nlohmann::json cache_stats_to_json(const ResultCache::Stats& stats);

[[nodiscard]] nlohmann::json query_log_to_json(const std::vector<QueryLogEntry>& entries);

/// Pretty-printed text; bytes that are not valid UTF-8 are replaced, never thrown on
[[nodiscard]] std::string dump_json(const nlohmann::json& j);

} // namespace askql
