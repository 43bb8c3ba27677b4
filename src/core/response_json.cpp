#include "core/response_json.hpp"
#include "core/utils.hpp"

namespace askql {

namespace {

nlohmann::json rows_to_json(const std::vector<std::string>& columns, const std::vector<Row>& rows) {
    auto out = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json obj = nlohmann::json::object();
        for (size_t c = 0; c < columns.size() && c < row.size(); ++c) {
            obj[columns[c]] = row[c] ? nlohmann::json(*row[c]) : nlohmann::json(nullptr);
        }
        out.push_back(std::move(obj));
    }
    return out;
}

} // anonymous namespace

nlohmann::json response_to_json(const QuestionResponse& response) {
    nlohmann::json j;
    if (response.success) {
        j["sql"] = response.sql;
        j["columns"] = response.column_names;
        j["rows"] = rows_to_json(response.column_names, response.rows);
        j["row_count"] = response.row_count;
        j["cache_hit"] = response.cache_hit;
        j["explanation"] = response.explanation;
        if (response.source) {
            j["source"] = candidate_source_to_string(*response.source);
        }
    } else {
        j["error"] = error_code_to_string(response.error_code);
        j["reject_reason"] = reject_reason_to_string(response.reason);
        j["message"] = response.message;
        if (response.offending_fragment) {
            j["offending_fragment"] = *response.offending_fragment;
        }
        if (response.reason == RejectReason::TABLE_NOT_ALLOWED) {
            j["permitted_tables"] = response.permitted_tables;
        }
        if (!response.sql.empty()) {
            j["sql"] = response.sql;
        }
    }
    j["elapsed_ms"] = static_cast<double>(response.total_time.count()) / 1000.0;
    return j;
}

nlohmann::json cache_stats_to_json(const ResultCache::Stats& stats) {
    return {
        {"entry_count", stats.entry_count},
        {"max_entries", stats.max_entries},
        {"ttl_seconds", stats.ttl_seconds},
        {"hit_count", stats.hit_count},
        {"miss_count", stats.miss_count},
        {"evictions", stats.evictions},
    };
}

nlohmann::json query_log_to_json(const std::vector<QueryLogEntry>& entries) {
    auto out = nlohmann::json::array();
    for (const auto& e : entries) {
        out.push_back({
            {"timestamp", utils::format_timestamp(e.timestamp)},
            {"user_id", e.user_id},
            {"role", e.role},
            {"question", e.question},
            {"sql", e.sql},
            {"outcome", e.outcome == ErrorCode::NONE ? "ok" : error_code_to_string(e.outcome)},
            {"reason", reject_reason_to_string(e.reason)},
            {"row_count", e.row_count},
            {"cache_hit", e.cache_hit},
            {"latency_ms", static_cast<double>(e.latency.count()) / 1000.0},
        });
    }
    return out;
}

std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace askql
