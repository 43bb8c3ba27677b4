#include "core/result_explainer.hpp"
#include "core/deadline.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>

namespace askql {

namespace {
constexpr size_t kSummaryColumns = 5;
}

ResultExplainer::ResultExplainer(Config config, std::shared_ptr<LlmClient> client)
    : config_(config), client_(std::move(client)) {}

std::string ResultExplainer::summarize(const QueryResult& result) {
    if (result.rows.empty()) {
        return "The query returned no rows.";
    }

    const size_t shown = std::min(result.column_names.size(), kSummaryColumns);
    std::vector<std::string> names(result.column_names.begin(),
                                   result.column_names.begin() + static_cast<std::ptrdiff_t>(shown));
    std::string columns = utils::join(names, ", ");
    if (result.column_names.size() > kSummaryColumns) {
        columns += "...";
    }
    return std::format("Retrieved {} record(s) with columns: {}", result.row_count(), columns);
}

std::string ResultExplainer::sample_rows_json(const QueryResult& result, size_t max_rows) {
    auto rows = nlohmann::json::array();
    const size_t n = std::min(result.rows.size(), max_rows);
    for (size_t r = 0; r < n; ++r) {
        nlohmann::json obj = nlohmann::json::object();
        const auto& row = result.rows[r];
        for (size_t c = 0; c < result.column_names.size() && c < row.size(); ++c) {
            obj[result.column_names[c]] = row[c] ? nlohmann::json(*row[c]) : nlohmann::json(nullptr);
        }
        rows.push_back(std::move(obj));
    }
    // Column values are database text; invalid UTF-8 becomes U+FFFD
    return rows.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string ResultExplainer::explain(const std::string& question,
                                     const std::string& sql,
                                     const QueryResult& result) const {
    if (!config_.enabled || !client_ || !client_->is_enabled() || result.rows.empty()) {
        return summarize(result);
    }

    auto outcome = run_with_deadline(
        [client = client_, question, sql, sample = sample_rows_json(result, config_.sample_rows)] {
            return client->explain_result(question, sql, sample);
        },
        config_.timeout);

    if (outcome.timed_out) {
        utils::log::warn(std::format("ResultExplainer: no narrative within {} ms",
                                     config_.timeout.count()));
        return summarize(result);
    }
    if (!outcome.value || !outcome.value->success) {
        utils::log::warn(std::format("ResultExplainer: narrative unavailable: {}",
                                     outcome.value ? outcome.value->error : outcome.error));
        return summarize(result);
    }

    auto text = utils::trim(outcome.value->content);
    return text.empty() ? summarize(result) : text;
}

} // namespace askql
