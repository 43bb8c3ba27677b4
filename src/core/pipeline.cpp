#include "core/pipeline.hpp"
#include "core/utils.hpp"

#include <format>

namespace askql {

QueryPipeline::QueryPipeline(PipelineComponents components)
    : QueryPipeline(std::move(components), Config{}) {}

QueryPipeline::QueryPipeline(PipelineComponents components, Config config)
    : c_(std::move(components)), config_(config) {}

QuestionResponse QueryPipeline::handle_question(const Identity& identity,
                                                const std::string& question) {
    utils::Timer timer;
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    QuestionResponse response;
    try {
        response = process(identity, question);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Pipeline: internal error for user '{}': {}",
                                      identity.user_id, e.what()));
        response = QuestionResponse{};
        response.error_code = ErrorCode::INTERNAL_ERROR;
        response.reason = RejectReason::INTERNAL_ERROR;
        response.message = "The question could not be processed. Please try again.";
    }

    response.total_time = timer.elapsed_us();
    record(identity, question, response);
    return response;
}

QuestionResponse QueryPipeline::process(const Identity& identity,
                                        const std::string& question) {
    QuestionResponse response;

    const auto reject = [this, &response](ErrorCode code, RejectReason reason, std::string message) {
        rejections_.fetch_add(1, std::memory_order_relaxed);
        response.success = false;
        response.error_code = code;
        response.reason = reason;
        response.message = std::move(message);
        return response;
    };

    // ---- 1. Ingress ---------------------------------------------------------
    const std::string text = utils::trim(question);
    if (identity.user_id.empty()) {
        return reject(ErrorCode::INVALID_REQUEST, RejectReason::INVALID_REQUEST,
                      "A user id is required.");
    }
    if (text.empty()) {
        return reject(ErrorCode::INVALID_REQUEST, RejectReason::INVALID_REQUEST,
                      "The question is empty.");
    }
    if (text.size() > config_.max_question_length) {
        return reject(ErrorCode::INVALID_REQUEST, RejectReason::INVALID_REQUEST,
                      std::format("The question is longer than {} characters.",
                                  config_.max_question_length));
    }

    // ---- 2. Scope -----------------------------------------------------------
    // One snapshot per request: what the producer sees and what the
    // validator permits come from the same lookup.
    const auto snapshot = c_.catalog->snapshot();
    const AccessScope scope = c_.policy->scope(identity.role, *snapshot);
    if (scope.empty()) {
        utils::log::info(std::format("Pipeline: role '{}' has no accessible tables", identity.role));
        return reject(ErrorCode::VALIDATION_REJECTED, RejectReason::NO_ACCESSIBLE_TABLES,
                      std::format("No tables are available for role '{}'.", identity.role));
    }

    // ---- 3. Result cache ----------------------------------------------------
    if (c_.cache && c_.cache->is_enabled()) {
        if (auto cached = c_.cache->get(identity, text)) {
            cache_hits_.fetch_add(1, std::memory_order_relaxed);
            response.success = true;
            response.cache_hit = true;
            response.sql = std::move(cached->sql);
            response.column_names = std::move(cached->column_names);
            response.rows = std::move(cached->rows);
            response.row_count = response.rows.size();
            response.explanation = std::move(cached->explanation);
            response.source = cached->source;
            return response;
        }
    }

    // ---- 4. Candidate -------------------------------------------------------
    auto produced = c_.producer->produce(text, scope);
    if (produced.fell_back) {
        generation_fallbacks_.fetch_add(1, std::memory_order_relaxed);
    }
    if (!produced.success) {
        utils::log::info(std::format("Pipeline: no template for '{}'", text));
        return reject(ErrorCode::TEMPLATE_UNMATCHED, RejectReason::TEMPLATE_UNMATCHED,
                      std::move(produced.message));
    }
    response.source = produced.candidate.source;

    // ---- 5. Safety validation -----------------------------------------------
    auto verdict = c_.validator->validate(produced.candidate.sql, scope.allowed);
    if (!verdict.is_accepted()) {
        auto& rejection = verdict.rejection;
        utils::log::info(std::format("Pipeline: rejected {} candidate ({}): {}",
                                     candidate_source_to_string(produced.candidate.source),
                                     reject_reason_to_string(rejection.reason),
                                     produced.candidate.sql));
        response.sql = produced.candidate.sql;
        response.offending_fragment = std::move(rejection.offending_fragment);
        response.permitted_tables = std::move(rejection.permitted_tables);
        return reject(ErrorCode::VALIDATION_REJECTED, rejection.reason,
                      std::move(rejection.message));
    }
    const SanitizedQuery& sanitized = *verdict.accepted;
    response.sql = sanitized.sql();
    utils::log::info(std::format("Pipeline: user '{}' role '{}' executing: {}",
                                 identity.user_id, identity.role, sanitized.sql()));

    // ---- 6. Execution -------------------------------------------------------
    auto result = c_.executor->run(sanitized);
    if (!result.success) {
        execution_failures_.fetch_add(1, std::memory_order_relaxed);
        response.error_code = result.error_code;
        response.reason = result.error_code == ErrorCode::EXECUTION_TIMEOUT
            ? RejectReason::EXECUTION_TIMEOUT
            : RejectReason::EXECUTION_FAILURE;
        response.message = std::move(result.error_message);
        return response;
    }

    // ---- 7. Explanation + cache store ---------------------------------------
    response.explanation = c_.explainer
        ? c_.explainer->explain(text, sanitized.sql(), result)
        : ResultExplainer::summarize(result);

    response.success = true;
    response.column_names = std::move(result.column_names);
    response.rows = std::move(result.rows);
    response.row_count = response.rows.size();

    if (c_.cache && c_.cache->is_enabled()) {
        CachedAnswer answer;
        answer.sql = response.sql;
        answer.column_names = response.column_names;
        answer.rows = response.rows;
        answer.explanation = response.explanation;
        answer.source = produced.candidate.source;
        answer.created_at = std::chrono::system_clock::now();
        c_.cache->put(identity, text, std::move(answer));
    }
    return response;
}

void QueryPipeline::record(const Identity& identity, const std::string& question,
                           const QuestionResponse& response) {
    if (!c_.query_log) return;

    QueryLogEntry entry;
    entry.user_id = identity.user_id;
    entry.role = identity.role;
    entry.question = question;
    entry.sql = response.sql;
    entry.outcome = response.error_code;
    entry.reason = response.reason;
    entry.row_count = response.row_count;
    entry.cache_hit = response.cache_hit;
    entry.latency = response.total_time;
    c_.query_log->record(std::move(entry));
}

ResultCache::Stats QueryPipeline::cache_stats() const {
    if (!c_.cache) {
        return {};
    }
    return c_.cache->get_stats();
}

void QueryPipeline::clear_cache() {
    if (c_.cache) {
        c_.cache->clear();
        utils::log::info("Pipeline: result cache cleared");
    }
}

std::vector<QueryLogEntry> QueryPipeline::recent_queries(size_t limit) const {
    if (!c_.query_log) {
        return {};
    }
    return c_.query_log->recent(limit);
}

} // namespace askql
