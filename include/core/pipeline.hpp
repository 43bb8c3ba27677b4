#pragma once

#include "audit/query_log.hpp"
#include "cache/result_cache.hpp"
#include "core/result_explainer.hpp"
#include "core/types.hpp"
#include "executor/bounded_executor.hpp"
#include "generator/icandidate_producer.hpp"
#include "policy/access_policy.hpp"
#include "schema/schema_catalog.hpp"
#include "security/safety_validator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace askql {

/**
 * @brief All components that QueryPipeline needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<SchemaCatalog> catalog;
    std::shared_ptr<const AccessPolicy> policy;
    std::shared_ptr<ICandidateProducer> producer;
    std::shared_ptr<const SafetyValidator> validator;
    std::shared_ptr<BoundedExecutor> executor;

    // Optional (nullptr = disabled)
    std::shared_ptr<ResultCache> cache;
    std::shared_ptr<const ResultExplainer> explainer;
    std::shared_ptr<QueryLog> query_log;
};

/**
 * @brief Answer to one question: rows, or a structured rejection/failure
 */
struct QuestionResponse {
    bool success = false;
    ErrorCode error_code = ErrorCode::NONE;
    RejectReason reason = RejectReason::NONE;
    std::string message;
    std::optional<std::string> offending_fragment;
    std::vector<std::string> permitted_tables;      // set for TABLE_NOT_ALLOWED

    std::string sql;                // also set on EXECUTION_TIMEOUT
    std::vector<std::string> column_names;
    std::vector<Row> rows;
    size_t row_count = 0;
    bool cache_hit = false;
    std::optional<CandidateSource> source;
    std::string explanation;

    std::chrono::microseconds total_time{0};
};

/**
 * @brief Pipeline coordinator for natural-language questions
 *
 * Stages:
 * 1. Ingress (request shape)
 * 2. Scope (catalog snapshot filtered by role)
 * 3. Result cache lookup
 * 4. Candidate production (generation, else template)
 * 5. Safety validation
 * 6. Bounded execution
 * 7. Explanation + cache store
 * 8. Query log
 *
 * Each stage re-checks what it depends on instead of trusting the previous
 * one. Failures are returned as values; nothing a single request does
 * touches catalog or policy state.
 */
class QueryPipeline {
public:
    struct Config {
        size_t max_question_length = 2000;
    };

    explicit QueryPipeline(PipelineComponents components);
    QueryPipeline(PipelineComponents components, Config config);

    [[nodiscard]] QuestionResponse handle_question(const Identity& identity,
                                                   const std::string& question);

    [[nodiscard]] ResultCache::Stats cache_stats() const;

    void clear_cache();

    [[nodiscard]] std::vector<QueryLogEntry> recent_queries(size_t limit) const;

    struct Stats {
        uint64_t total_requests;
        uint64_t cache_hits;
        uint64_t rejections;
        uint64_t generation_fallbacks;
        uint64_t execution_failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .cache_hits = cache_hits_.load(std::memory_order_relaxed),
            .rejections = rejections_.load(std::memory_order_relaxed),
            .generation_fallbacks = generation_fallbacks_.load(std::memory_order_relaxed),
            .execution_failures = execution_failures_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] QuestionResponse process(const Identity& identity,
                                           const std::string& question);
    void record(const Identity& identity, const std::string& question,
                const QuestionResponse& response);

    PipelineComponents c_;
    Config config_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> cache_hits_{0};
    mutable std::atomic<uint64_t> rejections_{0};
    mutable std::atomic<uint64_t> generation_fallbacks_{0};
    mutable std::atomic<uint64_t> execution_failures_{0};
};

} // namespace askql
