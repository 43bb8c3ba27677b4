#include "generator/generation_producer.hpp"
#include "generator/sql_normalizer.hpp"
#include "core/deadline.hpp"
#include "core/utils.hpp"

#include <format>

namespace askql {

GenerationProducer::GenerationProducer(Config config,
                                       std::shared_ptr<ISqlGenerator> generator,
                                       std::shared_ptr<ICandidateProducer> fallback)
    : config_(config),
      generator_(std::move(generator)),
      fallback_(std::move(fallback)) {}

ProduceResult GenerationProducer::produce(const std::string& question,
                                          const AccessScope& scope) {
    auto generated = attempt(question, scope);
    if (generated.ok()) {
        generated_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("GenerationProducer: generated candidate: {}", generated.sql));
        return ProduceResult::ok({std::move(generated.sql), CandidateSource::GENERATED});
    }

    if (generated.status == GenerationStatus::TIMEOUT) {
        timeouts_.fetch_add(1, std::memory_order_relaxed);
    } else {
        failures_.fetch_add(1, std::memory_order_relaxed);
    }
    fallbacks_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format("GenerationProducer: generation {} ({}), using templates",
                                 generation_status_to_string(generated.status), generated.error));

    auto result = fallback_->produce(question, scope);
    result.fell_back = true;
    return result;
}

GenerationResult GenerationProducer::attempt(const std::string& question,
                                             const AccessScope& scope) {
    if (!generator_) {
        return GenerationResult::failure(GenerationStatus::UNAVAILABLE, "no generator configured");
    }

    // Worker owns copies: it may outlive this call
    auto outcome = run_with_deadline(
        [generator = generator_, question, schema = scope.tables] {
            return generator->generate(question, schema);
        },
        config_.timeout);

    if (outcome.timed_out) {
        return GenerationResult::failure(
            GenerationStatus::TIMEOUT,
            std::format("no answer within {} ms", config_.timeout.count()));
    }
    if (!outcome.value) {
        return GenerationResult::failure(GenerationStatus::UNAVAILABLE, outcome.error);
    }

    auto result = std::move(*outcome.value);
    if (!result.ok()) {
        return result;
    }

    result.sql = normalize_candidate(result.sql);
    if (result.sql.empty()) {
        return GenerationResult::failure(GenerationStatus::MALFORMED,
                                         "empty output after normalization");
    }
    return result;
}

GenerationProducer::Stats GenerationProducer::get_stats() const {
    return {
        .generated = generated_.load(std::memory_order_relaxed),
        .fallbacks = fallbacks_.load(std::memory_order_relaxed),
        .timeouts = timeouts_.load(std::memory_order_relaxed),
        .failures = failures_.load(std::memory_order_relaxed),
    };
}

} // namespace askql
