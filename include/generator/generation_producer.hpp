#pragma once

#include "generator/icandidate_producer.hpp"
#include "generator/isql_generator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace askql {

/**
 * @brief Generation branch with template fallback
 *
 * Asks the external engine for SQL, waiting at most `timeout`. A timeout, an
 * engine failure, or output that is empty after normalization is logged and
 * counted, and the question goes to the fallback producer instead. The
 * caller never sees the generation failure itself.
 *
 * The engine call runs on a detached worker; a call that overruns the
 * timeout finishes in the background and its answer is discarded.
 */
class GenerationProducer : public ICandidateProducer {
public:
    struct Config {
        std::chrono::milliseconds timeout{10000};
    };

    GenerationProducer(Config config,
                       std::shared_ptr<ISqlGenerator> generator,
                       std::shared_ptr<ICandidateProducer> fallback);

    ProduceResult produce(const std::string& question,
                          const AccessScope& scope) override;

    struct Stats {
        uint64_t generated;
        uint64_t fallbacks;
        uint64_t timeouts;
        uint64_t failures;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] GenerationResult attempt(const std::string& question,
                                           const AccessScope& scope);

    Config config_;
    std::shared_ptr<ISqlGenerator> generator_;
    std::shared_ptr<ICandidateProducer> fallback_;

    std::atomic<uint64_t> generated_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace askql
