#pragma once

#include "generator/icandidate_producer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace askql {

/**
 * @brief Deterministic question-to-SQL patterns over the filtered schema
 *
 * Resolves a table (named in the question, the only table in scope, or the
 * one table whose columns the question mentions most), the columns the
 * question mentions, and one intent, tried in order:
 *   - count:           "how many", "count", "number of" (optionally "by Y")
 *   - grouped aggregate "total|sum|average|avg X by Y"
 *   - aggregate:       "total|sum|average|avg X"
 *   - listing:         "show", "list", "top N", ... or any mentioned column
 *
 * A quoted value in the question becomes an equality filter on the column
 * mentioned just before it. When nothing matches the result is TEMPLATE_UNMATCHED,
 * never a guessed query.
 */
class TemplateProducer : public ICandidateProducer {
public:
    struct Config {
        uint64_t default_limit = 100;
        uint64_t top_default = 10;      // "top" without a number
    };

    TemplateProducer() : TemplateProducer(Config{}) {}
    explicit TemplateProducer(Config config);

    ProduceResult produce(const std::string& question,
                          const AccessScope& scope) override;

    /// Lowercased words; anything outside [a-z0-9_] separates words.
    [[nodiscard]] static std::vector<std::string> split_words(std::string_view text);

    /// Text of the first 'quoted' or "quoted" value. Apostrophes inside words do not count.
    [[nodiscard]] static std::optional<std::string> find_quoted_value(std::string_view question);

    [[nodiscard]] static std::string quote_identifier(const std::string& name);

    [[nodiscard]] static bool is_numeric_type(const std::string& type);

private:
    Config config_;
};

} // namespace askql
