#pragma once

#include "core/types.hpp"
#include "security/sql_tokenizer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace askql {

class SafetyValidator;

/**
 * @brief A candidate that passed every safety check
 *
 * Only SafetyValidator can construct one, so holding a SanitizedQuery is
 * proof the text was validated. The executor accepts nothing else.
 */
class SanitizedQuery {
public:
    [[nodiscard]] const std::string& sql() const { return sql_; }

    /// Effective row limit: the literal already present, or the injected default.
    [[nodiscard]] uint64_t row_limit() const { return row_limit_; }

    [[nodiscard]] bool limit_injected() const { return limit_injected_; }

    bool operator==(const SanitizedQuery&) const = default;

private:
    friend class SafetyValidator;

    SanitizedQuery(std::string sql, uint64_t row_limit, bool limit_injected)
        : sql_(std::move(sql)), row_limit_(row_limit), limit_injected_(limit_injected) {}

    std::string sql_;
    uint64_t row_limit_;
    bool limit_injected_;
};

struct Rejection {
    RejectReason reason = RejectReason::NONE;
    std::string message;
    std::optional<std::string> offending_fragment;
    std::vector<std::string> permitted_tables;   // set for TABLE_NOT_ALLOWED

    bool operator==(const Rejection&) const = default;
};

/**
 * @brief Outcome of validation: accepted query or structured rejection
 */
struct SafetyVerdict {
    std::optional<SanitizedQuery> accepted;
    Rejection rejection;

    [[nodiscard]] bool is_accepted() const { return accepted.has_value(); }

    bool operator==(const SafetyVerdict&) const = default;
};

/**
 * @brief Pure SQL safety gate
 *
 * Runs six checks in a fixed order and stops at the first failure:
 *   1. statement shape (one read-only statement)
 *   2. forbidden keywords
 *   3. forbidden constructs (comments, set operations, CTEs, INTO,
 *      row locks, system catalogs)
 *   4. table-reference extraction from the FROM/JOIN graph
 *   5. table allowlist
 *   6. limit enforcement (reject above ceiling, append default if absent)
 *
 * No state beyond immutable config: identical input gives an identical
 * verdict, and validate() may be called concurrently.
 */
class SafetyValidator {
public:
    struct Config {
        uint64_t default_limit = 100;
        uint64_t max_limit = 1000;
        std::string default_schema = "public";
    };

    SafetyValidator() : SafetyValidator(Config{}) {}
    explicit SafetyValidator(Config config);

    /**
     * @brief Validate a candidate against the caller's allowlist
     * @param sql Candidate SQL text
     * @param allowed_tables Lowercased table names the role may read
     */
    [[nodiscard]] SafetyVerdict validate(std::string_view sql,
                                         const std::vector<std::string>& allowed_tables) const;

    /**
     * @brief Table names referenced in FROM/JOIN position, in order of appearance
     *
     * Unqualified names and names qualified with `default_schema` are
     * returned bare; other qualifiers are kept ("other.table").
     */
    [[nodiscard]] static std::vector<std::string> extract_tables(
        const std::vector<Token>& tokens, std::string_view default_schema);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] std::optional<Rejection> check_shape(
        const SqlTokenizer::Result& lexed, std::string_view sql) const;
    [[nodiscard]] static std::optional<Rejection> check_keywords(const std::vector<Token>& tokens);
    [[nodiscard]] static std::optional<Rejection> check_constructs(const std::vector<Token>& tokens);
    [[nodiscard]] static std::optional<Rejection> check_allowlist(
        const std::vector<std::string>& referenced,
        const std::vector<std::string>& allowed_tables);

    struct LimitCheck {
        std::optional<Rejection> rejection;
        std::optional<uint64_t> existing_limit;
    };
    [[nodiscard]] LimitCheck check_limit(const std::vector<Token>& tokens) const;

    Config config_;
};

} // namespace askql
