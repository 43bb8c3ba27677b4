#include "security/safety_validator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <string_view>
#include <unordered_set>

namespace askql {

// ============================================================================
// Static lookup tables
// ============================================================================

namespace {

// Mutating / administrative verbs. ANALYSE is PostgreSQL's alternate spelling.
const std::unordered_set<std::string_view> FORBIDDEN_KEYWORDS = {
    "INSERT", "UPDATE", "DELETE", "DROP", "ALTER", "TRUNCATE", "CREATE",
    "GRANT", "REVOKE", "COPY", "VACUUM", "ANALYZE", "ANALYSE", "LOCK"
};

const std::unordered_set<std::string_view> SET_OPERATIONS = {
    "UNION", "INTERSECT", "EXCEPT"
};

// WITH followed by one of these is part of a type or clause, not a CTE
const std::unordered_set<std::string_view> NON_CTE_WITH_FOLLOWERS = {
    "TIME", "LOCAL", "ORDINALITY", "TIES"
};

// FOR followed by one of these is a row-locking clause
const std::unordered_set<std::string_view> ROW_LOCK_FOLLOWERS = {
    "UPDATE", "SHARE", "NO", "KEY"
};

// Functions that run a query or read a table named in a string argument
const std::unordered_set<std::string_view> QUERY_RUNNING_FUNCTIONS = {
    "QUERY_TO_XML", "QUERY_TO_XMLSCHEMA", "QUERY_TO_XML_AND_XMLSCHEMA",
    "TABLE_TO_XML", "TABLE_TO_XMLSCHEMA", "TABLE_TO_XML_AND_XMLSCHEMA",
    "CURSOR_TO_XML", "CURSOR_TO_XMLSCHEMA",
    "SCHEMA_TO_XML", "SCHEMA_TO_XMLSCHEMA", "SCHEMA_TO_XML_AND_XMLSCHEMA",
    "DATABASE_TO_XML", "DATABASE_TO_XMLSCHEMA", "DATABASE_TO_XML_AND_XMLSCHEMA",
    "DBLINK", "DBLINK_EXEC", "LO_IMPORT", "LO_EXPORT", "SET_CONFIG", "CURRENT_SETTING"
};

// Functions whose argument syntax contains FROM
const std::unordered_set<std::string_view> FROM_SYNTAX_FUNCTIONS = {
    "EXTRACT", "SUBSTRING", "TRIM", "OVERLAY", "POSITION"
};

// Words that end a FROM list at the list's own nesting level
const std::unordered_set<std::string_view> FROM_LIST_TERMINATORS = {
    "WHERE", "GROUP", "HAVING", "ORDER", "LIMIT", "OFFSET", "FETCH", "WINDOW",
    "UNION", "INTERSECT", "EXCEPT", "JOIN", "INNER", "LEFT", "RIGHT", "FULL",
    "CROSS", "NATURAL", "ON", "USING", "FOR", "RETURNING"
};

constexpr size_t kMaxFragmentLength = 60;

std::string fragment_at(std::string_view sql, size_t offset) {
    if (offset >= sql.size()) return "";
    return utils::trim(sql.substr(offset, kMaxFragmentLength));
}

bool is_name_token(const Token& tok) {
    if (tok.type == TokenType::QUOTED_IDENTIFIER) return true;
    return tok.type == TokenType::WORD && !FROM_LIST_TERMINATORS.contains(tok.text)
        && tok.text != "SELECT" && tok.text != "VALUES";
}

/// Number of parenthesis pairs that enclose the whole token list
size_t wrapping_parens(const std::vector<Token>& tokens) {
    size_t wrap = 0;
    while (2 * (wrap + 1) <= tokens.size() &&
           tokens[wrap].is_symbol("(") && tokens[tokens.size() - 1 - wrap].is_symbol(")")) {
        // The opening paren must close at the matching position, not earlier
        int depth = 0;
        size_t close = wrap;
        for (; close < tokens.size(); ++close) {
            if (tokens[close].is_symbol("(")) ++depth;
            else if (tokens[close].is_symbol(")") && --depth == 0) break;
        }
        if (close != tokens.size() - 1 - wrap) break;
        ++wrap;
    }
    return wrap;
}

std::string name_of(const Token& tok) {
    return utils::to_lower(tok.text);
}

bool is_system_catalog_name(const std::string& lowered) {
    return lowered == "information_schema" || lowered == "pg_catalog"
        || lowered.starts_with("pg_");
}

Rejection make_rejection(RejectReason reason, std::string message,
                         std::optional<std::string> fragment = std::nullopt) {
    Rejection r;
    r.reason = reason;
    r.message = std::move(message);
    r.offending_fragment = std::move(fragment);
    return r;
}

using TableSink = std::vector<std::string>;

void add_table(TableSink& out, std::string name) {
    if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.push_back(std::move(name));
    }
}

bool starts_subquery(const std::vector<Token>& tokens, size_t pos) {
    return pos < tokens.size() &&
           (tokens[pos].is_word("SELECT") || tokens[pos].is_word("VALUES") ||
            tokens[pos].is_word("WITH") || tokens[pos].is_word("TABLE"));
}

/**
 * @brief Read one table reference starting at `pos`
 * @param opened Incremented once per join-grouping parenthesis entered
 * @return Index of the first token after the reference
 *
 * Subqueries and VALUES lists are not references; their inner FROM clauses
 * are visited by the outer scan. A parenthesized join such as
 * "(a CROSS JOIN b)" is entered so its first table is read here; the JOINs
 * after it are found by the outer scan.
 */
size_t read_table_ref(const std::vector<Token>& tokens, size_t pos,
                      std::string_view default_schema, TableSink& out, int& opened) {
    while (pos < tokens.size()) {
        if (tokens[pos].is_word("ONLY") || tokens[pos].is_word("LATERAL")) {
            ++pos;
        } else if (tokens[pos].is_symbol("(") && !starts_subquery(tokens, pos + 1)) {
            ++opened;
            ++pos;
        } else {
            break;
        }
    }
    if (pos >= tokens.size() || !is_name_token(tokens[pos])) {
        return pos;
    }

    std::vector<std::string> parts{name_of(tokens[pos])};
    ++pos;
    while (pos + 1 < tokens.size() && tokens[pos].is_symbol(".") &&
           is_name_token(tokens[pos + 1])) {
        parts.push_back(name_of(tokens[pos + 1]));
        pos += 2;
    }

    if (parts.size() == 1) {
        add_table(out, std::move(parts[0]));
    } else if (parts.size() == 2 && parts[0] == default_schema) {
        add_table(out, std::move(parts[1]));
    } else {
        add_table(out, utils::join(parts, "."));
    }
    return pos;
}

void read_from_list(const std::vector<Token>& tokens, size_t pos,
                    std::string_view default_schema, TableSink& out) {
    int depth = 0;
    pos = read_table_ref(tokens, pos, default_schema, out, depth);

    while (pos < tokens.size()) {
        const Token& tok = tokens[pos];
        if (tok.is_symbol("(")) {
            ++depth;
        } else if (tok.is_symbol(")")) {
            if (depth == 0) return;     // end of the enclosing subquery
            --depth;
        } else if (depth == 0) {
            if (tok.is_symbol(",")) {
                pos = read_table_ref(tokens, pos + 1, default_schema, out, depth);
                continue;
            }
            if (tok.type == TokenType::WORD && FROM_LIST_TERMINATORS.contains(tok.text)) {
                return;
            }
        }
        ++pos;
    }
}

} // anonymous namespace

// ============================================================================
// SafetyValidator
// ============================================================================

SafetyValidator::SafetyValidator(Config config)
    : config_(std::move(config)) {
    config_.default_schema = utils::to_lower(config_.default_schema);
    if (config_.default_limit > config_.max_limit) {
        utils::log::warn(std::format("SafetyValidator: default limit {} exceeds ceiling {}, using ceiling",
                                     config_.default_limit, config_.max_limit));
        config_.default_limit = config_.max_limit;
    }
}

SafetyVerdict SafetyValidator::validate(std::string_view sql,
                                        const std::vector<std::string>& allowed_tables) const {
    SafetyVerdict verdict;
    const auto reject = [&verdict](Rejection r) {
        verdict.rejection = std::move(r);
        return verdict;
    };

    // 1. Statement shape
    const auto lexed = SqlTokenizer::tokenize(sql);
    if (auto r = check_shape(lexed, sql)) return reject(std::move(*r));
    const auto& tokens = lexed.tokens;

    // 2. Forbidden keywords
    if (auto r = check_keywords(tokens)) return reject(std::move(*r));

    // 3. Forbidden constructs
    if (auto r = check_constructs(tokens)) return reject(std::move(*r));

    // 4. Table references, 5. allowlist
    const auto referenced = extract_tables(tokens, config_.default_schema);
    if (auto r = check_allowlist(referenced, allowed_tables)) return reject(std::move(*r));

    // 6. Limit
    auto limit = check_limit(tokens);
    if (limit.rejection) return reject(std::move(*limit.rejection));

    std::string text = utils::trim(sql);
    if (limit.existing_limit) {
        verdict.accepted = SanitizedQuery(std::move(text), *limit.existing_limit, false);
    } else {
        text += std::format(" LIMIT {}", config_.default_limit);
        verdict.accepted = SanitizedQuery(std::move(text), config_.default_limit, true);
    }
    return verdict;
}

// ---- 1. Statement shape ----------------------------------------------------

std::optional<Rejection> SafetyValidator::check_shape(const SqlTokenizer::Result& lexed,
                                                      std::string_view sql) const {
    if (utils::trim(sql).empty()) {
        return make_rejection(RejectReason::EMPTY_QUERY, "The query is empty.");
    }
    if (!lexed.success) {
        return make_rejection(RejectReason::MALFORMED_QUERY,
                              std::format("The query could not be read: {}.", lexed.error_message),
                              fragment_at(sql, lexed.error_offset));
    }
    if (lexed.tokens.empty()) {
        return make_rejection(RejectReason::EMPTY_QUERY, "The query is empty.");
    }

    for (const auto& tok : lexed.tokens) {
        if (tok.is_symbol(";")) {
            return make_rejection(RejectReason::MULTIPLE_STATEMENTS,
                                  "Only a single SQL statement is allowed; remove the ';' separator.",
                                  fragment_at(sql, tok.offset));
        }
    }

    size_t first = 0;
    while (first < lexed.tokens.size() && lexed.tokens[first].is_symbol("(")) ++first;
    if (first >= lexed.tokens.size() ||
        !(lexed.tokens[first].is_word("SELECT") || lexed.tokens[first].is_word("WITH"))) {
        const std::string found = first < lexed.tokens.size() ? lexed.tokens[first].text : "";
        return make_rejection(RejectReason::NOT_READ_ONLY,
                              "Only SELECT queries are allowed.",
                              found);
    }
    return std::nullopt;
}

// ---- 2. Forbidden keywords -------------------------------------------------

std::optional<Rejection> SafetyValidator::check_keywords(const std::vector<Token>& tokens) {
    for (const auto& tok : tokens) {
        if (tok.type == TokenType::WORD && FORBIDDEN_KEYWORDS.contains(tok.text)) {
            return make_rejection(RejectReason::FORBIDDEN_KEYWORD,
                                  std::format("Keyword '{}' is not allowed; only read-only queries can run.",
                                              tok.text),
                                  tok.text);
        }
    }
    return std::nullopt;
}

// ---- 3. Forbidden constructs -----------------------------------------------

std::optional<Rejection> SafetyValidator::check_constructs(const std::vector<Token>& tokens) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        const Token* next = (i + 1 < tokens.size()) ? &tokens[i + 1] : nullptr;

        if (tok.is_symbol("--") || tok.is_symbol("/*")) {
            return make_rejection(RejectReason::FORBIDDEN_CONSTRUCT,
                                  "SQL comments are not allowed.", tok.text);
        }

        if (tok.type == TokenType::WORD) {
            if (SET_OPERATIONS.contains(tok.text)) {
                return make_rejection(RejectReason::FORBIDDEN_CONSTRUCT,
                                      std::format("Set operations ({}) are not allowed.", tok.text),
                                      tok.text);
            }
            if (tok.text == "WITH" &&
                !(next && next->type == TokenType::WORD && NON_CTE_WITH_FOLLOWERS.contains(next->text))) {
                return make_rejection(RejectReason::FORBIDDEN_CONSTRUCT,
                                      "Common table expressions (WITH) are not allowed.", tok.text);
            }
            if (QUERY_RUNNING_FUNCTIONS.contains(tok.text) && next && next->is_symbol("(")) {
                const std::string name = utils::to_lower(tok.text);
                return make_rejection(RejectReason::FORBIDDEN_CONSTRUCT,
                                      std::format("Function {}() is not allowed.", name),
                                      name);
            }
            if (tok.text == "INTO") {
                return make_rejection(RejectReason::FORBIDDEN_CONSTRUCT,
                                      "INTO clauses are not allowed.", tok.text);
            }
            if (tok.text == "FOR" && next && next->type == TokenType::WORD &&
                ROW_LOCK_FOLLOWERS.contains(next->text)) {
                return make_rejection(RejectReason::FORBIDDEN_CONSTRUCT,
                                      std::format("Row-locking clauses (FOR {}) are not allowed.", next->text),
                                      std::format("FOR {}", next->text));
            }
        }

        if (tok.type == TokenType::WORD || tok.type == TokenType::QUOTED_IDENTIFIER) {
            const std::string lowered = utils::to_lower(tok.text);
            if (is_system_catalog_name(lowered)) {
                return make_rejection(RejectReason::FORBIDDEN_CONSTRUCT,
                                      std::format("System catalog references ({}) are not allowed.", lowered),
                                      lowered);
            }
        }
    }
    return std::nullopt;
}

// ---- 4. Table-reference extraction -----------------------------------------

std::vector<std::string> SafetyValidator::extract_tables(const std::vector<Token>& tokens,
                                                         std::string_view default_schema) {
    enum class Paren { FROM_SYNTAX_FUNCTION, OTHER };

    std::vector<std::string> tables;
    std::vector<Paren> parens;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];

        if (tok.is_symbol("(")) {
            const bool from_fn = i > 0 && tokens[i - 1].type == TokenType::WORD &&
                                 FROM_SYNTAX_FUNCTIONS.contains(tokens[i - 1].text);
            parens.push_back(from_fn ? Paren::FROM_SYNTAX_FUNCTION : Paren::OTHER);
            continue;
        }
        if (tok.is_symbol(")")) {
            if (!parens.empty()) parens.pop_back();
            continue;
        }

        if (tok.is_word("FROM")) {
            // EXTRACT(YEAR FROM ts), SUBSTRING(s FROM 1)
            if (!parens.empty() && parens.back() == Paren::FROM_SYNTAX_FUNCTION) continue;
            // a IS [NOT] DISTINCT FROM b
            if (i >= 2 && tokens[i - 1].is_word("DISTINCT") &&
                (tokens[i - 2].is_word("IS") || tokens[i - 2].is_word("NOT"))) {
                continue;
            }
            read_from_list(tokens, i + 1, default_schema, tables);
        } else if (tok.is_word("JOIN") || tok.is_word("TABLE")) {
            // TABLE name is shorthand for SELECT * FROM name
            int opened = 0;
            read_table_ref(tokens, i + 1, default_schema, tables, opened);
        }
    }
    return tables;
}

// ---- 5. Table allowlist ----------------------------------------------------

std::optional<Rejection> SafetyValidator::check_allowlist(
    const std::vector<std::string>& referenced,
    const std::vector<std::string>& allowed_tables) {
    std::vector<std::string> permitted = allowed_tables;
    std::sort(permitted.begin(), permitted.end());
    permitted.erase(std::unique(permitted.begin(), permitted.end()), permitted.end());

    for (const auto& table : referenced) {
        if (std::binary_search(permitted.begin(), permitted.end(), table)) {
            continue;
        }
        Rejection r;
        r.reason = RejectReason::TABLE_NOT_ALLOWED;
        r.message = permitted.empty()
            ? std::format("Access to table '{}' is not permitted. No tables are available for your role.",
                          table)
            : std::format("Access to table '{}' is not permitted. Available tables: {}.",
                          table, utils::join(permitted, ", "));
        r.offending_fragment = table;
        r.permitted_tables = std::move(permitted);
        return r;
    }
    return std::nullopt;
}

// ---- 6. Limit enforcement --------------------------------------------------

SafetyValidator::LimitCheck SafetyValidator::check_limit(const std::vector<Token>& tokens) const {
    LimitCheck check;

    const auto exceeded = [this](std::string message, std::string fragment) {
        LimitCheck c;
        c.rejection = make_rejection(RejectReason::LIMIT_EXCEEDED, std::move(message),
                                     std::move(fragment));
        return c;
    };
    const auto literal_required = [&, this](const std::string& clause) {
        return exceeded(std::format("{} must be a literal row count of at most {}.",
                                    clause, config_.max_limit),
                        clause);
    };
    const auto evaluate = [&, this](const Token& count_tok, const std::string& clause) {
        const auto value = utils::try_parse_int<uint64_t>(count_tok.text);
        if (!value) {
            return literal_required(clause);
        }
        if (*value > config_.max_limit) {
            return exceeded(std::format("Requested {} {} exceeds the maximum of {} rows. "
                                        "Ask for at most {} rows or narrow the question.",
                                        clause, *value, config_.max_limit, config_.max_limit),
                            std::format("{} {}", clause, count_tok.text));
        }
        LimitCheck ok;
        ok.existing_limit = *value;
        return ok;
    };

    // A number glued to the next token ("10abc", "1_000", "0x10") is not a
    // plain row count
    const auto glued = [&tokens](size_t count_at) {
        const Token& count_tok = tokens[count_at];
        return count_at + 1 < tokens.size() &&
               tokens[count_at + 1].type != TokenType::SYMBOL &&
               tokens[count_at + 1].offset == count_tok.offset + count_tok.text.size();
    };
    const auto with_ties = [&tokens](size_t from) {
        for (size_t k = from; k + 1 < tokens.size() && k < from + 4; ++k) {
            if (tokens[k].is_word("WITH") && tokens[k + 1].is_word("TIES")) return true;
        }
        return false;
    };
    const auto ties_rejected = [&, this] {
        return exceeded(std::format("FETCH ... WITH TIES can return more than the requested rows; "
                                    "use FETCH FIRST n ROWS ONLY or LIMIT (at most {}).",
                                    config_.max_limit),
                        "WITH TIES");
    };

    // "(SELECT ... LIMIT n)": the wrapping parentheses are the top level
    const size_t wrap = wrapping_parens(tokens);
    const size_t end = tokens.size() - wrap;

    int depth = 0;
    for (size_t i = wrap; i < end; ++i) {
        const Token& tok = tokens[i];
        if (tok.is_symbol("(")) { ++depth; continue; }
        if (tok.is_symbol(")")) { --depth; continue; }
        if (depth != 0) continue;

        if (tok.is_word("LIMIT")) {
            if (i + 1 >= tokens.size()) {
                return literal_required("LIMIT");
            }
            const Token& count_tok = tokens[i + 1];
            if (count_tok.is_word("ALL")) {
                return exceeded(std::format("LIMIT ALL is not allowed; the maximum is {} rows.",
                                            config_.max_limit),
                                "LIMIT ALL");
            }
            if (count_tok.type != TokenType::NUMBER || glued(i + 1)) {
                return literal_required("LIMIT");
            }
            return evaluate(count_tok, "LIMIT");
        }

        // FETCH { FIRST | NEXT } [ count ] { ROW | ROWS } { ONLY | WITH TIES }
        if (tok.is_word("FETCH")) {
            size_t j = i + 1;
            if (j < tokens.size() && (tokens[j].is_word("FIRST") || tokens[j].is_word("NEXT"))) ++j;
            if (with_ties(j)) {
                return ties_rejected();
            }
            if (j < tokens.size() && tokens[j].type == TokenType::NUMBER && !glued(j)) {
                return evaluate(tokens[j], "FETCH FIRST");
            }
            if (j < tokens.size() && (tokens[j].is_word("ROW") || tokens[j].is_word("ROWS"))) {
                check.existing_limit = 1;
                return check;
            }
            return literal_required("FETCH FIRST");
        }
    }
    return check;
}

} // namespace askql
