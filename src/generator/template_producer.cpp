#include "generator/template_producer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_set>

namespace askql {

namespace {

const std::unordered_set<std::string_view> AGGREGATE_WORDS = {
    "total", "sum", "average", "avg", "mean"
};

const std::unordered_set<std::string_view> GROUP_WORDS = {"by", "per"};

const std::unordered_set<std::string_view> LIMIT_WORDS = {"top", "limit", "first"};

const std::unordered_set<std::string_view> LISTING_WORDS = {
    "show", "list", "display", "sample", "top", "first", "fetch", "give",
    "see", "view"
};

// A question asking for any of these is never answered with a read
const std::unordered_set<std::string_view> MUTATION_WORDS = {
    "delete", "drop", "remove", "update", "insert", "truncate", "alter",
    "create", "modify", "rename", "grant", "revoke", "erase", "wipe"
};

const std::unordered_set<std::string_view> NUMERIC_TYPES = {
    "smallint", "integer", "bigint", "numeric", "decimal", "real",
    "double precision", "money", "int2", "int4", "int8", "float4", "float8"
};

// Words PostgreSQL would not accept as a bare table or column name
const std::unordered_set<std::string_view> RESERVED_WORDS = {
    "all", "analyse", "analyze", "and", "any", "array", "as", "asc", "both",
    "case", "cast", "check", "column", "constraint", "create", "current_date",
    "current_user", "default", "desc", "distinct", "do", "else", "end",
    "except", "false", "fetch", "for", "foreign", "from", "grant", "group",
    "having", "in", "into", "is", "leading", "limit", "not", "null", "offset",
    "on", "only", "or", "order", "primary", "references", "returning",
    "select", "session_user", "some", "table", "then", "to", "trailing",
    "true", "union", "unique", "user", "using", "when", "where", "window",
    "with"
};

using Words = std::vector<std::string>;

struct Span {
    size_t position;
    size_t length;
};

std::vector<std::string> split_name(const std::string& name) {
    std::vector<std::string> parts;
    std::string current;
    for (const char c : name) {
        if (c == '_') {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(std::move(current));
    return parts;
}

// "order" matches "order", "orders"; "orders" matches "order"; "category" matches "categories"
bool matches_inflection(const std::string& word, const std::string& base) {
    if (word == base) return true;
    if (word == base + "s" || word == base + "es") return true;
    if (base.ends_with('y') && word == base.substr(0, base.size() - 1) + "ies") return true;
    if (base.ends_with("ies") && word == base.substr(0, base.size() - 3) + "y") return true;
    if (base.ends_with('s') && !base.ends_with("ss") && word == base.substr(0, base.size() - 1)) {
        return true;
    }
    return false;
}

/**
 * @brief Earliest run of words spelling `parts`, the last part inflected
 *
 * Words marked in `taken` never match.
 */
std::optional<size_t> find_phrase(const Words& words, const std::vector<std::string>& parts,
                                  const std::vector<bool>& taken) {
    if (parts.empty() || parts.size() > words.size()) return std::nullopt;
    for (size_t i = 0; i + parts.size() <= words.size(); ++i) {
        bool ok = true;
        for (size_t j = 0; j < parts.size() && ok; ++j) {
            const auto& word = words[i + j];
            ok = !taken[i + j] &&
                 (j + 1 < parts.size() ? word == parts[j] : matches_inflection(word, parts[j]));
        }
        if (ok) return i;
    }
    return std::nullopt;
}

// "order_items" as one word, or as "order items"
std::optional<Span> find_name(const Words& words, const std::string& name,
                              const std::vector<bool>& taken) {
    const auto parts = split_name(name);
    std::optional<Span> best;
    if (const auto pos = find_phrase(words, parts, taken)) {
        best = Span{*pos, parts.size()};
    }
    if (parts.size() > 1) {
        if (const auto pos = find_phrase(words, {name}, taken); pos && (!best || *pos < best->position)) {
            best = Span{*pos, 1};
        }
    }
    return best;
}

std::optional<size_t> find_word(const Words& words,
                                const std::unordered_set<std::string_view>& set,
                                size_t from = 0) {
    for (size_t i = from; i < words.size(); ++i) {
        if (set.contains(words[i])) return i;
    }
    return std::nullopt;
}

std::string quote_literal(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        out += c;
        if (c == '\'') out += '\'';
    }
    out += '\'';
    return out;
}

struct Mention {
    const ColumnMetadata* column;
    size_t position;
};

} // anonymous namespace

// ============================================================================
// Static helpers
// ============================================================================

std::vector<std::string> TemplateProducer::split_words(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (const char raw : text) {
        const auto c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            current += c;
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

std::optional<std::string> TemplateProducer::find_quoted_value(std::string_view question) {
    const auto is_alnum = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };

    for (size_t i = 0; i < question.size(); ++i) {
        const char q = question[i];
        if ((q != '\'' && q != '"') || (i > 0 && is_alnum(question[i - 1]))) continue;
        for (size_t j = i + 1; j < question.size(); ++j) {
            if (question[j] == q && (j + 1 == question.size() || !is_alnum(question[j + 1]))) {
                if (j > i + 1) return std::string(question.substr(i + 1, j - i - 1));
                break;
            }
        }
    }
    return std::nullopt;
}

std::string TemplateProducer::quote_identifier(const std::string& name) {
    bool plain = !name.empty() && (std::islower(static_cast<unsigned char>(name[0])) || name[0] == '_');
    for (const char c : name) {
        plain = plain && (std::islower(static_cast<unsigned char>(c)) ||
                          std::isdigit(static_cast<unsigned char>(c)) || c == '_');
    }
    if (plain && !RESERVED_WORDS.contains(name)) {
        return name;
    }
    std::string out = "\"";
    for (const char c : name) {
        out += c;
        if (c == '"') out += '"';
    }
    out += '"';
    return out;
}

bool TemplateProducer::is_numeric_type(const std::string& type) {
    return NUMERIC_TYPES.contains(utils::to_lower(type));
}

// ============================================================================
// TemplateProducer
// ============================================================================

TemplateProducer::TemplateProducer(Config config)
    : config_(config) {}

ProduceResult TemplateProducer::produce(const std::string& question,
                                        const AccessScope& scope) {
    if (scope.empty()) {
        return ProduceResult::unmatched(
            "Could not understand the question: no tables are available for your role.");
    }
    const std::string available = utils::join(scope.allowed, ", ");

    // Quoted text is a filter value, not vocabulary
    const auto value = find_quoted_value(question);
    std::string vocabulary = question;
    size_t value_at = 0;    // word index the value stood at
    if (value) {
        for (const char q : {'\'', '"'}) {
            const std::string quoted = q + *value + q;
            if (const auto at = vocabulary.find(quoted); at != std::string::npos) {
                value_at = split_words(std::string_view(vocabulary).substr(0, at)).size();
                vocabulary.erase(at, quoted.size());
                break;
            }
        }
    }
    const Words words = split_words(vocabulary);
    std::vector<bool> taken(words.size(), false);

    if (const auto verb = find_word(words, MUTATION_WORDS)) {
        return ProduceResult::unmatched(std::format(
            "Could not understand the question: '{}' asks to change data, and only "
            "read-only questions are answered.", words[*verb]));
    }

    // ---- Table --------------------------------------------------------------
    const TableMetadata* table = nullptr;
    std::optional<Span> table_span;
    for (const auto& [name, meta] : scope.tables) {
        const auto span = find_name(words, name, taken);
        if (span && (!table_span || span->position < table_span->position ||
                     (span->position == table_span->position && span->length > table_span->length))) {
            table = meta.get();
            table_span = span;
        }
    }
    if (!table && scope.tables.size() == 1) {
        table = scope.tables.begin()->second.get();
    }
    if (!table) {
        // No table named: the one table whose columns the question mentions most
        size_t best = 0;
        bool tie = false;
        for (const auto& [name, meta] : scope.tables) {
            size_t hits = 0;
            for (const auto& col : meta->columns) {
                if (col.name != "id" && find_name(words, col.name, taken)) ++hits;
            }
            if (hits > best) {
                best = hits;
                table = meta.get();
                tie = false;
            } else if (hits == best && hits > 0) {
                tie = true;
            }
        }
        if (tie) table = nullptr;
    }
    if (!table) {
        return ProduceResult::unmatched(std::format(
            "Could not understand which table the question is about. Available tables: {}.",
            available));
    }
    if (table_span) {
        std::fill_n(taken.begin() + table_span->position, table_span->length, true);
    }

    // ---- Intent keywords ----------------------------------------------------
    std::optional<size_t> count_at;
    for (const auto& phrase : std::vector<std::vector<std::string>>{
             {"how", "many"}, {"number", "of"}, {"total", "number"}, {"count"}}) {
        if (const auto pos = find_phrase(words, phrase, taken)) {
            count_at = pos;
            std::fill_n(taken.begin() + *pos, phrase.size(), true);
            break;
        }
    }

    std::optional<size_t> aggregate_at;
    if (!count_at) {
        aggregate_at = find_word(words, AGGREGATE_WORDS);
        if (aggregate_at) taken[*aggregate_at] = true;
    }

    std::optional<size_t> group_at;
    if (count_at || aggregate_at) {
        group_at = find_word(words, GROUP_WORDS, count_at ? *count_at : *aggregate_at);
        if (group_at) taken[*group_at] = true;
    }

    std::optional<uint64_t> requested_limit;
    for (size_t i = 0; i + 1 < words.size(); ++i) {
        if (!LIMIT_WORDS.contains(words[i])) continue;
        if (const auto n = utils::try_parse_int<uint64_t>(words[i + 1]); n && *n > 0) {
            requested_limit = n;
            taken[i] = taken[i + 1] = true;
            break;
        }
    }

    // ---- Columns, longest names first ---------------------------------------
    std::vector<const ColumnMetadata*> by_length;
    for (const auto& col : table->columns) by_length.push_back(&col);
    std::stable_sort(by_length.begin(), by_length.end(),
                     [](const ColumnMetadata* a, const ColumnMetadata* b) {
                         return a->name.size() > b->name.size();
                     });

    std::vector<Mention> mentions;
    for (const auto* col : by_length) {
        if (const auto span = find_name(words, col->name, taken)) {
            std::fill_n(taken.begin() + span->position, span->length, true);
            mentions.push_back({col, span->position});
        }
    }
    std::sort(mentions.begin(), mentions.end(),
              [](const Mention& a, const Mention& b) { return a.position < b.position; });

    const Mention* group_col = nullptr;
    if (group_at) {
        for (const auto& m : mentions) {
            if (m.position > *group_at) { group_col = &m; break; }
        }
    }

    // Filter column: the nearest mention before the value, else the first one
    const Mention* filter_col = nullptr;
    if (value) {
        for (const auto& m : mentions) {
            if (&m == group_col) continue;
            if (!filter_col || m.position < value_at) filter_col = &m;
            if (m.position >= value_at) break;
        }
    }
    const std::string where = filter_col
        ? std::format(" WHERE {} = {}", quote_identifier(filter_col->column->name), quote_literal(*value))
        : "";

    const std::string from = quote_identifier(table->name);
    const auto done = [&](std::string sql) {
        utils::log::debug(std::format("TemplateProducer: '{}' -> {}", question, sql));
        return ProduceResult::ok({std::move(sql), CandidateSource::TEMPLATE});
    };

    // ---- 1. Count -----------------------------------------------------------
    if (count_at) {
        if (group_col) {
            const auto y = quote_identifier(group_col->column->name);
            return done(std::format("SELECT {}, COUNT(*) AS count FROM {}{} GROUP BY {}",
                                    y, from, where, y));
        }
        return done(std::format("SELECT COUNT(*) AS count FROM {}{}", from, where));
    }

    // ---- 2./3. Aggregate ----------------------------------------------------
    if (aggregate_at) {
        const Mention* measure = nullptr;
        for (const auto& m : mentions) {
            if (&m == group_col || !is_numeric_type(m.column->type)) continue;
            if (!measure || (measure->position < *aggregate_at && m.position > *aggregate_at)) {
                measure = &m;
            }
        }
        if (measure) {
            const bool average = words[*aggregate_at] != "total" && words[*aggregate_at] != "sum";
            const auto x = quote_identifier(measure->column->name);
            const auto agg = average ? std::format("AVG({}) AS average", x)
                                     : std::format("SUM({}) AS total", x);
            const std::string measure_where =
                (filter_col && filter_col != measure) ? where : "";
            if (group_col) {
                const auto y = quote_identifier(group_col->column->name);
                return done(std::format("SELECT {}, {} FROM {}{} GROUP BY {}",
                                        y, agg, from, measure_where, y));
            }
            return done(std::format("SELECT {} FROM {}{}", agg, from, measure_where));
        }
    }

    // ---- 4. Listing ---------------------------------------------------------
    if (find_word(words, LISTING_WORDS)) {
        std::vector<std::string> columns;
        for (const auto& m : mentions) {
            if (&m != filter_col) columns.push_back(quote_identifier(m.column->name));
        }
        if (columns.empty()) {
            columns = {"*"};
        }

        uint64_t limit = config_.default_limit;
        if (requested_limit) {
            limit = *requested_limit;
        } else if (std::find(words.begin(), words.end(), "top") != words.end()) {
            limit = config_.top_default;
        }
        return done(std::format("SELECT {} FROM {}{} LIMIT {}",
                                utils::join(columns, ", "), from, where, limit));
    }

    return ProduceResult::unmatched(std::format(
        "Could not understand the question. Try 'show rows from {}' or "
        "'total <column> by <column>'. Available tables: {}.",
        table->name, available));
}

} // namespace askql
