#include "security/sql_tokenizer.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace askql {

namespace {

bool is_word_start(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || uc >= 0x80;
}

bool is_word_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || uc >= 0x80;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/**
 * @brief Find the end of a quoted run starting at `start` (the opening quote)
 * @return One past the closing quote, or npos if unterminated
 */
size_t scan_quoted(std::string_view sql, size_t start, char quote, bool backslash_escapes) {
    size_t i = start + 1;
    while (i < sql.size()) {
        const char c = sql[i];
        if (backslash_escapes && c == '\\') {
            i += 2;
            continue;
        }
        if (c == quote) {
            if (i + 1 < sql.size() && sql[i + 1] == quote) {
                i += 2;     // doubled quote is an escaped quote
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return std::string_view::npos;
}

// $$ or $tag$ opens a dollar-quoted string
bool is_dollar_quote(std::string_view sql, size_t i) {
    if (i + 1 >= sql.size()) return false;
    if (sql[i + 1] == '$') return true;
    if (!is_word_start(sql[i + 1])) return false;
    size_t j = i + 1;
    while (j < sql.size() && is_word_char(sql[j])) ++j;
    return j < sql.size() && sql[j] == '$';
}

std::string unquote_identifier(std::string_view quoted) {
    std::string out;
    out.reserve(quoted.size());
    for (size_t i = 1; i + 1 < quoted.size(); ++i) {
        out += quoted[i];
        if (quoted[i] == '"' && quoted[i + 1] == '"') ++i;
    }
    return out;
}

} // anonymous namespace

SqlTokenizer::Result SqlTokenizer::tokenize(std::string_view sql) {
    Result result;
    const size_t n = sql.size();
    size_t i = 0;

    auto fail = [&result](std::string message, size_t at) {
        result.success = false;
        result.error_message = std::move(message);
        result.error_offset = at;
        result.tokens.clear();
        return result;
    };

    while (i < n) {
        const char c = sql[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        // E'...' escape string: backslash escapes apply
        if ((c == 'e' || c == 'E') && i + 1 < n && sql[i + 1] == '\'') {
            const size_t end = scan_quoted(sql, i + 1, '\'', true);
            if (end == std::string_view::npos) {
                return fail("Unterminated string literal", i);
            }
            result.tokens.push_back({TokenType::STRING_LITERAL,
                                     std::string(sql.substr(i, end - i)), i});
            i = end;
            continue;
        }

        if (c == '\'') {
            const size_t end = scan_quoted(sql, i, '\'', false);
            if (end == std::string_view::npos) {
                return fail("Unterminated string literal", i);
            }
            result.tokens.push_back({TokenType::STRING_LITERAL,
                                     std::string(sql.substr(i, end - i)), i});
            i = end;
            continue;
        }

        if (c == '"') {
            const size_t end = scan_quoted(sql, i, '"', false);
            if (end == std::string_view::npos) {
                return fail("Unterminated quoted identifier", i);
            }
            result.tokens.push_back({TokenType::QUOTED_IDENTIFIER,
                                     unquote_identifier(sql.substr(i, end - i)), i});
            i = end;
            continue;
        }

        if (c == '$' && is_dollar_quote(sql, i)) {
            return fail("Dollar-quoted strings are not supported", i);
        }

        if (is_word_start(c)) {
            const size_t start = i;
            while (i < n && is_word_char(sql[i])) ++i;
            result.tokens.push_back({TokenType::WORD,
                                     utils::to_upper(sql.substr(start, i - start)), start});
            continue;
        }

        // digits [. digits] [e [+-] digits]; a letter right after the number
        // starts a new token, as in "1from" -> 1 FROM
        if (is_digit(c) || (c == '.' && i + 1 < n && is_digit(sql[i + 1]))) {
            const size_t start = i;
            while (i < n && is_digit(sql[i])) ++i;
            if (i < n && sql[i] == '.') {
                ++i;
                while (i < n && is_digit(sql[i])) ++i;
            }
            if (i < n && (sql[i] == 'e' || sql[i] == 'E')) {
                size_t j = i + 1;
                if (j < n && (sql[j] == '+' || sql[j] == '-')) ++j;
                if (j < n && is_digit(sql[j])) {
                    i = j;
                    while (i < n && is_digit(sql[i])) ++i;
                }
            }
            result.tokens.push_back({TokenType::NUMBER,
                                     std::string(sql.substr(start, i - start)), start});
            continue;
        }

        if (i + 1 < n) {
            const std::string_view pair = sql.substr(i, 2);
            if (pair == "--" || pair == "/*" || pair == "*/") {
                result.tokens.push_back({TokenType::SYMBOL, std::string(pair), i});
                i += 2;
                continue;
            }
        }

        result.tokens.push_back({TokenType::SYMBOL, std::string(1, c), i});
        ++i;
    }

    result.success = true;
    return result;
}

} // namespace askql
