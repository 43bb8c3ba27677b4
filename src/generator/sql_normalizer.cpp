#include "generator/sql_normalizer.hpp"
#include "core/utils.hpp"

#include <cctype>

namespace askql {

namespace {

constexpr std::string_view kFence = "```";
constexpr std::string_view kSqlLabel = "sql:";

// Body of the first fenced block, or the whole text when there is none.
std::string_view strip_code_fence(std::string_view text) {
    const auto open = text.find(kFence);
    if (open == std::string_view::npos) {
        return text;
    }
    const auto after = open + kFence.size();
    const auto newline = text.find('\n', after);
    const auto inline_close = text.find(kFence, after);

    size_t body_start = after;
    if (newline != std::string_view::npos &&
        (inline_close == std::string_view::npos || newline < inline_close)) {
        body_start = newline + 1;   // rest of the opening line is the language tag
    } else if (text.size() > after + 3 && utils::iequals(text.substr(after, 3), "sql") &&
               std::isspace(static_cast<unsigned char>(text[after + 3]))) {
        body_start = after + 3;     // ```sql SELECT ...```
    }

    const auto close = text.find(kFence, body_start);
    if (close == std::string_view::npos) {
        return text.substr(body_start);
    }
    return text.substr(body_start, close - body_start);
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::string collapse_outside_quotes(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    char quote = '\0';
    bool escapes = false;   // inside E'...', where a backslash escapes the next character
    bool pending_space = false;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote == '\0' && std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        if (escapes && c == '\\' && i + 1 < text.size()) {
            out += c;
            out += text[++i];
            continue;
        }
        if (quote == '\0' && (c == '\'' || c == '"')) {
            quote = c;
            escapes = c == '\'' && i > 0 && (text[i - 1] == 'e' || text[i - 1] == 'E') &&
                      (i < 2 || !is_word_char(text[i - 2]));
        } else if (c == quote) {
            if (i + 1 < text.size() && text[i + 1] == quote) {
                out += c;   // doubled quote stays inside
                out += text[++i];
                continue;
            }
            quote = '\0';
            escapes = false;
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string normalize_candidate(std::string_view raw) {
    std::string text = utils::trim(strip_code_fence(raw));

    if (text.size() >= kSqlLabel.size() &&
        utils::iequals(std::string_view(text).substr(0, kSqlLabel.size()), kSqlLabel)) {
        text = utils::trim(std::string_view(text).substr(kSqlLabel.size()));
    }

    text = collapse_outside_quotes(text);

    while (!text.empty() && (text.back() == ';' ||
                             std::isspace(static_cast<unsigned char>(text.back())))) {
        text.pop_back();
    }
    return text;
}

} // namespace askql
