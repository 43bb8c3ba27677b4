#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace askql {

enum class TokenType : uint8_t {
    WORD,               // bare identifier or keyword; text is uppercased
    QUOTED_IDENTIFIER,  // "name"; text is the unquoted content
    STRING_LITERAL,     // '...' / E'...'; text is the raw literal
    NUMBER,
    SYMBOL              // punctuation; "--" and "/*" are single tokens
};

struct Token {
    TokenType type;
    std::string text;
    size_t offset;      // byte offset in the source text

    [[nodiscard]] bool is_word(std::string_view upper) const {
        return type == TokenType::WORD && text == upper;
    }
    [[nodiscard]] bool is_symbol(std::string_view sym) const {
        return type == TokenType::SYMBOL && text == sym;
    }
};

/**
 * @brief Lightweight SQL lexer for safety checks
 *
 * Understands exactly what the validator needs: quoted literals (so their
 * contents never look like code), quoted identifiers, words, numbers and
 * punctuation. Comments are NOT skipped: "--" and "/*" come out as symbol
 * tokens and everything after them is lexed as code.
 *
 * Fails on unterminated quotes and on dollar-quoted strings, whose
 * boundaries a lexer this small cannot establish reliably.
 */
class SqlTokenizer {
public:
    struct Result {
        bool success = false;
        std::string error_message;
        size_t error_offset = 0;
        std::vector<Token> tokens;
    };

    [[nodiscard]] static Result tokenize(std::string_view sql);
};

} // namespace askql
