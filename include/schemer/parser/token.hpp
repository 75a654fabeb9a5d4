#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace schemer::parser {

enum class TokenKind : std::uint8_t {
    Keyword = 0,
    Identifier,
    QuotedIdentifier,
    StringLiteral,
    NumberLiteral,
    Punctuation,
    Operator
};

/// A lexical unit of DDL text. `raw_text` keeps source casing and excludes
/// quote delimiters; `normalized_text` is the upper-cased form used for
/// keyword comparison. `offset`/`end_offset` delimit the token in the source,
/// delimiters included.
struct Token final {
    TokenKind kind = TokenKind::Identifier;
    std::string raw_text{};
    std::string normalized_text{};
    std::size_t offset = 0U;
    std::size_t end_offset = 0U;

    [[nodiscard]] bool is_word() const noexcept
    {
        return kind == TokenKind::Keyword || kind == TokenKind::Identifier;
    }

    [[nodiscard]] bool is_name() const noexcept
    {
        return is_word() || kind == TokenKind::QuotedIdentifier;
    }

    [[nodiscard]] bool is_punctuation(char symbol) const noexcept
    {
        return kind == TokenKind::Punctuation && raw_text.size() == 1U && raw_text.front() == symbol;
    }

    [[nodiscard]] bool is_keyword(std::string_view word) const noexcept
    {
        return is_word() && normalized_text == word;
    }
};

[[nodiscard]] std::string_view token_kind_name(TokenKind kind) noexcept;

}  // namespace schemer::parser
