#pragma once

#include "schemer/parser/parse_errors.hpp"
#include "schemer/parser/token.hpp"

#include <cstddef>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace schemer::parser {

/// Raised inside a statement reducer when the statement cannot be completed.
/// The script driver converts it into an Error diagnostic for that statement
/// only.
class StatementError final : public std::runtime_error {
public:
    StatementError(ParseErrc code, const std::string& message, std::size_t offset);

    [[nodiscard]] std::error_code code() const noexcept { return code_; }
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::error_code code_{};
    std::size_t offset_ = 0U;
};

/// Bounded view over the tokens of one statement or clause. Lookahead never
/// crosses the end of the span it was created with.
class TokenCursor final {
public:
    explicit TokenCursor(std::span<const Token> tokens, std::size_t end_offset = 0U) noexcept;

    [[nodiscard]] bool at_end() const noexcept { return position_ >= tokens_.size(); }
    [[nodiscard]] const Token* peek(std::size_t lookahead = 0U) const noexcept;
    const Token& advance();

    [[nodiscard]] bool peek_keyword(std::string_view word, std::size_t lookahead = 0U) const noexcept;
    [[nodiscard]] bool peek_keywords(std::initializer_list<std::string_view> words) const noexcept;
    bool accept_keyword(std::string_view word) noexcept;
    bool accept_keywords(std::initializer_list<std::string_view> words) noexcept;
    void expect_keyword(std::string_view word);

    [[nodiscard]] bool peek_punctuation(char symbol, std::size_t lookahead = 0U) const noexcept;
    bool accept_punctuation(char symbol) noexcept;
    void expect_punctuation(char symbol);
    bool accept_operator(std::string_view symbol) noexcept;

    /// Consumes an identifier, keyword or quoted identifier and returns its
    /// raw text.
    std::string expect_name(std::string_view what);
    [[nodiscard]] bool peek_name(std::size_t lookahead = 0U) const noexcept;

    /// Consumes a balanced `( ... )` group and returns the tokens between the
    /// parentheses.
    std::span<const Token> take_parenthesized();

    /// Consumes tokens up to (not including) the first depth-zero token for
    /// which `is_boundary` returns true.
    template <typename Predicate>
    std::span<const Token> take_until(Predicate is_boundary);

    std::span<const Token> take_rest() noexcept;

    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    void rewind(std::size_t position) noexcept { position_ = position; }
    [[nodiscard]] std::size_t current_offset() const noexcept;
    [[nodiscard]] std::span<const Token> remaining() const noexcept { return tokens_.subspan(position_); }
    [[nodiscard]] std::span<const Token> consumed_since(std::size_t start) const noexcept
    {
        return tokens_.subspan(start, position_ - start);
    }

    [[noreturn]] void fail(ParseErrc code, const std::string& message) const;

private:
    std::span<const Token> tokens_{};
    std::size_t position_ = 0U;
    std::size_t end_offset_ = 0U;
};

template <typename Predicate>
std::span<const Token> TokenCursor::take_until(Predicate is_boundary)
{
    const auto start = position_;
    int depth = 0;
    while (position_ < tokens_.size()) {
        const auto& token = tokens_[position_];
        if (depth == 0 && is_boundary(token)) {
            break;
        }
        if (token.is_punctuation('(')) {
            ++depth;
        } else if (token.is_punctuation(')')) {
            if (depth == 0) {
                break;
            }
            --depth;
        }
        ++position_;
    }
    return tokens_.subspan(start, position_ - start);
}

/// Splits a token span on depth-zero separators. Parentheses always nest;
/// angle brackets nest only when opened right after ARRAY, MAP, STRUCT or
/// UNIONTYPE so that comparison operators are left alone.
[[nodiscard]] std::vector<std::span<const Token>> split_top_level(std::span<const Token> tokens, char separator = ',');

/// Renders tokens back into normalized SQL text: reserved words upper-cased,
/// literals and quoted names re-quoted, single spaces between tokens except
/// around parentheses, commas, dots and casts.
[[nodiscard]] std::string render_tokens(std::span<const Token> tokens);

[[nodiscard]] std::string render_token(const Token& token);

}  // namespace schemer::parser
