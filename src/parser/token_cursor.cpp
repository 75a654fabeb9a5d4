#include "schemer/parser/token_cursor.hpp"

#include "schemer/parser/keyword_table.hpp"

#include <utility>

namespace schemer::parser {

namespace {

bool opens_nested_type(const Token& token) noexcept
{
    return token.is_keyword("ARRAY") || token.is_keyword("MAP") || token.is_keyword("STRUCT")
           || token.is_keyword("UNIONTYPE");
}

std::string quote(std::string_view text, char quote_char)
{
    std::string quoted;
    quoted.reserve(text.size() + 2U);
    quoted.push_back(quote_char);
    for (const char ch : text) {
        quoted.push_back(ch);
        if (ch == quote_char) {
            quoted.push_back(ch);
        }
    }
    quoted.push_back(quote_char);
    return quoted;
}

bool suppresses_space_after(const Token& token) noexcept
{
    return token.is_punctuation('(') || token.is_punctuation('.') || token.is_punctuation('[')
           || (token.kind == TokenKind::Operator && token.raw_text == "::");
}

bool suppresses_space_before(const Token& token) noexcept
{
    return token.is_punctuation(')') || token.is_punctuation(',') || token.is_punctuation('.')
           || token.is_punctuation('[') || token.is_punctuation(']')
           || (token.kind == TokenKind::Operator && token.raw_text == "::");
}

bool is_call_target(const Token& token) noexcept
{
    if (token.kind == TokenKind::Identifier || token.kind == TokenKind::QuotedIdentifier) {
        return true;
    }
    return token.kind == TokenKind::Keyword && classify_keyword(token.normalized_text) != KeywordCategory::ReservedWord;
}

}  // namespace

StatementError::StatementError(ParseErrc code, const std::string& message, std::size_t offset)
    : std::runtime_error{message}
    , code_{make_error_code(code)}
    , offset_{offset}
{
}

TokenCursor::TokenCursor(std::span<const Token> tokens, std::size_t end_offset) noexcept
    : tokens_{tokens}
    , end_offset_{end_offset}
{
    if (end_offset_ == 0U && !tokens_.empty()) {
        end_offset_ = tokens_.back().end_offset;
    }
}

const Token* TokenCursor::peek(std::size_t lookahead) const noexcept
{
    const auto index = position_ + lookahead;
    return index < tokens_.size() ? &tokens_[index] : nullptr;
}

const Token& TokenCursor::advance()
{
    if (at_end()) {
        fail(ParseErrc::UnexpectedEnd, "Unexpected end of statement");
    }
    return tokens_[position_++];
}

bool TokenCursor::peek_keyword(std::string_view word, std::size_t lookahead) const noexcept
{
    const auto* token = peek(lookahead);
    return token != nullptr && token->is_keyword(word);
}

bool TokenCursor::peek_keywords(std::initializer_list<std::string_view> words) const noexcept
{
    std::size_t lookahead = 0U;
    for (const auto word : words) {
        if (!peek_keyword(word, lookahead)) {
            return false;
        }
        ++lookahead;
    }
    return true;
}

bool TokenCursor::accept_keyword(std::string_view word) noexcept
{
    if (!peek_keyword(word)) {
        return false;
    }
    ++position_;
    return true;
}

bool TokenCursor::accept_keywords(std::initializer_list<std::string_view> words) noexcept
{
    if (!peek_keywords(words)) {
        return false;
    }
    position_ += words.size();
    return true;
}

void TokenCursor::expect_keyword(std::string_view word)
{
    if (!accept_keyword(word)) {
        const auto* token = peek();
        if (token == nullptr) {
            fail(ParseErrc::UnexpectedEnd, "Expected " + std::string{word} + " but the statement ended");
        }
        fail(ParseErrc::UnexpectedToken, "Expected " + std::string{word} + " near '" + token->raw_text + "'");
    }
}

bool TokenCursor::peek_punctuation(char symbol, std::size_t lookahead) const noexcept
{
    const auto* token = peek(lookahead);
    return token != nullptr && token->is_punctuation(symbol);
}

bool TokenCursor::accept_punctuation(char symbol) noexcept
{
    if (!peek_punctuation(symbol)) {
        return false;
    }
    ++position_;
    return true;
}

void TokenCursor::expect_punctuation(char symbol)
{
    if (!accept_punctuation(symbol)) {
        const auto* token = peek();
        std::string expected{"'"};
        expected.push_back(symbol);
        expected.push_back('\'');
        if (token == nullptr) {
            fail(ParseErrc::UnexpectedEnd, "Expected " + expected + " but the statement ended");
        }
        fail(ParseErrc::UnexpectedToken, "Expected " + expected + " near '" + token->raw_text + "'");
    }
}

bool TokenCursor::accept_operator(std::string_view symbol) noexcept
{
    const auto* token = peek();
    if (token == nullptr || token->kind != TokenKind::Operator || token->raw_text != symbol) {
        return false;
    }
    ++position_;
    return true;
}

bool TokenCursor::peek_name(std::size_t lookahead) const noexcept
{
    const auto* token = peek(lookahead);
    return token != nullptr && token->is_name();
}

std::string TokenCursor::expect_name(std::string_view what)
{
    const auto* token = peek();
    if (token == nullptr) {
        fail(ParseErrc::UnexpectedEnd, "Expected " + std::string{what} + " but the statement ended");
    }
    if (!token->is_name()) {
        fail(ParseErrc::UnexpectedToken, "Expected " + std::string{what} + " near '" + token->raw_text + "'");
    }
    ++position_;
    return token->raw_text;
}

std::span<const Token> TokenCursor::take_parenthesized()
{
    expect_punctuation('(');
    const auto start = position_;
    int depth = 1;
    while (position_ < tokens_.size()) {
        const auto& token = tokens_[position_];
        if (token.is_punctuation('(')) {
            ++depth;
        } else if (token.is_punctuation(')')) {
            --depth;
            if (depth == 0) {
                const auto inner = tokens_.subspan(start, position_ - start);
                ++position_;
                return inner;
            }
        }
        ++position_;
    }
    fail(ParseErrc::UnexpectedEnd, "Unbalanced parenthesis");
}

std::span<const Token> TokenCursor::take_rest() noexcept
{
    const auto rest = tokens_.subspan(position_);
    position_ = tokens_.size();
    return rest;
}

std::size_t TokenCursor::current_offset() const noexcept
{
    if (const auto* token = peek()) {
        return token->offset;
    }
    return end_offset_;
}

void TokenCursor::fail(ParseErrc code, const std::string& message) const
{
    throw StatementError(code, message, current_offset());
}

std::vector<std::span<const Token>> split_top_level(std::span<const Token> tokens, char separator)
{
    std::vector<std::span<const Token>> parts;
    int paren_depth = 0;
    int angle_depth = 0;
    std::size_t start = 0U;

    for (std::size_t index = 0U; index < tokens.size(); ++index) {
        const auto& token = tokens[index];
        if (token.is_punctuation('(')) {
            ++paren_depth;
        } else if (token.is_punctuation(')')) {
            --paren_depth;
        } else if (token.is_punctuation('<') && index > 0U && (opens_nested_type(tokens[index - 1U]) || angle_depth > 0)) {
            ++angle_depth;
        } else if (token.is_punctuation('>') && angle_depth > 0) {
            --angle_depth;
        } else if (paren_depth == 0 && angle_depth == 0 && token.is_punctuation(separator)) {
            parts.push_back(tokens.subspan(start, index - start));
            start = index + 1U;
        }
    }

    if (start < tokens.size() || !parts.empty()) {
        parts.push_back(tokens.subspan(start));
    }
    return parts;
}

std::string render_token(const Token& token)
{
    switch (token.kind) {
    case TokenKind::StringLiteral:
        return quote(token.raw_text, '\'');
    case TokenKind::QuotedIdentifier:
        return quote(token.raw_text, '"');
    case TokenKind::Keyword:
        if (classify_keyword(token.normalized_text) == KeywordCategory::ReservedWord) {
            return token.normalized_text;
        }
        return token.raw_text;
    default:
        return token.raw_text;
    }
}

std::string render_tokens(std::span<const Token> tokens)
{
    std::string text;
    for (std::size_t index = 0U; index < tokens.size(); ++index) {
        const auto& token = tokens[index];
        if (index > 0U) {
            const auto& previous = tokens[index - 1U];
            const bool call = token.is_punctuation('(') && is_call_target(previous);
            if (!call && !suppresses_space_after(previous) && !suppresses_space_before(token)) {
                text.push_back(' ');
            }
        }
        text.append(render_token(token));
    }
    return text;
}

}  // namespace schemer::parser
