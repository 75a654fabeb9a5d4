#include "schemer/parser/tokenizer.hpp"

#include "schemer/parser/keyword_table.hpp"
#include "schemer/parser/lexical_grammar.hpp"
#include "schemer/parser/text_utils.hpp"

#include <tao/pegtl.hpp>

#include <utility>

namespace schemer::parser {

namespace {

namespace pegtl = tao::pegtl;

struct OpenSpan final {
    ParseErrc code = ParseErrc::Success;
    std::size_t offset = 0U;
};

struct LexState final {
    std::vector<Token> tokens{};
    std::optional<OpenSpan> open_span{};
};

std::string collapse_doubled(std::string_view body, char quote)
{
    std::string text;
    text.reserve(body.size());
    for (std::size_t index = 0U; index < body.size(); ++index) {
        text.push_back(body[index]);
        if (body[index] == quote && index + 1U < body.size() && body[index + 1U] == quote) {
            ++index;
        }
    }
    return text;
}

template <typename Input>
void push_token(LexState& state, const Input& in, TokenKind kind, std::string raw, std::string normalized)
{
    Token token{};
    token.kind = kind;
    token.raw_text = std::move(raw);
    token.normalized_text = std::move(normalized);
    token.offset = static_cast<std::size_t>(in.position().byte);
    token.end_offset = token.offset + in.size();
    state.tokens.push_back(std::move(token));
}

template <typename Input>
void push_quoted(LexState& state, const Input& in, TokenKind kind, char quote)
{
    const auto text = in.string_view();
    auto body = collapse_doubled(text.substr(1U, text.size() - 2U), quote);
    auto normalized = kind == TokenKind::StringLiteral ? body : uppercase_copy(body);
    push_token(state, in, kind, std::move(body), std::move(normalized));
    state.open_span.reset();
}

template <typename Rule>
struct lex_action : pegtl::nothing<Rule> {
};

template <ParseErrc Code>
struct open_span_action {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        state.open_span = OpenSpan{Code, static_cast<std::size_t>(in.position().byte)};
    }
};

template <>
struct lex_action<lex::block_comment_open> : open_span_action<ParseErrc::UnterminatedComment> {
};

template <>
struct lex_action<lex::string_open> : open_span_action<ParseErrc::UnterminatedString> {
};

template <>
struct lex_action<lex::double_quote_open> : open_span_action<ParseErrc::UnterminatedIdentifier> {
};

template <>
struct lex_action<lex::backtick_open> : open_span_action<ParseErrc::UnterminatedIdentifier> {
};

template <>
struct lex_action<lex::bracket_open> : open_span_action<ParseErrc::UnterminatedIdentifier> {
};

template <>
struct lex_action<lex::block_comment> {
    template <typename Input>
    static void apply(const Input&, LexState& state)
    {
        state.open_span.reset();
    }
};

template <>
struct lex_action<lex::string_literal> {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        push_quoted(state, in, TokenKind::StringLiteral, '\'');
    }
};

template <>
struct lex_action<lex::double_quoted_identifier> {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        push_quoted(state, in, TokenKind::QuotedIdentifier, '"');
    }
};

template <>
struct lex_action<lex::backtick_identifier> {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        push_quoted(state, in, TokenKind::QuotedIdentifier, '`');
    }
};

template <>
struct lex_action<lex::bracket_identifier> {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        const auto text = in.string_view();
        auto body = std::string{text.substr(1U, text.size() - 2U)};
        auto normalized = uppercase_copy(body);
        push_token(state, in, TokenKind::QuotedIdentifier, std::move(body), std::move(normalized));
        state.open_span.reset();
    }
};

template <>
struct lex_action<lex::array_dimension> {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        const auto text = in.string_view();
        const auto begin = static_cast<std::size_t>(in.position().byte);
        const auto emit = [&state](TokenKind kind, std::string raw, std::size_t offset, std::size_t length) {
            Token token{};
            token.kind = kind;
            token.normalized_text = raw;
            token.raw_text = std::move(raw);
            token.offset = offset;
            token.end_offset = offset + length;
            state.tokens.push_back(std::move(token));
        };

        emit(TokenKind::Punctuation, "[", begin, 1U);
        const auto digits_begin = text.find_first_of("0123456789");
        if (digits_begin != std::string_view::npos) {
            const auto digits_end = text.find_first_not_of("0123456789", digits_begin);
            const auto digits = text.substr(digits_begin, digits_end - digits_begin);
            emit(TokenKind::NumberLiteral, std::string{digits}, begin + digits_begin, digits.size());
        }
        emit(TokenKind::Punctuation, "]", begin + text.size() - 1U, 1U);
    }
};

// A sign directly after an operand is a binary operator: `a-1` is `a - 1`.
bool ends_with_operand(const LexState& state) noexcept
{
    if (state.tokens.empty()) {
        return false;
    }
    const auto& last = state.tokens.back();
    switch (last.kind) {
    case TokenKind::Identifier:
    case TokenKind::QuotedIdentifier:
    case TokenKind::StringLiteral:
    case TokenKind::NumberLiteral:
        return true;
    case TokenKind::Punctuation:
        return last.is_punctuation(')') || last.is_punctuation(']');
    default:
        return false;
    }
}

template <>
struct lex_action<lex::number_literal> {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        auto raw = in.string();
        const bool signed_literal = raw.front() == '+' || raw.front() == '-';
        if (signed_literal && ends_with_operand(state)) {
            const auto offset = static_cast<std::size_t>(in.position().byte);

            Token sign{};
            sign.kind = TokenKind::Operator;
            sign.raw_text = raw.substr(0U, 1U);
            sign.normalized_text = sign.raw_text;
            sign.offset = offset;
            sign.end_offset = offset + 1U;
            state.tokens.push_back(std::move(sign));

            Token number{};
            number.kind = TokenKind::NumberLiteral;
            number.raw_text = raw.substr(1U);
            number.normalized_text = uppercase_copy(number.raw_text);
            number.offset = offset + 1U;
            number.end_offset = offset + raw.size();
            state.tokens.push_back(std::move(number));
            return;
        }
        auto normalized = uppercase_copy(raw);
        push_token(state, in, TokenKind::NumberLiteral, std::move(raw), std::move(normalized));
    }
};

template <>
struct lex_action<lex::word> {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        auto raw = in.string();
        auto normalized = uppercase_copy(raw);
        const auto kind = classify_keyword(normalized) == KeywordCategory::None ? TokenKind::Identifier
                                                                                : TokenKind::Keyword;
        push_token(state, in, kind, std::move(raw), std::move(normalized));
    }
};

template <>
struct lex_action<lex::operator_token> {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        auto raw = in.string();
        auto normalized = raw;
        push_token(state, in, TokenKind::Operator, std::move(raw), std::move(normalized));
    }
};

template <>
struct lex_action<lex::punctuation> {
    template <typename Input>
    static void apply(const Input& in, LexState& state)
    {
        auto raw = in.string();
        auto normalized = raw;
        push_token(state, in, TokenKind::Punctuation, std::move(raw), std::move(normalized));
    }
};

ParserDiagnostic make_lex_error(ParseErrc code, std::size_t offset, std::string_view input)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.code = make_error_code(code);
    diagnostic.offset = offset;
    const auto position = locate_offset(input, offset);
    diagnostic.line = position.line;
    diagnostic.column = position.column;

    switch (code) {
    case ParseErrc::UnterminatedString:
        diagnostic.message = "Unterminated string literal starting at offset " + std::to_string(offset);
        diagnostic.remediation_hints = {"Close the literal with a single quote; embed quotes as ''."};
        break;
    case ParseErrc::UnterminatedIdentifier:
        diagnostic.message = "Unterminated quoted identifier starting at offset " + std::to_string(offset);
        diagnostic.remediation_hints = {"Close the identifier with its matching quote or bracket."};
        break;
    case ParseErrc::UnterminatedComment:
        diagnostic.message = "Unterminated block comment starting at offset " + std::to_string(offset);
        diagnostic.remediation_hints = {"Close the comment with */."};
        break;
    default: {
        diagnostic.message = "Unexpected character at offset " + std::to_string(offset);
        if (offset < input.size()) {
            diagnostic.message += " near '";
            diagnostic.message.push_back(input[offset]);
            diagnostic.message.push_back('\'');
        }
        diagnostic.remediation_hints = {"Remove the character or quote the identifier that contains it."};
        break;
    }
    }
    return diagnostic;
}

}  // namespace

TokenStream::TokenStream(std::vector<Token> tokens)
    : tokens_{std::move(tokens)}
{
}

const Token* TokenStream::peek(std::size_t lookahead) const noexcept
{
    const auto index = cursor_ + lookahead;
    return index < tokens_.size() ? &tokens_[index] : nullptr;
}

const Token* TokenStream::next() noexcept
{
    if (at_end()) {
        return nullptr;
    }
    return &tokens_[cursor_++];
}

TokenizeResult tokenize(std::string_view input)
{
    TokenizeResult result{};
    LexState state{};
    pegtl::memory_input in(input.data(), input.size(), "ddl");

    try {
        if (pegtl::parse<lex::ddl_text, lex_action>(in, state)) {
            result.tokens.emplace(std::move(state.tokens));
        } else {
            result.diagnostics.push_back(make_lex_error(ParseErrc::UnexpectedCharacter, 0U, input));
        }
    } catch (const pegtl::parse_error& error) {
        if (state.open_span) {
            result.diagnostics.push_back(make_lex_error(state.open_span->code, state.open_span->offset, input));
        } else {
            std::size_t offset = input.size();
            if (!error.positions().empty()) {
                offset = static_cast<std::size_t>(error.positions().front().byte);
            }
            result.diagnostics.push_back(make_lex_error(ParseErrc::UnexpectedCharacter, offset, input));
        }
    }

    return result;
}

}  // namespace schemer::parser
