#include "schemer/parser/type_grammar.hpp"

#include "schemer/parser/keyword_table.hpp"
#include "schemer/parser/tokenizer.hpp"

#include <charconv>
#include <utility>

namespace schemer::parser {

namespace {

constexpr std::size_t kMaxTypeDepth = 64U;

bool is_nested_keyword(const Token& token) noexcept
{
    return token.is_keyword("ARRAY") || token.is_keyword("STRUCT") || token.is_keyword("MAP")
           || token.is_keyword("UNIONTYPE");
}

// Keywords are spelled in their normalized form so that keyword casing never
// changes the type string; user-defined type names keep their spelling.
std::string type_word(const Token& token)
{
    return token.kind == TokenKind::Keyword ? token.normalized_text : token.raw_text;
}

std::optional<std::int64_t> parse_dimension(const Token& token)
{
    std::int64_t value = 0;
    const auto* begin = token.raw_text.data();
    const auto* end = begin + token.raw_text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

void append_dimensions(std::string& text, const TypeNode& node)
{
    for (const auto& dimension : node.dimensions) {
        text.push_back('[');
        if (dimension) {
            text.append(std::to_string(*dimension));
        }
        text.push_back(']');
    }
}

std::string render_nested(const TypeNode& node, bool with_arguments)
{
    std::string text = node.name;
    switch (node.kind) {
    case TypeKind::Simple:
        if (with_arguments && !node.arguments.empty()) {
            text.push_back('(');
            for (std::size_t index = 0U; index < node.arguments.size(); ++index) {
                if (index > 0U) {
                    text.push_back(',');
                }
                text.append(node.arguments[index]);
            }
            text.push_back(')');
        }
        break;
    case TypeKind::Array:
    case TypeKind::Map:
        text.push_back('<');
        for (std::size_t index = 0U; index < node.children.size(); ++index) {
            if (index > 0U) {
                text.push_back(',');
            }
            text.append(canonical_type_string(node.children[index]));
        }
        text.push_back('>');
        break;
    case TypeKind::Struct:
        text.push_back('<');
        for (std::size_t index = 0U; index < node.children.size(); ++index) {
            if (index > 0U) {
                text.push_back(',');
            }
            text.append(node.field_names[index]);
            text.push_back(':');
            text.append(canonical_type_string(node.children[index]));
        }
        text.push_back('>');
        break;
    }
    append_dimensions(text, node);
    return text;
}

}  // namespace

TypeNode TypeParser::parse()
{
    const auto* token = cursor_.peek();
    if (token == nullptr) {
        cursor_.fail(ParseErrc::UnexpectedEnd, "Expected a data type but the statement ended");
    }
    if (is_nested_keyword(*token) && cursor_.peek_punctuation('<', 1U)) {
        auto node = parse_nested(0U);
        parse_dimensions(node);
        return node;
    }
    return parse_simple();
}

TypeNode TypeParser::parse_nested(std::size_t depth)
{
    if (depth > kMaxTypeDepth) {
        cursor_.fail(ParseErrc::UnexpectedToken, "Nested type exceeds the supported depth");
    }

    const auto* token = cursor_.peek();
    if (token == nullptr) {
        cursor_.fail(ParseErrc::UnexpectedEnd, "Expected a data type but the statement ended");
    }
    if (!is_nested_keyword(*token) || !cursor_.peek_punctuation('<', 1U)) {
        if (!token->is_name()) {
            cursor_.fail(ParseErrc::UnexpectedToken, "Expected a data type near '" + token->raw_text + "'");
        }
        return parse_simple();
    }

    TypeNode node{};
    node.name = cursor_.advance().normalized_text;
    cursor_.expect_punctuation('<');

    if (token->is_keyword("STRUCT")) {
        node.kind = TypeKind::Struct;
        do {
            node.field_names.push_back(cursor_.expect_name("a struct field name"));
            cursor_.accept_punctuation(':');
            node.children.push_back(parse_nested(depth + 1U));
            if (cursor_.accept_keyword("COMMENT")) {
                if (const auto* comment = cursor_.peek(); comment != nullptr && comment->kind == TokenKind::StringLiteral) {
                    cursor_.advance();
                }
            }
        } while (cursor_.accept_punctuation(','));
    } else if (token->is_keyword("MAP")) {
        node.kind = TypeKind::Map;
        node.children.push_back(parse_nested(depth + 1U));
        cursor_.expect_punctuation(',');
        node.children.push_back(parse_nested(depth + 1U));
    } else {
        node.kind = TypeKind::Array;
        do {
            node.children.push_back(parse_nested(depth + 1U));
        } while (cursor_.accept_punctuation(','));
    }

    expect_close_angle();
    return node;
}

TypeNode TypeParser::parse_simple()
{
    TypeNode node{};
    const auto* first = cursor_.peek();
    if (first == nullptr) {
        cursor_.fail(ParseErrc::UnexpectedEnd, "Expected a data type but the statement ended");
    }
    if (!first->is_name()) {
        cursor_.fail(ParseErrc::UnexpectedToken, "Expected a data type near '" + first->raw_text + "'");
    }
    node.name = type_word(cursor_.advance());
    while (cursor_.peek_punctuation('.') && cursor_.peek_name(1U)) {
        cursor_.advance();
        node.name.push_back('.');
        node.name.append(type_word(cursor_.advance()));
    }

    parse_modifiers(node);
    if (cursor_.peek_punctuation('(')) {
        parse_arguments(node);
        parse_modifiers(node);
    }
    parse_dimensions(node);
    return node;
}

void TypeParser::parse_arguments(TypeNode& node)
{
    const auto inner = cursor_.take_parenthesized();
    for (const auto part : split_top_level(inner)) {
        node.arguments.push_back(render_tokens(part));
    }
}

void TypeParser::parse_modifiers(TypeNode& node)
{
    while (const auto* token = cursor_.peek()) {
        if (token->is_word() && has_keyword_role(token->normalized_text, KeywordRole::TypeModifier)) {
            node.name.push_back(' ');
            node.name.append(cursor_.advance().normalized_text);
            continue;
        }

        const auto phrase_length = cursor_.peek_keywords({"WITH", "TIME", "ZONE"})         ? 3U
                                   : cursor_.peek_keywords({"WITHOUT", "TIME", "ZONE"})    ? 3U
                                   : cursor_.peek_keywords({"WITH", "LOCAL", "TIME", "ZONE"}) ? 4U
                                                                                            : 0U;
        if (phrase_length == 0U) {
            break;
        }
        for (std::size_t index = 0U; index < phrase_length; ++index) {
            node.name.push_back(' ');
            node.name.append(cursor_.advance().normalized_text);
        }
    }
}

void TypeParser::parse_dimensions(TypeNode& node)
{
    while (true) {
        if (cursor_.peek_punctuation('[')) {
            cursor_.advance();
            std::optional<std::int64_t> dimension{};
            if (const auto* token = cursor_.peek(); token != nullptr && token->kind == TokenKind::NumberLiteral) {
                dimension = parse_dimension(cursor_.advance());
            }
            cursor_.expect_punctuation(']');
            node.dimensions.push_back(dimension);
            continue;
        }
        if (cursor_.peek_keyword("ARRAY") && !cursor_.peek_punctuation('<', 1U)) {
            cursor_.advance();
            if (cursor_.peek_punctuation('[')) {
                continue;
            }
            node.dimensions.emplace_back(std::nullopt);
            continue;
        }
        break;
    }
}

void TypeParser::expect_close_angle()
{
    if (cursor_.accept_punctuation('>')) {
        return;
    }
    const auto* token = cursor_.peek();
    if (token == nullptr) {
        cursor_.fail(ParseErrc::UnexpectedEnd, "Unclosed '<' in nested type");
    }
    cursor_.fail(ParseErrc::UnexpectedToken, "Expected '>' near '" + token->raw_text + "'");
}

std::string canonical_type_string(const TypeNode& node)
{
    return render_nested(node, true);
}

std::string canonical_type_name(const TypeNode& node)
{
    return render_nested(node, false);
}

ParseResult<TypeNode> parse_type(std::string_view input)
{
    ParseResult<TypeNode> result{};
    auto tokens = tokenize(input);
    if (!tokens.success()) {
        result.diagnostics = std::move(tokens.diagnostics);
        return result;
    }

    TokenCursor cursor{tokens.tokens->tokens()};
    try {
        TypeParser parser{cursor};
        auto node = parser.parse();
        if (!cursor.at_end()) {
            cursor.fail(ParseErrc::UnexpectedToken, "Unexpected text after data type near '" + cursor.peek()->raw_text + "'");
        }
        result.ast = std::move(node);
    } catch (const StatementError& error) {
        ParserDiagnostic diagnostic{};
        diagnostic.severity = ParserSeverity::Error;
        diagnostic.code = error.code();
        diagnostic.message = error.what();
        diagnostic.offset = error.offset();
        const auto position = locate_offset(input, error.offset());
        diagnostic.line = position.line;
        diagnostic.column = position.column;
        diagnostic.statement = std::string{input};
        result.diagnostics.push_back(std::move(diagnostic));
    }
    return result;
}

}  // namespace schemer::parser
