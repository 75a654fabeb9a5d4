#include "schemer/parser/statement_reducers.hpp"

#include "schemer/parser/keyword_table.hpp"
#include "schemer/parser/text_utils.hpp"
#include "schemer/parser/type_grammar.hpp"

#include <cctype>
#include <charconv>
#include <unordered_map>
#include <utility>

namespace schemer::parser {

namespace {

using ColumnAttributeHandler = void (*)(TokenCursor&, ColumnDefinition&, ParseContext&);

bool is_column_boundary(const Token& token) noexcept
{
    return token.is_word() && has_keyword_role(token.normalized_text, KeywordRole::ColumnAttribute);
}

// `CHARACTER` opens both a type (`CHARACTER VARYING`) and an attribute
// (`CHARACTER SET`).
bool starts_column_attribute(const TokenCursor& cursor) noexcept
{
    const auto* token = cursor.peek();
    if (token == nullptr || !is_column_boundary(*token)) {
        return false;
    }
    if (token->is_keyword("CHARACTER")) {
        return cursor.peek_keyword("SET", 1U);
    }
    return true;
}

std::optional<std::int64_t> parse_int64(std::string_view text)
{
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1U);
    }
    std::int64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

// "10" and "10 CHAR" (Oracle length semantics) both size to 10.
std::optional<std::int64_t> leading_integer(std::string_view argument)
{
    const auto space = argument.find(' ');
    return parse_int64(argument.substr(0U, space));
}

bool is_plain_word(std::string_view text) noexcept
{
    if (text.empty()) {
        return false;
    }
    for (const char ch : text) {
        if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
            return false;
        }
    }
    return true;
}

void assign_type(ColumnDefinition& column, TypeNode node)
{
    column.type = canonical_type_string(node);
    if (node.kind == TypeKind::Simple && !node.arguments.empty()) {
        const auto& arguments = node.arguments;
        if (arguments.size() == 1U) {
            if (const auto length = leading_integer(arguments.front())) {
                column.size = *length;
                column.type = canonical_type_name(node);
            } else if (is_plain_word(arguments.front())) {
                column.size = arguments.front();
                column.type = canonical_type_name(node);
            }
        } else if (arguments.size() == 2U) {
            const auto precision = leading_integer(arguments[0]);
            const auto scale = leading_integer(arguments[1]);
            if (precision && scale) {
                column.size = std::make_pair(*precision, *scale);
                column.type = canonical_type_name(node);
            }
        }
    }
    column.type_tree = std::move(node);
}

std::string render_next(TokenCursor& cursor)
{
    return render_token(cursor.advance());
}

void skip_unknown_attribute(TokenCursor& cursor, ParseContext& context)
{
    const auto offset = cursor.current_offset();
    const auto start = cursor.position();
    cursor.advance();
    (void)cursor.take_until(is_column_boundary);
    const auto text = render_tokens(cursor.consumed_since(start));
    context.warn(ParseErrc::UnknownClause,
                 "Unrecognized column attribute '" + text + "' was skipped",
                 offset,
                 {"The attribute is not part of the supported dialects; it has no effect on the output."});
}

void reduce_not(TokenCursor& cursor, ColumnDefinition& column, ParseContext& context)
{
    if (cursor.accept_keywords({"NOT", "NULL"})) {
        column.nullable = false;
        return;
    }
    if (cursor.accept_keywords({"NOT", "DEFERRABLE"})) {
        return;
    }
    skip_unknown_attribute(cursor, context);
}

void reduce_null(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    column.nullable = true;
}

void reduce_primary_key(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    cursor.expect_keyword("KEY");
    column.primary_key = true;
    column.nullable = false;
    if (!cursor.accept_keyword("ASC")) {
        cursor.accept_keyword("DESC");
    }
}

void reduce_unique(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    cursor.accept_keyword("KEY");
    column.unique = true;
}

void reduce_default(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    column.default_value = render_tokens(take_attribute_expression(cursor));
}

void reduce_check(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    column.check = render_tokens(cursor.take_parenthesized());
}

void reduce_column_references(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    std::vector<std::string> reference_columns{};
    auto reference = reduce_references(cursor, reference_columns);
    if (!reference_columns.empty()) {
        reference.column = reference_columns.front();
    }
    column.references = std::move(reference);
}

void reduce_constraint_name(TokenCursor& cursor, ColumnDefinition&, ParseContext&)
{
    cursor.advance();
    (void)cursor.expect_name("a constraint name");
}

void reduce_deferrable(TokenCursor& cursor, ColumnDefinition&, ParseContext&)
{
    cursor.advance();
}

void reduce_initially(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    auto mode = uppercase_copy(cursor.expect_name("DEFERRED or IMMEDIATE"));
    if (column.references) {
        column.references->deferrable_initially = std::move(mode);
    }
}

void reduce_collate(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    column.collate = render_next(cursor);
}

void reduce_character_set(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    cursor.expect_keyword("SET");
    column.character_set = render_next(cursor);
}

void reduce_comment(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    cursor.accept_operator("=");
    column.comment = render_next(cursor);
}

void reduce_autoincrement(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    column.autoincrement = true;
}

void reduce_identity(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    if (cursor.peek_punctuation('(')) {
        (void)cursor.take_parenthesized();
    }
    column.autoincrement = true;
}

void reduce_generated(TokenCursor& cursor, ColumnDefinition& column, ParseContext&)
{
    cursor.advance();
    if (!cursor.accept_keyword("ALWAYS") && cursor.accept_keywords({"BY", "DEFAULT"})) {
        cursor.accept_keywords({"ON", "NULL"});
    }
    cursor.expect_keyword("AS");
    if (cursor.accept_keyword("IDENTITY")) {
        if (cursor.peek_punctuation('(')) {
            (void)cursor.take_parenthesized();
        }
        column.autoincrement = true;
        return;
    }
    column.generated_as = render_tokens(cursor.take_parenthesized());
    if (!cursor.accept_keyword("STORED") && !cursor.accept_keyword("VIRTUAL")) {
        cursor.accept_keyword("PERSISTED");
    }
}

void reduce_on(TokenCursor& cursor, ColumnDefinition& column, ParseContext& context)
{
    if (!cursor.accept_keywords({"ON", "UPDATE"})) {
        skip_unknown_attribute(cursor, context);
        return;
    }
    column.on_update = render_tokens(take_attribute_expression(cursor));
}

const std::unordered_map<std::string_view, ColumnAttributeHandler>& column_attribute_handlers()
{
    static const std::unordered_map<std::string_view, ColumnAttributeHandler> handlers{
        {"NOT", &reduce_not},
        {"NULL", &reduce_null},
        {"PRIMARY", &reduce_primary_key},
        {"UNIQUE", &reduce_unique},
        {"DEFAULT", &reduce_default},
        {"CHECK", &reduce_check},
        {"REFERENCES", &reduce_column_references},
        {"CONSTRAINT", &reduce_constraint_name},
        {"DEFERRABLE", &reduce_deferrable},
        {"INITIALLY", &reduce_initially},
        {"COLLATE", &reduce_collate},
        {"CHARACTER", &reduce_character_set},
        {"COMMENT", &reduce_comment},
        {"AUTO_INCREMENT", &reduce_autoincrement},
        {"AUTOINCREMENT", &reduce_autoincrement},
        {"IDENTITY", &reduce_identity},
        {"GENERATED", &reduce_generated},
        {"ON", &reduce_on},
    };
    return handlers;
}

std::string reduce_referential_action(TokenCursor& cursor)
{
    if (cursor.accept_keywords({"SET", "NULL"})) {
        return "SET NULL";
    }
    if (cursor.accept_keywords({"SET", "DEFAULT"})) {
        return "SET DEFAULT";
    }
    if (cursor.accept_keywords({"NO", "ACTION"})) {
        return "NO ACTION";
    }
    return uppercase_copy(cursor.expect_name("a referential action"));
}

}  // namespace

QualifiedName reduce_qualified_name(TokenCursor& cursor, std::string_view what)
{
    QualifiedName name{};
    name.name = cursor.expect_name(what);
    while (cursor.accept_punctuation('.')) {
        name.schema = std::move(name.name);
        name.name = cursor.expect_name(what);
    }
    return name;
}

std::vector<std::string> reduce_name_list(TokenCursor& cursor, std::string_view what)
{
    std::vector<std::string> names{};
    const auto inner = cursor.take_parenthesized();
    for (const auto part : split_top_level(inner)) {
        if (part.empty() || !part.front().is_name()) {
            cursor.fail(ParseErrc::UnexpectedToken, "Expected " + std::string{what} + " in column list");
        }
        names.push_back(part.front().raw_text);
    }
    return names;
}

std::span<const Token> take_attribute_expression(TokenCursor& cursor)
{
    const auto start = cursor.position();
    if (cursor.peek_punctuation('(')) {
        (void)cursor.take_parenthesized();
    } else {
        cursor.advance();
    }
    (void)cursor.take_until(is_column_boundary);
    return cursor.consumed_since(start);
}

ColumnDefinition reduce_column_definition(TokenCursor& cursor, ParseContext& context)
{
    ColumnDefinition column{};
    column.offset = cursor.current_offset();
    column.name = cursor.expect_name("a column name");

    if (!cursor.at_end() && !starts_column_attribute(cursor)) {
        TypeParser parser{cursor};
        assign_type(column, parser.parse());
    }

    const auto& handlers = column_attribute_handlers();
    while (const auto* token = cursor.peek()) {
        const auto handler = token->is_word() ? handlers.find(token->normalized_text) : handlers.end();
        if (handler == handlers.end()) {
            skip_unknown_attribute(cursor, context);
            continue;
        }
        handler->second(cursor, column, context);
    }
    return column;
}

ForeignKeyRef reduce_references(TokenCursor& cursor, std::vector<std::string>& reference_columns)
{
    cursor.expect_keyword("REFERENCES");
    ForeignKeyRef reference{};
    auto target = reduce_qualified_name(cursor, "a referenced table");
    reference.schema = std::move(target.schema);
    reference.table = std::move(target.name);
    if (cursor.peek_punctuation('(')) {
        reference_columns = reduce_name_list(cursor, "a referenced column");
    }

    while (!cursor.at_end()) {
        if (cursor.accept_keywords({"ON", "DELETE"})) {
            reference.on_delete = reduce_referential_action(cursor);
        } else if (cursor.accept_keywords({"ON", "UPDATE"})) {
            reference.on_update = reduce_referential_action(cursor);
        } else if (cursor.accept_keyword("MATCH")) {
            (void)cursor.expect_name("FULL, PARTIAL or SIMPLE");
        } else if (cursor.accept_keywords({"NOT", "DEFERRABLE"}) || cursor.accept_keyword("DEFERRABLE")) {
            continue;
        } else if (cursor.accept_keyword("INITIALLY")) {
            reference.deferrable_initially = uppercase_copy(cursor.expect_name("DEFERRED or IMMEDIATE"));
        } else {
            break;
        }
    }
    return reference;
}

std::optional<TableConstraint> reduce_table_constraint(TokenCursor& cursor)
{
    const auto start = cursor.position();
    std::optional<std::string> constraint_name{};
    if (cursor.accept_keyword("CONSTRAINT")) {
        constraint_name = cursor.expect_name("a constraint name");
    }

    if (cursor.accept_keywords({"PRIMARY", "KEY"})) {
        if (!cursor.accept_keyword("CLUSTERED")) {
            cursor.accept_keyword("NONCLUSTERED");
        }
        return PrimaryKeyConstraint{std::move(constraint_name), reduce_name_list(cursor, "a key column")};
    }

    if (cursor.peek_keyword("UNIQUE")) {
        cursor.advance();
        if (!cursor.accept_keyword("KEY")) {
            cursor.accept_keyword("INDEX");
        }
        if (!cursor.accept_keyword("CLUSTERED")) {
            cursor.accept_keyword("NONCLUSTERED");
        }
        if (cursor.peek_name() && cursor.peek_punctuation('(', 1U)) {
            auto index_name = cursor.advance().raw_text;
            if (!constraint_name) {
                constraint_name = std::move(index_name);
            }
        }
        if (!cursor.peek_punctuation('(')) {
            cursor.rewind(start);
            return std::nullopt;
        }
        return UniqueConstraint{std::move(constraint_name), reduce_name_list(cursor, "a unique column")};
    }

    if (cursor.accept_keywords({"FOREIGN", "KEY"})) {
        ForeignKeyConstraint constraint{};
        constraint.constraint_name = std::move(constraint_name);
        if (cursor.peek_name()) {
            cursor.advance();
        }
        constraint.local_columns = reduce_name_list(cursor, "a foreign key column");
        constraint.reference = reduce_references(cursor, constraint.reference_columns);
        return constraint;
    }

    if (cursor.peek_keyword("CHECK") && cursor.peek_punctuation('(', 1U)) {
        cursor.advance();
        CheckConstraint constraint{};
        constraint.constraint_name = std::move(constraint_name);
        const auto inner = cursor.take_parenthesized();
        constraint.expression_tokens.assign(inner.begin(), inner.end());
        constraint.statement = render_tokens(inner);
        return constraint;
    }

    cursor.rewind(start);
    return std::nullopt;
}

PropertyList reduce_property_list(TokenCursor& cursor)
{
    PropertyList properties{};
    const auto inner = cursor.take_parenthesized();
    for (const auto part : split_top_level(inner)) {
        if (part.empty()) {
            continue;
        }
        std::size_t equals = 0U;
        while (equals < part.size()
               && !(part[equals].kind == TokenKind::Operator && part[equals].raw_text == "=")) {
            ++equals;
        }
        const auto key_tokens = part.subspan(0U, equals);
        std::string key = key_tokens.size() == 1U && key_tokens.front().kind == TokenKind::StringLiteral
                              ? key_tokens.front().raw_text
                              : render_tokens(key_tokens);
        std::string value = equals < part.size() ? render_tokens(part.subspan(equals + 1U)) : std::string{};
        properties.emplace_back(std::move(key), std::move(value));
    }
    return properties;
}

std::int64_t reduce_integer(TokenCursor& cursor, std::string_view what)
{
    const auto* token = cursor.peek();
    if (token == nullptr) {
        cursor.fail(ParseErrc::UnexpectedEnd, "Expected " + std::string{what} + " but the statement ended");
    }
    if (token->kind != TokenKind::NumberLiteral) {
        cursor.fail(ParseErrc::UnexpectedToken, "Expected " + std::string{what} + " near '" + token->raw_text + "'");
    }
    const auto value = parse_int64(token->raw_text);
    if (!value) {
        cursor.fail(ParseErrc::InvalidNumber, "'" + token->raw_text + "' is not a valid 64-bit integer");
    }
    cursor.advance();
    return *value;
}

}  // namespace schemer::parser
