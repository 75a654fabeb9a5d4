#include "schemer/parser/statement_builders.hpp"
#include "schemer/parser/statement_reducers.hpp"

#include "schemer/parser/keyword_table.hpp"
#include "schemer/parser/text_utils.hpp"
#include "schemer/parser/type_grammar.hpp"

#include <unordered_map>
#include <utility>

namespace schemer::parser {

namespace {

bool is_index_column_modifier(const Token& token) noexcept
{
    return token.is_keyword("ASC") || token.is_keyword("DESC") || token.is_keyword("NULLS")
           || token.is_keyword("COLLATE");
}

IndexColumn reduce_index_column(TokenCursor& cursor)
{
    IndexColumn column{};
    const auto expression = cursor.take_until(is_index_column_modifier);
    if (expression.empty()) {
        cursor.fail(ParseErrc::UnexpectedToken, "Expected an index column");
    }
    column.name = expression.size() == 1U && expression.front().is_name() ? expression.front().raw_text
                                                                          : render_tokens(expression);

    while (!cursor.at_end()) {
        if (cursor.accept_keyword("ASC")) {
            column.order = "ASC";
        } else if (cursor.accept_keyword("DESC")) {
            column.order = "DESC";
        } else if (cursor.accept_keyword("NULLS")) {
            column.nulls = uppercase_copy(cursor.expect_name("FIRST or LAST"));
        } else if (cursor.accept_keyword("COLLATE")) {
            (void)cursor.advance();
        } else {
            cursor.fail(ParseErrc::UnexpectedToken, "Unexpected '" + cursor.peek()->raw_text + "' in index column");
        }
    }
    return column;
}

using SequenceOptionHandler = void (*)(TokenCursor&, SequenceBuilder&, ParseContext&);

bool is_sequence_option(const Token& token) noexcept
{
    return token.is_word() && has_keyword_role(token.normalized_text, KeywordRole::SequenceOption);
}

void set_number(TokenCursor& cursor, SequenceBuilder& builder, ParseContext& context, SequenceOption option)
{
    const auto offset = cursor.current_offset();
    builder.set(option, reduce_integer(cursor, "an integer value"), offset, context);
}

void reduce_as(TokenCursor& cursor, SequenceBuilder& builder, ParseContext&)
{
    cursor.advance();
    TypeParser parser{cursor};
    builder.sequence().data_type = canonical_type_string(parser.parse());
}

void reduce_increment(TokenCursor& cursor, SequenceBuilder& builder, ParseContext& context)
{
    cursor.advance();
    cursor.accept_keyword("BY");
    set_number(cursor, builder, context, SequenceOption::Increment);
}

void reduce_start(TokenCursor& cursor, SequenceBuilder& builder, ParseContext& context)
{
    cursor.advance();
    cursor.accept_keyword("WITH");
    set_number(cursor, builder, context, SequenceOption::Start);
}

void reduce_minvalue(TokenCursor& cursor, SequenceBuilder& builder, ParseContext& context)
{
    cursor.advance();
    set_number(cursor, builder, context, SequenceOption::MinValue);
}

void reduce_maxvalue(TokenCursor& cursor, SequenceBuilder& builder, ParseContext& context)
{
    cursor.advance();
    set_number(cursor, builder, context, SequenceOption::MaxValue);
}

void reduce_cache(TokenCursor& cursor, SequenceBuilder& builder, ParseContext& context)
{
    cursor.advance();
    set_number(cursor, builder, context, SequenceOption::Cache);
}

void reduce_cycle(TokenCursor& cursor, SequenceBuilder& builder, ParseContext&)
{
    cursor.advance();
    builder.sequence().cycle = true;
}

void skip_unknown_option(TokenCursor& cursor, ParseContext& context)
{
    const auto offset = cursor.current_offset();
    const auto start = cursor.position();
    cursor.advance();
    (void)cursor.take_until(is_sequence_option);
    const auto text = render_tokens(cursor.consumed_since(start));
    context.warn(ParseErrc::UnknownClause,
                 "Unrecognized sequence option '" + text + "' was skipped",
                 offset,
                 {"Supported options are AS, INCREMENT, START, MINVALUE, MAXVALUE, CACHE, CYCLE and OWNED BY."});
}

void reduce_no(TokenCursor& cursor, SequenceBuilder& builder, ParseContext& context)
{
    if (cursor.accept_keywords({"NO", "MINVALUE"})) {
        builder.clear(SequenceOption::MinValue);
    } else if (cursor.accept_keywords({"NO", "MAXVALUE"})) {
        builder.clear(SequenceOption::MaxValue);
    } else if (cursor.accept_keywords({"NO", "CYCLE"})) {
        builder.sequence().cycle = false;
    } else {
        skip_unknown_option(cursor, context);
    }
}

void reduce_owned_by(TokenCursor& cursor, SequenceBuilder& builder, ParseContext&)
{
    cursor.advance();
    cursor.expect_keyword("BY");
    const auto owner = cursor.take_until(is_sequence_option);
    if (owner.empty()) {
        cursor.fail(ParseErrc::UnexpectedToken, "Expected a column or NONE after OWNED BY");
    }
    builder.sequence().owned_by = render_tokens(owner);
}

const std::unordered_map<std::string_view, SequenceOptionHandler>& sequence_option_handlers()
{
    static const std::unordered_map<std::string_view, SequenceOptionHandler> handlers{
        {"AS", &reduce_as},
        {"INCREMENT", &reduce_increment},
        {"START", &reduce_start},
        {"MINVALUE", &reduce_minvalue},
        {"MAXVALUE", &reduce_maxvalue},
        {"CACHE", &reduce_cache},
        {"CYCLE", &reduce_cycle},
        {"NO", &reduce_no},
        {"OWNED", &reduce_owned_by},
    };
    return handlers;
}

}  // namespace

CreateIndexStatement reduce_create_index(TokenCursor& cursor, ParseContext& context)
{
    CreateIndexStatement statement{};
    auto& index = statement.index;

    cursor.expect_keyword("CREATE");
    index.unique = cursor.accept_keyword("UNIQUE");
    if (!cursor.accept_keyword("CLUSTERED")) {
        cursor.accept_keyword("NONCLUSTERED");
    }
    cursor.expect_keyword("INDEX");
    statement.concurrently = cursor.accept_keyword("CONCURRENTLY");
    statement.if_not_exists = cursor.accept_keywords({"IF", "NOT", "EXISTS"});
    if (!cursor.peek_keyword("ON")) {
        index.index_name = reduce_qualified_name(cursor, "an index name").name;
    }

    cursor.expect_keyword("ON");
    cursor.accept_keyword("ONLY");
    auto target = reduce_qualified_name(cursor, "a table name");
    statement.schema = std::move(target.schema);
    statement.table_name = std::move(target.name);
    if (cursor.accept_keyword("USING")) {
        (void)cursor.expect_name("an index method");
    }

    for (const auto part : split_top_level(cursor.take_parenthesized())) {
        TokenCursor column_cursor{part};
        index.columns.push_back(reduce_index_column(column_cursor));
    }

    if (!cursor.at_end()) {
        const auto offset = cursor.current_offset();
        const auto text = render_tokens(cursor.take_rest());
        context.warn(ParseErrc::UnknownClause,
                     "Unrecognized index clause '" + text + "' was skipped",
                     offset,
                     {"INCLUDE, WHERE and storage options of CREATE INDEX are not represented in the output."});
    }
    return statement;
}

CreateSequenceStatement reduce_create_sequence(TokenCursor& cursor, ParseContext& context)
{
    SequenceBuilder builder{};
    auto& sequence = builder.sequence();

    cursor.expect_keyword("CREATE");
    cursor.accept_keywords({"OR", "REPLACE"});
    if (!cursor.accept_keyword("TEMPORARY")) {
        cursor.accept_keyword("TEMP");
    }
    cursor.expect_keyword("SEQUENCE");
    sequence.if_not_exists = cursor.accept_keywords({"IF", "NOT", "EXISTS"});
    auto name = reduce_qualified_name(cursor, "a sequence name");
    sequence.schema = std::move(name.schema);
    sequence.sequence_name = std::move(name.name);

    const auto& handlers = sequence_option_handlers();
    while (const auto* token = cursor.peek()) {
        if (token->is_punctuation(',')) {
            cursor.advance();
            continue;
        }
        const auto handler = token->is_word() ? handlers.find(token->normalized_text) : handlers.end();
        if (handler == handlers.end()) {
            skip_unknown_option(cursor, context);
            continue;
        }
        handler->second(cursor, builder, context);
    }
    return builder.finish();
}

}  // namespace schemer::parser
