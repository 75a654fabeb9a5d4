#include "schemer/parser/statement_builders.hpp"
#include "schemer/parser/statement_reducers.hpp"

#include "schemer/parser/keyword_table.hpp"
#include "schemer/parser/text_utils.hpp"

#include <unordered_map>
#include <utility>

namespace schemer::parser {

namespace {

using TableClauseHandler = void (*)(TokenCursor&, TableBuilder&, ParseContext&);

bool is_table_clause(const Token& token) noexcept
{
    return token.is_word() && has_keyword_role(token.normalized_text, KeywordRole::TableClause);
}

std::string render_next(TokenCursor& cursor)
{
    return render_token(cursor.advance());
}

std::string qualified_text(const QualifiedName& name)
{
    return name.schema ? *name.schema + "." + name.name : name.name;
}

void warn_trailing(TokenCursor& cursor, ParseContext& context, std::string_view what)
{
    if (cursor.at_end()) {
        return;
    }
    const auto offset = cursor.current_offset();
    const auto text = render_tokens(cursor.take_rest());
    context.warn(ParseErrc::UnknownClause,
                 "Unrecognized text '" + text + "' after " + std::string{what} + " was skipped",
                 offset,
                 {"Remove the trailing text or move it into a supported clause."});
}

void skip_unknown_clause(TokenCursor& cursor, ParseContext& context)
{
    const auto offset = cursor.current_offset();
    const auto start = cursor.position();
    cursor.advance();
    (void)cursor.take_until(is_table_clause);
    const auto text = render_tokens(cursor.consumed_since(start));
    context.warn(ParseErrc::UnknownClause,
                 "Unrecognized table clause '" + text + "' was skipped",
                 offset,
                 {"The clause is not part of the supported dialects; it has no effect on the output."});
}

TableLike reduce_like_target(TokenCursor& cursor)
{
    auto name = reduce_qualified_name(cursor, "a table name");
    return TableLike{std::move(name.schema), std::move(name.name)};
}

// MySQL `KEY name (cols)` / `INDEX name (cols)`; a column called `key` is
// followed by its type instead.
bool starts_inline_index(const TokenCursor& cursor) noexcept
{
    if (!cursor.peek_keyword("KEY") && !cursor.peek_keyword("INDEX")) {
        return false;
    }
    if (cursor.peek_punctuation('(', 1U)) {
        return true;
    }
    const auto* name = cursor.peek(1U);
    return name != nullptr && name->is_name() && classify_keyword(name->normalized_text) != KeywordCategory::TypeName
           && cursor.peek_punctuation('(', 2U);
}

void reduce_table_element(TokenCursor& cursor, TableBuilder& builder, ParseContext& context)
{
    const auto offset = cursor.current_offset();
    if (auto constraint = reduce_table_constraint(cursor)) {
        builder.add_constraint(std::move(*constraint), offset);
        warn_trailing(cursor, context, "table constraint");
        return;
    }

    if (starts_inline_index(cursor)) {
        cursor.advance();
        IndexDefinition index{};
        if (!cursor.peek_punctuation('(')) {
            index.index_name = cursor.advance().raw_text;
        }
        for (auto& name : reduce_name_list(cursor, "an index column")) {
            index.columns.push_back(IndexColumn{std::move(name)});
        }
        builder.add_index(std::move(index));
        warn_trailing(cursor, context, "index definition");
        return;
    }

    if (cursor.peek_keyword("LIKE") && cursor.peek_name(1U)) {
        cursor.advance();
        builder.table().like = reduce_like_target(cursor);
        warn_trailing(cursor, context, "LIKE");
        return;
    }

    builder.add_column(reduce_column_definition(cursor, context));
}

void reduce_column_list(TokenCursor& cursor, TableBuilder& builder, ParseContext& context)
{
    const auto list_offset = cursor.current_offset();
    const auto entries = split_top_level(cursor.take_parenthesized());
    for (const auto entry : entries) {
        if (entry.empty()) {
            context.warn(ParseErrc::UnexpectedToken,
                         "Empty entry in column list was skipped",
                         list_offset,
                         {"Remove the stray comma from the column list."});
            continue;
        }
        TokenCursor entry_cursor{entry};
        reduce_table_element(entry_cursor, builder, context);
    }
}

void reduce_partitioned_by(TokenCursor& cursor, TableBuilder& builder, ParseContext& context)
{
    cursor.advance();
    cursor.expect_keyword("BY");
    for (const auto part : split_top_level(cursor.take_parenthesized())) {
        if (part.empty()) {
            continue;
        }
        TokenCursor part_cursor{part};
        builder.table().partitioned_by.push_back(reduce_column_definition(part_cursor, context));
    }
}

void reduce_partition_by(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    cursor.expect_keyword("BY");
    PartitionBy partition{};
    if (!cursor.peek_punctuation('(')) {
        partition.type = uppercase_copy(cursor.expect_name("a partitioning method"));
        cursor.accept_keyword("COLUMNS");
    }
    partition.columns = reduce_name_list(cursor, "a partition column");
    if (cursor.accept_keyword("PARTITIONS")) {
        (void)reduce_integer(cursor, "a partition count");
    }
    if (cursor.peek_punctuation('(')) {
        (void)cursor.take_parenthesized();
    }
    builder.table().partition_by = std::move(partition);
}

void reduce_clustered_by(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    cursor.expect_keyword("BY");
    auto& hql = builder.table().hql;
    hql.clustered_by = reduce_name_list(cursor, "a bucketing column");
    if (cursor.accept_keywords({"SORTED", "BY"})) {
        (void)cursor.take_parenthesized();
    }
    if (cursor.accept_keyword("INTO")) {
        hql.into_buckets = reduce_integer(cursor, "a bucket count");
        cursor.expect_keyword("BUCKETS");
    }
}

void reduce_row_format(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    cursor.expect_keyword("FORMAT");
    auto& hql = builder.table().hql;

    if (cursor.accept_keyword("SERDE")) {
        hql.row_format = "SERDE";
        hql.serde = render_next(cursor);
        if (cursor.accept_keywords({"WITH", "SERDEPROPERTIES"})) {
            (void)reduce_property_list(cursor);
        }
        return;
    }

    cursor.expect_keyword("DELIMITED");
    hql.row_format = "DELIMITED";
    while (!cursor.at_end()) {
        if (cursor.accept_keywords({"FIELDS", "TERMINATED", "BY"})) {
            hql.fields_terminated_by = render_next(cursor);
            if (cursor.accept_keywords({"ESCAPED", "BY"})) {
                cursor.advance();
            }
        } else if (cursor.accept_keywords({"COLLECTION", "ITEMS", "TERMINATED", "BY"})) {
            hql.collection_items_terminated_by = render_next(cursor);
        } else if (cursor.accept_keywords({"MAP", "KEYS", "TERMINATED", "BY"})) {
            hql.map_keys_terminated_by = render_next(cursor);
        } else if (cursor.accept_keywords({"LINES", "TERMINATED", "BY"})) {
            hql.lines_terminated_by = render_next(cursor);
        } else if (cursor.accept_keywords({"NULL", "DEFINED", "AS"})) {
            cursor.advance();
        } else {
            break;
        }
    }
}

void reduce_stored(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    auto& hql = builder.table().hql;
    if (cursor.accept_keyword("BY")) {
        hql.stored_as = render_next(cursor);
        return;
    }
    cursor.expect_keyword("AS");
    if (cursor.peek_keyword("INPUTFORMAT")) {
        const auto start = cursor.position();
        cursor.advance();
        cursor.advance();
        cursor.expect_keyword("OUTPUTFORMAT");
        cursor.advance();
        hql.stored_as = render_tokens(cursor.consumed_since(start));
        return;
    }
    hql.stored_as = cursor.expect_name("a storage format");
}

void reduce_location(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    builder.table().hql.location = render_next(cursor);
}

void reduce_table_comment(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    cursor.accept_operator("=");
    builder.table().comment = render_next(cursor);
}

void reduce_tblproperties(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    auto properties = reduce_property_list(cursor);
    auto& target = builder.table().hql.tblproperties;
    target.insert(target.end(), properties.begin(), properties.end());
}

void reduce_tablespace(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    builder.table().tablespace = cursor.expect_name("a tablespace name");
}

void add_table_option(TokenCursor& cursor, TableBuilder& builder, std::string key)
{
    cursor.accept_operator("=");
    builder.table().table_properties.emplace_back(std::move(key), render_next(cursor));
}

void reduce_engine(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    add_table_option(cursor, builder, "engine");
}

void reduce_charset(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    if (cursor.accept_keywords({"CHARACTER", "SET"})) {
        add_table_option(cursor, builder, "charset");
        return;
    }
    cursor.advance();
    add_table_option(cursor, builder, "charset");
}

void reduce_collate(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    add_table_option(cursor, builder, "collate");
}

void reduce_auto_increment(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    add_table_option(cursor, builder, "auto_increment");
}

void reduce_default_option(TokenCursor& cursor, TableBuilder& builder, ParseContext& context)
{
    if (cursor.peek_keyword("CHARSET", 1U) || cursor.peek_keywords({"DEFAULT", "CHARACTER", "SET"})) {
        cursor.advance();
        reduce_charset(cursor, builder, context);
    } else if (cursor.peek_keyword("COLLATE", 1U)) {
        cursor.advance();
        reduce_collate(cursor, builder, context);
    } else {
        skip_unknown_clause(cursor, context);
    }
}

void reduce_with(TokenCursor& cursor, TableBuilder& builder, ParseContext& context)
{
    if (!cursor.peek_punctuation('(', 1U)) {
        skip_unknown_clause(cursor, context);
        return;
    }
    cursor.advance();
    auto properties = reduce_property_list(cursor);
    auto& target = builder.table().table_properties;
    target.insert(target.end(), properties.begin(), properties.end());
}

void reduce_inherits(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    for (const auto part : split_top_level(cursor.take_parenthesized())) {
        TokenCursor part_cursor{part};
        builder.table().inherits.push_back(qualified_text(reduce_qualified_name(part_cursor, "a parent table")));
    }
}

void reduce_like(TokenCursor& cursor, TableBuilder& builder, ParseContext&)
{
    cursor.advance();
    builder.table().like = reduce_like_target(cursor);
}

const std::unordered_map<std::string_view, TableClauseHandler>& table_clause_handlers()
{
    static const std::unordered_map<std::string_view, TableClauseHandler> handlers{
        {"PARTITIONED", &reduce_partitioned_by},
        {"PARTITION", &reduce_partition_by},
        {"CLUSTERED", &reduce_clustered_by},
        {"ROW", &reduce_row_format},
        {"STORED", &reduce_stored},
        {"LOCATION", &reduce_location},
        {"COMMENT", &reduce_table_comment},
        {"TBLPROPERTIES", &reduce_tblproperties},
        {"TABLESPACE", &reduce_tablespace},
        {"ENGINE", &reduce_engine},
        {"CHARSET", &reduce_charset},
        {"CHARACTER", &reduce_charset},
        {"COLLATE", &reduce_collate},
        {"AUTO_INCREMENT", &reduce_auto_increment},
        {"DEFAULT", &reduce_default_option},
        {"WITH", &reduce_with},
        {"INHERITS", &reduce_inherits},
        {"LIKE", &reduce_like},
    };
    return handlers;
}

void reduce_table_clauses(TokenCursor& cursor, TableBuilder& builder, ParseContext& context)
{
    const auto& handlers = table_clause_handlers();
    while (const auto* token = cursor.peek()) {
        if (token->is_punctuation(',')) {
            cursor.advance();
            continue;
        }
        const auto handler = token->is_word() ? handlers.find(token->normalized_text) : handlers.end();
        if (handler == handlers.end()) {
            skip_unknown_clause(cursor, context);
            continue;
        }
        handler->second(cursor, builder, context);
    }
}

}  // namespace

CreateTableStatement reduce_create_table(TokenCursor& cursor, ParseContext& context)
{
    TableBuilder builder{};
    auto& table = builder.table();

    cursor.expect_keyword("CREATE");
    table.replace = cursor.accept_keywords({"OR", "REPLACE"});
    if (!cursor.accept_keyword("GLOBAL")) {
        cursor.accept_keyword("LOCAL");
    }
    table.temp = cursor.accept_keyword("TEMPORARY") || cursor.accept_keyword("TEMP");
    table.hql.external = cursor.accept_keyword("EXTERNAL");
    cursor.expect_keyword("TABLE");
    table.if_not_exists = cursor.accept_keywords({"IF", "NOT", "EXISTS"});

    auto name = reduce_qualified_name(cursor, "a table name");
    table.schema = std::move(name.schema);
    table.table_name = std::move(name.name);

    if (cursor.accept_keyword("LIKE")) {
        table.like = reduce_like_target(cursor);
    } else if (cursor.peek_punctuation('(')) {
        reduce_column_list(cursor, builder, context);
    } else {
        cursor.fail(ParseErrc::MissingColumnList, "CREATE TABLE " + table.table_name + " has no column list");
    }

    reduce_table_clauses(cursor, builder, context);
    return builder.finish(context);
}

}  // namespace schemer::parser
