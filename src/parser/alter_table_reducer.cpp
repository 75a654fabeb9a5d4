#include "schemer/parser/statement_reducers.hpp"


#include <type_traits>
#include <unordered_map>
#include <utility>

namespace schemer::parser {

namespace {

using AlterActionHandler = void (*)(TokenCursor&, AlterTableStatement&, ParseContext&);

void skip_unknown_action(TokenCursor& cursor, ParseContext& context)
{
    const auto offset = cursor.current_offset();
    const auto text = render_tokens(cursor.take_rest());
    context.warn(ParseErrc::UnknownClause,
                 "Unrecognized ALTER TABLE action '" + text + "' was skipped",
                 offset,
                 {"Supported actions are ADD, DROP COLUMN, RENAME COLUMN, MODIFY and ALTER COLUMN."});
}

AlterAction to_action(TableConstraint constraint)
{
    return std::visit(
        [](auto&& concrete) -> AlterAction {
            using ConstraintType = std::decay_t<decltype(concrete)>;
            if constexpr (std::is_same_v<ConstraintType, PrimaryKeyConstraint>) {
                return AddPrimaryKeyAction{std::move(concrete)};
            } else if constexpr (std::is_same_v<ConstraintType, CheckConstraint>) {
                return AddCheckAction{std::move(concrete)};
            } else if constexpr (std::is_same_v<ConstraintType, UniqueConstraint>) {
                return AddUniqueAction{std::move(concrete)};
            } else {
                return AddForeignKeyAction{std::move(concrete)};
            }
        },
        std::move(constraint));
}

// T-SQL `[CONSTRAINT name] DEFAULT value FOR column`.
bool reduce_default_for(TokenCursor& cursor, AlterTableStatement& statement)
{
    const auto start = cursor.position();
    std::optional<std::string> constraint_name{};
    if (cursor.accept_keyword("CONSTRAINT")) {
        constraint_name = cursor.expect_name("a constraint name");
    }
    if (!cursor.accept_keyword("DEFAULT")) {
        cursor.rewind(start);
        return false;
    }
    const auto value = cursor.take_until([](const Token& token) { return token.is_keyword("FOR"); });
    if (value.empty()) {
        cursor.fail(ParseErrc::UnexpectedToken, "Expected a default value");
    }
    cursor.expect_keyword("FOR");
    SetDefaultAction action{};
    action.constraint_name = std::move(constraint_name);
    action.value = render_tokens(value);
    action.column = cursor.expect_name("a column name");
    statement.actions.emplace_back(std::move(action));
    return true;
}

void reduce_add(TokenCursor& cursor, AlterTableStatement& statement, ParseContext& context)
{
    cursor.advance();
    if (reduce_default_for(cursor, statement)) {
        return;
    }
    if (auto constraint = reduce_table_constraint(cursor)) {
        statement.actions.push_back(to_action(std::move(*constraint)));
        return;
    }

    cursor.accept_keyword("COLUMN");
    cursor.accept_keywords({"IF", "NOT", "EXISTS"});
    if (cursor.peek_punctuation('(')) {
        for (const auto part : split_top_level(cursor.take_parenthesized())) {
            TokenCursor part_cursor{part};
            statement.actions.emplace_back(AddColumnAction{reduce_column_definition(part_cursor, context)});
        }
        return;
    }
    statement.actions.emplace_back(AddColumnAction{reduce_column_definition(cursor, context)});
}

void reduce_drop(TokenCursor& cursor, AlterTableStatement& statement, ParseContext& context)
{
    if (cursor.peek_keyword("CONSTRAINT", 1U) || cursor.peek_keyword("PRIMARY", 1U) || cursor.peek_keyword("FOREIGN", 1U)
        || cursor.peek_keyword("INDEX", 1U) || cursor.peek_keyword("KEY", 1U)) {
        skip_unknown_action(cursor, context);
        return;
    }
    cursor.advance();
    cursor.accept_keyword("COLUMN");
    DropColumnAction action{};
    action.if_exists = cursor.accept_keywords({"IF", "EXISTS"});
    action.column = cursor.expect_name("a column name");
    if (!cursor.accept_keyword("CASCADE")) {
        cursor.accept_keyword("RESTRICT");
    }
    statement.actions.emplace_back(std::move(action));
}

void reduce_rename(TokenCursor& cursor, AlterTableStatement& statement, ParseContext& context)
{
    const auto start = cursor.position();
    cursor.advance();
    cursor.accept_keyword("COLUMN");
    if (cursor.peek_keyword("TO") || !cursor.peek_keyword("TO", 1U)) {
        cursor.rewind(start);
        skip_unknown_action(cursor, context);
        return;
    }
    RenameColumnAction action{};
    action.from = cursor.expect_name("a column name");
    cursor.expect_keyword("TO");
    action.to = cursor.expect_name("a column name");
    statement.actions.emplace_back(std::move(action));
}

void reduce_modify(TokenCursor& cursor, AlterTableStatement& statement, ParseContext& context)
{
    cursor.advance();
    cursor.accept_keyword("COLUMN");
    statement.actions.emplace_back(ModifyColumnAction{reduce_column_definition(cursor, context)});
}

void reduce_alter_column(TokenCursor& cursor, AlterTableStatement& statement, ParseContext& context)
{
    const auto start = cursor.position();
    cursor.advance();
    cursor.accept_keyword("COLUMN");
    auto column = cursor.expect_name("a column name");

    if (cursor.accept_keywords({"SET", "DEFAULT"})) {
        SetDefaultAction action{};
        action.column = std::move(column);
        action.value = render_tokens(take_attribute_expression(cursor));
        statement.actions.emplace_back(std::move(action));
    } else if (cursor.accept_keywords({"DROP", "DEFAULT"})) {
        SetDefaultAction action{};
        action.column = std::move(column);
        statement.actions.emplace_back(std::move(action));
    } else if (cursor.accept_keywords({"SET", "NOT", "NULL"})) {
        statement.actions.emplace_back(SetNullabilityAction{std::move(column), false});
    } else if (cursor.accept_keywords({"DROP", "NOT", "NULL"})) {
        statement.actions.emplace_back(SetNullabilityAction{std::move(column), true});
    } else {
        cursor.rewind(start);
        skip_unknown_action(cursor, context);
    }
}

const std::unordered_map<std::string_view, AlterActionHandler>& alter_action_handlers()
{
    static const std::unordered_map<std::string_view, AlterActionHandler> handlers{
        {"ADD", &reduce_add},
        {"DROP", &reduce_drop},
        {"RENAME", &reduce_rename},
        {"MODIFY", &reduce_modify},
        {"ALTER", &reduce_alter_column},
    };
    return handlers;
}

void reduce_action(TokenCursor& cursor, AlterTableStatement& statement, ParseContext& context)
{
    // T-SQL `WITH CHECK ADD ...` / `WITH NOCHECK ADD ...`
    if (cursor.peek_keyword("WITH") && cursor.peek_name(1U)) {
        cursor.advance();
        cursor.advance();
    }

    const auto* token = cursor.peek();
    const auto& handlers = alter_action_handlers();
    const auto handler = token != nullptr && token->is_word() ? handlers.find(token->normalized_text) : handlers.end();
    if (handler == handlers.end()) {
        skip_unknown_action(cursor, context);
        return;
    }
    handler->second(cursor, statement, context);

    if (!cursor.at_end()) {
        const auto offset = cursor.current_offset();
        const auto text = render_tokens(cursor.take_rest());
        context.warn(ParseErrc::UnknownClause,
                     "Unrecognized text '" + text + "' after ALTER TABLE action was skipped",
                     offset,
                     {"Split combined actions with commas or remove the trailing text."});
    }
}

}  // namespace

AlterTableStatement reduce_alter_table(TokenCursor& cursor, ParseContext& context)
{
    AlterTableStatement statement{};
    cursor.expect_keyword("ALTER");
    cursor.expect_keyword("TABLE");
    statement.if_exists = cursor.accept_keywords({"IF", "EXISTS"});
    statement.only = cursor.accept_keyword("ONLY");

    auto name = reduce_qualified_name(cursor, "a table name");
    statement.schema = std::move(name.schema);
    statement.table_name = std::move(name.name);

    if (cursor.at_end()) {
        cursor.fail(ParseErrc::UnexpectedEnd, "ALTER TABLE " + statement.table_name + " has no action");
    }

    for (const auto part : split_top_level(cursor.take_rest())) {
        if (part.empty()) {
            continue;
        }
        TokenCursor action_cursor{part};
        reduce_action(action_cursor, statement, context);
    }
    return statement;
}

}  // namespace schemer::parser
