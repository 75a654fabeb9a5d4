#pragma once

#include "schemer/parser/ast.hpp"
#include "schemer/parser/parse_context.hpp"
#include "schemer/parser/token_cursor.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace schemer::parser {

struct QualifiedName final {
    std::optional<std::string> schema{};
    std::string name{};
};

/// Statement reducers. Each consumes the whole statement span from its leading
/// CREATE/ALTER keyword, reports recoverable problems through `context` and
/// throws StatementError when the statement cannot be completed.
CreateTableStatement reduce_create_table(TokenCursor& cursor, ParseContext& context);
AlterTableStatement reduce_alter_table(TokenCursor& cursor, ParseContext& context);
CreateIndexStatement reduce_create_index(TokenCursor& cursor, ParseContext& context);
CreateSequenceStatement reduce_create_sequence(TokenCursor& cursor, ParseContext& context);

// Clause reducers shared between statement kinds.
QualifiedName reduce_qualified_name(TokenCursor& cursor, std::string_view what);
std::vector<std::string> reduce_name_list(TokenCursor& cursor, std::string_view what);
ColumnDefinition reduce_column_definition(TokenCursor& cursor, ParseContext& context);
ForeignKeyRef reduce_references(TokenCursor& cursor, std::vector<std::string>& reference_columns);

/// Parses `[CONSTRAINT name] PRIMARY KEY|UNIQUE|FOREIGN KEY|CHECK ...`.
/// Returns nothing and leaves the cursor untouched when the span does not
/// start with a table constraint.
std::optional<TableConstraint> reduce_table_constraint(TokenCursor& cursor);

/// Consumes `expr` up to the next column-attribute keyword at depth zero.
/// The first token is always taken so that `DEFAULT NULL` keeps its value.
std::span<const Token> take_attribute_expression(TokenCursor& cursor);

/// `(k = v, ...)` property lists used by TBLPROPERTIES and WITH.
PropertyList reduce_property_list(TokenCursor& cursor);

std::int64_t reduce_integer(TokenCursor& cursor, std::string_view what);

}  // namespace schemer::parser
