#pragma once

#include "schemer/parser/ast.hpp"
#include "schemer/parser/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace schemer::parser {

enum class StatementType : std::uint8_t {
    Unknown = 0,
    CreateTable,
    AlterTable,
    CreateIndex,
    CreateSequence
};

using StatementAst = std::variant<std::monostate,
                                  CreateTableStatement,
                                  AlterTableStatement,
                                  CreateIndexStatement,
                                  CreateSequenceStatement>;

struct ScriptStatement final {
    StatementType type = StatementType::Unknown;
    std::size_t index = 0U;
    std::size_t offset = 0U;
    std::string text{};
    StatementAst ast{};
    std::vector<ParserDiagnostic> diagnostics{};
    bool success = false;
};

/// `lex_failed` is set when tokenization aborted the whole call; `statements`
/// is then empty and `diagnostics` holds the lexical error.
struct ScriptParseResult final {
    std::vector<ScriptStatement> statements{};
    std::vector<ParserDiagnostic> diagnostics{};
    bool lex_failed = false;
};

[[nodiscard]] std::string_view statement_type_name(StatementType type) noexcept;

ParseResult<CreateTableStatement> parse_create_table(std::string_view input);
ParseResult<AlterTableStatement> parse_alter_table(std::string_view input);
ParseResult<CreateIndexStatement> parse_create_index(std::string_view input);
ParseResult<CreateSequenceStatement> parse_create_sequence(std::string_view input);

ScriptParseResult parse_ddl_script(std::string_view input);

}  // namespace schemer::parser
