#pragma once

#include "schemer/output/output_normalizer.hpp"
#include "schemer/output/value.hpp"
#include "schemer/parser/diagnostics.hpp"
#include "schemer/parser/parser_telemetry.hpp"
#include "schemer/parser/statement_builders.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace schemer {

struct ParseOptions final {
    output::OutputMode output_mode = output::OutputMode::Sql;
    parser::ParserTelemetry* telemetry = nullptr;
    bool group_by_type = false;
};

/// Result of one parse call. `records` holds the normalized output in source
/// order; `statement_records` holds the same records before normalization.
/// `grouped` is filled only when `ParseOptions::group_by_type` is set.
/// `failed` is set when any statement (or the whole input, on a lexical
/// error) produced an Error diagnostic.
struct DdlParseOutput final {
    std::vector<output::Value> records{};
    std::vector<parser::StatementRecord> statement_records{};
    output::Value grouped{};
    std::vector<parser::ParserDiagnostic> diagnostics{};
    std::size_t statements = 0U;
    bool lex_failed = false;
    bool failed = false;

    [[nodiscard]] bool success() const noexcept { return !failed; }
};

/// Parses every statement in `ddl_text`. Independent calls share no state and
/// may run concurrently.
DdlParseOutput parse(std::string_view ddl_text, const ParseOptions& options = {});

}  // namespace schemer
