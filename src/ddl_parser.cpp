#include "schemer/ddl_parser.hpp"

#include "schemer/parser/grammar.hpp"

#include <chrono>
#include <utility>

namespace schemer {

namespace {

std::size_t count_code(const std::vector<parser::ParserDiagnostic>& diagnostics, parser::ParseErrc code)
{
    std::size_t count = 0U;
    for (const auto& diagnostic : diagnostics) {
        if (diagnostic.code == code) {
            ++count;
        }
    }
    return count;
}

void record_telemetry(parser::ParserTelemetry& telemetry,
                      const DdlParseOutput& output,
                      std::size_t statements_succeeded,
                      std::chrono::steady_clock::duration elapsed)
{
    parser::ParseSample sample{};
    sample.success = !output.failed;
    sample.lex_failed = output.lex_failed;
    sample.duration_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
    sample.statements_attempted = output.statements;
    sample.statements_succeeded = statements_succeeded;
    sample.records = output.records.size();
    sample.unknown_clauses = count_code(output.diagnostics, parser::ParseErrc::UnknownClause);
    sample.unresolved_targets = count_code(output.diagnostics, parser::ParseErrc::UnresolvedAlterTarget)
                                + count_code(output.diagnostics, parser::ParseErrc::UnresolvedIndexTarget);

    const auto counters = parser::tally_diagnostics(output.diagnostics);
    sample.info_diagnostics = counters.info;
    sample.warning_diagnostics = counters.warning;
    sample.error_diagnostics = counters.error;
    telemetry.record_script_result(sample);
}

}  // namespace

DdlParseOutput parse(std::string_view ddl_text, const ParseOptions& options)
{
    const auto started = std::chrono::steady_clock::now();
    if (options.telemetry != nullptr) {
        options.telemetry->record_script_attempt();
    }

    DdlParseOutput output{};
    auto script = parser::parse_ddl_script(ddl_text);
    output.lex_failed = script.lex_failed;
    output.statements = script.statements.size();

    output.diagnostics = std::move(script.diagnostics);

    std::size_t statements_succeeded = 0U;
    parser::RecordAssembler assembler{ddl_text};
    for (auto& statement : script.statements) {
        if (statement.success) {
            ++statements_succeeded;
        }
        assembler.add(statement);
        for (auto& diagnostic : statement.diagnostics) {
            output.diagnostics.push_back(std::move(diagnostic));
        }
    }

    output.statement_records = assembler.finish();
    const output::OutputNormalizer normalizer{options.output_mode};
    output.records = normalizer.normalize_all(output.statement_records);
    if (options.group_by_type) {
        output.grouped = normalizer.group_records(output.statement_records);
    }
    output.failed = output.lex_failed || parser::has_error(output.diagnostics);

    if (options.telemetry != nullptr) {
        record_telemetry(*options.telemetry, output, statements_succeeded, std::chrono::steady_clock::now() - started);
    }
    return output;
}

}  // namespace schemer
