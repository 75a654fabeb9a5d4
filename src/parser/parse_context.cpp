#include "schemer/parser/parse_context.hpp"

#include <utility>

namespace schemer::parser {

void ParseContext::warn(ParseErrc code, std::string message, std::size_t offset, std::vector<std::string> hints)
{
    diagnostics_.push_back(make_diagnostic(ParserSeverity::Warning, code, std::move(message), offset, std::move(hints)));
}

ParserDiagnostic ParseContext::make_diagnostic(ParserSeverity severity,
                                               ParseErrc code,
                                               std::string message,
                                               std::size_t offset,
                                               std::vector<std::string> hints) const
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = severity;
    diagnostic.code = make_error_code(code);
    diagnostic.message = std::move(message);
    diagnostic.offset = offset;
    const auto position = locate_offset(source_, offset);
    diagnostic.line = position.line;
    diagnostic.column = position.column;
    diagnostic.remediation_hints = std::move(hints);
    return diagnostic;
}

std::vector<ParserDiagnostic> ParseContext::take_diagnostics() noexcept
{
    return std::exchange(diagnostics_, {});
}

}  // namespace schemer::parser
