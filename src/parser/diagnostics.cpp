#include "schemer/parser/diagnostics.hpp"

#include <algorithm>

namespace schemer::parser {

namespace {

std::string format_location(const ParserDiagnostic& diagnostic)
{
    if (!diagnostic.statement_index && diagnostic.line == 0U && diagnostic.column == 0U) {
        return {};
    }

    std::string location = " (";
    bool written = false;
    if (diagnostic.statement_index) {
        location.append("statement ");
        location.append(std::to_string(*diagnostic.statement_index));
        written = true;
    }
    if (diagnostic.line > 0U) {
        if (written) {
            location.append(", ");
        }
        location.append("line ");
        location.append(std::to_string(diagnostic.line));
        written = true;
    }
    if (diagnostic.column > 0U) {
        if (written) {
            location.append(", ");
        }
        location.append("column ");
        location.append(std::to_string(diagnostic.column));
    }
    location.push_back(')');
    return location;
}

}  // namespace

SourcePosition locate_offset(std::string_view source, std::size_t offset) noexcept
{
    SourcePosition position{};
    const auto limit = std::min(offset, source.size());
    for (std::size_t index = 0U; index < limit; ++index) {
        if (source[index] == '\n') {
            ++position.line;
            position.column = 1U;
        } else {
            ++position.column;
        }
    }
    return position;
}

std::string_view severity_to_string(ParserSeverity severity) noexcept
{
    switch (severity) {
    case ParserSeverity::Info:
        return "info";
    case ParserSeverity::Warning:
        return "warning";
    case ParserSeverity::Error:
    default:
        return "error";
    }
}

std::string format_diagnostic(const ParserDiagnostic& diagnostic)
{
    std::string text{severity_to_string(diagnostic.severity)};
    text.append(": ");
    text.append(diagnostic.message);
    text.append(format_location(diagnostic));
    return text;
}

bool has_error(const std::vector<ParserDiagnostic>& diagnostics) noexcept
{
    return std::any_of(diagnostics.begin(), diagnostics.end(), [](const ParserDiagnostic& diagnostic) {
        return diagnostic.severity == ParserSeverity::Error;
    });
}

SeverityCounters tally_diagnostics(const std::vector<ParserDiagnostic>& diagnostics) noexcept
{
    SeverityCounters counters{};
    for (const auto& diagnostic : diagnostics) {
        switch (diagnostic.severity) {
            case ParserSeverity::Info:
                ++counters.info;
                break;
            case ParserSeverity::Warning:
                ++counters.warning;
                break;
            case ParserSeverity::Error:
            default:
                ++counters.error;
                break;
        }
    }
    return counters;
}

}  // namespace schemer::parser
