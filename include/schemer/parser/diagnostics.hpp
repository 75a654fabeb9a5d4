#pragma once

#include "schemer/parser/parse_errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace schemer::parser {

enum class ParserSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct ParserDiagnostic final {
    ParserSeverity severity = ParserSeverity::Error;
    std::error_code code{};
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::size_t offset = 0U;
    std::optional<std::size_t> statement_index{};
    std::string statement{};
    std::vector<std::string> remediation_hints{};
};

template <typename T>
struct ParseResult final {
    std::optional<T> ast{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return ast.has_value(); }
};

struct SourcePosition final {
    std::size_t line = 1U;
    std::size_t column = 1U;
};

/// Converts a byte offset into a one-based line/column pair. Offsets past the
/// end of the source clamp to the position just after the last character.
[[nodiscard]] SourcePosition locate_offset(std::string_view source, std::size_t offset) noexcept;

[[nodiscard]] std::string_view severity_to_string(ParserSeverity severity) noexcept;

[[nodiscard]] std::string format_diagnostic(const ParserDiagnostic& diagnostic);

[[nodiscard]] bool has_error(const std::vector<ParserDiagnostic>& diagnostics) noexcept;

struct SeverityCounters final {
    std::size_t info = 0U;
    std::size_t warning = 0U;
    std::size_t error = 0U;
};

[[nodiscard]] SeverityCounters tally_diagnostics(const std::vector<ParserDiagnostic>& diagnostics) noexcept;

}  // namespace schemer::parser
