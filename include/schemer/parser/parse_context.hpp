#pragma once

#include "schemer/parser/diagnostics.hpp"
#include "schemer/parser/parse_errors.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace schemer::parser {

/// Per-call parse state. Created by each entry point, passed by reference
/// through the reducers and builders, and never stored beyond the call.
class ParseContext final {
public:
    explicit ParseContext(std::string_view source) noexcept : source_{source} {}

    [[nodiscard]] std::string_view source() const noexcept { return source_; }

    void warn(ParseErrc code, std::string message, std::size_t offset, std::vector<std::string> hints = {});
    [[nodiscard]] ParserDiagnostic make_diagnostic(ParserSeverity severity,
                                                   ParseErrc code,
                                                   std::string message,
                                                   std::size_t offset,
                                                   std::vector<std::string> hints = {}) const;

    [[nodiscard]] const std::vector<ParserDiagnostic>& diagnostics() const noexcept { return diagnostics_; }
    std::vector<ParserDiagnostic> take_diagnostics() noexcept;

private:
    std::string_view source_{};
    std::vector<ParserDiagnostic> diagnostics_{};
};

}  // namespace schemer::parser
