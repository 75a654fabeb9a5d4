#pragma once

#include "schemer/output/output_normalizer.hpp"
#include "schemer/parser/diagnostics.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace schemer::tools {

/// One processed input as reported on the JSON Lines log.
struct ParseLogEntry final {
    std::string source{};
    output::OutputMode output_mode = output::OutputMode::Sql;
    bool success = false;
    std::size_t statements = 0U;
    std::size_t records = 0U;
    double duration_ms = 0.0;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
    std::vector<parser::ParserDiagnostic> diagnostics{};
};

[[nodiscard]] std::string format_parse_log_json(const ParseLogEntry& entry);

}  // namespace schemer::tools
