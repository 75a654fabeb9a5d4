#include "schemer/tools/parse_log_formatter.hpp"

#include "schemer/output/json_writer.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace {

using schemer::output::append_json_string;

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &time_value);
#else
    gmtime_r(&time_value, &buffer);
#endif

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

}  // namespace

namespace schemer::tools {

std::string format_parse_log_json(const ParseLogEntry& entry)
{
    std::string json;
    json.reserve(512U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_string_field = [&](const char* name, std::string_view value) {
        append_field(name);
        append_json_string(json, value);
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    auto append_timestamp_field = [&](const char* name, std::chrono::system_clock::time_point tp) {
        append_field(name);
        const auto text = format_timestamp_iso(tp);
        if (text.empty()) {
            json.append("null");
        } else {
            append_json_string(json, text);
        }
    };

    append_string_field("source", entry.source);
    append_string_field("output_mode", output::output_mode_name(entry.output_mode));
    append_field("success");
    json.append(entry.success ? "true" : "false");
    append_number_field("statements", entry.statements);
    append_number_field("records", entry.records);
    append_number_field("duration_ms", entry.duration_ms);
    append_timestamp_field("started_at", entry.started_at);
    append_timestamp_field("finished_at", entry.finished_at);

    append_field("diagnostics");
    json.push_back('[');
    for (std::size_t i = 0; i < entry.diagnostics.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& diagnostic = entry.diagnostics[i];
        json.push_back('{');
        bool diag_first = true;
        auto append_diag_field = [&](const char* name) {
            if (!diag_first) {
                json.push_back(',');
            }
            diag_first = false;
            json.push_back('"');
            json.append(name);
            json.push_back('"');
            json.push_back(':');
        };

        append_diag_field("severity");
        append_json_string(json, parser::severity_to_string(diagnostic.severity));
        append_diag_field("code");
        append_json_string(json, diagnostic.code.message());
        append_diag_field("message");
        append_json_string(json, diagnostic.message);
        append_diag_field("line");
        json.append(std::to_string(diagnostic.line));
        append_diag_field("column");
        json.append(std::to_string(diagnostic.column));
        append_diag_field("statement_index");
        if (diagnostic.statement_index) {
            json.append(std::to_string(*diagnostic.statement_index));
        } else {
            json.append("null");
        }
        append_diag_field("statement");
        append_json_string(json, diagnostic.statement);
        append_diag_field("remediation_hints");
        json.push_back('[');
        for (std::size_t hint_index = 0; hint_index < diagnostic.remediation_hints.size(); ++hint_index) {
            if (hint_index > 0U) {
                json.push_back(',');
            }
            append_json_string(json, diagnostic.remediation_hints[hint_index]);
        }
        json.push_back(']');
        json.push_back('}');
    }
    json.push_back(']');

    json.push_back('}');
    return json;
}

}  // namespace schemer::tools
