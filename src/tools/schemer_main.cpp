#include "schemer/ddl_parser.hpp"
#include "schemer/output/json_writer.hpp"
#include "schemer/parser/parser_telemetry.hpp"
#include "schemer/tools/dump_writer.hpp"
#include "schemer/tools/parse_log_formatter.hpp"

#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliConfig final {
    std::vector<std::string> inputs{};
    std::string target_directory = "schemas";
    bool verbose = false;
    bool no_dump = false;
    bool group_by_type = false;
    std::string output_mode = "sql";
    std::string log_json_path{};
};

std::string format_duration_ns(std::uint64_t ns)
{
    if (ns == 0U) {
        return "0 ms";
    }
    constexpr double kNsPerMs = 1'000'000.0;
    const double ms = static_cast<double>(ns) / kNsPerMs;
    std::ostringstream stream;
    const int precision = ms < 1.0 ? 3 : (ms < 10.0 ? 2 : 1);
    stream << std::fixed << std::setprecision(precision) << ms << " ms";
    return stream.str();
}

void print_diagnostics(const std::filesystem::path& source, const std::vector<schemer::parser::ParserDiagnostic>& diagnostics)
{
    for (const auto& diagnostic : diagnostics) {
        std::cerr << schemer::parser::format_diagnostic(diagnostic) << " in " << source.string() << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            std::cerr << "  hint: " << hint << '\n';
        }
    }
}

void print_telemetry(const schemer::parser::ParserTelemetrySnapshot& snapshot)
{
    std::cout << "Parser telemetry" << '\n';
    std::cout << "  scripts:     " << snapshot.scripts_succeeded << '/' << snapshot.scripts_attempted << " succeeded";
    if (snapshot.lex_failures > 0U) {
        std::cout << " (" << snapshot.lex_failures << " lexical failures)";
    }
    std::cout << '\n';
    std::cout << "  statements:  " << snapshot.statements_succeeded << '/' << snapshot.statements_attempted
              << " succeeded" << '\n';
    std::cout << "  records:     " << snapshot.records_emitted << '\n';
    std::cout << "  diagnostics: " << snapshot.diagnostics_error << " errors, " << snapshot.diagnostics_warning
              << " warnings, " << snapshot.diagnostics_info << " info" << '\n';
    std::cout << "  unknown clauses: " << snapshot.unknown_clauses << ", unresolved targets: "
              << snapshot.unresolved_targets << '\n';
    std::cout << "  parse time:  " << format_duration_ns(snapshot.total_parse_duration_ns) << " total, "
              << format_duration_ns(snapshot.last_parse_duration_ns) << " last" << '\n';
}

int run(const CliConfig& config)
{
    const auto mode = schemer::output::parse_output_mode(config.output_mode);
    if (!mode) {
        std::cerr << "error: unknown output mode '" << config.output_mode << "'" << '\n';
        return EXIT_FAILURE;
    }

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    if (!config.log_json_path.empty()) {
        if (config.log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(config.log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << config.log_json_path << "'" << '\n';
                return EXIT_FAILURE;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }
    }

    const auto sources = schemer::tools::collect_inputs(config.inputs);
    if (sources.empty()) {
        std::cerr << "error: no DDL files found" << '\n';
        return EXIT_FAILURE;
    }

    schemer::parser::ParserTelemetry telemetry;
    schemer::ParseOptions options{};
    options.output_mode = *mode;
    options.telemetry = &telemetry;
    options.group_by_type = config.group_by_type;

    bool all_succeeded = true;
    for (const auto& source : sources) {
        const auto text = schemer::tools::read_source_file(source);

        schemer::tools::ParseLogEntry entry{};
        entry.source = source.string();
        entry.output_mode = *mode;
        entry.started_at = std::chrono::system_clock::now();
        const auto started = std::chrono::steady_clock::now();

        auto result = schemer::parse(text, options);

        const auto elapsed = std::chrono::steady_clock::now() - started;
        entry.finished_at = std::chrono::system_clock::now();
        entry.duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();
        entry.success = result.success();
        entry.statements = result.statements;
        entry.records = result.records.size();

        print_diagnostics(source, result.diagnostics);
        all_succeeded = all_succeeded && result.success();

        const auto document = config.group_by_type
                                  ? result.grouped
                                  : schemer::output::Value{schemer::output::Array(result.records.begin(),
                                                                                  result.records.end())};
        if (config.verbose) {
            std::cout << schemer::output::write_json(document, 1) << '\n';
        }
        if (!config.no_dump) {
            const auto written = schemer::tools::dump_document(document, config.target_directory, source.stem().string());
            if (config.verbose) {
                std::cout << "wrote " << written.string() << '\n';
            }
        }

        if (log_stream != nullptr) {
            entry.diagnostics = std::move(result.diagnostics);
            (*log_stream) << schemer::tools::format_parse_log_json(entry) << '\n';
            log_stream->flush();
        }
    }

    if (config.verbose) {
        print_telemetry(telemetry.snapshot());
    }
    return all_succeeded ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Parse SQL and HQL DDL into JSON schema records"};

    CliConfig config{};
    app.add_option("inputs", config.inputs, "DDL files or directories of .sql/.ddl/.hql files")->required();
    app.add_option("-t,--target", config.target_directory, "Directory receiving <name>_schema.json dumps")
        ->capture_default_str();
    app.add_flag("-v,--verbose", config.verbose, "Echo parsed records and telemetry to stdout");
    app.add_flag("--no-dump", config.no_dump, "Do not write schema files");
    app.add_flag("--group-by-type", config.group_by_type, "Group records into tables, sequences and unresolved");
    app.add_option("-o,--output-mode", config.output_mode, "Output mode (sql or hql)")
        ->transform(CLI::CheckedTransformer({{"sql", "sql"}, {"hql", "hql"}}, CLI::ignore_case))
        ->capture_default_str();
    app.add_option("--log-json", config.log_json_path, "Append JSON Lines parse logs to a file ('-' for stdout)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    }

    try {
        return run(config);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }
}
