#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace schemer::parser {

struct ParserTelemetrySnapshot final {
    std::uint64_t scripts_attempted = 0U;
    std::uint64_t scripts_succeeded = 0U;
    std::uint64_t lex_failures = 0U;
    std::uint64_t statements_attempted = 0U;
    std::uint64_t statements_succeeded = 0U;
    std::uint64_t records_emitted = 0U;
    std::uint64_t unknown_clauses = 0U;
    std::uint64_t unresolved_targets = 0U;
    std::uint64_t diagnostics_info = 0U;
    std::uint64_t diagnostics_warning = 0U;
    std::uint64_t diagnostics_error = 0U;
    std::uint64_t total_parse_duration_ns = 0U;
    std::uint64_t last_parse_duration_ns = 0U;
};

/// Outcome of one parse call as fed to ParserTelemetry.
struct ParseSample final {
    bool success = false;
    bool lex_failed = false;
    std::uint64_t duration_ns = 0U;
    std::size_t statements_attempted = 0U;
    std::size_t statements_succeeded = 0U;
    std::size_t records = 0U;
    std::size_t unknown_clauses = 0U;
    std::size_t unresolved_targets = 0U;
    std::size_t info_diagnostics = 0U;
    std::size_t warning_diagnostics = 0U;
    std::size_t error_diagnostics = 0U;
};

/// Lock-free counters; one instance may be shared by concurrent parse calls.
class ParserTelemetry final {
public:
    void record_script_attempt() noexcept;
    void record_script_result(const ParseSample& sample) noexcept;

    [[nodiscard]] ParserTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static void add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept;

    std::atomic<std::uint64_t> scripts_attempted_{0U};
    std::atomic<std::uint64_t> scripts_succeeded_{0U};
    std::atomic<std::uint64_t> lex_failures_{0U};
    std::atomic<std::uint64_t> statements_attempted_{0U};
    std::atomic<std::uint64_t> statements_succeeded_{0U};
    std::atomic<std::uint64_t> records_emitted_{0U};
    std::atomic<std::uint64_t> unknown_clauses_{0U};
    std::atomic<std::uint64_t> unresolved_targets_{0U};
    std::atomic<std::uint64_t> diagnostics_info_{0U};
    std::atomic<std::uint64_t> diagnostics_warning_{0U};
    std::atomic<std::uint64_t> diagnostics_error_{0U};
    std::atomic<std::uint64_t> total_parse_duration_ns_{0U};
    std::atomic<std::uint64_t> last_parse_duration_ns_{0U};
};

class ParserTelemetryRegistry final {
public:
    using Sampler = std::function<ParserTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const ParserTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] ParserTelemetrySnapshot aggregate() const;

    /// Visits samplers in identifier order.
    void visit(const Visitor& visitor) const;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, Sampler> samplers_{};
};

}  // namespace schemer::parser
