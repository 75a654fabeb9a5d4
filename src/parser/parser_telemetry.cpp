#include "schemer/parser/parser_telemetry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace schemer::parser {
namespace {

ParserTelemetrySnapshot& accumulate(ParserTelemetrySnapshot& target, const ParserTelemetrySnapshot& source)
{
    target.scripts_attempted += source.scripts_attempted;
    target.scripts_succeeded += source.scripts_succeeded;
    target.lex_failures += source.lex_failures;
    target.statements_attempted += source.statements_attempted;
    target.statements_succeeded += source.statements_succeeded;
    target.records_emitted += source.records_emitted;
    target.unknown_clauses += source.unknown_clauses;
    target.unresolved_targets += source.unresolved_targets;
    target.diagnostics_info += source.diagnostics_info;
    target.diagnostics_warning += source.diagnostics_warning;
    target.diagnostics_error += source.diagnostics_error;
    target.total_parse_duration_ns += source.total_parse_duration_ns;
    target.last_parse_duration_ns = std::max(target.last_parse_duration_ns, source.last_parse_duration_ns);
    return target;
}

std::uint64_t widen(std::size_t value) noexcept
{
    return static_cast<std::uint64_t>(value);
}

}  // namespace

void ParserTelemetry::add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept
{
    target.fetch_add(value, std::memory_order_relaxed);
}

void ParserTelemetry::record_script_attempt() noexcept
{
    add_relaxed(scripts_attempted_, 1U);
}

void ParserTelemetry::record_script_result(const ParseSample& sample) noexcept
{
    if (sample.success) {
        add_relaxed(scripts_succeeded_, 1U);
    }
    if (sample.lex_failed) {
        add_relaxed(lex_failures_, 1U);
    }

    add_relaxed(statements_attempted_, widen(sample.statements_attempted));
    add_relaxed(statements_succeeded_, widen(sample.statements_succeeded));
    add_relaxed(records_emitted_, widen(sample.records));
    add_relaxed(unknown_clauses_, widen(sample.unknown_clauses));
    add_relaxed(unresolved_targets_, widen(sample.unresolved_targets));
    add_relaxed(diagnostics_info_, widen(sample.info_diagnostics));
    add_relaxed(diagnostics_warning_, widen(sample.warning_diagnostics));
    add_relaxed(diagnostics_error_, widen(sample.error_diagnostics));
    add_relaxed(total_parse_duration_ns_, sample.duration_ns);
    last_parse_duration_ns_.store(sample.duration_ns, std::memory_order_relaxed);
}

ParserTelemetrySnapshot ParserTelemetry::snapshot() const noexcept
{
    ParserTelemetrySnapshot snapshot{};
    snapshot.scripts_attempted = scripts_attempted_.load(std::memory_order_relaxed);
    snapshot.scripts_succeeded = scripts_succeeded_.load(std::memory_order_relaxed);
    snapshot.lex_failures = lex_failures_.load(std::memory_order_relaxed);
    snapshot.statements_attempted = statements_attempted_.load(std::memory_order_relaxed);
    snapshot.statements_succeeded = statements_succeeded_.load(std::memory_order_relaxed);
    snapshot.records_emitted = records_emitted_.load(std::memory_order_relaxed);
    snapshot.unknown_clauses = unknown_clauses_.load(std::memory_order_relaxed);
    snapshot.unresolved_targets = unresolved_targets_.load(std::memory_order_relaxed);
    snapshot.diagnostics_info = diagnostics_info_.load(std::memory_order_relaxed);
    snapshot.diagnostics_warning = diagnostics_warning_.load(std::memory_order_relaxed);
    snapshot.diagnostics_error = diagnostics_error_.load(std::memory_order_relaxed);
    snapshot.total_parse_duration_ns = total_parse_duration_ns_.load(std::memory_order_relaxed);
    snapshot.last_parse_duration_ns = last_parse_duration_ns_.load(std::memory_order_relaxed);
    return snapshot;
}

void ParserTelemetry::reset() noexcept
{
    for (auto* counter : {&scripts_attempted_,
                          &scripts_succeeded_,
                          &lex_failures_,
                          &statements_attempted_,
                          &statements_succeeded_,
                          &records_emitted_,
                          &unknown_clauses_,
                          &unresolved_targets_,
                          &diagnostics_info_,
                          &diagnostics_warning_,
                          &diagnostics_error_,
                          &total_parse_duration_ns_,
                          &last_parse_duration_ns_}) {
        counter->store(0U, std::memory_order_relaxed);
    }
}

void ParserTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }

    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void ParserTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

ParserTelemetrySnapshot ParserTelemetryRegistry::aggregate() const
{
    std::vector<Sampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            samplers.push_back(sampler);
        }
    }

    ParserTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        accumulate(total, sampler());
    }
    return total;
}

void ParserTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }
    std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

    for (const auto& [identifier, sampler] : entries) {
        visitor(identifier, sampler());
    }
}

}  // namespace schemer::parser
