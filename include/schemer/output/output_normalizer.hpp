#pragma once

#include "schemer/output/value.hpp"
#include "schemer/parser/statement_builders.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace schemer::output {

enum class OutputMode : std::uint8_t {
    Sql = 0,
    Hql
};

/// Accepts "sql" and "hql" in any letter case.
[[nodiscard]] std::optional<OutputMode> parse_output_mode(std::string_view text) noexcept;
[[nodiscard]] std::string_view output_mode_name(OutputMode mode) noexcept;

/// Shapes finished statement records into output values. Key order and key
/// presence are fixed per record kind; Hive-only fields are emitted only in
/// Hql mode.
class OutputNormalizer final {
public:
    explicit OutputNormalizer(OutputMode mode = OutputMode::Sql) noexcept : mode_{mode} {}

    [[nodiscard]] OutputMode mode() const noexcept { return mode_; }

    [[nodiscard]] Value normalize(const parser::StatementRecord& record) const;
    [[nodiscard]] std::vector<Value> normalize_all(const std::vector<parser::StatementRecord>& records) const;

    /// Buckets normalized records by kind into `{tables, sequences, unresolved}`.
    /// Every bucket is present; records keep their source order inside it.
    [[nodiscard]] Value group_records(const std::vector<parser::StatementRecord>& records) const;

    [[nodiscard]] Value normalize_table(const parser::CreateTableStatement& table) const;
    [[nodiscard]] Value normalize_sequence(const parser::CreateSequenceStatement& sequence) const;
    [[nodiscard]] Value normalize_column(const parser::ColumnDefinition& column) const;
    [[nodiscard]] Value normalize_reference(const parser::ForeignKeyRef& reference) const;
    [[nodiscard]] Value normalize_alter(const parser::AlterSection& alter) const;

private:
    [[nodiscard]] Value normalize_unresolved(const parser::UnresolvedAlter& alter) const;
    [[nodiscard]] Value normalize_unresolved(const parser::UnresolvedIndex& index) const;
    [[nodiscard]] Value normalize_constraints(const std::vector<parser::TableConstraint>& constraints) const;

    OutputMode mode_ = OutputMode::Sql;
};

}  // namespace schemer::output
