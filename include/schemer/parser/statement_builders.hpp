#pragma once

#include "schemer/parser/ast.hpp"
#include "schemer/parser/grammar.hpp"
#include "schemer/parser/parse_context.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace schemer::parser {

/// Accumulates clause fragments of one CREATE TABLE. Every table starts with
/// empty `index`, `primary_key`, `checks` and `alter` so that finished records
/// share one key set.
class TableBuilder final {
public:
    TableBuilder() = default;

    [[nodiscard]] CreateTableStatement& table() noexcept { return table_; }

    void add_column(ColumnDefinition column);
    void add_constraint(TableConstraint constraint, std::size_t offset = 0U);
    void add_index(IndexDefinition index);

    /// Orders the primary key (column-level keys first, then table-level
    /// keys), marks key columns NOT NULL, applies unique and foreign-key
    /// constraints to their columns and reports duplicate or unknown names.
    CreateTableStatement finish(ParseContext& context);

private:
    ColumnDefinition* find_column(std::string_view name) noexcept;

    CreateTableStatement table_{};
    std::vector<std::string> table_primary_key_{};
    std::size_t primary_key_offset_ = 0U;
};

enum class SequenceOption : std::uint8_t {
    Increment = 0,
    Start,
    MinValue,
    MaxValue,
    Cache
};

class SequenceBuilder final {
public:
    [[nodiscard]] CreateSequenceStatement& sequence() noexcept { return sequence_; }

    void set(SequenceOption option, std::int64_t value, std::size_t offset, ParseContext& context);
    void clear(SequenceOption option) noexcept;

    CreateSequenceStatement finish() noexcept { return std::move(sequence_); }

private:
    CreateSequenceStatement sequence_{};
};

[[nodiscard]] std::string_view sequence_option_name(SequenceOption option) noexcept;

/// ALTER TABLE whose target was not declared earlier in the same call.
struct UnresolvedAlter final {
    std::optional<std::string> schema{};
    std::string table_name{};
    AlterSection alter{};
};

/// CREATE INDEX whose target was not declared earlier in the same call.
struct UnresolvedIndex final {
    std::optional<std::string> schema{};
    std::string table_name{};
    IndexDefinition index{};
};

using StatementRecord = std::variant<CreateTableStatement, CreateSequenceStatement, UnresolvedAlter, UnresolvedIndex>;

/// Applies ALTER TABLE actions. With a target table the actions also update
/// its columns; without one only `section` is filled.
class AlterBuilder final {
public:
    AlterBuilder(AlterSection& section, CreateTableStatement* table) noexcept : section_{section}, table_{table} {}

    void apply(const AlterAction& action);

private:
    ColumnDefinition* find_column(std::string_view name) noexcept;

    void apply_action(const AddForeignKeyAction& action);
    void apply_action(const AddCheckAction& action);
    void apply_action(const AddUniqueAction& action);
    void apply_action(const AddPrimaryKeyAction& action);
    void apply_action(const SetDefaultAction& action);
    void apply_action(const AddColumnAction& action);
    void apply_action(const DropColumnAction& action);
    void apply_action(const RenameColumnAction& action);
    void apply_action(const ModifyColumnAction& action);
    void apply_action(const SetNullabilityAction& action);

    AlterSection& section_;
    CreateTableStatement* table_ = nullptr;
};

/// Folds parsed statements into output records in source order. ALTER TABLE
/// and CREATE INDEX merge into the table built earlier under the same
/// (schema, table) pair, compared case-insensitively. Unresolved targets are
/// kept as standalone records and reported on the statement's diagnostics.
class RecordAssembler final {
public:
    explicit RecordAssembler(std::string_view source) noexcept : context_{source} {}

    void add(ScriptStatement& statement);
    std::vector<StatementRecord> finish() noexcept { return std::move(records_); }

private:
    CreateTableStatement* find_table(const std::optional<std::string>& schema, std::string_view table_name);
    void add_table(CreateTableStatement table);
    void add_alter(const AlterTableStatement& alter, ScriptStatement& statement);
    void add_index(const CreateIndexStatement& index, ScriptStatement& statement);
    void report(ParseErrc code, std::string message, ScriptStatement& statement, std::vector<std::string> hints);

    ParseContext context_;
    std::vector<StatementRecord> records_{};
    std::unordered_map<std::string, std::size_t> tables_{};
};

[[nodiscard]] std::string table_key(const std::optional<std::string>& schema, std::string_view table_name);

}  // namespace schemer::parser
