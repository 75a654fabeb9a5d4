#pragma once

#include "schemer/parser/token.hpp"
#include "schemer/parser/type_grammar.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace schemer::parser {

struct ForeignKeyRef final {
    std::optional<std::string> schema{};
    std::string table{};
    std::optional<std::string> column{};
    std::optional<std::string> on_delete{};
    std::optional<std::string> on_update{};
    std::optional<std::string> deferrable_initially{};
};

/// `VARCHAR(50)` -> 50, `DECIMAL(10,2)` -> {10, 2}, `VARCHAR(MAX)` -> "MAX".
using ColumnSize = std::variant<std::monostate, std::int64_t, std::pair<std::int64_t, std::int64_t>, std::string>;

struct ColumnDefinition final {
    std::string name{};
    std::string type{};
    TypeNode type_tree{};
    ColumnSize size{};
    bool nullable = true;
    std::optional<std::string> default_value{};
    std::optional<std::string> check{};
    bool unique = false;
    bool primary_key = false;
    std::optional<ForeignKeyRef> references{};
    bool autoincrement = false;
    std::optional<std::string> comment{};
    std::optional<std::string> collate{};
    std::optional<std::string> character_set{};
    std::optional<std::string> on_update{};
    std::optional<std::string> generated_as{};
    std::size_t offset = 0U;
};

struct PrimaryKeyConstraint final {
    std::optional<std::string> constraint_name{};
    std::vector<std::string> columns{};
};

struct CheckConstraint final {
    std::optional<std::string> constraint_name{};
    std::vector<Token> expression_tokens{};
    std::string statement{};
};

struct UniqueConstraint final {
    std::optional<std::string> constraint_name{};
    std::vector<std::string> columns{};
};

struct ForeignKeyConstraint final {
    std::optional<std::string> constraint_name{};
    std::vector<std::string> local_columns{};
    std::vector<std::string> reference_columns{};
    ForeignKeyRef reference{};
};

using TableConstraint = std::variant<PrimaryKeyConstraint, CheckConstraint, UniqueConstraint, ForeignKeyConstraint>;

struct IndexColumn final {
    std::string name{};
    std::string order = "ASC";
    std::optional<std::string> nulls{};
};

struct IndexDefinition final {
    std::string index_name{};
    bool unique = false;
    std::vector<IndexColumn> columns{};
};

struct PartitionBy final {
    std::string type{};
    std::vector<std::string> columns{};
};

struct TableLike final {
    std::optional<std::string> schema{};
    std::string table_name{};
};

using PropertyList = std::vector<std::pair<std::string, std::string>>;

/// Hive storage clauses. String-valued fields keep their SQL quoting.
struct HiveTableOptions final {
    bool external = false;
    std::optional<std::string> stored_as{};
    std::optional<std::string> location{};
    std::optional<std::string> row_format{};
    std::optional<std::string> serde{};
    std::optional<std::string> fields_terminated_by{};
    std::optional<std::string> collection_items_terminated_by{};
    std::optional<std::string> map_keys_terminated_by{};
    std::optional<std::string> lines_terminated_by{};
    std::vector<std::string> clustered_by{};
    std::optional<std::int64_t> into_buckets{};
    PropertyList tblproperties{};
};

struct AlterColumnReference final {
    std::string name{};
    std::optional<std::string> constraint_name{};
    ForeignKeyRef references{};
};

struct AlterDefault final {
    std::optional<std::string> constraint_name{};
    std::string column{};
    std::optional<std::string> value{};
};

struct RenamedColumn final {
    std::string from{};
    std::string to{};
};

/// Accumulated effect of every ALTER TABLE applied to one table.
struct AlterSection final {
    std::vector<AlterColumnReference> references{};
    std::vector<ColumnDefinition> columns{};
    std::vector<CheckConstraint> checks{};
    std::vector<UniqueConstraint> uniques{};
    std::vector<PrimaryKeyConstraint> primary_keys{};
    std::vector<AlterDefault> defaults{};
    std::vector<std::string> dropped_columns{};
    std::vector<RenamedColumn> renamed_columns{};
    std::vector<ColumnDefinition> modified_columns{};

    [[nodiscard]] bool empty() const noexcept
    {
        return references.empty() && columns.empty() && checks.empty() && uniques.empty() && primary_keys.empty()
               && defaults.empty() && dropped_columns.empty() && renamed_columns.empty()
               && modified_columns.empty();
    }
};

struct CreateTableStatement final {
    std::optional<std::string> schema{};
    std::string table_name{};
    std::vector<ColumnDefinition> columns{};
    std::vector<std::string> primary_key{};
    std::vector<CheckConstraint> checks{};
    std::vector<IndexDefinition> indexes{};
    AlterSection alter{};
    std::vector<TableConstraint> constraints{};
    std::vector<ColumnDefinition> partitioned_by{};
    std::optional<std::string> tablespace{};
    bool if_not_exists = false;
    bool replace = false;
    bool temp = false;
    std::optional<TableLike> like{};
    std::optional<PartitionBy> partition_by{};
    std::vector<std::string> inherits{};
    PropertyList table_properties{};
    std::optional<std::string> comment{};
    HiveTableOptions hql{};
};

struct AddForeignKeyAction final {
    ForeignKeyConstraint constraint{};
};

struct AddCheckAction final {
    CheckConstraint constraint{};
};

struct AddUniqueAction final {
    UniqueConstraint constraint{};
};

struct AddPrimaryKeyAction final {
    PrimaryKeyConstraint constraint{};
};

/// `value` is empty for ALTER COLUMN ... DROP DEFAULT.
struct SetDefaultAction final {
    std::optional<std::string> constraint_name{};
    std::string column{};
    std::optional<std::string> value{};
};

struct AddColumnAction final {
    ColumnDefinition column{};
};

struct DropColumnAction final {
    std::string column{};
    bool if_exists = false;
};

struct RenameColumnAction final {
    std::string from{};
    std::string to{};
};

struct ModifyColumnAction final {
    ColumnDefinition column{};
};

struct SetNullabilityAction final {
    std::string column{};
    bool nullable = true;
};

using AlterAction = std::variant<AddForeignKeyAction,
                                 AddCheckAction,
                                 AddUniqueAction,
                                 AddPrimaryKeyAction,
                                 SetDefaultAction,
                                 AddColumnAction,
                                 DropColumnAction,
                                 RenameColumnAction,
                                 ModifyColumnAction,
                                 SetNullabilityAction>;

struct AlterTableStatement final {
    std::optional<std::string> schema{};
    std::string table_name{};
    bool if_exists = false;
    bool only = false;
    std::vector<AlterAction> actions{};
};

struct CreateIndexStatement final {
    std::optional<std::string> schema{};
    std::string table_name{};
    IndexDefinition index{};
    bool if_not_exists = false;
    bool concurrently = false;
};

/// Every property is independently optional; absence means the clause was not
/// written.
struct CreateSequenceStatement final {
    std::optional<std::string> schema{};
    std::string sequence_name{};
    std::optional<std::string> data_type{};
    std::optional<std::int64_t> increment{};
    std::optional<std::int64_t> start{};
    std::optional<std::int64_t> minvalue{};
    std::optional<std::int64_t> maxvalue{};
    std::optional<std::int64_t> cache{};
    std::optional<bool> cycle{};
    std::optional<std::string> owned_by{};
    bool if_not_exists = false;
};

}  // namespace schemer::parser
