#include "schemer/parser/statement_builders.hpp"

#include "schemer/parser/text_utils.hpp"

#include <algorithm>
#include <type_traits>
#include <unordered_set>

namespace schemer::parser {

namespace {

bool contains_name(const std::vector<std::string>& names, std::string_view name)
{
    return std::any_of(names.begin(), names.end(), [name](const std::string& candidate) {
        return iequals(candidate, name);
    });
}

ColumnDefinition* find_column_in(std::vector<ColumnDefinition>& columns, std::string_view name) noexcept
{
    const auto it = std::find_if(columns.begin(), columns.end(), [name](const ColumnDefinition& column) {
        return iequals(column.name, name);
    });
    return it == columns.end() ? nullptr : &*it;
}

ForeignKeyRef reference_for(const ForeignKeyConstraint& constraint, std::size_t index)
{
    auto reference = constraint.reference;
    if (index < constraint.reference_columns.size()) {
        reference.column = constraint.reference_columns[index];
    } else {
        reference.column.reset();
    }
    return reference;
}

}  // namespace

std::string table_key(const std::optional<std::string>& schema, std::string_view table_name)
{
    std::string key = schema ? lowercase_copy(*schema) : std::string{};
    key.push_back('.');
    key.append(lowercase_copy(table_name));
    return key;
}

void TableBuilder::add_column(ColumnDefinition column)
{
    table_.columns.push_back(std::move(column));
}

void TableBuilder::add_constraint(TableConstraint constraint, std::size_t offset)
{
    if (const auto* check = std::get_if<CheckConstraint>(&constraint)) {
        table_.checks.push_back(*check);
    } else if (const auto* primary_key = std::get_if<PrimaryKeyConstraint>(&constraint)) {
        for (const auto& name : primary_key->columns) {
            if (!contains_name(table_primary_key_, name)) {
                table_primary_key_.push_back(name);
            }
        }
        primary_key_offset_ = offset;
    }
    table_.constraints.push_back(std::move(constraint));
}

void TableBuilder::add_index(IndexDefinition index)
{
    table_.indexes.push_back(std::move(index));
}

ColumnDefinition* TableBuilder::find_column(std::string_view name) noexcept
{
    return find_column_in(table_.columns, name);
}

CreateTableStatement TableBuilder::finish(ParseContext& context)
{
    std::unordered_set<std::string> seen{};
    for (const auto& column : table_.columns) {
        if (!seen.insert(lowercase_copy(column.name)).second) {
            context.warn(ParseErrc::DuplicateColumn,
                         "Column '" + column.name + "' is declared more than once in table '" + table_.table_name + "'",
                         column.offset,
                         {"Remove or rename the repeated column definition."});
        }
    }

    std::vector<std::string> primary_key{};
    for (const auto& column : table_.columns) {
        if (column.primary_key && !contains_name(primary_key, column.name)) {
            primary_key.push_back(column.name);
        }
    }
    for (const auto& name : table_primary_key_) {
        if (!contains_name(primary_key, name)) {
            primary_key.push_back(name);
        }
    }

    for (const auto& name : primary_key) {
        if (auto* column = find_column(name)) {
            column->nullable = false;
        } else if (!table_.columns.empty()) {
            context.warn(ParseErrc::UnknownKeyColumn,
                         "Primary key column '" + name + "' is not declared in table '" + table_.table_name + "'",
                         primary_key_offset_,
                         {"Declare the column or correct the PRIMARY KEY column list."});
        }
    }
    table_.primary_key = std::move(primary_key);

    for (const auto& constraint : table_.constraints) {
        if (const auto* unique = std::get_if<UniqueConstraint>(&constraint)) {
            for (const auto& name : unique->columns) {
                if (auto* column = find_column(name)) {
                    column->unique = true;
                }
            }
        } else if (const auto* foreign_key = std::get_if<ForeignKeyConstraint>(&constraint)) {
            for (std::size_t index = 0U; index < foreign_key->local_columns.size(); ++index) {
                if (auto* column = find_column(foreign_key->local_columns[index])) {
                    column->references = reference_for(*foreign_key, index);
                }
            }
        }
    }

    return std::move(table_);
}

std::string_view sequence_option_name(SequenceOption option) noexcept
{
    switch (option) {
    case SequenceOption::Increment:
        return "increment";
    case SequenceOption::Start:
        return "start";
    case SequenceOption::MinValue:
        return "minvalue";
    case SequenceOption::MaxValue:
        return "maxvalue";
    case SequenceOption::Cache:
        return "cache";
    }
    return "unknown";
}

namespace {

std::optional<std::int64_t>& sequence_field(CreateSequenceStatement& sequence, SequenceOption option) noexcept
{
    switch (option) {
    case SequenceOption::Increment:
        return sequence.increment;
    case SequenceOption::Start:
        return sequence.start;
    case SequenceOption::MinValue:
        return sequence.minvalue;
    case SequenceOption::MaxValue:
        return sequence.maxvalue;
    case SequenceOption::Cache:
    default:
        return sequence.cache;
    }
}

}  // namespace

void SequenceBuilder::set(SequenceOption option, std::int64_t value, std::size_t offset, ParseContext& context)
{
    auto& field = sequence_field(sequence_, option);
    if (field) {
        context.warn(ParseErrc::UnexpectedToken,
                     "Sequence option '" + std::string{sequence_option_name(option)} + "' is specified more than once",
                     offset,
                     {"Keep a single occurrence of each sequence option; the last one wins."});
    }
    field = value;
}

void SequenceBuilder::clear(SequenceOption option) noexcept
{
    sequence_field(sequence_, option).reset();
}

ColumnDefinition* AlterBuilder::find_column(std::string_view name) noexcept
{
    if (table_ == nullptr) {
        return nullptr;
    }
    return find_column_in(table_->columns, name);
}

void AlterBuilder::apply(const AlterAction& action)
{
    std::visit([this](const auto& concrete) { apply_action(concrete); }, action);
}

void AlterBuilder::apply_action(const AddForeignKeyAction& action)
{
    const auto& constraint = action.constraint;
    for (std::size_t index = 0U; index < constraint.local_columns.size(); ++index) {
        AlterColumnReference entry{};
        entry.name = constraint.local_columns[index];
        entry.constraint_name = constraint.constraint_name;
        entry.references = reference_for(constraint, index);
        if (auto* column = find_column(entry.name)) {
            column->references = entry.references;
        }
        section_.references.push_back(std::move(entry));
    }
}

void AlterBuilder::apply_action(const AddCheckAction& action)
{
    section_.checks.push_back(action.constraint);
}

void AlterBuilder::apply_action(const AddUniqueAction& action)
{
    for (const auto& name : action.constraint.columns) {
        if (auto* column = find_column(name)) {
            column->unique = true;
        }
    }
    section_.uniques.push_back(action.constraint);
}

void AlterBuilder::apply_action(const AddPrimaryKeyAction& action)
{
    if (table_ != nullptr) {
        for (const auto& name : action.constraint.columns) {
            if (!contains_name(table_->primary_key, name)) {
                table_->primary_key.push_back(name);
            }
            if (auto* column = find_column(name)) {
                column->nullable = false;
            }
        }
    }
    section_.primary_keys.push_back(action.constraint);
}

void AlterBuilder::apply_action(const SetDefaultAction& action)
{
    if (auto* column = find_column(action.column)) {
        column->default_value = action.value;
    }
    section_.defaults.push_back(AlterDefault{action.constraint_name, action.column, action.value});
}

void AlterBuilder::apply_action(const AddColumnAction& action)
{
    if (table_ != nullptr && find_column(action.column.name) == nullptr) {
        table_->columns.push_back(action.column);
    }
    section_.columns.push_back(action.column);
}

void AlterBuilder::apply_action(const DropColumnAction& action)
{
    if (table_ != nullptr) {
        auto& columns = table_->columns;
        columns.erase(std::remove_if(columns.begin(),
                                     columns.end(),
                                     [&action](const ColumnDefinition& column) { return iequals(column.name, action.column); }),
                      columns.end());
        auto& key = table_->primary_key;
        key.erase(std::remove_if(key.begin(), key.end(), [&action](const std::string& name) { return iequals(name, action.column); }),
                  key.end());
    }
    section_.dropped_columns.push_back(action.column);
}

void AlterBuilder::apply_action(const RenameColumnAction& action)
{
    if (auto* column = find_column(action.from)) {
        column->name = action.to;
        for (auto& name : table_->primary_key) {
            if (iequals(name, action.from)) {
                name = action.to;
            }
        }
    }
    section_.renamed_columns.push_back(RenamedColumn{action.from, action.to});
}

void AlterBuilder::apply_action(const ModifyColumnAction& action)
{
    if (auto* column = find_column(action.column.name)) {
        const bool keyed = contains_name(table_->primary_key, column->name);
        *column = action.column;
        if (keyed) {
            column->nullable = false;
        }
    }
    section_.modified_columns.push_back(action.column);
}

void AlterBuilder::apply_action(const SetNullabilityAction& action)
{
    if (auto* column = find_column(action.column)) {
        column->nullable = action.nullable;
        section_.modified_columns.push_back(*column);
        return;
    }
    ColumnDefinition column{};
    column.name = action.column;
    column.nullable = action.nullable;
    section_.modified_columns.push_back(std::move(column));
}

CreateTableStatement* RecordAssembler::find_table(const std::optional<std::string>& schema, std::string_view table_name)
{
    const auto it = tables_.find(table_key(schema, table_name));
    if (it == tables_.end()) {
        return nullptr;
    }
    return std::get_if<CreateTableStatement>(&records_[it->second]);
}

void RecordAssembler::add(ScriptStatement& statement)
{
    if (!statement.success) {
        return;
    }

    std::visit(
        [this, &statement](auto& ast) {
            using AstType = std::decay_t<decltype(ast)>;
            if constexpr (std::is_same_v<AstType, CreateTableStatement>) {
                add_table(std::move(ast));
            } else if constexpr (std::is_same_v<AstType, AlterTableStatement>) {
                add_alter(ast, statement);
            } else if constexpr (std::is_same_v<AstType, CreateIndexStatement>) {
                add_index(ast, statement);
            } else if constexpr (std::is_same_v<AstType, CreateSequenceStatement>) {
                records_.emplace_back(std::move(ast));
            }
        },
        statement.ast);
}

void RecordAssembler::add_table(CreateTableStatement table)
{
    const auto key = table_key(table.schema, table.table_name);
    records_.emplace_back(std::move(table));
    tables_[key] = records_.size() - 1U;
}

void RecordAssembler::add_alter(const AlterTableStatement& alter, ScriptStatement& statement)
{
    if (auto* table = find_table(alter.schema, alter.table_name)) {
        AlterBuilder builder{table->alter, table};
        for (const auto& action : alter.actions) {
            builder.apply(action);
        }
        return;
    }

    UnresolvedAlter record{};
    record.schema = alter.schema;
    record.table_name = alter.table_name;
    AlterBuilder builder{record.alter, nullptr};
    for (const auto& action : alter.actions) {
        builder.apply(action);
    }
    records_.emplace_back(std::move(record));
    report(ParseErrc::UnresolvedAlterTarget,
           "ALTER TABLE targets '" + alter.table_name + "', which is not declared earlier in the input",
           statement,
           {"Place the CREATE TABLE statement before the ALTER TABLE that modifies it."});
}

void RecordAssembler::add_index(const CreateIndexStatement& index, ScriptStatement& statement)
{
    if (auto* table = find_table(index.schema, index.table_name)) {
        table->indexes.push_back(index.index);
        return;
    }

    records_.emplace_back(UnresolvedIndex{index.schema, index.table_name, index.index});
    report(ParseErrc::UnresolvedIndexTarget,
           "CREATE INDEX targets '" + index.table_name + "', which is not declared earlier in the input",
           statement,
           {"Place the CREATE TABLE statement before the CREATE INDEX that references it."});
}

void RecordAssembler::report(ParseErrc code, std::string message, ScriptStatement& statement, std::vector<std::string> hints)
{
    auto diagnostic = context_.make_diagnostic(ParserSeverity::Warning, code, std::move(message), statement.offset, std::move(hints));
    diagnostic.statement_index = statement.index;
    diagnostic.statement = statement.text;
    statement.diagnostics.push_back(std::move(diagnostic));
}

}  // namespace schemer::parser
