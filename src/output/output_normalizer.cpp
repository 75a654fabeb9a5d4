#include "schemer/output/output_normalizer.hpp"

#include "schemer/parser/text_utils.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace schemer::output {

namespace {

Value optional_string(const std::optional<std::string>& text)
{
    if (!text) {
        return Value{};
    }
    return Value{*text};
}

Value optional_integer(const std::optional<std::int64_t>& number)
{
    if (!number) {
        return Value{};
    }
    return Value{*number};
}

Value string_array(const std::vector<std::string>& items)
{
    Array array{};
    array.reserve(items.size());
    for (const auto& item : items) {
        array.emplace_back(item);
    }
    return Value{std::move(array)};
}

Value property_object(const parser::PropertyList& properties)
{
    Object object{};
    for (const auto& [key, value] : properties) {
        object.emplace_back(key, Value{value});
    }
    return Value{std::move(object)};
}

Value size_value(const parser::ColumnSize& size)
{
    return std::visit(
        [](const auto& held) -> Value {
            using Held = std::decay_t<decltype(held)>;
            if constexpr (std::is_same_v<Held, std::monostate>) {
                return Value{};
            } else if constexpr (std::is_same_v<Held, std::int64_t>) {
                return Value{held};
            } else if constexpr (std::is_same_v<Held, std::string>) {
                return Value{held};
            } else {
                return Value{Array{Value{held.first}, Value{held.second}}};
            }
        },
        size);
}

Value check_value(const parser::CheckConstraint& check)
{
    Value entry{Object{}};
    entry.set("constraint_name", optional_string(check.constraint_name));
    entry.set("statement", check.statement);
    return entry;
}

Value key_value(const std::optional<std::string>& constraint_name, const std::vector<std::string>& columns)
{
    Value entry{Object{}};
    entry.set("constraint_name", optional_string(constraint_name));
    entry.set("columns", string_array(columns));
    return entry;
}

Value index_value(const parser::IndexDefinition& index)
{
    Value entry{Object{}};
    entry.set("index_name", index.index_name);
    entry.set("unique", index.unique);

    Array names{};
    Array detailed{};
    for (const auto& column : index.columns) {
        names.emplace_back(column.name);
        Value detail{Object{}};
        detail.set("name", column.name);
        detail.set("order", column.order);
        detail.set("nulls", optional_string(column.nulls));
        detailed.push_back(std::move(detail));
    }
    entry.set("columns", Value{std::move(names)});
    entry.set("detailed_columns", Value{std::move(detailed)});
    return entry;
}

}  // namespace

std::optional<OutputMode> parse_output_mode(std::string_view text) noexcept
{
    if (parser::iequals(text, "sql")) {
        return OutputMode::Sql;
    }
    if (parser::iequals(text, "hql")) {
        return OutputMode::Hql;
    }
    return std::nullopt;
}

std::string_view output_mode_name(OutputMode mode) noexcept
{
    switch (mode) {
    case OutputMode::Hql:
        return "hql";
    case OutputMode::Sql:
    default:
        return "sql";
    }
}

Value OutputNormalizer::normalize(const parser::StatementRecord& record) const
{
    return std::visit(
        [this](const auto& held) -> Value {
            using Held = std::decay_t<decltype(held)>;
            if constexpr (std::is_same_v<Held, parser::CreateTableStatement>) {
                return normalize_table(held);
            } else if constexpr (std::is_same_v<Held, parser::CreateSequenceStatement>) {
                return normalize_sequence(held);
            } else {
                return normalize_unresolved(held);
            }
        },
        record);
}

std::vector<Value> OutputNormalizer::normalize_all(const std::vector<parser::StatementRecord>& records) const
{
    std::vector<Value> values{};
    values.reserve(records.size());
    for (const auto& record : records) {
        values.push_back(normalize(record));
    }
    return values;
}

Value OutputNormalizer::group_records(const std::vector<parser::StatementRecord>& records) const
{
    Array tables{};
    Array sequences{};
    Array unresolved{};
    for (const auto& record : records) {
        if (std::holds_alternative<parser::CreateTableStatement>(record)) {
            tables.push_back(normalize(record));
        } else if (std::holds_alternative<parser::CreateSequenceStatement>(record)) {
            sequences.push_back(normalize(record));
        } else {
            unresolved.push_back(normalize(record));
        }
    }

    Value grouped{Object{}};
    grouped.set("tables", Value{std::move(tables)});
    grouped.set("sequences", Value{std::move(sequences)});
    grouped.set("unresolved", Value{std::move(unresolved)});
    return grouped;
}

Value OutputNormalizer::normalize_reference(const parser::ForeignKeyRef& reference) const
{
    Value entry{Object{}};
    entry.set("table", reference.table);
    entry.set("schema", optional_string(reference.schema));
    entry.set("column", optional_string(reference.column));
    entry.set("on_delete", optional_string(reference.on_delete));
    entry.set("on_update", optional_string(reference.on_update));
    if (mode_ == OutputMode::Hql || reference.deferrable_initially) {
        entry.set("deferrable_initially", optional_string(reference.deferrable_initially));
    }
    return entry;
}

Value OutputNormalizer::normalize_column(const parser::ColumnDefinition& column) const
{
    Value entry{Object{}};
    entry.set("name", column.name);
    entry.set("type", column.type.empty() ? Value{} : Value{column.type});
    entry.set("size", size_value(column.size));
    entry.set("references", column.references ? normalize_reference(*column.references) : Value{});
    entry.set("unique", column.unique);
    entry.set("nullable", column.nullable);
    entry.set("default", optional_string(column.default_value));
    entry.set("check", optional_string(column.check));

    if (column.autoincrement) {
        entry.set("autoincrement", true);
    }
    if (column.comment) {
        entry.set("comment", *column.comment);
    }
    if (column.collate) {
        entry.set("collate", *column.collate);
    }
    if (column.character_set) {
        entry.set("character_set", *column.character_set);
    }
    if (column.on_update) {
        entry.set("on_update", *column.on_update);
    }
    if (column.generated_as) {
        entry.set("generated_as", *column.generated_as);
    }
    return entry;
}

Value OutputNormalizer::normalize_alter(const parser::AlterSection& alter) const
{
    Value entry{Object{}};

    Array columns{};
    for (const auto& reference : alter.references) {
        Value item{Object{}};
        item.set("name", reference.name);
        item.set("constraint_name", optional_string(reference.constraint_name));
        item.set("references", normalize_reference(reference.references));
        columns.push_back(std::move(item));
    }
    for (const auto& column : alter.columns) {
        columns.push_back(normalize_column(column));
    }
    if (!columns.empty()) {
        entry.set("columns", Value{std::move(columns)});
    }

    if (!alter.checks.empty()) {
        Array checks{};
        for (const auto& check : alter.checks) {
            checks.push_back(check_value(check));
        }
        entry.set("checks", Value{std::move(checks)});
    }
    if (!alter.uniques.empty()) {
        Array uniques{};
        for (const auto& unique : alter.uniques) {
            uniques.push_back(key_value(unique.constraint_name, unique.columns));
        }
        entry.set("uniques", Value{std::move(uniques)});
    }
    if (!alter.primary_keys.empty()) {
        Array keys{};
        for (const auto& key : alter.primary_keys) {
            keys.push_back(key_value(key.constraint_name, key.columns));
        }
        entry.set("primary_keys", Value{std::move(keys)});
    }
    if (!alter.defaults.empty()) {
        Array defaults{};
        for (const auto& item : alter.defaults) {
            Value value{Object{}};
            value.set("constraint_name", optional_string(item.constraint_name));
            value.set("column", item.column);
            value.set("value", optional_string(item.value));
            defaults.push_back(std::move(value));
        }
        entry.set("defaults", Value{std::move(defaults)});
    }
    if (!alter.dropped_columns.empty()) {
        entry.set("dropped_columns", string_array(alter.dropped_columns));
    }
    if (!alter.renamed_columns.empty()) {
        Array renamed{};
        for (const auto& rename : alter.renamed_columns) {
            Value value{Object{}};
            value.set("from", rename.from);
            value.set("to", rename.to);
            renamed.push_back(std::move(value));
        }
        entry.set("renamed_columns", Value{std::move(renamed)});
    }
    if (!alter.modified_columns.empty()) {
        Array modified{};
        for (const auto& column : alter.modified_columns) {
            modified.push_back(normalize_column(column));
        }
        entry.set("modified_columns", Value{std::move(modified)});
    }
    return entry;
}

Value OutputNormalizer::normalize_constraints(const std::vector<parser::TableConstraint>& constraints) const
{
    Array primary_keys{};
    Array uniques{};
    Array checks{};
    Array references{};

    for (const auto& constraint : constraints) {
        std::visit(
            [&](const auto& held) {
                using Held = std::decay_t<decltype(held)>;
                if (!held.constraint_name) {
                    return;
                }
                if constexpr (std::is_same_v<Held, parser::PrimaryKeyConstraint>) {
                    primary_keys.push_back(key_value(held.constraint_name, held.columns));
                } else if constexpr (std::is_same_v<Held, parser::UniqueConstraint>) {
                    uniques.push_back(key_value(held.constraint_name, held.columns));
                } else if constexpr (std::is_same_v<Held, parser::CheckConstraint>) {
                    checks.push_back(check_value(held));
                } else {
                    Value entry = key_value(held.constraint_name, held.local_columns);
                    Value reference = normalize_reference(held.reference);
                    reference.set("columns", string_array(held.reference_columns));
                    entry.set("references", std::move(reference));
                    references.push_back(std::move(entry));
                }
            },
            constraint);
    }

    Value entry{};
    if (!primary_keys.empty()) {
        entry.set("primary_keys", Value{std::move(primary_keys)});
    }
    if (!uniques.empty()) {
        entry.set("uniques", Value{std::move(uniques)});
    }
    if (!checks.empty()) {
        entry.set("checks", Value{std::move(checks)});
    }
    if (!references.empty()) {
        entry.set("references", Value{std::move(references)});
    }
    return entry;
}

Value OutputNormalizer::normalize_table(const parser::CreateTableStatement& table) const
{
    Value entry{Object{}};

    Array columns{};
    for (const auto& column : table.columns) {
        columns.push_back(normalize_column(column));
    }
    entry.set("columns", Value{std::move(columns)});
    entry.set("primary_key", string_array(table.primary_key));
    entry.set("alter", normalize_alter(table.alter));

    Array checks{};
    for (const auto& check : table.checks) {
        checks.push_back(check_value(check));
    }
    entry.set("checks", Value{std::move(checks)});

    Array indexes{};
    for (const auto& index : table.indexes) {
        indexes.push_back(index_value(index));
    }
    entry.set("index", Value{std::move(indexes)});

    Array partitioned{};
    for (const auto& column : table.partitioned_by) {
        partitioned.push_back(normalize_column(column));
    }
    entry.set("partitioned_by", Value{std::move(partitioned)});
    entry.set("tablespace", optional_string(table.tablespace));
    entry.set("schema", optional_string(table.schema));
    entry.set("table_name", table.table_name);

    if (table.if_not_exists) {
        entry.set("if_not_exists", true);
    }
    if (table.replace) {
        entry.set("replace", true);
    }
    if (table.temp) {
        entry.set("temp", true);
    }
    if (auto constraints = normalize_constraints(table.constraints); !constraints.is_null()) {
        entry.set("constraints", std::move(constraints));
    }
    if (table.like) {
        Value like{Object{}};
        like.set("schema", optional_string(table.like->schema));
        like.set("table_name", table.like->table_name);
        entry.set("like", std::move(like));
    }
    if (table.partition_by) {
        Value partition{Object{}};
        partition.set("type", table.partition_by->type);
        partition.set("columns", string_array(table.partition_by->columns));
        entry.set("partition_by", std::move(partition));
    }
    if (!table.inherits.empty()) {
        entry.set("inherits", string_array(table.inherits));
    }
    if (!table.table_properties.empty()) {
        entry.set("table_properties", property_object(table.table_properties));
    }

    if (mode_ == OutputMode::Sql) {
        if (table.comment) {
            entry.set("comment", *table.comment);
        }
        return entry;
    }

    const auto& hql = table.hql;
    entry.set("external", hql.external);
    entry.set("stored_as", optional_string(hql.stored_as));
    entry.set("location", optional_string(hql.location));
    entry.set("row_format", optional_string(hql.row_format));
    entry.set("serde", optional_string(hql.serde));
    entry.set("fields_terminated_by", optional_string(hql.fields_terminated_by));
    entry.set("collection_items_terminated_by", optional_string(hql.collection_items_terminated_by));
    entry.set("map_keys_terminated_by", optional_string(hql.map_keys_terminated_by));
    entry.set("lines_terminated_by", optional_string(hql.lines_terminated_by));
    entry.set("comment", optional_string(table.comment));
    entry.set("clustered_by", hql.clustered_by.empty() ? Value{} : string_array(hql.clustered_by));
    entry.set("into_buckets", optional_integer(hql.into_buckets));
    entry.set("tblproperties", hql.tblproperties.empty() ? Value{} : property_object(hql.tblproperties));
    return entry;
}

Value OutputNormalizer::normalize_sequence(const parser::CreateSequenceStatement& sequence) const
{
    Value entry{Object{}};
    entry.set("sequence_name", sequence.sequence_name);
    entry.set("schema", optional_string(sequence.schema));
    if (sequence.if_not_exists) {
        entry.set("if_not_exists", true);
    }
    if (sequence.data_type) {
        entry.set("data_type", *sequence.data_type);
    }
    if (sequence.increment) {
        entry.set("increment", *sequence.increment);
    }
    if (sequence.start) {
        entry.set("start", *sequence.start);
    }
    if (sequence.minvalue) {
        entry.set("minvalue", *sequence.minvalue);
    }
    if (sequence.maxvalue) {
        entry.set("maxvalue", *sequence.maxvalue);
    }
    if (sequence.cache) {
        entry.set("cache", *sequence.cache);
    }
    if (sequence.cycle) {
        entry.set("cycle", *sequence.cycle);
    }
    if (sequence.owned_by) {
        entry.set("owned_by", *sequence.owned_by);
    }
    return entry;
}

Value OutputNormalizer::normalize_unresolved(const parser::UnresolvedAlter& alter) const
{
    Value entry{Object{}};
    entry.set("table_name", alter.table_name);
    entry.set("schema", optional_string(alter.schema));
    entry.set("alter", normalize_alter(alter.alter));
    entry.set("unresolved", true);
    return entry;
}

Value OutputNormalizer::normalize_unresolved(const parser::UnresolvedIndex& index) const
{
    Value entry = index_value(index.index);
    entry.set("table_name", index.table_name);
    entry.set("schema", optional_string(index.schema));
    entry.set("unresolved", true);
    return entry;
}

}  // namespace schemer::output
