#include "schemer/parser/keyword_table.hpp"

#include <iterator>
#include <unordered_map>

namespace schemer::parser {

namespace {

constexpr std::uint8_t role(KeywordRole value) noexcept
{
    return static_cast<std::uint8_t>(value);
}

constexpr std::uint8_t kColumn = role(KeywordRole::ColumnAttribute);
constexpr std::uint8_t kTable = role(KeywordRole::TableClause);
constexpr std::uint8_t kModifier = role(KeywordRole::TypeModifier);
constexpr std::uint8_t kSequence = role(KeywordRole::SequenceOption);

struct KeywordEntry final {
    std::string_view word;
    KeywordCategory category;
    std::uint8_t roles;
};

constexpr auto kReserved = KeywordCategory::ReservedWord;
constexpr auto kType = KeywordCategory::TypeName;
constexpr auto kDialect = KeywordCategory::DialectClauseWord;

// clang-format off
constexpr KeywordEntry kEntries[] = {
    // statement and constraint vocabulary shared by every dialect
    {"ACTION", kReserved, 0U},
    {"ADD", kReserved, 0U},
    {"ALTER", kReserved, 0U},
    {"ALWAYS", kReserved, 0U},
    {"AND", kReserved, 0U},
    {"AS", kReserved, 0U},
    {"ASC", kReserved, 0U},
    {"AUTHORIZATION", kReserved, 0U},
    {"BETWEEN", kReserved, 0U},
    {"BY", kReserved, 0U},
    {"CACHE", kReserved, kSequence},
    {"CASCADE", kReserved, 0U},
    {"CASE", kReserved, 0U},
    {"CHECK", kReserved, kColumn},
    {"COLLATE", kReserved, kColumn | kTable},
    {"COLUMN", kReserved, 0U},
    {"CONCURRENTLY", kReserved, 0U},
    {"CONSTRAINT", kReserved, kColumn},
    {"CREATE", kReserved, 0U},
    {"CURRENT_DATE", kReserved, 0U},
    {"CURRENT_TIME", kReserved, 0U},
    {"CURRENT_TIMESTAMP", kReserved, 0U},
    {"CYCLE", kReserved, kSequence},
    {"DEFAULT", kReserved, kColumn | kTable},
    {"DEFERRABLE", kReserved, kColumn},
    {"DEFERRED", kReserved, 0U},
    {"DELETE", kReserved, 0U},
    {"DESC", kReserved, 0U},
    {"DISTINCT", kReserved, 0U},
    {"DROP", kReserved, 0U},
    {"ELSE", kReserved, 0U},
    {"END", kReserved, 0U},
    {"EXISTS", kReserved, 0U},
    {"FALSE", kReserved, 0U},
    {"FIRST", kReserved, 0U},
    {"FOR", kReserved, 0U},
    {"FOREIGN", kReserved, 0U},
    {"FULL", kReserved, 0U},
    {"GENERATED", kReserved, kColumn},
    {"IDENTITY", kReserved, kColumn},
    {"IF", kReserved, 0U},
    {"IMMEDIATE", kReserved, 0U},
    {"IN", kReserved, 0U},
    {"INCREMENT", kReserved, kSequence},
    {"INDEX", kReserved, 0U},
    {"INITIALLY", kReserved, kColumn},
    {"IS", kReserved, 0U},
    {"KEY", kReserved, 0U},
    {"LAST", kReserved, 0U},
    {"LIKE", kReserved, kTable},
    {"MATCH", kReserved, 0U},
    {"MAX", kReserved, 0U},
    {"MAXVALUE", kReserved, kSequence},
    {"MINVALUE", kReserved, kSequence},
    {"MODIFY", kReserved, 0U},
    {"NO", kReserved, kSequence},
    {"NOT", kReserved, kColumn},
    {"NULL", kReserved, kColumn},
    {"NULLS", kReserved, 0U},
    {"ON", kReserved, kColumn},
    {"ONLY", kReserved, 0U},
    {"OR", kReserved, 0U},
    {"OWNED", kReserved, kSequence},
    {"PARTIAL", kReserved, 0U},
    {"PRIMARY", kReserved, kColumn},
    {"REFERENCES", kReserved, kColumn},
    {"RENAME", kReserved, 0U},
    {"REPLACE", kReserved, 0U},
    {"RESTRICT", kReserved, 0U},
    {"SEQUENCE", kReserved, 0U},
    {"SET", kReserved, 0U},
    {"SIMPLE", kReserved, 0U},
    {"START", kReserved, kSequence},
    {"TABLE", kReserved, 0U},
    {"TEMP", kReserved, 0U},
    {"TEMPORARY", kReserved, 0U},
    {"THEN", kReserved, 0U},
    {"TO", kReserved, 0U},
    {"TRUE", kReserved, 0U},
    {"UNIQUE", kReserved, kColumn},
    {"UPDATE", kReserved, 0U},
    {"USING", kReserved, 0U},
    {"WHEN", kReserved, 0U},
    {"WITH", kReserved, kTable},

    // type names and type modifiers
    {"ARRAY", kType, 0U},
    {"BIGINT", kType, 0U},
    {"BIGSERIAL", kType, 0U},
    {"BINARY", kType, 0U},
    {"BIT", kType, 0U},
    {"BLOB", kType, 0U},
    {"BOOL", kType, 0U},
    {"BOOLEAN", kType, 0U},
    {"BYTEA", kType, 0U},
    {"CHAR", kType, 0U},
    {"CHARACTER", kType, kColumn | kTable},
    {"CLOB", kType, 0U},
    {"DATE", kType, 0U},
    {"DATETIME", kType, 0U},
    {"DECIMAL", kType, 0U},
    {"DOUBLE", kType, 0U},
    {"ENUM", kType, 0U},
    {"FLOAT", kType, 0U},
    {"INT", kType, 0U},
    {"INTEGER", kType, 0U},
    {"INTERVAL", kType, 0U},
    {"JSON", kType, 0U},
    {"JSONB", kType, 0U},
    {"LONGTEXT", kType, 0U},
    {"MAP", kType, 0U},
    {"MEDIUMINT", kType, 0U},
    {"MEDIUMTEXT", kType, 0U},
    {"MONEY", kType, 0U},
    {"NCHAR", kType, 0U},
    {"NUMBER", kType, 0U},
    {"NUMERIC", kType, 0U},
    {"NVARCHAR", kType, 0U},
    {"PRECISION", kType, kModifier},
    {"REAL", kType, 0U},
    {"SERIAL", kType, 0U},
    {"SIGNED", kType, kModifier},
    {"SMALLINT", kType, 0U},
    {"SMALLSERIAL", kType, 0U},
    {"STRING", kType, 0U},
    {"STRUCT", kType, 0U},
    {"TEXT", kType, 0U},
    {"TIME", kType, 0U},
    {"TIMESTAMP", kType, 0U},
    {"TIMESTAMPTZ", kType, 0U},
    {"TINYINT", kType, 0U},
    {"TINYTEXT", kType, 0U},
    {"UNSIGNED", kType, kModifier},
    {"UUID", kType, 0U},
    {"VARBINARY", kType, 0U},
    {"VARCHAR", kType, 0U},
    {"VARCHAR2", kType, 0U},
    {"VARYING", kType, kModifier},
    {"WITHOUT", kType, 0U},
    {"XML", kType, 0U},
    {"ZEROFILL", kType, kModifier},
    {"ZONE", kType, 0U},

    // dialect clause vocabulary: Hive/HQL
    {"BUCKETS", kDialect, 0U},
    {"CLUSTERED", kDialect, kTable},
    {"COLLECTION", kDialect, 0U},
    {"DELIMITED", kDialect, 0U},
    {"EXTERNAL", kDialect, 0U},
    {"FIELDS", kDialect, 0U},
    {"FORMAT", kDialect, 0U},
    {"INTO", kDialect, 0U},
    {"ITEMS", kDialect, 0U},
    {"KEYS", kDialect, 0U},
    {"LINES", kDialect, 0U},
    {"LOCATION", kDialect, kTable},
    {"PARTITIONED", kDialect, kTable},
    {"ROW", kDialect, kTable},
    {"SERDE", kDialect, 0U},
    {"SERDEPROPERTIES", kDialect, 0U},
    {"SORTED", kDialect, 0U},
    {"STORED", kDialect, kTable},
    {"TBLPROPERTIES", kDialect, kTable},
    {"TERMINATED", kDialect, 0U},

    // MySQL
    {"AUTO_INCREMENT", kDialect, kColumn | kTable},
    {"CHARSET", kDialect, kTable},
    {"ENGINE", kDialect, kTable},

    // PostgreSQL, Oracle, SQLite, T-SQL
    {"AUTOINCREMENT", kDialect, kColumn},
    {"CLUSTER", kDialect, kTable},
    {"COMMENT", kDialect, kColumn | kTable},
    {"HASH", kDialect, 0U},
    {"INHERITS", kDialect, kTable},
    {"LIST", kDialect, 0U},
    {"NONCLUSTERED", kDialect, 0U},
    {"OPTIONS", kDialect, kTable},
    {"PARTITION", kDialect, kTable},
    {"RANGE", kDialect, 0U},
    {"SERVER", kDialect, kTable},
    {"TABLESPACE", kDialect, kTable},

    // Redshift distribution clauses; recognized as boundaries only
    {"DISTKEY", kDialect, kTable},
    {"DISTSTYLE", kDialect, kTable},
    {"SORTKEY", kDialect, kTable},
};
// clang-format on

const std::unordered_map<std::string_view, KeywordInfo>& keyword_map()
{
    static const std::unordered_map<std::string_view, KeywordInfo> map = [] {
        std::unordered_map<std::string_view, KeywordInfo> entries;
        entries.reserve(std::size(kEntries));
        for (const auto& entry : kEntries) {
            entries.emplace(entry.word, KeywordInfo{entry.category, entry.roles});
        }
        return entries;
    }();
    return map;
}

}  // namespace

KeywordInfo lookup_keyword(std::string_view normalized) noexcept
{
    const auto& map = keyword_map();
    const auto it = map.find(normalized);
    if (it == map.end()) {
        return {};
    }
    return it->second;
}

KeywordCategory classify_keyword(std::string_view normalized) noexcept
{
    return lookup_keyword(normalized).category;
}

bool has_keyword_role(std::string_view normalized, KeywordRole role) noexcept
{
    return lookup_keyword(normalized).has_role(role);
}

std::string_view keyword_category_name(KeywordCategory category) noexcept
{
    switch (category) {
    case KeywordCategory::ReservedWord:
        return "reserved_word";
    case KeywordCategory::TypeName:
        return "type_name";
    case KeywordCategory::DialectClauseWord:
        return "dialect_clause_word";
    case KeywordCategory::None:
    default:
        return "none";
    }
}

}  // namespace schemer::parser
