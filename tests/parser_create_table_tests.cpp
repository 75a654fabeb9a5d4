#include "schemer/parser/grammar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>

using namespace schemer::parser;

namespace {

CreateTableStatement require_table(std::string_view sql)
{
    auto result = parse_create_table(sql);
    INFO(sql);
    REQUIRE(result.success());
    return std::move(*result.ast);
}

const ColumnDefinition& column_named(const CreateTableStatement& table, std::string_view name)
{
    for (const auto& column : table.columns) {
        if (column.name == name) {
            return column;
        }
    }
    FAIL("column " << name << " not found");
    return table.columns.front();
}

bool has_code(const std::vector<ParserDiagnostic>& diagnostics, ParseErrc code)
{
    for (const auto& diagnostic : diagnostics) {
        if (diagnostic.code == code) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("parse_create_table reads a basic column list")
{
    const auto result = parse_create_table(R"(CREATE TABLE users (
    id SERIAL PRIMARY KEY,
    email VARCHAR(255) NOT NULL UNIQUE,
    score DECIMAL(10, 2) DEFAULT 0,
    bio TEXT
);)");
    REQUIRE(result.success());
    CHECK(result.diagnostics.empty());

    const auto& table = *result.ast;
    CHECK(table.table_name == "users");
    CHECK_FALSE(table.schema.has_value());
    REQUIRE(table.columns.size() == 4U);
    CHECK(table.primary_key == std::vector<std::string>{"id"});

    const auto& id = table.columns[0];
    CHECK(id.type == "SERIAL");
    CHECK(std::holds_alternative<std::monostate>(id.size));
    CHECK(id.primary_key);
    CHECK_FALSE(id.nullable);

    const auto& email = table.columns[1];
    CHECK(email.type == "VARCHAR");
    REQUIRE(std::holds_alternative<std::int64_t>(email.size));
    CHECK(std::get<std::int64_t>(email.size) == 255);
    CHECK_FALSE(email.nullable);
    CHECK(email.unique);

    const auto& score = table.columns[2];
    CHECK(score.type == "DECIMAL");
    REQUIRE(std::holds_alternative<std::pair<std::int64_t, std::int64_t>>(score.size));
    CHECK(std::get<std::pair<std::int64_t, std::int64_t>>(score.size) == std::pair<std::int64_t, std::int64_t>{10, 2});
    CHECK(score.default_value == std::optional<std::string>{"0"});

    const auto& bio = table.columns[3];
    CHECK(bio.type == "TEXT");
    CHECK(bio.nullable);
    CHECK_FALSE(bio.default_value.has_value());
}

TEST_CASE("column-level and table-level primary keys are equivalent")
{
    const auto inline_key = require_table("CREATE TABLE t (id INT PRIMARY KEY, name TEXT)");
    const auto table_key = require_table("CREATE TABLE t (id INT, name TEXT, PRIMARY KEY (id))");

    CHECK(inline_key.primary_key == table_key.primary_key);
    CHECK_FALSE(column_named(table_key, "id").nullable);
    CHECK(column_named(table_key, "name").nullable);
}

TEST_CASE("composite primary keys keep declaration order")
{
    const auto table = require_table("CREATE TABLE line_items (order_id INT, line_no INT, PRIMARY KEY (order_id, line_no))");
    CHECK(table.primary_key == std::vector<std::string>{"order_id", "line_no"});
    CHECK_FALSE(column_named(table, "order_id").nullable);
    CHECK_FALSE(column_named(table, "line_no").nullable);
}

TEST_CASE("foreign keys attach references to their columns")
{
    const auto table = require_table(R"(CREATE TABLE orders (
    id INT PRIMARY KEY,
    customer_id INT REFERENCES customers (id) ON DELETE SET NULL,
    product_id INT,
    owner_id INT REFERENCES users,
    CONSTRAINT fk_product FOREIGN KEY (product_id) REFERENCES shop.products (id) ON UPDATE CASCADE
))");

    const auto& customer = column_named(table, "customer_id");
    REQUIRE(customer.references.has_value());
    CHECK(customer.references->table == "customers");
    CHECK(customer.references->column == std::optional<std::string>{"id"});
    CHECK(customer.references->on_delete == std::optional<std::string>{"SET NULL"});
    CHECK_FALSE(customer.references->on_update.has_value());

    const auto& owner = column_named(table, "owner_id");
    REQUIRE(owner.references.has_value());
    CHECK(owner.references->table == "users");
    CHECK_FALSE(owner.references->column.has_value());

    const auto& product = column_named(table, "product_id");
    REQUIRE(product.references.has_value());
    CHECK(product.references->schema == std::optional<std::string>{"shop"});
    CHECK(product.references->table == "products");
    CHECK(product.references->column == std::optional<std::string>{"id"});
    CHECK(product.references->on_update == std::optional<std::string>{"CASCADE"});

    REQUIRE(table.constraints.size() == 1U);
    const auto* foreign_key = std::get_if<ForeignKeyConstraint>(&table.constraints.front());
    REQUIRE(foreign_key != nullptr);
    CHECK(foreign_key->constraint_name == std::optional<std::string>{"fk_product"});
    CHECK(foreign_key->local_columns == std::vector<std::string>{"product_id"});
}

TEST_CASE("deferrable references record their initial mode")
{
    const auto table = require_table(
        "CREATE TABLE a (b_id INT REFERENCES b (id) DEFERRABLE INITIALLY DEFERRED)");
    const auto& column = column_named(table, "b_id");
    REQUIRE(column.references.has_value());
    CHECK(column.references->deferrable_initially == std::optional<std::string>{"DEFERRED"});
}

TEST_CASE("unique table constraints mark every listed column")
{
    const auto table = require_table("CREATE TABLE t (a INT, b INT, c INT, CONSTRAINT uq_ab UNIQUE (a, b))");
    CHECK(column_named(table, "a").unique);
    CHECK(column_named(table, "b").unique);
    CHECK_FALSE(column_named(table, "c").unique);

    REQUIRE(table.constraints.size() == 1U);
    const auto* unique = std::get_if<UniqueConstraint>(&table.constraints.front());
    REQUIRE(unique != nullptr);
    CHECK(unique->constraint_name == std::optional<std::string>{"uq_ab"});
}

TEST_CASE("check constraints keep their rendered expression")
{
    const auto table = require_table(
        "CREATE TABLE p (price INT CHECK (price > 0), qty INT, CONSTRAINT qty_positive CHECK (qty > 0))");
    CHECK(column_named(table, "price").check == std::optional<std::string>{"price > 0"});
    CHECK_FALSE(column_named(table, "qty").check.has_value());

    REQUIRE(table.checks.size() == 1U);
    CHECK(table.checks.front().constraint_name == std::optional<std::string>{"qty_positive"});
    CHECK(table.checks.front().statement == "qty > 0");
}

TEST_CASE("defaults are rendered as SQL text")
{
    const auto table = require_table(R"(CREATE TABLE d (
    label TEXT DEFAULT 'x',
    seq_id BIGINT DEFAULT nextval('seq'),
    counter INT DEFAULT ((0)),
    note TEXT DEFAULT NULL
))");
    CHECK(column_named(table, "label").default_value == std::optional<std::string>{"'x'"});
    CHECK(column_named(table, "seq_id").default_value == std::optional<std::string>{"nextval('seq')"});
    CHECK(column_named(table, "counter").default_value == std::optional<std::string>{"((0))"});
    CHECK(column_named(table, "note").default_value == std::optional<std::string>{"NULL"});
}

TEST_CASE("generated columns and identity columns")
{
    const auto table = require_table(R"(CREATE TABLE line (
    id INT GENERATED BY DEFAULT AS IDENTITY,
    price INT,
    qty INT,
    total INT GENERATED ALWAYS AS (price * qty) STORED
))");
    CHECK(column_named(table, "id").autoincrement);
    CHECK_FALSE(column_named(table, "id").generated_as.has_value());
    CHECK(column_named(table, "total").generated_as == std::optional<std::string>{"price * qty"});
}

TEST_CASE("MySQL column attributes and table options")
{
    const auto result = parse_create_table(R"(CREATE TABLE `shop`.`orders` (
    `id` INT(11) NOT NULL AUTO_INCREMENT,
    `status` VARCHAR(20) CHARACTER SET utf8mb4 COLLATE utf8mb4_bin DEFAULT 'new' COMMENT 'order state',
    `updated_at` TIMESTAMP DEFAULT CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP,
    PRIMARY KEY (`id`),
    KEY `status_idx` (`status`)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 AUTO_INCREMENT=100)");
    REQUIRE(result.success());
    CHECK(result.diagnostics.empty());

    const auto& table = *result.ast;
    CHECK(table.schema == std::optional<std::string>{"shop"});
    CHECK(table.table_name == "orders");
    CHECK(table.primary_key == std::vector<std::string>{"id"});

    const auto& id = column_named(table, "id");
    CHECK(id.type == "INT");
    CHECK(std::get<std::int64_t>(id.size) == 11);
    CHECK(id.autoincrement);
    CHECK_FALSE(id.nullable);

    const auto& status = column_named(table, "status");
    CHECK(status.character_set == std::optional<std::string>{"utf8mb4"});
    CHECK(status.collate == std::optional<std::string>{"utf8mb4_bin"});
    CHECK(status.default_value == std::optional<std::string>{"'new'"});
    CHECK(status.comment == std::optional<std::string>{"'order state'"});

    const auto& updated = column_named(table, "updated_at");
    CHECK(updated.default_value == std::optional<std::string>{"CURRENT_TIMESTAMP"});
    CHECK(updated.on_update == std::optional<std::string>{"CURRENT_TIMESTAMP"});

    REQUIRE(table.indexes.size() == 1U);
    CHECK(table.indexes.front().index_name == "status_idx");
    REQUIRE(table.indexes.front().columns.size() == 1U);
    CHECK(table.indexes.front().columns.front().name == "status");

    const PropertyList expected{{"engine", "InnoDB"}, {"charset", "utf8mb4"}, {"auto_increment", "100"}};
    CHECK(table.table_properties == expected);
}

TEST_CASE("T-SQL bracketed names identity and clustered keys")
{
    const auto result = parse_create_table(R"(CREATE TABLE [dbo].[accounts] (
    [id] INT IDENTITY(1,1) NOT NULL,
    [name] NVARCHAR(MAX) NULL,
    CONSTRAINT [PK_accounts] PRIMARY KEY CLUSTERED ([id] ASC)
))");
    REQUIRE(result.success());
    CHECK(result.diagnostics.empty());

    const auto& table = *result.ast;
    CHECK(table.schema == std::optional<std::string>{"dbo"});
    CHECK(table.table_name == "accounts");
    CHECK(table.primary_key == std::vector<std::string>{"id"});
    CHECK(column_named(table, "id").autoincrement);

    const auto& name = column_named(table, "name");
    CHECK(name.type == "NVARCHAR");
    REQUIRE(std::holds_alternative<std::string>(name.size));
    CHECK(std::get<std::string>(name.size) == "MAX");
    CHECK(name.nullable);

    REQUIRE(table.constraints.size() == 1U);
    const auto* primary_key = std::get_if<PrimaryKeyConstraint>(&table.constraints.front());
    REQUIRE(primary_key != nullptr);
    CHECK(primary_key->constraint_name == std::optional<std::string>{"PK_accounts"});
}

TEST_CASE("statement prefixes set table flags")
{
    const auto table = require_table("CREATE OR REPLACE TEMPORARY TABLE IF NOT EXISTS s.t (a INT)");
    CHECK(table.replace);
    CHECK(table.temp);
    CHECK(table.if_not_exists);
    CHECK(table.schema == std::optional<std::string>{"s"});

    const auto plain = require_table("CREATE TABLE t (a INT)");
    CHECK_FALSE(plain.replace);
    CHECK_FALSE(plain.temp);
    CHECK_FALSE(plain.if_not_exists);
}

TEST_CASE("CREATE TABLE LIKE copies no columns")
{
    const auto table = require_table("CREATE TABLE copy LIKE app.source");
    CHECK(table.columns.empty());
    REQUIRE(table.like.has_value());
    CHECK(table.like->schema == std::optional<std::string>{"app"});
    CHECK(table.like->table_name == "source");
}

TEST_CASE("PostgreSQL trailing clauses")
{
    const auto table = require_table(
        "CREATE TABLE child (a INT, created_at DATE) INHERITS (parent) WITH (fillfactor = 70) TABLESPACE fast");
    CHECK(table.inherits == std::vector<std::string>{"parent"});
    CHECK(table.table_properties == PropertyList{{"fillfactor", "70"}});
    CHECK(table.tablespace == std::optional<std::string>{"fast"});

    const auto partitioned = require_table("CREATE TABLE events (id INT, created_at DATE) PARTITION BY RANGE (created_at)");
    REQUIRE(partitioned.partition_by.has_value());
    CHECK(partitioned.partition_by->type == "RANGE");
    CHECK(partitioned.partition_by->columns == std::vector<std::string>{"created_at"});
}

TEST_CASE("duplicate columns and unknown key columns produce warnings")
{
    const auto duplicate = parse_create_table("CREATE TABLE t (a INT, A TEXT)");
    REQUIRE(duplicate.success());
    CHECK(has_code(duplicate.diagnostics, ParseErrc::DuplicateColumn));
    CHECK(duplicate.diagnostics.front().severity == ParserSeverity::Warning);

    const auto unknown = parse_create_table("CREATE TABLE t (a INT, PRIMARY KEY (b))");
    REQUIRE(unknown.success());
    CHECK(has_code(unknown.diagnostics, ParseErrc::UnknownKeyColumn));
    CHECK(unknown.ast->primary_key == std::vector<std::string>{"b"});
}

TEST_CASE("unknown attributes and clauses are skipped with warnings")
{
    const auto attribute = parse_create_table("CREATE TABLE t (a INT SPARSE NOT NULL)");
    REQUIRE(attribute.success());
    CHECK(has_code(attribute.diagnostics, ParseErrc::UnknownClause));
    CHECK_FALSE(attribute.ast->columns.front().nullable);

    const auto clause = parse_create_table("CREATE TABLE t (a INT) DISTSTYLE EVEN");
    REQUIRE(clause.success());
    CHECK(has_code(clause.diagnostics, ParseErrc::UnknownClause));
    CHECK(clause.ast->columns.size() == 1U);
}

TEST_CASE("CREATE TABLE without a column list fails")
{
    const auto result = parse_create_table("CREATE TABLE t");
    REQUIRE_FALSE(result.success());
    REQUIRE(result.diagnostics.size() == 1U);
    CHECK(result.diagnostics.front().severity == ParserSeverity::Error);
    CHECK(result.diagnostics.front().code == ParseErrc::MissingColumnList);
    CHECK_FALSE(result.diagnostics.front().remediation_hints.empty());
}

TEST_CASE("unbalanced column lists fail with an unexpected end")
{
    const auto result = parse_create_table("CREATE TABLE t (a INT, b VARCHAR(10)");
    REQUIRE_FALSE(result.success());
    CHECK(result.diagnostics.back().code == ParseErrc::UnexpectedEnd);
}

TEST_CASE("array columns keep cardinality in the type and leave size empty")
{
    const auto table = require_table("CREATE TABLE docs (tags TEXT ARRAY, slots TEXT ARRAY[3], ids int[], "
                                     "labels VARCHAR(20)[], grid INT[2][])");
    REQUIRE(table.columns.size() == 5U);

    const auto& tags = column_named(table, "tags");
    CHECK(tags.type == "TEXT[]");
    CHECK(std::holds_alternative<std::monostate>(tags.size));

    const auto& slots = column_named(table, "slots");
    CHECK(slots.type == "TEXT[3]");
    CHECK(std::holds_alternative<std::monostate>(slots.size));

    const auto& ids = column_named(table, "ids");
    CHECK(ids.type == "INT[]");
    CHECK(std::holds_alternative<std::monostate>(ids.size));

    const auto& labels = column_named(table, "labels");
    CHECK(labels.type == "VARCHAR[]");
    REQUIRE(std::holds_alternative<std::int64_t>(labels.size));
    CHECK(std::get<std::int64_t>(labels.size) == 20);

    const auto& grid = column_named(table, "grid");
    CHECK(grid.type == "INT[2][]");
    CHECK(std::holds_alternative<std::monostate>(grid.size));
}

TEST_CASE("checks keep binary minus apart from signed defaults")
{
    const auto table = require_table("CREATE TABLE stock (a INT DEFAULT -1 CHECK (a-1 > 0), b INT CHECK (b+2 < a * -3))");
    const auto& a = column_named(table, "a");
    REQUIRE(a.default_value.has_value());
    CHECK(*a.default_value == "-1");
    REQUIRE(a.check.has_value());
    CHECK(*a.check == "a - 1 > 0");

    const auto& b = column_named(table, "b");
    REQUIRE(b.check.has_value());
    CHECK(*b.check == "b + 2 < a * -3");
}
