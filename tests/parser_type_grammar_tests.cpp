#include "schemer/parser/type_grammar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace schemer::parser;

namespace {

TypeNode require_type(std::string_view text)
{
    auto result = parse_type(text);
    INFO(text);
    REQUIRE(result.success());
    return *result.ast;
}

}  // namespace

TEST_CASE("parse_type reads simple types with arguments")
{
    const auto varchar = require_type("varchar(50)");
    CHECK(varchar.kind == TypeKind::Simple);
    CHECK(varchar.name == "VARCHAR");
    CHECK(varchar.arguments == std::vector<std::string>{"50"});
    CHECK(canonical_type_string(varchar) == "VARCHAR(50)");
    CHECK(canonical_type_name(varchar) == "VARCHAR");

    const auto decimal = require_type("DECIMAL(10, 2)");
    CHECK(decimal.arguments == std::vector<std::string>{"10", "2"});
    CHECK(canonical_type_string(decimal) == "DECIMAL(10,2)");
}

TEST_CASE("parse_type folds multi-word types")
{
    CHECK(require_type("timestamp with time zone").name == "TIMESTAMP WITH TIME ZONE");
    CHECK(require_type("TIME WITHOUT TIME ZONE").name == "TIME WITHOUT TIME ZONE");
    CHECK(require_type("double precision").name == "DOUBLE PRECISION");
    CHECK(require_type("INT UNSIGNED").name == "INT UNSIGNED");
    CHECK(canonical_type_string(require_type("CHARACTER VARYING(20)")) == "CHARACTER VARYING(20)");
}

TEST_CASE("parse_type keeps user-defined and qualified names")
{
    const auto node = require_type("app.Mood");
    CHECK(node.name == "app.Mood");
    CHECK(canonical_type_string(node) == "app.Mood");
}

TEST_CASE("parse_type records array dimensions")
{
    CHECK(canonical_type_string(require_type("int[]")) == "INT[]");
    CHECK(canonical_type_string(require_type("INT[2][3]")) == "INT[2][3]");
    CHECK(canonical_type_string(require_type("text ARRAY")) == "TEXT[]");
    CHECK(canonical_type_string(require_type("text ARRAY[4]")) == "TEXT[4]");

    const auto node = require_type("INT[]");
    REQUIRE(node.dimensions.size() == 1U);
    CHECK_FALSE(node.dimensions.front().has_value());
}

TEST_CASE("parse_type builds nested type trees")
{
    const auto node = require_type("ARRAY<STRUCT<a: STRING, b: INT>>");
    CHECK(node.kind == TypeKind::Array);
    REQUIRE(node.children.size() == 1U);

    const auto& element = node.children.front();
    CHECK(element.kind == TypeKind::Struct);
    CHECK(element.field_names == std::vector<std::string>{"a", "b"});
    REQUIRE(element.children.size() == 2U);
    CHECK(element.children[0].name == "STRING");
    CHECK(element.children[1].name == "INT");
    CHECK(canonical_type_string(node) == "ARRAY<STRUCT<a:STRING,b:INT>>");

    const auto map = require_type("map<string, array<int>>");
    CHECK(map.kind == TypeKind::Map);
    CHECK(canonical_type_string(map) == "MAP<STRING,ARRAY<INT>>");
}

TEST_CASE("canonical nested type strings reparse to the same tree")
{
    for (const auto* text : {"STRUCT<a: STRING, b: INT>",
                             "MAP<STRING, STRUCT<x: DECIMAL(10, 2), y: ARRAY<INT>>>",
                             "ARRAY<MAP<INT,INT>>",
                             "STRUCT<note: STRING COMMENT 'free text', id: BIGINT>"}) {
        INFO(text);
        const auto first = require_type(text);
        const auto second = require_type(canonical_type_string(first));
        CHECK(first == second);
        CHECK(canonical_type_string(second) == canonical_type_string(first));
    }
}

TEST_CASE("parse_type reports malformed types")
{
    const auto unclosed = parse_type("STRUCT<a INT");
    REQUIRE_FALSE(unclosed.success());
    CHECK(unclosed.diagnostics.front().code == ParseErrc::UnexpectedEnd);

    const auto trailing = parse_type("INT garbage");
    REQUIRE_FALSE(trailing.success());
    CHECK(trailing.diagnostics.front().code == ParseErrc::UnexpectedToken);

    const auto empty = parse_type("");
    REQUIRE_FALSE(empty.success());
    CHECK(empty.diagnostics.front().code == ParseErrc::UnexpectedEnd);
}
