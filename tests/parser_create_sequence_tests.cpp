#include "schemer/ddl_parser.hpp"
#include "schemer/parser/grammar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace schemer::parser;

TEST_CASE("a sequence with one option emits only that option")
{
    const auto output = schemer::parse("CREATE SEQUENCE seq START 1;");
    REQUIRE(output.success());
    REQUIRE(output.records.size() == 1U);

    const auto& record = output.records.front();
    CHECK(record.keys() == std::vector<std::string>{"sequence_name", "schema", "start"});
    CHECK(record.at("sequence_name").as_string() == "seq");
    CHECK(record.at("schema").is_null());
    CHECK(record.at("start").as_integer() == 1);
}

TEST_CASE("parse_create_sequence reads every option")
{
    const auto result = parse_create_sequence(
        "CREATE SEQUENCE IF NOT EXISTS app.order_seq AS BIGINT INCREMENT BY 5 START WITH 100 "
        "MINVALUE 1 MAXVALUE 100000 CACHE 20 CYCLE OWNED BY orders.id");
    REQUIRE(result.success());
    CHECK(result.diagnostics.empty());

    const auto& sequence = *result.ast;
    CHECK(sequence.if_not_exists);
    CHECK(sequence.schema == std::optional<std::string>{"app"});
    CHECK(sequence.sequence_name == "order_seq");
    CHECK(sequence.data_type == std::optional<std::string>{"BIGINT"});
    CHECK(sequence.increment == std::optional<std::int64_t>{5});
    CHECK(sequence.start == std::optional<std::int64_t>{100});
    CHECK(sequence.minvalue == std::optional<std::int64_t>{1});
    CHECK(sequence.maxvalue == std::optional<std::int64_t>{100000});
    CHECK(sequence.cache == std::optional<std::int64_t>{20});
    CHECK(sequence.cycle == std::optional<bool>{true});
    CHECK(sequence.owned_by == std::optional<std::string>{"orders.id"});
}

TEST_CASE("NO options clear bounds and disable cycling")
{
    const auto result = parse_create_sequence("CREATE SEQUENCE s MINVALUE 5 NO MINVALUE NO MAXVALUE NO CYCLE");
    REQUIRE(result.success());
    CHECK_FALSE(result.ast->minvalue.has_value());
    CHECK_FALSE(result.ast->maxvalue.has_value());
    CHECK(result.ast->cycle == std::optional<bool>{false});
}

TEST_CASE("sequence options accept negative values")
{
    const auto result = parse_create_sequence("CREATE SEQUENCE countdown INCREMENT BY -1 START WITH -10 MINVALUE -100");
    REQUIRE(result.success());
    CHECK(result.ast->increment == std::optional<std::int64_t>{-1});
    CHECK(result.ast->start == std::optional<std::int64_t>{-10});
    CHECK(result.ast->minvalue == std::optional<std::int64_t>{-100});
}

TEST_CASE("repeated sequence options warn and keep the last value")
{
    const auto result = parse_create_sequence("CREATE SEQUENCE s START 1 START 2");
    REQUIRE(result.success());
    CHECK(result.ast->start == std::optional<std::int64_t>{2});
    REQUIRE(result.diagnostics.size() == 1U);
    CHECK(result.diagnostics.front().severity == ParserSeverity::Warning);
    CHECK(result.diagnostics.front().code == ParseErrc::UnexpectedToken);
}

TEST_CASE("unknown sequence options are skipped with a warning")
{
    const auto result = parse_create_sequence("CREATE SEQUENCE s NOORDER START 3");
    REQUIRE(result.success());
    CHECK(result.ast->start == std::optional<std::int64_t>{3});
    REQUIRE(result.diagnostics.size() == 1U);
    CHECK(result.diagnostics.front().code == ParseErrc::UnknownClause);
}

TEST_CASE("invalid sequence numbers fail the statement")
{
    const auto overflow = parse_create_sequence("CREATE SEQUENCE s MAXVALUE 99999999999999999999");
    REQUIRE_FALSE(overflow.success());
    CHECK(overflow.diagnostics.front().code == ParseErrc::InvalidNumber);

    const auto fractional = parse_create_sequence("CREATE SEQUENCE s CACHE 1.5");
    REQUIRE_FALSE(fractional.success());
    CHECK(fractional.diagnostics.front().code == ParseErrc::InvalidNumber);

    const auto missing = parse_create_sequence("CREATE SEQUENCE s START WITH");
    REQUIRE_FALSE(missing.success());
    CHECK(missing.diagnostics.front().code == ParseErrc::UnexpectedEnd);
}
