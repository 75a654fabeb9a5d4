#include "schemer/tools/parse_log_formatter.hpp"

#include "schemer/ddl_parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace schemer;

TEST_CASE("format_parse_log_json emits the summary fields in order")
{
    tools::ParseLogEntry entry{};
    entry.source = "schemas/orders.sql";
    entry.output_mode = output::OutputMode::Hql;
    entry.success = true;
    entry.statements = 3U;
    entry.records = 2U;
    entry.duration_ms = 1.5;

    const auto json = format_parse_log_json(entry);
    CAPTURE(json);
    CHECK(json.rfind(R"({"source":"schemas/orders.sql","output_mode":"hql","success":true,"statements":3,"records":2,)", 0U)
          == 0U);
    CHECK(json.find(R"("duration_ms":1.500000)") != std::string::npos);
    CHECK(json.find(R"("started_at":null,"finished_at":null)") != std::string::npos);
    CHECK(json.find(R"("diagnostics":[]})") != std::string::npos);
}

TEST_CASE("format_parse_log_json renders ISO-8601 timestamps")
{
    tools::ParseLogEntry entry{};
    entry.started_at = std::chrono::system_clock::time_point{std::chrono::seconds{86'400}};
    entry.finished_at = entry.started_at + std::chrono::microseconds{250};

    const auto json = format_parse_log_json(entry);
    CAPTURE(json);
    CHECK(json.find(R"("started_at":"1970-01-02T00:00:00.000000Z")") != std::string::npos);
    CHECK(json.find(R"("finished_at":"1970-01-02T00:00:00.000250Z")") != std::string::npos);
}

TEST_CASE("format_parse_log_json includes parser diagnostics")
{
    const auto output = parse("CREATE TABLE a (x INT);\nCREATE VIEW v AS SELECT \"q\";");
    REQUIRE(output.diagnostics.size() == 1U);

    tools::ParseLogEntry entry{};
    entry.source = "inline";
    entry.success = output.success();
    entry.diagnostics = output.diagnostics;

    const auto json = format_parse_log_json(entry);
    CAPTURE(json);
    CHECK(json.find(R"("success":false)") != std::string::npos);
    CHECK(json.find(R"("severity":"error","code":"unknown statement kind")") != std::string::npos);
    CHECK(json.find(R"("line":2,"column":1,"statement_index":1)") != std::string::npos);
    CHECK(json.find(R"("statement":"CREATE VIEW v AS SELECT \"q\"")") != std::string::npos);
    CHECK(json.find(R"("remediation_hints":["Only CREATE TABLE)") != std::string::npos);
}
