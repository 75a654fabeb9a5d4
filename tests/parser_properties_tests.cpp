#include "schemer/ddl_parser.hpp"
#include "schemer/output/json_writer.hpp"
#include "schemer/parser/parser_telemetry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <string>
#include <thread>
#include <vector>

using namespace schemer;

namespace {

std::vector<output::Value> records_of(std::string_view sql)
{
    auto result = parse(sql);
    INFO(sql);
    REQUIRE(result.success());
    return result.records;
}

}  // namespace

TEST_CASE("keyword casing does not change the output")
{
    const auto lower = records_of(
        "create table if not exists shop.items (id int primary key, name varchar(40) not null default 'n/a', "
        "price decimal(8, 2) check (price >= 0), constraint uq_name unique (name));");
    const auto upper = records_of(
        "CREATE TABLE IF NOT EXISTS shop.items (id INT PRIMARY KEY, name VARCHAR(40) NOT NULL DEFAULT 'n/a', "
        "price DECIMAL(8, 2) CHECK (price >= 0), CONSTRAINT uq_name UNIQUE (name));");
    CHECK(lower == upper);
    CHECK(output::write_json(output::Value{output::Array(lower.begin(), lower.end())})
          == output::write_json(output::Value{output::Array(upper.begin(), upper.end())}));
}

TEST_CASE("table records share one key set regardless of content")
{
    const auto plain = records_of("CREATE TABLE a (x INT);");
    const auto rich = records_of(
        "CREATE TABLE b (y TEXT NOT NULL DEFAULT 'z' CHECK (y <> ''), z INT REFERENCES a (x));");
    REQUIRE(plain.size() == 1U);
    REQUIRE(rich.size() == 1U);
    CHECK(plain.front().keys() == rich.front().keys());

    const auto& plain_column = plain.front().at("columns").at(0U);
    const auto& rich_column = rich.front().at("columns").at(0U);
    CHECK(plain_column.keys() == rich_column.keys());
    CHECK(plain_column.keys()
          == std::vector<std::string>{"name", "type", "size", "references", "unique", "nullable", "default", "check"});
}

TEST_CASE("parsing is deterministic across calls")
{
    constexpr std::string_view sql = R"(CREATE TABLE t (id SERIAL PRIMARY KEY, payload JSONB DEFAULT '{}');
CREATE UNIQUE INDEX t_payload_idx ON t (payload);
ALTER TABLE t ADD CONSTRAINT t_chk CHECK (id > 0);
)";
    const auto first = records_of(sql);
    const auto second = records_of(sql);
    CHECK(first == second);
}

TEST_CASE("concurrent parse calls produce identical records")
{
    constexpr std::string_view sql = R"(CREATE TABLE t (id SERIAL PRIMARY KEY, tags TEXT[] DEFAULT '{}');
CREATE INDEX t_tags_idx ON t (tags);
CREATE SEQUENCE t_seq START 10 INCREMENT BY 5;
ALTER TABLE ghost ADD c INT;
)";
    constexpr std::size_t kThreads = 8U;
    constexpr std::size_t kIterations = 25U;

    const auto expected = records_of(sql);
    REQUIRE(expected.size() == 3U);

    parser::ParserTelemetry telemetry;
    ParseOptions options{};
    options.telemetry = &telemetry;

    std::vector<std::vector<output::Value>> results(kThreads);
    std::vector<std::size_t> mismatches(kThreads, 0U);
    std::vector<std::thread> workers;
    workers.reserve(kThreads);
    for (std::size_t worker = 0U; worker < kThreads; ++worker) {
        workers.emplace_back([&, worker]() {
            for (std::size_t iteration = 0U; iteration < kIterations; ++iteration) {
                auto result = parse(sql, options);
                if (!result.success() || result.records != expected) {
                    ++mismatches[worker];
                }
                results[worker] = std::move(result.records);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (std::size_t worker = 0U; worker < kThreads; ++worker) {
        CAPTURE(worker);
        CHECK(mismatches[worker] == 0U);
        CHECK(results[worker] == expected);
    }

    const auto snapshot = telemetry.snapshot();
    const auto runs = kThreads * kIterations;
    CHECK(snapshot.scripts_attempted == runs);
    CHECK(snapshot.scripts_succeeded == runs);
    CHECK(snapshot.lex_failures == 0U);
    CHECK(snapshot.statements_attempted == runs * 4U);
    CHECK(snapshot.statements_succeeded == runs * 4U);
    CHECK(snapshot.records_emitted == runs * 3U);
    CHECK(snapshot.unresolved_targets == runs);
    CHECK(snapshot.diagnostics_warning == runs);
    CHECK(snapshot.diagnostics_error == 0U);
}

TEST_CASE("canonical nested types reparse to the same type")
{
    const auto first = records_of("CREATE TABLE n (v ARRAY<STRUCT<a: STRING, b: MAP<STRING, INT>>>);");
    const auto type = first.front().at("columns").at(0U).at("type").as_string();
    CHECK(type == "ARRAY<STRUCT<a:STRING,b:MAP<STRING,INT>>>");

    const auto second = records_of("CREATE TABLE n (v " + type + ");");
    CHECK(second.front().at("columns").at(0U).at("type").as_string() == type);
}

TEST_CASE("rendered defaults and checks reparse to the same text")
{
    const auto first = records_of("CREATE TABLE r (a INT DEFAULT (1 + 2) CHECK (a   >   0));");
    const auto& column = first.front().at("columns").at(0U);
    const auto default_text = column.at("default").as_string();
    const auto check_text = column.at("check").as_string();
    CHECK(check_text == "a > 0");

    const auto second = records_of("CREATE TABLE r (a INT DEFAULT " + default_text + " CHECK (" + check_text + "));");
    const auto& reparsed = second.front().at("columns").at(0U);
    CHECK(reparsed.at("default").as_string() == default_text);
    CHECK(reparsed.at("check").as_string() == check_text);
}
