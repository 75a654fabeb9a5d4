#include "schemer/tools/dump_writer.hpp"

#include "schemer/ddl_parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

using namespace schemer;

namespace {

std::filesystem::path make_unique_dump_path()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("schemer_dump_" + std::to_string(stamp));
}

struct TempDumpDirectory final {
    TempDumpDirectory()
        : path{make_unique_dump_path()}
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    ~TempDumpDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

void write_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream stream{path};
    REQUIRE(stream.is_open());
    stream << content;
}

}  // namespace

TEST_CASE("dump_records writes an indented JSON array per input")
{
    TempDumpDirectory temp;
    const auto output = parse("CREATE SEQUENCE s START 1;");
    REQUIRE(output.success());

    const auto target = temp.path / "schemas";
    const auto written = tools::dump_records(output.records, target, "orders");
    CAPTURE(written.string());
    CHECK(written == target / "orders_schema.json");
    REQUIRE(std::filesystem::exists(written));

    const auto content = tools::read_source_file(written);
    CHECK(content == "[\n {\n  \"sequence_name\": \"s\",\n  \"schema\": null,\n  \"start\": 1\n }\n]\n");
}

TEST_CASE("dump_records writes an empty array when nothing was parsed")
{
    TempDumpDirectory temp;
    const auto written = tools::dump_records({}, temp.path, "empty");
    CHECK(tools::read_source_file(written) == "[]\n");
}

TEST_CASE("dump_document writes a grouped object as is")
{
    TempDumpDirectory temp;
    ParseOptions options{};
    options.group_by_type = true;
    const auto output = parse("CREATE SEQUENCE s START 1;", options);
    REQUIRE(output.success());

    const auto written = tools::dump_document(output.grouped, temp.path, "grouped");
    const auto content = tools::read_source_file(written);
    CHECK(content.rfind("{\n \"tables\": [],\n \"sequences\": [\n", 0U) == 0U);
    CHECK(content.find("\"unresolved\": []\n}\n") != std::string::npos);
}

TEST_CASE("is_ddl_source matches DDL extensions case-insensitively")
{
    CHECK(tools::is_ddl_source("schema.sql"));
    CHECK(tools::is_ddl_source("schema.DDL"));
    CHECK(tools::is_ddl_source("warehouse/tables.hql"));
    CHECK_FALSE(tools::is_ddl_source("notes.txt"));
    CHECK_FALSE(tools::is_ddl_source("Makefile"));
}

TEST_CASE("collect_inputs expands directories and keeps explicit files")
{
    TempDumpDirectory temp;
    std::filesystem::create_directories(temp.path / "nested");
    write_file(temp.path / "b.sql", "CREATE TABLE b (id INT);");
    write_file(temp.path / "a.hql", "CREATE TABLE a (id INT);");
    write_file(temp.path / "readme.txt", "not ddl");
    write_file(temp.path / "nested" / "c.sql", "CREATE TABLE c (id INT);");

    const auto from_directory = tools::collect_inputs({temp.path.string()});
    REQUIRE(from_directory.size() == 2U);
    CHECK(from_directory[0].filename() == "a.hql");
    CHECK(from_directory[1].filename() == "b.sql");

    const auto explicit_file = tools::collect_inputs({(temp.path / "readme.txt").string()});
    REQUIRE(explicit_file.size() == 1U);
    CHECK(explicit_file.front().filename() == "readme.txt");

    CHECK_THROWS_AS(tools::collect_inputs({(temp.path / "missing.sql").string()}), std::runtime_error);
}

TEST_CASE("read_source_file fails on missing files")
{
    TempDumpDirectory temp;
    CHECK_THROWS_AS(tools::read_source_file(temp.path / "absent.sql"), std::runtime_error);
}
