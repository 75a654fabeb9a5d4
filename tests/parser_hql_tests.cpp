#include "schemer/ddl_parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace schemer;
using schemer::output::OutputMode;

namespace {

constexpr std::string_view kHiveTable = R"(CREATE EXTERNAL TABLE IF NOT EXISTS raw.clicks (
    click_id STRING COMMENT 'click identifier',
    attributes MAP<STRING, STRING>,
    path ARRAY<STRUCT<page: STRING, dwell_ms: BIGINT>>
)
COMMENT 'raw click stream'
PARTITIONED BY (dt STRING)
CLUSTERED BY (click_id) INTO 32 BUCKETS
ROW FORMAT DELIMITED FIELDS TERMINATED BY ',' COLLECTION ITEMS TERMINATED BY '|' MAP KEYS TERMINATED BY ':'
STORED AS ORC
LOCATION 's3://warehouse/raw/clicks'
TBLPROPERTIES ('orc.compress'='SNAPPY');
)";

output::Value parse_single_record(std::string_view sql, OutputMode mode)
{
    ParseOptions options{};
    options.output_mode = mode;
    auto result = parse(sql, options);
    INFO(sql);
    REQUIRE(result.success());
    REQUIRE(result.records.size() == 1U);
    return result.records.front();
}

}  // namespace

TEST_CASE("Hive storage clauses appear in hql output")
{
    const auto record = parse_single_record(kHiveTable, OutputMode::Hql);

    CHECK(record.at("schema").as_string() == "raw");
    CHECK(record.at("table_name").as_string() == "clicks");
    CHECK(record.at("if_not_exists").as_bool());
    CHECK(record.at("external").as_bool());
    CHECK(record.at("stored_as").as_string() == "ORC");
    CHECK(record.at("location").as_string() == "'s3://warehouse/raw/clicks'");
    CHECK(record.at("row_format").as_string() == "DELIMITED");
    CHECK(record.at("serde").is_null());
    CHECK(record.at("fields_terminated_by").as_string() == "','");
    CHECK(record.at("collection_items_terminated_by").as_string() == "'|'");
    CHECK(record.at("map_keys_terminated_by").as_string() == "':'");
    CHECK(record.at("lines_terminated_by").is_null());
    CHECK(record.at("comment").as_string() == "'raw click stream'");
    CHECK(record.at("into_buckets").as_integer() == 32);

    const auto& clustered = record.at("clustered_by");
    REQUIRE(clustered.size() == 1U);
    CHECK(clustered.at(0U).as_string() == "click_id");

    const auto& properties = record.at("tblproperties");
    CHECK(properties.keys() == std::vector<std::string>{"orc.compress"});
    CHECK(properties.at("orc.compress").as_string() == "'SNAPPY'");
}

TEST_CASE("Hive nested column types keep their canonical form")
{
    const auto record = parse_single_record(kHiveTable, OutputMode::Hql);
    const auto& columns = record.at("columns");
    REQUIRE(columns.size() == 3U);

    CHECK(columns.at(0U).at("type").as_string() == "STRING");
    CHECK(columns.at(0U).at("comment").as_string() == "'click identifier'");
    CHECK(columns.at(1U).at("type").as_string() == "MAP<STRING,STRING>");
    CHECK(columns.at(2U).at("type").as_string() == "ARRAY<STRUCT<page:STRING,dwell_ms:BIGINT>>");
    CHECK(columns.at(2U).at("size").is_null());

    const auto& partitioned = record.at("partitioned_by");
    REQUIRE(partitioned.size() == 1U);
    CHECK(partitioned.at(0U).at("name").as_string() == "dt");
    CHECK(partitioned.at(0U).at("type").as_string() == "STRING");
}

TEST_CASE("sql output omits Hive-only fields")
{
    const auto record = parse_single_record(kHiveTable, OutputMode::Sql);
    for (const auto* key : {"external",
                            "stored_as",
                            "location",
                            "row_format",
                            "serde",
                            "fields_terminated_by",
                            "collection_items_terminated_by",
                            "map_keys_terminated_by",
                            "lines_terminated_by",
                            "clustered_by",
                            "into_buckets",
                            "tblproperties"}) {
        INFO(key);
        CHECK_FALSE(record.contains(key));
    }
    CHECK(record.at("comment").as_string() == "'raw click stream'");
    CHECK(record.contains("partitioned_by"));
}

TEST_CASE("hql output fills absent Hive fields with null")
{
    const auto record = parse_single_record("CREATE TABLE plain (a INT);", OutputMode::Hql);
    CHECK_FALSE(record.at("external").as_bool());
    CHECK(record.at("stored_as").is_null());
    CHECK(record.at("comment").is_null());
    CHECK(record.at("clustered_by").is_null());
    CHECK(record.at("into_buckets").is_null());
    CHECK(record.at("tblproperties").is_null());

    const auto sql = parse_single_record("CREATE TABLE plain (a INT);", OutputMode::Sql);
    CHECK_FALSE(sql.contains("comment"));
    CHECK(record.keys().size() > sql.keys().size());
}

TEST_CASE("ROW FORMAT SERDE records the serde class")
{
    const auto record = parse_single_record(
        "CREATE TABLE csv (a STRING) ROW FORMAT SERDE 'org.apache.hadoop.hive.serde2.OpenCSVSerde' "
        "WITH SERDEPROPERTIES ('separatorChar'=',') STORED AS TEXTFILE",
        OutputMode::Hql);
    CHECK(record.at("row_format").as_string() == "SERDE");
    CHECK(record.at("serde").as_string() == "'org.apache.hadoop.hive.serde2.OpenCSVSerde'");
    CHECK(record.at("stored_as").as_string() == "TEXTFILE");
}

TEST_CASE("reference deferrability is always present in hql output")
{
    const auto hql = parse_single_record("CREATE TABLE a (b_id INT REFERENCES b (id));", OutputMode::Hql);
    const auto& hql_reference = hql.at("columns").at(0U).at("references");
    REQUIRE(hql_reference.contains("deferrable_initially"));
    CHECK(hql_reference.at("deferrable_initially").is_null());

    const auto sql = parse_single_record("CREATE TABLE a (b_id INT REFERENCES b (id));", OutputMode::Sql);
    CHECK_FALSE(sql.at("columns").at(0U).at("references").contains("deferrable_initially"));
}
