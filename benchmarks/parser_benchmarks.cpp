#include "schemer/ddl_parser.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string_view>

namespace
{

using Clock = std::chrono::steady_clock;

struct Scenario final {
    std::string_view name;
    std::string_view script;
    schemer::output::OutputMode mode;
};

constexpr std::string_view postgres_script = R"(CREATE SEQUENCE analytics.event_id_seq INCREMENT BY 1 START WITH 1000 CACHE 20;
CREATE TABLE IF NOT EXISTS analytics.events (
    event_id BIGINT PRIMARY KEY DEFAULT nextval('analytics.event_id_seq'),
    visitor_id BIGINT NOT NULL REFERENCES analytics.visitors (id) ON DELETE CASCADE,
    payload JSONB DEFAULT '{}',
    amount NUMERIC(12, 2) CHECK (amount >= 0),
    tags TEXT[],
    created_at TIMESTAMP WITH TIME ZONE DEFAULT CURRENT_TIMESTAMP
) PARTITION BY RANGE (created_at);
CREATE UNIQUE INDEX CONCURRENTLY events_visitor_idx ON analytics.events USING btree (visitor_id DESC NULLS LAST, created_at);
ALTER TABLE analytics.events ADD CONSTRAINT events_amount_chk CHECK (amount < 1000000);
ALTER TABLE ONLY analytics.events ALTER COLUMN payload SET NOT NULL;
)";

constexpr std::string_view mysql_script = R"(CREATE TABLE `shop`.`orders` (
    `id` INT(11) NOT NULL AUTO_INCREMENT,
    `customer_id` INT(11) NOT NULL,
    `status` VARCHAR(20) CHARACTER SET utf8mb4 COLLATE utf8mb4_bin DEFAULT 'new' COMMENT 'order state',
    `updated_at` TIMESTAMP DEFAULT CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP,
    PRIMARY KEY (`id`),
    KEY `customer_idx` (`customer_id`),
    CONSTRAINT `orders_customer_fk` FOREIGN KEY (`customer_id`) REFERENCES `customers` (`id`)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 AUTO_INCREMENT=100;
)";

constexpr std::string_view hive_script = R"(CREATE EXTERNAL TABLE IF NOT EXISTS raw.clicks (
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

constexpr std::string_view tsql_script = R"(CREATE TABLE [dbo].[accounts] (
    [id] INT IDENTITY(1,1) NOT NULL,
    [name] NVARCHAR(MAX) NULL,
    [balance] DECIMAL(18, 4) NOT NULL,
    CONSTRAINT [PK_accounts] PRIMARY KEY CLUSTERED ([id] ASC)
);
ALTER TABLE [dbo].[accounts] ADD CONSTRAINT [DF_accounts_balance] DEFAULT ((0)) FOR [balance];
CREATE NONCLUSTERED INDEX [IX_accounts_name] ON [dbo].[accounts] ([name] ASC);
)";

constexpr std::array scenarios{
    Scenario{"postgres", postgres_script, schemer::output::OutputMode::Sql},
    Scenario{"mysql", mysql_script, schemer::output::OutputMode::Sql},
    Scenario{"hive", hive_script, schemer::output::OutputMode::Hql},
    Scenario{"tsql", tsql_script, schemer::output::OutputMode::Sql},
};

std::size_t parse_iterations_from_args(int argc, char** argv, std::size_t default_iterations)
{
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: schemer_benchmarks [--iterations N]\n";
            std::exit(EXIT_SUCCESS);
        }
        if ((arg == "--iterations" || arg == "-n") && index + 1 < argc) {
            const auto value = std::strtoull(argv[index + 1], nullptr, 10);
            if (value > 0U) {
                return static_cast<std::size_t>(value);
            }
        }
    }

    return default_iterations;
}

struct BenchmarkSummary final {
    std::size_t iterations = 0U;
    std::size_t statements = 0U;
    std::size_t records = 0U;
    std::size_t diagnostics = 0U;
    std::size_t failed = 0U;
    Clock::duration elapsed{};
};

BenchmarkSummary run_scenario(const Scenario& scenario, std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;

    schemer::ParseOptions options{};
    options.output_mode = scenario.mode;

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        auto result = schemer::parse(scenario.script, options);
        summary.statements += result.statements;
        summary.records += result.records.size();
        summary.diagnostics += result.diagnostics.size();
        if (result.failed) {
            ++summary.failed;
        }
    }
    summary.elapsed = Clock::now() - start;

    return summary;
}

void report_summary(const Scenario& scenario, const BenchmarkSummary& summary)
{
    const auto seconds = std::chrono::duration<double>(summary.elapsed).count();
    const auto scripts_per_second = seconds > 0.0 ? static_cast<double>(summary.iterations) / seconds : 0.0;
    const auto statements_per_second = seconds > 0.0 ? static_cast<double>(summary.statements) / seconds : 0.0;
    const auto per_script = [&](std::size_t total) {
        return summary.iterations > 0U ? static_cast<double>(total) / summary.iterations : 0.0;
    };

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << scenario.name << "\n";
    std::cout << "  Scripts: " << summary.iterations << "\n";
    std::cout << "  Statements/script: " << per_script(summary.statements) << "\n";
    std::cout << "  Records/script: " << per_script(summary.records) << "\n";
    std::cout << "  Diagnostics/script: " << per_script(summary.diagnostics) << "\n";
    std::cout << "  Elapsed: " << seconds << " s\n";
    std::cout << "  Scripts/s: " << scripts_per_second << "\n";
    std::cout << "  Statements/s: " << statements_per_second << "\n";
    if (summary.failed > 0U) {
        std::cout << "  Failed scripts: " << summary.failed << "\n";
    }
    std::cout << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    constexpr std::size_t default_iterations = 1000U;
    const auto iterations = parse_iterations_from_args(argc, argv, default_iterations);

    for (const auto& scenario : scenarios) {
        auto summary = run_scenario(scenario, iterations);
        report_summary(scenario, summary);
    }

    return 0;
}
