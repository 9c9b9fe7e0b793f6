#include "tabula/catalog/catalog_schema.hpp"
#include "tabula/executor/query_executor.hpp"
#include "tabula/parser/grammar.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace
{

using Clock = std::chrono::steady_clock;

constexpr std::string_view kWorkloadScript = R"(CREATE TABLE users (id INT PRIMARY KEY, name VARCHAR(32) NOT NULL, age INT);
INSERT INTO users VALUES (1, 'Alice', 30), (2, 'Bob', 25), (3, 'Carol', 41);
SELECT name, age FROM users WHERE age > 26 AND name = 'Alice' ORDER BY age DESC;
UPDATE users SET age = 31 WHERE id = 1;
DELETE FROM users WHERE age < 26 OR name IS NULL;
-- trailing comment
SELECT 1 + 2 * (3 - 1);
)";

struct BenchmarkSummary final {
    std::size_t iterations = 0U;
    std::size_t operations = 0U;
    std::size_t failures = 0U;
    Clock::duration elapsed{};
};

struct Scenario final {
    std::string_view name;
    std::function<BenchmarkSummary(std::size_t)> run;
};

std::size_t parse_iterations_from_args(int argc, char** argv, std::size_t default_iterations)
{
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: tabula_benchmarks [--iterations N]\n";
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

std::vector<tabula::catalog::Column> user_columns()
{
    return {
        tabula::catalog::Column{"id", tabula::catalog::DataType::integer(), true, true},
        tabula::catalog::Column{"name", tabula::catalog::DataType::varchar(32U), false, true},
        tabula::catalog::Column{"age", tabula::catalog::DataType::integer(), false, false},
    };
}

BenchmarkSummary run_parse_script(std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        const auto result = tabula::parser::parse_script(kWorkloadScript);
        summary.operations += result.statements.size();
        for (const auto& statement : result.statements) {
            if (!statement.success) {
                ++summary.failures;
            }
        }
    }
    summary.elapsed = Clock::now() - start;
    return summary;
}

// Each iteration inserts 256 keyed rows, so the duplicate-key scan dominates.
BenchmarkSummary run_bulk_insert(std::size_t iterations)
{
    constexpr std::size_t rows_per_iteration = 256U;
    BenchmarkSummary summary{};
    summary.iterations = iterations;

    std::vector<std::vector<std::string>> rows;
    rows.reserve(rows_per_iteration);
    for (std::size_t row = 0; row < rows_per_iteration; ++row) {
        rows.push_back({std::to_string(row), "'user" + std::to_string(row) + "'", std::to_string(row % 90U)});
    }

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        tabula::catalog::Database database;
        tabula::executor::QueryExecutor executor{database};
        if (!executor.create_table("users", user_columns()).ok()) {
            ++summary.failures;
            continue;
        }
        const auto result = executor.insert("users", {}, rows);
        summary.operations += result.rows_affected;
        if (!result.success()) {
            ++summary.failures;
        }
    }
    summary.elapsed = Clock::now() - start;
    return summary;
}

BenchmarkSummary run_filtered_sort(std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;

    tabula::catalog::Database database;
    tabula::executor::QueryExecutor executor{database};
    if (!executor.create_table("users", user_columns()).ok()) {
        summary.failures = iterations;
        return summary;
    }

    std::vector<std::vector<std::string>> rows;
    for (std::size_t row = 0; row < 1024U; ++row) {
        rows.push_back({std::to_string(row), "'user" + std::to_string(row % 17U) + "'", std::to_string(row % 90U)});
    }
    if (!executor.insert("users", {}, rows).success()) {
        summary.failures = iterations;
        return summary;
    }

    const std::array<std::string, 2> columns{"name", "age"};
    const std::array<tabula::executor::OrderByItem, 2> order_by{
        tabula::executor::OrderByItem{"age", true},
        tabula::executor::OrderByItem{"name", false},
    };

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        const auto result = executor.select("users", columns, "age > 20 AND (name = 'user3' OR age < 60)", order_by);
        if (!result.success()) {
            ++summary.failures;
            continue;
        }
        summary.operations += result.value->rows.size();
    }
    summary.elapsed = Clock::now() - start;
    return summary;
}

void report_summary(std::string_view name, const BenchmarkSummary& summary)
{
    const auto seconds = std::chrono::duration<double>(summary.elapsed).count();
    const auto iterations_per_second = seconds > 0.0 ? static_cast<double>(summary.iterations) / seconds : 0.0;
    const auto operations_per_second = seconds > 0.0 ? static_cast<double>(summary.operations) / seconds : 0.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << name << "\n";
    std::cout << "  Iterations: " << summary.iterations << "\n";
    std::cout << "  Elapsed: " << seconds << " s\n";
    std::cout << "  Iterations/s: " << iterations_per_second << "\n";
    std::cout << "  Rows or statements/s: " << operations_per_second << "\n";
    if (summary.failures > 0U) {
        std::cout << "  Failures: " << summary.failures << "\n";
    }
    std::cout << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    constexpr std::size_t default_iterations = 200U;
    const auto iterations = parse_iterations_from_args(argc, argv, default_iterations);

    const std::array<Scenario, 3> scenarios{
        Scenario{"parse_script", run_parse_script},
        Scenario{"bulk_insert", run_bulk_insert},
        Scenario{"filtered_sort", run_filtered_sort},
    };

    int exit_code = EXIT_SUCCESS;
    for (const auto& scenario : scenarios) {
        const auto summary = scenario.run(iterations);
        report_summary(scenario.name, summary);
        if (summary.failures > 0U) {
            exit_code = EXIT_FAILURE;
        }
    }

    return exit_code;
}
