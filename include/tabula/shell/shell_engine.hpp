#pragma once

#include "tabula/catalog/catalog_schema.hpp"
#include "tabula/executor/engine_errors.hpp"
#include "tabula/executor/query_executor.hpp"
#include "tabula/parser/grammar.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::shell {

struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_touched = 0U;
    std::uint64_t statements_executed = 0U;
    std::vector<tabula::parser::ParserDiagnostic> diagnostics{};
    std::vector<std::string> detail_lines{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

inline constexpr std::string_view kNoResultsMessage = "There are no results to be displayed.";

class ShellEngine final {
public:
    struct Config final {
        // Borrowed; the engine falls back to a database of its own when null.
        catalog::Database* database = nullptr;
        std::filesystem::path snapshot_path{};
        bool autosave = false;
        std::function<void(const CommandMetrics&)> command_logger{};
    };

    ShellEngine();
    explicit ShellEngine(Config config);

    ShellEngine(const ShellEngine&) = delete;
    ShellEngine& operator=(const ShellEngine&) = delete;
    ShellEngine(ShellEngine&&) = delete;
    ShellEngine& operator=(ShellEngine&&) = delete;

    // Runs every statement in the text in order and stops at the first
    // failure; statements applied before it stay applied.
    CommandMetrics execute_sql(const std::string& sql);

    // Replaces the in-memory database with the snapshot at Config::snapshot_path.
    [[nodiscard]] executor::EngineStatus load();
    [[nodiscard]] executor::EngineStatus save() const;

    [[nodiscard]] catalog::Database& database() noexcept { return *database_; }
    [[nodiscard]] const catalog::Database& database() const noexcept { return *database_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    enum class CommandKind : std::uint8_t {
        Empty = 0,
        Sql,
        Meta
    };

    struct StatementOutcome final {
        executor::EngineStatus status{};
        bool produced_output = false;
        bool mutated = false;
        std::uint64_t rows_touched = 0U;
    };

    static CommandKind classify(std::string_view text);
    static std::string_view command_kind_to_string(CommandKind kind) noexcept;

    CommandMetrics execute_statements(const std::string& sql);
    CommandMetrics execute_meta(const std::string& command);
    StatementOutcome run_statement(const parser::ScriptStatement& statement, std::vector<std::string>& detail_lines);
    void autosave(CommandMetrics& metrics);
    void finalize(CommandMetrics& metrics,
                  CommandKind kind,
                  std::chrono::steady_clock::time_point start);

    Config config_{};
    catalog::Database owned_database_{};
    catalog::Database* database_ = nullptr;
    executor::QueryExecutor executor_;
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace tabula::shell
