#include "tabula/shell/shell_engine.hpp"

#include "tabula/executor/cell_format.hpp"
#include "tabula/parser/calculator.hpp"
#include "tabula/shell/result_formatter.hpp"
#include "tabula/storage/snapshot_codec.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <utility>
#include <variant>

using tabula::executor::EngineErrc;
using tabula::executor::EngineStatus;
using tabula::parser::ParserDiagnostic;
using tabula::parser::ScriptStatement;

namespace tabula::shell {

namespace {

[[nodiscard]] std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::size_t index = 0U;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        if (index >= text.size()) {
            break;
        }
        const std::size_t begin = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        tokens.emplace_back(text.substr(begin, index - begin));
    }
    return tokens;
}

[[nodiscard]] std::string plural(std::uint64_t count, std::string_view noun)
{
    std::ostringstream stream;
    stream << count << ' ' << noun << (count == 1U ? "" : "s");
    return stream.str();
}

[[nodiscard]] std::optional<std::string_view> where_view(const std::optional<std::string>& where)
{
    if (!where) {
        return std::nullopt;
    }
    return std::string_view{*where};
}

[[nodiscard]] std::vector<std::string> identifier_values(const std::vector<parser::Identifier>& identifiers)
{
    std::vector<std::string> values;
    values.reserve(identifiers.size());
    for (const auto& identifier : identifiers) {
        values.push_back(identifier.value);
    }
    return values;
}

[[nodiscard]] ParserDiagnostic make_meta_diagnostic(std::string_view command, std::string message, std::string hint)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = parser::ParserSeverity::Error;
    diagnostic.statement = std::string{command};
    diagnostic.message = std::move(message);
    diagnostic.remediation_hints = {std::move(hint)};
    return diagnostic;
}

}  // namespace

ShellEngine::ShellEngine()
    : ShellEngine(Config{})
{}

ShellEngine::ShellEngine(Config config)
    : config_{std::move(config)}
    , database_{config_.database != nullptr ? config_.database : &owned_database_}
    , executor_{*database_}
{}

CommandMetrics ShellEngine::execute_sql(const std::string& sql)
{
    const auto start = std::chrono::steady_clock::now();
    const auto started_at = std::chrono::system_clock::now();

    const auto kind = classify(sql);
    CommandMetrics metrics{};
    switch (kind) {
    case CommandKind::Meta:
        metrics = execute_meta(std::string{executor::trim(sql)});
        break;
    case CommandKind::Sql:
        metrics = execute_statements(sql);
        break;
    case CommandKind::Empty:
    default:
        metrics.success = true;
        metrics.summary = "Empty command.";
        break;
    }

    metrics.command_text = sql;
    metrics.started_at = started_at;
    finalize(metrics, kind, start);
    return metrics;
}

EngineStatus ShellEngine::load()
{
    if (config_.snapshot_path.empty()) {
        return {};
    }
    auto loaded = storage::load_snapshot(config_.snapshot_path);
    if (!loaded.success()) {
        return loaded.status;
    }
    *database_ = std::move(*loaded.value);
    return {};
}

EngineStatus ShellEngine::save() const
{
    if (config_.snapshot_path.empty()) {
        return {};
    }
    return storage::save_snapshot(*database_, config_.snapshot_path);
}

ShellEngine::CommandKind ShellEngine::classify(std::string_view text)
{
    const auto trimmed = executor::trim(text);
    if (trimmed.empty()) {
        return CommandKind::Empty;
    }
    if (trimmed.front() == '\\') {
        return CommandKind::Meta;
    }
    if (executor::trim(parser::strip_comments(trimmed)).empty()) {
        return CommandKind::Empty;
    }
    return CommandKind::Sql;
}

std::string_view ShellEngine::command_kind_to_string(CommandKind kind) noexcept
{
    switch (kind) {
    case CommandKind::Sql:
        return "sql";
    case CommandKind::Meta:
        return "meta";
    case CommandKind::Empty:
    default:
        return "empty";
    }
}

CommandMetrics ShellEngine::execute_statements(const std::string& sql)
{
    CommandMetrics metrics{};
    const auto script = parser::parse_script(sql);

    bool produced_output = false;
    bool mutated = false;
    std::optional<std::string> failure{};

    for (const auto& statement : script.statements) {
        if (!statement.success) {
            failure = "Syntax error";
            metrics.diagnostics.insert(metrics.diagnostics.end(),
                                       statement.diagnostics.begin(),
                                       statement.diagnostics.end());
            break;
        }

        auto outcome = run_statement(statement, metrics.detail_lines);
        ++metrics.statements_executed;
        metrics.rows_touched += outcome.rows_touched;
        mutated = mutated || outcome.mutated;
        if (!outcome.status.ok()) {
            failure = std::move(outcome.status.message);
            break;
        }
        produced_output = produced_output || outcome.produced_output;
    }

    if (mutated && config_.autosave) {
        autosave(metrics);
    }

    if (failure) {
        metrics.success = false;
        metrics.summary = "Error: " + *failure;
        return metrics;
    }

    if (!metrics.summary.empty()) {
        return metrics;
    }

    metrics.success = true;
    if (!produced_output) {
        metrics.summary = std::string{kNoResultsMessage};
    } else {
        metrics.summary = "Executed " + plural(metrics.statements_executed, "statement");
    }
    return metrics;
}

ShellEngine::StatementOutcome ShellEngine::run_statement(const ScriptStatement& statement,
                                                         std::vector<std::string>& detail_lines)
{
    StatementOutcome outcome{};

    if (const auto* select = std::get_if<parser::SelectStatement>(&statement.ast)) {
        std::vector<executor::OrderByItem> order_by;
        order_by.reserve(select->order_by.size());
        for (const auto& item : select->order_by) {
            order_by.push_back(executor::OrderByItem{item.column.value, item.descending});
        }

        auto result = executor_.select(select->table.value, select->columns, where_view(select->where), order_by);
        if (!result.success()) {
            outcome.status = std::move(result.status);
            return outcome;
        }
        outcome.rows_touched = result.value->rows.size();
        if (!result.value->rows.empty()) {
            auto lines = format_table(result.value->headers, result.value->rows);
            detail_lines.insert(detail_lines.end(), lines.begin(), lines.end());
            outcome.produced_output = true;
        }
        return outcome;
    }

    if (const auto* create = std::get_if<parser::CreateTableStatement>(&statement.ast)) {
        std::vector<catalog::Column> columns;
        columns.reserve(create->columns.size());
        for (const auto& definition : create->columns) {
            catalog::Column column{};
            column.name = definition.name.value;
            column.data_type = definition.data_type;
            column.is_primary = definition.primary_key;
            column.not_null = definition.not_null || definition.primary_key;
            columns.push_back(std::move(column));
        }
        outcome.status = executor_.create_table(create->name.value, std::move(columns));
        outcome.mutated = outcome.status.ok();
        return outcome;
    }

    if (const auto* insert = std::get_if<parser::InsertStatement>(&statement.ast)) {
        const auto columns = identifier_values(insert->columns);
        auto result = executor_.insert(insert->table.value, columns, insert->rows);
        outcome.rows_touched = result.rows_affected;
        outcome.mutated = result.rows_affected > 0U;
        outcome.status = std::move(result.status);
        if (outcome.status.ok()) {
            detail_lines.push_back("Inserted " + plural(result.rows_affected, "row"));
            outcome.produced_output = true;
        }
        return outcome;
    }

    if (const auto* update = std::get_if<parser::UpdateStatement>(&statement.ast)) {
        std::vector<executor::SetClause> assignments;
        assignments.reserve(update->assignments.size());
        for (const auto& assignment : update->assignments) {
            assignments.push_back(executor::SetClause{assignment.column.value, assignment.value});
        }
        auto result = executor_.update(update->table.value, assignments, where_view(update->where));
        outcome.rows_touched = result.rows_affected;
        outcome.mutated = result.rows_affected > 0U;
        outcome.status = std::move(result.status);
        if (outcome.status.ok()) {
            detail_lines.push_back("Updated " + plural(result.rows_affected, "row"));
            outcome.produced_output = true;
        }
        return outcome;
    }

    if (const auto* remove = std::get_if<parser::DeleteStatement>(&statement.ast)) {
        auto result = executor_.delete_rows(remove->table.value, where_view(remove->where));
        outcome.rows_touched = result.rows_affected;
        outcome.mutated = result.rows_affected > 0U;
        outcome.status = std::move(result.status);
        if (outcome.status.ok()) {
            detail_lines.push_back("Deleted " + plural(result.rows_affected, "row"));
            outcome.produced_output = true;
        }
        return outcome;
    }

    if (const auto* drop = std::get_if<parser::DropTableStatement>(&statement.ast)) {
        const auto tables = identifier_values(drop->tables);
        auto result = executor_.drop_tables(tables, drop->if_exists);
        outcome.mutated = result.rows_affected > 0U;
        outcome.status = std::move(result.status);
        if (outcome.status.ok()) {
            detail_lines.push_back("Dropped " + plural(result.rows_affected, "table"));
            outcome.produced_output = true;
        }
        return outcome;
    }

    if (const auto* calculation = std::get_if<parser::CalculateStatement>(&statement.ast)) {
        const std::vector<std::string> headers{calculation->expression};
        const std::vector<std::vector<std::string>> rows{
            std::vector<std::string>{parser::format_number(calculation->result)}};
        auto lines = format_table(headers, rows);
        detail_lines.insert(detail_lines.end(), lines.begin(), lines.end());
        outcome.produced_output = true;
        return outcome;
    }

    outcome.status = executor::make_status(EngineErrc::InvalidDefinition, "Statement produced no executable form");
    return outcome;
}

void ShellEngine::autosave(CommandMetrics& metrics)
{
    if (config_.snapshot_path.empty()) {
        return;
    }

    const auto status = save();
    if (status.ok()) {
        return;
    }

    metrics.success = false;
    metrics.summary = "Error: " + status.message;

    ParserDiagnostic diagnostic{};
    diagnostic.severity = parser::ParserSeverity::Error;
    diagnostic.message = status.message;
    diagnostic.remediation_hints = {"Check that the snapshot directory is writable."};
    metrics.diagnostics.push_back(std::move(diagnostic));
}

CommandMetrics ShellEngine::execute_meta(const std::string& command)
{
    CommandMetrics metrics{};
    const auto tokens = split_tokens(command);
    if (tokens.empty()) {
        metrics.success = true;
        metrics.summary = "Empty command.";
        return metrics;
    }

    if (tokens.front() == "\\dt") {
        std::vector<std::vector<std::string>> rows;
        rows.reserve(database_->table_count());
        for (const auto& table : database_->tables()) {
            rows.push_back({table.name, std::to_string(table.columns.size()), std::to_string(table.data.size())});
        }

        if (!rows.empty()) {
            metrics.detail_lines = format_table({"table", "columns", "rows"}, rows);
        }
        metrics.summary = "Listed " + plural(rows.size(), "table");
        metrics.success = true;
        return metrics;
    }

    if (tokens.front() == "\\d") {
        if (tokens.size() < 2U) {
            metrics.success = false;
            metrics.summary = "Error: Table name required";
            metrics.diagnostics.push_back(
                make_meta_diagnostic(command, "\\d expects a table name.", "Use \\dt to list the available tables."));
            return metrics;
        }

        const auto& name = tokens[1];
        const auto* table = database_->find_table(name);
        if (table == nullptr) {
            metrics.success = false;
            metrics.summary = "Error: Table '" + name + "' not found";
            metrics.diagnostics.push_back(
                make_meta_diagnostic(command, "Unknown table '" + name + "'.", "Use \\dt to list the available tables."));
            return metrics;
        }

        std::vector<std::vector<std::string>> rows;
        rows.reserve(table->columns.size());
        for (const auto& column : table->columns) {
            rows.push_back({column.name,
                            catalog::to_string(column.data_type),
                            column.is_primary ? "YES" : "NO",
                            column.rejects_null() ? "YES" : "NO"});
        }

        metrics.detail_lines = format_table({"column", "type", "primary", "not_null"}, rows);
        metrics.summary = "Table '" + table->name + "' has " + plural(rows.size(), "column");
        metrics.success = true;
        return metrics;
    }

    metrics.success = false;
    metrics.summary = "Unsupported meta command.";
    metrics.diagnostics.push_back(
        make_meta_diagnostic(command, "Shell command is not recognised.", "Use \\help to list supported commands."));
    return metrics;
}

void ShellEngine::finalize(CommandMetrics& metrics, CommandKind kind, std::chrono::steady_clock::time_point start)
{
    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;
    metrics.finished_at = std::chrono::system_clock::now();
    metrics.command_category = std::string{command_kind_to_string(kind)};

    const auto sequence = correlation_counter_.fetch_add(1U, std::memory_order_relaxed);
    metrics.correlation_id = "cmd-" + std::to_string(sequence);

    if (config_.command_logger) {
        config_.command_logger(metrics);
    }
}

}  // namespace tabula::shell
