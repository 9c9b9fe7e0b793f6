#include "tabula/tools/shell_log_formatter.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {

using json = nlohmann::json;

[[nodiscard]] std::string parser_severity_to_string(tabula::parser::ParserSeverity severity)
{
    switch (severity) {
    case tabula::parser::ParserSeverity::Info:
        return "info";
    case tabula::parser::ParserSeverity::Warning:
        return "warning";
    case tabula::parser::ParserSeverity::Error:
    default:
        return "error";
    }
}

// Unset time points render as null.
[[nodiscard]] json format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return nullptr;
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

[[nodiscard]] json diagnostic_to_json(const tabula::parser::ParserDiagnostic& diagnostic)
{
    json entry = json::object();
    entry["severity"] = parser_severity_to_string(diagnostic.severity);
    entry["message"] = diagnostic.message;
    entry["line"] = diagnostic.line;
    entry["column"] = diagnostic.column;
    entry["statement"] = diagnostic.statement;
    entry["remediation_hints"] = diagnostic.remediation_hints;
    return entry;
}

}  // namespace

namespace tabula::tools {

std::string format_shell_command_log_json(const tabula::shell::CommandMetrics& metrics)
{
    json record = json::object();
    record["correlation_id"] = metrics.correlation_id;
    record["category"] = metrics.command_category;
    record["sql"] = metrics.command_text;
    record["summary"] = metrics.summary;
    record["success"] = metrics.success;
    record["duration_ms"] = metrics.duration_ms;
    record["rows_touched"] = metrics.rows_touched;
    record["statements_executed"] = metrics.statements_executed;
    record["started_at"] = format_timestamp_iso(metrics.started_at);
    record["finished_at"] = format_timestamp_iso(metrics.finished_at);
    record["detail_lines"] = metrics.detail_lines;

    json diagnostics = json::array();
    for (const auto& diagnostic : metrics.diagnostics) {
        diagnostics.push_back(diagnostic_to_json(diagnostic));
    }
    record["diagnostics"] = std::move(diagnostics);

    // Invalid UTF-8 in user SQL must not abort logging.
    return record.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace tabula::tools
