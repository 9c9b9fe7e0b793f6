#include "tabula/catalog/catalog_schema.hpp"
#include "tabula/executor/cell_format.hpp"
#include "tabula/parser/grammar.hpp"
#include "tabula/shell/command_history.hpp"
#include "tabula/shell/shell_engine.hpp"
#include "tabula/tools/shell_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr std::string_view kDefaultDataFile = "data/db.json";

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".tabula_shell_history";
    return path;
}

// Result tables and the empty-result notice go to stdout, failures to stderr.
void render_result(const tabula::shell::CommandMetrics& metrics, bool verbose)
{
    for (const auto& line : metrics.detail_lines) {
        std::cout << line << '\n';
    }

    if (!metrics.success) {
        std::cerr << metrics.summary << '\n';
        if (verbose) {
            for (const auto& diagnostic : metrics.diagnostics) {
                std::cerr << "  - " << diagnostic.message;
                if (!diagnostic.statement.empty()) {
                    std::cerr << " (statement: " << diagnostic.statement << ')';
                }
                std::cerr << '\n';
                for (const auto& hint : diagnostic.remediation_hints) {
                    std::cerr << "      hint: " << hint << '\n';
                }
            }
        }
        return;
    }

    if (metrics.summary == tabula::shell::kNoResultsMessage) {
        std::cout << metrics.summary << '\n';
        return;
    }

    if (verbose) {
        std::cout << "OK: " << metrics.summary;
        if (!metrics.correlation_id.empty()) {
            std::cout << " [" << metrics.correlation_id << ']';
        }
        std::cout << " [" << std::fixed << std::setprecision(2) << metrics.duration_ms << " ms]";
        if (metrics.rows_touched != 0U) {
            std::cout << " rows=" << metrics.rows_touched;
        }
        std::cout << '\n';
    }
}

bool load_script_text(std::istream& input, std::string& script, std::string& error_message)
{
    error_message.clear();
    script.assign(std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{});

    if (input.bad()) {
        error_message = "I/O error while reading script";
        return false;
    }
    return true;
}

bool run_script_file(tabula::shell::ShellEngine& engine, const std::string& path, bool verbose)
{
    std::ifstream stream;
    std::istream* input = &std::cin;
    if (path != "-") {
        stream.open(path);
        if (!stream.is_open()) {
            std::cerr << "error: failed to open script file '" << path << "'" << '\n';
            return false;
        }
        input = &stream;
    }

    std::string script;
    std::string error;
    if (!load_script_text(*input, script, error)) {
        std::cerr << "error: " << error << " ('" << (path == "-" ? std::string{"<stdin>"} : path) << "')" << '\n';
        return false;
    }

    const auto result = engine.execute_sql(script);
    render_result(result, verbose);
    return result.success;
}

void print_history(const tabula::shell::CommandHistory& history)
{
    std::size_t number = 1U;
    for (const auto& entry : history.entries()) {
        std::cout << std::setw(5) << number << "  " << entry << '\n';
        ++number;
    }
}

void print_help()
{
    std::cout << "Commands:\n";
    std::cout << "  SQL statements must end with ';'\n";
    std::cout << "  \\dt          List tables\n";
    std::cout << "  \\d <table>   Describe a table\n";
    std::cout << "  history      List previous commands\n";
    std::cout << "  !! / !N      Re-run the last / N-th command\n";
    std::cout << "  @<path>      Execute a script file\n";
    std::cout << "  \\help        Show this message\n";
    std::cout << "  \\quit        Exit the shell\n";
}

int run_repl(bool quiet, tabula::shell::ShellEngine& engine)
{
    replxx::Replxx repl;
    tabula::shell::CommandHistory history;

    const auto history_file = history_path();
    if (!history_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(history_file.parent_path(), ec);
        if (!repl.history_load(history_file.string())) {
            std::cerr << "[debug] no line history loaded from " << history_file << '\n';
        }
    }

    if (!quiet) {
        std::cout << "tabula shell: enter SQL statements terminated with ';' or type \\help.\n";
    }

    int exit_code = 0;
    std::string buffer;
    auto execute = [&](const std::string& command) {
        history.add(command);
        const auto result = engine.execute_sql(command);
        render_result(result, true);
        if (!result.success) {
            exit_code = 1;
        }
    };

    while (true) {
        const char* line = repl.input(buffer.empty() ? "tabula> " : "...> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const std::string trimmed{tabula::executor::trim(line)};
        if (buffer.empty()) {
            if (trimmed == "\\q" || trimmed == "\\quit" || tabula::catalog::iequals(trimmed, "exit") ||
                tabula::catalog::iequals(trimmed, "quit")) {
                break;
            }
            if (trimmed == "\\help") {
                print_help();
                continue;
            }
            if (tabula::catalog::iequals(trimmed, "history") || tabula::catalog::iequals(trimmed, "history;")) {
                print_history(history);
                continue;
            }
            if (tabula::shell::CommandHistory::is_recall_command(trimmed)) {
                const auto recalled = history.resolve_recall(trimmed);
                if (!recalled) {
                    std::cerr << "error: event not found: " << trimmed << '\n';
                    continue;
                }
                std::cout << *recalled << '\n';
                repl.history_add(*recalled);
                execute(*recalled);
                continue;
            }
            if (trimmed.rfind('\\', 0U) == 0U) {
                execute(trimmed);
                continue;
            }
            if (trimmed.rfind('@', 0U) == 0U) {
                const std::string script_spec{tabula::executor::trim(std::string_view{trimmed}.substr(1U))};
                if (script_spec.empty()) {
                    std::cerr << "error: script path is required after '@'" << '\n';
                    continue;
                }
                if (script_spec == "-") {
                    std::cerr << "error: reading scripts from stdin is not supported inside the interactive shell" << '\n';
                    continue;
                }
                if (!run_script_file(engine, script_spec, true)) {
                    std::cerr << "error: script '" << script_spec << "' completed with errors" << '\n';
                }
                continue;
            }
        }

        if (trimmed.empty()) {
            if (!buffer.empty()) {
                buffer.append(line);
                buffer.push_back('\n');
            }
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');

        if (!tabula::parser::statement_terminated(buffer)) {
            continue;
        }

        const std::string statement{tabula::executor::trim(buffer)};
        buffer.clear();
        if (statement.empty()) {
            continue;
        }

        repl.history_add(statement);
        execute(statement);
        if (!history_file.empty() && !repl.history_save(history_file.string())) {
            std::cerr << "[debug] failed to save line history to " << history_file << '\n';
        }
    }

    std::cerr << "[debug] run_repl exiting with code=" << exit_code << '\n';
    return exit_code;
}

int run_batch(const std::vector<std::string>& commands,
              const std::vector<std::string>& script_files,
              tabula::shell::ShellEngine& engine,
              bool verbose)
{
    for (const auto& path : script_files) {
        if (!run_script_file(engine, path, verbose)) {
            std::cerr << "[debug] run_batch stopping after script '" << path << "' code=1\n";
            return 1;
        }
    }

    for (const auto& command : commands) {
        const auto result = engine.execute_sql(command);
        render_result(result, verbose);
        if (!result.success) {
            std::cerr << "[debug] run_batch stopping after failed command code=1\n";
            return 1;
        }
    }

    std::cerr << "[debug] run_batch exiting with code=0\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Interactive SQL shell for the tabula embedded engine."};

    bool quiet = false;
    bool no_save = false;
    std::vector<std::string> execute_commands;
    std::vector<std::string> script_files;
    std::string positional_script;
    std::string log_json_path;
    std::string data_file{kDefaultDataFile};

    app.add_flag("-q,--quiet", quiet, "Suppress startup banner and command summaries");
    app.add_option("-c,--command", execute_commands, "Execute the provided SQL command and exit")
        ->type_name("SQL")
        ->expected(1);
    app.add_option("-f,--file", script_files, "Execute SQL commands from the specified script file (use '-' for stdin)")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("script", positional_script, "SQL script to execute")
        ->type_name("PATH");
    app.add_option("--data-file", data_file, "Snapshot file holding the database")
        ->type_name("PATH")
        ->capture_default_str();
    app.add_flag("--no-save", no_save, "Do not write the snapshot back after mutating commands");
    app.add_option("--log-json", log_json_path, "Write structured command logs as JSON Lines (use '-' for stdout)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        const auto code = app.exit(error);
        std::cerr << "[debug] exiting main via CLI parse error path code=" << code << '\n';
        return code;
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        std::cerr << "[debug] exiting main due to exception code=1\n";
        return 1;
    }

    if (!positional_script.empty()) {
        script_files.insert(script_files.begin(), positional_script);
    }

    tabula::shell::ShellEngine::Config config{};
    config.snapshot_path = std::filesystem::path{data_file};
    config.autosave = !no_save;

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;

    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                std::cerr << "[debug] exiting main due to log open failure code=1\n";
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }

        config.command_logger = [log_stream, &log_mutex](const tabula::shell::CommandMetrics& metrics) {
            const auto line = tabula::tools::format_shell_command_log_json(metrics);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }

    tabula::shell::ShellEngine engine{config};
    const auto loaded = engine.load();
    if (!loaded.ok()) {
        std::cerr << "error: " << loaded.message << '\n';
        std::cerr << "[debug] exiting main due to snapshot load failure code=1\n";
        return 1;
    }
    std::cerr << "[debug] loaded " << engine.database().table_count() << " table(s) from " << data_file << '\n';

    bool stdin_scripts = false;
    for (const auto& path : script_files) {
        if (path != "-") {
            continue;
        }
        if (stdin_scripts) {
            std::cerr << "error: stdin script '-' specified more than once" << '\n';
            std::cerr << "[debug] exiting main due to repeated stdin script code=1\n";
            return 1;
        }
        stdin_scripts = true;
    }

    if (!execute_commands.empty() || !script_files.empty()) {
        const auto code = run_batch(execute_commands, script_files, engine, !quiet);
        std::cerr << "[debug] exiting main via run_batch code=" << code << '\n';
        return code;
    }

    const auto repl_code = run_repl(quiet, engine);
    std::cerr << "[debug] exiting main via run_repl code=" << repl_code << '\n';
    return repl_code;
}
