#pragma once

#include "tabula/parser/ast.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabula::parser {

enum class ParserSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct ParserDiagnostic final {
    ParserSeverity severity = ParserSeverity::Error;
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::string statement{};
    std::vector<std::string> remediation_hints{};
};

template <typename T>
struct ParseResult final {
    std::optional<T> ast{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return ast.has_value(); }
};

enum class StatementType : std::uint8_t {
    Unknown = 0,
    Select,
    CreateTable,
    Insert,
    Update,
    Delete,
    DropTable,
    Calculate
};

using StatementAst = std::variant<std::monostate,
                                  SelectStatement,
                                  CreateTableStatement,
                                  InsertStatement,
                                  UpdateStatement,
                                  DeleteStatement,
                                  DropTableStatement,
                                  CalculateStatement>;

struct ScriptStatement final {
    StatementType type = StatementType::Unknown;
    std::string text{};
    StatementAst ast{};
    std::vector<ParserDiagnostic> diagnostics{};
    bool success = false;
};

struct ScriptParseResult final {
    std::vector<ScriptStatement> statements{};
};

ParseResult<Identifier> parse_identifier(std::string_view input);
ParseResult<SelectStatement> parse_select(std::string_view input);
ParseResult<CreateTableStatement> parse_create_table(std::string_view input);
ParseResult<InsertStatement> parse_insert(std::string_view input);
ParseResult<UpdateStatement> parse_update(std::string_view input);
ParseResult<DeleteStatement> parse_delete(std::string_view input);
ParseResult<DropTableStatement> parse_drop_table(std::string_view input);

// Accepts "SELECT <expr>" or a bare arithmetic expression.
ParseResult<CalculateStatement> parse_calculate(std::string_view input);

// Dispatches on the leading keyword. A statement that fails its SQL grammar is
// retried as a calculation before the failure is reported.
ScriptStatement parse_statement(std::string_view input);

// Removes "--" line comments and "/* */" block comments outside quoted text.
[[nodiscard]] std::string strip_comments(std::string_view input);

// Splits on ';' outside quoted text. Blank statements are dropped and the
// returned pieces are trimmed.
[[nodiscard]] std::vector<std::string> split_statements(std::string_view input);

// True when the last thing outside quotes and comments is a ';'.
[[nodiscard]] bool statement_terminated(std::string_view input);

ScriptParseResult parse_script(std::string_view input);

[[nodiscard]] std::string to_string(StatementType type);

}  // namespace tabula::parser
