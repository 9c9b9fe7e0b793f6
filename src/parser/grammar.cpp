#include "tabula/parser/grammar.hpp"

#include "tabula/parser/calculator.hpp"
#include "tabula/parser/expression_primitives.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <unordered_set>
#include <utility>

namespace tabula::parser {

namespace pegtl = tao::pegtl;

namespace {

using expr::keyword;
using expr::optional_space;
using expr::required_space;

struct kw_select : keyword<'S', 'E', 'L', 'E', 'C', 'T'> {
};

struct kw_from : keyword<'F', 'R', 'O', 'M'> {
};

struct kw_where : keyword<'W', 'H', 'E', 'R', 'E'> {
};

struct kw_order : keyword<'O', 'R', 'D', 'E', 'R'> {
};

struct kw_by : keyword<'B', 'Y'> {
};

struct kw_asc : keyword<'A', 'S', 'C'> {
};

struct kw_desc : keyword<'D', 'E', 'S', 'C'> {
};

struct kw_create : keyword<'C', 'R', 'E', 'A', 'T', 'E'> {
};

struct kw_table : keyword<'T', 'A', 'B', 'L', 'E'> {
};

struct kw_primary : keyword<'P', 'R', 'I', 'M', 'A', 'R', 'Y'> {
};

struct kw_key : keyword<'K', 'E', 'Y'> {
};

struct kw_not : keyword<'N', 'O', 'T'> {
};

struct kw_null : keyword<'N', 'U', 'L', 'L'> {
};

struct kw_insert : keyword<'I', 'N', 'S', 'E', 'R', 'T'> {
};

struct kw_into : keyword<'I', 'N', 'T', 'O'> {
};

struct kw_values : keyword<'V', 'A', 'L', 'U', 'E', 'S'> {
};

struct kw_update : keyword<'U', 'P', 'D', 'A', 'T', 'E'> {
};

struct kw_set : keyword<'S', 'E', 'T'> {
};

struct kw_delete : keyword<'D', 'E', 'L', 'E', 'T', 'E'> {
};

struct kw_drop : keyword<'D', 'R', 'O', 'P'> {
};

struct kw_if : keyword<'I', 'F'> {
};

struct kw_exists : keyword<'E', 'X', 'I', 'S', 'T', 'S'> {
};

struct identifier_rule : pegtl::identifier {
};

struct left_paren : pegtl::one<'('> {
};

struct right_paren : pegtl::one<')'> {
};

struct comma : pegtl::one<','> {
};

struct semicolon : pegtl::one<';'> {
};

struct statement_end : pegtl::seq<optional_space, pegtl::opt<semicolon, optional_space>, pegtl::eof> {
};

struct value_literal_rule : pegtl::sor<expr::quoted_literal, expr::numeric_literal, identifier_rule> {
};

struct if_exists_rule : pegtl::seq<kw_if, required_space, kw_exists> {
};

struct order_by_start : pegtl::seq<required_space, kw_order, required_space, kw_by> {
};

struct where_char : pegtl::sor<expr::quoted_literal, pegtl::not_one<';'>> {
};

// Raw condition text handed to the predicate compiler. Stops at ORDER BY or ';'
// outside quoted literals.
struct where_text_rule : pegtl::plus<pegtl::not_at<order_by_start>, where_char> {
};

struct where_clause : pegtl::seq<required_space, kw_where, required_space, where_text_rule> {
};

// SELECT

struct select_star_token : pegtl::one<'*'> {
};

struct select_column_identifier : identifier_rule {
};

struct select_item_rule : pegtl::sor<select_star_token, select_column_identifier> {
};

struct select_list_rule
    : pegtl::seq<select_item_rule, pegtl::star<optional_space, comma, optional_space, select_item_rule>> {
};

struct select_table_identifier : identifier_rule {
};

struct order_column_identifier : identifier_rule {
};

struct order_direction_desc : kw_desc {
};

struct order_item_rule
    : pegtl::seq<order_column_identifier, pegtl::opt<required_space, pegtl::sor<kw_asc, order_direction_desc>>> {
};

struct order_by_clause
    : pegtl::seq<order_by_start,
                 required_space,
                 order_item_rule,
                 pegtl::star<optional_space, comma, optional_space, order_item_rule>> {
};

struct select_grammar
    : pegtl::seq<optional_space,
                 kw_select,
                 required_space,
                 select_list_rule,
                 required_space,
                 kw_from,
                 required_space,
                 select_table_identifier,
                 pegtl::opt<where_clause>,
                 pegtl::opt<order_by_clause>,
                 statement_end> {
};

// CREATE TABLE

struct table_name_identifier : identifier_rule {
};

struct column_identifier : identifier_rule {
};

struct type_identifier : identifier_rule {
};

struct type_length_rule : pegtl::plus<pegtl::digit> {
};

struct type_rule
    : pegtl::seq<type_identifier,
                 pegtl::opt<optional_space, left_paren, optional_space, type_length_rule, optional_space, right_paren>> {
};

struct constraint_not_null_rule : pegtl::seq<kw_not, required_space, kw_null> {
};

struct primary_key_rule : pegtl::seq<kw_primary, required_space, kw_key> {
};

struct column_constraint_rule : pegtl::seq<required_space, pegtl::sor<constraint_not_null_rule, primary_key_rule>> {
};

struct column_definition_rule
    : pegtl::seq<column_identifier, required_space, type_rule, pegtl::star<column_constraint_rule>> {
};

struct primary_key_column_identifier : identifier_rule {
};

struct table_primary_key_rule
    : pegtl::seq<kw_primary,
                 required_space,
                 kw_key,
                 optional_space,
                 left_paren,
                 optional_space,
                 primary_key_column_identifier,
                 pegtl::star<optional_space, comma, optional_space, primary_key_column_identifier>,
                 optional_space,
                 right_paren> {
};

struct table_element_rule : pegtl::sor<table_primary_key_rule, column_definition_rule> {
};

struct create_table_grammar
    : pegtl::seq<optional_space,
                 kw_create,
                 required_space,
                 kw_table,
                 required_space,
                 table_name_identifier,
                 optional_space,
                 left_paren,
                 optional_space,
                 table_element_rule,
                 pegtl::star<optional_space, comma, optional_space, table_element_rule>,
                 optional_space,
                 right_paren,
                 statement_end> {
};

// INSERT

struct insert_table_identifier : identifier_rule {
};

struct insert_column_identifier : identifier_rule {
};

struct insert_column_list_rule
    : pegtl::seq<left_paren,
                 optional_space,
                 insert_column_identifier,
                 pegtl::star<optional_space, comma, optional_space, insert_column_identifier>,
                 optional_space,
                 right_paren> {
};

struct values_row_open : left_paren {
};

struct insert_value_rule : value_literal_rule {
};

struct values_row_rule
    : pegtl::seq<values_row_open,
                 optional_space,
                 insert_value_rule,
                 pegtl::star<optional_space, comma, optional_space, insert_value_rule>,
                 optional_space,
                 right_paren> {
};

struct insert_grammar
    : pegtl::seq<optional_space,
                 kw_insert,
                 required_space,
                 kw_into,
                 required_space,
                 insert_table_identifier,
                 optional_space,
                 pegtl::opt<insert_column_list_rule, optional_space>,
                 kw_values,
                 optional_space,
                 values_row_rule,
                 pegtl::star<optional_space, comma, optional_space, values_row_rule>,
                 statement_end> {
};

// UPDATE

struct update_table_identifier : identifier_rule {
};

struct assignment_column_identifier : identifier_rule {
};

struct assignment_value_rule : value_literal_rule {
};

struct assignment_rule
    : pegtl::seq<assignment_column_identifier, optional_space, pegtl::one<'='>, optional_space, assignment_value_rule> {
};

struct update_grammar
    : pegtl::seq<optional_space,
                 kw_update,
                 required_space,
                 update_table_identifier,
                 required_space,
                 kw_set,
                 required_space,
                 assignment_rule,
                 pegtl::star<optional_space, comma, optional_space, assignment_rule>,
                 pegtl::opt<where_clause>,
                 statement_end> {
};

// DELETE

struct delete_table_identifier : identifier_rule {
};

struct delete_grammar
    : pegtl::seq<optional_space,
                 kw_delete,
                 required_space,
                 kw_from,
                 required_space,
                 delete_table_identifier,
                 pegtl::opt<where_clause>,
                 statement_end> {
};

// DROP TABLE

struct drop_table_identifier : identifier_rule {
};

struct drop_table_grammar
    : pegtl::seq<optional_space,
                 kw_drop,
                 required_space,
                 kw_table,
                 required_space,
                 pegtl::opt<if_exists_rule, required_space>,
                 drop_table_identifier,
                 pegtl::star<optional_space, comma, optional_space, drop_table_identifier>,
                 statement_end> {
};

struct identifier_grammar : pegtl::seq<optional_space, identifier_rule, optional_space, pegtl::eof> {
};

std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1)};
}

std::string uppercase_copy(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (unsigned char ch : text) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

std::string leading_word(std::string_view text)
{
    const auto trimmed = trim_copy(text);
    std::size_t end = 0U;
    while (end < trimmed.size() &&
           (std::isalnum(static_cast<unsigned char>(trimmed[end])) != 0 || trimmed[end] == '_')) {
        ++end;
    }
    return uppercase_copy(std::string_view{trimmed}.substr(0U, end));
}

template <typename Rule>
struct identifier_action {
    template <typename Input>
    static void apply(const Input&, Identifier&)
    {
    }
};

template <>
struct identifier_action<identifier_rule> {
    template <typename Input>
    static void apply(const Input& in, Identifier& identifier)
    {
        identifier.value = in.string();
    }
};

template <typename Rule>
struct select_action {
    template <typename Input>
    static void apply(const Input&, SelectStatement&)
    {
    }
};

template <>
struct select_action<select_star_token> {
    template <typename Input>
    static void apply(const Input&, SelectStatement& statement)
    {
        statement.columns.emplace_back("*");
    }
};

template <>
struct select_action<select_column_identifier> {
    template <typename Input>
    static void apply(const Input& in, SelectStatement& statement)
    {
        statement.columns.push_back(in.string());
    }
};

template <>
struct select_action<select_table_identifier> {
    template <typename Input>
    static void apply(const Input& in, SelectStatement& statement)
    {
        statement.table.value = in.string();
    }
};

template <>
struct select_action<where_text_rule> {
    template <typename Input>
    static void apply(const Input& in, SelectStatement& statement)
    {
        statement.where = trim_copy(in.string());
    }
};

template <>
struct select_action<order_column_identifier> {
    template <typename Input>
    static void apply(const Input& in, SelectStatement& statement)
    {
        auto& item = statement.order_by.emplace_back();
        item.column.value = in.string();
    }
};

template <>
struct select_action<order_direction_desc> {
    template <typename Input>
    static void apply(const Input&, SelectStatement& statement)
    {
        if (!statement.order_by.empty()) {
            statement.order_by.back().descending = true;
        }
    }
};

struct CreateTableParseState final {
    bool length_overflow = false;
};

template <typename Rule>
struct create_table_action {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement&, CreateTableParseState&)
    {
    }
};

template <>
struct create_table_action<table_name_identifier> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        statement.name.value = in.string();
    }
};

template <>
struct create_table_action<column_identifier> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        auto& column = statement.columns.emplace_back();
        column.name.value = in.string();
    }
};

template <>
struct create_table_action<type_identifier> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        if (!statement.columns.empty()) {
            statement.columns.back().type_name.value = in.string();
        }
    }
};

template <>
struct create_table_action<type_length_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        if (statement.columns.empty()) {
            return;
        }
        const auto text = in.string();
        std::uint32_t length = 0U;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), length);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            state.length_overflow = true;
            return;
        }
        statement.columns.back().type_length = length;
    }
};

template <>
struct create_table_action<constraint_not_null_rule> {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement& statement, CreateTableParseState&)
    {
        if (!statement.columns.empty()) {
            statement.columns.back().not_null = true;
        }
    }
};

template <>
struct create_table_action<primary_key_rule> {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement& statement, CreateTableParseState&)
    {
        if (!statement.columns.empty()) {
            auto& column = statement.columns.back();
            column.primary_key = true;
            column.not_null = true;
        }
    }
};

template <>
struct create_table_action<primary_key_column_identifier> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        statement.primary_key_columns.push_back(Identifier{in.string()});
    }
};

template <typename Rule>
struct insert_action {
    template <typename Input>
    static void apply(const Input&, InsertStatement&)
    {
    }
};

template <>
struct insert_action<insert_table_identifier> {
    template <typename Input>
    static void apply(const Input& in, InsertStatement& statement)
    {
        statement.table.value = in.string();
    }
};

template <>
struct insert_action<insert_column_identifier> {
    template <typename Input>
    static void apply(const Input& in, InsertStatement& statement)
    {
        statement.columns.push_back(Identifier{in.string()});
    }
};

template <>
struct insert_action<values_row_open> {
    template <typename Input>
    static void apply(const Input&, InsertStatement& statement)
    {
        statement.rows.emplace_back();
    }
};

template <>
struct insert_action<insert_value_rule> {
    template <typename Input>
    static void apply(const Input& in, InsertStatement& statement)
    {
        if (!statement.rows.empty()) {
            statement.rows.back().push_back(in.string());
        }
    }
};

template <typename Rule>
struct update_action {
    template <typename Input>
    static void apply(const Input&, UpdateStatement&)
    {
    }
};

template <>
struct update_action<update_table_identifier> {
    template <typename Input>
    static void apply(const Input& in, UpdateStatement& statement)
    {
        statement.table.value = in.string();
    }
};

template <>
struct update_action<assignment_column_identifier> {
    template <typename Input>
    static void apply(const Input& in, UpdateStatement& statement)
    {
        auto& assignment = statement.assignments.emplace_back();
        assignment.column.value = in.string();
    }
};

template <>
struct update_action<assignment_value_rule> {
    template <typename Input>
    static void apply(const Input& in, UpdateStatement& statement)
    {
        if (!statement.assignments.empty()) {
            statement.assignments.back().value = in.string();
        }
    }
};

template <>
struct update_action<where_text_rule> {
    template <typename Input>
    static void apply(const Input& in, UpdateStatement& statement)
    {
        statement.where = trim_copy(in.string());
    }
};

template <typename Rule>
struct delete_action {
    template <typename Input>
    static void apply(const Input&, DeleteStatement&)
    {
    }
};

template <>
struct delete_action<delete_table_identifier> {
    template <typename Input>
    static void apply(const Input& in, DeleteStatement& statement)
    {
        statement.table.value = in.string();
    }
};

template <>
struct delete_action<where_text_rule> {
    template <typename Input>
    static void apply(const Input& in, DeleteStatement& statement)
    {
        statement.where = trim_copy(in.string());
    }
};

template <typename Rule>
struct drop_table_action {
    template <typename Input>
    static void apply(const Input&, DropTableStatement&)
    {
    }
};

template <>
struct drop_table_action<if_exists_rule> {
    template <typename Input>
    static void apply(const Input&, DropTableStatement& statement)
    {
        statement.if_exists = true;
    }
};

template <>
struct drop_table_action<drop_table_identifier> {
    template <typename Input>
    static void apply(const Input& in, DropTableStatement& statement)
    {
        statement.tables.push_back(Identifier{in.string()});
    }
};

std::string format_parse_message(std::string_view message)
{
    constexpr std::string_view expected_prefix = "expected ";
    if (message.rfind(expected_prefix, 0) == 0U && message.size() > expected_prefix.size()) {
        auto detail = message.substr(expected_prefix.size());
        if (!detail.empty() && detail.front() == '\'' && detail.back() == '\'' && detail.size() > 2) {
            detail = detail.substr(1, detail.size() - 2);
        }
        return "Missing " + std::string{detail};
    }
    return std::string{message};
}

std::string_view extract_token(std::string_view input, std::size_t offset)
{
    if (input.empty()) {
        return {};
    }

    offset = std::min(offset, input.size() - 1U);

    auto is_separator = [](char ch) {
        const auto unsigned_ch = static_cast<unsigned char>(ch);
        return std::isspace(unsigned_ch) != 0 || ch == ';' || ch == ',' || ch == '(' || ch == ')';
    };

    std::size_t begin = offset;
    while (begin > 0U && !is_separator(input[begin - 1U])) {
        --begin;
    }

    std::size_t end = offset;
    while (end < input.size() && !is_separator(input[end])) {
        ++end;
    }

    return input.substr(begin, end - begin);
}

ParserDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = format_parse_message(error.message());
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {"Review the SQL syntax near the reported token."};

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);

        const auto byte_index = static_cast<std::size_t>(position.byte);
        if (!source.empty() && byte_index < source.size()) {
            const auto token = trim_copy(extract_token(source, byte_index));
            if (!token.empty()) {
                diagnostic.message += " near '" + token + "'";
            }
        } else if (byte_index >= source.size()) {
            diagnostic.message += " at end of input";
        }
    }

    return diagnostic;
}

ParserDiagnostic make_mismatch(std::string_view statement_kind, std::string_view source, std::string hint)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = "input did not match " + std::string{statement_kind} + " grammar";
    diagnostic.line = 1U;
    diagnostic.column = 1U;
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {std::move(hint)};
    return diagnostic;
}

ParserDiagnostic make_statement_error(std::string message, std::string_view source, std::string hint)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = std::move(message);
    diagnostic.statement = trim_copy(source);
    if (!hint.empty()) {
        diagnostic.remediation_hints = {std::move(hint)};
    }
    return diagnostic;
}

// Maps declared type names onto engine types and folds table level primary
// key clauses into the column definitions.
bool resolve_column_types(CreateTableStatement& statement,
                          std::string_view source,
                          std::vector<ParserDiagnostic>& diagnostics)
{
    bool ok = true;
    for (auto& column : statement.columns) {
        const auto type_name = uppercase_copy(column.type_name.value);
        if (type_name == "INT" || type_name == "INTEGER") {
            column.data_type = catalog::DataType::integer(column.type_length.value_or(catalog::DataType::kDefaultIntWidth));
        } else if (type_name == "VARCHAR") {
            column.data_type =
                catalog::DataType::varchar(column.type_length.value_or(catalog::DataType::kDefaultVarcharLength));
        } else {
            diagnostics.push_back(make_statement_error("Unsupported data type '" + column.type_name.value + "' for column '" +
                                                           column.name.value + "'",
                                                       source,
                                                       "Use INT or VARCHAR(n)."));
            ok = false;
        }
    }

    for (const auto& key : statement.primary_key_columns) {
        auto it = std::find_if(statement.columns.begin(), statement.columns.end(), [&key](const ColumnDefinition& column) {
            return column.name.value == key.value;
        });
        if (it == statement.columns.end()) {
            diagnostics.push_back(make_statement_error("PRIMARY KEY references unknown column '" + key.value + "'",
                                                       source,
                                                       "List only columns declared in the table."));
            ok = false;
            continue;
        }
        it->primary_key = true;
        it->not_null = true;
    }

    return ok;
}

template <typename Statement, template <typename> class Action, typename Grammar, typename... States>
ParseResult<Statement> run_grammar(std::string_view input,
                                   std::string_view source_name,
                                   std::string_view statement_kind,
                                   std::string hint,
                                   States&... states)
{
    ParseResult<Statement> result{};
    pegtl::memory_input in(input, std::string{source_name});
    Statement statement{};

    try {
        const auto parsed = pegtl::parse<Grammar, Action>(in, statement, states...);
        if (parsed) {
            result.ast = std::move(statement);
        } else {
            result.diagnostics.push_back(make_mismatch(statement_kind, input, std::move(hint)));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input));
    }

    return result;
}

}  // namespace

ParseResult<Identifier> parse_identifier(std::string_view input)
{
    return run_grammar<Identifier, identifier_action, identifier_grammar>(
        input, "identifier", "identifier", "Identifiers start with a letter or '_' followed by letters, digits or '_'.");
}

ParseResult<SelectStatement> parse_select(std::string_view input)
{
    return run_grammar<SelectStatement, select_action, select_grammar>(
        input,
        "select_statement",
        "SELECT",
        "Use SELECT <columns|*> FROM <table> [WHERE <condition>] [ORDER BY <column> [ASC|DESC], ...].");
}

ParseResult<CreateTableStatement> parse_create_table(std::string_view input)
{
    CreateTableParseState state{};
    auto result = run_grammar<CreateTableStatement, create_table_action, create_table_grammar>(
        input,
        "create_table",
        "CREATE TABLE",
        "Use CREATE TABLE <name> (<column> INT|VARCHAR(n) [PRIMARY KEY] [NOT NULL], ...).",
        state);

    if (!result.success()) {
        return result;
    }

    if (state.length_overflow) {
        result.diagnostics.push_back(make_statement_error("Type length is out of range", input, "Use a length below 4294967296."));
        result.ast.reset();
        return result;
    }

    if (!resolve_column_types(*result.ast, input, result.diagnostics)) {
        result.ast.reset();
    }
    return result;
}

ParseResult<InsertStatement> parse_insert(std::string_view input)
{
    return run_grammar<InsertStatement, insert_action, insert_grammar>(
        input, "insert_statement", "INSERT", "Use INSERT INTO <table> [(<columns>)] VALUES (...), (...).");
}

ParseResult<UpdateStatement> parse_update(std::string_view input)
{
    return run_grammar<UpdateStatement, update_action, update_grammar>(
        input, "update_statement", "UPDATE", "Use UPDATE <table> SET <column> = <value>, ... [WHERE <condition>].");
}

ParseResult<DeleteStatement> parse_delete(std::string_view input)
{
    return run_grammar<DeleteStatement, delete_action, delete_grammar>(
        input, "delete_statement", "DELETE", "Use DELETE FROM <table> [WHERE <condition>].");
}

ParseResult<DropTableStatement> parse_drop_table(std::string_view input)
{
    return run_grammar<DropTableStatement, drop_table_action, drop_table_grammar>(
        input, "drop_table", "DROP TABLE", "Use DROP TABLE [IF EXISTS] <table>, ....");
}

ParseResult<CalculateStatement> parse_calculate(std::string_view input)
{
    ParseResult<CalculateStatement> result{};
    auto expression = trim_copy(input);
    while (!expression.empty() && expression.back() == ';') {
        expression.pop_back();
        expression = trim_copy(expression);
    }

    if (leading_word(expression) == "SELECT") {
        expression = trim_copy(std::string_view{expression}.substr(6U));
    }

    const auto evaluation = evaluate_arithmetic(expression);
    if (!evaluation.success()) {
        result.diagnostics.push_back(
            make_statement_error(evaluation.error, input, "Calculations support numbers, + - * / and parentheses."));
        return result;
    }

    CalculateStatement statement{};
    statement.expression = std::move(expression);
    statement.result = *evaluation.value;
    result.ast = std::move(statement);
    return result;
}

namespace {

template <typename Statement>
void assign_result(ScriptStatement& script, StatementType type, ParseResult<Statement>&& parsed)
{
    script.type = type;
    script.diagnostics.insert(script.diagnostics.end(),
                              std::make_move_iterator(parsed.diagnostics.begin()),
                              std::make_move_iterator(parsed.diagnostics.end()));
    if (parsed.success()) {
        script.ast = std::move(*parsed.ast);
        script.success = true;
    }
}

// Replaces the SQL diagnostics only when the text turns out to be a calculation.
template <typename Statement>
void assign_with_calculation_fallback(ScriptStatement& script, StatementType type, ParseResult<Statement>&& parsed)
{
    if (parsed.success()) {
        assign_result(script, type, std::move(parsed));
        return;
    }

    auto calculation = parse_calculate(script.text);
    if (calculation.success()) {
        assign_result(script, StatementType::Calculate, std::move(calculation));
        return;
    }
    assign_result(script, type, std::move(parsed));
}

}  // namespace

ScriptStatement parse_statement(std::string_view input)
{
    ScriptStatement script{};
    script.text = trim_copy(input);
    if (script.text.empty()) {
        return script;
    }

    const auto head = leading_word(script.text);
    if (head == "SELECT") {
        assign_with_calculation_fallback(script, StatementType::Select, parse_select(script.text));
    } else if (head == "CREATE") {
        assign_with_calculation_fallback(script, StatementType::CreateTable, parse_create_table(script.text));
    } else if (head == "INSERT") {
        assign_with_calculation_fallback(script, StatementType::Insert, parse_insert(script.text));
    } else if (head == "UPDATE") {
        assign_with_calculation_fallback(script, StatementType::Update, parse_update(script.text));
    } else if (head == "DELETE") {
        assign_with_calculation_fallback(script, StatementType::Delete, parse_delete(script.text));
    } else if (head == "DROP") {
        assign_with_calculation_fallback(script, StatementType::DropTable, parse_drop_table(script.text));
    } else {
        auto calculation = parse_calculate(script.text);
        if (!calculation.success() && !head.empty()) {
            script.diagnostics.push_back(make_statement_error("Unsupported statement '" + head + "'",
                                                              script.text,
                                                              "Supported statements: SELECT, CREATE TABLE, INSERT, UPDATE, "
                                                              "DELETE, DROP TABLE."));
        }
        assign_result(script, StatementType::Calculate, std::move(calculation));
    }

    return script;
}

std::string strip_comments(std::string_view input)
{
    std::string output;
    output.reserve(input.size());

    char quote = '\0';
    std::size_t position = 0U;
    while (position < input.size()) {
        const char ch = input[position];
        if (quote != '\0') {
            output.push_back(ch);
            if (ch == quote) {
                quote = '\0';
            }
            ++position;
            continue;
        }

        if (ch == '\'' || ch == '"') {
            quote = ch;
            output.push_back(ch);
            ++position;
            continue;
        }

        if (ch == '-' && position + 1U < input.size() && input[position + 1U] == '-') {
            position += 2U;
            while (position < input.size() && input[position] != '\n') {
                ++position;
            }
            continue;
        }

        if (ch == '/' && position + 1U < input.size() && input[position + 1U] == '*') {
            position += 2U;
            while (position + 1U < input.size() && !(input[position] == '*' && input[position + 1U] == '/')) {
                ++position;
            }
            position = std::min(position + 2U, input.size());
            output.push_back(' ');
            continue;
        }

        output.push_back(ch);
        ++position;
    }

    return output;
}

std::vector<std::string> split_statements(std::string_view input)
{
    std::vector<std::string> statements;
    char quote = '\0';
    std::size_t start = 0U;

    const auto flush = [&](std::size_t end) {
        auto piece = trim_copy(input.substr(start, end - start));
        if (!piece.empty()) {
            statements.push_back(std::move(piece));
        }
    };

    for (std::size_t position = 0U; position < input.size(); ++position) {
        const char ch = input[position];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            }
            continue;
        }
        if (ch == '\'' || ch == '"') {
            quote = ch;
        } else if (ch == ';') {
            flush(position);
            start = position + 1U;
        }
    }
    flush(input.size());

    return statements;
}

bool statement_terminated(std::string_view input)
{
    const auto cleaned = strip_comments(input);
    char quote = '\0';
    bool terminated = false;

    for (const char ch : cleaned) {
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            }
            continue;
        }
        if (ch == '\'' || ch == '"') {
            quote = ch;
            terminated = false;
        } else if (ch == ';') {
            terminated = true;
        } else if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            terminated = false;
        }
    }

    return quote == '\0' && terminated;
}

ScriptParseResult parse_script(std::string_view input)
{
    ScriptParseResult result{};
    const auto cleaned = strip_comments(input);
    for (const auto& text : split_statements(cleaned)) {
        result.statements.push_back(parse_statement(text));
    }
    return result;
}

std::string to_string(StatementType type)
{
    switch (type) {
    case StatementType::Select:
        return "SELECT";
    case StatementType::CreateTable:
        return "CREATE TABLE";
    case StatementType::Insert:
        return "INSERT";
    case StatementType::Update:
        return "UPDATE";
    case StatementType::Delete:
        return "DELETE";
    case StatementType::DropTable:
        return "DROP TABLE";
    case StatementType::Calculate:
        return "CALCULATE";
    case StatementType::Unknown:
    default:
        return "UNKNOWN";
    }
}

}  // namespace tabula::parser
