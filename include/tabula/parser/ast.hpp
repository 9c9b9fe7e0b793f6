#pragma once

#include "tabula/catalog/catalog_schema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tabula::parser {

struct Identifier final {
    std::string value{};
};

struct ColumnDefinition final {
    Identifier name{};
    Identifier type_name{};
    std::optional<std::uint32_t> type_length{};
    catalog::DataType data_type{};
    bool not_null = false;
    bool primary_key = false;
};

struct CreateTableStatement final {
    Identifier name{};
    std::vector<ColumnDefinition> columns{};
    // Columns named by a table level PRIMARY KEY (...) clause.
    std::vector<Identifier> primary_key_columns{};
};

struct DropTableStatement final {
    std::vector<Identifier> tables{};
    bool if_exists = false;
};

struct OrderByItem final {
    Identifier column{};
    bool descending = false;
};

struct SelectStatement final {
    Identifier table{};
    std::vector<std::string> columns{};
    std::optional<std::string> where{};
    std::vector<OrderByItem> order_by{};
};

// Values are kept as written (quotes included) and normalized by the executor.
struct InsertStatement final {
    Identifier table{};
    std::vector<Identifier> columns{};
    std::vector<std::vector<std::string>> rows{};
};

struct Assignment final {
    Identifier column{};
    std::string value{};
};

struct UpdateStatement final {
    Identifier table{};
    std::vector<Assignment> assignments{};
    std::optional<std::string> where{};
};

struct DeleteStatement final {
    Identifier table{};
    std::optional<std::string> where{};
};

struct CalculateStatement final {
    std::string expression{};
    double result = 0.0;
};

}  // namespace tabula::parser
