#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::catalog {

enum class DataTypeKind : std::uint8_t {
    Int = 0,
    Varchar
};

// Int carries an informational display width; Varchar carries the maximum
// cell length in bytes.
struct DataType final {
    DataTypeKind kind = DataTypeKind::Int;
    std::uint32_t size = 0U;

    [[nodiscard]] static constexpr DataType integer(std::uint32_t width = kDefaultIntWidth) noexcept
    {
        return DataType{DataTypeKind::Int, width};
    }

    [[nodiscard]] static constexpr DataType varchar(std::uint32_t max_length = kDefaultVarcharLength) noexcept
    {
        return DataType{DataTypeKind::Varchar, max_length};
    }

    [[nodiscard]] constexpr bool is_integer() const noexcept { return kind == DataTypeKind::Int; }
    [[nodiscard]] constexpr bool is_varchar() const noexcept { return kind == DataTypeKind::Varchar; }

    bool operator==(const DataType& other) const = default;

    static constexpr std::uint32_t kDefaultIntWidth = 10U;
    static constexpr std::uint32_t kDefaultVarcharLength = 255U;
};

[[nodiscard]] std::string to_string(const DataType& type);

struct Column final {
    std::string name{};
    DataType data_type{};
    bool is_primary = false;
    bool not_null = false;

    // Primary columns reject NULL even when not_null was not declared.
    [[nodiscard]] bool rejects_null() const noexcept { return is_primary || not_null; }

    bool operator==(const Column& other) const = default;
};

using Row = std::vector<std::string>;

struct Table final {
    std::string name{};
    std::vector<Column> columns{};
    std::vector<Row> data{};

    [[nodiscard]] std::optional<std::size_t> column_index(std::string_view column_name) const noexcept;
    [[nodiscard]] std::optional<std::size_t> primary_key_index() const noexcept;
    [[nodiscard]] std::vector<std::size_t> all_column_indices() const;
    [[nodiscard]] std::vector<std::string> column_names() const;

    bool operator==(const Table& other) const = default;
};

class Database final {
public:
    Database() = default;

    [[nodiscard]] Table* find_table(std::string_view name) noexcept;
    [[nodiscard]] const Table* find_table(std::string_view name) const noexcept;

    // Case-insensitive probe used to keep table names unique on creation.
    [[nodiscard]] bool has_table_named(std::string_view name) const noexcept;

    Table& add_table(Table table);
    bool remove_table(std::string_view name);

    [[nodiscard]] const std::vector<Table>& tables() const noexcept { return tables_; }
    [[nodiscard]] std::size_t table_count() const noexcept { return tables_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tables_.empty(); }

    bool operator==(const Database& other) const = default;

private:
    std::vector<Table> tables_{};
};

[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

}  // namespace tabula::catalog
