#include "tabula/catalog/catalog_schema.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace tabula::catalog {

std::string to_string(const DataType& type)
{
    switch (type.kind) {
    case DataTypeKind::Int:
        return "INT(" + std::to_string(type.size) + ")";
    case DataTypeKind::Varchar:
        return "VARCHAR(" + std::to_string(type.size) + ")";
    default:
        return "UNKNOWN";
    }
}

std::optional<std::size_t> Table::column_index(std::string_view column_name) const noexcept
{
    for (std::size_t index = 0U; index < columns.size(); ++index) {
        if (columns[index].name == column_name) {
            return index;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> Table::primary_key_index() const noexcept
{
    const auto it = std::find_if(columns.begin(), columns.end(), [](const Column& column) {
        return column.is_primary;
    });
    if (it == columns.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(columns.begin(), it));
}

std::vector<std::size_t> Table::all_column_indices() const
{
    std::vector<std::size_t> indices;
    indices.reserve(columns.size());
    for (std::size_t index = 0U; index < columns.size(); ++index) {
        indices.push_back(index);
    }
    return indices;
}

std::vector<std::string> Table::column_names() const
{
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
        names.push_back(column.name);
    }
    return names;
}

Table* Database::find_table(std::string_view name) noexcept
{
    auto it = std::find_if(tables_.begin(), tables_.end(), [name](const Table& table) {
        return table.name == name;
    });
    return it == tables_.end() ? nullptr : &*it;
}

const Table* Database::find_table(std::string_view name) const noexcept
{
    auto it = std::find_if(tables_.begin(), tables_.end(), [name](const Table& table) {
        return table.name == name;
    });
    return it == tables_.end() ? nullptr : &*it;
}

bool Database::has_table_named(std::string_view name) const noexcept
{
    return std::any_of(tables_.begin(), tables_.end(), [name](const Table& table) {
        return iequals(table.name, name);
    });
}

Table& Database::add_table(Table table)
{
    tables_.push_back(std::move(table));
    return tables_.back();
}

bool Database::remove_table(std::string_view name)
{
    auto it = std::find_if(tables_.begin(), tables_.end(), [name](const Table& table) {
        return table.name == name;
    });
    if (it == tables_.end()) {
        return false;
    }
    tables_.erase(it);
    return true;
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::tolower(left) != std::tolower(right)) {
            return false;
        }
    }

    return true;
}

}  // namespace tabula::catalog
