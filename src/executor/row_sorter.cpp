#include "tabula/executor/row_sorter.hpp"

#include "tabula/executor/cell_format.hpp"
#include "tabula/executor/constraint_enforcer.hpp"

#include <algorithm>

namespace tabula::executor {

namespace {

[[nodiscard]] int compare_cells(std::string_view lhs, std::string_view rhs, const catalog::DataType& type) noexcept
{
    if (type.is_integer()) {
        const auto left = int32_or_zero(lhs);
        const auto right = int32_or_zero(rhs);
        return left < right ? -1 : (left > right ? 1 : 0);
    }

    const auto order = lhs.compare(rhs);
    return order < 0 ? -1 : (order > 0 ? 1 : 0);
}

}  // namespace

EngineResult<std::vector<SortKey>> resolve_sort_keys(const catalog::Table& table, std::span<const OrderByItem> order_by)
{
    using Result = EngineResult<std::vector<SortKey>>;

    std::vector<SortKey> keys;
    keys.reserve(order_by.size());
    for (const auto& item : order_by) {
        const auto index = table.column_index(item.column);
        if (!index) {
            return Result::failure(column_not_found(item.column));
        }
        keys.push_back(SortKey{*index, table.columns[*index].data_type, item.descending});
    }
    return Result::ok(std::move(keys));
}

int compare_rows(const catalog::Row& lhs, const catalog::Row& rhs, std::span<const SortKey> keys)
{
    for (const auto& key : keys) {
        const std::string_view left = key.column_index < lhs.size() ? std::string_view{lhs[key.column_index]} : std::string_view{};
        const std::string_view right = key.column_index < rhs.size() ? std::string_view{rhs[key.column_index]} : std::string_view{};
        auto order = compare_cells(left, right, key.data_type);
        if (order != 0) {
            return key.descending ? -order : order;
        }
    }
    return 0;
}

void sort_rows(std::vector<catalog::Row>& rows, std::span<const SortKey> keys)
{
    if (keys.empty()) {
        return;
    }

    std::stable_sort(rows.begin(), rows.end(), [keys](const catalog::Row& lhs, const catalog::Row& rhs) {
        return compare_rows(lhs, rhs, keys) < 0;
    });
}

}  // namespace tabula::executor
