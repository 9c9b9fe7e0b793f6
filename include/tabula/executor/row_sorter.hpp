#pragma once

#include "tabula/catalog/catalog_schema.hpp"
#include "tabula/executor/engine_errors.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace tabula::executor {

struct OrderByItem final {
    std::string column{};
    bool descending = false;
};

struct SortKey final {
    std::size_t column_index = 0U;
    catalog::DataType data_type{};
    bool descending = false;
};

[[nodiscard]] EngineResult<std::vector<SortKey>> resolve_sort_keys(const catalog::Table& table,
                                                                   std::span<const OrderByItem> order_by);

// Three-way comparison over the keys in order. Int keys compare numerically
// with unparsable cells as 0, Varchar keys compare bytewise. descending flips
// only the key it belongs to.
[[nodiscard]] int compare_rows(const catalog::Row& lhs, const catalog::Row& rhs, std::span<const SortKey> keys);

// Stable: rows equal on every key keep their relative order.
void sort_rows(std::vector<catalog::Row>& rows, std::span<const SortKey> keys);

}  // namespace tabula::executor
