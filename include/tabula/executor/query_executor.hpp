#pragma once

#include "tabula/catalog/catalog_schema.hpp"
#include "tabula/executor/engine_errors.hpp"
#include "tabula/executor/predicate.hpp"
#include "tabula/executor/row_sorter.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::executor {

struct QueryResult final {
    std::vector<std::string> headers{};
    std::vector<catalog::Row> rows{};
};

struct SetClause final {
    std::string column{};
    std::string value{};
};

// Runs create/insert/select/update/delete/drop against a database owned by
// the caller. Every operation validates before it mutates and reports failures
// through the returned status. Access must be serialized by the caller.
class QueryExecutor final {
public:
    explicit QueryExecutor(catalog::Database& database) noexcept;

    [[nodiscard]] EngineStatus create_table(std::string_view name, std::vector<catalog::Column> columns);

    // Rows are applied in order; the first failing row stops the call and
    // earlier rows stay committed. An empty column list means all columns.
    [[nodiscard]] MutationResult insert(std::string_view table_name,
                                        std::span<const std::string> column_names,
                                        const std::vector<std::vector<std::string>>& rows);

    // "*" expands to every column in schema order wherever it appears. Rows are
    // filtered and sorted on full rows before projection.
    [[nodiscard]] EngineResult<QueryResult> select(std::string_view table_name,
                                                   std::span<const std::string> column_names,
                                                   std::optional<std::string_view> condition = std::nullopt,
                                                   std::span<const OrderByItem> order_by = {}) const;

    [[nodiscard]] MutationResult update(std::string_view table_name,
                                        std::span<const SetClause> assignments,
                                        std::optional<std::string_view> condition = std::nullopt);

    [[nodiscard]] MutationResult delete_rows(std::string_view table_name,
                                             std::optional<std::string_view> condition = std::nullopt);

    // Without if_exists a missing name fails the whole call before anything is
    // dropped. rows_affected reports the number of tables removed.
    [[nodiscard]] MutationResult drop_tables(std::span<const std::string> table_names, bool if_exists);

    [[nodiscard]] catalog::Database& database() noexcept { return *database_; }
    [[nodiscard]] const catalog::Database& database() const noexcept { return *database_; }

private:
    catalog::Database* database_ = nullptr;
};

// Compiles an optional WHERE text; absent or blank text yields match-all.
[[nodiscard]] EngineResult<Predicate> compile_optional_predicate(std::optional<std::string_view> condition,
                                                                 const catalog::Table& table);

}  // namespace tabula::executor
