#include "tabula/executor/query_executor.hpp"

#include "tabula/executor/cell_format.hpp"
#include "tabula/executor/constraint_enforcer.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace tabula::executor {

namespace {

[[nodiscard]] EngineStatus validate_definition(std::string_view table_name, const std::vector<catalog::Column>& columns)
{
    if (table_name.empty()) {
        return make_status(EngineErrc::InvalidDefinition, "Table name must not be empty");
    }
    if (columns.empty()) {
        std::ostringstream stream;
        stream << "Table '" << table_name << "' must have at least one column";
        return make_status(EngineErrc::InvalidDefinition, stream.str());
    }

    std::size_t primary_columns = 0U;
    for (std::size_t index = 0U; index < columns.size(); ++index) {
        const auto& column = columns[index];
        if (column.name.empty()) {
            return make_status(EngineErrc::InvalidDefinition, "Column name must not be empty");
        }
        for (std::size_t other = 0U; other < index; ++other) {
            if (catalog::iequals(columns[other].name, column.name)) {
                std::ostringstream stream;
                stream << "Duplicate column name '" << column.name << "'";
                return make_status(EngineErrc::InvalidDefinition, stream.str());
            }
        }
        if (column.is_primary) {
            ++primary_columns;
        }
    }

    if (primary_columns > 1U) {
        std::ostringstream stream;
        stream << "Table '" << table_name << "' declares " << primary_columns
               << " primary key columns; only one is supported";
        return make_status(EngineErrc::InvalidDefinition, stream.str());
    }
    return EngineStatus{};
}

struct ResolvedProjection final {
    std::vector<std::size_t> indices{};
    std::vector<std::string> headers{};
};

[[nodiscard]] EngineResult<ResolvedProjection> resolve_projection(const catalog::Table& table,
                                                                  std::span<const std::string> column_names)
{
    using Result = EngineResult<ResolvedProjection>;

    ResolvedProjection projection{};
    for (const auto& name : column_names) {
        if (name == "*") {
            const auto indices = table.all_column_indices();
            const auto headers = table.column_names();
            projection.indices.insert(projection.indices.end(), indices.begin(), indices.end());
            projection.headers.insert(projection.headers.end(), headers.begin(), headers.end());
            continue;
        }

        const auto index = table.column_index(name);
        if (!index) {
            return Result::failure(column_not_found(name));
        }
        projection.indices.push_back(*index);
        projection.headers.push_back(table.columns[*index].name);
    }
    return Result::ok(std::move(projection));
}

}  // namespace

EngineResult<Predicate> compile_optional_predicate(std::optional<std::string_view> condition, const catalog::Table& table)
{
    if (!condition || trim(*condition).empty()) {
        return EngineResult<Predicate>::ok(Predicate::match_all());
    }
    return compile_predicate(*condition, table);
}

QueryExecutor::QueryExecutor(catalog::Database& database) noexcept
    : database_{&database}
{
}

EngineStatus QueryExecutor::create_table(std::string_view name, std::vector<catalog::Column> columns)
{
    if (database_->has_table_named(name)) {
        std::ostringstream stream;
        stream << "Table '" << name << "' already exists";
        return make_status(EngineErrc::TableExists, stream.str());
    }

    if (auto status = validate_definition(name, columns); !status.ok()) {
        return status;
    }

    catalog::Table table{};
    table.name = std::string{name};
    table.columns = std::move(columns);
    database_->add_table(std::move(table));
    return EngineStatus{};
}

MutationResult QueryExecutor::insert(std::string_view table_name,
                                     std::span<const std::string> column_names,
                                     const std::vector<std::vector<std::string>>& rows)
{
    MutationResult result{};
    auto* table = database_->find_table(table_name);
    if (table == nullptr) {
        result.status = table_not_found(table_name);
        return result;
    }

    const ConstraintEnforcer enforcer{*table};
    for (const auto& values : rows) {
        auto candidate = assemble_row(*table, column_names, values);
        if (!candidate.success()) {
            result.status = std::move(candidate.status);
            return result;
        }

        if (auto status = enforcer.validate_row(*candidate.value); !status.ok()) {
            result.status = std::move(status);
            return result;
        }

        table->data.push_back(std::move(*candidate.value));
        ++result.rows_affected;
    }

    return result;
}

EngineResult<QueryResult> QueryExecutor::select(std::string_view table_name,
                                                std::span<const std::string> column_names,
                                                std::optional<std::string_view> condition,
                                                std::span<const OrderByItem> order_by) const
{
    using Result = EngineResult<QueryResult>;

    const auto* table = database_->find_table(table_name);
    if (table == nullptr) {
        return Result::failure(table_not_found(table_name));
    }

    auto projection = resolve_projection(*table, column_names);
    if (!projection.success()) {
        return Result::failure(std::move(projection.status));
    }

    auto keys = resolve_sort_keys(*table, order_by);
    if (!keys.success()) {
        return Result::failure(std::move(keys.status));
    }

    auto predicate = compile_optional_predicate(condition, *table);
    if (!predicate.success()) {
        return Result::failure(std::move(predicate.status));
    }

    std::vector<catalog::Row> matched;
    for (const auto& row : table->data) {
        if (predicate.value->matches(row)) {
            matched.push_back(row);
        }
    }

    sort_rows(matched, *keys.value);

    QueryResult query{};
    query.headers = std::move(projection.value->headers);
    query.rows.reserve(matched.size());
    const auto& indices = projection.value->indices;
    for (const auto& row : matched) {
        catalog::Row projected;
        projected.reserve(indices.size());
        for (const auto index : indices) {
            projected.push_back(index < row.size() ? row[index] : std::string{});
        }
        query.rows.push_back(std::move(projected));
    }

    return Result::ok(std::move(query));
}

MutationResult QueryExecutor::update(std::string_view table_name,
                                     std::span<const SetClause> assignments,
                                     std::optional<std::string_view> condition)
{
    MutationResult result{};
    auto* table = database_->find_table(table_name);
    if (table == nullptr) {
        result.status = table_not_found(table_name);
        return result;
    }

    std::vector<std::pair<std::size_t, std::string>> resolved;
    resolved.reserve(assignments.size());
    for (const auto& assignment : assignments) {
        const auto index = table->column_index(assignment.column);
        if (!index) {
            result.status = column_not_found(assignment.column);
            return result;
        }
        resolved.emplace_back(*index, normalize_cell(assignment.value));
    }

    auto predicate = compile_optional_predicate(condition, *table);
    if (!predicate.success()) {
        result.status = std::move(predicate.status);
        return result;
    }

    const ConstraintEnforcer enforcer{*table};
    const auto primary_index = table->primary_key_index();

    for (std::size_t row_index = 0U; row_index < table->data.size(); ++row_index) {
        if (!predicate.value->matches(table->data[row_index])) {
            continue;
        }

        auto candidate = table->data[row_index];
        for (const auto& [column_index, value] : resolved) {
            if (auto status = enforcer.validate_cell(column_index, value); !status.ok()) {
                result.status = std::move(status);
                return result;
            }
            candidate[column_index] = value;
        }

        if (primary_index && candidate[*primary_index] != table->data[row_index][*primary_index]) {
            if (auto status = enforcer.check_primary_key(candidate[*primary_index], row_index); !status.ok()) {
                result.status = std::move(status);
                return result;
            }
        }

        table->data[row_index] = std::move(candidate);
        ++result.rows_affected;
    }

    return result;
}

MutationResult QueryExecutor::delete_rows(std::string_view table_name, std::optional<std::string_view> condition)
{
    MutationResult result{};
    auto* table = database_->find_table(table_name);
    if (table == nullptr) {
        result.status = table_not_found(table_name);
        return result;
    }

    auto predicate = compile_optional_predicate(condition, *table);
    if (!predicate.success()) {
        result.status = std::move(predicate.status);
        return result;
    }

    const auto& filter = *predicate.value;
    const auto before = table->data.size();
    table->data.erase(std::remove_if(table->data.begin(), table->data.end(), [&filter](const catalog::Row& row) {
                          return filter.matches(row);
                      }),
                      table->data.end());
    result.rows_affected = before - table->data.size();
    return result;
}

MutationResult QueryExecutor::drop_tables(std::span<const std::string> table_names, bool if_exists)
{
    MutationResult result{};
    if (!if_exists) {
        for (const auto& name : table_names) {
            if (database_->find_table(name) == nullptr) {
                std::ostringstream stream;
                stream << "Unknown table '" << name << "'";
                result.status = make_status(EngineErrc::TableNotFound, stream.str());
                return result;
            }
        }
    }

    for (const auto& name : table_names) {
        if (database_->remove_table(name)) {
            ++result.rows_affected;
        }
    }
    return result;
}

}  // namespace tabula::executor
