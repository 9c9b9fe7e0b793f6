#include "tabula/executor/constraint_enforcer.hpp"

#include "tabula/executor/cell_format.hpp"

#include <sstream>
#include <vector>

namespace tabula::executor {

namespace {

[[nodiscard]] EngineStatus ok_status() noexcept
{
    return EngineStatus{};
}

}  // namespace

EngineStatus column_not_found(std::string_view column_name)
{
    std::ostringstream stream;
    stream << "Column '" << column_name << "' not found";
    return make_status(EngineErrc::ColumnNotFound, stream.str());
}

EngineStatus table_not_found(std::string_view table_name)
{
    std::ostringstream stream;
    stream << "Table '" << table_name << "' not found";
    return make_status(EngineErrc::TableNotFound, stream.str());
}

ConstraintEnforcer::ConstraintEnforcer(const catalog::Table& table) noexcept
    : table_{&table}
    , primary_index_{table.primary_key_index()}
{
}

EngineStatus ConstraintEnforcer::validate_row(const catalog::Row& candidate, std::optional<std::size_t> ignore_row) const
{
    const auto& columns = table_->columns;
    if (candidate.size() != columns.size()) {
        std::ostringstream stream;
        stream << "Column count mismatch: table '" << table_->name << "' has " << columns.size()
               << " columns but " << candidate.size() << " values were supplied";
        return make_status(EngineErrc::ColumnCountMismatch, stream.str());
    }

    for (std::size_t index = 0U; index < columns.size(); ++index) {
        if (auto status = validate_not_null(index, candidate[index]); !status.ok()) {
            return status;
        }
    }

    for (std::size_t index = 0U; index < columns.size(); ++index) {
        if (auto status = validate_type(index, candidate[index]); !status.ok()) {
            return status;
        }
    }

    if (primary_index_) {
        return check_primary_key(candidate[*primary_index_], ignore_row);
    }
    return ok_status();
}

EngineStatus ConstraintEnforcer::validate_not_null(std::size_t column_index, std::string_view cell) const
{
    const auto& column = table_->columns.at(column_index);
    if (column.rejects_null() && is_null_cell(cell)) {
        std::ostringstream stream;
        stream << "Field '" << column.name << "' doesn't have a default value";
        return make_status(EngineErrc::MissingValue, stream.str());
    }
    return ok_status();
}

EngineStatus ConstraintEnforcer::validate_type(std::size_t column_index, std::string_view cell) const
{
    if (is_null_cell(cell)) {
        return ok_status();
    }

    const auto& column = table_->columns.at(column_index);
    switch (column.data_type.kind) {
    case catalog::DataTypeKind::Int:
        if (!parse_int32(trim(cell))) {
            std::ostringstream stream;
            stream << "Value '" << cell << "' is not INT for column '" << column.name << "'";
            return make_status(EngineErrc::TypeMismatch, stream.str());
        }
        break;
    case catalog::DataTypeKind::Varchar:
        if (cell.size() > column.data_type.size) {
            std::ostringstream stream;
            stream << "Value too long for column '" << column.name << "' (max " << column.data_type.size << ")";
            return make_status(EngineErrc::ValueTooLong, stream.str());
        }
        break;
    default:
        break;
    }
    return ok_status();
}

EngineStatus ConstraintEnforcer::validate_cell(std::size_t column_index, std::string_view cell) const
{
    if (auto status = validate_not_null(column_index, cell); !status.ok()) {
        return status;
    }
    return validate_type(column_index, cell);
}

EngineStatus ConstraintEnforcer::check_primary_key(std::string_view key, std::optional<std::size_t> ignore_row) const
{
    if (!primary_index_ || is_null_cell(key)) {
        return ok_status();
    }

    const auto key_index = *primary_index_;
    const auto& rows = table_->data;
    for (std::size_t row_index = 0U; row_index < rows.size(); ++row_index) {
        if (ignore_row && *ignore_row == row_index) {
            continue;
        }
        const auto& row = rows[row_index];
        if (key_index < row.size() && row[key_index] == key) {
            std::ostringstream stream;
            stream << "Duplicate entry '" << key << "' for key 'PRIMARY'";
            return make_status(EngineErrc::DuplicateKey, stream.str());
        }
    }
    return ok_status();
}

EngineResult<catalog::Row> assemble_row(const catalog::Table& table,
                                        std::span<const std::string> column_names,
                                        std::span<const std::string> values)
{
    using Result = EngineResult<catalog::Row>;

    const auto mismatch = [&table](std::size_t expected, std::size_t supplied) {
        std::ostringstream stream;
        stream << "Column count mismatch: expected " << expected << " values for table '" << table.name << "' but got "
               << supplied;
        return Result::failure(make_status(EngineErrc::ColumnCountMismatch, stream.str()));
    };

    if (column_names.empty()) {
        if (values.size() != table.columns.size()) {
            return mismatch(table.columns.size(), values.size());
        }
        catalog::Row row;
        row.reserve(values.size());
        for (const auto& value : values) {
            row.push_back(normalize_cell(value));
        }
        return Result::ok(std::move(row));
    }

    if (values.size() != column_names.size()) {
        return mismatch(column_names.size(), values.size());
    }

    catalog::Row row(table.columns.size());
    std::vector<bool> assigned(table.columns.size(), false);
    for (std::size_t index = 0U; index < column_names.size(); ++index) {
        const auto target = table.column_index(column_names[index]);
        if (!target) {
            return Result::failure(column_not_found(column_names[index]));
        }
        if (assigned[*target]) {
            std::ostringstream stream;
            stream << "Column '" << column_names[index] << "' specified more than once";
            return Result::failure(make_status(EngineErrc::ColumnCountMismatch, stream.str()));
        }
        assigned[*target] = true;
        row[*target] = normalize_cell(values[index]);
    }
    return Result::ok(std::move(row));
}

}  // namespace tabula::executor
