#pragma once

#include "tabula/catalog/catalog_schema.hpp"
#include "tabula/executor/engine_errors.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::executor {

// Read-only validation of candidate rows against one table's schema and data.
// The enforcer never mutates the table it was built over.
class ConstraintEnforcer final {
public:
    explicit ConstraintEnforcer(const catalog::Table& table) noexcept;

    // Checks arity, NOT NULL, column types and primary key uniqueness in that
    // order. ignore_row excludes one stored row from the uniqueness probe.
    [[nodiscard]] EngineStatus validate_row(const catalog::Row& candidate,
                                            std::optional<std::size_t> ignore_row = std::nullopt) const;

    [[nodiscard]] EngineStatus validate_not_null(std::size_t column_index, std::string_view cell) const;
    [[nodiscard]] EngineStatus validate_type(std::size_t column_index, std::string_view cell) const;

    // NOT NULL followed by the type check for a single cell.
    [[nodiscard]] EngineStatus validate_cell(std::size_t column_index, std::string_view cell) const;

    [[nodiscard]] EngineStatus check_primary_key(std::string_view key,
                                                 std::optional<std::size_t> ignore_row = std::nullopt) const;

    [[nodiscard]] const catalog::Table& table() const noexcept { return *table_; }

private:
    const catalog::Table* table_ = nullptr;
    std::optional<std::size_t> primary_index_{};
};

// Builds a full positional row from caller literals. With an empty column list
// the values map onto the schema in order; otherwise unlisted columns receive
// the NULL sentinel. A column named twice is rejected. Literals are normalized
// before placement.
[[nodiscard]] EngineResult<catalog::Row> assemble_row(const catalog::Table& table,
                                                      std::span<const std::string> column_names,
                                                      std::span<const std::string> values);

[[nodiscard]] EngineStatus column_not_found(std::string_view column_name);
[[nodiscard]] EngineStatus table_not_found(std::string_view table_name);

}  // namespace tabula::executor
