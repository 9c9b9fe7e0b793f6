#pragma once

#include "tabula/catalog/catalog_schema.hpp"
#include "tabula/executor/engine_errors.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace tabula::storage {

using executor::EngineResult;
using executor::EngineStatus;

// Document layout:
// {"tables":[{"name":..,"columns":[{"name":..,"data_type":{"Int":10},
//   "is_primary":..,"not_null":..}],"data":[["1","Alice"]]}]}
// Fails with SnapshotFormatError when a name or cell is not valid UTF-8.
[[nodiscard]] EngineResult<std::string> encode_snapshot(const catalog::Database& database);
[[nodiscard]] EngineResult<catalog::Database> decode_snapshot(std::string_view document);

[[nodiscard]] EngineStatus write_snapshot(const catalog::Database& database, std::ostream& stream);
[[nodiscard]] EngineResult<catalog::Database> read_snapshot(std::istream& stream);

// Writes through a sibling temporary file and renames it over path, creating
// parent directories when needed.
[[nodiscard]] EngineStatus save_snapshot(const catalog::Database& database, const std::filesystem::path& path);

// A missing file yields an empty database.
[[nodiscard]] EngineResult<catalog::Database> load_snapshot(const std::filesystem::path& path);

}  // namespace tabula::storage
