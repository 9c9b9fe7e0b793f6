#include "tabula/storage/snapshot_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

namespace tabula::storage {

using json = nlohmann::json;
using executor::EngineErrc;
using executor::make_status;

namespace {

constexpr int kIndent = 2;

[[nodiscard]] EngineStatus format_error(std::string message)
{
    return make_status(EngineErrc::SnapshotFormatError, "Malformed snapshot: " + std::move(message));
}

[[nodiscard]] EngineStatus io_error(const std::filesystem::path& path, std::string_view action, const std::error_code& ec = {})
{
    std::ostringstream stream;
    stream << "Failed to " << action << " snapshot '" << path.string() << "'";
    if (ec) {
        stream << ": " << ec.message();
    }
    return make_status(EngineErrc::SnapshotIoError, stream.str());
}

[[nodiscard]] json encode_data_type(const catalog::DataType& type)
{
    json encoded = json::object();
    encoded[type.is_integer() ? "Int" : "Varchar"] = type.size;
    return encoded;
}

[[nodiscard]] json encode_table(const catalog::Table& table)
{
    json columns = json::array();
    for (const auto& column : table.columns) {
        columns.push_back(json{{"name", column.name},
                               {"data_type", encode_data_type(column.data_type)},
                               {"is_primary", column.is_primary},
                               {"not_null", column.not_null}});
    }

    json data = json::array();
    for (const auto& row : table.data) {
        data.push_back(json(row));
    }

    return json{{"name", table.name}, {"columns", std::move(columns)}, {"data", std::move(data)}};
}

[[nodiscard]] bool read_size(const json& value, std::uint32_t& out)
{
    if (!value.is_number_unsigned()) {
        return false;
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw > std::numeric_limits<std::uint32_t>::max()) {
        return false;
    }
    out = static_cast<std::uint32_t>(raw);
    return true;
}

[[nodiscard]] EngineStatus decode_data_type(const json& value, const std::string& column_name, catalog::DataType& out)
{
    if (!value.is_object() || value.size() != 1U) {
        return format_error("column '" + column_name + "' has an invalid data_type");
    }

    const auto entry = value.begin();
    std::uint32_t size = 0U;
    if (!read_size(entry.value(), size)) {
        return format_error("column '" + column_name + "' has an invalid data_type size");
    }

    if (entry.key() == "Int") {
        out = catalog::DataType::integer(size);
    } else if (entry.key() == "Varchar") {
        out = catalog::DataType::varchar(size);
    } else {
        return format_error("column '" + column_name + "' has unknown data_type '" + entry.key() + "'");
    }
    return EngineStatus{};
}

[[nodiscard]] EngineStatus decode_column(const json& value, catalog::Column& out)
{
    if (!value.is_object()) {
        return format_error("column entry is not an object");
    }

    const auto name = value.find("name");
    const auto data_type = value.find("data_type");
    const auto is_primary = value.find("is_primary");
    const auto not_null = value.find("not_null");
    if (name == value.end() || !name->is_string()) {
        return format_error("column entry is missing a name");
    }
    out.name = name->get<std::string>();

    if (data_type == value.end()) {
        return format_error("column '" + out.name + "' is missing data_type");
    }
    if (auto status = decode_data_type(*data_type, out.name, out.data_type); !status.ok()) {
        return status;
    }

    if (is_primary == value.end() || !is_primary->is_boolean() || not_null == value.end() || !not_null->is_boolean()) {
        return format_error("column '" + out.name + "' is missing constraint flags");
    }
    out.is_primary = is_primary->get<bool>();
    out.not_null = not_null->get<bool>();
    return EngineStatus{};
}

[[nodiscard]] EngineStatus decode_table(const json& value, catalog::Table& out)
{
    if (!value.is_object()) {
        return format_error("table entry is not an object");
    }

    const auto name = value.find("name");
    if (name == value.end() || !name->is_string()) {
        return format_error("table entry is missing a name");
    }
    out.name = name->get<std::string>();

    const auto columns = value.find("columns");
    if (columns == value.end() || !columns->is_array()) {
        return format_error("table '" + out.name + "' is missing columns");
    }

    std::size_t primary_columns = 0U;
    for (const auto& column_value : *columns) {
        catalog::Column column{};
        if (auto status = decode_column(column_value, column); !status.ok()) {
            return status;
        }
        if (column.is_primary) {
            ++primary_columns;
        }
        out.columns.push_back(std::move(column));
    }
    if (primary_columns > 1U) {
        return format_error("table '" + out.name + "' declares more than one primary key column");
    }

    const auto data = value.find("data");
    if (data == value.end() || !data->is_array()) {
        return format_error("table '" + out.name + "' is missing data");
    }

    out.data.reserve(data->size());
    for (const auto& row_value : *data) {
        if (!row_value.is_array() || row_value.size() != out.columns.size()) {
            return format_error("table '" + out.name + "' has a row whose width does not match its columns");
        }
        catalog::Row row;
        row.reserve(row_value.size());
        for (const auto& cell : row_value) {
            if (!cell.is_string()) {
                return format_error("table '" + out.name + "' has a non-string cell");
            }
            row.push_back(cell.get<std::string>());
        }
        out.data.push_back(std::move(row));
    }
    return EngineStatus{};
}

}  // namespace

EngineResult<std::string> encode_snapshot(const catalog::Database& database)
{
    using Result = EngineResult<std::string>;

    json tables = json::array();
    for (const auto& table : database.tables()) {
        tables.push_back(encode_table(table));
    }

    json document = json::object();
    document["tables"] = std::move(tables);

    // Cells are stored verbatim, so bytes that are not UTF-8 cannot be written.
    try {
        return Result::ok(document.dump(kIndent));
    } catch (const json::type_error& error) {
        return Result::failure(
            make_status(EngineErrc::SnapshotFormatError, std::string{"Cannot encode snapshot: "} + error.what()));
    }
}

EngineResult<catalog::Database> decode_snapshot(std::string_view document)
{
    using Result = EngineResult<catalog::Database>;

    const json parsed = json::parse(document.begin(), document.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return Result::failure(format_error("document is not valid JSON"));
    }
    if (!parsed.is_object()) {
        return Result::failure(format_error("top level value is not an object"));
    }

    const auto tables = parsed.find("tables");
    if (tables == parsed.end() || !tables->is_array()) {
        return Result::failure(format_error("missing 'tables' array"));
    }

    catalog::Database database{};
    for (const auto& table_value : *tables) {
        catalog::Table table{};
        if (auto status = decode_table(table_value, table); !status.ok()) {
            return Result::failure(std::move(status));
        }
        if (database.has_table_named(table.name)) {
            return Result::failure(format_error("table '" + table.name + "' appears more than once"));
        }
        database.add_table(std::move(table));
    }

    return Result::ok(std::move(database));
}

EngineStatus write_snapshot(const catalog::Database& database, std::ostream& stream)
{
    auto encoded = encode_snapshot(database);
    if (!encoded.success()) {
        return std::move(encoded.status);
    }

    stream << *encoded.value << '\n';
    stream.flush();
    if (!stream) {
        return make_status(EngineErrc::SnapshotIoError, "Failed to write snapshot stream");
    }
    return EngineStatus{};
}

EngineResult<catalog::Database> read_snapshot(std::istream& stream)
{
    std::string document{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    if (stream.bad()) {
        return EngineResult<catalog::Database>::failure(
            make_status(EngineErrc::SnapshotIoError, "Failed to read snapshot stream"));
    }
    return decode_snapshot(document);
}

EngineStatus save_snapshot(const catalog::Database& database, const std::filesystem::path& path)
{
    auto encoded = encode_snapshot(database);
    if (!encoded.success()) {
        return std::move(encoded.status);
    }

    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return io_error(path, "create directory for", ec);
        }
    }

    auto temp_path = path;
    temp_path += ".tmp";
    {
        std::ofstream stream{temp_path, std::ios::binary | std::ios::trunc};
        if (!stream) {
            return io_error(path, "open");
        }
        stream << *encoded.value << '\n';
        stream.flush();
        if (!stream) {
            stream.close();
            std::error_code cleanup;
            std::filesystem::remove(temp_path, cleanup);
            return io_error(path, "write");
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp_path, cleanup);
        return io_error(path, "replace", ec);
    }
    return EngineStatus{};
}

EngineResult<catalog::Database> load_snapshot(const std::filesystem::path& path)
{
    using Result = EngineResult<catalog::Database>;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return Result::failure(io_error(path, "inspect", ec));
        }
        return Result::ok(catalog::Database{});
    }

    std::ifstream stream{path, std::ios::binary};
    if (!stream) {
        return Result::failure(io_error(path, "open"));
    }
    return read_snapshot(stream);
}

}  // namespace tabula::storage
