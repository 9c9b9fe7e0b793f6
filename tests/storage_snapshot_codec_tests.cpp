#include "tabula/storage/snapshot_codec.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

using Catch::Matchers::ContainsSubstring;
using tabula::catalog::Column;
using tabula::catalog::Database;
using tabula::catalog::DataType;
using tabula::catalog::Row;
using tabula::catalog::Table;
using tabula::executor::EngineErrc;

namespace {

std::filesystem::path make_unique_snapshot_path()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("tabula_snapshot_" + std::to_string(stamp));
}

struct TempSnapshotDirectory final {
    TempSnapshotDirectory()
        : path{make_unique_snapshot_path()}
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    ~TempSnapshotDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

Database make_sample_database()
{
    Database database{};

    Table users{};
    users.name = "users";
    users.columns = {
        Column{"id", DataType::integer(), true, true},
        Column{"name", DataType::varchar(32U), false, false},
    };
    users.data = {Row{"1", "Alice"}, Row{"2", ""}};
    database.add_table(std::move(users));

    Table tags{};
    tags.name = "tags";
    tags.columns = {Column{"label", DataType::varchar(), false, true}};
    database.add_table(std::move(tags));

    return database;
}

void expect_format_error(const std::string& document)
{
    const auto decoded = tabula::storage::decode_snapshot(document);
    CAPTURE(document);
    REQUIRE_FALSE(decoded.success());
    CHECK(decoded.status.error == EngineErrc::SnapshotFormatError);
    CHECK_THAT(decoded.status.message, ContainsSubstring("Malformed snapshot"));
}

}  // namespace

TEST_CASE("Snapshot survives a save and load cycle", "[storage][snapshot]")
{
    TempSnapshotDirectory temp_dir;
    const auto path = temp_dir.path / "nested" / "db.json";
    const auto database = make_sample_database();

    const auto saved = tabula::storage::save_snapshot(database, path);
    CAPTURE(saved.message);
    REQUIRE(saved.ok());
    CHECK(std::filesystem::exists(path));

    const auto loaded = tabula::storage::load_snapshot(path);
    REQUIRE(loaded.success());
    CHECK(*loaded.value == database);
    REQUIRE(loaded.value->table_count() == 2U);
    CHECK(loaded.value->tables()[0].name == "users");
    CHECK(loaded.value->tables()[1].name == "tags");
}

TEST_CASE("Missing snapshot file yields an empty database", "[storage][snapshot]")
{
    TempSnapshotDirectory temp_dir;
    const auto loaded = tabula::storage::load_snapshot(temp_dir.path / "absent.json");
    REQUIRE(loaded.success());
    CHECK(loaded.value->empty());
}

TEST_CASE("Encoded snapshot uses the tagged data_type layout", "[storage][snapshot]")
{
    const auto document = tabula::storage::encode_snapshot(make_sample_database());
    REQUIRE(document.success());
    const auto parsed = nlohmann::json::parse(*document.value);

    REQUIRE(parsed.contains("tables"));
    const auto& users = parsed["tables"][0];
    CHECK(users["name"] == "users");
    CHECK(users["columns"][0]["data_type"] == nlohmann::json{{"Int", 10}});
    CHECK(users["columns"][1]["data_type"] == nlohmann::json{{"Varchar", 32}});
    CHECK(users["columns"][0]["is_primary"] == true);
    CHECK(users["data"][1][1] == "");
}

TEST_CASE("Snapshot streams round trip through write and read", "[storage][snapshot]")
{
    const auto database = make_sample_database();
    std::stringstream stream;
    REQUIRE(tabula::storage::write_snapshot(database, stream).ok());

    const auto loaded = tabula::storage::read_snapshot(stream);
    REQUIRE(loaded.success());
    CHECK(*loaded.value == database);
}

TEST_CASE("Malformed snapshots are rejected", "[storage][snapshot]")
{
    SECTION("not JSON")
    {
        expect_format_error("{\"tables\": [");
    }

    SECTION("missing tables key")
    {
        expect_format_error(R"({"schemas": []})");
    }

    SECTION("unknown data type tag")
    {
        expect_format_error(
            R"({"tables":[{"name":"t","columns":[{"name":"a","data_type":{"Text":1},"is_primary":false,"not_null":false}],"data":[]}]})");
    }

    SECTION("more than one primary column")
    {
        expect_format_error(
            R"({"tables":[{"name":"t","columns":[)"
            R"({"name":"a","data_type":{"Int":10},"is_primary":true,"not_null":true},)"
            R"({"name":"b","data_type":{"Int":10},"is_primary":true,"not_null":true}],"data":[]}]})");
    }

    SECTION("row width mismatch")
    {
        expect_format_error(
            R"({"tables":[{"name":"t","columns":[{"name":"a","data_type":{"Int":10},"is_primary":false,"not_null":false}],"data":[["1","2"]]}]})");
    }

    SECTION("non-string cell")
    {
        expect_format_error(
            R"({"tables":[{"name":"t","columns":[{"name":"a","data_type":{"Int":10},"is_primary":false,"not_null":false}],"data":[[1]]}]})");
    }

    SECTION("duplicate table names")
    {
        expect_format_error(R"({"tables":[{"name":"t","columns":[],"data":[]},{"name":"T","columns":[],"data":[]}]})");
    }
}

TEST_CASE("Cells that are not UTF-8 fail to save without leaving files behind", "[storage][snapshot]")
{
    TempSnapshotDirectory temp_dir;
    const auto path = temp_dir.path / "db.json";

    auto database = make_sample_database();
    database.find_table("users")->data.push_back(Row{"3", "caf\xe9"});

    const auto encoded = tabula::storage::encode_snapshot(database);
    REQUIRE_FALSE(encoded.success());
    CHECK(encoded.status.error == EngineErrc::SnapshotFormatError);

    std::stringstream stream;
    CHECK(tabula::storage::write_snapshot(database, stream).error == EngineErrc::SnapshotFormatError);
    CHECK(stream.str().empty());

    const auto saved = tabula::storage::save_snapshot(database, path);
    REQUIRE_FALSE(saved.ok());
    CHECK(saved.error == EngineErrc::SnapshotFormatError);
    CHECK_FALSE(std::filesystem::exists(path));

    auto temp_path = path;
    temp_path += ".tmp";
    CHECK_FALSE(std::filesystem::exists(temp_path));
}
