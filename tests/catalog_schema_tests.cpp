#include "tabula/catalog/catalog_schema.hpp"

#include <catch2/catch_test_macros.hpp>

using tabula::catalog::Column;
using tabula::catalog::Database;
using tabula::catalog::DataType;
using tabula::catalog::DataTypeKind;
using tabula::catalog::Table;

namespace {

Table make_users_table()
{
    Table table{};
    table.name = "users";
    table.columns = {
        Column{"id", DataType::integer(), true, false},
        Column{"name", DataType::varchar(5U), false, true},
        Column{"age", DataType::integer(3U), false, false},
    };
    return table;
}

}  // namespace

TEST_CASE("DataType factories apply default sizes", "[catalog]")
{
    const auto integer = DataType::integer();
    CHECK(integer.kind == DataTypeKind::Int);
    CHECK(integer.size == 10U);
    CHECK(integer.is_integer());

    const auto varchar = DataType::varchar();
    CHECK(varchar.kind == DataTypeKind::Varchar);
    CHECK(varchar.size == 255U);
    CHECK(varchar.is_varchar());

    CHECK(to_string(DataType::integer(4U)) == "INT(4)");
    CHECK(to_string(DataType::varchar(20U)) == "VARCHAR(20)");
}

TEST_CASE("Primary columns reject NULL without an explicit NOT NULL", "[catalog]")
{
    const Column primary{"id", DataType::integer(), true, false};
    const Column required{"name", DataType::varchar(), false, true};
    const Column optional{"age", DataType::integer(), false, false};

    CHECK(primary.rejects_null());
    CHECK(required.rejects_null());
    CHECK_FALSE(optional.rejects_null());
}

TEST_CASE("Table resolves columns by exact name", "[catalog]")
{
    const auto table = make_users_table();

    REQUIRE(table.column_index("name").has_value());
    CHECK(*table.column_index("name") == 1U);
    CHECK_FALSE(table.column_index("NAME").has_value());
    CHECK_FALSE(table.column_index("email").has_value());

    REQUIRE(table.primary_key_index().has_value());
    CHECK(*table.primary_key_index() == 0U);

    CHECK(table.all_column_indices() == std::vector<std::size_t>{0U, 1U, 2U});
    CHECK(table.column_names() == std::vector<std::string>{"id", "name", "age"});
}

TEST_CASE("Table without a primary column reports none", "[catalog]")
{
    Table table{};
    table.name = "notes";
    table.columns = {Column{"body", DataType::varchar(), false, false}};

    CHECK_FALSE(table.primary_key_index().has_value());
}

TEST_CASE("Database keeps tables in creation order", "[catalog]")
{
    Database database;
    CHECK(database.empty());

    database.add_table(make_users_table());
    Table orders{};
    orders.name = "orders";
    orders.columns = {Column{"id", DataType::integer(), true, false}};
    database.add_table(std::move(orders));

    REQUIRE(database.table_count() == 2U);
    CHECK(database.tables()[0].name == "users");
    CHECK(database.tables()[1].name == "orders");

    REQUIRE(database.find_table("orders") != nullptr);
    CHECK(database.find_table("ORDERS") == nullptr);
    CHECK(database.has_table_named("ORDERS"));

    CHECK(database.remove_table("users"));
    CHECK_FALSE(database.remove_table("users"));
    REQUIRE(database.table_count() == 1U);
    CHECK(database.tables().front().name == "orders");
}

TEST_CASE("iequals compares ASCII case-insensitively", "[catalog]")
{
    CHECK(tabula::catalog::iequals("Select", "SELECT"));
    CHECK_FALSE(tabula::catalog::iequals("select", "selects"));
    CHECK(tabula::catalog::iequals("", ""));
}
