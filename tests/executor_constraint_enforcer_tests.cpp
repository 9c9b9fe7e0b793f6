#include "tabula/executor/constraint_enforcer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using tabula::catalog::Column;
using tabula::catalog::DataType;
using tabula::catalog::Row;
using tabula::catalog::Table;
using tabula::executor::ConstraintEnforcer;
using tabula::executor::EngineErrc;

namespace {

Table make_users_table()
{
    Table table{};
    table.name = "users";
    table.columns = {
        Column{"id", DataType::integer(), true, false},
        Column{"name", DataType::varchar(5U), false, true},
        Column{"age", DataType::integer(), false, false},
    };
    table.data = {
        Row{"1", "Alice", "30"},
        Row{"2", "Bob", ""},
    };
    return table;
}

}  // namespace

TEST_CASE("validate_row accepts a well formed row", "[executor][constraints]")
{
    const auto table = make_users_table();
    const ConstraintEnforcer enforcer{table};

    const auto status = enforcer.validate_row(Row{"3", "Carol", ""});
    CHECK(status.ok());
}

TEST_CASE("validate_row rejects rows of the wrong width", "[executor][constraints]")
{
    const auto table = make_users_table();
    const ConstraintEnforcer enforcer{table};

    const auto status = enforcer.validate_row(Row{"3", "Carol"});
    REQUIRE_FALSE(status.ok());
    CHECK(status.error == EngineErrc::ColumnCountMismatch);
}

TEST_CASE("NOT NULL and primary columns reject NULL cells", "[executor][constraints]")
{
    const auto table = make_users_table();
    const ConstraintEnforcer enforcer{table};

    auto status = enforcer.validate_row(Row{"", "Carol", "1"});
    REQUIRE_FALSE(status.ok());
    CHECK(status.error == EngineErrc::MissingValue);
    CHECK(status.message == "Field 'id' doesn't have a default value");

    status = enforcer.validate_row(Row{"3", "null", "1"});
    REQUIRE_FALSE(status.ok());
    CHECK(status.message == "Field 'name' doesn't have a default value");
}

TEST_CASE("NULL checks run before type checks", "[executor][constraints]")
{
    const auto table = make_users_table();
    const ConstraintEnforcer enforcer{table};

    const auto status = enforcer.validate_row(Row{"3", "", "old"});
    REQUIRE_FALSE(status.ok());
    CHECK(status.error == EngineErrc::MissingValue);
}

TEST_CASE("Int columns require 32-bit integers", "[executor][constraints]")
{
    const auto table = make_users_table();
    const ConstraintEnforcer enforcer{table};

    const auto status = enforcer.validate_row(Row{"3", "Carol", "old"});
    REQUIRE_FALSE(status.ok());
    CHECK(status.error == EngineErrc::TypeMismatch);
    CHECK(status.message == "Value 'old' is not INT for column 'age'");

    CHECK(enforcer.validate_type(2U, "-12").ok());
    CHECK_FALSE(enforcer.validate_type(2U, "99999999999").ok());
}

TEST_CASE("Varchar columns enforce their maximum length", "[executor][constraints]")
{
    const auto table = make_users_table();
    const ConstraintEnforcer enforcer{table};

    CHECK(enforcer.validate_type(1U, "Alice").ok());

    const auto status = enforcer.validate_row(Row{"3", "Charlotte", ""});
    REQUIRE_FALSE(status.ok());
    CHECK(status.error == EngineErrc::ValueTooLong);
    CHECK(status.message == "Value too long for column 'name' (max 5)");
}

TEST_CASE("Primary key must be unique", "[executor][constraints]")
{
    const auto table = make_users_table();
    const ConstraintEnforcer enforcer{table};

    const auto status = enforcer.validate_row(Row{"1", "Dup", ""});
    REQUIRE_FALSE(status.ok());
    CHECK(status.error == EngineErrc::DuplicateKey);
    CHECK(status.message == "Duplicate entry '1' for key 'PRIMARY'");

    CHECK(enforcer.check_primary_key("1", 0U).ok());
    CHECK_FALSE(enforcer.check_primary_key("1", 1U).ok());
}

TEST_CASE("Enforcer does not mutate the table", "[executor][constraints]")
{
    const auto table = make_users_table();
    const auto before = table;
    const ConstraintEnforcer enforcer{table};

    (void)enforcer.validate_row(Row{"1", "Dup", ""});
    (void)enforcer.validate_row(Row{"9", "Zed", "5"});
    CHECK(table == before);
}

TEST_CASE("assemble_row maps values positionally or by name", "[executor][constraints]")
{
    const auto table = make_users_table();

    SECTION("positional values are normalized")
    {
        const std::vector<std::string> values{"3", "'Carol'", "NULL"};
        const auto row = tabula::executor::assemble_row(table, {}, values);
        REQUIRE(row.success());
        CHECK(*row.value == Row{"3", "Carol", ""});
    }

    SECTION("named columns leave the rest NULL")
    {
        const std::vector<std::string> columns{"name", "id"};
        const std::vector<std::string> values{"'Dan'", "4"};
        const auto row = tabula::executor::assemble_row(table, columns, values);
        REQUIRE(row.success());
        CHECK(*row.value == Row{"4", "Dan", ""});
    }

    SECTION("unknown column")
    {
        const std::vector<std::string> columns{"email"};
        const std::vector<std::string> values{"'x'"};
        const auto row = tabula::executor::assemble_row(table, columns, values);
        REQUIRE_FALSE(row.success());
        CHECK(row.status.error == EngineErrc::ColumnNotFound);
        CHECK(row.status.message == "Column 'email' not found");
    }

    SECTION("a column listed twice")
    {
        const std::vector<std::string> columns{"id", "id"};
        const std::vector<std::string> values{"1", "2"};
        const auto row = tabula::executor::assemble_row(table, columns, values);
        REQUIRE_FALSE(row.success());
        CHECK(row.status.error == EngineErrc::ColumnCountMismatch);
        CHECK(row.status.message == "Column 'id' specified more than once");
    }

    SECTION("value count mismatch")
    {
        const std::vector<std::string> values{"3", "'Carol'"};
        const auto row = tabula::executor::assemble_row(table, {}, values);
        REQUIRE_FALSE(row.success());
        CHECK(row.status.error == EngineErrc::ColumnCountMismatch);
    }
}
