#include "tabula/executor/predicate.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>

using Catch::Matchers::ContainsSubstring;
using tabula::catalog::Column;
using tabula::catalog::DataType;
using tabula::catalog::Row;
using tabula::catalog::Table;
using tabula::executor::compile_predicate;
using tabula::executor::ComparisonOperator;
using tabula::executor::ConditionTokenKind;
using tabula::executor::EngineErrc;
using tabula::executor::PredicateNodeType;

namespace {

Table make_people_table()
{
    Table table{};
    table.name = "people";
    table.columns = {
        Column{"id", DataType::integer(), true, false},
        Column{"name", DataType::varchar(), false, false},
        Column{"age", DataType::integer(), false, false},
    };
    return table;
}

bool matches(const Table& table, std::string_view condition, const Row& row)
{
    const auto predicate = compile_predicate(condition, table);
    CAPTURE(condition, predicate.status.message);
    REQUIRE(predicate.success());
    return predicate.value->matches(row);
}

}  // namespace

TEST_CASE("tokenize_condition keeps quoted whitespace and operator runs", "[executor][predicate]")
{
    const auto tokens = tabula::executor::tokenize_condition("name = 'Mary Ann' AND age>=3");
    REQUIRE(tokens.success());

    const auto& list = *tokens.value;
    REQUIRE(list.size() == 7U);
    CHECK(list[0].kind == ConditionTokenKind::Word);
    CHECK(list[2].kind == ConditionTokenKind::Quoted);
    CHECK(list[2].text == "'Mary Ann'");
    CHECK(list[5].kind == ConditionTokenKind::Operator);
    CHECK(list[5].text == ">=");
    CHECK(list[6].text == "3");
}

TEST_CASE("tokenize_condition rejects unterminated literals", "[executor][predicate]")
{
    const auto tokens = tabula::executor::tokenize_condition("name = 'open");
    REQUIRE_FALSE(tokens.success());
    CHECK(tokens.status.error == EngineErrc::ConditionParseError);
}

TEST_CASE("Equality compares exact text after unquoting", "[executor][predicate]")
{
    const auto table = make_people_table();
    const Row alice{"1", "Alice", "30"};

    CHECK(matches(table, "name = 'Alice'", alice));
    CHECK(matches(table, "name = Alice", alice));
    CHECK_FALSE(matches(table, "name = 'alice'", alice));
    CHECK(matches(table, "age = 30", alice));
    CHECK_FALSE(matches(table, "age = 030", alice));
}

TEST_CASE("Ordering comparisons are numeric with unparsable cells as zero", "[executor][predicate]")
{
    const auto table = make_people_table();

    CHECK(matches(table, "age > 26", Row{"1", "Alice", "30"}));
    CHECK_FALSE(matches(table, "age > 26", Row{"2", "Bob", "25"}));
    CHECK(matches(table, "age < 1", Row{"3", "Nobody", ""}));
    CHECK(matches(table, "age > -1", Row{"3", "Nobody", ""}));
    CHECK(matches(table, "age < 10", Row{"4", "Nine", "9"}));
}

TEST_CASE("IS NULL and IS NOT NULL", "[executor][predicate]")
{
    const auto table = make_people_table();

    CHECK(matches(table, "age IS NULL", Row{"1", "Alice", ""}));
    CHECK(matches(table, "age is null", Row{"1", "Alice", "NULL"}));
    CHECK_FALSE(matches(table, "age IS NULL", Row{"1", "Alice", "3"}));
    CHECK(matches(table, "age IS NOT NULL", Row{"1", "Alice", "3"}));
}

TEST_CASE("AND binds tighter than OR and parentheses override", "[executor][predicate]")
{
    const auto table = make_people_table();
    const Row bob{"2", "Bob", "25"};

    CHECK(matches(table, "name = 'Bob' OR name = 'Alice' AND age > 100", bob));
    CHECK_FALSE(matches(table, "(name = 'Bob' OR name = 'Alice') AND age > 100", bob));

    const auto predicate = compile_predicate("name = 'Bob' OR name = 'Alice' AND age > 100", table);
    REQUIRE(predicate.success());
    REQUIRE(predicate.value->root() != nullptr);
    CHECK(predicate.value->root()->type() == PredicateNodeType::Or);
    REQUIRE(predicate.value->root()->right() != nullptr);
    CHECK(predicate.value->root()->right()->type() == PredicateNodeType::And);
}

TEST_CASE("Column names resolve to positions at compile time", "[executor][predicate]")
{
    const auto table = make_people_table();
    const auto predicate = compile_predicate("age > 3", table);
    REQUIRE(predicate.success());

    const auto& leaf = predicate.value->root()->comparison();
    CHECK(leaf.column_index == 2U);
    CHECK(leaf.op == ComparisonOperator::GreaterThan);
    CHECK(leaf.literal == "3");
}

TEST_CASE("Rows too short for a column never match", "[executor][predicate]")
{
    const auto table = make_people_table();
    CHECK_FALSE(matches(table, "age IS NULL", Row{"1"}));
}

TEST_CASE("Malformed conditions report ConditionParseError", "[executor][predicate]")
{
    const auto table = make_people_table();

    SECTION("unknown column")
    {
        const auto predicate = compile_predicate("email = 'x'", table);
        REQUIRE_FALSE(predicate.success());
        CHECK(predicate.status.error == EngineErrc::ConditionParseError);
        CHECK(predicate.status.message == "Unknown column 'email' in condition");
    }

    SECTION("unsupported operator")
    {
        const auto predicate = compile_predicate("age >= 3", table);
        REQUIRE_FALSE(predicate.success());
        CHECK(predicate.status.error == EngineErrc::ConditionParseError);
        CHECK_THAT(predicate.status.message, ContainsSubstring(">="));
    }

    SECTION("unbalanced parentheses")
    {
        const auto predicate = compile_predicate("(age > 3", table);
        REQUIRE_FALSE(predicate.success());
        CHECK(predicate.status.error == EngineErrc::ConditionParseError);
    }

    SECTION("dangling AND")
    {
        const auto predicate = compile_predicate("age > 3 AND", table);
        REQUIRE_FALSE(predicate.success());
        CHECK(predicate.status.error == EngineErrc::ConditionParseError);
    }

    SECTION("trailing tokens")
    {
        const auto predicate = compile_predicate("age > 3 name", table);
        REQUIRE_FALSE(predicate.success());
        CHECK_THAT(predicate.status.message, ContainsSubstring("Unexpected token 'name'"));
    }

    SECTION("empty condition")
    {
        const auto predicate = compile_predicate("   ", table);
        REQUIRE_FALSE(predicate.success());
        CHECK(predicate.status.message == "Empty condition");
    }
}

TEST_CASE("A default predicate matches every row", "[executor][predicate]")
{
    const auto predicate = tabula::executor::Predicate::match_all();
    CHECK(predicate.matches_all());
    CHECK(predicate.matches(Row{}));
}

TEST_CASE("Keywords inside identifiers and quoted literals are not operators", "[executor][predicate]")
{
    Table table{};
    table.name = "products";
    table.columns = {
        Column{"BRAND", DataType::varchar(), false, false},
        Column{"origin", DataType::varchar(), false, false},
        Column{"order_id", DataType::integer(), false, false},
    };
    const Row row{"x AND y", "or", "12"};

    CHECK(matches(table, "BRAND = 'x AND y'", row));
    CHECK(matches(table, "BRAND = \"x AND y\"", row));
    CHECK_FALSE(matches(table, "BRAND = 'x OR y'", row));
    CHECK(matches(table, "(BRAND = \"x AND y\" OR order_id > 99) AND origin = 'or'", row));
    CHECK(matches(table, "origin = 'or' AND order_id > 9", row));
    CHECK_FALSE(matches(table, "origin = \"and\" OR order_id < 5", row));

    const auto predicate = compile_predicate("BRAND = 'a OR b'", table);
    REQUIRE(predicate.success());
    CHECK(predicate.value->root()->type() == PredicateNodeType::Comparison);
    CHECK(predicate.value->root()->comparison().literal == "a OR b");
}
