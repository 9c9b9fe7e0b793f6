#include "tabula/executor/cell_format.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace tabula::executor;

TEST_CASE("NULL cells are blank or spell null", "[executor][cells]")
{
    CHECK(is_null_cell(""));
    CHECK(is_null_cell("   "));
    CHECK(is_null_cell("NULL"));
    CHECK(is_null_cell(" null "));
    CHECK(is_null_cell("Null"));
    CHECK_FALSE(is_null_cell("nullable"));
    CHECK_FALSE(is_null_cell("0"));
}

TEST_CASE("parse_int32 accepts only whole 32-bit integers", "[executor][cells]")
{
    CHECK(parse_int32("42") == 42);
    CHECK(parse_int32("-7") == -7);
    CHECK(parse_int32("+7") == 7);
    CHECK(parse_int32("2147483647") == std::numeric_limits<std::int32_t>::max());
    CHECK(parse_int32("-2147483648") == std::numeric_limits<std::int32_t>::min());

    CHECK_FALSE(parse_int32("2147483648").has_value());
    CHECK_FALSE(parse_int32("12a").has_value());
    CHECK_FALSE(parse_int32("1.5").has_value());
    CHECK_FALSE(parse_int32("").has_value());
    CHECK_FALSE(parse_int32("+").has_value());
    CHECK_FALSE(parse_int32("+-1").has_value());
}

TEST_CASE("int32_or_zero orders unparsable text as zero", "[executor][cells]")
{
    CHECK(int32_or_zero(" 15 ") == 15);
    CHECK(int32_or_zero("abc") == 0);
    CHECK(int32_or_zero("") == 0);
    CHECK(int32_or_zero("-3") == -3);
}

TEST_CASE("normalize_cell strips quotes and maps NULL to the empty sentinel", "[executor][cells]")
{
    CHECK(normalize_cell("'Alice'") == "Alice");
    CHECK(normalize_cell("\"Bob\"") == "Bob");
    CHECK(normalize_cell("  42 ") == "42");
    CHECK(normalize_cell("NULL") == "");
    CHECK(normalize_cell("'NULL'") == "NULL");
    CHECK(normalize_cell("'O''Brien'") == "O'Brien");
    CHECK(normalize_cell("''") == "");
}

TEST_CASE("is_quoted requires matching delimiters", "[executor][cells]")
{
    CHECK(is_quoted("'a'"));
    CHECK(is_quoted("\"a\""));
    CHECK_FALSE(is_quoted("'a\""));
    CHECK_FALSE(is_quoted("'"));
    CHECK(unquote("plain") == "plain");
}
