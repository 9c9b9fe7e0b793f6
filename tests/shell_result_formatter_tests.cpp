#include "tabula/shell/result_formatter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using tabula::shell::format_table;
using tabula::shell::join_lines;

TEST_CASE("format_table pads columns to the widest cell", "[shell][format]")
{
    const std::vector<std::string> headers{"id", "name"};
    const std::vector<std::vector<std::string>> rows{{"1", "Alice"}, {"22", "Bo"}};

    const auto lines = format_table(headers, rows);
    REQUIRE(lines.size() == 4U);
    CHECK(lines[0] == "| id  | name  |");
    CHECK(lines[1] == "| --- | ----- |");
    CHECK(lines[2] == "| 1   | Alice |");
    CHECK(lines[3] == "| 22  | Bo    |");
}

TEST_CASE("format_table trims cells and renders NULL as blank", "[shell][format]")
{
    const std::vector<std::string> headers{"description"};
    const std::vector<std::vector<std::string>> rows{{"  padded  "}, {""}};

    const auto lines = format_table(headers, rows);
    REQUIRE(lines.size() == 4U);
    CHECK(lines[0] == "| description |");
    CHECK(lines[1] == "| ----------- |");
    CHECK(lines[2] == "| padded      |");
    CHECK(lines[3] == "|             |");
}

TEST_CASE("format_table with headers only", "[shell][format]")
{
    const std::vector<std::string> headers{"a"};
    const auto lines = format_table(headers, {});
    REQUIRE(lines.size() == 2U);
    CHECK(lines[0] == "| a   |");
    CHECK(lines[1] == "| --- |");
}

TEST_CASE("join_lines separates with newlines", "[shell][format]")
{
    CHECK(join_lines({}).empty());
    CHECK(join_lines({"a"}) == "a");
    CHECK(join_lines({"a", "b"}) == "a\nb");
}
