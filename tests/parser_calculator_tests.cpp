#include "tabula/parser/calculator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using namespace tabula::parser;

namespace {

double evaluate(std::string_view expression)
{
    const auto result = evaluate_arithmetic(expression);
    CAPTURE(expression, result.error);
    REQUIRE(result.success());
    return *result.value;
}

std::string evaluation_error(std::string_view expression)
{
    const auto result = evaluate_arithmetic(expression);
    CAPTURE(expression);
    REQUIRE_FALSE(result.success());
    return result.error;
}

}  // namespace

TEST_CASE("Multiplication binds tighter than addition", "[parser][calculator]")
{
    CHECK(evaluate("1 + 2 * 3") == 7.0);
    CHECK(evaluate("(1 + 2) * 3") == 9.0);
    CHECK(evaluate("10 - 4 - 3") == 3.0);
    CHECK(evaluate("8 / 4 / 2") == 1.0);
    CHECK(evaluate("7 / 2") == 3.5);
}

TEST_CASE("Unary signs and decimals", "[parser][calculator]")
{
    CHECK(evaluate("-3 + 5") == 2.0);
    CHECK(evaluate("2 * -(1 + 1)") == -4.0);
    CHECK(evaluate("+4") == 4.0);
    CHECK(evaluate("1.5 * 2") == 3.0);
}

TEST_CASE("Malformed expressions report what went wrong", "[parser][calculator]")
{
    CHECK(evaluation_error("") == "Empty expression");
    CHECK(evaluation_error("1 / 0") == "Division by zero");
    CHECK(evaluation_error("(1 + 2") == "Unmatched opening parenthesis");
    CHECK(evaluation_error("1 + 2)") == "Unmatched closing parenthesis");
    CHECK(evaluation_error("1 +") == "Missing operand");
    CHECK(evaluation_error("1 2") == "Missing operator");
    CHECK(evaluation_error("2 + x") == "Unknown character: x");
    CHECK(evaluation_error("1.2.3") == "Invalid number: 1.2.3");
}

TEST_CASE("format_number prints the shortest text", "[parser][calculator]")
{
    CHECK(format_number(3.0) == "3");
    CHECK(format_number(2.5) == "2.5");
    CHECK(format_number(0.0) == "0");
    CHECK(format_number(-0.0) == "0");
    CHECK(format_number(-12.0) == "-12");
}
