#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tabula::parser {

struct CalculationResult final {
    std::optional<double> value{};
    std::string error{};

    [[nodiscard]] bool success() const noexcept { return value.has_value(); }
};

// Evaluates + - * / over decimal numbers with parentheses and unary signs.
// '*' and '/' bind tighter than '+' and '-'; all operators are left associative.
[[nodiscard]] CalculationResult evaluate_arithmetic(std::string_view expression);

// Shortest decimal text that round-trips the value; integral values print
// without a fraction.
[[nodiscard]] std::string format_number(double value);

}  // namespace tabula::parser
