#include "tabula/parser/calculator.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <vector>

namespace tabula::parser {

namespace {

enum class TokenKind : std::uint8_t {
    Number,
    Operator,
    LeftParen,
    RightParen
};

struct Token final {
    TokenKind kind = TokenKind::Number;
    double number = 0.0;
    char symbol = '\0';
};

[[nodiscard]] bool tokenize(std::string_view expression, std::vector<Token>& tokens, std::string& error)
{
    std::size_t index = 0U;
    while (index < expression.size()) {
        const char ch = expression[index];
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            ++index;
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == '.') {
            std::size_t end = index;
            while (end < expression.size() &&
                   (std::isdigit(static_cast<unsigned char>(expression[end])) != 0 || expression[end] == '.')) {
                ++end;
            }
            Token token{};
            token.kind = TokenKind::Number;
            const auto* first = expression.data() + index;
            const auto* last = expression.data() + end;
            const auto [ptr, ec] = std::from_chars(first, last, token.number);
            if (ec != std::errc{} || ptr != last) {
                error = "Invalid number: " + std::string{expression.substr(index, end - index)};
                return false;
            }
            tokens.push_back(token);
            index = end;
            continue;
        }

        Token token{};
        token.symbol = ch;
        switch (ch) {
        case '+':
        case '-':
        case '*':
        case '/':
            token.kind = TokenKind::Operator;
            break;
        case '(':
            token.kind = TokenKind::LeftParen;
            break;
        case ')':
            token.kind = TokenKind::RightParen;
            break;
        default:
            error = std::string{"Unknown character: "} + ch;
            return false;
        }
        tokens.push_back(token);
        ++index;
    }
    return true;
}

class ArithmeticParser final {
public:
    explicit ArithmeticParser(const std::vector<Token>& tokens) noexcept
        : tokens_{tokens}
    {
    }

    CalculationResult evaluate()
    {
        CalculationResult result{};
        double value = 0.0;
        if (!parse_expression(value)) {
            result.error = std::move(error_);
            return result;
        }
        if (position_ < tokens_.size()) {
            result.error = tokens_[position_].kind == TokenKind::RightParen ? "Unmatched closing parenthesis"
                                                                            : "Missing operator";
            return result;
        }
        result.value = value;
        return result;
    }

private:
    bool parse_expression(double& value)
    {
        if (!parse_term(value)) {
            return false;
        }
        while (peek_operator('+') || peek_operator('-')) {
            const char op = tokens_[position_++].symbol;
            double rhs = 0.0;
            if (!parse_term(rhs)) {
                return false;
            }
            value = op == '+' ? value + rhs : value - rhs;
        }
        return true;
    }

    bool parse_term(double& value)
    {
        if (!parse_unary(value)) {
            return false;
        }
        while (peek_operator('*') || peek_operator('/')) {
            const char op = tokens_[position_++].symbol;
            double rhs = 0.0;
            if (!parse_unary(rhs)) {
                return false;
            }
            if (op == '/') {
                if (rhs == 0.0) {
                    error_ = "Division by zero";
                    return false;
                }
                value /= rhs;
            } else {
                value *= rhs;
            }
        }
        return true;
    }

    bool parse_unary(double& value)
    {
        if (peek_operator('+') || peek_operator('-')) {
            const char op = tokens_[position_++].symbol;
            if (!parse_unary(value)) {
                return false;
            }
            if (op == '-') {
                value = -value;
            }
            return true;
        }
        return parse_primary(value);
    }

    bool parse_primary(double& value)
    {
        if (position_ >= tokens_.size()) {
            error_ = "Missing operand";
            return false;
        }

        const auto& token = tokens_[position_];
        if (token.kind == TokenKind::Number) {
            value = token.number;
            ++position_;
            return true;
        }

        if (token.kind == TokenKind::LeftParen) {
            ++position_;
            if (!parse_expression(value)) {
                return false;
            }
            if (position_ >= tokens_.size() || tokens_[position_].kind != TokenKind::RightParen) {
                error_ = "Unmatched opening parenthesis";
                return false;
            }
            ++position_;
            return true;
        }

        error_ = token.kind == TokenKind::RightParen ? "Missing operand before ')'" : "Missing operand";
        return false;
    }

    [[nodiscard]] bool peek_operator(char symbol) const noexcept
    {
        return position_ < tokens_.size() && tokens_[position_].kind == TokenKind::Operator &&
               tokens_[position_].symbol == symbol;
    }

    const std::vector<Token>& tokens_;
    std::size_t position_ = 0U;
    std::string error_{};
};

}  // namespace

CalculationResult evaluate_arithmetic(std::string_view expression)
{
    CalculationResult result{};
    std::vector<Token> tokens;
    if (!tokenize(expression, tokens, result.error)) {
        return result;
    }
    if (tokens.empty()) {
        result.error = "Empty expression";
        return result;
    }

    ArithmeticParser parser{tokens};
    return parser.evaluate();
}

std::string format_number(double value)
{
    if (value == 0.0) {
        return "0";
    }

    std::array<char, 64> buffer{};
    const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string{buffer.data(), ptr};
}

}  // namespace tabula::parser
