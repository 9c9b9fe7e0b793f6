#include "tabula/executor/predicate.hpp"

#include "tabula/executor/cell_format.hpp"

#include <cctype>
#include <sstream>
#include <utility>

namespace tabula::executor {

namespace {

[[nodiscard]] bool is_operator_char(char ch) noexcept
{
    return ch == '<' || ch == '>' || ch == '=' || ch == '!';
}

[[nodiscard]] bool is_word_boundary(char ch) noexcept
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == '(' || ch == ')' || ch == '\'' || ch == '"' ||
           is_operator_char(ch);
}

[[nodiscard]] EngineStatus condition_error(std::string message)
{
    return make_status(EngineErrc::ConditionParseError, std::move(message));
}

class ConditionParser final {
public:
    ConditionParser(const std::vector<ConditionToken>& tokens, const catalog::Table& table) noexcept
        : tokens_{tokens}
        , table_{table}
    {
    }

    EngineResult<Predicate> parse()
    {
        auto root = parse_or();
        if (!root) {
            return EngineResult<Predicate>::failure(std::move(error_));
        }
        if (!at_end()) {
            return EngineResult<Predicate>::failure(unexpected(peek()));
        }
        return EngineResult<Predicate>::ok(Predicate{std::move(root)});
    }

private:
    PredicateNodePtr parse_or()
    {
        auto left = parse_and();
        while (left && is_keyword("OR")) {
            ++position_;
            auto right = parse_and();
            if (!right) {
                return nullptr;
            }
            left = PredicateNode::make_or(std::move(left), std::move(right));
        }
        return left;
    }

    PredicateNodePtr parse_and()
    {
        auto left = parse_term();
        while (left && is_keyword("AND")) {
            ++position_;
            auto right = parse_term();
            if (!right) {
                return nullptr;
            }
            left = PredicateNode::make_and(std::move(left), std::move(right));
        }
        return left;
    }

    PredicateNodePtr parse_term()
    {
        if (at_end()) {
            return fail("Incomplete condition: expected a comparison");
        }

        if (peek().kind == ConditionTokenKind::LeftParen) {
            ++position_;
            auto inner = parse_or();
            if (!inner) {
                return nullptr;
            }
            if (at_end() || peek().kind != ConditionTokenKind::RightParen) {
                return fail("Unbalanced parentheses in condition");
            }
            ++position_;
            return inner;
        }

        return parse_comparison();
    }

    PredicateNodePtr parse_comparison()
    {
        const auto& column_token = peek();
        if (column_token.kind != ConditionTokenKind::Word || is_reserved(column_token.text)) {
            error_ = unexpected(column_token);
            return nullptr;
        }
        ++position_;

        const auto column_index = table_.column_index(column_token.text);
        if (!column_index) {
            std::ostringstream stream;
            stream << "Unknown column '" << column_token.text << "' in condition";
            return fail(stream.str());
        }

        Comparison comparison{};
        comparison.column_index = *column_index;

        if (at_end()) {
            return fail("Malformed comparison: expected operator after '" + column_token.text + "'");
        }

        if (is_keyword("IS")) {
            ++position_;
            comparison.op = ComparisonOperator::IsNull;
            if (is_keyword("NOT")) {
                ++position_;
                comparison.op = ComparisonOperator::IsNotNull;
            }
            if (!is_keyword("NULL")) {
                return fail("Malformed comparison: expected NULL after IS");
            }
            ++position_;
            return PredicateNode::make_comparison(std::move(comparison));
        }

        const auto& op_token = peek();
        if (op_token.kind != ConditionTokenKind::Operator) {
            return fail("Malformed comparison: expected operator after '" + column_token.text + "'");
        }
        if (op_token.text == "=") {
            comparison.op = ComparisonOperator::Equal;
        } else if (op_token.text == ">") {
            comparison.op = ComparisonOperator::GreaterThan;
        } else if (op_token.text == "<") {
            comparison.op = ComparisonOperator::LessThan;
        } else {
            return fail("Unknown operator '" + op_token.text + "'");
        }
        ++position_;

        if (at_end()) {
            return fail("Malformed comparison: missing value for '" + column_token.text + "'");
        }
        const auto& value_token = peek();
        if (value_token.kind == ConditionTokenKind::Quoted) {
            comparison.literal = unquote(value_token.text);
        } else if (value_token.kind == ConditionTokenKind::Word && !is_reserved(value_token.text)) {
            comparison.literal = value_token.text;
        } else {
            error_ = unexpected(value_token);
            return nullptr;
        }
        ++position_;

        return PredicateNode::make_comparison(std::move(comparison));
    }

    [[nodiscard]] bool at_end() const noexcept { return position_ >= tokens_.size(); }
    [[nodiscard]] const ConditionToken& peek() const { return tokens_.at(position_); }

    [[nodiscard]] bool is_keyword(std::string_view keyword) const
    {
        return !at_end() && peek().kind == ConditionTokenKind::Word && catalog::iequals(peek().text, keyword);
    }

    [[nodiscard]] static bool is_reserved(std::string_view word) noexcept
    {
        return catalog::iequals(word, "AND") || catalog::iequals(word, "OR") || catalog::iequals(word, "IS") ||
               catalog::iequals(word, "NOT");
    }

    [[nodiscard]] static EngineStatus unexpected(const ConditionToken& token)
    {
        std::ostringstream stream;
        stream << "Unexpected token '" << token.text << "' at offset " << token.offset << " in condition";
        return condition_error(stream.str());
    }

    PredicateNodePtr fail(std::string message)
    {
        error_ = condition_error(std::move(message));
        return nullptr;
    }

    const std::vector<ConditionToken>& tokens_;
    const catalog::Table& table_;
    std::size_t position_ = 0U;
    EngineStatus error_{};
};

}  // namespace

PredicateNode::PredicateNode(Comparison comparison)
    : type_{PredicateNodeType::Comparison}
    , comparison_{std::move(comparison)}
{
}

PredicateNode::PredicateNode(PredicateNodeType type, PredicateNodePtr left, PredicateNodePtr right)
    : type_{type}
    , left_{std::move(left)}
    , right_{std::move(right)}
{
}

bool PredicateNode::evaluate(const catalog::Row& row) const
{
    switch (type_) {
    case PredicateNodeType::And:
        return left_ && right_ && left_->evaluate(row) && right_->evaluate(row);
    case PredicateNodeType::Or:
        return (left_ && left_->evaluate(row)) || (right_ && right_->evaluate(row));
    case PredicateNodeType::Comparison:
    default:
        break;
    }

    if (comparison_.column_index >= row.size()) {
        return false;
    }

    const auto& cell = row[comparison_.column_index];
    switch (comparison_.op) {
    case ComparisonOperator::Equal:
        return cell == comparison_.literal;
    case ComparisonOperator::GreaterThan:
        return int32_or_zero(cell) > int32_or_zero(comparison_.literal);
    case ComparisonOperator::LessThan:
        return int32_or_zero(cell) < int32_or_zero(comparison_.literal);
    case ComparisonOperator::IsNull:
        return is_null_cell(cell);
    case ComparisonOperator::IsNotNull:
        return !is_null_cell(cell);
    default:
        return false;
    }
}

PredicateNodePtr PredicateNode::make_comparison(Comparison comparison)
{
    return std::make_shared<const PredicateNode>(std::move(comparison));
}

PredicateNodePtr PredicateNode::make_and(PredicateNodePtr left, PredicateNodePtr right)
{
    return std::make_shared<const PredicateNode>(PredicateNodeType::And, std::move(left), std::move(right));
}

PredicateNodePtr PredicateNode::make_or(PredicateNodePtr left, PredicateNodePtr right)
{
    return std::make_shared<const PredicateNode>(PredicateNodeType::Or, std::move(left), std::move(right));
}

Predicate::Predicate(PredicateNodePtr root)
    : root_{std::move(root)}
{
}

bool Predicate::matches(const catalog::Row& row) const
{
    return root_ == nullptr || root_->evaluate(row);
}

Predicate Predicate::match_all()
{
    return Predicate{};
}

EngineResult<std::vector<ConditionToken>> tokenize_condition(std::string_view condition)
{
    using Result = EngineResult<std::vector<ConditionToken>>;

    std::vector<ConditionToken> tokens;
    std::size_t index = 0U;
    while (index < condition.size()) {
        const char ch = condition[index];
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            ++index;
            continue;
        }

        ConditionToken token{};
        token.offset = index;

        if (ch == '(' || ch == ')') {
            token.kind = ch == '(' ? ConditionTokenKind::LeftParen : ConditionTokenKind::RightParen;
            token.text.assign(1U, ch);
            ++index;
        } else if (ch == '\'' || ch == '"') {
            std::size_t cursor = index + 1U;
            bool closed = false;
            while (cursor < condition.size()) {
                if (condition[cursor] == ch) {
                    if (cursor + 1U < condition.size() && condition[cursor + 1U] == ch) {
                        cursor += 2U;
                        continue;
                    }
                    closed = true;
                    break;
                }
                ++cursor;
            }
            if (!closed) {
                std::ostringstream stream;
                stream << "Unterminated quoted literal at offset " << index << " in condition";
                return Result::failure(condition_error(stream.str()));
            }
            token.kind = ConditionTokenKind::Quoted;
            token.text = std::string{condition.substr(index, cursor + 1U - index)};
            index = cursor + 1U;
        } else if (is_operator_char(ch)) {
            std::size_t cursor = index;
            while (cursor < condition.size() && is_operator_char(condition[cursor])) {
                ++cursor;
            }
            token.kind = ConditionTokenKind::Operator;
            token.text = std::string{condition.substr(index, cursor - index)};
            index = cursor;
        } else {
            std::size_t cursor = index;
            while (cursor < condition.size() && !is_word_boundary(condition[cursor])) {
                ++cursor;
            }
            token.kind = ConditionTokenKind::Word;
            token.text = std::string{condition.substr(index, cursor - index)};
            index = cursor;
        }

        tokens.push_back(std::move(token));
    }

    return Result::ok(std::move(tokens));
}

EngineResult<Predicate> compile_predicate(std::string_view condition, const catalog::Table& table)
{
    auto tokens = tokenize_condition(condition);
    if (!tokens.success()) {
        return EngineResult<Predicate>::failure(std::move(tokens.status));
    }
    if (tokens.value->empty()) {
        return EngineResult<Predicate>::failure(condition_error("Empty condition"));
    }

    ConditionParser parser{*tokens.value, table};
    return parser.parse();
}

}  // namespace tabula::executor
