#pragma once

#include "tabula/catalog/catalog_schema.hpp"
#include "tabula/executor/engine_errors.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::executor {

enum class ComparisonOperator : std::uint8_t {
    Equal,
    GreaterThan,
    LessThan,
    IsNull,
    IsNotNull
};

enum class PredicateNodeType : std::uint8_t {
    Comparison,
    And,
    Or
};

struct Comparison final {
    std::size_t column_index = 0U;
    ComparisonOperator op = ComparisonOperator::Equal;
    std::string literal{};
};

class PredicateNode;
using PredicateNodePtr = std::shared_ptr<const PredicateNode>;

// Node of a compiled condition tree. Leaves hold a resolved column index and
// an unquoted literal; inner nodes combine two children.
class PredicateNode final {
public:
    explicit PredicateNode(Comparison comparison);
    PredicateNode(PredicateNodeType type, PredicateNodePtr left, PredicateNodePtr right);

    [[nodiscard]] PredicateNodeType type() const noexcept { return type_; }
    [[nodiscard]] const Comparison& comparison() const noexcept { return comparison_; }
    [[nodiscard]] const PredicateNodePtr& left() const noexcept { return left_; }
    [[nodiscard]] const PredicateNodePtr& right() const noexcept { return right_; }

    [[nodiscard]] bool evaluate(const catalog::Row& row) const;

    static PredicateNodePtr make_comparison(Comparison comparison);
    static PredicateNodePtr make_and(PredicateNodePtr left, PredicateNodePtr right);
    static PredicateNodePtr make_or(PredicateNodePtr left, PredicateNodePtr right);

private:
    PredicateNodeType type_ = PredicateNodeType::Comparison;
    Comparison comparison_{};
    PredicateNodePtr left_{};
    PredicateNodePtr right_{};
};

// Reusable row test. A predicate without a root matches every row. It keeps
// no reference to the table it was compiled against, only column positions.
class Predicate final {
public:
    Predicate() = default;
    explicit Predicate(PredicateNodePtr root);

    [[nodiscard]] bool matches(const catalog::Row& row) const;
    [[nodiscard]] bool matches_all() const noexcept { return root_ == nullptr; }
    [[nodiscard]] const PredicateNodePtr& root() const noexcept { return root_; }

    static Predicate match_all();

private:
    PredicateNodePtr root_{};
};

enum class ConditionTokenKind : std::uint8_t {
    Word,
    Quoted,
    Operator,
    LeftParen,
    RightParen
};

struct ConditionToken final {
    ConditionTokenKind kind = ConditionTokenKind::Word;
    std::string text{};
    std::size_t offset = 0U;
};

// Splits condition text into words, quoted literals (quotes kept), operator
// runs and parentheses. Whitespace inside quotes is preserved.
[[nodiscard]] EngineResult<std::vector<ConditionToken>> tokenize_condition(std::string_view condition);

// Grammar: or_expr := and_expr (OR and_expr)*, and_expr := term (AND term)*,
// term := '(' or_expr ')' | column op value | column IS [NOT] NULL.
// Keywords are case-insensitive. Column names resolve against table once.
[[nodiscard]] EngineResult<Predicate> compile_predicate(std::string_view condition, const catalog::Table& table);

}  // namespace tabula::executor
