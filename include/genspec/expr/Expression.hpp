#pragma once
#include <genspec/path/JsonPointer.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace GS::Expr {

struct Expression;
using ExpressionPtr = std::shared_ptr<Expression const>;

struct Literal {
    Json value;
};

// Plain object whose members may contain expressions.
struct ObjectLiteral {
    std::vector<std::pair<std::string, ExpressionPtr>> members;
};

struct ArrayLiteral {
    std::vector<ExpressionPtr> elements;
};

struct StateRef {
    std::string path;
};

// Field of the current repeat item; "" and "/" select the item itself.
struct ItemRef {
    std::string field;
};

struct IndexRef {};

struct Computed {
    std::string   function;
    ExpressionPtr args; // null when the call carries no args
};

struct Cond {
    ExpressionPtr condition;
    ExpressionPtr thenBranch;
    ExpressionPtr elseBranch;
};

struct And {
    std::vector<ExpressionPtr> operands;
};

struct Or {
    std::vector<ExpressionPtr> operands;
};

struct Not {
    ExpressionPtr operand;
};

enum class CompareOp {
    Truthy,
    Eq,
    Neq,
    Gt,
    Gte,
    Lt,
    Lte
};

struct Compare {
    ExpressionPtr operand;
    CompareOp     op = CompareOp::Truthy;
    ExpressionPtr rhs; // null for Truthy
    bool          negate = false;
};

struct BindState {
    std::string path;
};

struct BindItem {
    std::string field;
};

struct Expression {
    using Variant = std::variant<Literal,
                                 ObjectLiteral,
                                 ArrayLiteral,
                                 StateRef,
                                 ItemRef,
                                 IndexRef,
                                 Computed,
                                 Cond,
                                 And,
                                 Or,
                                 Not,
                                 Compare,
                                 BindState,
                                 BindItem>;
    Variant node;
};

/**
 * Classifies a JSON value into an expression tree.
 *
 * Objects are matched on their reserved keys ($state, $item, $index,
 * $computed, $cond/$then/$else, $and, $or, $not, $bindState, $bindItem).
 * A reference carrying a comparison operator (eq, neq, gt, gte, lt, lte) or
 * `not: true` becomes a Compare. Anything else is a literal, with objects and
 * arrays descended into so nested expressions still resolve.
 */
[[nodiscard]] auto ParseExpression(Json const& value) -> ExpressionPtr;

/**
 * Parses a visibility-style condition. Differs from ParseExpression in that
 * an array is an implicit AND of its entries and a bare reference tests its
 * operand for truthiness.
 */
[[nodiscard]] auto ParseCondition(Json const& value) -> ExpressionPtr;

[[nodiscard]] auto MakeLiteral(Json value) -> ExpressionPtr;

[[nodiscard]] auto compareOpName(CompareOp op) -> std::string_view;

} // namespace GS::Expr
