#include <genspec/expr/Expression.hpp>

#include <array>
#include <optional>

namespace GS::Expr {

namespace {

template <typename T>
auto make(T node) -> ExpressionPtr {
    return std::make_shared<Expression const>(Expression{Expression::Variant{std::move(node)}});
}

auto string_member(Json const& object, char const* key) -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Operand of a reference-style condition ($state, $item or $index).
auto parse_reference(Json const& object) -> ExpressionPtr {
    if (auto path = string_member(object, "$state")) {
        return make(StateRef{std::move(*path)});
    }
    if (auto field = string_member(object, "$item")) {
        return make(ItemRef{std::move(*field)});
    }
    auto index = object.find("$index");
    if (index != object.end() && index->is_boolean() && index->get<bool>()) {
        return make(IndexRef{});
    }
    return nullptr;
}

constexpr std::array<std::pair<char const*, CompareOp>, 6> kOperators{{
    {"eq", CompareOp::Eq},
    {"neq", CompareOp::Neq},
    {"gt", CompareOp::Gt},
    {"gte", CompareOp::Gte},
    {"lt", CompareOp::Lt},
    {"lte", CompareOp::Lte},
}};

auto has_operator(Json const& object) -> bool {
    for (auto const& [name, op] : kOperators) {
        if (object.contains(name)) {
            return true;
        }
    }
    auto negate = object.find("not");
    return negate != object.end() && negate->is_boolean() && negate->get<bool>();
}

auto parse_compare(Json const& object, ExpressionPtr operand) -> ExpressionPtr {
    Compare compare;
    compare.operand = std::move(operand);
    for (auto const& [name, op] : kOperators) {
        auto it = object.find(name);
        if (it != object.end()) {
            compare.op  = op;
            compare.rhs = ParseExpression(*it);
            break;
        }
    }
    auto negate    = object.find("not");
    compare.negate = negate != object.end() && negate->is_boolean() && negate->get<bool>();
    return make(std::move(compare));
}

auto parse_condition_list(Json const& list) -> std::vector<ExpressionPtr> {
    std::vector<ExpressionPtr> operands;
    if (!list.is_array()) {
        operands.push_back(ParseCondition(list));
        return operands;
    }
    operands.reserve(list.size());
    for (auto const& entry : list) {
        operands.push_back(ParseCondition(entry));
    }
    return operands;
}

// Logical forms shared by expression and condition parsing.
auto parse_logical(Json const& object) -> ExpressionPtr {
    if (auto it = object.find("$and"); it != object.end()) {
        return make(And{parse_condition_list(*it)});
    }
    if (auto it = object.find("$or"); it != object.end()) {
        return make(Or{parse_condition_list(*it)});
    }
    if (auto it = object.find("$not"); it != object.end()) {
        return make(Not{ParseCondition(*it)});
    }
    return nullptr;
}

auto parse_object_literal(Json const& object) -> ExpressionPtr {
    ObjectLiteral literal;
    literal.members.reserve(object.size());
    for (auto const& [key, member] : object.items()) {
        literal.members.emplace_back(key, ParseExpression(member));
    }
    return make(std::move(literal));
}

} // namespace

auto MakeLiteral(Json value) -> ExpressionPtr {
    return make(Literal{std::move(value)});
}

auto ParseExpression(Json const& value) -> ExpressionPtr {
    if (value.is_array()) {
        ArrayLiteral literal;
        literal.elements.reserve(value.size());
        for (auto const& element : value) {
            literal.elements.push_back(ParseExpression(element));
        }
        return make(std::move(literal));
    }
    if (!value.is_object()) {
        return MakeLiteral(value);
    }

    if (auto reference = parse_reference(value)) {
        if (has_operator(value)) {
            return parse_compare(value, std::move(reference));
        }
        return reference;
    }

    if (auto name = string_member(value, "$computed")) {
        auto          args = value.find("args");
        ExpressionPtr parsedArgs;
        if (args != value.end()) {
            parsedArgs = ParseExpression(*args);
        }
        return make(Computed{std::move(*name), std::move(parsedArgs)});
    }

    if (value.contains("$cond") && value.contains("$then") && value.contains("$else")) {
        return make(Cond{ParseCondition(value.at("$cond")),
                         ParseExpression(value.at("$then")),
                         ParseExpression(value.at("$else"))});
    }

    if (auto logical = parse_logical(value)) {
        return logical;
    }

    if (auto path = string_member(value, "$bindState")) {
        return make(BindState{std::move(*path)});
    }
    if (auto field = string_member(value, "$bindItem")) {
        return make(BindItem{std::move(*field)});
    }

    return parse_object_literal(value);
}

auto ParseCondition(Json const& value) -> ExpressionPtr {
    if (value.is_array()) {
        return make(And{parse_condition_list(value)});
    }
    if (!value.is_object()) {
        return MakeLiteral(value);
    }
    if (auto reference = parse_reference(value)) {
        return parse_compare(value, std::move(reference));
    }
    if (auto logical = parse_logical(value)) {
        return logical;
    }
    return ParseExpression(value);
}

auto compareOpName(CompareOp op) -> std::string_view {
    switch (op) {
    case CompareOp::Truthy:
        return "truthy";
    case CompareOp::Eq:
        return "eq";
    case CompareOp::Neq:
        return "neq";
    case CompareOp::Gt:
        return "gt";
    case CompareOp::Gte:
        return "gte";
    case CompareOp::Lt:
        return "lt";
    case CompareOp::Lte:
        return "lte";
    }
    return "truthy";
}

} // namespace GS::Expr
