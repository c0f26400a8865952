#include <genspec/expr/ExpressionResolver.hpp>

#include "log/TaggedLogger.hpp"

#include <cmath>
#include <cstdint>

namespace GS::Expr {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

auto state_of(ResolveContext const& ctx) -> Json const& {
    static Json const empty = Json::object();
    return ctx.snapshot ? *ctx.snapshot : empty;
}

auto item_field(ResolveContext const& ctx, std::string const& field) -> std::optional<Json> {
    if (!ctx.repeatItem) {
        gs_log("$item '" + field + "' evaluated outside a repeat scope", "Expression");
        return std::nullopt;
    }
    return GetByPointer(*ctx.repeatItem, field);
}

auto item_path(ResolveContext const& ctx, std::string const& field) -> std::optional<std::string> {
    if (!ctx.repeatBasePath) {
        return std::nullopt;
    }
    return JoinPointer(*ctx.repeatBasePath, field);
}

auto ordered(std::optional<Json> const& lhs, std::optional<Json> const& rhs, CompareOp op) -> bool {
    if (!lhs || !rhs || !lhs->is_number() || !rhs->is_number()) {
        return false;
    }
    auto const a = lhs->get<double>();
    auto const b = rhs->get<double>();
    switch (op) {
    case CompareOp::Gt:
        return a > b;
    case CompareOp::Gte:
        return a >= b;
    case CompareOp::Lt:
        return a < b;
    case CompareOp::Lte:
        return a <= b;
    default:
        return false;
    }
}

auto to_display_string(Json const& value) -> std::string {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return std::string{};
    }
    return value.dump();
}

} // namespace

auto MakeContext(StateSnapshot snapshot) -> ResolveContext {
    ResolveContext ctx;
    ctx.snapshot = std::move(snapshot);
    return ctx;
}

auto IsTruthy(std::optional<Json> const& value) -> bool {
    if (!value) {
        return false;
    }
    switch (value->type()) {
    case Json::value_t::null:
    case Json::value_t::discarded:
        return false;
    case Json::value_t::boolean:
        return value->get<bool>();
    case Json::value_t::number_integer:
        return value->get<std::int64_t>() != 0;
    case Json::value_t::number_unsigned:
        return value->get<std::uint64_t>() != 0;
    case Json::value_t::number_float: {
        auto const number = value->get<double>();
        return number != 0.0 && !std::isnan(number);
    }
    case Json::value_t::string:
        return !value->get_ref<std::string const&>().empty();
    default:
        return true;
    }
}

auto InterpolateString(std::string_view text, Json const& state) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t cursor = 0;
    while (cursor < text.size()) {
        auto open = text.find("${", cursor);
        if (open == std::string_view::npos) {
            break;
        }
        auto close = text.find('}', open + 2);
        if (close == std::string_view::npos || close == open + 2) {
            out.append(text.substr(cursor, open + 2 - cursor));
            cursor = open + 2;
            continue;
        }
        out.append(text.substr(cursor, open - cursor));
        auto path = text.substr(open + 2, close - open - 2);
        if (auto const* value = FindByPointer(state, path)) {
            out.append(to_display_string(*value));
        }
        cursor = close + 1;
    }
    out.append(text.substr(cursor));
    return out;
}

ExpressionResolver::ExpressionResolver(FunctionMap functions)
    : functions(std::move(functions)) {}

auto ExpressionResolver::registerFunction(std::string name, ComputedFunction function) -> void {
    this->functions.insert_or_assign(std::move(name), std::move(function));
}

auto ExpressionResolver::hasFunction(std::string_view name) const -> bool {
    return this->functions.contains(std::string{name});
}

auto ExpressionResolver::resolve(Expression const& expression, ResolveContext const& ctx) const -> std::optional<Json> {
    return this->resolveNode(expression, ctx);
}

auto ExpressionResolver::resolve(Json const& value, ResolveContext const& ctx) const -> std::optional<Json> {
    return this->resolveNode(*ParseExpression(value), ctx);
}

auto ExpressionResolver::resolveNode(Expression const& expression, ResolveContext const& ctx) const -> std::optional<Json> {
    return std::visit(
            overloaded{
                    [](Literal const& literal) -> std::optional<Json> { return literal.value; },
                    [&](ObjectLiteral const& object) -> std::optional<Json> {
                        Json out = Json::object();
                        for (auto const& [key, member] : object.members) {
                            if (auto value = this->resolveNode(*member, ctx)) {
                                out[key] = std::move(*value);
                            }
                        }
                        return out;
                    },
                    [&](ArrayLiteral const& array) -> std::optional<Json> {
                        Json out = Json::array();
                        for (auto const& element : array.elements) {
                            out.push_back(this->resolveNode(*element, ctx).value_or(Json{}));
                        }
                        return out;
                    },
                    [&](StateRef const& ref) -> std::optional<Json> { return GetByPointer(state_of(ctx), ref.path); },
                    [&](ItemRef const& ref) -> std::optional<Json> { return item_field(ctx, ref.field); },
                    [&](IndexRef const&) -> std::optional<Json> {
                        if (!ctx.repeatIndex) {
                            gs_log("$index evaluated outside a repeat scope", "Expression");
                            return std::nullopt;
                        }
                        return Json(*ctx.repeatIndex);
                    },
                    [&](Computed const& computed) -> std::optional<Json> {
                        auto fn = this->functions.find(computed.function);
                        if (fn == this->functions.end()) {
                            gs_log("Unknown computed function: " + computed.function, "Expression", "WARN");
                            return std::nullopt;
                        }
                        Json args = Json::object();
                        if (computed.args) {
                            args = this->resolveNode(*computed.args, ctx).value_or(Json::object());
                        }
                        return fn->second(args);
                    },
                    [&](Cond const& cond) -> std::optional<Json> {
                        auto const& branch = this->evaluateCondition(*cond.condition, ctx) ? cond.thenBranch : cond.elseBranch;
                        return this->resolveNode(*branch, ctx);
                    },
                    [&](And const&) -> std::optional<Json> { return Json(this->evaluateCondition(expression, ctx)); },
                    [&](Or const&) -> std::optional<Json> { return Json(this->evaluateCondition(expression, ctx)); },
                    [&](Not const&) -> std::optional<Json> { return Json(this->evaluateCondition(expression, ctx)); },
                    [&](Compare const& compare) -> std::optional<Json> { return Json(this->compare(compare, ctx)); },
                    [&](BindState const& bind) -> std::optional<Json> { return GetByPointer(state_of(ctx), bind.path); },
                    [&](BindItem const& bind) -> std::optional<Json> { return item_field(ctx, bind.field); },
            },
            expression.node);
}

auto ExpressionResolver::compare(Compare const& compare, ResolveContext const& ctx) const -> bool {
    auto lhs = this->resolveNode(*compare.operand, ctx);
    bool result = false;
    switch (compare.op) {
    case CompareOp::Truthy:
        result = IsTruthy(lhs);
        break;
    case CompareOp::Eq:
        result = lhs == this->resolveNode(*compare.rhs, ctx);
        break;
    case CompareOp::Neq:
        result = lhs != this->resolveNode(*compare.rhs, ctx);
        break;
    case CompareOp::Gt:
    case CompareOp::Gte:
    case CompareOp::Lt:
    case CompareOp::Lte:
        result = ordered(lhs, this->resolveNode(*compare.rhs, ctx), compare.op);
        break;
    }
    return compare.negate ? !result : result;
}

auto ExpressionResolver::evaluateCondition(Expression const& condition, ResolveContext const& ctx) const -> bool {
    if (auto const* all = std::get_if<And>(&condition.node)) {
        for (auto const& operand : all->operands) {
            if (!this->evaluateCondition(*operand, ctx)) {
                return false;
            }
        }
        return true;
    }
    if (auto const* any = std::get_if<Or>(&condition.node)) {
        for (auto const& operand : any->operands) {
            if (this->evaluateCondition(*operand, ctx)) {
                return true;
            }
        }
        return false;
    }
    if (auto const* negation = std::get_if<Not>(&condition.node)) {
        return !this->evaluateCondition(*negation->operand, ctx);
    }
    if (auto const* comparison = std::get_if<Compare>(&condition.node)) {
        return this->compare(*comparison, ctx);
    }
    return IsTruthy(this->resolveNode(condition, ctx));
}

auto ExpressionResolver::evaluateCondition(Json const& condition, ResolveContext const& ctx) const -> bool {
    return this->evaluateCondition(*ParseCondition(condition), ctx);
}

auto ExpressionResolver::evaluateVisibility(std::optional<Json> const& condition, ResolveContext const& ctx) const -> bool {
    if (!condition) {
        return true;
    }
    return this->evaluateCondition(*condition, ctx);
}

auto ExpressionResolver::resolveProps(Json const& props, ResolveContext const& ctx) const -> Json {
    Json out = Json::object();
    if (!props.is_object()) {
        return out;
    }
    for (auto const& [key, value] : props.items()) {
        if (auto resolved = this->resolve(value, ctx)) {
            out[key] = std::move(*resolved);
        }
    }
    return out;
}

auto ExpressionResolver::resolveBindings(Json const& props, ResolveContext const& ctx) const -> BindingMap {
    BindingMap bindings;
    if (!props.is_object()) {
        return bindings;
    }
    for (auto const& [key, value] : props.items()) {
        auto parsed = ParseExpression(value);
        if (auto const* state = std::get_if<BindState>(&parsed->node)) {
            bindings.insert_or_assign(key, state->path);
        } else if (auto const* item = std::get_if<BindItem>(&parsed->node)) {
            if (auto path = item_path(ctx, item->field)) {
                bindings.insert_or_assign(key, std::move(*path));
            } else {
                gs_log("$bindItem '" + item->field + "' used outside a repeat scope", "Expression");
            }
        }
    }
    return bindings;
}

auto ExpressionResolver::resolveActionParam(Json const& value, ResolveContext const& ctx) const -> std::optional<Json> {
    auto parsed = ParseExpression(value);
    if (auto const* item = std::get_if<ItemRef>(&parsed->node)) {
        if (auto path = item_path(ctx, item->field)) {
            return Json(std::move(*path));
        }
        gs_log("$item action param '" + item->field + "' used outside a repeat scope", "Expression");
        return std::nullopt;
    }
    return this->resolveNode(*parsed, ctx);
}

auto ExpressionResolver::resolveActionParams(Json const& params, ResolveContext const& ctx) const -> Json {
    Json out = Json::object();
    if (!params.is_object()) {
        return out;
    }
    for (auto const& [key, value] : params.items()) {
        if (auto resolved = this->resolveActionParam(value, ctx)) {
            out[key] = std::move(*resolved);
        }
    }
    return out;
}

} // namespace GS::Expr
