#pragma once
#include <genspec/expr/Expression.hpp>
#include <genspec/state/StateStore.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace GS::Expr {

// Pure function invoked by { "$computed": name, "args": ... }.
using ComputedFunction = std::function<Json(Json const& args)>;
using FunctionMap      = phmap::flat_hash_map<std::string, ComputedFunction>;
using BindingMap       = phmap::flat_hash_map<std::string, std::string>;

/**
 * Scope an expression is evaluated in. The repeat fields are only set for
 * nodes rendered under a repeat; repeatBasePath is the absolute state path of
 * the current item (e.g. "/todos/2").
 */
struct ResolveContext {
    StateSnapshot              snapshot;
    std::optional<Json>        repeatItem;
    std::optional<std::size_t> repeatIndex;
    std::optional<std::string> repeatBasePath;
};

[[nodiscard]] auto MakeContext(StateSnapshot snapshot) -> ResolveContext;

// JavaScript truthiness; a disengaged value counts as false.
[[nodiscard]] auto IsTruthy(std::optional<Json> const& value) -> bool;

// Replaces ${/path} with the state value at path ("" when absent).
[[nodiscard]] auto InterpolateString(std::string_view text, Json const& state) -> std::string;

/**
 * Evaluates expressions against a state snapshot. Nothing is cached, so the
 * same expression re-evaluated after a state change sees the new values.
 *
 * Generated documents are untrusted: unknown computed functions and repeat
 * references outside a repeat scope resolve to nothing instead of failing.
 */
class ExpressionResolver {
public:
    ExpressionResolver() = default;
    explicit ExpressionResolver(FunctionMap functions);

    auto registerFunction(std::string name, ComputedFunction function) -> void;
    [[nodiscard]] auto hasFunction(std::string_view name) const -> bool;

    [[nodiscard]] auto resolve(Expression const& expression, ResolveContext const& ctx) const -> std::optional<Json>;
    [[nodiscard]] auto resolve(Json const& value, ResolveContext const& ctx) const -> std::optional<Json>;

    [[nodiscard]] auto evaluateCondition(Expression const& condition, ResolveContext const& ctx) const -> bool;
    [[nodiscard]] auto evaluateCondition(Json const& condition, ResolveContext const& ctx) const -> bool;
    // No condition means visible.
    [[nodiscard]] auto evaluateVisibility(std::optional<Json> const& condition, ResolveContext const& ctx) const -> bool;

    // Resolves every member of a props object; absent results are omitted.
    [[nodiscard]] auto resolveProps(Json const& props, ResolveContext const& ctx) const -> Json;
    // propName -> absolute state path for $bindState / $bindItem props.
    [[nodiscard]] auto resolveBindings(Json const& props, ResolveContext const& ctx) const -> BindingMap;

    // Like resolve, but $item yields the item field's absolute state path.
    [[nodiscard]] auto resolveActionParam(Json const& value, ResolveContext const& ctx) const -> std::optional<Json>;
    [[nodiscard]] auto resolveActionParams(Json const& params, ResolveContext const& ctx) const -> Json;

private:
    [[nodiscard]] auto resolveNode(Expression const& expression, ResolveContext const& ctx) const -> std::optional<Json>;
    [[nodiscard]] auto compare(Compare const& compare, ResolveContext const& ctx) const -> bool;

    FunctionMap functions;
};

} // namespace GS::Expr
