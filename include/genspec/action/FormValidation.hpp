#pragma once
#include <genspec/core/Error.hpp>
#include <genspec/expr/ExpressionResolver.hpp>
#include <genspec/state/StateStore.hpp>

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace GS::Action {

// Receives the field value (absent when unset) and the resolved check args.
using ValidationFunction = std::function<bool(std::optional<Json> const& value, Json const& args)>;

struct ValidationCheck {
    std::string fn;
    Json        args = Json::object(); // values may be expressions, e.g. {"other": {"$state": "/pw"}}
    std::string message;
};

struct ValidationConfig {
    std::vector<ValidationCheck> checks;
    std::optional<Json>          enabled; // condition; validation is skipped while false
};

struct ValidationCheckResult {
    std::string fn;
    bool        valid = true;
    std::string message;
};

struct FieldValidationResult {
    bool                               valid = true;
    std::vector<std::string>           errors;
    std::vector<ValidationCheckResult> checks;
};

struct FormValidationResult {
    bool                                            valid = true;
    std::map<std::string, std::vector<std::string>> errors; // statePath -> messages

    [[nodiscard]] auto toJson() const -> Json;
};

[[nodiscard]] auto ValidationConfigFromJson(Json const& json) -> Expected<ValidationConfig>;

/**
 * Looks up a built-in check: required, email, minLength, maxLength, pattern,
 * min, max, numeric, url, matches.
 */
[[nodiscard]] auto FindBuiltinValidation(std::string_view name) -> ValidationFunction const*;

/**
 * Holds the validation config of every registered form field and runs it on
 * demand. Built-ins take precedence over custom functions of the same name;
 * an unknown function passes with a warning.
 */
class FormValidator {
public:
    FormValidator() = default;
    explicit FormValidator(Expr::ExpressionResolver const* resolver);

    auto registerFunction(std::string name, ValidationFunction function) -> void;
    auto registerField(std::string statePath, ValidationConfig config) -> void;
    auto unregisterField(std::string const& statePath) -> void;
    [[nodiscard]] auto fieldCount() const -> std::size_t;

    [[nodiscard]] auto runCheck(ValidationCheck const& check, std::optional<Json> const& value, Expr::ResolveContext const& ctx) const
            -> ValidationCheckResult;
    [[nodiscard]] auto validate(ValidationConfig const& config, std::optional<Json> const& value, Expr::ResolveContext const& ctx) const
            -> FieldValidationResult;
    [[nodiscard]] auto validateField(std::string const& statePath, StateSnapshot const& snapshot) const -> FieldValidationResult;
    [[nodiscard]] auto validateAll(StateSnapshot const& snapshot) const -> FormValidationResult;

private:
    [[nodiscard]] auto resolverOrDefault() const -> Expr::ExpressionResolver const&;

    Expr::ExpressionResolver const*                             resolver = nullptr;
    mutable std::mutex                                          mutex_;
    phmap::flat_hash_map<std::string, ValidationFunction>       customFunctions;
    std::map<std::string, ValidationConfig>                     fields;
};

} // namespace GS::Action
