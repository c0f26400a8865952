#include <genspec/action/FormValidation.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <regex>

namespace GS::Action {

namespace {

// Length in code points; UTF-8 continuation bytes are not counted.
auto string_length(Json const& value) -> std::size_t {
    auto const& text = value.get_ref<std::string const&>();
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

auto number_arg(Json const& args, char const* key) -> std::optional<double> {
    if (auto it = args.find(key); it != args.end() && it->is_number()) {
        return it->get<double>();
    }
    return std::nullopt;
}

auto trim_view(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

auto is_required(std::optional<Json> const& value, Json const&) -> bool {
    if (!value || value->is_null()) {
        return false;
    }
    if (value->is_string()) {
        return !trim_view(value->get_ref<std::string const&>()).empty();
    }
    if (value->is_array()) {
        return !value->empty();
    }
    return true;
}

auto is_email(std::optional<Json> const& value, Json const&) -> bool {
    if (!value || !value->is_string()) {
        return false;
    }
    static std::regex const pattern{R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)"};
    return std::regex_match(value->get_ref<std::string const&>(), pattern);
}

auto has_min_length(std::optional<Json> const& value, Json const& args) -> bool {
    auto min = number_arg(args, "min");
    if (!value || !value->is_string() || !min) {
        return false;
    }
    return static_cast<double>(string_length(*value)) >= *min;
}

auto has_max_length(std::optional<Json> const& value, Json const& args) -> bool {
    auto max = number_arg(args, "max");
    if (!value || !value->is_string() || !max) {
        return false;
    }
    return static_cast<double>(string_length(*value)) <= *max;
}

auto matches_pattern(std::optional<Json> const& value, Json const& args) -> bool {
    if (!value || !value->is_string()) {
        return false;
    }
    auto pattern = args.find("pattern");
    if (pattern == args.end() || !pattern->is_string()) {
        return false;
    }
    try {
        std::regex const expression{pattern->get<std::string>(), std::regex::ECMAScript};
        return std::regex_search(value->get_ref<std::string const&>(), expression);
    } catch (std::regex_error const& error) {
        gs_log(std::string{"Invalid validation pattern: "} + error.what(), "Action", "WARN");
        return false;
    }
}

auto is_at_least(std::optional<Json> const& value, Json const& args) -> bool {
    auto min = number_arg(args, "min");
    if (!value || !value->is_number() || !min) {
        return false;
    }
    return value->get<double>() >= *min;
}

auto is_at_most(std::optional<Json> const& value, Json const& args) -> bool {
    auto max = number_arg(args, "max");
    if (!value || !value->is_number() || !max) {
        return false;
    }
    return value->get<double>() <= *max;
}

// Accepts numbers and strings with a numeric prefix ("12px" passes).
auto is_numeric(std::optional<Json> const& value, Json const&) -> bool {
    if (!value) {
        return false;
    }
    if (value->is_number()) {
        return !std::isnan(value->get<double>());
    }
    if (!value->is_string()) {
        return false;
    }
    auto text = trim_view(value->get_ref<std::string const&>());
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    double parsed = 0.0;
    auto   result = std::from_chars(text.data(), text.data() + text.size(), parsed);
    return result.ec == std::errc{} && result.ptr != text.data();
}

auto is_url(std::optional<Json> const& value, Json const&) -> bool {
    if (!value || !value->is_string()) {
        return false;
    }
    std::string_view text = value->get_ref<std::string const&>();
    auto             colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    auto scheme = text.substr(0, colon);
    if (std::isalpha(static_cast<unsigned char>(scheme.front())) == 0) {
        return false;
    }
    for (char ch : scheme) {
        if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '+' && ch != '-' && ch != '.') {
            return false;
        }
    }
    auto rest = text.substr(colon + 1);
    if (rest.empty() || rest.find(' ') != std::string_view::npos) {
        return false;
    }
    if (rest.starts_with("//")) {
        auto authority = rest.substr(2, rest.find_first_of("/?#", 2) - 2);
        return !authority.empty();
    }
    return scheme != "http" && scheme != "https";
}

auto matches_other(std::optional<Json> const& value, Json const& args) -> bool {
    std::optional<Json> other;
    if (auto it = args.find("other"); it != args.end()) {
        other = *it;
    }
    return value == other;
}

auto builtin_functions() -> phmap::flat_hash_map<std::string, ValidationFunction> const& {
    static phmap::flat_hash_map<std::string, ValidationFunction> const functions{
            {"required", is_required},
            {"email", is_email},
            {"minLength", has_min_length},
            {"maxLength", has_max_length},
            {"pattern", matches_pattern},
            {"min", is_at_least},
            {"max", is_at_most},
            {"numeric", is_numeric},
            {"url", is_url},
            {"matches", matches_other},
    };
    return functions;
}

} // namespace

auto FormValidationResult::toJson() const -> Json {
    Json errorsJson = Json::object();
    for (auto const& [path, messages] : this->errors) {
        errorsJson[path] = messages;
    }
    return Json{{"valid", this->valid}, {"errors", std::move(errorsJson)}};
}

auto ValidationConfigFromJson(Json const& json) -> Expected<ValidationConfig> {
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "validation: must be an object"});
    }
    ValidationConfig config;
    if (auto checks = json.find("checks"); checks != json.end()) {
        if (!checks->is_array()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "checks: must be an array"});
        }
        for (auto const& entry : *checks) {
            auto fn = entry.find("fn");
            if (!entry.is_object() || fn == entry.end() || !fn->is_string()) {
                return std::unexpected(Error{Error::Code::MalformedInput, "checks: each check needs a string fn"});
            }
            ValidationCheck check;
            check.fn = fn->get<std::string>();
            if (auto args = entry.find("args"); args != entry.end() && args->is_object()) {
                check.args = *args;
            }
            if (auto message = entry.find("message"); message != entry.end() && message->is_string()) {
                check.message = message->get<std::string>();
            }
            config.checks.push_back(std::move(check));
        }
    }
    if (auto enabled = json.find("enabled"); enabled != json.end()) {
        config.enabled = *enabled;
    }
    return config;
}

auto FindBuiltinValidation(std::string_view name) -> ValidationFunction const* {
    auto const& functions = builtin_functions();
    auto        it        = functions.find(std::string{name});
    return it == functions.end() ? nullptr : &it->second;
}

FormValidator::FormValidator(Expr::ExpressionResolver const* resolver)
    : resolver(resolver) {}

auto FormValidator::resolverOrDefault() const -> Expr::ExpressionResolver const& {
    static Expr::ExpressionResolver const fallback;
    return this->resolver ? *this->resolver : fallback;
}

auto FormValidator::registerFunction(std::string name, ValidationFunction function) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->customFunctions.insert_or_assign(std::move(name), std::move(function));
}

auto FormValidator::registerField(std::string statePath, ValidationConfig config) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->fields.insert_or_assign(std::move(statePath), std::move(config));
}

auto FormValidator::unregisterField(std::string const& statePath) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->fields.erase(statePath);
}

auto FormValidator::fieldCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->fields.size();
}

auto FormValidator::runCheck(ValidationCheck const& check, std::optional<Json> const& value, Expr::ResolveContext const& ctx) const
        -> ValidationCheckResult {
    auto args = this->resolverOrDefault().resolveProps(check.args, ctx);

    ValidationFunction function;
    if (auto const* builtin = FindBuiltinValidation(check.fn)) {
        function = *builtin;
    } else {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (auto it = this->customFunctions.find(check.fn); it != this->customFunctions.end()) {
            function = it->second;
        }
    }

    if (!function) {
        gs_log("Unknown validation function: " + check.fn, "Action", "WARN");
        return ValidationCheckResult{check.fn, true, check.message};
    }
    return ValidationCheckResult{check.fn, function(value, args), check.message};
}

auto FormValidator::validate(ValidationConfig const& config, std::optional<Json> const& value, Expr::ResolveContext const& ctx) const
        -> FieldValidationResult {
    FieldValidationResult result;
    if (config.enabled && !this->resolverOrDefault().evaluateCondition(*config.enabled, ctx)) {
        return result;
    }
    for (auto const& check : config.checks) {
        auto outcome = this->runCheck(check, value, ctx);
        if (!outcome.valid) {
            result.errors.push_back(outcome.message);
        }
        result.checks.push_back(std::move(outcome));
    }
    result.valid = result.errors.empty();
    return result;
}

auto FormValidator::validateField(std::string const& statePath, StateSnapshot const& snapshot) const -> FieldValidationResult {
    std::optional<ValidationConfig> config;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (auto it = this->fields.find(statePath); it != this->fields.end()) {
            config = it->second;
        }
    }
    if (!config) {
        return FieldValidationResult{};
    }
    auto ctx   = Expr::MakeContext(snapshot);
    auto value = snapshot ? GetByPointer(*snapshot, statePath) : std::nullopt;
    return this->validate(*config, value, ctx);
}

auto FormValidator::validateAll(StateSnapshot const& snapshot) const -> FormValidationResult {
    std::map<std::string, ValidationConfig> registered;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        registered = this->fields;
    }

    FormValidationResult result;
    auto                 ctx = Expr::MakeContext(snapshot);
    for (auto const& [path, config] : registered) {
        auto value   = snapshot ? GetByPointer(*snapshot, path) : std::nullopt;
        auto outcome = this->validate(config, value, ctx);
        if (!outcome.valid) {
            result.valid        = false;
            result.errors[path] = std::move(outcome.errors);
        }
    }
    return result;
}

} // namespace GS::Action
