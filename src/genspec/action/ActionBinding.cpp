#include <genspec/action/ActionBinding.hpp>

namespace GS::Action {

namespace {

[[nodiscard]] auto make_error(std::string_view field, std::string_view detail) -> Error {
    std::string message{field};
    message.append(": ");
    message.append(detail);
    return Error{Error::Code::MalformedInput, std::move(message)};
}

[[nodiscard]] auto read_string(Json const& json, char const* key) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return std::unexpected(make_error(key, "is required"));
}

[[nodiscard]] auto read_optional_string(Json const& json, char const* key) -> std::optional<std::string> {
    if (auto it = json.find(key); it != json.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

[[nodiscard]] auto read_confirm(Json const& json) -> Expected<ActionConfirm> {
    if (!json.is_object()) {
        return std::unexpected(make_error("confirm", "must be an object"));
    }
    ActionConfirm confirm;
    confirm.title        = read_optional_string(json, "title").value_or(std::string{});
    confirm.message      = read_optional_string(json, "message").value_or(std::string{});
    confirm.confirmLabel = read_optional_string(json, "confirmLabel");
    confirm.cancelLabel  = read_optional_string(json, "cancelLabel");
    if (auto variant = read_optional_string(json, "variant"); variant && *variant == "danger") {
        confirm.variant = ConfirmVariant::Danger;
    }
    return confirm;
}

[[nodiscard]] auto read_set(Json const& json, char const* field) -> Expected<SetValues> {
    auto it = json.find("set");
    if (!it->is_object()) {
        return std::unexpected(make_error(field, "set must be an object"));
    }
    return SetValues{*it};
}

[[nodiscard]] auto read_success(Json const& json) -> Expected<SuccessHandler> {
    if (!json.is_object()) {
        return std::unexpected(make_error("onSuccess", "must be an object"));
    }
    if (auto navigate = read_optional_string(json, "navigate")) {
        return SuccessHandler{NavigateTo{std::move(*navigate)}};
    }
    if (json.contains("set")) {
        auto set = read_set(json, "onSuccess");
        if (!set) {
            return std::unexpected(set.error());
        }
        return SuccessHandler{std::move(*set)};
    }
    if (auto action = read_optional_string(json, "action")) {
        return SuccessHandler{RunAction{std::move(*action)}};
    }
    return std::unexpected(make_error("onSuccess", "expected navigate, set or action"));
}

[[nodiscard]] auto read_error_handler(Json const& json) -> Expected<ErrorHandler> {
    if (!json.is_object()) {
        return std::unexpected(make_error("onError", "must be an object"));
    }
    if (json.contains("set")) {
        auto set = read_set(json, "onError");
        if (!set) {
            return std::unexpected(set.error());
        }
        return ErrorHandler{std::move(*set)};
    }
    if (auto action = read_optional_string(json, "action")) {
        return ErrorHandler{RunAction{std::move(*action)}};
    }
    return std::unexpected(make_error("onError", "expected set or action"));
}

} // namespace

auto ParseActionBinding(Json const& json) -> Expected<ActionBinding> {
    if (!json.is_object()) {
        return std::unexpected(make_error("binding", "must be an object"));
    }

    auto action = read_string(json, "action");
    if (!action) {
        return std::unexpected(action.error());
    }

    ActionBinding binding;
    binding.action = std::move(*action);

    if (auto it = json.find("params"); it != json.end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::unexpected(make_error("params", "must be an object"));
        }
        binding.params = *it;
    }
    if (auto it = json.find("confirm"); it != json.end() && !it->is_null()) {
        auto confirm = read_confirm(*it);
        if (!confirm) {
            return std::unexpected(confirm.error());
        }
        binding.confirm = std::move(*confirm);
    }
    if (auto it = json.find("preventDefault"); it != json.end() && it->is_boolean()) {
        binding.preventDefault = it->get<bool>();
    }
    if (auto it = json.find("onSuccess"); it != json.end() && !it->is_null()) {
        auto handler = read_success(*it);
        if (!handler) {
            return std::unexpected(handler.error());
        }
        binding.onSuccess = std::move(*handler);
    }
    if (auto it = json.find("onError"); it != json.end() && !it->is_null()) {
        auto handler = read_error_handler(*it);
        if (!handler) {
            return std::unexpected(handler.error());
        }
        binding.onError = std::move(*handler);
    }
    return binding;
}

auto ParseActionBindings(Json const& json) -> Expected<std::vector<ActionBinding>> {
    std::vector<ActionBinding> bindings;
    if (!json.is_array()) {
        auto binding = ParseActionBinding(json);
        if (!binding) {
            return std::unexpected(binding.error());
        }
        bindings.push_back(std::move(*binding));
        return bindings;
    }
    for (auto const& entry : json) {
        auto binding = ParseActionBinding(entry);
        if (!binding) {
            return std::unexpected(binding.error());
        }
        bindings.push_back(std::move(*binding));
    }
    return bindings;
}

auto ActionBindingToJson(ActionBinding const& binding) -> Json {
    Json json      = Json::object();
    json["action"] = binding.action;
    if (!binding.params.empty()) {
        json["params"] = binding.params;
    }
    if (binding.confirm) {
        Json confirm       = Json::object();
        confirm["title"]   = binding.confirm->title;
        confirm["message"] = binding.confirm->message;
        if (binding.confirm->confirmLabel) {
            confirm["confirmLabel"] = *binding.confirm->confirmLabel;
        }
        if (binding.confirm->cancelLabel) {
            confirm["cancelLabel"] = *binding.confirm->cancelLabel;
        }
        if (binding.confirm->variant == ConfirmVariant::Danger) {
            confirm["variant"] = "danger";
        }
        json["confirm"] = std::move(confirm);
    }
    if (binding.preventDefault) {
        json["preventDefault"] = true;
    }
    if (binding.onSuccess) {
        if (auto const* navigate = std::get_if<NavigateTo>(&*binding.onSuccess)) {
            json["onSuccess"] = Json{{"navigate", navigate->screen}};
        } else if (auto const* set = std::get_if<SetValues>(&*binding.onSuccess)) {
            json["onSuccess"] = Json{{"set", set->values}};
        } else if (auto const* run = std::get_if<RunAction>(&*binding.onSuccess)) {
            json["onSuccess"] = Json{{"action", run->action}};
        }
    }
    if (binding.onError) {
        if (auto const* set = std::get_if<SetValues>(&*binding.onError)) {
            json["onError"] = Json{{"set", set->values}};
        } else if (auto const* run = std::get_if<RunAction>(&*binding.onError)) {
            json["onError"] = Json{{"action", run->action}};
        }
    }
    return json;
}

auto MakeBinding(std::string action, Json params) -> ActionBinding {
    ActionBinding binding;
    binding.action = std::move(action);
    binding.params = params.is_object() ? std::move(params) : Json::object();
    return binding;
}

} // namespace GS::Action
