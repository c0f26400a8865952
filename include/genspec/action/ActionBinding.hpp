#pragma once
#include <genspec/core/Error.hpp>
#include <genspec/path/JsonPointer.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace GS::Action {

enum class ConfirmVariant {
    Default,
    Danger
};

// Dialog shown before a gated action runs. title and message may contain
// ${/state/path} placeholders.
struct ActionConfirm {
    std::string                title;
    std::string                message;
    std::optional<std::string> confirmLabel;
    std::optional<std::string> cancelLabel;
    ConfirmVariant             variant = ConfirmVariant::Default;
};

struct NavigateTo {
    std::string screen;
};

// {path: value} writes applied to the state store.
struct SetValues {
    Json values = Json::object();
};

struct RunAction {
    std::string action;
};

using SuccessHandler = std::variant<NavigateTo, SetValues, RunAction>;
using ErrorHandler   = std::variant<SetValues, RunAction>;

struct ActionBinding {
    std::string                   action;
    Json                          params = Json::object();
    std::optional<ActionConfirm>  confirm;
    bool                          preventDefault = false;
    std::optional<SuccessHandler> onSuccess;
    std::optional<ErrorHandler>   onError;
};

[[nodiscard]] auto ParseActionBinding(Json const& json) -> Expected<ActionBinding>;
// An event entry may be one binding or an array of them.
[[nodiscard]] auto ParseActionBindings(Json const& json) -> Expected<std::vector<ActionBinding>>;
[[nodiscard]] auto ActionBindingToJson(ActionBinding const& binding) -> Json;

// Shorthand used by hosts and tests.
[[nodiscard]] auto MakeBinding(std::string action, Json params = Json::object()) -> ActionBinding;

} // namespace GS::Action
