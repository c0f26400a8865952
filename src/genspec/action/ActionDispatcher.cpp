#include <genspec/action/ActionDispatcher.hpp>

#include "log/TaggedLogger.hpp"

#include <array>
#include <cstdio>
#include <future>
#include <random>

namespace GS::Action {

namespace {

constexpr char const* kNavStackPath      = "/navStack";
constexpr char const* kCurrentScreenPath = "/currentScreen";
constexpr char const* kFormResultPath    = "/formValidation";
constexpr char const* kErrorMessageToken = "$error.message";

auto string_param(Json const& params, char const* key) -> std::optional<std::string> {
    if (auto it = params.find(key); it != params.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

auto array_at(StateStore const& store, std::string_view path) -> Json {
    auto value = store.get(path);
    if (value && value->is_array()) {
        return std::move(*value);
    }
    return Json::array();
}

auto is_id_token(Json const& value) -> bool {
    if (value.is_string()) {
        return value.get_ref<std::string const&>() == "$id";
    }
    if (!value.is_object() || value.size() != 1) {
        return false;
    }
    auto it = value.find("$id");
    return it != value.end() && it->is_boolean() && it->get<bool>();
}

// Index params arrive as numbers but tolerate integral strings.
auto index_param(Json const& params) -> std::optional<std::size_t> {
    auto it = params.find("index");
    if (it == params.end()) {
        return std::nullopt;
    }
    if (it->is_number_integer() || it->is_number_unsigned()) {
        auto index = it->get<std::int64_t>();
        if (index < 0) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(index);
    }
    if (it->is_string()) {
        return parse_array_index(it->get_ref<std::string const&>());
    }
    return std::nullopt;
}

} // namespace

auto GenerateUniqueId() -> std::string {
    static std::mutex      generatorMutex;
    static std::mt19937_64 generator{std::random_device{}()};

    std::uint64_t high = 0;
    std::uint64_t low  = 0;
    {
        std::lock_guard<std::mutex> lock(generatorMutex);
        high = generator();
        low  = generator();
    }
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low  = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::array<char, 37> buffer{};
    std::snprintf(buffer.data(),
                  buffer.size(),
                  "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32),
                  static_cast<unsigned>((high >> 16) & 0xFFFF),
                  static_cast<unsigned>(high & 0xFFFF),
                  static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return std::string{buffer.data()};
}

ActionContext::ActionContext(ActionDispatcher& dispatcher, std::string action, Json params)
    : dispatcher(dispatcher), action_(std::move(action)), params_(std::move(params)) {}

auto ActionContext::executeAction(std::string const& name) -> Expected<void> {
    return this->dispatcher.execute(MakeBinding(name));
}

auto ActionContext::execute(ActionBinding const& binding) -> Expected<void> {
    return this->dispatcher.execute(binding);
}

auto ActionContext::store() -> StateStore& {
    return this->dispatcher.store();
}

ActionDispatcher::LoadingGuard::LoadingGuard(ActionDispatcher& dispatcher, std::string action)
    : dispatcher(dispatcher), action(std::move(action)) {
    std::lock_guard<std::mutex> lock(this->dispatcher.mutex_);
    ++this->dispatcher.loading[this->action];
}

ActionDispatcher::LoadingGuard::~LoadingGuard() {
    std::lock_guard<std::mutex> lock(this->dispatcher.mutex_);
    auto it = this->dispatcher.loading.find(this->action);
    if (it != this->dispatcher.loading.end() && --it->second == 0) {
        this->dispatcher.loading.erase(it);
    }
}

ActionDispatcher::ActionDispatcher(StateStore& store, Expr::ExpressionResolver const& resolver, FormValidator const* forms)
    : store_(store), resolver_(resolver), idGenerator(GenerateUniqueId), forms(forms) {}

ActionDispatcher::~ActionDispatcher() {
    std::unique_lock<std::mutex> lock(this->mutex_);
    this->shuttingDown = true;
    for (auto& slot : this->pending) {
        slot->decision = false;
    }
    this->pending.clear();
    this->cv.notify_all();
    this->cv.wait(lock, [&] { return this->inFlight == 0; });
}

auto ActionDispatcher::registerHandler(std::string name, ActionHandler handler) -> void {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    this->handlers.insert_or_assign(std::move(name), std::move(handler));
}

auto ActionDispatcher::unregisterHandler(std::string const& name) -> void {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    this->handlers.erase(name);
}

auto ActionDispatcher::hasHandler(std::string const& name) const -> bool {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    return this->handlers.contains(name);
}

auto ActionDispatcher::setNavigate(NavigateCallback navigate) -> void {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    this->navigate = std::move(navigate);
}

auto ActionDispatcher::setIdGenerator(IdGenerator generator) -> void {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    this->idGenerator = generator ? std::move(generator) : IdGenerator{GenerateUniqueId};
}

auto ActionDispatcher::setFormValidator(FormValidator const* forms) -> void {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    this->forms = forms;
}

auto ActionDispatcher::execute(ActionBinding const& binding) -> Expected<void> {
    return this->execute(binding, Expr::ResolveContext{});
}

auto ActionDispatcher::execute(ActionBinding const& binding, Expr::ResolveContext const& scope) -> Expected<void> {
    if (!this->reserve()) {
        return std::unexpected(Error{Error::Code::Cancelled, "Dispatcher is shutting down"});
    }
    InFlightGuard inFlightGuard{*this};

    auto ctx     = scope;
    ctx.snapshot = this->store_.snapshot();
    auto params  = this->resolver_.resolveActionParams(binding.params, ctx);
    gs_log("Executing action " + binding.action, "Action");

    if (auto builtin = this->runBuiltin(binding.action, params)) {
        return *builtin;
    }

    ActionHandler handler;
    {
        std::lock_guard<std::mutex> lock(this->handlersMutex);
        if (auto it = this->handlers.find(binding.action); it != this->handlers.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        gs_log("No handler registered for action: " + binding.action, "Action", "WARN");
        return {};
    }

    if (binding.confirm) {
        auto decision = this->awaitConfirmation(binding.action, params, *binding.confirm);
        if (!decision) {
            gs_log("Action " + binding.action + " cancelled", "Action", "INFO");
            return decision;
        }
    }

    Expected<void> outcome{};
    {
        LoadingGuard  loadingGuard{*this, binding.action};
        ActionContext actionContext{*this, binding.action, params};
        outcome = handler(params, actionContext);
    }

    if (outcome) {
        if (binding.onSuccess) {
            return this->applySuccess(*binding.onSuccess);
        }
        return {};
    }

    gs_log("Action " + binding.action + " failed: " + describeError(outcome.error()), "Action", "ERROR");
    if (binding.onError) {
        return this->applyError(*binding.onError, outcome.error());
    }
    return outcome;
}

auto ActionDispatcher::executeAll(std::vector<ActionBinding> const& bindings) -> Expected<void> {
    for (auto const& binding : bindings) {
        if (auto result = this->execute(binding); !result) {
            return result;
        }
    }
    return {};
}

auto ActionDispatcher::submit(ActionBinding binding) -> std::future<Expected<void>> {
    // The reservation is taken here, not on the worker, so the destructor
    // waits for tasks that have not started yet.
    if (!this->reserve()) {
        std::promise<Expected<void>> refused;
        refused.set_value(std::unexpected(Error{Error::Code::Cancelled, "Dispatcher is shutting down"}));
        return refused.get_future();
    }
    return std::async(std::launch::async, [this, binding = std::move(binding)]() {
        InFlightGuard reservation{*this};
        return this->execute(binding);
    });
}

auto ActionDispatcher::reserve() -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (this->shuttingDown) {
        return false;
    }
    ++this->inFlight;
    return true;
}

ActionDispatcher::InFlightGuard::~InFlightGuard() {
    std::lock_guard<std::mutex> lock(this->dispatcher.mutex_);
    --this->dispatcher.inFlight;
    this->dispatcher.cv.notify_all();
}

auto ActionDispatcher::awaitConfirmation(std::string const& action, Json const& params, ActionConfirm const& confirm) -> Expected<void> {
    auto state = this->store_.snapshot();
    auto slot  = std::make_shared<PendingSlot>();
    slot->info.action          = action;
    slot->info.params          = params;
    slot->info.confirm         = confirm;
    slot->info.confirm.title   = Expr::InterpolateString(confirm.title, *state);
    slot->info.confirm.message = Expr::InterpolateString(confirm.message, *state);

    std::unique_lock<std::mutex> lock(this->mutex_);
    if (this->shuttingDown) {
        return std::unexpected(Error{Error::Code::Cancelled, "Dispatcher is shutting down"});
    }
    slot->info.id = this->nextConfirmationId++;
    this->pending.push_back(slot);
    this->cv.notify_all();
    gs_log("Action " + action + " awaiting confirmation", "Action");

    this->cv.wait(lock, [&] { return slot->decision.has_value(); });
    if (!*slot->decision) {
        return std::unexpected(Error{Error::Code::Cancelled, "Action cancelled"});
    }
    return {};
}

auto ActionDispatcher::pendingConfirmations() const -> std::vector<PendingConfirmation> {
    std::lock_guard<std::mutex> lock(this->mutex_);
    std::vector<PendingConfirmation> out;
    out.reserve(this->pending.size());
    for (auto const& slot : this->pending) {
        out.push_back(slot->info);
    }
    return out;
}

auto ActionDispatcher::hasPendingConfirmation() const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return !this->pending.empty();
}

auto ActionDispatcher::waitForPendingConfirmation(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(this->mutex_);
    return this->cv.wait_for(lock, timeout, [&] { return !this->pending.empty(); });
}

auto ActionDispatcher::confirm() -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (this->pending.empty()) {
        return false;
    }
    this->pending.front()->decision = true;
    this->pending.pop_front();
    this->cv.notify_all();
    return true;
}

auto ActionDispatcher::cancel() -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (this->pending.empty()) {
        return false;
    }
    this->pending.front()->decision = false;
    this->pending.pop_front();
    this->cv.notify_all();
    return true;
}

auto ActionDispatcher::loadingActions() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(this->mutex_);
    std::vector<std::string> names;
    names.reserve(this->loading.size());
    for (auto const& [name, count] : this->loading) {
        names.push_back(name);
    }
    return names;
}

auto ActionDispatcher::isLoading(std::string const& action) const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->loading.contains(action);
}

auto ActionDispatcher::nextId() -> std::string {
    IdGenerator generator;
    {
        std::lock_guard<std::mutex> lock(this->handlersMutex);
        generator = this->idGenerator;
    }
    return generator();
}

auto ActionDispatcher::resolveDeep(Json const& value) -> Json {
    if (is_id_token(value)) {
        return this->nextId();
    }
    if (value.is_object()) {
        if (value.size() == 1) {
            if (auto it = value.find("$state"); it != value.end() && it->is_string()) {
                return this->store_.get(it->get_ref<std::string const&>()).value_or(Json{});
            }
        }
        Json out = Json::object();
        for (auto const& [key, member] : value.items()) {
            out[key] = this->resolveDeep(member);
        }
        return out;
    }
    if (value.is_array()) {
        Json out = Json::array();
        for (auto const& element : value) {
            out.push_back(this->resolveDeep(element));
        }
        return out;
    }
    return value;
}

auto ActionDispatcher::runBuiltin(std::string const& name, Json const& params) -> std::optional<Expected<void>> {
    if (name == "setState") {
        if (auto path = string_param(params, "statePath")) {
            std::optional<Json> value;
            if (auto it = params.find("value"); it != params.end()) {
                value = *it;
            }
            this->store_.set(*path, std::move(value));
        }
        return Expected<void>{};
    }

    if (name == "pushState") {
        auto path = string_param(params, "statePath");
        if (!path) {
            return Expected<void>{};
        }
        Json value = Json{};
        if (auto it = params.find("value"); it != params.end()) {
            value = this->resolveDeep(*it);
        }
        auto list = array_at(this->store_, *path);
        list.push_back(std::move(value));
        std::vector<StateChange> changes;
        changes.push_back(StateChange{*path, std::move(list)});
        if (auto clear = string_param(params, "clearStatePath"); clear && !clear->empty()) {
            changes.push_back(StateChange{*clear, Json("")});
        }
        this->store_.update(std::move(changes));
        return Expected<void>{};
    }

    if (name == "removeState") {
        auto path  = string_param(params, "statePath");
        auto index = index_param(params);
        if (path && index) {
            auto list = array_at(this->store_, *path);
            if (*index < list.size()) {
                list.erase(*index);
            }
            this->store_.set(*path, std::move(list));
        }
        return Expected<void>{};
    }

    if (name == "push") {
        auto screen = string_param(params, "screen");
        if (screen && !screen->empty()) {
            auto stack   = array_at(this->store_, kNavStackPath);
            auto current = this->store_.get(kCurrentScreenPath);
            stack.push_back(current && current->is_string() ? *current : Json(""));
            std::vector<StateChange> changes;
            changes.push_back(StateChange{kNavStackPath, std::move(stack)});
            changes.push_back(StateChange{kCurrentScreenPath, Json(*screen)});
            this->store_.update(std::move(changes));
        }
        return Expected<void>{};
    }

    if (name == "pop") {
        auto stack = array_at(this->store_, kNavStackPath);
        if (!stack.empty()) {
            Json previous = stack.back();
            stack.erase(stack.size() - 1);
            std::vector<StateChange> changes;
            changes.push_back(StateChange{kNavStackPath, std::move(stack)});
            if (previous.is_string() && !previous.get_ref<std::string const&>().empty()) {
                changes.push_back(StateChange{kCurrentScreenPath, std::move(previous)});
            } else {
                changes.push_back(StateChange{kCurrentScreenPath, std::nullopt});
            }
            this->store_.update(std::move(changes));
        }
        return Expected<void>{};
    }

    if (name == "validateForm") {
        FormValidator const* validator = nullptr;
        {
            std::lock_guard<std::mutex> lock(this->handlersMutex);
            validator = this->forms;
        }
        if (validator == nullptr) {
            gs_log("validateForm dispatched without a form validator", "Action", "WARN");
            return Expected<void>{};
        }
        auto result = validator->validateAll(this->store_.snapshot());
        auto path   = string_param(params, "statePath");
        this->store_.set(path && !path->empty() ? *path : std::string{kFormResultPath}, result.toJson());
        return Expected<void>{};
    }

    return std::nullopt;
}

auto ActionDispatcher::applySuccess(SuccessHandler const& handler) -> Expected<void> {
    if (auto const* navigateTo = std::get_if<NavigateTo>(&handler)) {
        NavigateCallback callback;
        {
            std::lock_guard<std::mutex> lock(this->handlersMutex);
            callback = this->navigate;
        }
        if (callback) {
            callback(navigateTo->screen);
            return {};
        }
        return this->execute(MakeBinding("push", Json{{"screen", navigateTo->screen}}));
    }
    if (auto const* set = std::get_if<SetValues>(&handler)) {
        std::vector<StateChange> changes;
        for (auto const& [path, value] : set->values.items()) {
            changes.push_back(StateChange{path, value});
        }
        this->store_.update(std::move(changes));
        return {};
    }
    return this->execute(MakeBinding(std::get<RunAction>(handler).action));
}

auto ActionDispatcher::applyError(ErrorHandler const& handler, Error const& error) -> Expected<void> {
    if (auto const* set = std::get_if<SetValues>(&handler)) {
        std::vector<StateChange> changes;
        for (auto const& [path, value] : set->values.items()) {
            if (value.is_string() && value.get_ref<std::string const&>() == kErrorMessageToken) {
                changes.push_back(StateChange{path, Json(errorMessage(error))});
            } else {
                changes.push_back(StateChange{path, value});
            }
        }
        this->store_.update(std::move(changes));
        return {};
    }
    return this->execute(MakeBinding(std::get<RunAction>(handler).action));
}

} // namespace GS::Action
