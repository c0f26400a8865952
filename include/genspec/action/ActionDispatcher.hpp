#pragma once
#include <genspec/action/ActionBinding.hpp>
#include <genspec/action/FormValidation.hpp>
#include <genspec/core/Error.hpp>
#include <genspec/expr/ExpressionResolver.hpp>
#include <genspec/state/StateStore.hpp>

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace GS::Action {

class ActionDispatcher;

/**
 * What a handler sees while it runs: its resolved params, the state store
 * and a way to trigger further actions by name. Chained actions go through
 * the full dispatch path, so they may themselves wait for confirmation.
 */
class ActionContext {
public:
    ActionContext(ActionDispatcher& dispatcher, std::string action, Json params);

    auto executeAction(std::string const& name) -> Expected<void>;
    auto execute(ActionBinding const& binding) -> Expected<void>;

    [[nodiscard]] auto store() -> StateStore&;
    [[nodiscard]] auto params() const -> Json const& { return this->params_; }
    [[nodiscard]] auto action() const -> std::string const& { return this->action_; }

private:
    ActionDispatcher& dispatcher;
    std::string       action_;
    Json              params_;
};

using ActionHandler    = std::function<Expected<void>(Json const& params, ActionContext& ctx)>;
using NavigateCallback = std::function<void(std::string const& screen)>;
using IdGenerator      = std::function<std::string()>;

// A gated action waiting for confirm() or cancel(). Title and message are
// already interpolated against state.
struct PendingConfirmation {
    std::uint64_t id = 0;
    std::string   action;
    Json          params;
    ActionConfirm confirm;
};

/**
 * Routes action bindings to built-ins or registered handlers.
 *
 * Built-ins (setState, pushState, removeState, push, pop, validateForm) act
 * on the state store directly; they are never gated or tracked as loading.
 * Any other name is looked up in the handler map; unknown names log a
 * warning and succeed.
 *
 * A binding with `confirm` set blocks the calling thread until confirm() or
 * cancel() is called from elsewhere. Pending confirmations are answered in
 * the order they were raised. cancel() fails the action with
 * Error::Code::Cancelled.
 */
class ActionDispatcher {
public:
    ActionDispatcher(StateStore& store, Expr::ExpressionResolver const& resolver, FormValidator const* forms = nullptr);
    ~ActionDispatcher();

    ActionDispatcher(ActionDispatcher const&)            = delete;
    ActionDispatcher& operator=(ActionDispatcher const&) = delete;

    auto registerHandler(std::string name, ActionHandler handler) -> void;
    auto unregisterHandler(std::string const& name) -> void;
    [[nodiscard]] auto hasHandler(std::string const& name) const -> bool;

    auto setNavigate(NavigateCallback navigate) -> void;
    auto setIdGenerator(IdGenerator generator) -> void;
    auto setFormValidator(FormValidator const* forms) -> void;

    auto execute(ActionBinding const& binding) -> Expected<void>;
    // Resolves params inside a repeat scope; the scope's snapshot is ignored
    // in favour of the live state.
    auto execute(ActionBinding const& binding, Expr::ResolveContext const& scope) -> Expected<void>;
    // Runs in order and stops at the first failure.
    auto executeAll(std::vector<ActionBinding> const& bindings) -> Expected<void>;
    // execute() on a worker thread.
    [[nodiscard]] auto submit(ActionBinding binding) -> std::future<Expected<void>>;

    [[nodiscard]] auto pendingConfirmations() const -> std::vector<PendingConfirmation>;
    [[nodiscard]] auto hasPendingConfirmation() const -> bool;
    // Blocks until at least one confirmation is pending or the timeout passes.
    auto waitForPendingConfirmation(std::chrono::milliseconds timeout) const -> bool;
    // Resolve the oldest pending confirmation. False when none is pending.
    auto confirm() -> bool;
    auto cancel() -> bool;

    [[nodiscard]] auto loadingActions() const -> std::vector<std::string>;
    [[nodiscard]] auto isLoading(std::string const& action) const -> bool;

    [[nodiscard]] auto store() -> StateStore& { return this->store_; }
    [[nodiscard]] auto resolver() const -> Expr::ExpressionResolver const& { return this->resolver_; }

private:
    struct PendingSlot {
        PendingConfirmation info;
        std::optional<bool> decision;
    };

    class LoadingGuard {
    public:
        LoadingGuard(ActionDispatcher& dispatcher, std::string action);
        ~LoadingGuard();
        LoadingGuard(LoadingGuard const&)            = delete;
        LoadingGuard& operator=(LoadingGuard const&) = delete;

    private:
        ActionDispatcher& dispatcher;
        std::string       action;
    };

    // Releases a slot taken by reserve(); the destructor waits for all slots.
    struct InFlightGuard {
        ActionDispatcher& dispatcher;
        ~InFlightGuard();
    };

    auto reserve() -> bool;
    auto runBuiltin(std::string const& name, Json const& params) -> std::optional<Expected<void>>;
    auto awaitConfirmation(std::string const& action, Json const& params, ActionConfirm const& confirm) -> Expected<void>;
    auto applySuccess(SuccessHandler const& handler) -> Expected<void>;
    auto applyError(ErrorHandler const& handler, Error const& error) -> Expected<void>;
    auto resolveDeep(Json const& value) -> Json;
    auto nextId() -> std::string;

    StateStore&                     store_;
    Expr::ExpressionResolver const& resolver_;

    mutable std::mutex                                      handlersMutex;
    phmap::flat_hash_map<std::string, ActionHandler>        handlers;
    NavigateCallback                                        navigate;
    IdGenerator                                             idGenerator;
    FormValidator const*                                    forms = nullptr;

    mutable std::mutex                                   mutex_;
    mutable std::condition_variable                      cv;
    std::deque<std::shared_ptr<PendingSlot>>             pending;
    phmap::flat_hash_map<std::string, std::size_t>       loading;
    std::uint64_t                                        nextConfirmationId = 1;
    std::size_t                                          inFlight           = 0;
    bool                                                 shuttingDown       = false;
};

// Default id source for "$id" tokens: random RFC 4122 version 4 UUIDs.
[[nodiscard]] auto GenerateUniqueId() -> std::string;

} // namespace GS::Action
