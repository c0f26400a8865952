#include <genspec/state/StateStore.hpp>
#include <genspec/path/PointerIterator.hpp>

#include "log/TaggedLogger.hpp"

namespace GS {

namespace {

// Applies change to document; false when it would not alter anything.
auto apply_change(Json& document, StateChange const& change) -> bool {
    if (IsRootPointer(change.path)) {
        Json replacement = change.value.value_or(Json::object());
        if (document == replacement) {
            return false;
        }
        document = std::move(replacement);
        return true;
    }

    auto const* existing = FindByPointer(document, change.path);
    if (!change.value) {
        if (existing == nullptr) {
            return false;
        }
        return RemoveByPointer(document, change.path);
    }
    if (existing != nullptr && *existing == *change.value) {
        return false;
    }
    if (!SetByPointer(document, change.path, *change.value)) {
        gs_log("StateStore ignored write to unaddressable path " + change.path, "StateStore", "WARN");
        return false;
    }
    return true;
}

} // namespace

void StateStore::Subscription::reset() {
    if (this->id_ == 0) {
        return;
    }
    if (auto registry = this->registry_.lock()) {
        std::lock_guard<std::mutex> lock(registry->mutex_);
        registry->listeners.erase(this->id_);
    }
    this->registry_.reset();
    this->id_ = 0;
}

auto StateStore::Subscription::active() const -> bool {
    return this->id_ != 0 && !this->registry_.expired();
}

StateStore::StateStore(Json initial)
    : current_(std::make_shared<Json const>(initial.is_null() ? Json::object() : std::move(initial)))
    , registry_(std::make_shared<ListenerRegistry>()) {}

auto StateStore::get(std::string_view path) const -> std::optional<Json> {
    return GetByPointer(*this->snapshot(), path);
}

auto StateStore::set(std::string_view path, std::optional<Json> value) -> bool {
    std::vector<StateChange> changes;
    changes.push_back(StateChange{std::string{path}, std::move(value)});
    return this->update(std::move(changes));
}

auto StateStore::update(std::vector<StateChange> changes) -> bool {
    std::vector<StateChange> applied;
    StateSnapshot            published;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        Json next = *this->current_;
        for (auto& change : changes) {
            if (apply_change(next, change)) {
                applied.push_back(std::move(change));
            }
        }
        if (applied.empty()) {
            return false;
        }
        published      = std::make_shared<Json const>(std::move(next));
        this->current_ = published;
    }
    gs_log("StateStore applied " + std::to_string(applied.size()) + " change(s)", "StateStore");
    this->notify(applied, published);
    return true;
}

auto StateStore::snapshot() const -> StateSnapshot {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->current_;
}

auto StateStore::subscribe(Listener listener) -> Subscription {
    std::lock_guard<std::mutex> lock(this->registry_->mutex_);
    auto id = this->registry_->nextId++;
    this->registry_->listeners.emplace(id, std::move(listener));
    return Subscription{this->registry_, id};
}

auto StateStore::listenerCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->registry_->mutex_);
    return this->registry_->listeners.size();
}

auto StateStore::notify(std::vector<StateChange> const& applied, StateSnapshot const& snapshot) -> void {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(this->registry_->mutex_);
        listeners.reserve(this->registry_->listeners.size());
        for (auto const& [id, listener] : this->registry_->listeners) {
            listeners.push_back(listener);
        }
    }
    for (auto const& listener : listeners) {
        listener(applied, snapshot);
    }
}

auto FlattenToPointers(Json const& value, std::string_view prefix) -> std::vector<StateChange> {
    std::vector<StateChange> result;
    if (!value.is_object()) {
        if (!prefix.empty()) {
            result.push_back(StateChange{std::string{prefix}, value});
        }
        return result;
    }
    for (auto const& [key, member] : value.items()) {
        std::string pointer{prefix};
        pointer.push_back('/');
        pointer.append(encode_pointer_segment(key));
        if (member.is_object()) {
            auto nested = FlattenToPointers(member, pointer);
            result.insert(result.end(), std::make_move_iterator(nested.begin()), std::make_move_iterator(nested.end()));
        } else {
            result.push_back(StateChange{std::move(pointer), member});
        }
    }
    return result;
}

} // namespace GS
