#pragma once
#include <genspec/path/JsonPointer.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GS {

// A write at a pointer path. A disengaged value removes the entry.
struct StateChange {
    std::string         path;
    std::optional<Json> value;
};

using StateSnapshot = std::shared_ptr<Json const>;

/**
 * StateStore holds the mutable state document that expressions read and
 * actions write.
 *
 * Writes build a new document and swap it in under the store mutex, so a
 * snapshot obtained from snapshot() never changes underneath its holder.
 * Listeners run on the writing thread after the swap, outside the store lock,
 * and may write back into the store.
 *
 * Writes that leave the addressed value unchanged are dropped and notify no
 * one.
 */
class StateStore {
public:
    using Listener = std::function<void(std::vector<StateChange> const& changes, StateSnapshot const& snapshot)>;

private:
    struct ListenerRegistry {
        std::mutex                        mutex_;
        std::map<std::uint64_t, Listener> listeners;
        std::uint64_t                     nextId = 1;
    };

public:
    class Subscription {
    public:
        Subscription() = default;
        Subscription(std::weak_ptr<ListenerRegistry> registry, std::uint64_t id) noexcept
            : registry_(std::move(registry)), id_(id) {}
        Subscription(Subscription&& other) noexcept
            : registry_(std::move(other.registry_)), id_(other.id_) {
            other.id_ = 0;
        }
        auto operator=(Subscription&& other) noexcept -> Subscription& {
            if (this != &other) {
                this->reset();
                this->registry_ = std::move(other.registry_);
                this->id_       = other.id_;
                other.id_       = 0;
            }
            return *this;
        }
        Subscription(Subscription const&)            = delete;
        Subscription& operator=(Subscription const&) = delete;
        ~Subscription() { this->reset(); }

        void reset();
        [[nodiscard]] auto active() const -> bool;

    private:
        std::weak_ptr<ListenerRegistry> registry_;
        std::uint64_t                   id_ = 0;
    };

    explicit StateStore(Json initial = Json::object());

    StateStore(StateStore const&)            = delete;
    StateStore& operator=(StateStore const&) = delete;

    [[nodiscard]] auto get(std::string_view path) const -> std::optional<Json>;
    // Returns true when the document changed.
    auto set(std::string_view path, std::optional<Json> value) -> bool;
    // Applies every change in order and notifies once with the effective ones.
    auto update(std::vector<StateChange> changes) -> bool;
    [[nodiscard]] auto snapshot() const -> StateSnapshot;

    [[nodiscard]] auto subscribe(Listener listener) -> Subscription;
    [[nodiscard]] auto listenerCount() const -> std::size_t;

private:
    auto notify(std::vector<StateChange> const& applied, StateSnapshot const& snapshot) -> void;

    mutable std::mutex                mutex_;
    StateSnapshot                     current_;
    std::shared_ptr<ListenerRegistry> registry_;
};

/**
 * Flattens nested objects into leaf pointer writes:
 * {"user": {"name": "Ada"}, "count": 1} -> [/user/name = "Ada", /count = 1].
 * Arrays are leaves.
 */
[[nodiscard]] auto FlattenToPointers(Json const& value, std::string_view prefix = "") -> std::vector<StateChange>;

} // namespace GS
