#pragma once
#include <genspec/core/Error.hpp>
#include <genspec/path/JsonPointer.hpp>

#include <parallel_hashmap/phmap.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace GS::Document {

using NodeId = std::string;

struct Repeat {
    std::string                statePath;
    std::optional<std::string> key;

    auto operator==(Repeat const&) const -> bool = default;
};

/**
 * One element of a generated interface. `visible` holds a condition, `on`
 * maps event names to action bindings and `watch` maps state paths to
 * bindings fired on change. They are kept as JSON because their contents are
 * only interpreted when evaluated.
 */
struct Node {
    std::string           type;
    Json                  props = Json::object();
    std::vector<NodeId>   children;
    std::optional<Json>   visible;
    std::optional<Json>   on;
    std::optional<Json>   watch;
    std::optional<Repeat> repeat;

    auto operator==(Node const&) const -> bool = default;
};

using NodePtr = std::shared_ptr<Node const>;
using NodeMap = phmap::flat_hash_map<NodeId, NodePtr>;

/**
 * The generated document: a root id plus an arena of nodes keyed by id.
 * Nodes are shared between copies; edits replace the affected node pointer
 * rather than touching the node, so an older Spec value never changes.
 */
struct Spec {
    NodeId              root;
    NodeMap             nodes;
    std::optional<Json> state;

    [[nodiscard]] auto find(NodeId const& id) const -> NodePtr;
    [[nodiscard]] auto contains(NodeId const& id) const -> bool;
    [[nodiscard]] auto empty() const -> bool;
};

[[nodiscard]] auto NodeToJson(Node const& node) -> Json;
// Unknown fields are dropped; missing ones take their defaults.
[[nodiscard]] auto NodeFromJson(Json const& json) -> Expected<Node>;

// Nodes are emitted in id order so the output is stable.
[[nodiscard]] auto SpecToJson(Spec const& spec) -> Json;
[[nodiscard]] auto SpecFromJson(Json const& json) -> Expected<Spec>;

[[nodiscard]] auto SortedNodeIds(Spec const& spec) -> std::vector<NodeId>;
// Structural comparison; shared and separately allocated nodes compare alike.
[[nodiscard]] auto SpecEquals(Spec const& lhs, Spec const& rhs) -> bool;

} // namespace GS::Document
