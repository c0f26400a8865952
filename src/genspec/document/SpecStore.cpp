#include <genspec/document/SpecStore.hpp>
#include <genspec/path/PointerIterator.hpp>

#include "log/TaggedLogger.hpp"

namespace GS::Document {

namespace {

enum class Region {
    Root,
    State,
    Nodes,
    OutOfScope
};

// A patch path split into its region, node id and the pointer within it.
struct SpecAddress {
    Region      region = Region::OutOfScope;
    NodeId      nodeId;
    std::string rest;
};

auto locate(std::string_view path) -> SpecAddress {
    SpecAddress address;
    PointerIterator it{path};
    if (it.isAtEnd()) {
        return address;
    }
    auto head = it.decoded();
    ++it;
    if (head == "root") {
        if (it.isAtEnd()) {
            address.region = Region::Root;
        }
        return address;
    }
    if (head == "state") {
        address.region = Region::State;
        address.rest   = it.remainder();
        return address;
    }
    if (head == "nodes" && !it.isAtEnd()) {
        address.region = Region::Nodes;
        address.nodeId = it.decoded();
        ++it;
        address.rest = it.remainder();
    }
    return address;
}

auto write_value(Spec& spec, std::string_view path, Json value) -> void {
    auto address = locate(path);
    switch (address.region) {
    case Region::Root:
        if (!value.is_string()) {
            gs_log("Ignoring non-string root value", "SpecStore", "WARN");
            return;
        }
        spec.root = value.get<std::string>();
        return;
    case Region::State:
        if (address.rest.empty()) {
            spec.state = std::move(value);
            return;
        }
        if (!spec.state) {
            spec.state = Json::object();
        }
        if (!SetByPointer(*spec.state, address.rest, std::move(value))) {
            gs_log("Ignoring unaddressable state path " + std::string{path}, "SpecStore");
        }
        return;
    case Region::Nodes: {
        if (address.rest.empty()) {
            auto node = NodeFromJson(value);
            if (!node) {
                gs_log("Ignoring node '" + address.nodeId + "': " + describeError(node.error()), "SpecStore", "WARN");
                return;
            }
            spec.nodes.insert_or_assign(address.nodeId, std::make_shared<Node const>(std::move(*node)));
            return;
        }
        auto existing = spec.find(address.nodeId);
        if (!existing) {
            gs_log("Ignoring write into missing node '" + address.nodeId + "'", "SpecStore");
            return;
        }
        auto json = NodeToJson(*existing);
        if (!SetByPointer(json, address.rest, std::move(value))) {
            return;
        }
        auto node = NodeFromJson(json);
        if (node) {
            spec.nodes.insert_or_assign(address.nodeId, std::make_shared<Node const>(std::move(*node)));
        }
        return;
    }
    case Region::OutOfScope:
        gs_log("Ignoring patch outside the document: " + std::string{path}, "SpecStore");
        return;
    }
}

auto remove_value(Spec& spec, std::string_view path) -> void {
    auto address = locate(path);
    switch (address.region) {
    case Region::Root:
        spec.root.clear();
        return;
    case Region::State:
        if (address.rest.empty()) {
            spec.state.reset();
        } else if (spec.state) {
            RemoveByPointer(*spec.state, address.rest);
        }
        return;
    case Region::Nodes: {
        if (address.rest.empty()) {
            spec.nodes.erase(address.nodeId);
            return;
        }
        auto existing = spec.find(address.nodeId);
        if (!existing) {
            return;
        }
        auto json = NodeToJson(*existing);
        if (!RemoveByPointer(json, address.rest)) {
            return;
        }
        if (auto node = NodeFromJson(json)) {
            spec.nodes.insert_or_assign(address.nodeId, std::make_shared<Node const>(std::move(*node)));
        }
        return;
    }
    case Region::OutOfScope:
        gs_log("Ignoring remove outside the document: " + std::string{path}, "SpecStore");
        return;
    }
}

} // namespace

auto ReadSpecValue(Spec const& spec, std::string_view path) -> std::optional<Json> {
    auto address = locate(path);
    switch (address.region) {
    case Region::Root:
        if (spec.root.empty()) {
            return std::nullopt;
        }
        return Json(spec.root);
    case Region::State:
        if (!spec.state) {
            return std::nullopt;
        }
        return GetByPointer(*spec.state, address.rest);
    case Region::Nodes: {
        auto node = spec.find(address.nodeId);
        if (!node) {
            return std::nullopt;
        }
        return GetByPointer(NodeToJson(*node), address.rest);
    }
    case Region::OutOfScope:
        return std::nullopt;
    }
    return std::nullopt;
}

auto ApplyPatch(Spec const& spec, Patch const& patch) -> Spec {
    gs_log("Patch " + std::string{patchOpName(patch.op)} + " " + patch.path, "SpecStore", "Patch");
    Spec next = spec;
    switch (patch.op) {
    case PatchOp::Add:
    case PatchOp::Replace:
        if (patch.value) {
            write_value(next, patch.path, *patch.value);
        }
        break;
    case PatchOp::Remove:
        remove_value(next, patch.path);
        break;
    case PatchOp::Move:
    case PatchOp::Copy: {
        if (!patch.from) {
            break;
        }
        auto value = ReadSpecValue(next, *patch.from);
        if (!value) {
            gs_log("Ignoring " + std::string{patchOpName(patch.op)} + " from unresolved path " + *patch.from, "SpecStore");
            break;
        }
        if (patch.op == PatchOp::Move) {
            remove_value(next, *patch.from);
        }
        write_value(next, patch.path, std::move(*value));
        break;
    }
    case PatchOp::Test:
        break;
    }
    return next;
}

auto ApplyPatches(Spec const& spec, std::vector<Patch> const& patches) -> Spec {
    Spec next = spec;
    for (auto const& patch : patches) {
        next = ApplyPatch(next, patch);
    }
    return next;
}

SpecStore::SpecStore(Spec initial)
    : current(std::move(initial)) {}

auto SpecStore::apply(Patch const& patch) -> Spec {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->current = ApplyPatch(this->current, patch);
    ++this->revision_;
    return this->current;
}

auto SpecStore::applyAll(std::vector<Patch> const& patches) -> Spec {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->current = ApplyPatches(this->current, patches);
    ++this->revision_;
    return this->current;
}

auto SpecStore::replace(Spec spec) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->current = std::move(spec);
    ++this->revision_;
}

auto SpecStore::reset() -> void {
    this->replace(Spec{});
}

auto SpecStore::snapshot() const -> Spec {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->current;
}

auto SpecStore::revision() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->revision_;
}

} // namespace GS::Document
