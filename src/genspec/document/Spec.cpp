#include <genspec/document/Spec.hpp>

#include <algorithm>

namespace GS::Document {

namespace {

[[nodiscard]] auto make_error(std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    message.append(": ");
    message.append(detail);
    return Error{Error::Code::MalformedInput, std::move(message)};
}

[[nodiscard]] auto read_optional_member(Json const& json, char const* key) -> std::optional<Json> {
    if (auto it = json.find(key); it != json.end()) {
        return *it;
    }
    return std::nullopt;
}

[[nodiscard]] auto read_repeat(Json const& json) -> std::optional<Repeat> {
    auto it = json.find("repeat");
    if (it == json.end() || !it->is_object()) {
        return std::nullopt;
    }
    Repeat repeat;
    if (auto path = it->find("statePath"); path != it->end() && path->is_string()) {
        repeat.statePath = path->get<std::string>();
    }
    if (auto key = it->find("key"); key != it->end() && key->is_string()) {
        repeat.key = key->get<std::string>();
    }
    return repeat;
}

} // namespace

auto Spec::find(NodeId const& id) const -> NodePtr {
    auto it = this->nodes.find(id);
    return it == this->nodes.end() ? nullptr : it->second;
}

auto Spec::contains(NodeId const& id) const -> bool {
    return this->nodes.contains(id);
}

auto Spec::empty() const -> bool {
    return this->root.empty() && this->nodes.empty() && !this->state;
}

auto NodeToJson(Node const& node) -> Json {
    Json json = Json::object();
    json["type"]     = node.type;
    json["props"]    = node.props.is_object() ? node.props : Json::object();
    json["children"] = node.children;
    if (node.visible) {
        json["visible"] = *node.visible;
    }
    if (node.on) {
        json["on"] = *node.on;
    }
    if (node.watch) {
        json["watch"] = *node.watch;
    }
    if (node.repeat) {
        Json repeat         = Json::object();
        repeat["statePath"] = node.repeat->statePath;
        if (node.repeat->key) {
            repeat["key"] = *node.repeat->key;
        }
        json["repeat"] = std::move(repeat);
    }
    return json;
}

auto NodeFromJson(Json const& json) -> Expected<Node> {
    if (!json.is_object()) {
        return std::unexpected(make_error("node", "must be an object"));
    }

    Node node;
    if (auto it = json.find("type"); it != json.end() && it->is_string()) {
        node.type = it->get<std::string>();
    }
    if (auto it = json.find("props"); it != json.end() && it->is_object()) {
        node.props = *it;
    }
    if (auto it = json.find("children"); it != json.end() && it->is_array()) {
        for (auto const& child : *it) {
            if (child.is_string()) {
                node.children.push_back(child.get<std::string>());
            }
        }
    }
    node.visible = read_optional_member(json, "visible");
    node.on      = read_optional_member(json, "on");
    node.watch   = read_optional_member(json, "watch");
    node.repeat  = read_repeat(json);
    return node;
}

auto SpecToJson(Spec const& spec) -> Json {
    Json nodes = Json::object();
    for (auto const& id : SortedNodeIds(spec)) {
        nodes[id] = NodeToJson(*spec.nodes.at(id));
    }
    Json json     = Json::object();
    json["root"]  = spec.root;
    json["nodes"] = std::move(nodes);
    if (spec.state) {
        json["state"] = *spec.state;
    }
    return json;
}

auto SpecFromJson(Json const& json) -> Expected<Spec> {
    if (!json.is_object()) {
        return std::unexpected(make_error("spec", "must be an object"));
    }

    Spec spec;
    if (auto it = json.find("root"); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error("root", "must be a string"));
        }
        spec.root = it->get<std::string>();
    }
    if (auto it = json.find("nodes"); it != json.end()) {
        if (!it->is_object()) {
            return std::unexpected(make_error("nodes", "must be an object"));
        }
        for (auto const& [id, value] : it->items()) {
            auto node = NodeFromJson(value);
            if (!node) {
                return std::unexpected(make_error("nodes/" + id, errorMessage(node.error())));
            }
            spec.nodes.emplace(id, std::make_shared<Node const>(std::move(*node)));
        }
    }
    if (auto it = json.find("state"); it != json.end() && !it->is_null()) {
        spec.state = *it;
    }
    return spec;
}

auto SortedNodeIds(Spec const& spec) -> std::vector<NodeId> {
    std::vector<NodeId> ids;
    ids.reserve(spec.nodes.size());
    for (auto const& [id, node] : spec.nodes) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

auto SpecEquals(Spec const& lhs, Spec const& rhs) -> bool {
    if (lhs.root != rhs.root || lhs.state != rhs.state || lhs.nodes.size() != rhs.nodes.size()) {
        return false;
    }
    for (auto const& [id, node] : lhs.nodes) {
        auto other = rhs.find(id);
        if (!other || !(*other == *node)) {
            return false;
        }
    }
    return true;
}

} // namespace GS::Document
