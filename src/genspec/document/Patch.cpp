#include <genspec/document/Patch.hpp>

namespace GS::Document {

namespace {

[[nodiscard]] auto malformed(std::string_view field, std::string_view detail) -> Error {
    std::string message{field};
    message.append(": ");
    message.append(detail);
    return Error{Error::Code::MalformedInput, std::move(message)};
}

} // namespace

auto patchOpName(PatchOp op) -> std::string_view {
    switch (op) {
    case PatchOp::Add:
        return "add";
    case PatchOp::Remove:
        return "remove";
    case PatchOp::Replace:
        return "replace";
    case PatchOp::Move:
        return "move";
    case PatchOp::Copy:
        return "copy";
    case PatchOp::Test:
        return "test";
    }
    return "add";
}

auto parsePatchOp(std::string_view name) -> std::optional<PatchOp> {
    if (name == "add" || name == "set")
        return PatchOp::Add;
    if (name == "remove")
        return PatchOp::Remove;
    if (name == "replace")
        return PatchOp::Replace;
    if (name == "move")
        return PatchOp::Move;
    if (name == "copy")
        return PatchOp::Copy;
    if (name == "test")
        return PatchOp::Test;
    return std::nullopt;
}

auto ParsePatch(Json const& json) -> Expected<Patch> {
    if (!json.is_object()) {
        return std::unexpected(malformed("patch", "must be an object"));
    }

    auto op = json.find("op");
    if (op == json.end() || !op->is_string()) {
        return std::unexpected(malformed("op", "must be a string"));
    }
    auto kind = parsePatchOp(op->get_ref<std::string const&>());
    if (!kind) {
        return std::unexpected(malformed("op", "unknown operation '" + op->get<std::string>() + "'"));
    }

    auto path = json.find("path");
    if (path == json.end() || !path->is_string()) {
        return std::unexpected(malformed("path", "must be a string"));
    }

    Patch patch;
    patch.op   = *kind;
    patch.path = path->get<std::string>();

    if (auto value = json.find("value"); value != json.end()) {
        patch.value = *value;
    }
    if (auto from = json.find("from"); from != json.end() && from->is_string()) {
        patch.from = from->get<std::string>();
    }

    switch (patch.op) {
    case PatchOp::Add:
    case PatchOp::Replace:
    case PatchOp::Test:
        if (!patch.value) {
            return std::unexpected(malformed("value", "is required"));
        }
        break;
    case PatchOp::Move:
    case PatchOp::Copy:
        if (!patch.from) {
            return std::unexpected(malformed("from", "is required"));
        }
        break;
    case PatchOp::Remove:
        break;
    }
    return patch;
}

auto PatchToJson(Patch const& patch) -> Json {
    Json json    = Json::object();
    json["op"]   = std::string{patchOpName(patch.op)};
    json["path"] = patch.path;
    if (patch.value) {
        json["value"] = *patch.value;
    }
    if (patch.from) {
        json["from"] = *patch.from;
    }
    return json;
}

} // namespace GS::Document
