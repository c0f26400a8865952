#pragma once
#include <genspec/core/Error.hpp>
#include <genspec/path/JsonPointer.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace GS::Document {

enum class PatchOp {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test
};

struct Patch {
    PatchOp                    op = PatchOp::Add;
    std::string                path;
    std::optional<Json>        value;
    std::optional<std::string> from;
};

[[nodiscard]] auto patchOpName(PatchOp op) -> std::string_view;
// "set" is accepted as a synonym for "add".
[[nodiscard]] auto parsePatchOp(std::string_view name) -> std::optional<PatchOp>;

/**
 * Reads a patch object: {"op", "path", "value"?, "from"?}.
 * add, replace and test need a value; move and copy need a string "from".
 */
[[nodiscard]] auto ParsePatch(Json const& json) -> Expected<Patch>;
[[nodiscard]] auto PatchToJson(Patch const& patch) -> Json;

} // namespace GS::Document
