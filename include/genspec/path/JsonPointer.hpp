#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace GS {

using Json = nlohmann::json;

// Both "" and "/" address the whole document.
[[nodiscard]] auto IsRootPointer(std::string_view path) -> bool;

[[nodiscard]] auto FindByPointer(Json const& document, std::string_view path) -> Json const*;
[[nodiscard]] auto GetByPointer(Json const& document, std::string_view path) -> std::optional<Json>;

// Furthest an array write may land past the current end.
inline constexpr std::size_t kMaxArrayPadding = 1024;

/**
 * Writes value at path, creating missing intermediate containers: an array
 * when the following segment is an index, an object otherwise. Scalars found
 * along the way are replaced by containers. "-" appends to an array and array
 * writes past the end pad with null.
 *
 * Returns false when the path cannot address anything (a non-index key into
 * an array) or an index lies more than kMaxArrayPadding past the end of its
 * array; the document is left untouched in that case.
 */
auto SetByPointer(Json& document, std::string_view path, Json value) -> bool;

// Removes the addressed member or array element. Returns false if absent.
auto RemoveByPointer(Json& document, std::string_view path) -> bool;

// Joins an already-encoded relative path onto base with a single slash.
[[nodiscard]] auto JoinPointer(std::string_view base, std::string_view relative) -> std::string;

} // namespace GS
