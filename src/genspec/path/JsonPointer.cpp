#include <genspec/path/JsonPointer.hpp>
#include <genspec/path/PointerIterator.hpp>

#include "log/TaggedLogger.hpp"

#include <vector>

namespace GS {

namespace {

auto collect_segments(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    for (PointerIterator it{path}; !it.isAtEnd(); ++it) {
        segments.push_back(it.decoded());
    }
    return segments;
}

auto wants_array(std::string const& segment) -> bool {
    return segment == "-" || parse_array_index(segment).has_value();
}

// Resolves the slot for segment inside container, creating it when missing.
auto step_into(Json& container, std::string const& segment) -> Json* {
    if (container.is_object()) {
        return &container[segment];
    }
    if (container.is_array()) {
        if (segment == "-") {
            container.push_back(nullptr);
            return &container.back();
        }
        auto index = parse_array_index(segment);
        if (!index || *index > container.size() + kMaxArrayPadding) {
            return nullptr;
        }
        while (container.size() <= *index) {
            container.push_back(nullptr);
        }
        return &container[*index];
    }
    return nullptr;
}

} // namespace

auto IsRootPointer(std::string_view path) -> bool {
    return PointerIterator{path}.isAtEnd();
}

auto FindByPointer(Json const& document, std::string_view path) -> Json const* {
    Json const* current = &document;
    for (PointerIterator it{path}; !it.isAtEnd(); ++it) {
        auto segment = it.decoded();
        if (current->is_object()) {
            auto found = current->find(segment);
            if (found == current->end()) {
                return nullptr;
            }
            current = &*found;
        } else if (current->is_array()) {
            auto index = parse_array_index(segment);
            if (!index || *index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[*index];
        } else {
            return nullptr;
        }
    }
    return current;
}

auto GetByPointer(Json const& document, std::string_view path) -> std::optional<Json> {
    if (auto const* found = FindByPointer(document, path)) {
        return *found;
    }
    return std::nullopt;
}

auto SetByPointer(Json& document, std::string_view path, Json value) -> bool {
    auto segments = collect_segments(path);
    if (segments.empty()) {
        document = std::move(value);
        return true;
    }

    if (!document.is_object() && !document.is_array()) {
        document = wants_array(segments.front()) ? Json::array() : Json::object();
    }
    if (document.is_array() && !wants_array(segments.front())) {
        return false;
    }

    // Validate the walk first so a rejected path never leaves padding behind.
    // Containers that do not exist yet count as empty.
    {
        Json const* cursor = &document;
        for (std::size_t i = 0; i < segments.size(); ++i) {
            bool const inArray = cursor != nullptr ? cursor->is_array() : wants_array(segments[i]);
            if (inArray) {
                if (!wants_array(segments[i])) {
                    return false;
                }
                auto const size  = cursor != nullptr ? cursor->size() : std::size_t{0};
                auto const index = parse_array_index(segments[i]);
                if (index && *index > size + kMaxArrayPadding) {
                    gs_log("Rejected write to " + std::string{path} + ": index too far past the end", "Pointer", "WARN");
                    return false;
                }
            }
            Json const* next = nullptr;
            if (cursor != nullptr && cursor->is_object()) {
                auto found = cursor->find(segments[i]);
                if (found != cursor->end()) {
                    next = &*found;
                }
            } else if (cursor != nullptr && cursor->is_array()) {
                auto index = parse_array_index(segments[i]);
                if (index && *index < cursor->size()) {
                    next = &(*cursor)[*index];
                }
            }
            cursor = (next != nullptr && (next->is_object() || next->is_array())) ? next : nullptr;
        }
    }

    Json* current = &document;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        Json* slot = step_into(*current, segments[i]);
        if (slot == nullptr) {
            return false;
        }
        if (!slot->is_object() && !slot->is_array()) {
            *slot = wants_array(segments[i + 1]) ? Json::array() : Json::object();
        }
        current = slot;
    }

    Json* target = step_into(*current, segments.back());
    if (target == nullptr) {
        return false;
    }
    *target = std::move(value);
    return true;
}

auto RemoveByPointer(Json& document, std::string_view path) -> bool {
    auto segments = collect_segments(path);
    if (segments.empty()) {
        return false;
    }

    Json* current = &document;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        auto const& segment = segments[i];
        if (current->is_object()) {
            auto found = current->find(segment);
            if (found == current->end()) {
                return false;
            }
            current = &*found;
        } else if (current->is_array()) {
            auto index = parse_array_index(segment);
            if (!index || *index >= current->size()) {
                return false;
            }
            current = &(*current)[*index];
        } else {
            return false;
        }
    }

    auto const& last = segments.back();
    if (current->is_object()) {
        return current->erase(last) > 0;
    }
    if (current->is_array()) {
        auto index = parse_array_index(last);
        if (!index || *index >= current->size()) {
            return false;
        }
        current->erase(*index);
        return true;
    }
    return false;
}

auto JoinPointer(std::string_view base, std::string_view relative) -> std::string {
    std::string joined{base};
    while (!joined.empty() && joined.back() == '/') {
        joined.pop_back();
    }
    while (!relative.empty() && relative.front() == '/') {
        relative.remove_prefix(1);
    }
    if (relative.empty()) {
        return joined.empty() ? std::string{"/"} : joined;
    }
    joined.push_back('/');
    joined.append(relative);
    return joined;
}

} // namespace GS
