#pragma once
#include <genspec/document/Patch.hpp>
#include <genspec/document/Spec.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace GS::Document {

/**
 * Applies one patch and returns the edited copy; `spec` is left untouched.
 *
 * Addressable paths:
 *   /root                 the root node id (a string)
 *   /state, /state/...    the embedded state document
 *   /nodes/<id>           a whole node
 *   /nodes/<id>/...       a field inside a node
 *
 * Anything else is ignored, as are writes into a node that does not exist
 * and move/copy whose source does not resolve. Generated input never makes
 * this fail.
 */
[[nodiscard]] auto ApplyPatch(Spec const& spec, Patch const& patch) -> Spec;
[[nodiscard]] auto ApplyPatches(Spec const& spec, std::vector<Patch> const& patches) -> Spec;

// Reads a value using the same path scheme as ApplyPatch.
[[nodiscard]] auto ReadSpecValue(Spec const& spec, std::string_view path) -> std::optional<Json>;

// Thread-safe holder of the current document.
class SpecStore {
public:
    SpecStore() = default;
    explicit SpecStore(Spec initial);

    auto apply(Patch const& patch) -> Spec;
    auto applyAll(std::vector<Patch> const& patches) -> Spec;
    auto replace(Spec spec) -> void;
    auto reset() -> void;

    [[nodiscard]] auto snapshot() const -> Spec;
    // Bumped on every apply, replace and reset.
    [[nodiscard]] auto revision() const -> std::uint64_t;

private:
    mutable std::mutex mutex_;
    Spec               current;
    std::uint64_t      revision_ = 0;
};

} // namespace GS::Document
