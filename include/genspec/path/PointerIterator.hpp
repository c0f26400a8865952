#pragma once
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace GS {

/**
 * PointerIterator walks the segments of a slash-delimited pointer path
 * ("/customers/0/name"). A leading slash is optional and repeated slashes are
 * collapsed, so "" and "/" both address the document root.
 *
 * operator* yields the raw segment; decoded() applies the JSON pointer
 * escapes ("~1" -> "/", "~0" -> "~").
 */
class PointerIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = std::string_view;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;
    using IteratorType      = std::string_view::const_iterator;

    explicit PointerIterator(char const* const path) noexcept;
    explicit PointerIterator(std::string_view path) noexcept;

    [[nodiscard]] auto operator*() const noexcept -> value_type;
    [[nodiscard]] auto operator->() const noexcept -> pointer;
    auto               operator++() noexcept -> PointerIterator&;
    auto               operator++(int) noexcept -> PointerIterator;
    [[nodiscard]] auto operator==(const PointerIterator& other) const noexcept -> bool;

    [[nodiscard]] auto isAtStart() const noexcept -> bool;
    [[nodiscard]] auto isAtFinalComponent() const noexcept -> bool;
    [[nodiscard]] auto isAtEnd() const noexcept -> bool;
    [[nodiscard]] auto toStringView() const noexcept -> std::string_view;
    [[nodiscard]] auto currentComponent() const noexcept -> std::string_view;
    [[nodiscard]] auto decoded() const -> std::string;
    [[nodiscard]] auto next() const noexcept -> PointerIterator;
    // Remaining path from the current segment on, including a leading slash.
    [[nodiscard]] auto remainder() const -> std::string;

private:
    void findNextComponent() noexcept;

    std::string_view path;
    std::string_view current_segment;
    IteratorType     current;
    IteratorType     segment_end;
};

[[nodiscard]] auto decode_pointer_segment(std::string_view segment) -> std::string;
[[nodiscard]] auto encode_pointer_segment(std::string_view segment) -> std::string;
// Parses a canonical array index: digits only, no leading zeros except "0".
[[nodiscard]] auto parse_array_index(std::string_view segment) -> std::optional<std::size_t>;

} // namespace GS
