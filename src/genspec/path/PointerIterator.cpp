#include <genspec/path/PointerIterator.hpp>

#include <charconv>

namespace GS {

PointerIterator::PointerIterator(std::string_view path) noexcept
    : path{path}, current{path.begin()}, segment_end{path.begin()} {
    findNextComponent();
}

PointerIterator::PointerIterator(char const* const path) noexcept
    : PointerIterator{std::string_view{path}} {}

void PointerIterator::findNextComponent() noexcept {
    while (current != path.end() && *current == '/') {
        ++current;
    }

    segment_end = current;
    while (segment_end != path.end() && *segment_end != '/') {
        ++segment_end;
    }

    current_segment = std::string_view{current, segment_end};
}

auto PointerIterator::toStringView() const noexcept -> std::string_view {
    return this->path;
}

auto PointerIterator::currentComponent() const noexcept -> std::string_view {
    return this->current_segment;
}

auto PointerIterator::decoded() const -> std::string {
    return decode_pointer_segment(this->current_segment);
}

auto PointerIterator::next() const noexcept -> PointerIterator {
    auto iter = *this;
    ++iter;
    return iter;
}

auto PointerIterator::remainder() const -> std::string {
    if (this->isAtEnd()) {
        return std::string{};
    }
    std::string rest{"/"};
    rest.append(this->current, this->path.end());
    return rest;
}

auto PointerIterator::operator*() const noexcept -> value_type {
    return current_segment;
}

auto PointerIterator::operator->() const noexcept -> pointer {
    return &current_segment;
}

auto PointerIterator::operator++() noexcept -> PointerIterator& {
    if (!isAtEnd()) {
        current = segment_end;
        findNextComponent();
    }
    return *this;
}

auto PointerIterator::operator++(int) noexcept -> PointerIterator {
    PointerIterator tmp = *this;
    ++*this;
    return tmp;
}

auto PointerIterator::operator==(const PointerIterator& other) const noexcept -> bool {
    return current == other.current;
}

auto PointerIterator::isAtStart() const noexcept -> bool {
    auto it = path.begin();
    while (it != path.end() && *it == '/') {
        ++it;
    }
    return current == it;
}

auto PointerIterator::isAtFinalComponent() const noexcept -> bool {
    if (isAtEnd()) {
        return false;
    }
    auto it = segment_end;
    while (it != path.end() && *it == '/') {
        ++it;
    }
    return it == path.end();
}

auto PointerIterator::isAtEnd() const noexcept -> bool {
    return current == path.end();
}

auto decode_pointer_segment(std::string_view segment) -> std::string {
    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                out.push_back('/');
                ++i;
                continue;
            }
            if (segment[i + 1] == '0') {
                out.push_back('~');
                ++i;
                continue;
            }
        }
        out.push_back(segment[i]);
    }
    return out;
}

auto encode_pointer_segment(std::string_view segment) -> std::string {
    std::string out;
    out.reserve(segment.size());
    for (char ch : segment) {
        if (ch == '~') {
            out.append("~0");
        } else if (ch == '/') {
            out.append("~1");
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

auto parse_array_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) {
        return std::nullopt;
    }
    if (segment.size() > 1 && segment.front() == '0') {
        return std::nullopt;
    }
    for (char ch : segment) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
    }
    std::size_t value = 0;
    auto result = std::from_chars(segment.data(), segment.data() + segment.size(), value);
    if (result.ec != std::errc{}) {
        return std::nullopt;
    }
    return value;
}

} // namespace GS
