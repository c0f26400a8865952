#pragma once
#include <genspec/document/Patch.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GS::Stream {

enum class LineKind {
    Empty,
    Comment,    // "//" prefixed
    Commentary, // model narration, not JSON-shaped
    Patch,
    Usage,      // {"__meta": "usage", ...}
    Malformed,  // JSON-shaped but unparseable after recovery
    Ignored     // valid JSON that is not a patch
};

struct TokenUsage {
    std::int64_t promptTokens     = 0;
    std::int64_t completionTokens = 0;
    std::int64_t totalTokens      = 0;
};

struct ParsedLine {
    LineKind                     kind = LineKind::Empty;
    std::string                  text; // trimmed
    std::vector<Document::Patch> patches;
    std::optional<TokenUsage>    usage;
    std::size_t                  strippedChars = 0;
    std::optional<std::string>   problem;
};

// Trailing '}' / ']' characters removed one at a time before giving up.
inline constexpr std::size_t kMaxRecoveryStrips = 3;

/**
 * Classifies one stream line. Lines that fail to parse get up to
 * kMaxRecoveryStrips attempts with one trailing bracket removed each time,
 * since models often emit an extra closer on nested objects. An array line
 * is read as a batch of patches.
 */
[[nodiscard]] auto ParseStreamLine(std::string_view line) -> ParsedLine;

[[nodiscard]] auto lineKindName(LineKind kind) -> std::string_view;

// Accumulates chunks and hands out complete '\n'-terminated lines.
class LineSplitter {
public:
    auto push(std::string_view chunk) -> std::vector<std::string>;
    // The unterminated tail, if any, once the stream has ended.
    auto finish() -> std::optional<std::string>;
    auto reset() -> void;

private:
    std::string buffer;
};

} // namespace GS::Stream
