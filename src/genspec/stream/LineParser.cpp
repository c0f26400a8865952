#include <genspec/stream/LineParser.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>

namespace GS::Stream {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

auto looks_like_json(std::string_view text) -> bool {
    return !text.empty() && (text.front() == '{' || text.front() == '[');
}

auto try_parse(std::string_view text) -> std::optional<Json> {
    auto parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

auto read_count(Json const& json, char const* key) -> std::int64_t {
    if (auto it = json.find(key); it != json.end() && it->is_number()) {
        return it->get<std::int64_t>();
    }
    return 0;
}

auto is_usage(Json const& json) -> bool {
    if (!json.is_object()) {
        return false;
    }
    auto meta = json.find("__meta");
    return meta != json.end() && meta->is_string() && meta->get_ref<std::string const&>() == "usage";
}

auto classify(Json const& json, ParsedLine& line) -> void {
    if (is_usage(json)) {
        line.kind  = LineKind::Usage;
        line.usage = TokenUsage{read_count(json, "promptTokens"), read_count(json, "completionTokens"), read_count(json, "totalTokens")};
        return;
    }

    if (json.is_object()) {
        auto patch = Document::ParsePatch(json);
        if (!patch) {
            line.kind    = LineKind::Ignored;
            line.problem = describeError(patch.error());
            return;
        }
        line.kind = LineKind::Patch;
        line.patches.push_back(std::move(*patch));
        return;
    }

    for (auto const& entry : json) {
        auto patch = Document::ParsePatch(entry);
        if (patch) {
            line.patches.push_back(std::move(*patch));
        } else if (!line.problem) {
            line.problem = describeError(patch.error());
        }
    }
    line.kind = line.patches.empty() ? LineKind::Ignored : LineKind::Patch;
}

} // namespace

auto ParseStreamLine(std::string_view raw) -> ParsedLine {
    ParsedLine line;
    auto       trimmed = trim(raw);
    line.text          = std::string{trimmed};

    if (trimmed.empty()) {
        line.kind = LineKind::Empty;
        return line;
    }
    if (trimmed.starts_with("//")) {
        line.kind = LineKind::Comment;
        return line;
    }
    if (!looks_like_json(trimmed)) {
        line.kind = LineKind::Commentary;
        return line;
    }

    if (auto parsed = try_parse(trimmed)) {
        classify(*parsed, line);
        return line;
    }

    auto attempt = trimmed;
    for (std::size_t i = 0; i < kMaxRecoveryStrips; ++i) {
        auto last = attempt.back();
        if (last != '}' && last != ']') {
            break;
        }
        attempt.remove_suffix(1);
        if (attempt.empty()) {
            break;
        }
        if (auto parsed = try_parse(attempt)) {
            gs_log("Recovered malformed line by removing " + std::to_string(i + 1) + " trailing '" + std::string(1, last) + "'",
                   "Stream",
                   "WARN");
            line.strippedChars = i + 1;
            classify(*parsed, line);
            return line;
        }
    }

    line.kind    = LineKind::Malformed;
    line.problem = "unparseable JSON";
    return line;
}

auto lineKindName(LineKind kind) -> std::string_view {
    switch (kind) {
    case LineKind::Empty:
        return "empty";
    case LineKind::Comment:
        return "comment";
    case LineKind::Commentary:
        return "commentary";
    case LineKind::Patch:
        return "patch";
    case LineKind::Usage:
        return "usage";
    case LineKind::Malformed:
        return "malformed";
    case LineKind::Ignored:
        return "ignored";
    }
    return "ignored";
}

auto LineSplitter::push(std::string_view chunk) -> std::vector<std::string> {
    std::vector<std::string> lines;
    this->buffer.append(chunk);
    std::size_t start = 0;
    for (auto newline = this->buffer.find('\n'); newline != std::string::npos; newline = this->buffer.find('\n', start)) {
        lines.emplace_back(this->buffer, start, newline - start);
        start = newline + 1;
    }
    this->buffer.erase(0, start);
    return lines;
}

auto LineSplitter::finish() -> std::optional<std::string> {
    if (this->buffer.empty()) {
        return std::nullopt;
    }
    std::string tail;
    tail.swap(this->buffer);
    return tail;
}

auto LineSplitter::reset() -> void {
    this->buffer.clear();
}

} // namespace GS::Stream
