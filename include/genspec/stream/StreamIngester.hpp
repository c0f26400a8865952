#pragma once
#include <genspec/core/Error.hpp>
#include <genspec/document/Spec.hpp>
#include <genspec/document/SpecValidator.hpp>
#include <genspec/stream/GenerationOptions.hpp>
#include <genspec/stream/GenerationTransport.hpp>
#include <genspec/stream/LineParser.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GS::Stream {

enum class GenerationStatus {
    Complete,  // stream finished and the document validated
    Invalid,   // stream finished, validation off, document has errors
    Exhausted, // retry budget spent with errors remaining
    Cancelled, // stop() was called
    Failed     // transport error
};

[[nodiscard]] auto generationStatusName(GenerationStatus status) -> std::string_view;

struct GenerationResult {
    Document::Spec                         spec;
    GenerationStatus                       status = GenerationStatus::Complete;
    std::vector<Document::ValidationIssue> issues;
    std::optional<Error>                   error;
    int                                    retriesUsed = 0;
    int                                    rounds      = 0;
    std::optional<TokenUsage>              usage;
    std::vector<std::string>               malformedLines;
    std::vector<std::string>               commentary;
    // Every non-empty line received, trimmed, whatever its kind.
    std::vector<std::string>               rawLines;
    std::vector<std::string>               fixes;
};

struct GenerationCallbacks {
    std::function<void(Document::Spec const&)>               onSpec;
    std::function<void(GenerationResult const&)>             onComplete;
    std::function<void(Error const&, Document::Spec const&)> onError;
};

/**
 * Turns a generation stream into a Spec.
 *
 * Each round POSTs the prompt through the transport, splits the body into
 * lines and applies every patch in arrival order. With `validate` on, the
 * first unrecoverable line cancels the round and a repair round is started
 * from the partial document; after a clean round the document is auto-fixed
 * and validated, and remaining errors start another repair round. Both kinds
 * of repair draw on one budget of `max_retries`.
 *
 * generate() blocks; stop() may be called from another thread (or from a
 * callback) and ends the generation without firing onError.
 */
class StreamIngester {
public:
    StreamIngester(GenerationTransport& transport, GenerationOptions options = {});

    auto setCallbacks(GenerationCallbacks callbacks) -> void;

    auto generate(std::string const& prompt,
                  Json const& context = Json::object(),
                  std::optional<Document::Spec> const& previousSpec = std::nullopt) -> GenerationResult;

    auto stop() -> void;

    [[nodiscard]] auto isStreaming() const -> bool;
    // Latest document of the running (or last) generation.
    [[nodiscard]] auto current() const -> Document::Spec;
    [[nodiscard]] auto options() const -> GenerationOptions const& { return this->options_; }

private:
    enum class RoundOutcome {
        Finished,
        Malformed,
        Stopped,
        Failed
    };

    struct Round {
        RoundOutcome         outcome = RoundOutcome::Finished;
        std::string          malformedLine;
        std::optional<Error> error;
    };

    auto runRound(GenerationRequest const& request, GenerationResult& result) -> Round;
    auto processLine(std::string const& line, GenerationResult& result) -> bool;
    auto publish(Document::Spec const& spec) -> void;
    auto finish(GenerationResult& result) -> GenerationResult;

    GenerationTransport& transport;
    GenerationOptions    options_;
    GenerationCallbacks  callbacks;

    std::atomic<bool> stopRequested{false};
    std::atomic<bool> streaming{false};

    mutable std::mutex mutex_;
    Document::Spec     latest;
};

// Prompt for a round that follows a cancelled malformed line.
[[nodiscard]] auto MalformedRepairPrompt(std::string_view line) -> std::string;
// Prompt for a round that follows failed validation.
[[nodiscard]] auto ValidationRepairPrompt(std::vector<Document::ValidationIssue> const& issues) -> std::string;

} // namespace GS::Stream
