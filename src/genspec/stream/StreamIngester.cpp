#include <genspec/document/SpecStore.hpp>
#include <genspec/stream/StreamIngester.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace GS::Stream {

using Document::Spec;

namespace {

constexpr std::size_t kMaxQuotedLine = 500;

struct StreamingFlag {
    explicit StreamingFlag(std::atomic<bool>& flag) : flag(flag) { this->flag.store(true); }
    ~StreamingFlag() { this->flag.store(false); }
    std::atomic<bool>& flag;
};

auto request_for(std::string prompt, Json context, Spec const& spec) -> GenerationRequest {
    GenerationRequest request;
    request.prompt      = std::move(prompt);
    request.context     = context.is_object() ? std::move(context) : Json::object();
    request.currentSpec = Document::SpecToJson(spec);
    return request;
}

} // namespace

auto generationStatusName(GenerationStatus status) -> std::string_view {
    switch (status) {
        case GenerationStatus::Complete:
            return "complete";
        case GenerationStatus::Invalid:
            return "invalid";
        case GenerationStatus::Exhausted:
            return "exhausted";
        case GenerationStatus::Cancelled:
            return "cancelled";
        case GenerationStatus::Failed:
            return "failed";
    }
    return "unknown";
}

auto MalformedRepairPrompt(std::string_view line) -> std::string {
    std::string prompt = "The previous generation contained malformed JSON that could not be parsed. The line was:\n";
    prompt.append(line.substr(0, kMaxQuotedLine));
    prompt.append("\n\nThe current spec state is provided. Continue generating from where you left off. "
                  "Output ONLY the remaining patches needed to complete the UI.");
    return prompt;
}

auto ValidationRepairPrompt(std::vector<Document::ValidationIssue> const& issues) -> std::string {
    return "FIX THE FOLLOWING ERRORS in the current UI spec. Output ONLY the patches needed to fix these issues, "
           "do not recreate the entire UI.\n\n"
           + Document::FormatSpecIssues(issues);
}

StreamIngester::StreamIngester(GenerationTransport& transport, GenerationOptions options)
    : transport(transport), options_(std::move(options)) {}

auto StreamIngester::setCallbacks(GenerationCallbacks callbacks) -> void {
    this->callbacks = std::move(callbacks);
}

auto StreamIngester::stop() -> void {
    this->stopRequested.store(true);
}

auto StreamIngester::isStreaming() const -> bool {
    return this->streaming.load();
}

auto StreamIngester::current() const -> Spec {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->latest;
}

auto StreamIngester::publish(Spec const& spec) -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->latest = spec;
    }
    if (this->callbacks.onSpec) {
        this->callbacks.onSpec(spec);
    }
}

auto StreamIngester::processLine(std::string const& line, GenerationResult& result) -> bool {
    auto parsed = ParseStreamLine(line);
    if (parsed.kind != LineKind::Empty) {
        result.rawLines.push_back(parsed.text);
    }
    switch (parsed.kind) {
        case LineKind::Empty:
        case LineKind::Comment:
            return true;
        case LineKind::Commentary:
            result.commentary.push_back(std::move(parsed.text));
            return true;
        case LineKind::Usage:
            result.usage = parsed.usage;
            return true;
        case LineKind::Ignored:
            gs_log("Ignored stream line: " + parsed.problem.value_or(parsed.text), "Stream", "WARN");
            return true;
        case LineKind::Malformed:
            result.malformedLines.push_back(parsed.text);
            gs_log("Malformed stream line: " + parsed.text, "Stream", "WARN");
            return !this->options_.validate;
        case LineKind::Patch:
            break;
    }
    for (auto const& patch : parsed.patches) {
        result.spec = Document::ApplyPatch(result.spec, patch);
        this->publish(result.spec);
    }
    return true;
}

auto StreamIngester::runRound(GenerationRequest const& request, GenerationResult& result) -> Round {
    Round        round;
    LineSplitter splitter;
    bool         malformed = false;

    auto sink = [&](std::string_view chunk) -> bool {
        if (this->stopRequested.load()) {
            return false;
        }
        for (auto const& line : splitter.push(chunk)) {
            if (!this->processLine(line, result)) {
                round.malformedLine = line;
                malformed           = true;
                return false;
            }
            if (this->stopRequested.load()) {
                return false;
            }
        }
        return true;
    };

    auto streamed = this->transport.stream(request, sink);

    if (malformed) {
        round.outcome = RoundOutcome::Malformed;
        return round;
    }
    if (this->stopRequested.load()) {
        round.outcome = RoundOutcome::Stopped;
        return round;
    }
    if (!streamed) {
        if (streamed.error().code == Error::Code::Cancelled) {
            round.outcome = RoundOutcome::Stopped;
            return round;
        }
        round.outcome = RoundOutcome::Failed;
        round.error   = streamed.error();
        return round;
    }
    if (auto tail = splitter.finish()) {
        if (!this->processLine(*tail, result)) {
            round.malformedLine = *tail;
            round.outcome       = RoundOutcome::Malformed;
        }
    }
    return round;
}

auto StreamIngester::finish(GenerationResult& result) -> GenerationResult {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->latest = result.spec;
    }
    gs_log("Generation " + std::string(generationStatusName(result.status)) + " after " + std::to_string(result.rounds)
               + " round(s)",
           "Stream", "INFO");
    switch (result.status) {
        case GenerationStatus::Complete:
        case GenerationStatus::Invalid:
            if (this->callbacks.onComplete) {
                this->callbacks.onComplete(result);
            }
            break;
        case GenerationStatus::Exhausted:
        case GenerationStatus::Failed:
            if (this->callbacks.onError && result.error) {
                this->callbacks.onError(*result.error, result.spec);
            }
            break;
        case GenerationStatus::Cancelled:
            break;
    }
    return std::move(result);
}

auto StreamIngester::generate(std::string const& prompt, Json const& context, std::optional<Spec> const& previousSpec)
        -> GenerationResult {
    StreamingFlag streamingFlag(this->streaming);
    this->stopRequested.store(false);

    GenerationResult result;
    if (previousSpec && !previousSpec->root.empty()) {
        result.spec = *previousSpec;
    }
    this->publish(result.spec);

    int const   maxRetries    = this->options_.max_retries < 0 ? 0 : this->options_.max_retries;
    std::string currentPrompt = prompt;
    Json        roundContext  = context.is_object() ? context : Json::object();

    while (true) {
        ++result.rounds;
        gs_log("Starting generation round " + std::to_string(result.rounds), "Stream");
        auto round = this->runRound(request_for(currentPrompt, roundContext, result.spec), result);

        if (round.outcome == RoundOutcome::Stopped) {
            result.status = GenerationStatus::Cancelled;
            return this->finish(result);
        }
        if (round.outcome == RoundOutcome::Failed) {
            result.status = GenerationStatus::Failed;
            result.error  = round.error;
            return this->finish(result);
        }

        if (round.outcome == RoundOutcome::Malformed) {
            if (result.retriesUsed >= maxRetries) {
                result.status = GenerationStatus::Exhausted;
                result.error  = Error{Error::Code::RetriesExhausted,
                                      "malformed line after " + std::to_string(result.retriesUsed) + " retries"};
                result.issues = Document::ValidateSpec(result.spec).issues;
                return this->finish(result);
            }
            ++result.retriesUsed;
            gs_log("Retrying after malformed line", "Stream", "WARN");
            currentPrompt               = MalformedRepairPrompt(round.malformedLine);
            roundContext["previousSpec"] = Document::SpecToJson(result.spec);
            continue;
        }

        if (!result.spec.root.empty()) {
            auto fixed = Document::AutoFixSpec(result.spec);
            if (!fixed.fixes.empty()) {
                for (auto const& fix : fixed.fixes) {
                    gs_log(fix, "Validator", "INFO");
                }
                result.fixes.insert(result.fixes.end(), fixed.fixes.begin(), fixed.fixes.end());
                result.spec = std::move(fixed.spec);
                this->publish(result.spec);
            }
        }

        auto validation = Document::ValidateSpec(result.spec);
        result.issues   = validation.issues;
        if (validation.valid) {
            result.status = GenerationStatus::Complete;
            return this->finish(result);
        }
        if (!this->options_.validate || result.spec.root.empty()) {
            result.status = GenerationStatus::Invalid;
            return this->finish(result);
        }
        if (result.retriesUsed >= maxRetries) {
            result.status = GenerationStatus::Exhausted;
            result.error  = Error{Error::Code::RetriesExhausted, Document::FormatSpecIssues(validation.issues)};
            return this->finish(result);
        }
        ++result.retriesUsed;
        gs_log("Retrying with " + std::to_string(validation.errors().size()) + " validation error(s)", "Stream", "WARN");
        currentPrompt               = ValidationRepairPrompt(validation.issues);
        roundContext["previousSpec"] = Document::SpecToJson(result.spec);
    }
}

} // namespace GS::Stream
