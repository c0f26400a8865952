#pragma once
#include <genspec/core/Error.hpp>
#include <genspec/path/JsonPointer.hpp>
#include <genspec/stream/GenerationOptions.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace GS::Stream {

struct GenerationRequest {
    std::string prompt;
    Json        context     = Json::object();
    Json        currentSpec = Json::object();
};

// Receives body bytes as they arrive; returning false aborts the stream.
using ChunkSink = std::function<bool(std::string_view chunk)>;

// Wire body: {"prompt", "context", "currentSpec"}.
[[nodiscard]] auto RequestBody(GenerationRequest const& request) -> Json;

/**
 * Delivers one generation response as a byte stream.
 *
 * stream() returns once the body is exhausted. When the sink aborts, the
 * result is an Error::Code::Cancelled error; any other failure (connection,
 * non-2xx status) carries the message to surface to the caller.
 */
class GenerationTransport {
public:
    virtual ~GenerationTransport() = default;

    virtual auto stream(GenerationRequest const& request, ChunkSink const& sink) -> Expected<void> = 0;
};

// POSTs to GenerationOptions::endpoint over cpp-httplib.
class HttpGenerationTransport final : public GenerationTransport {
public:
    explicit HttpGenerationTransport(GenerationOptions options);

    auto stream(GenerationRequest const& request, ChunkSink const& sink) -> Expected<void> override;

    [[nodiscard]] auto options() const -> GenerationOptions const& { return this->options_; }

private:
    GenerationOptions          options_;
    std::optional<EndpointUrl> endpoint;
};

// Message for a non-2xx response: the body's "message" or "error" field,
// otherwise "HTTP error: <status>".
[[nodiscard]] auto HttpErrorMessage(int status, std::string_view body) -> std::string;

} // namespace GS::Stream
