#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace GS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NoSuchPath,
        InvalidPath,
        InvalidType,
        MalformedInput,
        NotFound,
        NotSupported,
        Cancelled,
        TransportFailure,
        HttpStatus,
        RetriesExhausted,
        HandlerFailed
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NoSuchPath:
        return "no_such_path";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::InvalidType:
        return "invalid_type";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::Cancelled:
        return "cancelled";
    case Error::Code::TransportFailure:
        return "transport_failure";
    case Error::Code::HttpStatus:
        return "http_status";
    case Error::Code::RetriesExhausted:
        return "retries_exhausted";
    case Error::Code::HandlerFailed:
        return "handler_failed";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 2 + error.message->size());
        description.append(label.data(), label.size());
        description.append(": ");
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Message text without the code label; falls back to the label when empty.
[[nodiscard]] inline auto errorMessage(Error const& error) -> std::string {
    if (error.message && !error.message->empty()) {
        return *error.message;
    }
    return std::string{errorCodeToString(error.code)};
}

} // namespace GS
