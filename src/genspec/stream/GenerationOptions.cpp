#include <genspec/stream/GenerationOptions.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>

namespace GS::Stream {

namespace {

constexpr int kMaxRetriesLimit = 100;

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

auto ParseEndpointUrl(std::string_view url) -> std::optional<EndpointUrl> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    auto scheme = url.substr(0, scheme_end);
    bool tls    = false;
    if (scheme == "https") {
        tls = true;
    } else if (scheme != "http") {
        return std::nullopt;
    }

    auto             remainder = url.substr(scheme_end + 3);
    auto             slash     = remainder.find('/');
    std::string_view authority;
    std::string      path{"/"};
    if (slash == std::string_view::npos) {
        authority = remainder;
    } else {
        authority = remainder.substr(0, slash);
        path      = std::string{remainder.substr(slash)};
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    std::string host;
    int         port  = tls ? 443 : 80;
    auto        colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        host = std::string{authority.substr(0, colon)};
        if (!parse_integer_in_range<int>(authority.substr(colon + 1), 1, 65535, port)) {
            return std::nullopt;
        }
    } else {
        host = std::string{authority};
    }
    if (host.empty()) {
        return std::nullopt;
    }

    return EndpointUrl{std::string{scheme}, std::move(host), std::move(path), port, tls};
}

bool ApplyGenerationEnvOverrides(GenerationOptions& options) {
    if (!apply_env("GENSPEC_ENDPOINT", [&](std::string_view value) {
            if (!ParseEndpointUrl(value)) {
                std::cerr << "GENSPEC_ENDPOINT must be an http(s) URL\n";
                return false;
            }
            options.endpoint = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("GENSPEC_VALIDATE", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "GENSPEC_VALIDATE must be a boolean (1/0, true/false, yes/no, on/off)\n";
                return false;
            }
            options.validate = *parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("GENSPEC_MAX_RETRIES", [&](std::string_view value) {
            int parsed = options.max_retries;
            if (!parse_integer_in_range<int>(value, 0, kMaxRetriesLimit, parsed)) {
                std::cerr << "GENSPEC_MAX_RETRIES must be within 0-" << kMaxRetriesLimit << "\n";
                return false;
            }
            options.max_retries = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("GENSPEC_TIMEOUT_MS", [&](std::string_view value) {
            std::int64_t parsed = options.read_timeout_ms;
            if (!parse_integer_in_range<std::int64_t>(value, 1, std::numeric_limits<std::int64_t>::max(), parsed)) {
                std::cerr << "GENSPEC_TIMEOUT_MS must be a positive integer\n";
                return false;
            }
            options.read_timeout_ms = parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

auto ValidateGenerationOptions(GenerationOptions const& options) -> std::optional<std::string> {
    if (options.endpoint.empty()) {
        return std::string{"endpoint must not be empty"};
    }
    if (!ParseEndpointUrl(options.endpoint)) {
        return std::string{"endpoint must be an http(s) URL with a host"};
    }
    if (options.max_retries < 0 || options.max_retries > kMaxRetriesLimit) {
        return "max_retries must be within 0-" + std::to_string(kMaxRetriesLimit);
    }
    if (options.connect_timeout_ms <= 0) {
        return std::string{"connect_timeout_ms must be positive"};
    }
    if (options.read_timeout_ms <= 0) {
        return std::string{"read_timeout_ms must be positive"};
    }
    for (auto const& [name, value] : options.headers) {
        if (name.empty()) {
            return std::string{"header names must not be empty"};
        }
        if (name.find_first_of(":\r\n") != std::string::npos || value.find_first_of("\r\n") != std::string::npos) {
            return "header '" + name + "' contains forbidden characters";
        }
    }
    return std::nullopt;
}

} // namespace GS::Stream
