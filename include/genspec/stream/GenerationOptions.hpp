#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace GS::Stream {

struct GenerationOptions {
    std::string  endpoint{"http://127.0.0.1:3000/api/generate"};
    bool         validate{false};
    int          max_retries{5};
    std::int64_t connect_timeout_ms{5000};
    std::int64_t read_timeout_ms{120000};
    std::vector<std::pair<std::string, std::string>> headers;
};

struct EndpointUrl {
    std::string scheme;
    std::string host;
    std::string path;
    int         port{0};
    bool        tls{false};
};

// http/https only; the path defaults to "/".
auto ParseEndpointUrl(std::string_view url) -> std::optional<EndpointUrl>;

/**
 * Reads GENSPEC_ENDPOINT, GENSPEC_VALIDATE, GENSPEC_MAX_RETRIES and
 * GENSPEC_TIMEOUT_MS (read timeout). Unset variables leave the option alone;
 * an unparseable one is reported on stderr and makes this return false.
 */
bool ApplyGenerationEnvOverrides(GenerationOptions& options);

auto ValidateGenerationOptions(GenerationOptions const& options) -> std::optional<std::string>;

} // namespace GS::Stream
