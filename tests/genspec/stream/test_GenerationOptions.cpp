#include <doctest/doctest.h>
#include <genspec/stream/GenerationOptions.hpp>

#include <cstdlib>
#include <optional>
#include <string>

using namespace GS::Stream;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

} // namespace

TEST_CASE("Endpoint URL parsing") {
    auto plain = ParseEndpointUrl("http://127.0.0.1:3000/api/generate");
    REQUIRE(plain.has_value());
    CHECK(plain->scheme == "http");
    CHECK(plain->host == "127.0.0.1");
    CHECK(plain->port == 3000);
    CHECK(plain->path == "/api/generate");
    CHECK_FALSE(plain->tls);

    auto secure = ParseEndpointUrl("https://ui.example.com");
    REQUIRE(secure.has_value());
    CHECK(secure->tls);
    CHECK(secure->port == 443);
    CHECK(secure->path == "/");

    CHECK_FALSE(ParseEndpointUrl("ftp://example.com").has_value());
    CHECK_FALSE(ParseEndpointUrl("example.com/api").has_value());
    CHECK_FALSE(ParseEndpointUrl("http:///api").has_value());
    CHECK_FALSE(ParseEndpointUrl("http://host:99999/").has_value());
    CHECK_FALSE(ParseEndpointUrl("http://:80/").has_value());
}

TEST_CASE("Generation options validation") {
    GenerationOptions options;
    CHECK_FALSE(ValidateGenerationOptions(options).has_value());
    CHECK(options.max_retries == 5);
    CHECK_FALSE(options.validate);

    SUBCASE("Endpoint") {
        options.endpoint = "not a url";
        CHECK(ValidateGenerationOptions(options).has_value());
    }

    SUBCASE("Retries") {
        options.max_retries = -1;
        CHECK(ValidateGenerationOptions(options).has_value());
    }

    SUBCASE("Timeouts") {
        options.read_timeout_ms = 0;
        CHECK(ValidateGenerationOptions(options) == std::optional<std::string>{"read_timeout_ms must be positive"});
    }

    SUBCASE("Headers") {
        options.headers.emplace_back("Authorization", "Bearer token");
        CHECK_FALSE(ValidateGenerationOptions(options).has_value());
        options.headers.emplace_back("X-Bad", "line\r\nInjected: 1");
        CHECK(ValidateGenerationOptions(options).has_value());
    }
}

TEST_CASE("Generation options environment overrides") {
    SUBCASE("Unset variables leave defaults") {
        EnvGuard endpoint{"GENSPEC_ENDPOINT", nullptr};
        EnvGuard validate{"GENSPEC_VALIDATE", nullptr};
        EnvGuard retries{"GENSPEC_MAX_RETRIES", nullptr};
        EnvGuard timeout{"GENSPEC_TIMEOUT_MS", nullptr};
        GenerationOptions options;
        CHECK(ApplyGenerationEnvOverrides(options));
        CHECK(options.endpoint == GenerationOptions{}.endpoint);
    }

    SUBCASE("Valid overrides") {
        EnvGuard endpoint{"GENSPEC_ENDPOINT", "https://gen.example.com/v1/ui"};
        EnvGuard validate{"GENSPEC_VALIDATE", "Yes"};
        EnvGuard retries{"GENSPEC_MAX_RETRIES", "2"};
        EnvGuard timeout{"GENSPEC_TIMEOUT_MS", "1500"};
        GenerationOptions options;
        CHECK(ApplyGenerationEnvOverrides(options));
        CHECK(options.endpoint == "https://gen.example.com/v1/ui");
        CHECK(options.validate);
        CHECK(options.max_retries == 2);
        CHECK(options.read_timeout_ms == 1500);
    }

    SUBCASE("Invalid values are rejected") {
        EnvGuard endpoint{"GENSPEC_ENDPOINT", nullptr};
        EnvGuard validate{"GENSPEC_VALIDATE", "maybe"};
        GenerationOptions options;
        CHECK_FALSE(ApplyGenerationEnvOverrides(options));
        CHECK_FALSE(options.validate);
    }

    SUBCASE("Retry limit") {
        EnvGuard endpoint{"GENSPEC_ENDPOINT", nullptr};
        EnvGuard validate{"GENSPEC_VALIDATE", nullptr};
        EnvGuard retries{"GENSPEC_MAX_RETRIES", "101"};
        GenerationOptions options;
        CHECK_FALSE(ApplyGenerationEnvOverrides(options));
        CHECK(options.max_retries == 5);
    }
}
