#include <genspec/stream/GenerationTransport.hpp>
#include <genspec/stream/StreamIngester.hpp>

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include "httplib.h"

#include <doctest/doctest.h>

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace GS;
using namespace GS::Stream;

namespace {

// Local generation endpoint on an ephemeral port.
class GenerationServer {
public:
    GenerationServer() {
        this->server.Post("/api/generate", [this](httplib::Request const& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lock(this->mutex_);
                this->bodies.push_back(Json::parse(req.body, nullptr, false));
                this->authorization = req.get_header_value("Authorization");
            }
            auto lines = this->lines;
            res.set_chunked_content_provider("application/x-ndjson", [lines](size_t, httplib::DataSink& sink) {
                for (auto const& line : lines) {
                    auto text = line + "\n";
                    if (!sink.write(text.data(), text.size())) {
                        return false;
                    }
                }
                sink.done();
                return true;
            });
        });
        this->server.Post("/api/limited", [](httplib::Request const&, httplib::Response& res) {
            res.status = 429;
            res.set_content(R"({"error":"Too many requests"})", "application/json");
        });
        this->server.Post("/api/broken", [](httplib::Request const&, httplib::Response& res) {
            res.status = 500;
            res.set_content("<html>oops</html>", "text/html");
        });

        this->port = this->server.bind_to_any_port("127.0.0.1");
        REQUIRE(this->port > 0);
        this->thread = std::thread([this] { this->server.listen_after_bind(); });
        this->server.wait_until_ready();
    }

    ~GenerationServer() {
        this->server.stop();
        if (this->thread.joinable()) {
            this->thread.join();
        }
    }

    auto endpoint(std::string const& path = "/api/generate") const -> std::string {
        return "http://127.0.0.1:" + std::to_string(this->port) + path;
    }

    httplib::Server          server;
    std::vector<std::string> lines;
    std::vector<Json>        bodies;
    std::string              authorization;
    std::mutex               mutex_;
    int                      port = 0;
    std::thread              thread;
};

auto options_for(std::string endpoint) -> GenerationOptions {
    GenerationOptions options;
    options.endpoint           = std::move(endpoint);
    options.connect_timeout_ms = 1000;
    options.read_timeout_ms    = 2000;
    return options;
}

auto collect(GenerationTransport& transport, GenerationRequest const& request, std::string& received) -> Expected<void> {
    return transport.stream(request, [&](std::string_view chunk) {
        received.append(chunk);
        return true;
    });
}

} // namespace

TEST_SUITE_BEGIN("stream.http");

TEST_CASE("HTTP transport streams the response body") {
    GenerationServer server;
    server.lines = {R"({"op":"add","path":"/root","value":"page"})", R"({"op":"add","path":"/nodes/page","value":{"type":"Text"}})"};

    auto options = options_for(server.endpoint());
    options.headers.emplace_back("Authorization", "Bearer secret");
    HttpGenerationTransport transport{options};

    GenerationRequest request;
    request.prompt  = "A page";
    request.context = Json{{"locale", "en"}};

    std::string received;
    auto        result = collect(transport, request, received);
    REQUIRE(result.has_value());
    CHECK(received == server.lines[0] + "\n" + server.lines[1] + "\n");

    std::lock_guard<std::mutex> lock(server.mutex_);
    REQUIRE(server.bodies.size() == 1);
    CHECK(server.bodies[0] == RequestBody(request));
    CHECK(server.authorization == "Bearer secret");
}

TEST_CASE("HTTP transport reports error statuses") {
    GenerationServer server;

    SUBCASE("JSON error body") {
        HttpGenerationTransport transport{options_for(server.endpoint("/api/limited"))};
        std::string             received;
        auto                    result = collect(transport, GenerationRequest{}, received);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::HttpStatus);
        CHECK(errorMessage(result.error()) == "Too many requests");
        CHECK(received.empty());
    }

    SUBCASE("Opaque error body") {
        HttpGenerationTransport transport{options_for(server.endpoint("/api/broken"))};
        std::string             received;
        auto                    result = collect(transport, GenerationRequest{}, received);
        REQUIRE_FALSE(result.has_value());
        CHECK(errorMessage(result.error()) == "HTTP error: 500");
    }

    SUBCASE("Unknown route") {
        HttpGenerationTransport transport{options_for(server.endpoint("/api/missing"))};
        std::string             received;
        auto                    result = collect(transport, GenerationRequest{}, received);
        REQUIRE_FALSE(result.has_value());
        CHECK(errorMessage(result.error()) == "HTTP error: 404");
    }
}

TEST_CASE("HTTP transport failures") {
    SUBCASE("Invalid endpoint") {
        HttpGenerationTransport transport{options_for("nowhere")};
        std::string             received;
        auto                    result = collect(transport, GenerationRequest{}, received);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::InvalidPath);
    }

    SUBCASE("Connection refused") {
        int port = 0;
        {
            GenerationServer server;
            port = server.port;
        }
        HttpGenerationTransport transport{options_for("http://127.0.0.1:" + std::to_string(port) + "/api/generate")};
        std::string             received;
        auto                    result = collect(transport, GenerationRequest{}, received);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::TransportFailure);
    }

    SUBCASE("Consumer abort") {
        GenerationServer server;
        server.lines = {"one", "two", "three"};
        HttpGenerationTransport transport{options_for(server.endpoint())};
        auto result = transport.stream(GenerationRequest{}, [](std::string_view) { return false; });
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::Cancelled);
    }
}

TEST_CASE("HTTP error messages") {
    CHECK(HttpErrorMessage(400, R"({"message":"Bad prompt"})") == "Bad prompt");
    CHECK(HttpErrorMessage(400, R"({"message":"","error":"Fallback"})") == "Fallback");
    CHECK(HttpErrorMessage(502, R"({"detail":"x"})") == "HTTP error: 502");
    CHECK(HttpErrorMessage(503, "") == "HTTP error: 503");
}

TEST_CASE("Generation over HTTP") {
    GenerationServer server;
    server.lines = {"Building a greeting.",
                    R"({"op":"add","path":"/root","value":"page"})",
                    R"({"op":"add","path":"/nodes/page","value":{"type":"Stack","children":["title"]}})",
                    R"({"op":"add","path":"/nodes/title","value":{"type":"Text","props":{"text":"Hi"}}})",
                    R"({"__meta":"usage","promptTokens":3,"completionTokens":4,"totalTokens":7})"};

    auto options     = options_for(server.endpoint());
    options.validate = true;
    HttpGenerationTransport transport{options};
    StreamIngester          ingester{transport, options};

    auto result = ingester.generate("Greeting");
    CHECK(result.status == GenerationStatus::Complete);
    CHECK(result.spec.contains("title"));
    CHECK(result.commentary.size() == 1);
    REQUIRE(result.usage.has_value());
    CHECK(result.usage->totalTokens == 7);
    CHECK(transport.options().endpoint == server.endpoint());
}

TEST_SUITE_END();
