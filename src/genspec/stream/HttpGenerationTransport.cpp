#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif

#include "httplib.h"

#include <genspec/stream/GenerationTransport.hpp>

#include "log/TaggedLogger.hpp"

#include <memory>

namespace GS::Stream {

namespace {

auto make_http_client(EndpointUrl const& url, GenerationOptions const& options) -> std::unique_ptr<httplib::ClientImpl> {
    std::unique_ptr<httplib::ClientImpl> client;
    if (url.tls) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        auto ssl_client = std::make_unique<httplib::SSLClient>(url.host, url.port);
        ssl_client->enable_server_certificate_verification(true);
        client = std::unique_ptr<httplib::ClientImpl>(std::move(ssl_client));
#else
        return nullptr;
#endif
    } else {
        client = std::make_unique<httplib::ClientImpl>(url.host, url.port);
    }
    client->set_connection_timeout(static_cast<time_t>(options.connect_timeout_ms / 1000),
                                   static_cast<time_t>((options.connect_timeout_ms % 1000) * 1000));
    client->set_read_timeout(static_cast<time_t>(options.read_timeout_ms / 1000),
                             static_cast<time_t>((options.read_timeout_ms % 1000) * 1000));
    client->set_follow_location(false);
    client->set_keep_alive(false);
    return client;
}

auto is_success(int status) -> bool {
    return status >= 200 && status < 300;
}

} // namespace

auto RequestBody(GenerationRequest const& request) -> Json {
    return Json{{"prompt", request.prompt}, {"context", request.context}, {"currentSpec", request.currentSpec}};
}

auto HttpErrorMessage(int status, std::string_view body) -> std::string {
    auto parsed = Json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        for (auto const* key : {"message", "error"}) {
            if (auto it = parsed.find(key); it != parsed.end() && it->is_string() && !it->get_ref<std::string const&>().empty()) {
                return it->get<std::string>();
            }
        }
    }
    return "HTTP error: " + std::to_string(status);
}

HttpGenerationTransport::HttpGenerationTransport(GenerationOptions options)
    : options_(std::move(options)), endpoint(ParseEndpointUrl(this->options_.endpoint)) {}

auto HttpGenerationTransport::stream(GenerationRequest const& request, ChunkSink const& sink) -> Expected<void> {
    if (!this->endpoint) {
        return std::unexpected(Error{Error::Code::InvalidPath, "invalid endpoint: " + this->options_.endpoint});
    }
    auto client = make_http_client(*this->endpoint, this->options_);
    if (!client) {
        return std::unexpected(Error{Error::Code::NotSupported, "https endpoints need OpenSSL support"});
    }

    httplib::Request httpRequest;
    httpRequest.method = "POST";
    httpRequest.path   = this->endpoint->path;
    httpRequest.headers.emplace("Content-Type", "application/json");
    httpRequest.headers.emplace("Accept", "application/x-ndjson, text/plain");
    for (auto const& [name, value] : this->options_.headers) {
        httpRequest.headers.emplace(name, value);
    }
    httpRequest.body = RequestBody(request).dump();

    int         status = 0;
    std::string errorBody;
    bool        sinkAborted = false;
    httpRequest.response_handler = [&](httplib::Response const& response) {
        status = response.status;
        gs_log("Generation response status " + std::to_string(status), "Transport");
        return true;
    };
    httpRequest.content_receiver = [&](char const* data, std::size_t length, std::uint64_t, std::uint64_t) {
        if (!is_success(status)) {
            errorBody.append(data, length);
            return true;
        }
        if (!sink(std::string_view{data, length})) {
            sinkAborted = true;
            return false;
        }
        return true;
    };

    httplib::Response response;
    httplib::Error    error = httplib::Error::Success;
    bool const        sent  = client->send(httpRequest, response, error);

    if (sinkAborted) {
        return std::unexpected(Error{Error::Code::Cancelled, "stream aborted by consumer"});
    }
    if (!sent) {
        gs_log("Generation request failed: " + httplib::to_string(error), "Transport", "ERROR");
        return std::unexpected(Error{Error::Code::TransportFailure, httplib::to_string(error)});
    }
    if (!is_success(status)) {
        if (errorBody.empty()) {
            errorBody = response.body;
        }
        return std::unexpected(Error{Error::Code::HttpStatus, HttpErrorMessage(status, errorBody)});
    }
    return {};
}

} // namespace GS::Stream
