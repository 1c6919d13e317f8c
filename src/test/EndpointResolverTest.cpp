#undef NDEBUG
#include <cassert>
#include <iostream>
#include "application/EndpointResolver.hpp"
#include "infrastructure/UrlUtils.hpp"

using runrelay::application::EndpointResolver;
using runrelay::infrastructure::UrlUtils;

namespace {

void TestUploadEndpointDerivation() {
    std::cout << "[Test] Upload endpoint derived from the stream endpoint..." << std::endl;
    assert(EndpointResolver::UploadEndpointFromStream("ws://localhost:5555") == "http://localhost:5555/upload");
    assert(EndpointResolver::UploadEndpointFromStream("wss://api.example.com/ws") == "https://api.example.com/upload");
    assert(EndpointResolver::UploadEndpointFromStream("wss://api.example.com/reporter/ws") ==
           "https://api.example.com/reporter/upload");
    assert(EndpointResolver::UploadEndpointFromStream("ws://localhost:5555/") == "http://localhost:5555/upload");
    assert(EndpointResolver::UploadEndpointFromStream("ws://ws") == "http://ws/upload");
    assert(EndpointResolver::UploadEndpointFromStream("ws://host/news") == "http://host/news/upload");
    std::cout << "[PASS] Upload derivation" << std::endl;
}

void TestStreamAndHealthEndpoints() {
    std::cout << "[Test] Stream and health endpoints..." << std::endl;
    assert(EndpointResolver::StreamEndpoint("localhost:5555", false) == "ws://localhost:5555/ws");
    assert(EndpointResolver::StreamEndpoint("api.example.com/reporter/", true) == "wss://api.example.com/reporter/ws");
    assert(EndpointResolver::HealthEndpointFromStream("wss://api.example.com/reporter/ws") ==
           "https://api.example.com/reporter/health");
    std::cout << "[PASS] Stream and health" << std::endl;
}

void TestResolveFromConfig() {
    std::cout << "[Test] Resolve embeds the credential and honours overrides..." << std::endl;
    runrelay::domain::ReporterConfig config;
    config.endpoint = "localhost:5555";
    config.apiKey = "key with/space";

    auto endpoints = EndpointResolver::Resolve(config);
    assert(endpoints.stream == "ws://localhost:5555/ws");
    assert(endpoints.streamWithToken == "ws://localhost:5555/ws?token=key%20with%2Fspace");
    assert(endpoints.upload == "http://localhost:5555/upload");
    assert(endpoints.health == "http://localhost:5555/health");

    config.endpoint = "api.example.com/reporter";
    config.uploadEndpoint = "https://uploads.example.com/v2/upload";
    endpoints = EndpointResolver::Resolve(config);
    assert(endpoints.stream == "wss://api.example.com/reporter/ws");
    assert(endpoints.upload == "https://uploads.example.com/v2/upload");
    assert(endpoints.health == "https://api.example.com/reporter/health");

    config.secure = false;
    assert(EndpointResolver::Resolve(config).stream == "ws://api.example.com/reporter/ws");
    std::cout << "[PASS] Resolve" << std::endl;
}

void TestUrlParsing() {
    std::cout << "[Test] URL parsing..." << std::endl;
    auto parts = UrlUtils::Parse("wss://api.example.com/reporter/ws?token=abc");
    assert(parts);
    assert(parts->scheme == "wss");
    assert(parts->host == "api.example.com");
    assert(parts->port == "443");
    assert(parts->target == "/reporter/ws?token=abc");
    assert(parts->isSecure());

    parts = UrlUtils::Parse("http://localhost:5555");
    assert(parts && parts->port == "5555" && parts->target == "/");
    assert(!parts->isSecure());

    assert(!UrlUtils::Parse("ftp://example.com"));
    assert(!UrlUtils::Parse("localhost:5555"));
    assert(!UrlUtils::Parse("http://host:abc/"));
    std::cout << "[PASS] URL parsing" << std::endl;
}

} // namespace

int main() {
    TestUploadEndpointDerivation();
    TestStreamAndHealthEndpoints();
    TestResolveFromConfig();
    TestUrlParsing();
    std::cout << "[Test] EndpointResolver tests passed." << std::endl;
    return 0;
}
