#include "application/EndpointResolver.hpp"
#include "infrastructure/UrlUtils.hpp"

namespace runrelay::application {

std::string EndpointResolver::StreamEndpoint(const std::string& baseEndpoint, bool secure) {
    std::string base = baseEndpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return std::string(secure ? "wss" : "ws") + "://" + base + "/ws";
}

std::string EndpointResolver::UploadEndpointFromStream(const std::string& streamUrl) {
    return DeriveHttpEndpoint(streamUrl, "upload");
}

std::string EndpointResolver::HealthEndpointFromStream(const std::string& streamUrl) {
    return DeriveHttpEndpoint(streamUrl, "health");
}

ResolvedEndpoints EndpointResolver::Resolve(const domain::ReporterConfig& config) {
    ResolvedEndpoints endpoints;
    endpoints.stream = StreamEndpoint(config.endpoint, config.useSecureTransport());
    endpoints.streamWithToken = infrastructure::UrlUtils::AppendQueryParameter(endpoints.stream, "token", config.apiKey);
    endpoints.upload = config.uploadEndpoint && !config.uploadEndpoint->empty()
        ? *config.uploadEndpoint
        : UploadEndpointFromStream(endpoints.stream);
    endpoints.health = HealthEndpointFromStream(endpoints.stream);
    return endpoints;
}

std::string EndpointResolver::DeriveHttpEndpoint(const std::string& streamUrl, const std::string& leaf) {
    std::string scheme;
    std::string rest;
    auto schemeEnd = streamUrl.find("://");
    if (schemeEnd == std::string::npos) {
        rest = streamUrl;
    } else {
        scheme = streamUrl.substr(0, schemeEnd);
        rest = streamUrl.substr(schemeEnd + 3);
    }

    if (scheme == "wss") {
        scheme = "https";
    } else if (scheme == "ws" || scheme.empty()) {
        scheme = "http";
    }

    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }

    // Only a trailing path segment named exactly "ws" is replaced, never a host.
    const std::string wsSegment = "/ws";
    auto firstSlash = rest.find('/');
    if (firstSlash != std::string::npos && rest.size() >= wsSegment.size() &&
        rest.compare(rest.size() - wsSegment.size(), wsSegment.size(), wsSegment) == 0) {
        rest.erase(rest.size() - wsSegment.size());
    }

    return scheme + "://" + rest + "/" + leaf;
}

} // namespace runrelay::application
