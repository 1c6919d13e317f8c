#include "infrastructure/HttpClient.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <httplib.h>
#include <iostream>

namespace runrelay::infrastructure {

namespace {

httplib::Headers BearerHeaders(const std::string& token) {
    return httplib::Headers{{"Authorization", "Bearer " + token}};
}

domain::HttpResponse ToResponse(const httplib::Result& res) {
    domain::HttpResponse response;
    if (res) {
        response.status = res->status;
        response.body = res->body;
    } else {
        response.error = "Connection failed: " + std::to_string(static_cast<int>(res.error()));
    }
    return response;
}

} // namespace

HttpClient::HttpClient(std::chrono::milliseconds requestTimeout, bool debug)
    : m_requestTimeout(requestTimeout), m_debug(debug) {}

domain::HttpResponse HttpClient::get(const std::string& url,
                                     const std::string& bearerToken,
                                     std::chrono::milliseconds timeout) {
    auto parts = UrlUtils::Parse(url);
    if (!parts) {
        return {0, "", "Invalid URL: " + url};
    }

    httplib::Client cli(parts->origin());
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    auto res = cli.Get(parts->target, BearerHeaders(bearerToken));
    auto response = ToResponse(res);
    if (m_debug) {
        std::cout << "[HttpClient] GET " << url << " -> "
                  << (response.status ? std::to_string(response.status) : response.error) << std::endl;
    }
    return response;
}

domain::HttpResponse HttpClient::postMultipart(const std::string& url,
                                               const std::string& bearerToken,
                                               const std::vector<domain::FormField>& fields) {
    auto parts = UrlUtils::Parse(url);
    if (!parts) {
        return {0, "", "Invalid URL: " + url};
    }

    httplib::Client cli(parts->origin());
    cli.set_connection_timeout(m_requestTimeout);
    cli.set_read_timeout(m_requestTimeout);
    cli.set_write_timeout(m_requestTimeout);

    httplib::MultipartFormDataItems items;
    items.reserve(fields.size());
    for (const auto& field : fields) {
        items.push_back({field.name, field.content, field.filename, field.contentType});
    }

    auto res = cli.Post(parts->target, BearerHeaders(bearerToken), items);
    auto response = ToResponse(res);
    if (!response.ok()) {
        if (res) {
            std::cerr << "[HttpClient] HTTP Error " << response.status << " from " << url << std::endl;
        } else {
            std::cerr << "[HttpClient] " << response.error << " (" << url << ")" << std::endl;
        }
    }
    return response;
}

} // namespace runrelay::infrastructure
