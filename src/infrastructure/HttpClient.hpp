/**
 * @file HttpClient.hpp
 * @brief cpp-httplib implementation of the HTTP transport used for health checks and uploads.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "domain/HttpTransport.hpp"

namespace runrelay::infrastructure {

class HttpClient : public domain::HttpTransport {
public:
    /**
     * @param requestTimeout Connection, read and write bound for each upload request.
     */
    explicit HttpClient(std::chrono::milliseconds requestTimeout = std::chrono::seconds(30), bool debug = false);

    /** @brief Sends a GET with Authorization: Bearer. */
    domain::HttpResponse get(const std::string& url,
                             const std::string& bearerToken,
                             std::chrono::milliseconds timeout) override;

    /** @brief Sends a multipart/form-data POST with Authorization: Bearer. */
    domain::HttpResponse postMultipart(const std::string& url,
                                       const std::string& bearerToken,
                                       const std::vector<domain::FormField>& fields) override;

private:
    std::chrono::milliseconds m_requestTimeout;
    bool m_debug;
};

} // namespace runrelay::infrastructure
