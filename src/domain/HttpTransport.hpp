/**
 * @file HttpTransport.hpp
 * @brief Interface for the request/response calls made during a run.
 */

#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace runrelay::domain {

/**
 * @struct HttpResponse
 * @brief status is 0 when no response arrived; error then explains why.
 */
struct HttpResponse {
    int status = 0;
    std::string body;
    std::string error;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @struct FormField
 * @brief One part of a multipart/form-data body. A non-empty filename marks a file part.
 */
struct FormField {
    std::string name;
    std::string content;
    std::string filename;
    std::string contentType;
};

/**
 * @class HttpTransport
 * @brief Abstract HTTP client. Implementations bound every call with timeouts.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /** @brief GET with a bearer credential and an explicit timeout. */
    virtual HttpResponse get(const std::string& url,
                             const std::string& bearerToken,
                             std::chrono::milliseconds timeout) = 0;

    /** @brief POST of a multipart/form-data body with a bearer credential. */
    virtual HttpResponse postMultipart(const std::string& url,
                                       const std::string& bearerToken,
                                       const std::vector<FormField>& fields) = 0;
};

} // namespace runrelay::domain
