/**
 * @file EndpointResolver.hpp
 * @brief Derives streaming, upload and health URLs from configuration.
 */

#pragma once
#include <string>
#include "domain/ReporterConfig.hpp"

namespace runrelay::application {

struct ResolvedEndpoints {
    std::string stream;        ///< Without credential.
    std::string streamWithToken;
    std::string upload;
    std::string health;
};

class EndpointResolver {
public:
    /** @brief "{ws|wss}://{base}/ws" for a base endpoint without scheme. */
    static std::string StreamEndpoint(const std::string& baseEndpoint, bool secure);

    /**
     * @brief Swaps ws->http / wss->https and replaces a trailing "/ws" with "/upload",
     *        or appends "/upload" when there is none.
     */
    static std::string UploadEndpointFromStream(const std::string& streamUrl);

    /** @brief Same derivation as the upload endpoint, ending in "/health". */
    static std::string HealthEndpointFromStream(const std::string& streamUrl);

    static ResolvedEndpoints Resolve(const domain::ReporterConfig& config);

private:
    static std::string DeriveHttpEndpoint(const std::string& streamUrl, const std::string& leaf);
};

} // namespace runrelay::application
