/**
 * @file ReporterConfig.hpp
 * @brief Settings for event streaming and artifact upload.
 */

#pragma once
#include <optional>
#include <string>

namespace runrelay::domain {

struct ReconnectSettings {
    bool enabled = true;
    int maxAttempts = 10;
    int initialDelayMs = 1000;
    int maxDelayMs = 30000;
};

struct UploadSettings {
    bool enabled = true;
    int parallel = 3;
    int chunkSizeMb = 5;
    int retries = 3;
};

/**
 * @struct ReporterConfig
 * @brief Resolved configuration. See ConfigLoader for file and environment sources.
 */
struct ReporterConfig {
    std::string apiKey;
    std::string endpoint = "api.runrelay.dev/reporter"; ///< Host and base path, no scheme.
    std::optional<bool> secure;                        ///< Unset: secure unless localhost.
    bool debug = false;
    std::string artifactsDir = "test-results";
    std::optional<std::string> uploadEndpoint;         ///< Overrides the derived upload URL.

    int bufferCapacity = 1000;
    int heartbeatIntervalMs = 30000;
    int healthTimeoutMs = 3000;
    int handshakeTimeoutMs = 3000;
    int closeTimeoutMs = 3000;

    ReconnectSettings reconnect;
    UploadSettings upload;

    bool useSecureTransport() const {
        if (secure) {
            return *secure;
        }
        bool isLocalhost = endpoint.rfind("localhost", 0) == 0 || endpoint.rfind("127.0.0.1", 0) == 0;
        return !isLocalhost;
    }
};

} // namespace runrelay::domain
