/**
 * @file ChunkedTransferClient.hpp
 * @brief Uploads one artifact, whole or in ordered chunks, with retry and backoff.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "domain/FileManifestEntry.hpp"
#include "domain/HttpTransport.hpp"
#include "domain/UploadOutcome.hpp"

namespace runrelay::application {

struct TransferSettings {
    std::string endpoint;                              ///< Whole-file URL; chunks go to endpoint + "/chunk".
    std::string apiKey;
    std::uint64_t chunkSizeBytes = 5ull * 1024 * 1024; ///< Whole-file limit and chunk size.
    int retries = 3;
    std::chrono::milliseconds retryBaseDelay{1000};
    std::chrono::milliseconds retryMaxDelay{10000};
    bool debug = false;
};

/**
 * @class ChunkedTransferClient
 * @brief Stateless per call; safe to share between upload workers.
 *
 * Files up to chunkSizeBytes go out as one multipart request. Larger files
 * are split into ceil(size / chunkSizeBytes) ranges sent in index order under
 * one upload id. A failed chunk restarts the whole sequence on the next
 * attempt with a new upload id.
 */
class ChunkedTransferClient {
public:
    ChunkedTransferClient(std::shared_ptr<domain::HttpTransport> http, TransferSettings settings);

    /**
     * @brief Transfers one file, retrying up to settings.retries times.
     * @return Outcome with the attempt count. Failures are reported, never thrown.
     */
    domain::UploadOutcome transfer(const domain::FileManifestEntry& entry, const std::string& runId);

    /** @brief Number of chunk requests a file of this size needs; 0 means whole-file. */
    std::uint64_t chunkCount(std::uint64_t sizeBytes) const;

    /** @brief Wait after failed attempt @p attempt (0-based). */
    std::chrono::milliseconds retryDelay(int attempt) const;

    const TransferSettings& settings() const { return m_settings; }

private:
    bool uploadWhole(const domain::FileManifestEntry& entry, const std::string& runId, std::string& error);
    bool uploadChunked(const domain::FileManifestEntry& entry, const std::string& runId, std::string& error);
    std::vector<domain::FormField> metadataFields(const domain::FileManifestEntry& entry,
                                                  const std::string& runId) const;
    std::string describeFailure(const domain::HttpResponse& response) const;
    void log(const std::string& message) const;

    std::shared_ptr<domain::HttpTransport> m_http;
    TransferSettings m_settings;
};

} // namespace runrelay::application
