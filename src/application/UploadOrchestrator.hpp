/**
 * @file UploadOrchestrator.hpp
 * @brief Drives a bounded pool of upload workers over a shared pending list.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/ChunkedTransferClient.hpp"
#include "domain/FileManifestEntry.hpp"
#include "domain/UploadOutcome.hpp"

namespace runrelay::application {

/**
 * @class UploadOrchestrator
 * @brief Pull-based worker pool: each worker claims the next pending file until none remain.
 */
class UploadOrchestrator {
public:
    explicit UploadOrchestrator(std::shared_ptr<ChunkedTransferClient> client, bool debug = false);

    /**
     * @brief Uploads every manifest entry exactly once using at most @p concurrency workers.
     *
     * Blocks until all workers finish. An empty manifest returns a zero summary
     * without starting any worker.
     */
    domain::UploadSummary uploadAll(const std::vector<domain::FileManifestEntry>& manifest,
                                    const std::string& runId,
                                    int concurrency);

private:
    static domain::UploadSummary Summarize(const std::vector<domain::UploadOutcome>& outcomes);

    std::shared_ptr<ChunkedTransferClient> m_client;
    bool m_debug;
};

} // namespace runrelay::application
