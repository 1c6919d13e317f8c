/**
 * @file UploadOrchestrator.cpp
 * @brief Implementation of UploadOrchestrator.
 */

#include "application/UploadOrchestrator.hpp"
#include <algorithm>
#include <deque>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

namespace runrelay::application {

namespace {

/**
 * @brief State shared by the workers of one uploadAll() call.
 */
class UploadWorkQueue {
public:
    explicit UploadWorkQueue(const std::vector<domain::FileManifestEntry>& manifest)
        : m_pending(manifest.begin(), manifest.end()) {}

    std::optional<domain::FileManifestEntry> claimNext() {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        if (m_pending.empty()) {
            return std::nullopt;
        }
        domain::FileManifestEntry entry = std::move(m_pending.front());
        m_pending.pop_front();
        return entry;
    }

    void record(domain::UploadOutcome outcome) {
        std::lock_guard<std::mutex> lock(m_outcomesMutex);
        m_outcomes.push_back(std::move(outcome));
    }

    std::vector<domain::UploadOutcome> takeOutcomes() {
        std::lock_guard<std::mutex> lock(m_outcomesMutex);
        return std::move(m_outcomes);
    }

private:
    std::mutex m_pendingMutex;
    std::deque<domain::FileManifestEntry> m_pending;

    std::mutex m_outcomesMutex;
    std::vector<domain::UploadOutcome> m_outcomes;
};

} // namespace

UploadOrchestrator::UploadOrchestrator(std::shared_ptr<ChunkedTransferClient> client, bool debug)
    : m_client(std::move(client)), m_debug(debug) {}

domain::UploadSummary UploadOrchestrator::uploadAll(const std::vector<domain::FileManifestEntry>& manifest,
                                                    const std::string& runId,
                                                    int concurrency) {
    if (manifest.empty()) {
        if (m_debug) {
            std::cout << "[UploadOrchestrator] No files to upload" << std::endl;
        }
        return {};
    }

    const std::size_t workerCount = std::min<std::size_t>(
        static_cast<std::size_t>(std::max(concurrency, 1)), manifest.size());

    if (m_debug) {
        std::cout << "[UploadOrchestrator] Starting upload of " << manifest.size()
                  << " files with concurrency " << workerCount << std::endl;
    }

    UploadWorkQueue queue(manifest);
    std::vector<std::thread> workers;
    workers.reserve(workerCount);

    for (std::size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back([this, &queue, &runId]() {
            while (auto entry = queue.claimNext()) {
                queue.record(m_client->transfer(*entry, runId));
            }
        });
    }

    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }

    domain::UploadSummary summary = Summarize(queue.takeOutcomes());

    if (m_debug) {
        std::cout << "[UploadOrchestrator] Upload complete: " << summary.successCount << "/"
                  << summary.totalFiles << " succeeded" << std::endl;
    }
    if (!summary.failures.empty()) {
        std::cerr << "[UploadOrchestrator] Failed uploads:" << std::endl;
        for (const auto& failure : summary.failures) {
            std::cerr << "  - " << failure.file.relativePath << ": "
                      << failure.error.value_or("unknown error") << std::endl;
        }
    }
    return summary;
}

domain::UploadSummary UploadOrchestrator::Summarize(const std::vector<domain::UploadOutcome>& outcomes) {
    domain::UploadSummary summary;
    summary.totalFiles = outcomes.size();
    for (const auto& outcome : outcomes) {
        if (outcome.success) {
            ++summary.successCount;
            summary.totalBytes += outcome.file.sizeBytes;
        } else {
            ++summary.failedCount;
            summary.failures.push_back(outcome);
        }
    }
    return summary;
}

} // namespace runrelay::application
