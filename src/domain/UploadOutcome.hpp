/**
 * @file UploadOutcome.hpp
 * @brief Per-file and per-run results of the artifact upload.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/FileManifestEntry.hpp"

namespace runrelay::domain {

struct UploadOutcome {
    FileManifestEntry file;
    bool success = false;
    std::optional<std::string> error; ///< Description of the last failed attempt.
    int attempts = 0;
};

/**
 * @struct UploadSummary
 * @brief Run-level aggregate. totalBytes counts successful files only.
 */
struct UploadSummary {
    std::size_t totalFiles = 0;
    std::size_t successCount = 0;
    std::size_t failedCount = 0;
    std::uint64_t totalBytes = 0;
    std::vector<UploadOutcome> failures;
};

} // namespace runrelay::domain
