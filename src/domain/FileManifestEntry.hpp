/**
 * @file FileManifestEntry.hpp
 * @brief One artifact found under the scan root.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace runrelay::domain {

/**
 * @struct FileManifestEntry
 * @brief Immutable after the scan except for the optional test correlation.
 */
struct FileManifestEntry {
    std::string path;                  ///< Absolute path on disk.
    std::uint64_t sizeBytes = 0;       ///< Size at scan time.
    std::string filename;              ///< Basename.
    std::string relativePath;          ///< Path relative to the scan root, '/' separated.
    std::optional<std::string> testId; ///< Test that produced the file, if known.
};

} // namespace runrelay::domain
