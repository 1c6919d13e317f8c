/**
 * @file ArtifactManifestBuilder.hpp
 * @brief Scanner that lists the artifacts left behind by a run.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "domain/FileManifestEntry.hpp"

namespace runrelay::infrastructure {

/**
 * @class ArtifactManifestBuilder
 * @brief Walks an artifacts directory once and records every regular file without reading it.
 */
class ArtifactManifestBuilder {
public:
    explicit ArtifactManifestBuilder(bool debug = false);

    /**
     * @brief Depth-first scan of @p rootPath.
     * @return One entry per regular file. Empty when the root does not exist.
     * @throws std::filesystem::filesystem_error on any other filesystem failure.
     */
    std::vector<domain::FileManifestEntry> scan(const std::string& rootPath) const;

    static std::uint64_t TotalSize(const std::vector<domain::FileManifestEntry>& entries);

    /** @brief "1.5 MB" style rendering with B, KB, MB and GB units. */
    static std::string FormatSize(std::uint64_t bytes);

    /**
     * @brief Sets testId on entries whose absolute path appears in @p pathToTestId.
     * @return Number of entries enriched.
     */
    static std::size_t EnrichWithTestIds(std::vector<domain::FileManifestEntry>& entries,
                                         const std::map<std::string, std::string>& pathToTestId);

private:
    void scanDirectory(const std::filesystem::path& root,
                       const std::filesystem::path& current,
                       std::vector<domain::FileManifestEntry>& out) const;

    bool m_debug;
};

} // namespace runrelay::infrastructure
