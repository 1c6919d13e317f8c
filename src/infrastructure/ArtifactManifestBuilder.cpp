/**
 * @file ArtifactManifestBuilder.cpp
 * @brief Implementation of the ArtifactManifestBuilder.
 */

#include "infrastructure/ArtifactManifestBuilder.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace runrelay::infrastructure {

ArtifactManifestBuilder::ArtifactManifestBuilder(bool debug)
    : m_debug(debug) {}

std::vector<domain::FileManifestEntry> ArtifactManifestBuilder::scan(const std::string& rootPath) const {
    std::vector<domain::FileManifestEntry> entries;

    std::error_code ec;
    fs::file_status status = fs::status(rootPath, ec);
    if (status.type() == fs::file_type::not_found) {
        // No artifacts is a normal outcome.
        if (m_debug) {
            std::cout << "[ArtifactManifestBuilder] Directory does not exist: " << rootPath << std::endl;
        }
        return entries;
    }
    if (ec) {
        throw fs::filesystem_error("Cannot stat artifacts root", fs::path(rootPath), ec);
    }

    fs::path root = fs::absolute(rootPath).lexically_normal();
    scanDirectory(root, root, entries);

    if (m_debug) {
        std::cout << "[ArtifactManifestBuilder] Found " << entries.size() << " files ("
                  << FormatSize(TotalSize(entries)) << ") in " << rootPath << std::endl;
    }
    return entries;
}

void ArtifactManifestBuilder::scanDirectory(const fs::path& root,
                                            const fs::path& current,
                                            std::vector<domain::FileManifestEntry>& out) const {
    std::vector<fs::directory_entry> children;
    for (const auto& entry : fs::directory_iterator(current)) {
        children.push_back(entry);
    }
    // Stable order makes manifests reproducible across platforms.
    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

    for (const auto& entry : children) {
        // Links are never followed, to files or directories.
        if (entry.is_symlink()) {
            continue;
        }
        if (entry.is_directory()) {
            scanDirectory(root, entry.path(), out);
        } else if (entry.is_regular_file()) {
            domain::FileManifestEntry file;
            file.path = entry.path().string();
            file.sizeBytes = static_cast<std::uint64_t>(fs::file_size(entry.path()));
            file.filename = entry.path().filename().string();
            file.relativePath = entry.path().lexically_relative(root).generic_string();

            if (m_debug) {
                std::cout << "[ArtifactManifestBuilder] Found file: " << file.relativePath
                          << " (" << file.sizeBytes << " bytes)" << std::endl;
            }
            out.push_back(std::move(file));
        }
    }
}

std::uint64_t ArtifactManifestBuilder::TotalSize(const std::vector<domain::FileManifestEntry>& entries) {
    std::uint64_t total = 0;
    for (const auto& entry : entries) {
        total += entry.sizeBytes;
    }
    return total;
}

std::string ArtifactManifestBuilder::FormatSize(std::uint64_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return ss.str();
}

std::size_t ArtifactManifestBuilder::EnrichWithTestIds(std::vector<domain::FileManifestEntry>& entries,
                                                      const std::map<std::string, std::string>& pathToTestId) {
    std::size_t enriched = 0;
    for (auto& entry : entries) {
        auto it = pathToTestId.find(entry.path);
        if (it == pathToTestId.end()) {
            it = pathToTestId.find(fs::path(entry.path).lexically_normal().string());
        }
        if (it != pathToTestId.end()) {
            entry.testId = it->second;
            ++enriched;
        }
    }
    return enriched;
}

} // namespace runrelay::infrastructure
