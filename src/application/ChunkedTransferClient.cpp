/**
 * @file ChunkedTransferClient.cpp
 * @brief Implementation of ChunkedTransferClient.
 */

#include "application/ChunkedTransferClient.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <fstream>
#include <iostream>
#include <random>
#include <thread>

namespace runrelay::application {

namespace {

const char* const kOctetStream = "application/octet-stream";

bool ReadFileRange(const std::string& path, std::uint64_t offset, std::uint64_t length,
                   std::string& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error = "Cannot open " + path;
        return false;
    }
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    out.resize(static_cast<std::size_t>(length));
    if (length > 0) {
        in.read(&out[0], static_cast<std::streamsize>(length));
    }
    if (static_cast<std::uint64_t>(in.gcount()) != length) {
        error = "Short read on " + path + " at offset " + std::to_string(offset);
        return false;
    }
    return true;
}

std::string GenerateUploadId(const std::string& runId) {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphabet) - 2);

    std::string suffix;
    suffix.reserve(10);
    for (int i = 0; i < 10; ++i) {
        suffix += alphabet[pick(rng)];
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return runId + "_" + std::to_string(millis) + "_" + suffix;
}

} // namespace

ChunkedTransferClient::ChunkedTransferClient(std::shared_ptr<domain::HttpTransport> http,
                                             TransferSettings settings)
    : m_http(std::move(http)), m_settings(std::move(settings)) {
    m_settings.chunkSizeBytes = std::max<std::uint64_t>(m_settings.chunkSizeBytes, 1);
    m_settings.retries = std::max(m_settings.retries, 0);
}

std::uint64_t ChunkedTransferClient::chunkCount(std::uint64_t sizeBytes) const {
    if (sizeBytes <= m_settings.chunkSizeBytes) {
        return 0;
    }
    return (sizeBytes + m_settings.chunkSizeBytes - 1) / m_settings.chunkSizeBytes;
}

std::chrono::milliseconds ChunkedTransferClient::retryDelay(int attempt) const {
    double exponential = static_cast<double>(m_settings.retryBaseDelay.count()) * std::pow(2.0, attempt);
    double capped = std::min(exponential, static_cast<double>(m_settings.retryMaxDelay.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

domain::UploadOutcome ChunkedTransferClient::transfer(const domain::FileManifestEntry& entry,
                                                      const std::string& runId) {
    domain::UploadOutcome outcome;
    outcome.file = entry;

    const int maxAttempts = m_settings.retries + 1;
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        ++outcome.attempts;

        std::string error;
        bool ok = false;
        try {
            ok = entry.sizeBytes > m_settings.chunkSizeBytes
                ? uploadChunked(entry, runId, error)
                : uploadWhole(entry, runId, error);
        } catch (const std::exception& e) {
            // Counts as a failed attempt; the worker thread must survive.
            error = std::string("Exception: ") + e.what();
        }

        if (ok) {
            log("Uploaded: " + entry.relativePath);
            outcome.success = true;
            outcome.error.reset();
            return outcome;
        }

        outcome.error = error;
        std::cerr << "[ChunkedTransferClient] Upload failed (attempt " << (attempt + 1) << "/"
                  << maxAttempts << "): " << entry.relativePath << ": " << error << std::endl;

        if (attempt + 1 < maxAttempts) {
            auto delay = retryDelay(attempt);
            log("Retrying in " + std::to_string(delay.count()) + "ms...");
            std::this_thread::sleep_for(delay);
        }
    }

    return outcome;
}

bool ChunkedTransferClient::uploadWhole(const domain::FileManifestEntry& entry,
                                        const std::string& runId,
                                        std::string& error) {
    std::string content;
    if (!ReadFileRange(entry.path, 0, entry.sizeBytes, content, error)) {
        return false;
    }

    auto fields = metadataFields(entry, runId);
    fields.insert(fields.begin(), domain::FormField{"file", std::move(content), entry.filename, kOctetStream});

    auto response = m_http->postMultipart(m_settings.endpoint, m_settings.apiKey, fields);
    if (!response.ok()) {
        error = describeFailure(response);
        return false;
    }
    return true;
}

bool ChunkedTransferClient::uploadChunked(const domain::FileManifestEntry& entry,
                                          const std::string& runId,
                                          std::string& error) {
    const std::uint64_t totalChunks = chunkCount(entry.sizeBytes);
    const std::string uploadId = GenerateUploadId(runId);
    const std::string chunkUrl = m_settings.endpoint + "/chunk";

    log("Uploading " + entry.relativePath + " in " + std::to_string(totalChunks) +
        " chunks (" + std::to_string(entry.sizeBytes) + " bytes)");

    for (std::uint64_t index = 0; index < totalChunks; ++index) {
        std::uint64_t start = index * m_settings.chunkSizeBytes;
        std::uint64_t length = std::min(m_settings.chunkSizeBytes, entry.sizeBytes - start);

        std::string bytes;
        if (!ReadFileRange(entry.path, start, length, bytes, error)) {
            return false;
        }

        auto fields = metadataFields(entry, runId);
        fields.insert(fields.begin(), domain::FormField{"file", std::move(bytes), entry.filename, kOctetStream});
        fields.push_back({"uploadId", uploadId, "", ""});
        fields.push_back({"chunkIndex", std::to_string(index), "", ""});
        fields.push_back({"totalChunks", std::to_string(totalChunks), "", ""});

        auto response = m_http->postMultipart(chunkUrl, m_settings.apiKey, fields);
        if (!response.ok()) {
            error = describeFailure(response) + " (chunk " + std::to_string(index + 1) + "/" +
                    std::to_string(totalChunks) + ")";
            return false;
        }
        log("Uploaded chunk " + std::to_string(index + 1) + "/" + std::to_string(totalChunks));
    }
    return true;
}

std::vector<domain::FormField> ChunkedTransferClient::metadataFields(const domain::FileManifestEntry& entry,
                                                                     const std::string& runId) const {
    std::vector<domain::FormField> fields;
    fields.push_back({"runId", runId, "", ""});
    fields.push_back({"relativePath", entry.relativePath, "", ""});
    if (entry.testId) {
        fields.push_back({"testId", *entry.testId, "", ""});
    }
    return fields;
}

std::string ChunkedTransferClient::describeFailure(const domain::HttpResponse& response) const {
    if (response.status == 0) {
        return response.error.empty() ? "Network error" : response.error;
    }
    return "HTTP " + std::to_string(response.status);
}

void ChunkedTransferClient::log(const std::string& message) const {
    if (m_settings.debug) {
        std::cout << "[ChunkedTransferClient] " << message << std::endl;
    }
}

} // namespace runrelay::application
