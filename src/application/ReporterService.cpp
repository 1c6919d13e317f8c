/**
 * @file ReporterService.cpp
 * @brief Implementation of ReporterService.
 */

#include "application/ReporterService.hpp"
#include "infrastructure/ArtifactManifestBuilder.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>

namespace runrelay::application {

ReporterService::ReporterService(domain::ReporterConfig config,
                                 std::shared_ptr<domain::StreamTransport> streamTransport,
                                 std::shared_ptr<domain::HttpTransport> httpTransport)
    : m_config(std::move(config)),
      m_endpoints(EndpointResolver::Resolve(m_config)),
      m_streamTransport(std::move(streamTransport)),
      m_http(std::move(httpTransport)),
      m_runId(GenerateRunId()) {
    if (m_config.apiKey.empty()) {
        std::cerr << "[ReporterService] No API key configured" << std::endl;
    }
}

ReporterService::~ReporterService() {
    if (m_connection) {
        m_connection->close();
    }
}

bool ReporterService::begin() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_began) {
        return !m_disabled;
    }
    m_began = true;

    if (!probeHealth()) {
        m_disabled = true;
        std::cerr << "[ReporterService] Reporting disabled for run " << m_runId << std::endl;
        return false;
    }

    ConnectionSettings connection;
    connection.url = m_endpoints.streamWithToken;
    connection.reconnect = m_config.reconnect;
    connection.bufferCapacity = static_cast<std::size_t>(std::max(m_config.bufferCapacity, 1));
    connection.heartbeatInterval = std::chrono::milliseconds(m_config.heartbeatIntervalMs);
    connection.handshakeTimeout = std::chrono::milliseconds(m_config.handshakeTimeoutMs);
    connection.closeTimeout = std::chrono::milliseconds(m_config.closeTimeoutMs);
    connection.debug = m_config.debug;
    m_connection = std::make_unique<StreamingConnectionManager>(m_streamTransport, connection);
    m_connection->start();

    if (m_config.upload.enabled) {
        TransferSettings transfer;
        transfer.endpoint = m_endpoints.upload;
        transfer.apiKey = m_config.apiKey;
        transfer.chunkSizeBytes = static_cast<std::uint64_t>(std::max(m_config.upload.chunkSizeMb, 1)) * 1024 * 1024;
        transfer.retries = m_config.upload.retries;
        transfer.debug = m_config.debug;
        auto client = std::make_shared<ChunkedTransferClient>(m_http, transfer);
        m_uploader = std::make_unique<UploadOrchestrator>(client, m_config.debug);
    }

    log("Initialized run " + m_runId);
    log("  Stream: " + m_endpoints.stream);
    log("  Upload: " + (m_uploader ? m_endpoints.upload : std::string("disabled")));
    return true;
}

void ReporterService::emit(const std::string& eventName, const domain::EventRecord::Json& fields) {
    StreamingConnectionManager* connection = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disabled || !m_connection) {
            return;
        }
        connection = m_connection.get();
    }
    connection->send(domain::EventRecord::Create(eventName, m_runId, domain::EventRecord::NowTimestamp(), fields));
}

void ReporterService::registerAttachment(const std::string& absolutePath, const std::string& testId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_config.debug) {
        log("Mapping attachment to test: " + absolutePath + " -> " + testId);
    }
    m_attachmentTestIds[absolutePath] = testId;
}

void ReporterService::end(const domain::EventRecord::Json& fields) {
    if (isDisabled()) {
        return;
    }
    emit("onEnd", fields);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_uploader) {
        return;
    }

    log("Scanning " + m_config.artifactsDir + " for files to upload...");
    infrastructure::ArtifactManifestBuilder builder(m_config.debug);
    try {
        std::filesystem::path root = std::filesystem::absolute(m_config.artifactsDir);
        m_manifest = builder.scan(root.string());
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[ReporterService] Artifact scan failed: " << e.what() << std::endl;
        m_manifest.clear();
        return;
    }

    std::size_t enriched = infrastructure::ArtifactManifestBuilder::EnrichWithTestIds(m_manifest, m_attachmentTestIds);
    log("Found " + std::to_string(m_manifest.size()) + " files (" +
        infrastructure::ArtifactManifestBuilder::FormatSize(infrastructure::ArtifactManifestBuilder::TotalSize(m_manifest)) +
        "), " + std::to_string(enriched) + " linked to tests");
}

std::optional<domain::UploadSummary> ReporterService::exit() {
    std::vector<domain::FileManifestEntry> manifest;
    UploadOrchestrator* uploader = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disabled || m_exited || !m_began) {
            return std::nullopt;
        }
        m_exited = true;
        manifest = m_manifest;
        uploader = m_uploader.get();
    }

    std::optional<domain::UploadSummary> summary;
    if (uploader) {
        log("Uploading artifacts...");
        summary = uploader->uploadAll(manifest, m_runId, m_config.upload.parallel);
    }

    emit("onExit");

    if (m_connection) {
        log("Closing connection...");
        m_connection->close();
    }
    log("Reporter finished");
    return summary;
}

bool ReporterService::isDisabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disabled;
}

std::vector<domain::FileManifestEntry> ReporterService::manifest() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_manifest;
}

domain::ConnectionState ReporterService::connectionState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connection ? m_connection->state() : domain::ConnectionState::Disconnected;
}

std::string ReporterService::GenerateRunId() {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphabet) - 2);

    std::string suffix;
    for (int i = 0; i < 9; ++i) {
        suffix += alphabet[pick(rng)];
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "run_" + std::to_string(millis) + "_" + suffix;
}

bool ReporterService::probeHealth() {
    int timeoutMs = m_config.healthTimeoutMs;
    if (timeoutMs <= 0) {
        timeoutMs = domain::ReporterConfig{}.healthTimeoutMs;
        std::cerr << "[ReporterService] healthTimeoutMs must be positive, using " << timeoutMs << "ms" << std::endl;
    }
    const auto timeout = std::chrono::milliseconds(timeoutMs);
    log("Performing health check to " + m_endpoints.health + " with timeout " +
        std::to_string(timeout.count()) + "ms");

    auto response = m_http->get(m_endpoints.health, m_config.apiKey, timeout);
    if (response.ok()) {
        log("Health check passed");
        return true;
    }

    if (response.status == 0) {
        std::cerr << "[ReporterService] Health check failed: "
                  << (response.error.empty() ? "no response" : response.error) << std::endl;
    } else {
        std::cerr << "[ReporterService] Health check failed with status " << response.status << std::endl;
    }
    return false;
}

void ReporterService::log(const std::string& message) const {
    if (m_config.debug) {
        std::cout << "[ReporterService] " << message << std::endl;
    }
}

} // namespace runrelay::application
