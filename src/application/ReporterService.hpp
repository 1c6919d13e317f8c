/**
 * @file ReporterService.hpp
 * @brief Drives event streaming and artifact upload across one run.
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/ChunkedTransferClient.hpp"
#include "application/EndpointResolver.hpp"
#include "application/StreamingConnectionManager.hpp"
#include "application/UploadOrchestrator.hpp"
#include "domain/EventRecord.hpp"
#include "domain/FileManifestEntry.hpp"
#include "domain/HttpTransport.hpp"
#include "domain/ReporterConfig.hpp"
#include "domain/StreamTransport.hpp"
#include "domain/UploadOutcome.hpp"

namespace runrelay::application {

/**
 * @class ReporterService
 * @brief Run lifecycle: begin() -> emit()* -> end() -> exit().
 *
 * begin() probes the health endpoint. When the probe fails the service is
 * disabled for the rest of the run: no connection is attempted, emit() is a
 * no-op and nothing is uploaded.
 */
class ReporterService {
public:
    ReporterService(domain::ReporterConfig config,
                    std::shared_ptr<domain::StreamTransport> streamTransport,
                    std::shared_ptr<domain::HttpTransport> httpTransport);
    ~ReporterService();

    ReporterService(const ReporterService&) = delete;
    ReporterService& operator=(const ReporterService&) = delete;

    /**
     * @brief Health probe, then connection start and upload pipeline setup.
     * @return true if the service is active.
     */
    bool begin();

    /** @brief Builds and sends one event record. Caller fields follow event, timestamp, runId. */
    void emit(const std::string& eventName,
              const domain::EventRecord::Json& fields = domain::EventRecord::Json::object());

    /** @brief Associates an attachment's absolute path with the test that produced it. */
    void registerAttachment(const std::string& absolutePath, const std::string& testId);

    /** @brief Emits onEnd and builds the artifact manifest. */
    void end(const domain::EventRecord::Json& fields = domain::EventRecord::Json::object());

    /**
     * @brief Uploads the manifest, emits onExit and closes the connection.
     * @return The upload summary, or nullopt when uploads did not run.
     */
    std::optional<domain::UploadSummary> exit();

    bool isDisabled() const;
    const std::string& runId() const { return m_runId; }
    const ResolvedEndpoints& endpoints() const { return m_endpoints; }
    std::vector<domain::FileManifestEntry> manifest() const;
    domain::ConnectionState connectionState() const;

    /** @brief "run_<epochMillis>_<9 base-36 chars>". */
    static std::string GenerateRunId();

private:
    bool probeHealth();
    void log(const std::string& message) const;

    domain::ReporterConfig m_config;
    ResolvedEndpoints m_endpoints;
    std::shared_ptr<domain::StreamTransport> m_streamTransport;
    std::shared_ptr<domain::HttpTransport> m_http;
    std::string m_runId;

    mutable std::mutex m_mutex;
    bool m_began = false;
    bool m_disabled = false;
    bool m_exited = false;
    std::map<std::string, std::string> m_attachmentTestIds;
    std::vector<domain::FileManifestEntry> m_manifest;

    std::unique_ptr<StreamingConnectionManager> m_connection;
    std::unique_ptr<UploadOrchestrator> m_uploader;
};

} // namespace runrelay::application
