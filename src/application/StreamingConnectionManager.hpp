/**
 * @file StreamingConnectionManager.hpp
 * @brief Owns the persistent event stream: state machine, reconnects, heartbeat, buffering.
 */

#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "application/EventBuffer.hpp"
#include "application/ReconnectPolicy.hpp"
#include "application/TaskScheduler.hpp"
#include "domain/ConnectionState.hpp"
#include "domain/EventRecord.hpp"
#include "domain/ReporterConfig.hpp"
#include "domain/StreamTransport.hpp"

namespace runrelay::application {

/**
 * @struct ConnectionSettings
 * @brief Everything the manager needs besides its transport.
 */
struct ConnectionSettings {
    std::string url;                                  ///< Endpoint with the credential already embedded.
    domain::ReconnectSettings reconnect;
    std::size_t bufferCapacity = EventBuffer::kDefaultCapacity;
    std::chrono::milliseconds heartbeatInterval{30000};
    std::chrono::milliseconds handshakeTimeout{3000};
    std::chrono::milliseconds closeTimeout{3000};
    bool debug = false;
};

/**
 * @class StreamingConnectionManager
 * @brief Delivers event records over one persistent connection, buffering while it is down.
 *
 * Connection attempts, reconnect timers and heartbeats all run on a private
 * TaskScheduler thread. One mutex serializes state transitions, sends and the
 * drain that follows every successful connect, so records sent by the
 * producer never overtake records already buffered.
 */
class StreamingConnectionManager {
public:
    static constexpr int kNormalClosure = 1000;

    StreamingConnectionManager(std::shared_ptr<domain::StreamTransport> transport,
                               ConnectionSettings settings);
    ~StreamingConnectionManager();

    StreamingConnectionManager(const StreamingConnectionManager&) = delete;
    StreamingConnectionManager& operator=(const StreamingConnectionManager&) = delete;

    /** @brief Schedules the first connection attempt. Returns immediately. */
    void start();

    /**
     * @brief Transmits the record now if connected, otherwise buffers it.
     *
     * Never throws and never reports failure; delivery is best effort.
     */
    void send(const domain::EventRecord& record);

    /**
     * @brief Terminal shutdown: cancels timers, flushes, closes with code 1000.
     *
     * Bounded by the configured close timeout. Later calls are no-ops.
     */
    void close();

    domain::ConnectionState state() const;
    std::size_t bufferedCount() const;

    /** @brief Reconnects scheduled since the last successful connection. */
    int reconnectAttempts() const;

    /** @brief Every connection attempt made, including the first. */
    int connectAttempts() const;

private:
    void attemptConnect();
    void handleTransportClosed(int code, const std::string& reason);
    void handleMessage(const std::string& text);
    void sendHeartbeat();

    bool transitionLocked(domain::ConnectionState next);
    void scheduleReconnectLocked();
    void startHeartbeatLocked();
    void stopHeartbeatLocked();
    void drainBufferLocked();
    bool sendImmediateLocked(const domain::EventRecord& record);
    void log(const std::string& message) const;

    std::shared_ptr<domain::StreamTransport> m_transport;
    ConnectionSettings m_settings;
    EventBuffer m_buffer;

    mutable std::mutex m_mutex;
    ReconnectPolicy m_policy;
    domain::ConnectionState m_state = domain::ConnectionState::Disconnected;
    int m_reconnectAttempts = 0;
    int m_connectAttempts = 0;
    bool m_started = false;
    TaskHandle m_reconnectTask = kInvalidTask;
    TaskHandle m_heartbeatTask = kInvalidTask;

    // Declared last so its worker is joined before anything it touches is destroyed.
    TaskScheduler m_scheduler;
};

} // namespace runrelay::application
