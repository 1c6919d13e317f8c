/**
 * @file StreamingConnectionManager.cpp
 * @brief Implementation of StreamingConnectionManager.
 */

#include "application/StreamingConnectionManager.hpp"
#include <iostream>

namespace runrelay::application {

using domain::ConnectionState;

namespace {
const char* const kHeartbeatMessage = R"({"type":"ping"})";
const char* const kCloseReason = "Reporter finished";

void KeepPositive(std::chrono::milliseconds& value, std::chrono::milliseconds fallback, const char* name) {
    if (value.count() <= 0) {
        std::cerr << "[StreamingConnectionManager] " << name << " must be positive, using "
                  << fallback.count() << "ms" << std::endl;
        value = fallback;
    }
}

ConnectionSettings Sanitized(ConnectionSettings settings) {
    const ConnectionSettings defaults;
    KeepPositive(settings.heartbeatInterval, defaults.heartbeatInterval, "heartbeatInterval");
    KeepPositive(settings.handshakeTimeout, defaults.handshakeTimeout, "handshakeTimeout");
    KeepPositive(settings.closeTimeout, defaults.closeTimeout, "closeTimeout");
    return settings;
}
}

StreamingConnectionManager::StreamingConnectionManager(std::shared_ptr<domain::StreamTransport> transport,
                                                       ConnectionSettings settings)
    : m_transport(std::move(transport)),
      m_settings(Sanitized(std::move(settings))),
      m_buffer(m_settings.bufferCapacity, m_settings.debug),
      m_policy(m_settings.reconnect) {
    m_transport->setCloseHandler([this](int code, const std::string& reason) {
        handleTransportClosed(code, reason);
    });
    m_transport->setMessageHandler([this](const std::string& text) {
        handleMessage(text);
    });
}

StreamingConnectionManager::~StreamingConnectionManager() {
    close();
    m_scheduler.stop();
    m_transport->setCloseHandler(nullptr);
    m_transport->setMessageHandler(nullptr);
}

void StreamingConnectionManager::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_started || m_state == ConnectionState::Closing) {
        return;
    }
    m_started = true;
    m_reconnectTask = m_scheduler.schedule(std::chrono::milliseconds(0), [this] { attemptConnect(); });
}

void StreamingConnectionManager::send(const domain::EventRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == ConnectionState::Connected && sendImmediateLocked(record)) {
        return;
    }
    m_buffer.enqueue(record);
    if (m_settings.debug) {
        log("Queued: " + record.kind());
    }
}

void StreamingConnectionManager::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == ConnectionState::Closing) {
            return;
        }
        transitionLocked(ConnectionState::Closing);

        if (m_reconnectTask != kInvalidTask) {
            m_scheduler.cancel(m_reconnectTask);
            m_reconnectTask = kInvalidTask;
        }
        stopHeartbeatLocked();
    }

    // Outside the lock: the transport's I/O thread may be waiting on it to report a drop.
    m_transport->close(kNormalClosure, kCloseReason, m_settings.closeTimeout);

    std::size_t leftover = m_buffer.size();
    if (leftover > 0) {
        std::cerr << "[StreamingConnectionManager] Closed with " << leftover
                  << " undelivered events" << std::endl;
    }
    log("Closed");
}

ConnectionState StreamingConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::size_t StreamingConnectionManager::bufferedCount() const {
    return m_buffer.size();
}

int StreamingConnectionManager::reconnectAttempts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reconnectAttempts;
}

int StreamingConnectionManager::connectAttempts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connectAttempts;
}

void StreamingConnectionManager::attemptConnect() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_reconnectTask = kInvalidTask;
        if (m_state != ConnectionState::Disconnected) {
            return;
        }
        transitionLocked(ConnectionState::Connecting);
        ++m_connectAttempts;
    }

    log("Connecting (attempt " + std::to_string(connectAttempts()) + ")");
    bool connected = m_transport->connect(m_settings.url, m_settings.handshakeTimeout);

    bool closeLate = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == ConnectionState::Closing) {
            closeLate = connected;
        } else if (m_state != ConnectionState::Connecting) {
            // The transport already reported a drop for this connection.
            return;
        } else if (connected) {
            transitionLocked(ConnectionState::Connected);
            m_reconnectAttempts = 0;
            log("Connected");
            startHeartbeatLocked();
            drainBufferLocked();
            return;
        } else {
            std::cerr << "[StreamingConnectionManager] Connection attempt failed" << std::endl;
            transitionLocked(ConnectionState::Disconnected);
            scheduleReconnectLocked();
            return;
        }
    }

    // close() ran while the handshake was in flight and may have found nothing to close.
    if (closeLate) {
        m_transport->close(kNormalClosure, kCloseReason, m_settings.closeTimeout);
    }
}

void StreamingConnectionManager::handleTransportClosed(int code, const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == ConnectionState::Closing || m_state == ConnectionState::Disconnected) {
        return;
    }
    std::cerr << "[StreamingConnectionManager] Connection lost: " << code
              << (reason.empty() ? "" : " " + reason) << std::endl;
    stopHeartbeatLocked();
    transitionLocked(ConnectionState::Disconnected);
    scheduleReconnectLocked();
}

void StreamingConnectionManager::handleMessage(const std::string& text) {
    if (m_settings.debug) {
        log("Received: " + text);
    }
}

void StreamingConnectionManager::sendHeartbeat() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_heartbeatTask = kInvalidTask;
    if (m_state != ConnectionState::Connected) {
        return;
    }

    if (m_transport->send(kHeartbeatMessage)) {
        if (m_settings.debug) {
            log("Sent heartbeat ping");
        }
    } else {
        // Not a reason to reconnect; the transport reports real drops itself.
        std::cerr << "[StreamingConnectionManager] Failed to send heartbeat" << std::endl;
    }
    m_heartbeatTask = m_scheduler.schedule(m_settings.heartbeatInterval, [this] { sendHeartbeat(); });
}

bool StreamingConnectionManager::transitionLocked(ConnectionState next) {
    if (!domain::IsValidTransition(m_state, next)) {
        std::cerr << "[StreamingConnectionManager] Rejected transition "
                  << domain::ToString(m_state) << " -> " << domain::ToString(next) << std::endl;
        return false;
    }
    m_state = next;
    return true;
}

void StreamingConnectionManager::scheduleReconnectLocked() {
    if (!m_policy.enabled()) {
        log("Reconnection disabled");
        return;
    }
    if (!m_policy.allowsAttempt(m_reconnectAttempts)) {
        std::cerr << "[StreamingConnectionManager] Max reconnection attempts reached ("
                  << m_policy.maxAttempts() << "), " << m_buffer.size()
                  << " events stay buffered" << std::endl;
        return;
    }

    auto delay = m_policy.nextDelay(m_reconnectAttempts);
    ++m_reconnectAttempts;
    log("Scheduling reconnect attempt " + std::to_string(m_reconnectAttempts) + "/" +
        std::to_string(m_policy.maxAttempts()) + " in " + std::to_string(delay.count()) + "ms");

    m_reconnectTask = m_scheduler.schedule(delay, [this] { attemptConnect(); });
}

void StreamingConnectionManager::startHeartbeatLocked() {
    stopHeartbeatLocked();
    m_heartbeatTask = m_scheduler.schedule(m_settings.heartbeatInterval, [this] { sendHeartbeat(); });
}

void StreamingConnectionManager::stopHeartbeatLocked() {
    if (m_heartbeatTask != kInvalidTask) {
        m_scheduler.cancel(m_heartbeatTask);
        m_heartbeatTask = kInvalidTask;
    }
}

void StreamingConnectionManager::drainBufferLocked() {
    if (m_buffer.isEmpty()) {
        return;
    }

    auto records = m_buffer.drain();
    log("Draining " + std::to_string(records.size()) + " queued events");

    for (std::size_t i = 0; i < records.size(); ++i) {
        if (!sendImmediateLocked(records[i])) {
            // Producer sends wait on m_mutex, so nothing was enqueued behind these.
            std::size_t remaining = records.size() - i;
            for (std::size_t j = i; j < records.size(); ++j) {
                m_buffer.enqueue(std::move(records[j]));
            }
            std::cerr << "[StreamingConnectionManager] Drain interrupted, re-buffered "
                      << remaining << " events" << std::endl;
            return;
        }
    }
}

bool StreamingConnectionManager::sendImmediateLocked(const domain::EventRecord& record) {
    if (!m_transport->isOpen()) {
        return false;
    }
    return m_transport->send(record.serialize());
}

void StreamingConnectionManager::log(const std::string& message) const {
    if (m_settings.debug) {
        std::cout << "[StreamingConnectionManager] " << message << std::endl;
    }
}

} // namespace runrelay::application
