/**
 * @file StreamTransport.hpp
 * @brief Interface for a persistent duplex text-message connection.
 */

#pragma once
#include <chrono>
#include <functional>
#include <string>

namespace runrelay::domain {

/**
 * @class StreamTransport
 * @brief Abstract duplex connection used by the streaming connection manager.
 *
 * A transport carries at most one connection at a time and may be reconnected
 * after that connection ends.
 */
class StreamTransport {
public:
    /** @brief Called once when an open connection ends without a local close(). */
    using CloseHandler = std::function<void(int code, const std::string& reason)>;
    using MessageHandler = std::function<void(const std::string& text)>;

    virtual ~StreamTransport() = default;

    /**
     * @brief Opens a connection and completes the handshake.
     * @param url Full endpoint URL, credential included.
     * @param timeout Upper bound for the whole attempt.
     * @return True once the connection is open. False on failure or timeout.
     */
    virtual bool connect(const std::string& url, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Queues one text frame for transmission.
     * @return False when no connection is open or the frame was refused.
     */
    virtual bool send(const std::string& text) = 0;

    /**
     * @brief Flushes queued frames, then performs the close handshake.
     *
     * Returns after the handshake or the timeout, whichever comes first. The
     * close handler is not invoked for a local close.
     */
    virtual void close(int code, const std::string& reason, std::chrono::milliseconds timeout) = 0;

    virtual bool isOpen() const = 0;

    virtual void setCloseHandler(CloseHandler handler) = 0;
    virtual void setMessageHandler(MessageHandler handler) = 0;
};

} // namespace runrelay::domain
