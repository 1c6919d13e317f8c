/**
 * @file WebSocketTransport.hpp
 * @brief Boost.Beast WebSocket implementation of the streaming transport (ws and wss).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include "domain/StreamTransport.hpp"

namespace runrelay::infrastructure {

/**
 * @class WebSocketTransport
 * @brief Runs every socket operation on one private io_context thread.
 *
 * connect() and close() block the caller up to their timeout; send() only
 * queues the frame and returns. Frames are written in the order send() was
 * called. A remote close, read error or write error ends the connection and
 * fires the close handler once.
 */
class WebSocketTransport : public domain::StreamTransport {
public:
    explicit WebSocketTransport(bool debug = false);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    bool connect(const std::string& url, std::chrono::milliseconds timeout) override;
    bool send(const std::string& text) override;
    void close(int code, const std::string& reason, std::chrono::milliseconds timeout) override;
    bool isOpen() const override;

    void setCloseHandler(CloseHandler handler) override;
    void setMessageHandler(MessageHandler handler) override;

    class Session;

private:
    void handleDisconnect(std::uint64_t generation, int code, const std::string& reason);
    void handleMessage(std::uint64_t generation, const std::string& text);

    // Declared before m_ioc: sessions still queued in the io_context reference it.
    boost::asio::ssl::context m_sslContext;
    boost::asio::io_context m_ioc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_work;
    std::thread m_ioThread;
    const bool m_debug;

    mutable std::mutex m_mutex;
    std::shared_ptr<Session> m_session;
    std::uint64_t m_generation = 0;
    bool m_open = false;

    std::mutex m_handlerMutex;
    CloseHandler m_onClose;
    MessageHandler m_onMessage;
};

} // namespace runrelay::infrastructure
