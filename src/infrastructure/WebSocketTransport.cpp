/**
 * @file WebSocketTransport.cpp
 * @brief Implementation of WebSocketTransport on Boost.Beast.
 */

#include "infrastructure/WebSocketTransport.hpp"
#include "infrastructure/UrlUtils.hpp"

#include <deque>
#include <functional>
#include <future>
#include <iostream>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace runrelay::infrastructure {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {
constexpr int kAbnormalClosure = 1006;
constexpr std::size_t kMaxCloseReasonLength = 123;
constexpr auto kTcpConnectTimeout = std::chrono::seconds(30);
}

/**
 * @class WebSocketTransport::Session
 * @brief One connection's worth of socket state. Lives on the io_context thread.
 */
class WebSocketTransport::Session {
public:
    struct Callbacks {
        std::function<void(beast::error_code)> onOpen;            ///< Exactly once per open().
        std::function<void(const std::string&)> onMessage;
        std::function<void(int, const std::string&)> onDisconnect; ///< At most once, only after a successful open.
    };

    virtual ~Session() = default;

    virtual void open(const UrlParts& url) = 0;
    virtual void write(std::string text) = 0;
    /** @brief Sends queued frames first, then the close frame. */
    virtual void close(websocket::close_reason reason, std::function<void()> onClosed) = 0;
    /** @brief Tears the socket down immediately. */
    virtual void abort() = 0;
};

namespace {

void PrepareNextLayer(beast::tcp_stream&, const std::string&,
                      const std::function<void(beast::error_code)>& next) {
    next({});
}

void PrepareNextLayer(beast::ssl_stream<beast::tcp_stream>& stream, const std::string& host,
                      const std::function<void(beast::error_code)>& next) {
    // SNI is required by most TLS front ends.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        next(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
        return;
    }
    stream.set_verify_callback(ssl::host_name_verification(host));
    stream.async_handshake(ssl::stream_base::client, [next](beast::error_code ec) { next(ec); });
}

template <class NextLayer>
class WebSocketSession final
    : public WebSocketTransport::Session,
      public std::enable_shared_from_this<WebSocketSession<NextLayer>> {
public:
    template <class... Args>
    WebSocketSession(net::io_context& ioc, Callbacks callbacks, Args&... nextLayerArgs)
        : m_resolver(net::make_strand(ioc)),
          m_ws(net::make_strand(ioc), nextLayerArgs...),
          m_callbacks(std::move(callbacks)) {}

    void open(const UrlParts& url) override {
        auto self = this->shared_from_this();
        net::post(m_ws.get_executor(), [self, url]() {
            self->m_host = url.host;
            self->m_target = url.target;
            self->m_resolver.async_resolve(url.host, url.port,
                [self](beast::error_code ec, tcp::resolver::results_type results) {
                    self->onResolve(ec, results);
                });
        });
    }

    void write(std::string text) override {
        auto self = this->shared_from_this();
        net::post(m_ws.get_executor(), [self, text = std::move(text)]() mutable {
            if (!self->m_open || self->m_closing) {
                return;
            }
            self->m_outbox.push_back(std::move(text));
            if (self->m_outbox.size() == 1) {
                self->doWrite();
            }
        });
    }

    void close(websocket::close_reason reason, std::function<void()> onClosed) override {
        auto self = this->shared_from_this();
        net::post(m_ws.get_executor(), [self, reason, onClosed = std::move(onClosed)]() mutable {
            self->m_onClosed = std::move(onClosed);
            if (self->m_closing) {
                return;
            }
            self->m_closing = true;
            self->m_closeReason = reason;

            if (!self->m_open) {
                self->finishClose();
            } else if (self->m_outbox.empty()) {
                self->doClose();
            } else {
                // The in-flight write chain calls doClose() once the outbox is empty.
                self->m_closeAfterWrites = true;
            }
        });
    }

    void abort() override {
        auto self = this->shared_from_this();
        net::post(m_ws.get_executor(), [self]() {
            self->m_aborted = true;
            self->m_resolver.cancel();
            beast::get_lowest_layer(self->m_ws).close();
        });
    }

private:
    void onResolve(beast::error_code ec, const tcp::resolver::results_type& results) {
        if (ec || m_aborted) {
            return finishOpen(ec ? ec : beast::error_code(net::error::operation_aborted));
        }
        auto self = this->shared_from_this();
        beast::get_lowest_layer(m_ws).expires_after(kTcpConnectTimeout);
        beast::get_lowest_layer(m_ws).async_connect(results,
            [self](beast::error_code ec, const tcp::resolver::results_type::endpoint_type& endpoint) {
                self->onConnect(ec, endpoint);
            });
    }

    void onConnect(beast::error_code ec, const tcp::resolver::results_type::endpoint_type& endpoint) {
        if (ec || m_aborted) {
            return finishOpen(ec ? ec : beast::error_code(net::error::operation_aborted));
        }
        // Host header carries the port, as the handshake requires.
        m_hostHeader = m_host + ':' + std::to_string(endpoint.port());

        auto self = this->shared_from_this();
        PrepareNextLayer(m_ws.next_layer(), m_host, [self](beast::error_code ec) {
            self->onNextLayerReady(ec);
        });
    }

    void onNextLayerReady(beast::error_code ec) {
        if (ec || m_aborted) {
            return finishOpen(ec ? ec : beast::error_code(net::error::operation_aborted));
        }

        // The websocket stream has its own timeout handling.
        beast::get_lowest_layer(m_ws).expires_never();
        m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        m_ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "runrelay");
        }));

        auto self = this->shared_from_this();
        m_ws.async_handshake(m_hostHeader, m_target, [self](beast::error_code ec) {
            self->onHandshake(ec);
        });
    }

    void onHandshake(beast::error_code ec) {
        if (ec || m_aborted) {
            return finishOpen(ec ? ec : beast::error_code(net::error::operation_aborted));
        }
        m_ws.text(true);
        m_open = true;
        finishOpen({});
        doRead();
    }

    void finishOpen(beast::error_code ec) {
        if (!m_callbacks.onOpen) {
            return;
        }
        auto onOpen = std::move(m_callbacks.onOpen);
        m_callbacks.onOpen = nullptr;
        onOpen(ec);
    }

    void doRead() {
        auto self = this->shared_from_this();
        m_ws.async_read(m_readBuffer, [self](beast::error_code ec, std::size_t) {
            self->onRead(ec);
        });
    }

    void onRead(beast::error_code ec) {
        if (ec) {
            int code = kAbnormalClosure;
            std::string reason = ec.message();
            if (ec == websocket::error::closed) {
                const auto& remote = m_ws.reason();
                code = remote.code;
                reason.assign(remote.reason.data(), remote.reason.size());
            }
            reportDisconnect(code, reason);
            return;
        }

        std::string text = beast::buffers_to_string(m_readBuffer.data());
        m_readBuffer.consume(m_readBuffer.size());
        if (m_callbacks.onMessage) {
            m_callbacks.onMessage(text);
        }
        doRead();
    }

    void doWrite() {
        auto self = this->shared_from_this();
        m_ws.async_write(net::buffer(m_outbox.front()), [self](beast::error_code ec, std::size_t) {
            self->onWrite(ec);
        });
    }

    void onWrite(beast::error_code ec) {
        if (ec) {
            m_outbox.clear();
            reportDisconnect(kAbnormalClosure, ec.message());
            beast::get_lowest_layer(m_ws).close();
            if (m_closing) {
                finishClose();
            }
            return;
        }

        m_outbox.pop_front();
        if (!m_outbox.empty()) {
            doWrite();
        } else if (m_closeAfterWrites) {
            m_closeAfterWrites = false;
            doClose();
        }
    }

    void doClose() {
        auto self = this->shared_from_this();
        m_ws.async_close(m_closeReason, [self](beast::error_code ec) {
            if (ec && ec != websocket::error::closed) {
                std::cerr << "[WebSocketTransport] Close handshake failed: " << ec.message() << std::endl;
            }
            self->finishClose();
        });
    }

    void finishClose() {
        m_open = false;
        if (m_onClosed) {
            auto onClosed = std::move(m_onClosed);
            m_onClosed = nullptr;
            onClosed();
        }
    }

    void reportDisconnect(int code, const std::string& reason) {
        bool wasOpen = m_open;
        m_open = false;
        if (!wasOpen || m_closing || m_disconnectReported) {
            return;
        }
        m_disconnectReported = true;
        if (m_callbacks.onDisconnect) {
            m_callbacks.onDisconnect(code, reason);
        }
    }

    tcp::resolver m_resolver;
    websocket::stream<NextLayer> m_ws;
    beast::flat_buffer m_readBuffer;
    std::deque<std::string> m_outbox;
    Callbacks m_callbacks;

    std::string m_host;
    std::string m_hostHeader;
    std::string m_target;

    bool m_open = false;
    bool m_closing = false;
    bool m_closeAfterWrites = false;
    bool m_aborted = false;
    bool m_disconnectReported = false;
    websocket::close_reason m_closeReason;
    std::function<void()> m_onClosed;
};

} // namespace

WebSocketTransport::WebSocketTransport(bool debug)
    : m_sslContext(ssl::context::tlsv12_client),
      m_work(net::make_work_guard(m_ioc)),
      m_debug(debug) {
    m_sslContext.set_default_verify_paths();
    m_sslContext.set_verify_mode(ssl::verify_peer);
    m_ioThread = std::thread([this]() { m_ioc.run(); });
}

WebSocketTransport::~WebSocketTransport() {
    close(1000, "", std::chrono::seconds(1));
    m_work.reset();
    m_ioc.stop();
    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }
}

bool WebSocketTransport::connect(const std::string& url, std::chrono::milliseconds timeout) {
    auto parts = UrlUtils::Parse(url);
    if (!parts || (parts->scheme != "ws" && parts->scheme != "wss")) {
        std::cerr << "[WebSocketTransport] Invalid WebSocket URL" << std::endl;
        return false;
    }

    auto opened = std::make_shared<std::promise<beast::error_code>>();
    auto result = opened->get_future();

    std::shared_ptr<Session> session;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_session) {
            m_session->abort();
        }
        generation = ++m_generation;
        m_open = false;

        Session::Callbacks callbacks;
        callbacks.onOpen = [this, generation, opened](beast::error_code ec) {
            if (!ec) {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (generation == m_generation) {
                    m_open = true;
                }
            }
            opened->set_value(ec);
        };
        callbacks.onMessage = [this, generation](const std::string& text) {
            handleMessage(generation, text);
        };
        callbacks.onDisconnect = [this, generation](int code, const std::string& reason) {
            handleDisconnect(generation, code, reason);
        };

        if (parts->isSecure()) {
            session = std::make_shared<WebSocketSession<beast::ssl_stream<beast::tcp_stream>>>(
                m_ioc, std::move(callbacks), m_sslContext);
        } else {
            session = std::make_shared<WebSocketSession<beast::tcp_stream>>(m_ioc, std::move(callbacks));
        }
        m_session = session;
    }

    if (m_debug) {
        std::cout << "[WebSocketTransport] Connecting to " << parts->scheme << "://"
                  << parts->host << ":" << parts->port << std::endl;
    }
    session->open(*parts);

    if (result.wait_for(timeout) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (generation == m_generation) {
                ++m_generation;
                m_open = false;
            }
        }
        session->abort();
        std::cerr << "[WebSocketTransport] Handshake timed out after " << timeout.count() << "ms" << std::endl;
        return false;
    }

    beast::error_code ec = result.get();
    if (ec) {
        std::cerr << "[WebSocketTransport] Connection failed: " << ec.message() << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open && generation == m_generation;
}

bool WebSocketTransport::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_open || !m_session) {
        return false;
    }
    m_session->write(text);
    return true;
}

void WebSocketTransport::close(int code, const std::string& reason, std::chrono::milliseconds timeout) {
    std::shared_ptr<Session> session;
    bool wasOpen = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        session = m_session;
        wasOpen = m_open;
        m_open = false;
        ++m_generation;
    }
    if (!session) {
        return;
    }

    if (wasOpen) {
        auto closed = std::make_shared<std::promise<void>>();
        auto done = closed->get_future();
        websocket::close_reason closeReason(static_cast<websocket::close_code>(code),
                                            reason.substr(0, kMaxCloseReasonLength));
        session->close(closeReason, [closed]() { closed->set_value(); });

        if (done.wait_for(timeout) != std::future_status::ready) {
            std::cerr << "[WebSocketTransport] Close handshake timed out after " << timeout.count() << "ms" << std::endl;
        } else if (m_debug) {
            std::cout << "[WebSocketTransport] Closed with code " << code << std::endl;
        }
    }
    session->abort();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_session == session) {
        m_session.reset();
    }
}

bool WebSocketTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

void WebSocketTransport::setCloseHandler(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_onClose = std::move(handler);
}

void WebSocketTransport::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_onMessage = std::move(handler);
}

void WebSocketTransport::handleDisconnect(std::uint64_t generation, int code, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation || !m_open) {
            return;
        }
        m_open = false;
    }

    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_onClose;
    }
    if (handler) {
        handler(code, reason);
    }
}

void WebSocketTransport::handleMessage(std::uint64_t generation, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation) {
            return;
        }
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_onMessage;
    }
    if (handler) {
        handler(text);
    }
}

} // namespace runrelay::infrastructure
