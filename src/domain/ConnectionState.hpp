/**
 * @file ConnectionState.hpp
 * @brief States of the streaming connection and the legal moves between them.
 */

#pragma once
#include <string>

namespace runrelay::domain {

/**
 * @enum ConnectionState
 * @brief Exactly one is active at a time. Closing is terminal.
 */
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Closing
};

inline std::string ToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Closing: return "closing";
    }
    return "unknown";
}

/**
 * @brief Transition guard for the connection state machine.
 *
 * disconnected -> connecting -> connected -> disconnected, a failed handshake
 * returns connecting -> disconnected, and every non-closing state may move to
 * closing. Nothing leaves closing.
 */
inline bool IsValidTransition(ConnectionState from, ConnectionState to) {
    switch (from) {
        case ConnectionState::Disconnected:
            return to == ConnectionState::Connecting || to == ConnectionState::Closing;
        case ConnectionState::Connecting:
            return to == ConnectionState::Connected
                || to == ConnectionState::Disconnected
                || to == ConnectionState::Closing;
        case ConnectionState::Connected:
            return to == ConnectionState::Disconnected || to == ConnectionState::Closing;
        case ConnectionState::Closing:
            return false;
    }
    return false;
}

} // namespace runrelay::domain
