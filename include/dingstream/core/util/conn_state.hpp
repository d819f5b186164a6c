/**
 * @file conn_state.hpp
 * @brief Connection state of the stream client as observed by the host.
 */
#pragma once
#include <cstdint>
#include <functional>

namespace dingstream {

    /**
     * @enum ConnectionState
     * @brief Lifecycle of one StreamClient.
     *
     * - Disconnected: initial state, and the state after every epoch ends
     * - Connecting: endpoint negotiation and websocket handshake in flight
     * - Connected: handshake done, dispatcher (and heartbeat) running
     */
    enum class ConnectionState : uint8_t {
        Disconnected,
        Connecting,
        Connected
    };

    using StateObserver = std::function<void(ConnectionState)>;

    inline const char* toString(ConnectionState s) {
        switch (s) {
            case ConnectionState::Disconnected: return "Disconnected";
            case ConnectionState::Connecting:   return "Connecting";
            case ConnectionState::Connected:    return "Connected";
        }
        return "Unknown";
    }

}
