/**
 * @file socket_state.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <cstdint>

namespace oea {

/**
 * @brief Lifecycle state of one module link slot.
 */
enum class SocketState : std::uint8_t {
    /// Free slot, may be handed out by the allocator.
    Closed = 0,
    /// Handed out by socket() but not connected yet.
    Open,
    /// Connect confirmed by the module.
    Connected,
    /// Closed by the remote side, handle still alive and must be closed explicitly.
    Closing,
};

inline const char* toString(SocketState state) {
    switch (state) {
    case SocketState::Closed:
        return "CLOSED";
    case SocketState::Open:
        return "OPEN";
    case SocketState::Connected:
        return "CONNECTED";
    case SocketState::Closing:
        return "CLOSING";
    }
    return "UNKNOWN";
}

} // namespace oea
