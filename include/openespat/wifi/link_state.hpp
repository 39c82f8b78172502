/**
 * @file link_state.hpp
 * @brief Driver-side view of the module state, updated only from notifications.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "openespat/core/socket_state.hpp"
#include "openespat/transport/i_modem_link.hpp"

namespace oea {

/// Maximum concurrent links of the module.
constexpr std::size_t kMaxLinks = 5;

struct ConnectionState {
    bool joined = false;
    bool ipAssigned = false;
};

/**
 * @brief Accounting for the chunk currently in flight. Reset before each chunk.
 */
struct TransferState {
    /// nullopt: pending, true: SEND OK, false: SEND FAIL.
    std::optional<bool> sendConfirmed;
    /// Byte count echoed by the module.
    std::optional<std::size_t> recvByteCount;
};

struct LinkState {
    ConnectionState connection{};
    /// Index = link id.
    std::array<SocketState, kMaxLinks> sockets{};
    /// Bytes signaled as buffered on the module and not yet retrieved, per link id.
    std::array<std::size_t, kMaxLinks> bytesAvailable{};
    /// Bumped whenever a slot is released, so handles issued before that no longer match.
    std::array<std::uint32_t, kMaxLinks> generations{};
    TransferState transfer{};
    /// Module reported ALREADY CONNECTED. Cleared only at the start of connect().
    bool alreadyConnected = false;
    /// Payload of the last receive command, consumed by the receive path.
    std::optional<std::vector<std::uint8_t>> receivedData;
};

/**
 * @brief Applies notifications to `LinkState`.
 */
class NotificationReconciler {
public:
    /**
     * @brief Apply exactly one notification. Link ids outside the pool are ignored.
     */
    static void apply(LinkState& state, const ModemEvent& event);

    /**
     * @brief Poll and apply notifications until the source is empty.
     * @return number of notifications applied.
     */
    static std::size_t drain(LinkState& state, INotificationSource& source);
};

} // namespace oea
