/**
 * @file modem_event.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace oea {

/**
 * @brief Unsolicited notification kinds emitted by the module.
 */
enum class ModemEventType {
    StationDisconnected,
    AddressObtained,
    StationConnected,
    ModuleReady,
    SocketConnected,
    SocketClosed,
    /// Passive mode `+IPD`: bytes buffered on the module for a link.
    DataAvailable,
    SendConfirmed,
    SendFailed,
    /// `Recv <n> bytes`: byte count accepted for the pending transmission.
    BytesAccepted,
    /// Payload of a `+CIPRECVDATA` reply.
    DataReceived,
    AlreadyConnected,
    Unrecognized,
};

/**
 * @brief Tagged notification. `linkId`, `count` and `data` are set per type.
 */
struct ModemEvent {
    ModemEventType type = ModemEventType::Unrecognized;
    std::size_t linkId = 0;
    std::size_t count = 0;
    std::vector<std::uint8_t> data;

    static ModemEvent simple(ModemEventType type) {
        ModemEvent event;
        event.type = type;
        return event;
    }
    static ModemEvent forLink(ModemEventType type, std::size_t linkId) {
        ModemEvent event;
        event.type = type;
        event.linkId = linkId;
        return event;
    }
    static ModemEvent dataAvailable(std::size_t linkId, std::size_t count) {
        ModemEvent event = forLink(ModemEventType::DataAvailable, linkId);
        event.count = count;
        return event;
    }
    static ModemEvent bytesAccepted(std::size_t count) {
        ModemEvent event = simple(ModemEventType::BytesAccepted);
        event.count = count;
        return event;
    }
    static ModemEvent dataReceived(std::vector<std::uint8_t> data) {
        ModemEvent event = simple(ModemEventType::DataReceived);
        event.count = data.size();
        event.data = std::move(data);
        return event;
    }
};

const char* toString(ModemEventType type);

} // namespace oea
