/**
 * @file modem_event.cpp
 * @brief openESPAT source file.
 */

#include "openespat/transport/modem_event.hpp"

namespace oea {

const char* toString(ModemEventType type) {
    switch (type) {
    case ModemEventType::StationDisconnected:
        return "StationDisconnected";
    case ModemEventType::AddressObtained:
        return "AddressObtained";
    case ModemEventType::StationConnected:
        return "StationConnected";
    case ModemEventType::ModuleReady:
        return "ModuleReady";
    case ModemEventType::SocketConnected:
        return "SocketConnected";
    case ModemEventType::SocketClosed:
        return "SocketClosed";
    case ModemEventType::DataAvailable:
        return "DataAvailable";
    case ModemEventType::SendConfirmed:
        return "SendConfirmed";
    case ModemEventType::SendFailed:
        return "SendFailed";
    case ModemEventType::BytesAccepted:
        return "BytesAccepted";
    case ModemEventType::DataReceived:
        return "DataReceived";
    case ModemEventType::AlreadyConnected:
        return "AlreadyConnected";
    case ModemEventType::Unrecognized:
        return "Unrecognized";
    }
    return "Unknown";
}

} // namespace oea
