/**
 * @file link_state.cpp
 * @brief openESPAT source file.
 */

#include "openespat/wifi/link_state.hpp"

namespace oea {

void NotificationReconciler::apply(LinkState& state, const ModemEvent& event) {
    const bool linkInRange = event.linkId < kMaxLinks;

    switch (event.type) {
    case ModemEventType::StationDisconnected:
        state.connection.joined = false;
        state.connection.ipAssigned = false;
        break;
    case ModemEventType::AddressObtained:
        state.connection.ipAssigned = true;
        break;
    case ModemEventType::StationConnected:
        state.connection.joined = true;
        break;
    case ModemEventType::ModuleReady:
        break;
    case ModemEventType::SocketConnected:
        if (linkInRange) {
            state.sockets[event.linkId] = SocketState::Connected;
        }
        break;
    case ModemEventType::SocketClosed:
        if (linkInRange) {
            state.sockets[event.linkId] = SocketState::Closing;
        }
        break;
    case ModemEventType::DataAvailable:
        if (linkInRange) {
            state.bytesAvailable[event.linkId] += event.count;
        }
        break;
    case ModemEventType::SendConfirmed:
        state.transfer.sendConfirmed = true;
        break;
    case ModemEventType::SendFailed:
        state.transfer.sendConfirmed = false;
        break;
    case ModemEventType::BytesAccepted:
        state.transfer.recvByteCount = event.count;
        break;
    case ModemEventType::DataReceived:
        if (state.receivedData) {
            state.receivedData->insert(state.receivedData->end(), event.data.begin(), event.data.end());
        } else {
            state.receivedData = event.data;
        }
        break;
    case ModemEventType::AlreadyConnected:
        state.alreadyConnected = true;
        break;
    case ModemEventType::Unrecognized:
        break;
    }
}

std::size_t NotificationReconciler::drain(LinkState& state, INotificationSource& source) {
    std::size_t applied = 0;
    while (auto event = source.pollNextEvent()) {
        apply(state, *event);
        ++applied;
    }
    return applied;
}

} // namespace oea
