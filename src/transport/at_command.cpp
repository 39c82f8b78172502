/**
 * @file at_command.cpp
 * @brief openESPAT source file.
 */

#include "openespat/transport/at_command.hpp"

#include <utility>

namespace oea {
namespace {

AtCommand make(AtCommandKind kind) {
    AtCommand command;
    command.kind = kind;
    return command;
}

} // namespace

AtCommand AtCommand::test() { return make(AtCommandKind::Test); }

AtCommand AtCommand::restart() { return make(AtCommandKind::Restart); }

AtCommand AtCommand::stationMode() { return make(AtCommandKind::SetWifiMode); }

AtCommand AtCommand::joinAccessPoint(std::string ssid, std::string password) {
    auto command = make(AtCommandKind::JoinAccessPoint);
    command.ssid = std::move(ssid);
    command.password = std::move(password);
    return command;
}

AtCommand AtCommand::queryLocalAddress() { return make(AtCommandKind::QueryLocalAddress); }

AtCommand AtCommand::multipleConnections() { return make(AtCommandKind::SetMultipleConnections); }

AtCommand AtCommand::passiveReceiveMode() { return make(AtCommandKind::SetReceiveMode); }

AtCommand AtCommand::connectTcp(std::size_t linkId, const SocketAddress& remote) {
    auto command = make(AtCommandKind::ConnectTcp);
    command.linkId = linkId;
    command.remote = remote;
    return command;
}

AtCommand AtCommand::prepareTransmission(std::size_t linkId, std::size_t length) {
    auto command = make(AtCommandKind::PrepareTransmission);
    command.linkId = linkId;
    command.length = length;
    return command;
}

AtCommand AtCommand::transmitData(const std::uint8_t* data, std::size_t length) {
    auto command = make(AtCommandKind::TransmitData);
    command.length = length;
    command.payload.assign(data, data + length);
    return command;
}

AtCommand AtCommand::receiveData(std::size_t linkId, std::size_t length) {
    auto command = make(AtCommandKind::ReceiveData);
    command.linkId = linkId;
    command.length = length;
    return command;
}

AtCommand AtCommand::closeSocket(std::size_t linkId) {
    auto command = make(AtCommandKind::CloseSocket);
    command.linkId = linkId;
    return command;
}

const char* toString(AtCommandKind kind) {
    switch (kind) {
    case AtCommandKind::Test:
        return "AT";
    case AtCommandKind::Restart:
        return "AT+RST";
    case AtCommandKind::SetWifiMode:
        return "AT+CWMODE";
    case AtCommandKind::JoinAccessPoint:
        return "AT+CWJAP";
    case AtCommandKind::QueryLocalAddress:
        return "AT+CIFSR";
    case AtCommandKind::SetMultipleConnections:
        return "AT+CIPMUX";
    case AtCommandKind::SetReceiveMode:
        return "AT+CIPRECVMODE";
    case AtCommandKind::ConnectTcp:
        return "AT+CIPSTART";
    case AtCommandKind::PrepareTransmission:
        return "AT+CIPSEND";
    case AtCommandKind::TransmitData:
        return "DATA";
    case AtCommandKind::ReceiveData:
        return "AT+CIPRECVDATA";
    case AtCommandKind::CloseSocket:
        return "AT+CIPCLOSE";
    }
    return "UNKNOWN";
}

const char* toString(AtError error) {
    switch (error) {
    case AtError::None:
        return "None";
    case AtError::Timeout:
        return "Timeout";
    case AtError::Error:
        return "Error";
    case AtError::InvalidResponse:
        return "InvalidResponse";
    case AtError::AlreadyConnected:
        return "AlreadyConnected";
    case AtError::Io:
        return "Io";
    }
    return "Unknown";
}

} // namespace oea
