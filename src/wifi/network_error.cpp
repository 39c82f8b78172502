/**
 * @file network_error.cpp
 * @brief openESPAT source file.
 */

#include "openespat/wifi/network_error.hpp"

namespace oea {

const char* toString(NetworkErrorKind error) {
    switch (error) {
    case NetworkErrorKind::None:
        return "None";
    case NetworkErrorKind::WouldBlock:
        return "WouldBlock";
    case NetworkErrorKind::EnablingMultiConnectionsFailed:
        return "EnablingMultiConnectionsFailed";
    case NetworkErrorKind::EnablingPassiveSocketModeFailed:
        return "EnablingPassiveSocketModeFailed";
    case NetworkErrorKind::ConnectError:
        return "ConnectError";
    case NetworkErrorKind::TransmissionStartFailed:
        return "TransmissionStartFailed";
    case NetworkErrorKind::SendFailed:
        return "SendFailed";
    case NetworkErrorKind::ReceiveFailed:
        return "ReceiveFailed";
    case NetworkErrorKind::CloseError:
        return "CloseError";
    case NetworkErrorKind::PartialSend:
        return "PartialSend";
    case NetworkErrorKind::UnconfirmedSocketState:
        return "UnconfirmedSocketState";
    case NetworkErrorKind::NoSocketAvailable:
        return "NoSocketAvailable";
    case NetworkErrorKind::AlreadyConnected:
        return "AlreadyConnected";
    case NetworkErrorKind::SocketUnconnected:
        return "SocketUnconnected";
    case NetworkErrorKind::ClosingSocket:
        return "ClosingSocket";
    case NetworkErrorKind::ReceiveOverflow:
        return "ReceiveOverflow";
    case NetworkErrorKind::UnexpectedWouldBlock:
        return "UnexpectedWouldBlock";
    case NetworkErrorKind::TimerError:
        return "TimerError";
    case NetworkErrorKind::InvalidSocket:
        return "InvalidSocket";
    case NetworkErrorKind::RestartFailed:
        return "RestartFailed";
    }
    return "Unknown";
}

const char* toString(JoinErrorKind error) {
    switch (error) {
    case JoinErrorKind::None:
        return "None";
    case JoinErrorKind::ModeError:
        return "ModeError";
    case JoinErrorKind::ConnectError:
        return "ConnectError";
    case JoinErrorKind::InvalidSsidLength:
        return "InvalidSsidLength";
    case JoinErrorKind::InvalidPasswordLength:
        return "InvalidPasswordLength";
    case JoinErrorKind::UnexpectedWouldBlock:
        return "UnexpectedWouldBlock";
    }
    return "Unknown";
}

const char* toString(AddressErrorKind error) {
    switch (error) {
    case AddressErrorKind::None:
        return "None";
    case AddressErrorKind::CommandError:
        return "CommandError";
    case AddressErrorKind::AddressParseError:
        return "AddressParseError";
    case AddressErrorKind::UnexpectedWouldBlock:
        return "UnexpectedWouldBlock";
    }
    return "Unknown";
}

} // namespace oea
