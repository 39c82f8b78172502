/**
 * @file network_error.hpp
 * @brief Result types returned by the adapter's public operations.
 */

#pragma once

#include <cstddef>

#include "openespat/transport/at_command.hpp"
#include "openespat/wifi/local_address.hpp"

namespace oea {

/**
 * @brief Socket stack failure kinds.
 */
enum class NetworkErrorKind {
    None,
    /// No data buffered yet; retry later. Not a failure.
    WouldBlock,
    /// AT+CIPMUX failed.
    EnablingMultiConnectionsFailed,
    /// AT+CIPRECVMODE failed.
    EnablingPassiveSocketModeFailed,
    ConnectError,
    /// AT+CIPSEND failed.
    TransmissionStartFailed,
    /// Module reported SEND FAIL (cause Error) or confirmation timed out (cause Timeout).
    SendFailed,
    ReceiveFailed,
    CloseError,
    /// Module confirmed an unexpected byte count.
    PartialSend,
    /// Command answered OK but the connect or close notification never arrived.
    UnconfirmedSocketState,
    NoSocketAvailable,
    /// Socket already connected, close it first.
    AlreadyConnected,
    SocketUnconnected,
    /// Closed by the remote side; reconnect or close it.
    ClosingSocket,
    /// Module returned more data than requested. Firmware contract violation, not retryable.
    ReceiveOverflow,
    /// Transport reported would-block where a blocking exchange was expected.
    UnexpectedWouldBlock,
    TimerError,
    /// Handle was moved from, closed, or its slot was released by restart().
    InvalidSocket,
    RestartFailed,
};

struct NetworkResult {
    NetworkErrorKind error = NetworkErrorKind::None;
    AtError cause = AtError::None;
    /// Bytes sent or received on success.
    std::size_t bytes = 0;

    bool ok() const noexcept { return error == NetworkErrorKind::None; }
    bool wouldBlock() const noexcept { return error == NetworkErrorKind::WouldBlock; }

    static NetworkResult success(std::size_t bytes = 0) {
        NetworkResult result;
        result.bytes = bytes;
        return result;
    }
    static NetworkResult failure(NetworkErrorKind error, AtError cause = AtError::None) {
        NetworkResult result;
        result.error = error;
        result.cause = cause;
        return result;
    }
};

enum class JoinErrorKind {
    None,
    /// AT+CWMODE failed.
    ModeError,
    /// AT+CWJAP failed.
    ConnectError,
    /// SSID longer than 32 bytes.
    InvalidSsidLength,
    /// Password longer than 63 bytes.
    InvalidPasswordLength,
    UnexpectedWouldBlock,
};

/**
 * @brief Current WiFi connection state.
 */
struct JoinState {
    /// Associated to an access point.
    bool connected = false;
    /// Address lease obtained.
    bool ipAssigned = false;
};

struct JoinResult {
    JoinErrorKind error = JoinErrorKind::None;
    AtError cause = AtError::None;
    JoinState state{};

    bool ok() const noexcept { return error == JoinErrorKind::None; }
};

enum class AddressErrorKind {
    None,
    /// AT+CIFSR failed.
    CommandError,
    AddressParseError,
    UnexpectedWouldBlock,
};

struct AddressResult {
    AddressErrorKind error = AddressErrorKind::None;
    AtError cause = AtError::None;
    LocalAddress address{};

    bool ok() const noexcept { return error == AddressErrorKind::None; }
};

const char* toString(NetworkErrorKind error);
const char* toString(JoinErrorKind error);
const char* toString(AddressErrorKind error);

} // namespace oea
