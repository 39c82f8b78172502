/**
 * @file at_command.hpp
 * @brief Typed AT command requests and replies exchanged with the module.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "openespat/core/network_address.hpp"

namespace oea {

enum class AtCommandKind {
    Test,
    Restart,
    SetWifiMode,
    JoinAccessPoint,
    QueryLocalAddress,
    SetMultipleConnections,
    SetReceiveMode,
    ConnectTcp,
    PrepareTransmission,
    TransmitData,
    ReceiveData,
    CloseSocket,
};

/**
 * @brief Transport level failure cause of one command exchange.
 */
enum class AtError {
    None,
    /// No final result code within the command timeout.
    Timeout,
    /// Module answered ERROR/FAIL.
    Error,
    /// Reply did not carry the expected data.
    InvalidResponse,
    /// Module answered ALREADY CONNECTED followed by ERROR.
    AlreadyConnected,
    /// Link not open or read/write on the device failed.
    Io,
};

enum class AtStatus {
    Ok,
    /// Channel currently busy, the exchange was not started.
    WouldBlock,
    Failed,
};

/**
 * @brief One `+CIFSR:<tag>,"<address>"` record.
 */
struct LocalAddressRecord {
    std::string tag;
    std::string address;
};

/**
 * @brief Command value object. Only the fields relevant to `kind` are used.
 */
struct AtCommand {
    AtCommandKind kind = AtCommandKind::Test;
    std::size_t linkId = 0;
    std::size_t length = 0;
    std::string ssid;
    std::string password;
    SocketAddress remote{};
    std::vector<std::uint8_t> payload;

    static AtCommand test();
    static AtCommand restart();
    static AtCommand stationMode();
    static AtCommand joinAccessPoint(std::string ssid, std::string password);
    static AtCommand queryLocalAddress();
    static AtCommand multipleConnections();
    static AtCommand passiveReceiveMode();
    static AtCommand connectTcp(std::size_t linkId, const SocketAddress& remote);
    static AtCommand prepareTransmission(std::size_t linkId, std::size_t length);
    static AtCommand transmitData(const std::uint8_t* data, std::size_t length);
    static AtCommand receiveData(std::size_t linkId, std::size_t length);
    static AtCommand closeSocket(std::size_t linkId);
};

/**
 * @brief Typed reply of one command exchange.
 */
struct AtReply {
    AtStatus status = AtStatus::Ok;
    AtError error = AtError::None;
    std::vector<LocalAddressRecord> addressRecords;

    bool ok() const noexcept { return status == AtStatus::Ok; }
    bool wouldBlock() const noexcept { return status == AtStatus::WouldBlock; }

    static AtReply success() { return AtReply{}; }
    static AtReply failure(AtError error) { return AtReply{AtStatus::Failed, error, {}}; }
    static AtReply busy() { return AtReply{AtStatus::WouldBlock, AtError::None, {}}; }
};

const char* toString(AtCommandKind kind);
const char* toString(AtError error);

} // namespace oea
