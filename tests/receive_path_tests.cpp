/**
 * @file receive_path_tests.cpp
 * @brief Pull-based receive: byte accounting, bounded destination, overflow handling.
 */

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <vector>

#include "openespat/transport/mock_modem.hpp"
#include "openespat/wifi/wifi_adapter.hpp"

namespace {

std::vector<std::uint8_t> pattern(std::size_t size, std::uint8_t seed) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>(seed + i);
    }
    return data;
}

oea::Socket connectedSocket(oea::WifiAdapter& adapter) {
    const auto remote = oea::parseSocketAddress("172.16.0.9:9000");
    assert(remote.has_value());
    oea::Socket socket;
    assert(adapter.socket(socket).ok());
    assert(adapter.connect(socket, *remote).ok());
    return socket;
}

oea::AdapterOptions receiveChunk(std::size_t chunk) {
    oea::AdapterOptions options;
    options.rxChunkSize = chunk;
    return options;
}

void testWouldBlock() {
    oea::MockModem modem;
    oea::MockCountdownTimer timer;
    oea::WifiAdapter adapter(modem, timer);
    auto socket = connectedSocket(adapter);

    std::array<std::uint8_t, 16> buffer{};
    const auto result = adapter.receive(socket, buffer.data(), buffer.size());
    assert(result.wouldBlock());
    assert(!result.ok());
    assert(modem.countCommands(oea::AtCommandKind::ReceiveData) == 0U);
}

void testAccounting() {
    oea::MockModem modem;
    oea::MockCountdownTimer timer;
    oea::WifiAdapter adapter(modem, timer, receiveChunk(128));
    auto socket = connectedSocket(adapter);
    const auto linkId = socket.linkId();

    const auto incoming = pattern(300, 3);
    modem.remoteSend(linkId, incoming);
    adapter.processNotifications();
    assert(adapter.bytesAvailable(linkId) == 300U);

    std::vector<std::uint8_t> buffer(1024, 0);
    const auto result = adapter.receive(socket, buffer.data(), buffer.size());
    assert(result.ok());
    assert(result.bytes == 300U);
    assert(std::equal(incoming.begin(), incoming.end(), buffer.begin()));
    assert(adapter.bytesAvailable(linkId) == 0U);

    std::vector<std::size_t> pulls;
    for (const auto& command : modem.commands()) {
        if (command.kind == oea::AtCommandKind::ReceiveData) {
            assert(command.linkId == linkId);
            pulls.push_back(command.length);
        }
    }
    assert((pulls == std::vector<std::size_t>{128, 128, 128}));

    assert(adapter.receive(socket, buffer.data(), buffer.size()).wouldBlock());
}

void testSmallDestination() {
    oea::MockModem modem;
    oea::MockCountdownTimer timer;
    oea::WifiAdapter adapter(modem, timer);
    auto socket = connectedSocket(adapter);
    const auto linkId = socket.linkId();

    const auto incoming = pattern(250, 40);
    modem.remoteSend(linkId, incoming);

    std::array<std::uint8_t, 100> buffer{};
    std::vector<std::uint8_t> collected;
    for (int round = 0; round < 3; ++round) {
        const auto result = adapter.receive(socket, buffer.data(), buffer.size());
        assert(result.ok());
        collected.insert(collected.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(result.bytes));
    }
    assert(collected == incoming);
    assert(adapter.bytesAvailable(linkId) == 0U);
    assert(adapter.receive(socket, buffer.data(), buffer.size()).wouldBlock());
}

void testRetrievalBeyondTrackedCountClamps() {
    oea::MockModem modem;
    oea::MockCountdownTimer timer;
    oea::WifiAdapter adapter(modem, timer);
    auto socket = connectedSocket(adapter);
    const auto linkId = socket.linkId();

    modem.remoteSend(linkId, pattern(40, 0), false);
    modem.enqueueEvent(oea::ModemEvent::dataAvailable(linkId, 10));

    std::array<std::uint8_t, 64> buffer{};
    const auto result = adapter.receive(socket, buffer.data(), buffer.size());
    assert(result.ok());
    assert(result.bytes == 40U);
    assert(adapter.bytesAvailable(linkId) == 0U);
}

void testOverclaimedNotification() {
    oea::MockModem modem;
    oea::MockCountdownTimer timer;
    oea::WifiAdapter adapter(modem, timer);
    auto socket = connectedSocket(adapter);
    const auto linkId = socket.linkId();

    modem.remoteSend(linkId, pattern(40, 1));
    modem.enqueueEvent(oea::ModemEvent::dataAvailable(linkId, 60));

    std::array<std::uint8_t, 300> storage{};
    storage.fill(0x5AU);
    const auto result = adapter.receive(socket, storage.data(), 256);
    assert(result.error == oea::NetworkErrorKind::ReceiveFailed);
    assert(result.cause == oea::AtError::InvalidResponse);
    assert(storage[39] == 40U);
    for (std::size_t i = 40; i < storage.size(); ++i) {
        assert(storage[i] == 0x5AU);
    }
    assert(adapter.bytesAvailable(linkId) == 60U);
}

void testOverflowIsHardStop() {
    oea::MockModem modem;
    oea::MockCountdownTimer timer;
    oea::WifiAdapter adapter(modem, timer);
    auto socket = connectedSocket(adapter);
    const auto linkId = socket.linkId();

    modem.remoteSend(linkId, pattern(64, 9));
    modem.injectReceiveExcess(8);

    std::array<std::uint8_t, 80> storage{};
    storage.fill(0xC3U);
    const auto result = adapter.receive(socket, storage.data(), 64);
    assert(result.error == oea::NetworkErrorKind::ReceiveOverflow);
    for (const auto byte : storage) {
        assert(byte == 0xC3U);
    }
    assert(adapter.bytesAvailable(linkId) == 0U);
}

void testReceiveFailuresAndResets() {
    oea::MockModem modem;
    oea::MockCountdownTimer timer;
    oea::WifiAdapter adapter(modem, timer);

    // Bytes signaled before connect are discarded by it.
    oea::Socket socket;
    assert(adapter.socket(socket).ok());
    modem.enqueueEvent(oea::ModemEvent::dataAvailable(socket.linkId(), 50));
    adapter.processNotifications();
    assert(adapter.bytesAvailable(socket.linkId()) == 50U);
    const auto remote = oea::parseSocketAddress("172.16.0.9:9001");
    assert(adapter.connect(socket, *remote).ok());
    assert(adapter.bytesAvailable(socket.linkId()) == 0U);

    modem.remoteSend(socket.linkId(), pattern(12, 0));
    modem.failNext(oea::AtCommandKind::ReceiveData, oea::AtError::Timeout);
    std::array<std::uint8_t, 32> buffer{};
    const auto failed = adapter.receive(socket, buffer.data(), buffer.size());
    assert(failed.error == oea::NetworkErrorKind::ReceiveFailed);
    assert(failed.cause == oea::AtError::Timeout);
    assert(adapter.bytesAvailable(socket.linkId()) == 12U);

    // Data buffered before a remote close stays readable.
    modem.remoteClose(socket.linkId());
    const auto drained = adapter.receive(socket, buffer.data(), buffer.size());
    assert(drained.ok());
    assert(drained.bytes == 12U);
    assert(adapter.socketState(socket.linkId()) == oea::SocketState::Closing);
}

} // namespace

int main() {
    testWouldBlock();
    testAccounting();
    testSmallDestination();
    testRetrievalBeyondTrackedCountClamps();
    testOverclaimedNotification();
    testOverflowIsHardStop();
    testReceiveFailuresAndResets();

    std::cout << "receive_path_tests passed\n";
    return 0;
}
