/**
 * @file transmission_tests.cpp
 * @brief Chunked send with per-chunk confirmation, failure and timeout handling.
 */

#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <vector>

#include "openespat/transport/mock_modem.hpp"
#include "openespat/wifi/wifi_adapter.hpp"

namespace {

std::vector<std::uint8_t> makePayload(std::size_t size) {
    std::vector<std::uint8_t> payload(size);
    for (std::size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<std::uint8_t>(i * 7U);
    }
    return payload;
}

oea::AdapterOptions chunkedOptions(std::size_t chunk) {
    oea::AdapterOptions options;
    options.txChunkSize = chunk;
    return options;
}

oea::Socket connectedSocket(oea::WifiAdapter& adapter) {
    const auto remote = oea::parseSocketAddress("10.1.0.2:7000");
    assert(remote.has_value());
    oea::Socket socket;
    assert(adapter.socket(socket).ok());
    assert(adapter.connect(socket, *remote).ok());
    return socket;
}

std::vector<std::size_t> preparedLengths(const oea::MockModem& modem) {
    std::vector<std::size_t> lengths;
    for (const auto& command : modem.commands()) {
        if (command.kind == oea::AtCommandKind::PrepareTransmission) {
            lengths.push_back(command.length);
        }
    }
    return lengths;
}

} // namespace

int main() {
    // 600 bytes with a 256 byte bound: three prepare/transmit cycles.
    {
        oea::MockModem modem;
        oea::MockCountdownTimer timer;
        oea::WifiAdapter adapter(modem, timer, chunkedOptions(256));
        auto socket = connectedSocket(adapter);
        modem.clearCommandLog();

        const auto payload = makePayload(600);
        const auto result = adapter.send(socket, payload);
        assert(result.ok());
        assert(result.bytes == 600U);
        assert((preparedLengths(modem) == std::vector<std::size_t>{256, 256, 88}));
        assert(modem.countCommands(oea::AtCommandKind::TransmitData) == 3U);
        assert(modem.transmitted(socket.linkId()) == payload);
        assert(timer.startCount() == 3U);
        assert(timer.lastDuration() == std::chrono::milliseconds(5000));
        assert(modem.resetCount() == 0U);
    }

    // SEND FAIL on the second chunk stops the transfer.
    {
        oea::MockModem modem;
        oea::MockCountdownTimer timer;
        oea::WifiAdapter adapter(modem, timer, chunkedOptions(256));
        auto socket = connectedSocket(adapter);
        modem.clearCommandLog();
        modem.injectSendFailureOnChunk(2);

        const auto result = adapter.send(socket, makePayload(600));
        assert(result.error == oea::NetworkErrorKind::SendFailed);
        assert(result.cause == oea::AtError::Error);
        assert(modem.countCommands(oea::AtCommandKind::PrepareTransmission) == 2U);
        assert(modem.countCommands(oea::AtCommandKind::TransmitData) == 2U);
        assert(modem.transmitted(socket.linkId()).size() == 256U);
        assert(modem.resetCount() == 1U);
        assert(adapter.isConnected(socket));
    }

    // No confirmation within the timeout is distinct from a module-signaled failure.
    {
        oea::MockModem modem;
        oea::MockCountdownTimer timer(3);
        oea::WifiAdapter adapter(modem, timer);
        adapter.setSendTimeoutMs(1500);
        assert(adapter.sendTimeout() == std::chrono::milliseconds(1500));
        auto socket = connectedSocket(adapter);
        modem.suppressSendConfirmations(true);

        const auto result = adapter.send(socket, makePayload(32));
        assert(result.error == oea::NetworkErrorKind::SendFailed);
        assert(result.cause == oea::AtError::Timeout);
        assert(timer.lastDuration() == std::chrono::milliseconds(1500));
        assert(modem.resetCount() == 1U);
    }

    // Echoed byte count differs from the chunk length.
    {
        oea::MockModem modem;
        oea::MockCountdownTimer timer;
        oea::WifiAdapter adapter(modem, timer);
        auto socket = connectedSocket(adapter);
        modem.injectAcceptedShortfall(10);

        const auto result = adapter.send(socket, makePayload(100));
        assert(result.error == oea::NetworkErrorKind::PartialSend);
        assert(modem.transmitted(socket.linkId()).size() == 90U);
    }

    // Prepare rejected, timer unavailable, payload command blocked.
    {
        oea::MockModem modem;
        oea::MockCountdownTimer timer;
        oea::WifiAdapter adapter(modem, timer);
        auto socket = connectedSocket(adapter);

        modem.failNext(oea::AtCommandKind::PrepareTransmission, oea::AtError::Error);
        const auto rejected = adapter.send(socket, makePayload(16));
        assert(rejected.error == oea::NetworkErrorKind::TransmissionStartFailed);
        assert(rejected.cause == oea::AtError::Error);
        assert(modem.countCommands(oea::AtCommandKind::TransmitData) == 0U);

        // The payload is already out, so both timer failures drop the pending prompt state.
        const auto resetsBefore = modem.resetCount();
        timer.injectStartFailure(true);
        const auto timerFailed = adapter.send(socket, makePayload(16));
        assert(timerFailed.error == oea::NetworkErrorKind::TimerError);
        assert(modem.resetCount() == resetsBefore + 1U);
        timer.injectStartFailure(false);

        modem.suppressSendConfirmations(true);
        timer.injectPollFailure(true);
        const auto pollFailed = adapter.send(socket, makePayload(16));
        assert(pollFailed.error == oea::NetworkErrorKind::TimerError);
        assert(modem.resetCount() == resetsBefore + 2U);
        timer.injectPollFailure(false);
        modem.suppressSendConfirmations(false);

        modem.blockNext(oea::AtCommandKind::TransmitData);
        const auto blocked = adapter.send(socket, makePayload(16));
        assert(blocked.error == oea::NetworkErrorKind::UnexpectedWouldBlock);

        modem.failNext(oea::AtCommandKind::TransmitData, oea::AtError::Io);
        const auto ioFailed = adapter.send(socket, makePayload(16));
        assert(ioFailed.error == oea::NetworkErrorKind::SendFailed);
        assert(ioFailed.cause == oea::AtError::Io);
    }

    // Slot state gates the send.
    {
        oea::MockModem modem;
        oea::MockCountdownTimer timer;
        oea::WifiAdapter adapter(modem, timer);

        oea::Socket unconnected;
        assert(adapter.socket(unconnected).ok());
        const auto notConnected = adapter.send(unconnected, makePayload(8));
        assert(notConnected.error == oea::NetworkErrorKind::SocketUnconnected);

        auto socket = connectedSocket(adapter);
        modem.remoteClose(socket.linkId());
        modem.clearCommandLog();
        const auto closing = adapter.send(socket, makePayload(8));
        assert(closing.error == oea::NetworkErrorKind::ClosingSocket);
        assert(modem.countCommands(oea::AtCommandKind::PrepareTransmission) == 0U);

        // Nothing to send still succeeds.
        oea::Socket idle;
        assert(adapter.socket(idle).ok());
        const auto remote = oea::parseSocketAddress("10.1.0.3:7000");
        assert(adapter.connect(idle, *remote).ok());
        const auto empty = adapter.send(idle, std::vector<std::uint8_t>{});
        assert(empty.ok());
        assert(empty.bytes == 0U);
    }

    std::cout << "transmission_tests passed\n";
    return 0;
}
