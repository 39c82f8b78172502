/**
 * @file mock_echo_demo.cpp
 * @brief openESPAT source file.
 */

#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "openespat/transport/mock_modem.hpp"
#include "openespat/wifi/wifi_adapter.hpp"

int main() {
    oea::MockModem modem;
    oea::MockCountdownTimer timer;
    oea::AdapterOptions options;
    options.txChunkSize = 16;
    options.rxChunkSize = 32;
    oea::WifiAdapter adapter(modem, timer, options);

    modem.setLocalAddressRecords({{"STAIP", "192.168.0.42"}, {"STAMAC", "24:0a:c4:00:00:01"}});

    const auto joined = adapter.join("demo-ap", "demo-password");
    if (!joined.ok()) {
        std::cerr << "Join failed: " << oea::toString(joined.error) << " " << adapter.lastError() << '\n';
        return 1;
    }
    const auto address = adapter.getAddress();
    if (address.ok() && address.address.ipv4) {
        std::cout << "station ip=" << oea::toString(*address.address.ipv4)
                  << " mac=" << address.address.mac.value_or("?") << '\n';
    }

    oea::Socket socket;
    auto result = adapter.socket(socket);
    if (!result.ok()) {
        std::cerr << "No socket: " << oea::toString(result.error) << '\n';
        return 1;
    }

    const auto remote = oea::parseSocketAddress("192.168.0.1:7");
    if (!remote) {
        return 1;
    }
    result = adapter.connect(socket, *remote);
    if (!result.ok()) {
        std::cerr << "Connect failed: " << adapter.lastError() << '\n';
        return 1;
    }

    const std::string message = "hello over a mocked ESP-AT link, split into several chunks";
    const std::vector<std::uint8_t> payload(message.begin(), message.end());
    result = adapter.send(socket, payload);
    std::cout << "send: " << oea::toString(result.error) << " bytes=" << result.bytes
              << " prepares=" << modem.countCommands(oea::AtCommandKind::PrepareTransmission) << '\n';

    // Echo peer: hand the module what we sent and let it signal +IPD.
    modem.remoteSend(socket.linkId(), modem.transmitted(socket.linkId()));

    std::vector<std::uint8_t> buffer(256);
    result = adapter.receive(socket, buffer.data(), buffer.size());
    if (result.ok()) {
        std::cout << "echo: " << std::string(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(result.bytes))
                  << '\n';
    }

    modem.remoteClose(socket.linkId());
    std::cout << "connected after remote close=" << (adapter.isConnected(socket) ? 1 : 0) << '\n';

    result = adapter.close(std::move(socket));
    std::cout << "close: " << oea::toString(result.error) << '\n';
    return 0;
}
