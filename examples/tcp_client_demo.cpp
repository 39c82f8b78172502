/**
 * @file tcp_client_demo.cpp
 * @brief openESPAT source file.
 */

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "openespat/config/profile_loader.hpp"
#include "openespat/config/profile_validator.hpp"
#include "openespat/transport/transport_factory.hpp"
#include "openespat/wifi/wifi_adapter.hpp"

int main(int argc, char** argv) {
    const std::string profilePath = (argc > 1) ? argv[1] : "examples/config/modem_profile.json";
    const std::string target = (argc > 2) ? argv[2] : "93.184.216.34:80";

    oea::ModemProfile profile;
    std::string error;
    if (!oea::ProfileLoader::loadFromJsonFile(profilePath, profile, error)) {
        std::cerr << "Profile load failed: " << error << '\n';
        return 1;
    }
    oea::ProfileLoader::applyEnvironmentOverrides(profile);

    const auto issues = oea::ProfileValidator::validate(profile);
    for (const auto& issue : issues) {
        std::cerr << (issue.severity == oea::ValidationSeverity::Error ? "error: " : "warning: ") << issue.message
                  << '\n';
    }
    if (oea::ProfileValidator::hasErrors(issues)) {
        return 1;
    }

    const auto remote = oea::parseSocketAddress(target);
    if (!remote) {
        std::cerr << "Invalid target address: " << target << '\n';
        return 1;
    }

    oea::TransportFactoryConfig transportConfig;
    if (!oea::TransportFactory::parseTransportSpec(profile.transport, transportConfig, error)) {
        std::cerr << "Transport spec error: " << error << '\n';
        return 1;
    }
    transportConfig.commandTimeoutMs = profile.commandTimeoutMs;
    transportConfig.joinTimeoutMs = profile.joinTimeoutMs;

    auto link = oea::TransportFactory::create(transportConfig, error);
    if (!link) {
        std::cerr << "Transport create failed: " << error << '\n';
        return 1;
    }
    if (!link->open()) {
        std::cerr << "Transport open failed: " << link->lastError() << '\n';
        return 1;
    }

    oea::SteadyCountdownTimer timer;
    oea::WifiAdapter adapter(*link, timer, profile.options);

    const auto joined = adapter.join(profile.ssid, profile.password);
    if (!joined.ok()) {
        std::cerr << "Join failed: " << oea::toString(joined.error) << " (" << adapter.lastError() << ")\n";
        return 1;
    }

    // The module keeps associating in the background; wait for the lease.
    auto state = joined.state;
    for (int attempt = 0; attempt < 100 && !state.ipAssigned; ++attempt) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        state = adapter.joinState();
    }
    if (!state.ipAssigned) {
        std::cerr << "No IP address assigned\n";
        return 1;
    }

    const auto address = adapter.getAddress();
    if (address.ok() && address.address.ipv4) {
        std::cout << "local ip=" << oea::toString(*address.address.ipv4) << '\n';
    }

    oea::Socket socket;
    auto result = adapter.socket(socket);
    if (result.ok()) {
        result = adapter.connect(socket, *remote);
    }
    if (!result.ok()) {
        std::cerr << "Connect failed: " << oea::toString(result.error) << " (" << adapter.lastError() << ")\n";
        return 1;
    }

    const std::string request = "GET / HTTP/1.0\r\nHost: " + oea::hostString(*remote) + "\r\n\r\n";
    result = adapter.send(socket, std::vector<std::uint8_t>(request.begin(), request.end()));
    if (!result.ok()) {
        std::cerr << "Send failed: " << oea::toString(result.error) << " (" << adapter.lastError() << ")\n";
        (void)adapter.close(std::move(socket));
        return 1;
    }

    std::vector<std::uint8_t> buffer(2048);
    std::size_t total = 0;
    for (int poll = 0; poll < 50; ++poll) {
        result = adapter.receive(socket, buffer.data(), buffer.size());
        if (result.ok()) {
            total += result.bytes;
            std::cout.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(result.bytes));
            continue;
        }
        if (!result.wouldBlock()) {
            std::cerr << "\nReceive failed: " << oea::toString(result.error) << '\n';
            break;
        }
        if (!adapter.isConnected(socket) && adapter.bytesAvailable(socket.linkId()) == 0U) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cout << "\nreceived " << total << " bytes\n";

    result = adapter.close(std::move(socket));
    if (!result.ok()) {
        std::cerr << "Close: " << oea::toString(result.error) << '\n';
    }
    link->close();
    return 0;
}
