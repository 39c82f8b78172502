/**
 * @file adapter_options.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace oea {

/**
 * @brief Runtime knobs of `WifiAdapter`.
 */
struct AdapterOptions {
    /// Upper bound for waiting on SEND OK / SEND FAIL per chunk.
    std::chrono::milliseconds sendTimeout{5000};
    /// Outbound chunk size in bytes. Larger values need fewer round trips.
    std::size_t txChunkSize = 1024;
    /// Receive pull size in bytes.
    std::size_t rxChunkSize = 1024;
    /// Upper bound for the `ready` notification after AT+RST.
    std::chrono::milliseconds restartTimeout{5000};

    static constexpr std::size_t kMaxChunkSize = 8192;
};

/**
 * @brief Everything needed to bring up one module: link, credentials and adapter options.
 */
struct ModemProfile {
    /// Transport spec, see `TransportFactory::parseTransportSpec`.
    std::string transport = "mock";
    std::string ssid;
    std::string password;
    /// Serial command reply timeout.
    int commandTimeoutMs = 2000;
    /// Serial reply timeout for AT+CWJAP and AT+RST.
    int joinTimeoutMs = 20000;
    AdapterOptions options{};
};

} // namespace oea
