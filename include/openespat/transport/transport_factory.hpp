#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "openespat/transport/i_modem_link.hpp"

namespace oea {

enum class TransportKind {
    Mock,
    Serial,
};

struct TransportFactoryConfig {
    TransportKind kind = TransportKind::Mock;
    std::string device;
    std::uint32_t baudRate = 115200;
    int commandTimeoutMs = 2000;
    int joinTimeoutMs = 20000;
};

/**
 * @brief Create modem links from a small runtime config.
 *
 * Transport spec format for parseTransportSpec:
 * - mock
 * - serial:<device>
 * - serial:<device>@<baud>
 */
class TransportFactory {
public:
    static bool parseTransportSpec(const std::string& spec,
                                   TransportFactoryConfig& outConfig,
                                   std::string& outError);

    static std::unique_ptr<IModemLink> create(const TransportFactoryConfig& config,
                                              std::string& outError);
};

} // namespace oea
