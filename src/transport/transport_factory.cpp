#include "openespat/transport/transport_factory.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

#include "openespat/transport/mock_modem.hpp"
#include "openespat/transport/serial_at_transport.hpp"

namespace oea {
namespace {

std::string trimCopy(std::string value) {
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                value.end());
    return value;
}

} // namespace

bool TransportFactory::parseTransportSpec(const std::string& spec,
                                          TransportFactoryConfig& outConfig,
                                          std::string& outError) {
    outError.clear();
    const auto trimmed = trimCopy(spec);
    if (trimmed.empty()) {
        outError = "transport spec is empty";
        return false;
    }

    if (trimmed == "mock") {
        outConfig.kind = TransportKind::Mock;
        outConfig.device.clear();
        return true;
    }

    constexpr const char* kSerialPrefix = "serial:";
    if (trimmed.rfind(kSerialPrefix, 0) == 0) {
        outConfig.kind = TransportKind::Serial;
        const std::string rest = trimCopy(trimmed.substr(7));
        const auto at = rest.find('@');
        outConfig.device = trimCopy(rest.substr(0, at));
        if (outConfig.device.empty()) {
            outError = "serial transport requires a device, e.g. serial:/dev/ttyUSB0";
            return false;
        }
        if (at == std::string::npos) {
            return true;
        }

        const auto baudText = trimCopy(rest.substr(at + 1));
        try {
            std::size_t consumed = 0;
            const auto baud = std::stoul(baudText, &consumed, 10);
            if (consumed != baudText.size() || baud == 0UL) {
                outError = "invalid baud rate '" + baudText + "'";
                return false;
            }
            outConfig.baudRate = static_cast<std::uint32_t>(baud);
        } catch (const std::exception&) {
            outError = "invalid baud rate '" + baudText + "'";
            return false;
        }
        return true;
    }

    outError = "unsupported transport spec '" + spec + "', expected 'mock' or 'serial:<device>[@<baud>]'";
    return false;
}

std::unique_ptr<IModemLink> TransportFactory::create(const TransportFactoryConfig& config,
                                                     std::string& outError) {
    outError.clear();

    if (config.kind == TransportKind::Mock) {
        return std::make_unique<MockModem>();
    }

    if (config.kind != TransportKind::Serial) {
        outError = "unsupported transport kind";
        return nullptr;
    }

    if (config.device.empty()) {
        outError = "serial transport requires device";
        return nullptr;
    }

    auto transport = std::make_unique<SerialAtTransport>(config.device, config.baudRate);
    transport->setCommandTimeoutMs(config.commandTimeoutMs);
    transport->setJoinTimeoutMs(config.joinTimeoutMs);
    return transport;
}

} // namespace oea
