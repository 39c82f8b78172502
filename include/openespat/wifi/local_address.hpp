/**
 * @file local_address.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "openespat/core/network_address.hpp"
#include "openespat/transport/at_command.hpp"

namespace oea {

/**
 * @brief Local IP and MAC addresses of the station interface.
 */
struct LocalAddress {
    /// Local IPv4 address if assigned.
    std::optional<Ipv4Address> ipv4;
    /// Link local IPv6 address if assigned.
    std::optional<Ipv6Address> ipv6LinkLocal;
    /// Global IPv6 address if assigned.
    std::optional<Ipv6Address> ipv6Global;
    /// MAC address as reported, at most 17 characters.
    std::optional<std::string> mac;

    static constexpr std::size_t kMaxRecords = 4;
    static constexpr std::size_t kMaxMacLength = 17;

    /**
     * @brief Build from `+CIFSR` records keyed by tag. Unknown tags are ignored.
     * @return std::nullopt if a known record does not parse.
     */
    static std::optional<LocalAddress> fromRecords(const std::vector<LocalAddressRecord>& records);
};

} // namespace oea
