/**
 * @file network_address.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace oea {

enum class AddressFamily { IPv4, IPv6 };

struct Ipv4Address {
    std::array<std::uint8_t, 4> octets{};

    bool operator==(const Ipv4Address&) const = default;
};

struct Ipv6Address {
    std::array<std::uint8_t, 16> octets{};

    bool operator==(const Ipv6Address&) const = default;
};

/**
 * @brief Remote TCP endpoint, either IPv4 or IPv6.
 */
struct SocketAddress {
    AddressFamily family = AddressFamily::IPv4;
    Ipv4Address v4{};
    Ipv6Address v6{};
    std::uint16_t port = 0;

    static SocketAddress fromIpv4(const Ipv4Address& address, std::uint16_t port);
    static SocketAddress fromIpv6(const Ipv6Address& address, std::uint16_t port);
};

std::optional<Ipv4Address> parseIpv4(const std::string& text);
std::optional<Ipv6Address> parseIpv6(const std::string& text);

/**
 * @brief Parse "a.b.c.d:port" or "[v6]:port".
 */
std::optional<SocketAddress> parseSocketAddress(const std::string& text);

std::string toString(const Ipv4Address& address);
std::string toString(const Ipv6Address& address);
/**
 * @brief Host part only, without brackets or port.
 */
std::string hostString(const SocketAddress& address);
std::string toString(const SocketAddress& address);

} // namespace oea
