/**
 * @file network_address.cpp
 * @brief openESPAT source file.
 */

#include "openespat/core/network_address.hpp"

#include <arpa/inet.h>

#include <cstring>

namespace oea {
namespace {

std::optional<std::uint16_t> parsePort(const std::string& text) {
    if (text.empty() || text.size() > 5U) {
        return std::nullopt;
    }
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    const auto value = std::stoul(text);
    if (value > 0xFFFFUL) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

SocketAddress SocketAddress::fromIpv4(const Ipv4Address& address, std::uint16_t port) {
    SocketAddress out;
    out.family = AddressFamily::IPv4;
    out.v4 = address;
    out.port = port;
    return out;
}

SocketAddress SocketAddress::fromIpv6(const Ipv6Address& address, std::uint16_t port) {
    SocketAddress out;
    out.family = AddressFamily::IPv6;
    out.v6 = address;
    out.port = port;
    return out;
}

std::optional<Ipv4Address> parseIpv4(const std::string& text) {
    in_addr raw {};
    if (::inet_pton(AF_INET, text.c_str(), &raw) != 1) {
        return std::nullopt;
    }
    Ipv4Address address;
    std::memcpy(address.octets.data(), &raw, address.octets.size());
    return address;
}

std::optional<Ipv6Address> parseIpv6(const std::string& text) {
    in6_addr raw {};
    if (::inet_pton(AF_INET6, text.c_str(), &raw) != 1) {
        return std::nullopt;
    }
    Ipv6Address address;
    std::memcpy(address.octets.data(), &raw, address.octets.size());
    return address;
}

std::optional<SocketAddress> parseSocketAddress(const std::string& text) {
    if (!text.empty() && text.front() == '[') {
        const auto close = text.find(']');
        if (close == std::string::npos || close + 1U >= text.size() || text[close + 1U] != ':') {
            return std::nullopt;
        }
        const auto host = parseIpv6(text.substr(1U, close - 1U));
        const auto port = parsePort(text.substr(close + 2U));
        if (!host || !port) {
            return std::nullopt;
        }
        return SocketAddress::fromIpv6(*host, *port);
    }

    const auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    const auto host = parseIpv4(text.substr(0, colon));
    const auto port = parsePort(text.substr(colon + 1U));
    if (!host || !port) {
        return std::nullopt;
    }
    return SocketAddress::fromIpv4(*host, *port);
}

std::string toString(const Ipv4Address& address) {
    char buffer[INET_ADDRSTRLEN] = {};
    if (::inet_ntop(AF_INET, address.octets.data(), buffer, sizeof(buffer)) == nullptr) {
        return {};
    }
    return buffer;
}

std::string toString(const Ipv6Address& address) {
    char buffer[INET6_ADDRSTRLEN] = {};
    if (::inet_ntop(AF_INET6, address.octets.data(), buffer, sizeof(buffer)) == nullptr) {
        return {};
    }
    return buffer;
}

std::string hostString(const SocketAddress& address) {
    return (address.family == AddressFamily::IPv4) ? toString(address.v4) : toString(address.v6);
}

std::string toString(const SocketAddress& address) {
    if (address.family == AddressFamily::IPv4) {
        return toString(address.v4) + ":" + std::to_string(address.port);
    }
    return "[" + toString(address.v6) + "]:" + std::to_string(address.port);
}

} // namespace oea
