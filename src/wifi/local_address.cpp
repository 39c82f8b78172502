/**
 * @file local_address.cpp
 * @brief openESPAT source file.
 */

#include "openespat/wifi/local_address.hpp"

#include <algorithm>

namespace oea {

std::optional<LocalAddress> LocalAddress::fromRecords(const std::vector<LocalAddressRecord>& records) {
    LocalAddress data;
    const auto count = std::min(records.size(), kMaxRecords);

    for (std::size_t i = 0; i < count; ++i) {
        const auto& record = records[i];
        if (record.tag == "STAIP") {
            data.ipv4 = parseIpv4(record.address);
            if (!data.ipv4) {
                return std::nullopt;
            }
        } else if (record.tag == "STAIP6LL") {
            data.ipv6LinkLocal = parseIpv6(record.address);
            if (!data.ipv6LinkLocal) {
                return std::nullopt;
            }
        } else if (record.tag == "STAIP6GL") {
            data.ipv6Global = parseIpv6(record.address);
            if (!data.ipv6Global) {
                return std::nullopt;
            }
        } else if (record.tag == "STAMAC") {
            if (record.address.size() > kMaxMacLength) {
                return std::nullopt;
            }
            data.mac = record.address;
        }
    }

    return data;
}

} // namespace oea
