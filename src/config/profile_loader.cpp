/**
 * @file profile_loader.cpp
 * @brief openESPAT source file.
 */

#include "openespat/config/profile_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace oea {
namespace {

bool readFile(const std::string& path, std::string& out, std::string& outError) {
    std::ifstream file(path);
    if (!file) {
        outError = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

std::optional<std::string> stringValue(const std::string& json, const std::string& key) {
    const std::regex re("\"" + key + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
    std::smatch match;
    if (!std::regex_search(json, match, re) || match.size() < 2) {
        return std::nullopt;
    }

    const auto raw = match[1].str();
    std::string value;
    value.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\' && (i + 1U) < raw.size()) {
            ++i;
        }
        value.push_back(raw[i]);
    }
    return value;
}

std::optional<std::string> scalarValue(const std::string& json, const std::string& key) {
    const std::regex re("\"" + key + "\"\\s*:\\s*([^,\\}\\s]+)");
    std::smatch match;
    if (!std::regex_search(json, match, re) || match.size() < 2) {
        return std::nullopt;
    }
    return match[1].str();
}

std::size_t parseUnsigned(const std::string& key,
                          const std::string& text,
                          unsigned long long maxValue = std::numeric_limits<std::size_t>::max()) {
    std::size_t consumed = 0;
    const auto value = std::stoull(text, &consumed, 10);
    if (consumed != text.size() || text.front() == '-') {
        throw std::invalid_argument("invalid numeric value for '" + key + "'");
    }
    if (value > maxValue) {
        throw std::out_of_range("value for '" + key + "' exceeds " + std::to_string(maxValue));
    }
    return static_cast<std::size_t>(value);
}

int parseTimeoutMs(const std::string& key, const std::string& text) {
    return static_cast<int>(parseUnsigned(key, text, static_cast<unsigned long long>(std::numeric_limits<int>::max())));
}

template <typename T>
T parseIntegralEnv(const char* name, T defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    try {
        if constexpr (std::is_signed<T>::value) {
            return static_cast<T>(std::stoll(value, nullptr, 0));
        } else {
            return static_cast<T>(std::stoull(value, nullptr, 0));
        }
    } catch (const std::exception&) {
        return defaultValue;
    }
}

} // namespace

bool ProfileLoader::loadFromJsonFile(const std::string& filePath,
                                     ModemProfile& outProfile,
                                     std::string& outError) {
    outProfile = ModemProfile{};
    outError.clear();

    std::string json;
    if (!readFile(filePath, json, outError)) {
        return false;
    }
    return loadFromJsonText(json, outProfile, outError);
}

bool ProfileLoader::loadFromJsonText(const std::string& json,
                                     ModemProfile& outProfile,
                                     std::string& outError) {
    outProfile = ModemProfile{};
    outError.clear();

    if (json.find('{') == std::string::npos) {
        outError = "No JSON object found";
        return false;
    }

    try {
        if (auto value = stringValue(json, "transport")) {
            outProfile.transport = *value;
        }
        if (auto value = stringValue(json, "ssid")) {
            outProfile.ssid = *value;
        }
        if (auto value = stringValue(json, "password")) {
            outProfile.password = *value;
        }
        if (auto value = scalarValue(json, "commandTimeoutMs")) {
            outProfile.commandTimeoutMs = parseTimeoutMs("commandTimeoutMs", *value);
        }
        if (auto value = scalarValue(json, "joinTimeoutMs")) {
            outProfile.joinTimeoutMs = parseTimeoutMs("joinTimeoutMs", *value);
        }
        if (auto value = scalarValue(json, "sendTimeoutMs")) {
            outProfile.options.sendTimeout = std::chrono::milliseconds(parseUnsigned("sendTimeoutMs", *value));
        }
        if (auto value = scalarValue(json, "restartTimeoutMs")) {
            outProfile.options.restartTimeout =
                std::chrono::milliseconds(parseUnsigned("restartTimeoutMs", *value));
        }
        if (auto value = scalarValue(json, "txChunkSize")) {
            outProfile.options.txChunkSize = parseUnsigned("txChunkSize", *value);
        }
        if (auto value = scalarValue(json, "rxChunkSize")) {
            outProfile.options.rxChunkSize = parseUnsigned("rxChunkSize", *value);
        }
        return true;
    } catch (const std::exception& ex) {
        outError = std::string("Profile parse error: ") + ex.what();
        return false;
    }
}

void ProfileLoader::applyEnvironmentOverrides(ModemProfile& profile) {
    if (const char* transport = std::getenv("OEA_TRANSPORT")) {
        profile.transport = transport;
    }
    profile.options.sendTimeout = std::chrono::milliseconds(
        parseIntegralEnv<std::int64_t>("OEA_SEND_TIMEOUT_MS", profile.options.sendTimeout.count()));
    profile.options.txChunkSize = parseIntegralEnv<std::size_t>("OEA_TX_CHUNK_SIZE", profile.options.txChunkSize);
    profile.options.rxChunkSize = parseIntegralEnv<std::size_t>("OEA_RX_CHUNK_SIZE", profile.options.rxChunkSize);
}

} // namespace oea
