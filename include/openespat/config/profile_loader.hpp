/**
 * @file profile_loader.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <string>

#include "openespat/config/adapter_options.hpp"

namespace oea {

/**
 * @brief Loads a `ModemProfile` from a flat JSON document and the environment.
 *
 * Recognized keys: transport, ssid, password, commandTimeoutMs, joinTimeoutMs,
 * sendTimeoutMs, txChunkSize, rxChunkSize, restartTimeoutMs. Unknown keys are ignored.
 */
class ProfileLoader {
public:
    /**
     * @brief Parse `filePath` into `outProfile`, starting from defaults.
     *
     * @param filePath Path to the JSON profile.
     * @param outProfile Parsed profile on success.
     * @param outError Human-readable parse/IO error on failure.
     * @return true if parsing succeeded.
     */
    static bool loadFromJsonFile(const std::string& filePath,
                                 ModemProfile& outProfile,
                                 std::string& outError);

    static bool loadFromJsonText(const std::string& json,
                                 ModemProfile& outProfile,
                                 std::string& outError);

    /**
     * @brief Apply OEA_TRANSPORT, OEA_SEND_TIMEOUT_MS, OEA_TX_CHUNK_SIZE and OEA_RX_CHUNK_SIZE.
     *
     * Values that fail to parse leave the profile untouched.
     */
    static void applyEnvironmentOverrides(ModemProfile& profile);
};

} // namespace oea
