/**
 * @file at_codec.hpp
 * @brief ESP-AT wire encoding for commands and decoding for module output.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "openespat/transport/at_command.hpp"
#include "openespat/transport/modem_event.hpp"

namespace oea {

/**
 * @brief Frame produced by `AtStreamParser`.
 */
enum class AtFrameType {
    Line,
    /// `>` data prompt after AT+CIPSEND.
    Prompt,
    /// Binary payload of a `+CIPRECVDATA` reply.
    ReceivedData,
};

struct AtFrame {
    AtFrameType type = AtFrameType::Line;
    std::string line;
    std::vector<std::uint8_t> data;
};

class AtCodec {
public:
    /**
     * @brief Encode a command to the bytes written on the wire.
     *
     * Text commands are terminated by CRLF; TransmitData yields the raw payload.
     */
    static std::string encode(const AtCommand& command);

    /**
     * @brief Decode one complete module line to a notification.
     * @return std::nullopt for empty lines, `Unrecognized` for unknown ones.
     */
    static std::optional<ModemEvent> decodeUrcLine(const std::string& line);

    /**
     * @brief Parse a `+CIFSR:<tag>,"<address>"` line.
     */
    static std::optional<LocalAddressRecord> parseAddressRecord(const std::string& line);

    /**
     * @brief Quote an AT string argument, escaping `\`, `"` and `,`.
     */
    static std::string quote(const std::string& value);

    /**
     * @brief True for the final result codes ending a command exchange.
     */
    static bool isFinalResult(const std::string& line);
};

/**
 * @brief Incremental framer for the module's output byte stream.
 *
 * Bytes may arrive in arbitrary pieces; `next()` yields a frame only once it is complete.
 * `+CIPRECVDATA` payloads are consumed by their declared length and may contain CR/LF.
 */
class AtStreamParser {
public:
    void feed(const std::uint8_t* data, std::size_t length);
    void feed(const std::string& text);
    std::optional<AtFrame> next();
    void clear();

    std::size_t buffered() const noexcept { return buffer_.size(); }

private:
    enum class PayloadHeader { Incomplete, Invalid, Complete };

    PayloadHeader parsePayloadHeader(std::size_t& outLength, std::size_t& outDataStart) const;

    std::string buffer_;
};

} // namespace oea
