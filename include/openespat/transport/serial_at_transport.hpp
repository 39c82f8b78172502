/**
 * @file serial_at_transport.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "openespat/transport/at_codec.hpp"
#include "openespat/transport/i_modem_link.hpp"

namespace oea {

/**
 * @brief ESP-AT link over a Linux tty (raw 8N1).
 *
 * Commands and notifications share the serial channel: while waiting for a command's final
 * result code every line that is not part of the reply is queued as a notification and handed
 * out later by `pollNextEvent()`.
 */
class SerialAtTransport final : public IModemLink {
public:
    explicit SerialAtTransport(std::string device, std::uint32_t baudRate = 115200);
    ~SerialAtTransport() override;

    SerialAtTransport(const SerialAtTransport&) = delete;
    SerialAtTransport& operator=(const SerialAtTransport&) = delete;

    bool open() override;
    void close() override;
    std::string lastError() const override;

    AtReply send(const AtCommand& command) override;
    void reset() override;
    std::optional<ModemEvent> pollNextEvent() override;

    void setCommandTimeoutMs(int timeoutMs);
    void setJoinTimeoutMs(int timeoutMs);

    const std::string& device() const noexcept { return device_; }
    std::uint32_t baudRate() const noexcept { return baudRate_; }

private:
    bool writeAll(const std::string& bytes);
    /// Read whatever arrives within `timeoutMs` into the parser. Returns false on I/O error.
    bool readAvailable(int timeoutMs);
    void queueUnsolicited(const AtFrame& frame);
    int timeoutFor(const AtCommand& command) const noexcept;
    void trace(const char* direction, const std::string& text) const;

    std::string device_;
    std::uint32_t baudRate_;
    int fd_ = -1;
    int commandTimeoutMs_ = 2000;
    int joinTimeoutMs_ = 20000;
    bool traceAt_ = false;
    AtStreamParser parser_;
    std::deque<ModemEvent> events_;
    std::string error_;
};

} // namespace oea
