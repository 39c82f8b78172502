/**
 * @file i_modem_link.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <optional>
#include <string>

#include "openespat/transport/at_command.hpp"
#include "openespat/transport/modem_event.hpp"

namespace oea {

/**
 * @brief Request/response channel to the module.
 */
class ICommandTransport {
public:
    virtual ~ICommandTransport() = default;

    /**
     * @brief Send one command and wait for its typed reply.
     *
     * A busy channel is reported as `AtStatus::WouldBlock`, distinct from a failed exchange.
     */
    virtual AtReply send(const AtCommand& command) = 0;
    /**
     * @brief Drop partially framed input and pending prompt state after an aborted exchange.
     */
    virtual void reset() = 0;
};

/**
 * @brief Pull-based source of unsolicited notifications. Never blocks.
 */
class INotificationSource {
public:
    virtual ~INotificationSource() = default;

    virtual std::optional<ModemEvent> pollNextEvent() = 0;
};

/**
 * @brief One physical link carrying both commands and notifications.
 */
class IModemLink : public ICommandTransport, public INotificationSource {
public:
    virtual bool open() = 0;
    virtual void close() = 0;
    virtual std::string lastError() const = 0;
};

} // namespace oea
