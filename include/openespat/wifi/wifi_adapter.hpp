/**
 * @file wifi_adapter.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "openespat/config/adapter_options.hpp"
#include "openespat/core/network_address.hpp"
#include "openespat/transport/countdown_timer.hpp"
#include "openespat/transport/i_modem_link.hpp"
#include "openespat/wifi/link_state.hpp"
#include "openespat/wifi/network_error.hpp"
#include "openespat/wifi/tcp_socket.hpp"

namespace oea {

/**
 * @brief Non-blocking multi-socket TCP stack on top of an ESP-AT module.
 *
 * WifiAdapter owns the fixed pool of link slots and keeps it consistent with the
 * module by draining notifications before and after every command. It is not
 * internally synchronized; one thread of control must own an instance.
 */
class WifiAdapter {
public:
    WifiAdapter(ICommandTransport& transport,
                INotificationSource& notifications,
                ICountdownTimer& timer,
                AdapterOptions options = {});
    WifiAdapter(IModemLink& link, ICountdownTimer& timer, AdapterOptions options = {});

    /**
     * @brief Switch to station mode and join the access point.
     *
     * If the join fails or the link drops later, the module keeps retrying in the
     * background. Use `joinState()` to re-query.
     */
    JoinResult join(const std::string& ssid, const std::string& password);
    /**
     * @brief Reconcile, then return the current association and lease snapshot.
     */
    JoinState joinState();
    AddressResult getAddress();
    /**
     * @brief Reset the module and all local state, then wait for `ready`.
     *
     * Every slot returns to Closed; handles issued before the restart become invalid.
     */
    NetworkResult restart();

    /**
     * @brief Apply all pending notifications and re-assert passive receive mode.
     */
    void processNotifications();

    void setSendTimeoutMs(std::uint32_t timeoutMs);
    std::chrono::milliseconds sendTimeout() const noexcept { return options_.sendTimeout; }

    /**
     * @brief Allocate the first Closed slot.
     *
     * The first call enables multiple connections on the module.
     */
    NetworkResult socket(Socket& outSocket);
    /**
     * @brief Open a TCP connection, IPv4 or IPv6.
     *
     * The first call enables passive receive mode. A synchronous "already connected"
     * from the module is taken as a missed connect notification and resolves to success.
     */
    NetworkResult connect(Socket& socket, const SocketAddress& remote);
    /**
     * @brief True if the slot is Connected. Remote closes are taken into account.
     */
    bool isConnected(const Socket& socket);
    /**
     * @brief Send all of `data` in chunks of `txChunkSize`, each confirmed by the module.
     *
     * Succeeds with the full size or fails; partial progress is not reported.
     */
    NetworkResult send(Socket& socket, const std::uint8_t* data, std::size_t size);
    NetworkResult send(Socket& socket, const std::vector<std::uint8_t>& data);
    /**
     * @brief Pull buffered data into `destination` until it is full or nothing is left.
     *
     * Returns WouldBlock when nothing was signaled for the slot.
     */
    NetworkResult receive(Socket& socket, std::uint8_t* destination, std::size_t capacity);
    /**
     * @brief Consume the handle. The slot is Closed afterwards even if the command failed.
     *
     * Releasing a slot invalidates every handle issued for it, even if the slot is later
     * handed out again.
     */
    NetworkResult close(Socket&& socket);

    SocketState socketState(std::size_t linkId) const;
    std::size_t bytesAvailable(std::size_t linkId) const;
    const LinkState& linkState() const noexcept { return state_; }
    const AdapterOptions& options() const noexcept { return options_; }
    std::string lastError() const { return error_; }

private:
    AtReply sendCommand(const AtCommand& command);
    NetworkResult checkHandle(const Socket& socket);
    NetworkResult enableMultipleConnections();
    NetworkResult enablePassiveReceiveMode();
    NetworkResult requireConnected(std::size_t linkId);
    NetworkResult sendChunk(std::size_t linkId, const std::uint8_t* data, std::size_t size);
    NetworkResult fail(NetworkErrorKind error, AtError cause, std::string message);
    NetworkResult commandFailed(AtCommandKind kind, const AtReply& reply, NetworkErrorKind error);
    void reduceBytesAvailable(std::size_t linkId, std::size_t count);
    void releaseSlot(std::size_t linkId);
    void setError(std::string message);
    void trace(const std::string& message) const;

    ICommandTransport& transport_;
    INotificationSource& notifications_;
    ICountdownTimer& timer_;
    AdapterOptions options_;
    LinkState state_{};
    bool multiConnectionsEnabled_ = false;
    bool passiveModeEnabled_ = false;
    bool traceAdapter_ = false;
    std::string error_;
};

} // namespace oea
