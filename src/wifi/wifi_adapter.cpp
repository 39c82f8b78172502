/**
 * @file wifi_adapter.cpp
 * @brief openESPAT source file.
 */

#include "openespat/wifi/wifi_adapter.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace oea {
namespace {

constexpr std::size_t kMaxSsidLength = 32;
constexpr std::size_t kMaxPasswordLength = 63;

bool parseBoolEnv(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    const std::string text(value);
    if (text == "1" || text == "true" || text == "TRUE" || text == "on" || text == "ON") {
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE" || text == "off" || text == "OFF") {
        return false;
    }
    return defaultValue;
}

AdapterOptions normalizeOptions(AdapterOptions options) {
    options.txChunkSize = std::clamp<std::size_t>(options.txChunkSize, 1U, AdapterOptions::kMaxChunkSize);
    options.rxChunkSize = std::clamp<std::size_t>(options.rxChunkSize, 1U, AdapterOptions::kMaxChunkSize);
    return options;
}

} // namespace

WifiAdapter::WifiAdapter(ICommandTransport& transport,
                         INotificationSource& notifications,
                         ICountdownTimer& timer,
                         AdapterOptions options)
    : transport_(transport),
      notifications_(notifications),
      timer_(timer),
      options_(normalizeOptions(options)),
      traceAdapter_(parseBoolEnv("OEA_TRACE_ADAPTER", false)) {}

WifiAdapter::WifiAdapter(IModemLink& link, ICountdownTimer& timer, AdapterOptions options)
    : WifiAdapter(link, link, timer, options) {}

JoinResult WifiAdapter::join(const std::string& ssid, const std::string& password) {
    JoinResult result;
    if (ssid.size() > kMaxSsidLength) {
        result.error = JoinErrorKind::InvalidSsidLength;
        setError("SSID longer than 32 bytes");
        return result;
    }
    if (password.size() > kMaxPasswordLength) {
        result.error = JoinErrorKind::InvalidPasswordLength;
        setError("Password longer than 63 bytes");
        return result;
    }

    auto reply = sendCommand(AtCommand::stationMode());
    if (!reply.ok()) {
        result.error = reply.wouldBlock() ? JoinErrorKind::UnexpectedWouldBlock : JoinErrorKind::ModeError;
        result.cause = reply.error;
        setError(std::string("Setting station mode failed: ") + toString(reply.error));
        return result;
    }

    reply = sendCommand(AtCommand::joinAccessPoint(ssid, password));
    if (!reply.ok()) {
        result.error = reply.wouldBlock() ? JoinErrorKind::UnexpectedWouldBlock : JoinErrorKind::ConnectError;
        result.cause = reply.error;
        setError("Joining '" + ssid + "' failed: " + toString(reply.error));
        return result;
    }

    processNotifications();
    result.state = JoinState{state_.connection.joined, state_.connection.ipAssigned};
    trace("join '" + ssid + "' connected=" + (result.state.connected ? "1" : "0") +
          " ipAssigned=" + (result.state.ipAssigned ? "1" : "0"));
    return result;
}

JoinState WifiAdapter::joinState() {
    processNotifications();
    return JoinState{state_.connection.joined, state_.connection.ipAssigned};
}

AddressResult WifiAdapter::getAddress() {
    AddressResult result;
    const auto reply = sendCommand(AtCommand::queryLocalAddress());
    if (!reply.ok()) {
        result.error = reply.wouldBlock() ? AddressErrorKind::UnexpectedWouldBlock : AddressErrorKind::CommandError;
        result.cause = reply.error;
        setError(std::string("Local address query failed: ") + toString(reply.error));
        return result;
    }

    auto address = LocalAddress::fromRecords(reply.addressRecords);
    if (!address) {
        result.error = AddressErrorKind::AddressParseError;
        setError("Malformed local address record");
        return result;
    }
    result.address = std::move(*address);
    return result;
}

NetworkResult WifiAdapter::restart() {
    const auto reply = sendCommand(AtCommand::restart());
    if (!reply.ok()) {
        return commandFailed(AtCommandKind::Restart, reply, NetworkErrorKind::RestartFailed);
    }

    const auto generations = state_.generations;
    state_ = LinkState{};
    for (std::size_t linkId = 0; linkId < kMaxLinks; ++linkId) {
        state_.generations[linkId] = generations[linkId] + 1U;
    }
    multiConnectionsEnabled_ = false;
    passiveModeEnabled_ = false;

    if (!timer_.start(options_.restartTimeout)) {
        return fail(NetworkErrorKind::TimerError, AtError::None, "Restart timer could not be started");
    }

    // Notifications ahead of `ready` describe the session that was just reset.
    while (true) {
        while (auto event = notifications_.pollNextEvent()) {
            if (event->type == ModemEventType::ModuleReady) {
                trace("module ready after restart");
                return NetworkResult::success();
            }
        }

        switch (timer_.poll()) {
        case TimerPoll::Running:
            break;
        case TimerPoll::Elapsed:
            return fail(NetworkErrorKind::RestartFailed, AtError::Timeout, "Module not ready after restart");
        case TimerPoll::Failed:
            return fail(NetworkErrorKind::TimerError, AtError::None, "Restart timer failed");
        }
    }
}

void WifiAdapter::processNotifications() {
    NotificationReconciler::drain(state_, notifications_);

    // Housekeeping only, the reply is not checked.
    (void)sendCommand(AtCommand::passiveReceiveMode());
}

void WifiAdapter::setSendTimeoutMs(std::uint32_t timeoutMs) {
    options_.sendTimeout = std::chrono::milliseconds(timeoutMs);
}

SocketState WifiAdapter::socketState(std::size_t linkId) const {
    if (linkId >= kMaxLinks) {
        return SocketState::Closed;
    }
    return state_.sockets[linkId];
}

std::size_t WifiAdapter::bytesAvailable(std::size_t linkId) const {
    if (linkId >= kMaxLinks) {
        return 0;
    }
    return state_.bytesAvailable[linkId];
}

AtReply WifiAdapter::sendCommand(const AtCommand& command) {
    auto reply = transport_.send(command);
    if (reply.status == AtStatus::Failed && reply.error == AtError::AlreadyConnected) {
        state_.alreadyConnected = true;
    }
    return reply;
}

NetworkResult WifiAdapter::fail(NetworkErrorKind error, AtError cause, std::string message) {
    trace(message);
    setError(std::move(message));
    return NetworkResult::failure(error, cause);
}

NetworkResult WifiAdapter::commandFailed(AtCommandKind kind, const AtReply& reply, NetworkErrorKind error) {
    std::ostringstream os;
    os << toString(kind) << " failed: ";
    if (reply.wouldBlock()) {
        os << "transport busy";
        return fail(NetworkErrorKind::UnexpectedWouldBlock, AtError::None, os.str());
    }
    os << toString(reply.error);
    return fail(error, reply.error, os.str());
}

void WifiAdapter::setError(std::string message) { error_ = std::move(message); }

void WifiAdapter::trace(const std::string& message) const {
    if (traceAdapter_) {
        std::cerr << "[oea] " << message << "\n";
    }
}

} // namespace oea
