/**
 * @file wifi_adapter_tcp_stack.cpp
 * @brief Socket lifecycle, chunked transmission and the pull-based receive path.
 */

#include "openespat/wifi/wifi_adapter.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "openespat/wifi/receive_buffer.hpp"

namespace oea {
namespace {

std::string linkName(std::size_t linkId) { return "link " + std::to_string(linkId); }

} // namespace

NetworkResult WifiAdapter::socket(Socket& outSocket) {
    processNotifications();

    auto enabled = enableMultipleConnections();
    if (!enabled.ok()) {
        return enabled;
    }

    const auto slot = std::find(state_.sockets.begin(), state_.sockets.end(), SocketState::Closed);
    if (slot == state_.sockets.end()) {
        return fail(NetworkErrorKind::NoSocketAvailable, AtError::None, "All link slots are in use");
    }

    *slot = SocketState::Open;
    const auto linkId = static_cast<std::size_t>(slot - state_.sockets.begin());
    outSocket = Socket(linkId, state_.generations[linkId]);
    trace("allocated " + linkName(linkId));
    return NetworkResult::success();
}

NetworkResult WifiAdapter::connect(Socket& socket, const SocketAddress& remote) {
    auto valid = checkHandle(socket);
    if (!valid.ok()) {
        return valid;
    }
    const auto linkId = socket.linkId();

    processNotifications();
    if (state_.sockets[linkId] == SocketState::Connected) {
        return fail(NetworkErrorKind::AlreadyConnected, AtError::None, linkName(linkId) + " is already connected");
    }

    auto enabled = enablePassiveReceiveMode();
    if (!enabled.ok()) {
        return enabled;
    }

    state_.alreadyConnected = false;
    const auto reply = sendCommand(AtCommand::connectTcp(linkId, remote));
    processNotifications();

    // The module still holds the link although its CONNECT notification was never seen.
    if (state_.alreadyConnected) {
        state_.sockets[linkId] = SocketState::Connected;
        trace(linkName(linkId) + " recovered from connect collision");
        return NetworkResult::success();
    }
    if (!reply.ok()) {
        return commandFailed(AtCommandKind::ConnectTcp, reply, NetworkErrorKind::ConnectError);
    }
    if (state_.sockets[linkId] != SocketState::Connected) {
        return fail(NetworkErrorKind::UnconfirmedSocketState,
                    AtError::None,
                    linkName(linkId) + " connect not confirmed by module");
    }

    state_.bytesAvailable[linkId] = 0;
    trace(linkName(linkId) + " connected to " + toString(remote));
    return NetworkResult::success();
}

bool WifiAdapter::isConnected(const Socket& socket) {
    if (!socket.valid() || socket.linkId() >= kMaxLinks) {
        return false;
    }
    processNotifications();
    return socket.generation_ == state_.generations[socket.linkId()] &&
           state_.sockets[socket.linkId()] == SocketState::Connected;
}

NetworkResult WifiAdapter::send(Socket& socket, const std::vector<std::uint8_t>& data) {
    return send(socket, data.data(), data.size());
}

NetworkResult WifiAdapter::send(Socket& socket, const std::uint8_t* data, std::size_t size) {
    auto valid = checkHandle(socket);
    if (!valid.ok()) {
        return valid;
    }
    const auto linkId = socket.linkId();

    processNotifications();
    auto connected = requireConnected(linkId);
    if (!connected.ok()) {
        return connected;
    }

    for (std::size_t offset = 0; offset < size; offset += options_.txChunkSize) {
        const auto length = std::min(options_.txChunkSize, size - offset);
        const auto reply = sendCommand(AtCommand::prepareTransmission(linkId, length));
        if (!reply.ok()) {
            return commandFailed(AtCommandKind::PrepareTransmission, reply, NetworkErrorKind::TransmissionStartFailed);
        }

        auto chunk = sendChunk(linkId, data + offset, length);
        if (!chunk.ok()) {
            return chunk;
        }
    }

    return NetworkResult::success(size);
}

NetworkResult WifiAdapter::sendChunk(std::size_t linkId, const std::uint8_t* data, std::size_t size) {
    state_.transfer = TransferState{};

    const auto reply = sendCommand(AtCommand::transmitData(data, size));
    if (!reply.ok()) {
        return commandFailed(AtCommandKind::TransmitData, reply, NetworkErrorKind::SendFailed);
    }
    if (!timer_.start(options_.sendTimeout)) {
        transport_.reset();
        return fail(NetworkErrorKind::TimerError, AtError::None, "Send timer could not be started");
    }

    while (true) {
        processNotifications();

        if (state_.transfer.sendConfirmed.has_value()) {
            if (!*state_.transfer.sendConfirmed) {
                // A pending prompt would otherwise swallow the next command reply.
                transport_.reset();
                return fail(NetworkErrorKind::SendFailed, AtError::Error, linkName(linkId) + " SEND FAIL");
            }
            const auto& accepted = state_.transfer.recvByteCount;
            if (accepted.has_value() && *accepted != size) {
                return fail(NetworkErrorKind::PartialSend,
                            AtError::None,
                            linkName(linkId) + " module accepted " + std::to_string(*accepted) + " of " +
                                std::to_string(size) + " bytes");
            }
            return NetworkResult::success(size);
        }

        switch (timer_.poll()) {
        case TimerPoll::Running:
            break;
        case TimerPoll::Elapsed:
            transport_.reset();
            return fail(NetworkErrorKind::SendFailed, AtError::Timeout, linkName(linkId) + " send confirmation timed out");
        case TimerPoll::Failed:
            transport_.reset();
            return fail(NetworkErrorKind::TimerError, AtError::None, "Send timer failed");
        }
    }
}

NetworkResult WifiAdapter::receive(Socket& socket, std::uint8_t* destination, std::size_t capacity) {
    auto valid = checkHandle(socket);
    if (!valid.ok()) {
        return valid;
    }
    const auto linkId = socket.linkId();

    processNotifications();
    if (state_.bytesAvailable[linkId] == 0) {
        return NetworkResult::failure(NetworkErrorKind::WouldBlock);
    }

    ReceiveBuffer buffer(destination, capacity, options_.rxChunkSize);
    while (state_.bytesAvailable[linkId] > 0 && !buffer.isFull()) {
        state_.receivedData.reset();
        const auto reply = sendCommand(AtCommand::receiveData(linkId, buffer.nextLength()));
        if (!reply.ok()) {
            return commandFailed(AtCommandKind::ReceiveData, reply, NetworkErrorKind::ReceiveFailed);
        }
        processNotifications();

        if (!state_.receivedData.has_value()) {
            return fail(NetworkErrorKind::ReceiveFailed,
                        AtError::InvalidResponse,
                        linkName(linkId) + " receive returned no data");
        }
        const auto data = std::move(*state_.receivedData);
        state_.receivedData.reset();

        if (data.empty()) {
            // Module holds less than was signaled.
            state_.bytesAvailable[linkId] = 0;
            break;
        }

        reduceBytesAvailable(linkId, data.size());
        if (!buffer.append(data)) {
            return fail(NetworkErrorKind::ReceiveOverflow,
                        AtError::None,
                        linkName(linkId) + " module returned " + std::to_string(data.size()) + " bytes for " +
                            std::to_string(buffer.space()) + " bytes of space");
        }
    }

    if (buffer.size() == 0U && capacity != 0U) {
        return NetworkResult::failure(NetworkErrorKind::WouldBlock);
    }
    return NetworkResult::success(buffer.size());
}

NetworkResult WifiAdapter::close(Socket&& socket) {
    const Socket handle(std::move(socket));
    auto valid = checkHandle(handle);
    if (!valid.ok()) {
        return valid;
    }
    const auto linkId = handle.linkId();

    processNotifications();
    auto& slot = state_.sockets[linkId];
    if (slot == SocketState::Open || slot == SocketState::Closing) {
        releaseSlot(linkId);
        trace(linkName(linkId) + " released");
        return NetworkResult::success();
    }

    const auto reply = sendCommand(AtCommand::closeSocket(linkId));
    processNotifications();

    auto result = NetworkResult::success();
    if (!reply.ok()) {
        result = commandFailed(AtCommandKind::CloseSocket, reply, NetworkErrorKind::CloseError);
    } else if (slot != SocketState::Closing) {
        result = fail(NetworkErrorKind::UnconfirmedSocketState, AtError::None, linkName(linkId) + " close not confirmed by module");
    }

    // The handle is gone; a slot left open here could never be reused.
    releaseSlot(linkId);
    return result;
}

NetworkResult WifiAdapter::checkHandle(const Socket& socket) {
    if (!socket.valid() || socket.linkId() >= kMaxLinks) {
        return fail(NetworkErrorKind::InvalidSocket, AtError::None, "Socket handle is not valid");
    }
    if (state_.sockets[socket.linkId()] == SocketState::Closed) {
        return fail(NetworkErrorKind::InvalidSocket, AtError::None, linkName(socket.linkId()) + " is not allocated");
    }
    if (socket.generation_ != state_.generations[socket.linkId()]) {
        return fail(NetworkErrorKind::InvalidSocket,
                    AtError::None,
                    linkName(socket.linkId()) + " was released and handed out again");
    }
    return NetworkResult::success();
}

NetworkResult WifiAdapter::enableMultipleConnections() {
    if (multiConnectionsEnabled_) {
        return NetworkResult::success();
    }
    const auto reply = sendCommand(AtCommand::multipleConnections());
    if (!reply.ok()) {
        return commandFailed(AtCommandKind::SetMultipleConnections, reply, NetworkErrorKind::EnablingMultiConnectionsFailed);
    }
    multiConnectionsEnabled_ = true;
    return NetworkResult::success();
}

NetworkResult WifiAdapter::enablePassiveReceiveMode() {
    if (passiveModeEnabled_) {
        return NetworkResult::success();
    }
    const auto reply = sendCommand(AtCommand::passiveReceiveMode());
    if (!reply.ok()) {
        return commandFailed(AtCommandKind::SetReceiveMode, reply, NetworkErrorKind::EnablingPassiveSocketModeFailed);
    }
    passiveModeEnabled_ = true;
    return NetworkResult::success();
}

NetworkResult WifiAdapter::requireConnected(std::size_t linkId) {
    switch (state_.sockets[linkId]) {
    case SocketState::Connected:
        return NetworkResult::success();
    case SocketState::Closing:
        return fail(NetworkErrorKind::ClosingSocket, AtError::None, linkName(linkId) + " was closed by the remote side");
    case SocketState::Open:
    case SocketState::Closed:
        break;
    }
    return fail(NetworkErrorKind::SocketUnconnected, AtError::None, linkName(linkId) + " is not connected");
}

void WifiAdapter::releaseSlot(std::size_t linkId) {
    state_.sockets[linkId] = SocketState::Closed;
    ++state_.generations[linkId];
}

void WifiAdapter::reduceBytesAvailable(std::size_t linkId, std::size_t count) {
    auto& available = state_.bytesAvailable[linkId];
    available = (count > available) ? 0U : available - count;
}

} // namespace oea
