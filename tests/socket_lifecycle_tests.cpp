/**
 * @file socket_lifecycle_tests.cpp
 * @brief Slot allocation, connect confirmation and close semantics against MockModem.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iostream>
#include <optional>
#include <random>
#include <utility>
#include <vector>

#include "openespat/transport/mock_modem.hpp"
#include "openespat/wifi/wifi_adapter.hpp"

namespace {

struct Bench {
    oea::MockModem modem;
    oea::MockCountdownTimer timer;
    oea::WifiAdapter adapter{modem, timer};
};

oea::SocketAddress remoteV4() {
    const auto address = oea::parseSocketAddress("192.168.4.10:5000");
    assert(address.has_value());
    return *address;
}

// Fails every connect and reports the collision only as a notification.
class CollidingTransport final : public oea::ICommandTransport {
public:
    class EventQueue final : public oea::INotificationSource {
    public:
        std::optional<oea::ModemEvent> pollNextEvent() override {
            if (pending.empty()) {
                return std::nullopt;
            }
            auto event = pending.front();
            pending.pop_front();
            return event;
        }

        std::deque<oea::ModemEvent> pending;
    };

    oea::AtReply send(const oea::AtCommand& command) override {
        if (command.kind == oea::AtCommandKind::ConnectTcp) {
            ++connectAttempts;
            events.pending.push_back(oea::ModemEvent::simple(oea::ModemEventType::AlreadyConnected));
            return oea::AtReply::failure(oea::AtError::Error);
        }
        return oea::AtReply::success();
    }

    void reset() override {}

    EventQueue events;
    std::size_t connectAttempts = 0;
};

std::size_t liveSlots(const oea::WifiAdapter& adapter) {
    std::size_t live = 0;
    for (const auto state : adapter.linkState().sockets) {
        if (state != oea::SocketState::Closed) {
            ++live;
        }
    }
    return live;
}

void testAllocationAndExhaustion() {
    Bench bench;
    std::vector<oea::Socket> sockets;
    for (std::size_t i = 0; i < oea::kMaxLinks; ++i) {
        oea::Socket socket;
        assert(bench.adapter.socket(socket).ok());
        assert(socket.valid());
        assert(socket.linkId() == i);
        assert(bench.adapter.socketState(i) == oea::SocketState::Open);
        sockets.push_back(std::move(socket));
    }
    assert(bench.modem.countCommands(oea::AtCommandKind::SetMultipleConnections) == 1U);

    oea::Socket extra;
    const auto exhausted = bench.adapter.socket(extra);
    assert(exhausted.error == oea::NetworkErrorKind::NoSocketAvailable);
    assert(!extra.valid());

    // Releasing a never-connected slot needs no module command.
    bench.modem.clearCommandLog();
    assert(bench.adapter.close(std::move(sockets[2])).ok());
    assert(!sockets[2].valid());
    assert(bench.modem.countCommands(oea::AtCommandKind::CloseSocket) == 0U);
    assert(bench.adapter.socketState(2) == oea::SocketState::Closed);

    oea::Socket reused;
    assert(bench.adapter.socket(reused).ok());
    assert(reused.linkId() == 2U);
}

void testRandomAllocationNeverExceedsPool() {
    Bench bench;
    std::mt19937 rng(7);
    std::vector<oea::Socket> held;

    for (int step = 0; step < 400; ++step) {
        if ((rng() % 2U) == 0U || held.empty()) {
            oea::Socket socket;
            const auto result = bench.adapter.socket(socket);
            if (held.size() == oea::kMaxLinks) {
                assert(result.error == oea::NetworkErrorKind::NoSocketAvailable);
            } else {
                assert(result.ok());
                if ((rng() % 3U) == 0U) {
                    assert(bench.adapter.connect(socket, remoteV4()).ok());
                }
                held.push_back(std::move(socket));
            }
        } else {
            const auto index = rng() % held.size();
            const auto linkId = held[index].linkId();
            assert(bench.adapter.close(std::move(held[index])).ok());
            assert(bench.adapter.socketState(linkId) == oea::SocketState::Closed);
            held.erase(held.begin() + static_cast<std::ptrdiff_t>(index));
        }
        assert(liveSlots(bench.adapter) == held.size());
        assert(liveSlots(bench.adapter) <= oea::kMaxLinks);
    }
}

void testConnectConfirmation() {
    Bench bench;
    oea::Socket socket;
    assert(bench.adapter.socket(socket).ok());

    const auto connected = bench.adapter.connect(socket, remoteV4());
    assert(connected.ok());
    assert(bench.adapter.isConnected(socket));
    assert(bench.modem.linkConnected(socket.linkId()));

    const auto& commands = bench.modem.commands();
    bool sawConnect = false;
    for (const auto& command : commands) {
        if (command.kind == oea::AtCommandKind::ConnectTcp) {
            sawConnect = true;
            assert(command.linkId == socket.linkId());
            assert(command.remote.port == 5000U);
        }
    }
    assert(sawConnect);

    const auto again = bench.adapter.connect(socket, remoteV4());
    assert(again.error == oea::NetworkErrorKind::AlreadyConnected);
    assert(bench.modem.countCommands(oea::AtCommandKind::ConnectTcp) == 1U);

    // IPv6 remotes use the same slot machinery.
    oea::Socket second;
    assert(bench.adapter.socket(second).ok());
    const auto v6 = oea::parseSocketAddress("[2001:db8::20]:8443");
    assert(v6.has_value());
    assert(bench.adapter.connect(second, *v6).ok());

    const oea::AtCommand* lastConnect = nullptr;
    for (const auto& command : bench.modem.commands()) {
        if (command.kind == oea::AtCommandKind::ConnectTcp) {
            lastConnect = &command;
        }
    }
    assert(lastConnect != nullptr);
    assert(lastConnect->linkId == second.linkId());
    assert(lastConnect->remote.family == oea::AddressFamily::IPv6);
    assert(lastConnect->remote.port == 8443U);
}

void testConnectFailures() {
    Bench bench;
    oea::Socket socket;
    assert(bench.adapter.socket(socket).ok());

    bench.modem.setRemoteReachable(false);
    const auto refused = bench.adapter.connect(socket, remoteV4());
    assert(refused.error == oea::NetworkErrorKind::ConnectError);
    assert(refused.cause == oea::AtError::Error);
    assert(bench.adapter.socketState(socket.linkId()) == oea::SocketState::Open);
    assert(!bench.adapter.lastError().empty());

    bench.modem.setRemoteReachable(true);
    bench.modem.blockNext(oea::AtCommandKind::ConnectTcp);
    const auto blocked = bench.adapter.connect(socket, remoteV4());
    assert(blocked.error == oea::NetworkErrorKind::UnexpectedWouldBlock);

    // First pass answers the notification drain, second one the explicit enable.
    Bench passive;
    oea::Socket other;
    assert(passive.adapter.socket(other).ok());
    passive.modem.failNext(oea::AtCommandKind::SetReceiveMode, oea::AtError::Error, 2);
    const auto modeFailed = passive.adapter.connect(other, remoteV4());
    assert(modeFailed.error == oea::NetworkErrorKind::EnablingPassiveSocketModeFailed);
    assert(passive.modem.countCommands(oea::AtCommandKind::ConnectTcp) == 0U);
    assert(passive.adapter.connect(other, remoteV4()).ok());

    Bench mux;
    mux.modem.failNext(oea::AtCommandKind::SetMultipleConnections, oea::AtError::Timeout);
    oea::Socket never;
    const auto muxFailed = mux.adapter.socket(never);
    assert(muxFailed.error == oea::NetworkErrorKind::EnablingMultiConnectionsFailed);
    assert(muxFailed.cause == oea::AtError::Timeout);
    assert(!never.valid());
    assert(liveSlots(mux.adapter) == 0U);
    assert(mux.adapter.socket(never).ok());
    assert(mux.modem.countCommands(oea::AtCommandKind::SetMultipleConnections) == 2U);
}

void testCollisionRecovery() {
    // Synchronous "already connected" without any local record of the connection.
    {
        Bench bench;
        oea::Socket socket;
        assert(bench.adapter.socket(socket).ok());
        bench.modem.failNext(oea::AtCommandKind::ConnectTcp, oea::AtError::AlreadyConnected);
        const auto result = bench.adapter.connect(socket, remoteV4());
        assert(result.ok());
        assert(bench.adapter.socketState(socket.linkId()) == oea::SocketState::Connected);
    }

    // Missed CONNECT notification: first attempt is unconfirmed, retry resolves via collision.
    {
        Bench bench;
        oea::Socket socket;
        assert(bench.adapter.socket(socket).ok());
        bench.modem.suppressConnectNotifications(true);

        const auto unconfirmed = bench.adapter.connect(socket, remoteV4());
        assert(unconfirmed.error == oea::NetworkErrorKind::UnconfirmedSocketState);
        assert(bench.adapter.socketState(socket.linkId()) == oea::SocketState::Open);
        assert(bench.modem.linkConnected(socket.linkId()));

        const auto recovered = bench.adapter.connect(socket, remoteV4());
        assert(recovered.ok());
        assert(bench.adapter.isConnected(socket));
    }

    // A stale collision notice from before the attempt does not count.
    {
        Bench bench;
        oea::Socket socket;
        assert(bench.adapter.socket(socket).ok());
        bench.modem.enqueueEvent(oea::ModemEvent::simple(oea::ModemEventType::AlreadyConnected));
        bench.modem.failNext(oea::AtCommandKind::ConnectTcp, oea::AtError::Error);
        const auto stale = bench.adapter.connect(socket, remoteV4());
        assert(stale.error == oea::NetworkErrorKind::ConnectError);
        assert(stale.cause == oea::AtError::Error);
        assert(bench.adapter.socketState(socket.linkId()) == oea::SocketState::Open);
    }

    // ALREADY CONNECTED reported as a separate line while the command fails.
    {
        CollidingTransport transport;
        oea::MockCountdownTimer timer;
        oea::WifiAdapter adapter(transport, transport.events, timer);
        oea::Socket socket;
        assert(adapter.socket(socket).ok());
        assert(adapter.connect(socket, remoteV4()).ok());
        assert(adapter.socketState(socket.linkId()) == oea::SocketState::Connected);
        assert(transport.connectAttempts == 1U);
    }
}

void testCloseSemantics() {
    // Confirmed close.
    {
        Bench bench;
        oea::Socket socket;
        assert(bench.adapter.socket(socket).ok());
        assert(bench.adapter.connect(socket, remoteV4()).ok());
        const auto linkId = socket.linkId();
        assert(bench.adapter.close(std::move(socket)).ok());
        assert(bench.modem.countCommands(oea::AtCommandKind::CloseSocket) == 1U);
        assert(bench.adapter.socketState(linkId) == oea::SocketState::Closed);
        assert(!bench.modem.linkConnected(linkId));
    }

    // Command accepted but CLOSED never observed.
    {
        Bench bench;
        oea::Socket socket;
        assert(bench.adapter.socket(socket).ok());
        assert(bench.adapter.connect(socket, remoteV4()).ok());
        bench.modem.suppressCloseNotifications(true);
        const auto linkId = socket.linkId();
        const auto result = bench.adapter.close(std::move(socket));
        assert(result.error == oea::NetworkErrorKind::UnconfirmedSocketState);
        assert(bench.adapter.socketState(linkId) == oea::SocketState::Closed);
    }

    // Command failure still releases the slot.
    {
        Bench bench;
        oea::Socket socket;
        assert(bench.adapter.socket(socket).ok());
        assert(bench.adapter.connect(socket, remoteV4()).ok());
        bench.modem.failNext(oea::AtCommandKind::CloseSocket, oea::AtError::Timeout);
        const auto linkId = socket.linkId();
        const auto result = bench.adapter.close(std::move(socket));
        assert(result.error == oea::NetworkErrorKind::CloseError);
        assert(result.cause == oea::AtError::Timeout);
        assert(bench.adapter.socketState(linkId) == oea::SocketState::Closed);

        oea::Socket next;
        assert(bench.adapter.socket(next).ok());
        assert(next.linkId() == linkId);
    }

    // Remote close: slot is Closing until the handle is consumed, without a command.
    {
        Bench bench;
        oea::Socket socket;
        assert(bench.adapter.socket(socket).ok());
        assert(bench.adapter.connect(socket, remoteV4()).ok());
        bench.modem.remoteClose(socket.linkId());
        assert(!bench.adapter.isConnected(socket));
        assert(bench.adapter.socketState(socket.linkId()) == oea::SocketState::Closing);

        bench.modem.clearCommandLog();
        assert(bench.adapter.close(std::move(socket)).ok());
        assert(bench.modem.countCommands(oea::AtCommandKind::CloseSocket) == 0U);
    }
}

void testInvalidHandles() {
    Bench bench;
    oea::Socket socket;
    assert(bench.adapter.socket(socket).ok());
    assert(bench.adapter.connect(socket, remoteV4()).ok());

    oea::Socket moved(std::move(socket));
    assert(!socket.valid());
    assert(moved.valid());

    bench.modem.clearCommandLog();
    const std::vector<std::uint8_t> payload = {1, 2, 3};
    assert(bench.adapter.send(socket, payload).error == oea::NetworkErrorKind::InvalidSocket);
    assert(bench.adapter.connect(socket, remoteV4()).error == oea::NetworkErrorKind::InvalidSocket);
    std::uint8_t buffer[8] = {};
    assert(bench.adapter.receive(socket, buffer, sizeof(buffer)).error == oea::NetworkErrorKind::InvalidSocket);
    assert(bench.adapter.close(std::move(socket)).error == oea::NetworkErrorKind::InvalidSocket);
    assert(!bench.adapter.isConnected(socket));
    assert(bench.modem.commands().empty());

    // Restart releases every slot; handles from before it are stale.
    assert(bench.adapter.restart().ok());
    assert(liveSlots(bench.adapter) == 0U);
    bench.modem.clearCommandLog();
    assert(bench.adapter.send(moved, payload).error == oea::NetworkErrorKind::InvalidSocket);
    assert(bench.modem.commands().empty());

    // The same slot handed out again must not be reachable through the old handle.
    oea::Socket fresh;
    assert(bench.adapter.socket(fresh).ok());
    assert(fresh.linkId() == moved.linkId());
    assert(bench.adapter.connect(fresh, remoteV4()).ok());
    bench.modem.clearCommandLog();
    assert(bench.adapter.send(moved, payload).error == oea::NetworkErrorKind::InvalidSocket);
    assert(bench.adapter.receive(moved, buffer, sizeof(buffer)).error == oea::NetworkErrorKind::InvalidSocket);
    assert(bench.adapter.connect(moved, remoteV4()).error == oea::NetworkErrorKind::InvalidSocket);
    assert(!bench.adapter.isConnected(moved));
    assert(bench.adapter.close(std::move(moved)).error == oea::NetworkErrorKind::InvalidSocket);
    assert(bench.modem.countCommands(oea::AtCommandKind::CloseSocket) == 0U);
    assert(bench.adapter.isConnected(fresh));
    assert(bench.modem.linkConnected(fresh.linkId()));

    // Closing bumps the slot generation; the reissued handle matches the new one.
    const auto linkId = fresh.linkId();
    oea::Socket parked(std::move(fresh));
    assert(bench.adapter.close(std::move(parked)).ok());
    oea::Socket reissued;
    assert(bench.adapter.socket(reissued).ok());
    assert(reissued.linkId() == linkId);
    assert(bench.adapter.socketState(linkId) == oea::SocketState::Open);
    assert(bench.adapter.close(std::move(reissued)).ok());
}

} // namespace

int main() {
    testAllocationAndExhaustion();
    testRandomAllocationNeverExceedsPool();
    testConnectConfirmation();
    testConnectFailures();
    testCollisionRecovery();
    testCloseSemantics();
    testInvalidHandles();

    std::cout << "socket_lifecycle_tests passed\n";
    return 0;
}
