/**
 * @file mock_modem.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "openespat/transport/i_modem_link.hpp"

namespace oea {

/**
 * @brief Scripted ESP-AT simulator implementing both the command and notification side.
 *
 * Commands are answered the way the module answers them and the matching notifications are
 * queued (connect, close, send confirmation, receive payloads). Fault injection hooks cover the
 * firmware races the adapter has to reconcile.
 */
class MockModem final : public IModemLink {
public:
    static constexpr std::size_t kLinkCount = 5;

    MockModem();

    bool open() override;
    void close() override;
    std::string lastError() const override;

    AtReply send(const AtCommand& command) override;
    void reset() override;
    std::optional<ModemEvent> pollNextEvent() override;

    // Scripting.
    void enqueueEvent(ModemEvent event);
    void failNext(AtCommandKind kind, AtError error, std::size_t count = 1);
    void blockNext(AtCommandKind kind, std::size_t count = 1);
    void setJoinOutcome(bool associate, bool obtainAddress);
    void setLocalAddressRecords(std::vector<LocalAddressRecord> records);
    void setRemoteReachable(bool reachable);
    void suppressConnectNotifications(bool suppress);
    void suppressCloseNotifications(bool suppress);
    void suppressSendConfirmations(bool suppress);
    void suppressReadyNotification(bool suppress);
    /// The Nth transmitted chunk (1-based, counted since the last reset of counters) is reported as SEND FAIL.
    void injectSendFailureOnChunk(std::size_t chunkNumber);
    /// Every chunk is acknowledged with `Recv <n - shortfall> bytes`.
    void injectAcceptedShortfall(std::size_t shortfall);
    /// Receive replies carry this many extra bytes beyond the requested length.
    void injectReceiveExcess(std::size_t extraBytes);

    // Remote peer side.
    /// Buffer `data` on the module. With `announce` a matching +IPD notification is queued.
    void remoteSend(std::size_t linkId, const std::vector<std::uint8_t>& data, bool announce = true);
    void remoteClose(std::size_t linkId);

    // Inspection.
    const std::vector<AtCommand>& commands() const noexcept { return commands_; }
    std::size_t countCommands(AtCommandKind kind) const;
    void clearCommandLog();
    std::vector<std::uint8_t> transmitted(std::size_t linkId) const;
    bool linkConnected(std::size_t linkId) const;
    std::size_t pendingEvents() const noexcept { return events_.size(); }
    std::size_t resetCount() const noexcept { return resetCount_; }
    std::size_t chunksTransmitted() const noexcept { return chunksTransmitted_; }

private:
    struct Link {
        bool connected = false;
        std::deque<std::uint8_t> buffered;
        std::vector<std::uint8_t> transmitted;
    };

    std::optional<AtReply> takeScriptedReply(AtCommandKind kind);
    AtReply handle(const AtCommand& command);
    bool validLink(std::size_t linkId) const noexcept { return linkId < kLinkCount; }

    std::array<Link, kLinkCount> links_{};
    std::deque<ModemEvent> events_;
    std::map<AtCommandKind, std::deque<AtReply>> scriptedReplies_;
    std::vector<AtCommand> commands_;
    std::vector<LocalAddressRecord> addressRecords_;
    std::optional<std::size_t> pendingTransmitLink_;
    std::size_t pendingTransmitLength_ = 0;
    std::size_t chunksTransmitted_ = 0;
    std::size_t failChunk_ = 0;
    std::size_t acceptedShortfall_ = 0;
    std::size_t receiveExcess_ = 0;
    std::size_t resetCount_ = 0;
    bool associate_ = true;
    bool obtainAddress_ = true;
    bool remoteReachable_ = true;
    bool suppressConnect_ = false;
    bool suppressClose_ = false;
    bool suppressSendConfirm_ = false;
    bool suppressReady_ = false;
    bool opened_ = true;
    std::string error_;
};

} // namespace oea
