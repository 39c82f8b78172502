/**
 * @file mock_modem.cpp
 * @brief openESPAT source file.
 */

#include "openespat/transport/mock_modem.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace oea {

MockModem::MockModem() = default;

bool MockModem::open() {
    opened_ = true;
    error_.clear();
    return true;
}

void MockModem::close() { opened_ = false; }

std::string MockModem::lastError() const { return error_; }

AtReply MockModem::send(const AtCommand& command) {
    commands_.push_back(command);
    if (!opened_) {
        error_ = "not opened";
        return AtReply::failure(AtError::Io);
    }
    if (auto scripted = takeScriptedReply(command.kind)) {
        return *scripted;
    }
    return handle(command);
}

void MockModem::reset() {
    ++resetCount_;
    pendingTransmitLink_.reset();
    pendingTransmitLength_ = 0;
}

std::optional<ModemEvent> MockModem::pollNextEvent() {
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void MockModem::enqueueEvent(ModemEvent event) { events_.push_back(std::move(event)); }

void MockModem::failNext(AtCommandKind kind, AtError error, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        scriptedReplies_[kind].push_back(AtReply::failure(error));
    }
}

void MockModem::blockNext(AtCommandKind kind, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        scriptedReplies_[kind].push_back(AtReply::busy());
    }
}

void MockModem::setJoinOutcome(bool associate, bool obtainAddress) {
    associate_ = associate;
    obtainAddress_ = obtainAddress;
}

void MockModem::setLocalAddressRecords(std::vector<LocalAddressRecord> records) {
    addressRecords_ = std::move(records);
}

void MockModem::setRemoteReachable(bool reachable) { remoteReachable_ = reachable; }

void MockModem::suppressConnectNotifications(bool suppress) { suppressConnect_ = suppress; }

void MockModem::suppressCloseNotifications(bool suppress) { suppressClose_ = suppress; }

void MockModem::suppressSendConfirmations(bool suppress) { suppressSendConfirm_ = suppress; }

void MockModem::suppressReadyNotification(bool suppress) { suppressReady_ = suppress; }

void MockModem::injectSendFailureOnChunk(std::size_t chunkNumber) { failChunk_ = chunkNumber; }

void MockModem::injectAcceptedShortfall(std::size_t shortfall) { acceptedShortfall_ = shortfall; }

void MockModem::injectReceiveExcess(std::size_t extraBytes) { receiveExcess_ = extraBytes; }

void MockModem::remoteSend(std::size_t linkId, const std::vector<std::uint8_t>& data, bool announce) {
    if (!validLink(linkId)) {
        throw std::out_of_range("link id out of range");
    }
    auto& link = links_[linkId];
    link.buffered.insert(link.buffered.end(), data.begin(), data.end());
    if (announce) {
        events_.push_back(ModemEvent::dataAvailable(linkId, data.size()));
    }
}

void MockModem::remoteClose(std::size_t linkId) {
    if (!validLink(linkId)) {
        throw std::out_of_range("link id out of range");
    }
    links_[linkId].connected = false;
    events_.push_back(ModemEvent::forLink(ModemEventType::SocketClosed, linkId));
}

std::size_t MockModem::countCommands(AtCommandKind kind) const {
    return static_cast<std::size_t>(std::count_if(
        commands_.begin(), commands_.end(), [kind](const AtCommand& command) { return command.kind == kind; }));
}

void MockModem::clearCommandLog() {
    commands_.clear();
    chunksTransmitted_ = 0;
}

std::vector<std::uint8_t> MockModem::transmitted(std::size_t linkId) const {
    if (!validLink(linkId)) {
        throw std::out_of_range("link id out of range");
    }
    return links_[linkId].transmitted;
}

bool MockModem::linkConnected(std::size_t linkId) const {
    return validLink(linkId) && links_[linkId].connected;
}

std::optional<AtReply> MockModem::takeScriptedReply(AtCommandKind kind) {
    const auto it = scriptedReplies_.find(kind);
    if (it == scriptedReplies_.end() || it->second.empty()) {
        return std::nullopt;
    }
    auto reply = it->second.front();
    it->second.pop_front();
    return reply;
}

AtReply MockModem::handle(const AtCommand& command) {
    switch (command.kind) {
    case AtCommandKind::Test:
    case AtCommandKind::SetWifiMode:
    case AtCommandKind::SetMultipleConnections:
    case AtCommandKind::SetReceiveMode:
        return AtReply::success();

    case AtCommandKind::Restart:
        for (auto& link : links_) {
            link = Link{};
        }
        events_.clear();
        pendingTransmitLink_.reset();
        if (!suppressReady_) {
            events_.push_back(ModemEvent::simple(ModemEventType::ModuleReady));
        }
        return AtReply::success();

    case AtCommandKind::JoinAccessPoint:
        if (!associate_) {
            error_ = "access point not reachable";
            return AtReply::failure(AtError::Error);
        }
        events_.push_back(ModemEvent::simple(ModemEventType::StationConnected));
        if (obtainAddress_) {
            events_.push_back(ModemEvent::simple(ModemEventType::AddressObtained));
        }
        return AtReply::success();

    case AtCommandKind::QueryLocalAddress: {
        auto reply = AtReply::success();
        reply.addressRecords = addressRecords_;
        return reply;
    }

    case AtCommandKind::ConnectTcp: {
        if (!validLink(command.linkId)) {
            return AtReply::failure(AtError::Error);
        }
        auto& link = links_[command.linkId];
        if (link.connected) {
            return AtReply::failure(AtError::AlreadyConnected);
        }
        if (!remoteReachable_) {
            error_ = "remote not reachable";
            return AtReply::failure(AtError::Error);
        }
        link.connected = true;
        if (!suppressConnect_) {
            events_.push_back(ModemEvent::forLink(ModemEventType::SocketConnected, command.linkId));
        }
        return AtReply::success();
    }

    case AtCommandKind::PrepareTransmission:
        if (!validLink(command.linkId) || !links_[command.linkId].connected) {
            return AtReply::failure(AtError::Error);
        }
        pendingTransmitLink_ = command.linkId;
        pendingTransmitLength_ = command.length;
        return AtReply::success();

    case AtCommandKind::TransmitData: {
        if (!pendingTransmitLink_ || command.payload.size() != pendingTransmitLength_) {
            return AtReply::failure(AtError::Error);
        }
        auto& link = links_[*pendingTransmitLink_];
        pendingTransmitLink_.reset();
        ++chunksTransmitted_;

        if (failChunk_ != 0U && chunksTransmitted_ == failChunk_) {
            if (!suppressSendConfirm_) {
                events_.push_back(ModemEvent::simple(ModemEventType::SendFailed));
            }
            return AtReply::success();
        }

        const auto accepted =
            (acceptedShortfall_ < command.payload.size()) ? command.payload.size() - acceptedShortfall_ : 0U;
        link.transmitted.insert(link.transmitted.end(), command.payload.begin(),
                                command.payload.begin() + static_cast<std::ptrdiff_t>(accepted));
        if (!suppressSendConfirm_) {
            events_.push_back(ModemEvent::bytesAccepted(accepted));
            events_.push_back(ModemEvent::simple(ModemEventType::SendConfirmed));
        }
        return AtReply::success();
    }

    case AtCommandKind::ReceiveData: {
        if (!validLink(command.linkId)) {
            return AtReply::failure(AtError::Error);
        }
        auto& link = links_[command.linkId];
        const auto available = std::min(command.length, link.buffered.size());
        std::vector<std::uint8_t> data(link.buffered.begin(),
                                       link.buffered.begin() + static_cast<std::ptrdiff_t>(available));
        link.buffered.erase(link.buffered.begin(), link.buffered.begin() + static_cast<std::ptrdiff_t>(available));
        if (receiveExcess_ != 0U && !data.empty()) {
            data.insert(data.end(), receiveExcess_, 0xEEU);
        }
        if (!data.empty()) {
            events_.push_back(ModemEvent::dataReceived(std::move(data)));
        }
        return AtReply::success();
    }

    case AtCommandKind::CloseSocket: {
        if (!validLink(command.linkId) || !links_[command.linkId].connected) {
            return AtReply::failure(AtError::Error);
        }
        links_[command.linkId].connected = false;
        links_[command.linkId].buffered.clear();
        if (!suppressClose_) {
            events_.push_back(ModemEvent::forLink(ModemEventType::SocketClosed, command.linkId));
        }
        return AtReply::success();
    }
    }

    return AtReply::failure(AtError::InvalidResponse);
}

} // namespace oea
