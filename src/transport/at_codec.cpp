/**
 * @file at_codec.cpp
 * @brief openESPAT source file.
 */

#include "openespat/transport/at_codec.hpp"

#include <algorithm>
#include <cctype>

namespace oea {
namespace {

constexpr const char* kReceivedDataPrefix = "+CIPRECVDATA";
constexpr std::size_t kMaxLengthDigits = 8U;

std::string trimLine(const std::string& line) {
    auto end = line.size();
    while (end > 0U && std::isspace(static_cast<unsigned char>(line[end - 1U])) != 0) {
        --end;
    }
    std::size_t begin = 0U;
    while (begin < end && std::isspace(static_cast<unsigned char>(line[begin])) != 0) {
        ++begin;
    }
    return line.substr(begin, end - begin);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool parseDecimal(const std::string& text, std::size_t& outValue) {
    if (text.empty() || text.size() > 10U) {
        return false;
    }
    std::size_t value = 0U;
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = (value * 10U) + static_cast<std::size_t>(c - '0');
    }
    outValue = value;
    return true;
}

// "<id>,CONNECT" / "<id>,CLOSED"
std::optional<ModemEvent> decodeLinkStatus(const std::string& line) {
    const auto comma = line.find(',');
    if (comma == std::string::npos) {
        return std::nullopt;
    }
    std::size_t linkId = 0U;
    if (!parseDecimal(line.substr(0, comma), linkId)) {
        return std::nullopt;
    }
    const auto status = line.substr(comma + 1U);
    if (status == "CONNECT") {
        return ModemEvent::forLink(ModemEventType::SocketConnected, linkId);
    }
    if (status == "CLOSED") {
        return ModemEvent::forLink(ModemEventType::SocketClosed, linkId);
    }
    return std::nullopt;
}

// Passive mode "+IPD,<id>,<len>"; tolerates a trailing ":..." of active mode.
std::optional<ModemEvent> decodeDataAvailable(const std::string& line) {
    auto rest = line.substr(5U);
    const auto colon = rest.find(':');
    if (colon != std::string::npos) {
        rest.resize(colon);
    }
    const auto comma = rest.find(',');
    if (comma == std::string::npos) {
        return std::nullopt;
    }
    std::size_t linkId = 0U;
    std::size_t count = 0U;
    if (!parseDecimal(rest.substr(0, comma), linkId) || !parseDecimal(rest.substr(comma + 1U), count)) {
        return std::nullopt;
    }
    return ModemEvent::dataAvailable(linkId, count);
}

// "Recv <n> bytes"
std::optional<ModemEvent> decodeBytesAccepted(const std::string& line) {
    constexpr std::size_t kHead = 5U;
    constexpr std::size_t kTail = 6U;
    if (line.size() <= kHead + kTail || line.compare(line.size() - kTail, kTail, " bytes") != 0) {
        return std::nullopt;
    }
    std::size_t count = 0U;
    if (!parseDecimal(line.substr(kHead, line.size() - kHead - kTail), count)) {
        return std::nullopt;
    }
    return ModemEvent::bytesAccepted(count);
}

} // namespace

std::string AtCodec::encode(const AtCommand& command) {
    switch (command.kind) {
    case AtCommandKind::Test:
        return "AT\r\n";
    case AtCommandKind::Restart:
        return "AT+RST\r\n";
    case AtCommandKind::SetWifiMode:
        return "AT+CWMODE=1\r\n";
    case AtCommandKind::JoinAccessPoint:
        return "AT+CWJAP=" + quote(command.ssid) + "," + quote(command.password) + "\r\n";
    case AtCommandKind::QueryLocalAddress:
        return "AT+CIFSR\r\n";
    case AtCommandKind::SetMultipleConnections:
        return "AT+CIPMUX=1\r\n";
    case AtCommandKind::SetReceiveMode:
        return "AT+CIPRECVMODE=1\r\n";
    case AtCommandKind::ConnectTcp: {
        const char* type = (command.remote.family == AddressFamily::IPv4) ? "\"TCP\"" : "\"TCPv6\"";
        return "AT+CIPSTART=" + std::to_string(command.linkId) + "," + type + ",\"" +
               hostString(command.remote) + "\"," + std::to_string(command.remote.port) + "\r\n";
    }
    case AtCommandKind::PrepareTransmission:
        return "AT+CIPSEND=" + std::to_string(command.linkId) + "," + std::to_string(command.length) + "\r\n";
    case AtCommandKind::TransmitData:
        return std::string(command.payload.begin(), command.payload.end());
    case AtCommandKind::ReceiveData:
        return "AT+CIPRECVDATA=" + std::to_string(command.linkId) + "," + std::to_string(command.length) +
               "\r\n";
    case AtCommandKind::CloseSocket:
        return "AT+CIPCLOSE=" + std::to_string(command.linkId) + "\r\n";
    }
    return {};
}

std::optional<ModemEvent> AtCodec::decodeUrcLine(const std::string& rawLine) {
    const auto line = trimLine(rawLine);
    if (line.empty()) {
        return std::nullopt;
    }

    if (line == "WIFI DISCONNECT") {
        return ModemEvent::simple(ModemEventType::StationDisconnected);
    }
    if (line == "WIFI CONNECTED") {
        return ModemEvent::simple(ModemEventType::StationConnected);
    }
    // Covers "WIFI GOT IP" and the IPv6 variants "WIFI GOT IPv6 LL/GL".
    if (startsWith(line, "WIFI GOT IP")) {
        return ModemEvent::simple(ModemEventType::AddressObtained);
    }
    if (line == "ready") {
        return ModemEvent::simple(ModemEventType::ModuleReady);
    }
    if (line == "SEND OK") {
        return ModemEvent::simple(ModemEventType::SendConfirmed);
    }
    if (line == "SEND FAIL") {
        return ModemEvent::simple(ModemEventType::SendFailed);
    }
    if (line == "ALREADY CONNECTED") {
        return ModemEvent::simple(ModemEventType::AlreadyConnected);
    }
    if (startsWith(line, "+IPD,")) {
        if (auto event = decodeDataAvailable(line)) {
            return event;
        }
    }
    if (startsWith(line, "Recv ")) {
        if (auto event = decodeBytesAccepted(line)) {
            return event;
        }
    }
    if (std::isdigit(static_cast<unsigned char>(line.front())) != 0) {
        if (auto event = decodeLinkStatus(line)) {
            return event;
        }
    }
    return ModemEvent::simple(ModemEventType::Unrecognized);
}

std::optional<LocalAddressRecord> AtCodec::parseAddressRecord(const std::string& rawLine) {
    const auto line = trimLine(rawLine);
    constexpr const char* kPrefix = "+CIFSR:";
    if (!startsWith(line, kPrefix)) {
        return std::nullopt;
    }
    const auto body = line.substr(7U);
    const auto comma = body.find(',');
    if (comma == std::string::npos || comma == 0U) {
        return std::nullopt;
    }

    LocalAddressRecord record;
    record.tag = body.substr(0, comma);
    auto value = body.substr(comma + 1U);
    if (value.size() >= 2U && value.front() == '"' && value.back() == '"') {
        value = value.substr(1U, value.size() - 2U);
    }
    record.address = value;
    return record;
}

std::string AtCodec::quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2U);
    out.push_back('"');
    for (const char c : value) {
        if (c == '\\' || c == '"' || c == ',') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

bool AtCodec::isFinalResult(const std::string& rawLine) {
    const auto line = trimLine(rawLine);
    return line == "OK" || line == "ERROR" || line == "FAIL";
}

void AtStreamParser::feed(const std::uint8_t* data, std::size_t length) {
    buffer_.append(reinterpret_cast<const char*>(data), length);
}

void AtStreamParser::feed(const std::string& text) { buffer_.append(text); }

void AtStreamParser::clear() { buffer_.clear(); }

AtStreamParser::PayloadHeader AtStreamParser::parsePayloadHeader(std::size_t& outLength,
                                                                  std::size_t& outDataStart) const {
    // ESP-AT: "+CIPRECVDATA:<len>,<data>"; some firmwares: "+CIPRECVDATA,<len>:<data>".
    const std::string prefix(kReceivedDataPrefix);
    auto pos = prefix.size();
    if (pos >= buffer_.size()) {
        return PayloadHeader::Incomplete;
    }
    const char separator = buffer_[pos];
    if (separator != ':' && separator != ',') {
        return PayloadHeader::Invalid;
    }
    ++pos;

    const auto digitsStart = pos;
    while (pos < buffer_.size() && std::isdigit(static_cast<unsigned char>(buffer_[pos])) != 0) {
        ++pos;
        if ((pos - digitsStart) > kMaxLengthDigits) {
            return PayloadHeader::Invalid;
        }
    }
    if (pos >= buffer_.size()) {
        return PayloadHeader::Incomplete;
    }
    if (pos == digitsStart) {
        return PayloadHeader::Invalid;
    }

    const char terminator = (separator == ':') ? ',' : ':';
    if (buffer_[pos] != terminator) {
        return PayloadHeader::Invalid;
    }

    std::size_t length = 0U;
    if (!parseDecimal(buffer_.substr(digitsStart, pos - digitsStart), length)) {
        return PayloadHeader::Invalid;
    }
    outLength = length;
    outDataStart = pos + 1U;
    return PayloadHeader::Complete;
}

std::optional<AtFrame> AtStreamParser::next() {
    const auto firstContent = buffer_.find_first_not_of("\r\n");
    if (firstContent == std::string::npos) {
        buffer_.clear();
        return std::nullopt;
    }
    buffer_.erase(0, firstContent);

    if (buffer_.front() == '>') {
        std::size_t consumed = 1U;
        if (buffer_.size() > 1U && buffer_[1] == ' ') {
            consumed = 2U;
        }
        buffer_.erase(0, consumed);
        AtFrame frame;
        frame.type = AtFrameType::Prompt;
        return frame;
    }

    const std::string prefix(kReceivedDataPrefix);
    const auto comparable = std::min(prefix.size(), buffer_.size());
    if (buffer_.compare(0, comparable, prefix, 0, comparable) == 0) {
        if (buffer_.size() < prefix.size()) {
            return std::nullopt;
        }
        std::size_t length = 0U;
        std::size_t dataStart = 0U;
        const auto header = parsePayloadHeader(length, dataStart);
        if (header == PayloadHeader::Incomplete) {
            return std::nullopt;
        }
        if (header == PayloadHeader::Complete) {
            if (buffer_.size() < dataStart + length) {
                return std::nullopt;
            }
            AtFrame frame;
            frame.type = AtFrameType::ReceivedData;
            frame.data.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(dataStart),
                              buffer_.begin() + static_cast<std::ptrdiff_t>(dataStart + length));
            buffer_.erase(0, dataStart + length);
            return frame;
        }
        // Invalid header: fall back to plain line framing.
    }

    const auto newline = buffer_.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    AtFrame frame;
    frame.type = AtFrameType::Line;
    frame.line = buffer_.substr(0, newline);
    if (!frame.line.empty() && frame.line.back() == '\r') {
        frame.line.pop_back();
    }
    buffer_.erase(0, newline + 1U);
    return frame;
}

} // namespace oea
