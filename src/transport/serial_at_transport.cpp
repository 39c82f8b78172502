/**
 * @file serial_at_transport.cpp
 * @brief Linux tty lifecycle and AT command exchange over the serial line.
 */

#include "openespat/transport/serial_at_transport.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>

#include <fcntl.h>
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>

namespace oea {
namespace {

bool toSpeed(std::uint32_t baudRate, speed_t& outSpeed) {
    switch (baudRate) {
    case 9600:
        outSpeed = B9600;
        return true;
    case 19200:
        outSpeed = B19200;
        return true;
    case 38400:
        outSpeed = B38400;
        return true;
    case 57600:
        outSpeed = B57600;
        return true;
    case 115200:
        outSpeed = B115200;
        return true;
    case 230400:
        outSpeed = B230400;
        return true;
    case 460800:
        outSpeed = B460800;
        return true;
    case 921600:
        outSpeed = B921600;
        return true;
    default:
        return false;
    }
}

bool startsWith(const std::string& text, const char* prefix) { return text.rfind(prefix, 0) == 0; }

std::string printable(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (c == '\r') {
            out += "\\r";
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

SerialAtTransport::SerialAtTransport(std::string device, std::uint32_t baudRate)
    : device_(std::move(device)), baudRate_(baudRate), traceAt_(std::getenv("OEA_TRACE_AT") != nullptr) {}

SerialAtTransport::~SerialAtTransport() { close(); }

bool SerialAtTransport::open() {
    close();

    speed_t speed {};
    if (!toSpeed(baudRate_, speed)) {
        error_ = "unsupported baud rate " + std::to_string(baudRate_);
        return false;
    }

    fd_ = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        error_ = "open(" + device_ + ") failed: " + std::string(std::strerror(errno));
        return false;
    }

    termios tty {};
    if (::tcgetattr(fd_, &tty) != 0) {
        error_ = "tcgetattr() failed: " + std::string(std::strerror(errno));
        close();
        return false;
    }
    ::cfmakeraw(&tty);
    ::cfsetispeed(&tty, speed);
    ::cfsetospeed(&tty, speed);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~static_cast<tcflag_t>(CSTOPB | CRTSCTS);
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
    if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
        error_ = "tcsetattr() failed: " + std::string(std::strerror(errno));
        close();
        return false;
    }
    ::tcflush(fd_, TCIOFLUSH);

    parser_.clear();
    events_.clear();
    error_.clear();
    return true;
}

void SerialAtTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    parser_.clear();
}

std::string SerialAtTransport::lastError() const { return error_; }

void SerialAtTransport::setCommandTimeoutMs(int timeoutMs) { commandTimeoutMs_ = timeoutMs; }

void SerialAtTransport::setJoinTimeoutMs(int timeoutMs) { joinTimeoutMs_ = timeoutMs; }

AtReply SerialAtTransport::send(const AtCommand& command) {
    if (fd_ < 0) {
        error_ = "not opened";
        return AtReply::failure(AtError::Io);
    }

    const auto bytes = AtCodec::encode(command);
    if (command.kind == AtCommandKind::TransmitData) {
        trace(">", "<" + std::to_string(bytes.size()) + " data bytes>");
    } else {
        trace(">", bytes);
    }
    if (!writeAll(bytes)) {
        return AtReply::failure(AtError::Io);
    }
    // Raw payload has no synchronous reply; "Recv n bytes" / "SEND OK" arrive as notifications.
    if (command.kind == AtCommandKind::TransmitData) {
        return AtReply::success();
    }

    auto reply = AtReply::success();
    bool alreadyConnected = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutFor(command));

    while (true) {
        while (auto frame = parser_.next()) {
            if (frame->type == AtFrameType::Prompt) {
                if (command.kind == AtCommandKind::PrepareTransmission) {
                    return reply;
                }
                continue;
            }
            if (frame->type == AtFrameType::ReceivedData) {
                queueUnsolicited(*frame);
                continue;
            }

            const auto& line = frame->line;
            if (line.empty()) {
                continue;
            }
            trace("<", line);

            if (line == "OK") {
                // CIPSEND answers "OK" and then the ">" prompt.
                if (command.kind != AtCommandKind::PrepareTransmission) {
                    return reply;
                }
                continue;
            }
            if (line == "ERROR" || line == "FAIL") {
                error_ = std::string(toString(command.kind)) + " answered " + line;
                return AtReply::failure(alreadyConnected ? AtError::AlreadyConnected : AtError::Error);
            }
            if (line == "ALREADY CONNECTED") {
                alreadyConnected = true;
                continue;
            }
            if (startsWith(line, "+CIFSR:")) {
                if (auto record = AtCodec::parseAddressRecord(line)) {
                    reply.addressRecords.push_back(*record);
                }
                continue;
            }
            // Command echo and "busy p..." progress lines.
            if (startsWith(line, "AT") || startsWith(line, "busy")) {
                continue;
            }
            queueUnsolicited(*frame);
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            error_ = std::string("timeout waiting for ") + toString(command.kind) + " reply";
            return AtReply::failure(AtError::Timeout);
        }
        if (!readAvailable(static_cast<int>(remaining.count()))) {
            return AtReply::failure(AtError::Io);
        }
    }
}

void SerialAtTransport::reset() {
    trace("!", "reset");
    parser_.clear();
}

std::optional<ModemEvent> SerialAtTransport::pollNextEvent() {
    if (events_.empty() && fd_ >= 0) {
        if (!readAvailable(0)) {
            return std::nullopt;
        }
        while (auto frame = parser_.next()) {
            if (frame->type == AtFrameType::Line) {
                trace("<", frame->line);
            }
            queueUnsolicited(*frame);
        }
    }

    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool SerialAtTransport::writeAll(const std::string& bytes) {
    std::size_t written = 0U;
    while (written < bytes.size()) {
        const auto result = ::write(fd_, bytes.data() + written, bytes.size() - written);
        if (result > 0) {
            written += static_cast<std::size_t>(result);
            continue;
        }
        if (result < 0 && errno == EINTR) {
            continue;
        }
        if (result < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            fd_set writeSet;
            FD_ZERO(&writeSet);
            FD_SET(fd_, &writeSet);
            timeval timeout {};
            timeout.tv_sec = commandTimeoutMs_ / 1000;
            timeout.tv_usec = (commandTimeoutMs_ % 1000) * 1000;
            const int selectResult = ::select(fd_ + 1, nullptr, &writeSet, nullptr, &timeout);
            if (selectResult == 0) {
                error_ = "write timeout";
                return false;
            }
            if (selectResult < 0 && errno != EINTR) {
                error_ = "select() failed: " + std::string(std::strerror(errno));
                return false;
            }
            continue;
        }
        error_ = "write() failed: " + std::string(std::strerror(errno));
        return false;
    }
    return true;
}

bool SerialAtTransport::readAvailable(int timeoutMs) {
    fd_set readSet;
    FD_ZERO(&readSet);
    FD_SET(fd_, &readSet);

    timeval timeout {};
    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;

    const int selectResult = ::select(fd_ + 1, &readSet, nullptr, nullptr, &timeout);
    if (selectResult == 0) {
        return true;
    }
    if (selectResult < 0) {
        if (errno == EINTR) {
            return true;
        }
        error_ = "select() failed: " + std::string(std::strerror(errno));
        return false;
    }

    std::uint8_t buffer[512];
    while (true) {
        const auto received = ::read(fd_, buffer, sizeof(buffer));
        if (received > 0) {
            parser_.feed(buffer, static_cast<std::size_t>(received));
            continue;
        }
        if (received == 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        if (errno == EINTR) {
            continue;
        }
        error_ = "read() failed: " + std::string(std::strerror(errno));
        return false;
    }
}

void SerialAtTransport::queueUnsolicited(const AtFrame& frame) {
    switch (frame.type) {
    case AtFrameType::ReceivedData:
        events_.push_back(ModemEvent::dataReceived(frame.data));
        return;
    case AtFrameType::Prompt:
        return;
    case AtFrameType::Line:
        break;
    }
    // Final result codes of an abandoned exchange carry no state.
    if (AtCodec::isFinalResult(frame.line)) {
        return;
    }
    if (auto event = AtCodec::decodeUrcLine(frame.line)) {
        events_.push_back(std::move(*event));
    }
}

int SerialAtTransport::timeoutFor(const AtCommand& command) const noexcept {
    if (command.kind == AtCommandKind::JoinAccessPoint || command.kind == AtCommandKind::Restart) {
        return joinTimeoutMs_;
    }
    return commandTimeoutMs_;
}

void SerialAtTransport::trace(const char* direction, const std::string& text) const {
    if (!traceAt_) {
        return;
    }
    std::cerr << "[oea-at] " << direction << ' ' << printable(text) << '\n';
}

} // namespace oea
