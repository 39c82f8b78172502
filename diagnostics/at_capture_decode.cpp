/**
 * @file at_capture_decode.cpp
 * @brief Replays a raw serial capture through the framer and the notification decoder.
 */

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "openespat/transport/at_codec.hpp"

namespace {

std::string printable(const std::vector<std::uint8_t>& data) {
    std::string out;
    for (const auto byte : data) {
        out.push_back(std::isprint(byte) != 0 ? static_cast<char>(byte) : '.');
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: at_capture_decode <capture.bin>\n";
        return 1;
    }

    std::ifstream in(argv[1], std::ios::binary);
    if (!in) {
        std::cerr << "Cannot open capture: " << argv[1] << '\n';
        return 1;
    }
    const std::vector<std::uint8_t> capture{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    oea::AtStreamParser parser;
    parser.feed(capture.data(), capture.size());

    std::size_t frames = 0;
    std::size_t events = 0;
    while (auto frame = parser.next()) {
        ++frames;
        switch (frame->type) {
        case oea::AtFrameType::Prompt:
            std::cout << "PROMPT\n";
            break;
        case oea::AtFrameType::ReceivedData:
            std::cout << "DATA   len=" << frame->data.size() << " \"" << printable(frame->data) << "\"\n";
            break;
        case oea::AtFrameType::Line: {
            if (auto record = oea::AtCodec::parseAddressRecord(frame->line)) {
                std::cout << "ADDR   " << record->tag << "=" << record->address << '\n';
                break;
            }
            if (oea::AtCodec::isFinalResult(frame->line)) {
                std::cout << "RESULT " << frame->line << '\n';
                break;
            }
            const auto event = oea::AtCodec::decodeUrcLine(frame->line);
            if (!event) {
                break;
            }
            ++events;
            std::cout << "EVENT  " << oea::toString(event->type);
            if (event->type == oea::ModemEventType::DataAvailable) {
                std::cout << " link=" << event->linkId << " count=" << event->count;
            } else if (event->type == oea::ModemEventType::SocketConnected ||
                       event->type == oea::ModemEventType::SocketClosed) {
                std::cout << " link=" << event->linkId;
            } else if (event->type == oea::ModemEventType::BytesAccepted) {
                std::cout << " count=" << event->count;
            } else if (event->type == oea::ModemEventType::Unrecognized) {
                std::cout << " \"" << frame->line << "\"";
            }
            std::cout << '\n';
            break;
        }
        }
    }

    std::cout << "frames=" << frames << " events=" << events << " trailing=" << parser.buffered() << '\n';
    return 0;
}
