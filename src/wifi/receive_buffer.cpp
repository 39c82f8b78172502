/**
 * @file receive_buffer.cpp
 * @brief openESPAT source file.
 */

#include "openespat/wifi/receive_buffer.hpp"

#include <algorithm>

namespace oea {

ReceiveBuffer::ReceiveBuffer(std::uint8_t* destination, std::size_t capacity, std::size_t chunkSize) noexcept
    : destination_(destination), capacity_(destination == nullptr ? 0U : capacity), chunkSize_(chunkSize) {}

std::size_t ReceiveBuffer::nextLength() const noexcept { return std::min(space(), chunkSize_); }

bool ReceiveBuffer::append(const std::vector<std::uint8_t>& data) {
    if (data.size() > space()) {
        return false;
    }
    std::copy(data.begin(), data.end(), destination_ + position_);
    position_ += data.size();
    return true;
}

bool ReceiveBuffer::isFull() const noexcept { return position_ >= capacity_; }

} // namespace oea
