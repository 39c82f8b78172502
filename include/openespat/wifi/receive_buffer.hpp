/**
 * @file receive_buffer.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace oea {

/**
 * @brief Cursor over a caller-owned destination, filled chunk by chunk. Never allocates.
 */
class ReceiveBuffer {
public:
    ReceiveBuffer(std::uint8_t* destination, std::size_t capacity, std::size_t chunkSize) noexcept;

    /**
     * @brief Length of the next pull: min(remaining space, chunk size).
     */
    std::size_t nextLength() const noexcept;

    /**
     * @brief Append `data`. Returns false and writes nothing if it does not fit.
     */
    bool append(const std::vector<std::uint8_t>& data);

    bool isFull() const noexcept;
    std::size_t size() const noexcept { return position_; }
    std::size_t space() const noexcept { return capacity_ - position_; }

private:
    std::uint8_t* destination_;
    std::size_t capacity_;
    std::size_t chunkSize_;
    /// Next index to insert at.
    std::size_t position_ = 0;
};

} // namespace oea
