/**
 * @file tcp_socket.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace oea {

class WifiAdapter;

/**
 * @brief Move-only handle naming one module link slot.
 *
 * Carries no state of its own; the slot state lives in the adapter. The handle also records
 * the slot generation it was issued for, so it stops naming the slot once the slot is released
 * by `close()` or `restart()`. Passing the handle to `WifiAdapter::close()` consumes it.
 */
class Socket {
public:
    Socket() = default;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept : linkId_(other.linkId_), generation_(other.generation_) { other.release(); }
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            linkId_ = other.linkId_;
            generation_ = other.generation_;
            other.release();
        }
        return *this;
    }

    bool valid() const noexcept { return linkId_ != kInvalidLink; }
    std::size_t linkId() const noexcept { return linkId_; }

private:
    friend class WifiAdapter;

    static constexpr std::size_t kInvalidLink = std::numeric_limits<std::size_t>::max();

    Socket(std::size_t linkId, std::uint32_t generation) noexcept : linkId_(linkId), generation_(generation) {}
    void release() noexcept {
        linkId_ = kInvalidLink;
        generation_ = 0;
    }

    std::size_t linkId_ = kInvalidLink;
    std::uint32_t generation_ = 0;
};

} // namespace oea
