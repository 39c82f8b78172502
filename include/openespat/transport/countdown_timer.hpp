/**
 * @file countdown_timer.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <chrono>
#include <cstddef>

namespace oea {

enum class TimerPoll {
    /// Countdown still running (would block).
    Running,
    Elapsed,
    /// Timer was never started or the clock failed.
    Failed,
};

/**
 * @brief Scoped countdown with a non-blocking poll.
 */
class ICountdownTimer {
public:
    virtual ~ICountdownTimer() = default;

    virtual bool start(std::chrono::milliseconds duration) = 0;
    virtual TimerPoll poll() = 0;
};

class SteadyCountdownTimer final : public ICountdownTimer {
public:
    bool start(std::chrono::milliseconds duration) override;
    TimerPoll poll() override;

private:
    std::chrono::steady_clock::time_point deadline_{};
    bool started_ = false;
};

/**
 * @brief Deterministic timer for tests: elapses after a fixed number of polls.
 */
class MockCountdownTimer final : public ICountdownTimer {
public:
    explicit MockCountdownTimer(std::size_t pollsUntilElapsed = 1000);

    bool start(std::chrono::milliseconds duration) override;
    TimerPoll poll() override;

    void setPollsUntilElapsed(std::size_t polls);
    void injectStartFailure(bool fail);
    /// A started timer reports Failed on every poll.
    void injectPollFailure(bool fail);

    std::size_t startCount() const noexcept { return startCount_; }
    std::chrono::milliseconds lastDuration() const noexcept { return lastDuration_; }

private:
    std::size_t pollsUntilElapsed_;
    std::size_t remainingPolls_ = 0;
    std::size_t startCount_ = 0;
    std::chrono::milliseconds lastDuration_{0};
    bool started_ = false;
    bool failStart_ = false;
    bool failPoll_ = false;
};

} // namespace oea
