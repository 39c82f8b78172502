/**
 * @file countdown_timer.cpp
 * @brief openESPAT source file.
 */

#include "openespat/transport/countdown_timer.hpp"

namespace oea {

bool SteadyCountdownTimer::start(std::chrono::milliseconds duration) {
    deadline_ = std::chrono::steady_clock::now() + duration;
    started_ = true;
    return true;
}

TimerPoll SteadyCountdownTimer::poll() {
    if (!started_) {
        return TimerPoll::Failed;
    }
    return (std::chrono::steady_clock::now() >= deadline_) ? TimerPoll::Elapsed : TimerPoll::Running;
}

MockCountdownTimer::MockCountdownTimer(std::size_t pollsUntilElapsed)
    : pollsUntilElapsed_(pollsUntilElapsed) {}

bool MockCountdownTimer::start(std::chrono::milliseconds duration) {
    ++startCount_;
    lastDuration_ = duration;
    if (failStart_) {
        started_ = false;
        return false;
    }
    remainingPolls_ = pollsUntilElapsed_;
    started_ = true;
    return true;
}

TimerPoll MockCountdownTimer::poll() {
    if (!started_ || failPoll_) {
        return TimerPoll::Failed;
    }
    if (remainingPolls_ == 0U) {
        return TimerPoll::Elapsed;
    }
    --remainingPolls_;
    return TimerPoll::Running;
}

void MockCountdownTimer::setPollsUntilElapsed(std::size_t polls) { pollsUntilElapsed_ = polls; }

void MockCountdownTimer::injectStartFailure(bool fail) { failStart_ = fail; }

void MockCountdownTimer::injectPollFailure(bool fail) { failPoll_ = fail; }

} // namespace oea
