#pragma once

#include <chrono>

namespace rustycubes::controller {

// Fixed-interval gravity clock. Elapsed time is injected by the caller,
// so the poll rate and the gravity cadence stay independent.
class StepScheduler {
public:
    using Duration = std::chrono::milliseconds;

    /// interval must be positive (std::invalid_argument otherwise)
    explicit StepScheduler(Duration interval);

    /// Accumulates elapsed time. Returns true when a gravity tick is due;
    /// fires at most once per call and drops any surplus time.
    bool poll(Duration elapsed);

    void reset() noexcept { accumulated_ = Duration{0}; }

    Duration interval() const noexcept { return interval_; }
    void setInterval(Duration interval);

    Duration accumulated() const noexcept { return accumulated_; }

private:
    Duration interval_;
    Duration accumulated_{0};
};

} // namespace rustycubes::controller
