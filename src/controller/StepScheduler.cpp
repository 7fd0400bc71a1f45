#include "controller/StepScheduler.hpp"
#include <stdexcept>

namespace rustycubes::controller {

StepScheduler::StepScheduler(Duration interval)
    : interval_{interval}
{
    if (interval.count() <= 0) {
        throw std::invalid_argument("StepScheduler interval must be positive");
    }
}

bool StepScheduler::poll(Duration elapsed) {
    if (elapsed.count() > 0) {
        accumulated_ += elapsed;
    }

    if (accumulated_ < interval_) {
        return false;
    }

    accumulated_ = Duration{0};
    return true;
}

void StepScheduler::setInterval(Duration interval) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("StepScheduler interval must be positive");
    }
    interval_ = interval;
}

} // namespace rustycubes::controller
