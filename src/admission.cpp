#include "admission.hpp"

#include <stdexcept>

namespace app_poller {

std::chrono::nanoseconds
projectNextCycleCost(std::chrono::nanoseconds measured,
                     std::chrono::nanoseconds throttleInterval,
                     int64_t multiplierMilli)
{
    if (multiplierMilli < 1000) {
        throw std::invalid_argument("Safety multiplier must be at least 1.0");
    }
    if (measured.count() < 0) {
        measured = std::chrono::nanoseconds::zero();
    }

    // Split to keep the product inside int64 for multi-hour measurements.
    const int64_t ns       = measured.count();
    const int64_t whole    = (ns / 1000) * multiplierMilli;
    const int64_t leftover = ((ns % 1000) * multiplierMilli) / 1000;

    return std::chrono::nanoseconds(whole + leftover) + throttleInterval;
}

bool admitNextCycle(std::chrono::nanoseconds projected,
                    std::chrono::nanoseconds remaining)
{
    return projected < remaining;
}

} // namespace app_poller
