#pragma once

#include <chrono>
#include <cstdint>

namespace app_poller {

/// Safety multiplier applied to a measured cycle, in thousandths (1.2x).
constexpr int64_t kDefaultSafetyMultiplierMilli = 1200;

/// Projected cost of the next poll cycle: measured * multiplier + throttle.
///
/// All arithmetic is fixed point on integer nanoseconds so that cycles of a
/// few milliseconds keep their full weight (10 ms * 1.2 + 5 s == 5.012 s).
/// @param multiplierMilli  Multiplier in thousandths, e.g. 1200 for 1.2.
std::chrono::nanoseconds
projectNextCycleCost(std::chrono::nanoseconds measured,
                     std::chrono::nanoseconds throttleInterval,
                     int64_t multiplierMilli = kDefaultSafetyMultiplierMilli);

/// True when a cycle of @p projected cost still fits in @p remaining.
/// A projection equal to the remaining budget is rejected.
bool admitNextCycle(std::chrono::nanoseconds projected,
                    std::chrono::nanoseconds remaining);

} // namespace app_poller
