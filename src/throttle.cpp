#include "throttle.hpp"

#include <algorithm>
#include <cmath>

namespace app_poller {

ThrottleController::ThrottleController(std::chrono::nanoseconds minInterval,
                                       double safetyMargin)
    : mMinInterval(minInterval)
    , mSafetyMargin(safetyMargin) {}

void ThrottleController::observeResponse(const nlohmann::json& response,
                                         std::ostream& log)
{
    try {
        if (!response.contains("extensions") ||
            !response["extensions"].contains("cost")) {
            return;
        }

        const auto& cost = response["extensions"]["cost"];
        mLastRequestedCost = cost.value("requestedQueryCost", mLastRequestedCost);

        if (cost.contains("throttleStatus")) {
            const auto& ts = cost["throttleStatus"];
            mCurrentlyAvailable = ts.value("currentlyAvailable", mCurrentlyAvailable);
            mRestoreRate        = ts.value("restoreRate", mRestoreRate);
            mHasBudget          = true;
        }

        mTotalCost += mLastRequestedCost;
        ++mObservationCount;

    } catch (const nlohmann::json::exception& e) {
        log << "[Throttle] warning: failed to parse cost info: "
            << e.what() << "\n";
    }
}

std::chrono::nanoseconds ThrottleController::nextDelay() const {
    if (!mHasBudget || mRestoreRate <= 0.0) return mMinInterval;

    const double needed = mLastRequestedCost + mSafetyMargin;
    if (mCurrentlyAvailable >= needed) return mMinInterval;

    const double seconds = std::ceil((needed - mCurrentlyAvailable) / mRestoreRate);
    const std::chrono::nanoseconds restore =
        std::chrono::seconds(static_cast<int64_t>(seconds));
    return std::max(restore, mMinInterval);
}

double ThrottleController::avgQueryCost() const {
    if (mObservationCount == 0) return 0.0;
    return mTotalCost / mObservationCount;
}

} // namespace app_poller
