#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <ostream>

namespace app_poller {

/// Tracks Shopify-style query-cost extensions and turns them into the pause
/// a source should observe before its next request.  It never sleeps
/// itself; the poller does the waiting.
class ThrottleController {
public:
    /// @param minInterval   Floor for the recommended pause.
    /// @param safetyMargin  Extra cost points to keep in reserve.
    explicit ThrottleController(std::chrono::nanoseconds minInterval,
                                double safetyMargin = 20.0);

    /// Extract cost fields from a GraphQL response body.  Malformed cost
    /// data is reported on @p log and otherwise ignored.
    void observeResponse(const nlohmann::json& response, std::ostream& log);

    /// Pause before the next request: the time needed to restore the
    /// deficit, in whole seconds, but never below the minimum interval.
    std::chrono::nanoseconds nextDelay() const;

    double avgQueryCost()      const;
    int    totalObservations() const { return mObservationCount; }

private:
    std::chrono::nanoseconds mMinInterval;
    double mSafetyMargin;

    double mLastRequestedCost  = 0.0;
    double mCurrentlyAvailable = 0.0;
    double mRestoreRate        = 0.0;
    double mTotalCost          = 0.0;
    int    mObservationCount   = 0;
    bool   mHasBudget          = false;
};

} // namespace app_poller
