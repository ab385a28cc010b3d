#pragma once

#include "admission.hpp"
#include "models.hpp"
#include "record_sink.hpp"
#include "source_adapter.hpp"
#include "watermark_store.hpp"

#include <chrono>
#include <functional>
#include <ostream>

namespace app_poller {

/// Drives one job through idle -> running -> succeeded | failed inside the
/// time budget reported by the WatermarkStore.
///
/// Each iteration fetches one page from the adapter, delivers it to the
/// sink and only then persists the advanced watermark.  Before starting
/// another iteration the poller projects its cost (last cycle * safety
/// multiplier + throttle interval) and stops if that does not fit in the
/// remaining time.  A batch the sink rejects ends the loop without failing
/// the run; its watermark is not committed and the adapter is rewound.
/// The instance holds no per-run state and may be reused.
class BoundedPoller {
public:
    using Sleeper = std::function<void(std::chrono::nanoseconds)>;

    struct Options {
        int64_t safetyMultiplierMilli = kDefaultSafetyMultiplierMilli;
        bool    verbose               = false;
        Sleeper sleep;   // empty: std::this_thread::sleep_for
    };

    BoundedPoller(SourceAdapter& adapter,
                  WatermarkStore& store,
                  RecordSink& sink,
                  std::ostream& log,
                  Options options);

    BoundedPoller(SourceAdapter& adapter,
                  WatermarkStore& store,
                  RecordSink& sink,
                  std::ostream& log)
        : BoundedPoller(adapter, store, sink, log, Options{}) {}

    /// Run @p job to completion or until the time budget runs out.
    ///
    /// Returns with started == false, and without touching the store,
    /// when the job is already running.  Throws ConfigurationError for
    /// invalid credentials (before anything is written) and rethrows one
    /// raised by the adapter mid-run after finalizing the job as failed.
    RunSummary run(JobConfig& job);

private:
    /// Per-run counters; lives on the stack of run().
    struct RunState {
        Timestamp                watermark        = 0;
        std::size_t              gathered         = 0;
        int                      iterations       = 0;
        int                      polls            = 0;
        int                      deliveryFailures = 0;
        bool                     moreToPoll       = false;
        bool                     failed           = false;
        std::chrono::nanoseconds slept{0};
    };

    SourceAdapter&  mAdapter;
    WatermarkStore& mStore;
    RecordSink&     mSink;
    std::ostream&   mLog;
    Options         mOptions;

    bool initialize(JobConfig& job, RunState& state);
    void throttle(RunState& state);

    /// One fetch + deliver + commit.  Returns false when the loop must end
    /// regardless of the time budget.
    bool gather(JobConfig& job, RunState& state, PollCycleResult& cycle);

    bool admitNext(const PollCycleResult& cycle);
    void finalize(JobConfig& job, const RunState& state);
};

} // namespace app_poller
