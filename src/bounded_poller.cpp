#include "bounded_poller.hpp"
#include "credentials.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <thread>
#include <utility>

namespace app_poller {

BoundedPoller::BoundedPoller(SourceAdapter& adapter,
                             WatermarkStore& store,
                             RecordSink& sink,
                             std::ostream& log,
                             Options options)
    : mAdapter(adapter)
    , mStore(store)
    , mSink(sink)
    , mLog(log)
    , mOptions(std::move(options))
{
    if (!mOptions.sleep) {
        mOptions.sleep = [](std::chrono::nanoseconds d) {
            std::this_thread::sleep_for(d);
        };
    }
}

// ---------------------------------------------------------------------------
// Public: one run
// ---------------------------------------------------------------------------

RunSummary BoundedPoller::run(JobConfig& job)
{
    RunState   state;
    RunSummary summary;

    if (!initialize(job, state)) {
        summary.status         = JobStatus::Running;
        summary.finalWatermark = job.watermark;
        return summary;
    }
    mAdapter.rewind();

    try {
        for (;;) {
            throttle(state);

            PollCycleResult cycle;
            if (!gather(job, state, cycle)) break;
            if (!admitNext(cycle)) break;

            // Sources must re-assert the flag on every fetch.
            if (!std::exchange(state.moreToPoll, false)) break;
        }
    } catch (const ConfigurationError& e) {
        mLog << "[BoundedPoller] error: configuration error during gather for '"
             << mAdapter.type() << "': " << e.what() << "\n";
        state.failed = true;
        finalize(job, state);
        throw;
    }

    finalize(job, state);

    summary.started          = true;
    summary.status           = job.status;
    summary.recordsGathered  = state.gathered;
    summary.iterations       = state.iterations;
    summary.finalWatermark   = state.watermark;
    summary.deliveryFailures = state.deliveryFailures;
    summary.totalSleep       = state.slept;
    return summary;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

bool BoundedPoller::initialize(JobConfig& job, RunState& state)
{
    // Advisory check-then-act against the persisted status.
    if (mStore.isRunning(job.jobId)) {
        mLog << "[BoundedPoller] error: App already running for service '"
             << mAdapter.type() << "' (job '" << job.jobId << "').\n";
        return false;
    }

    mLog << "[BoundedPoller] App starting for service '" << mAdapter.type()
         << "' (job '" << job.jobId << "').\n";

    validateCredentials(job.credentials, mAdapter.requiredCredentialKeys(),
                        mAdapter.type());

    job.watermark      = mStore.getWatermark(job.jobId);
    job.startWatermark = job.watermark;
    state.watermark    = job.watermark;

    mStore.markRunning(job.jobId);
    job.status = JobStatus::Running;
    return true;
}

void BoundedPoller::throttle(RunState& state)
{
    if (state.polls == 0) {
        if (mOptions.verbose) {
            mLog << "[BoundedPoller] Skipping sleep for first poll\n";
        }
        return;
    }

    const auto interval = mAdapter.throttleInterval();
    if (mOptions.verbose) {
        mLog << "[BoundedPoller] Sleeping '" << mAdapter.type() << "' for "
             << formatSeconds(interval) << "s\n";
    }
    mOptions.sleep(interval);
    state.slept += interval;
}

bool BoundedPoller::gather(JobConfig& job, RunState& state, PollCycleResult& cycle)
{
    using Clock = std::chrono::steady_clock;

    ++state.polls;
    const auto start = Clock::now();
    const auto stopWatch = [&cycle, start] {
        cycle.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            Clock::now() - start);
    };
    cycle.newWatermark = state.watermark;

    FetchResult fetched;
    try {
        fetched = mAdapter.fetchNext(job.credentials, state.watermark);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        mLog << "[BoundedPoller] error: gather failed for '" << mAdapter.type()
             << "': " << e.what() << "\n";
        state.failed = true;
        return false;
    }
    state.moreToPoll = fetched.moreAvailable;

    if (fetched.records.empty()) {
        if (mOptions.verbose) {
            mLog << "[BoundedPoller] Gather process for '" << mAdapter.type()
                 << "' returned no records\n";
        }
        stopWatch();
        return true;
    }

    bool delivered = false;
    try {
        delivered = mSink.deliver(job.destination, fetched.records);
    } catch (const std::exception& e) {
        mLog << "[BoundedPoller] error: sink threw: " << e.what() << "\n";
    }
    if (!delivered) {
        // Stop here: a later page would move the watermark past this batch.
        mLog << "[BoundedPoller] error: failed to deliver "
             << fetched.records.size() << " records to '" << job.destination
             << "'; watermark left at " << state.watermark << "\n";
        ++state.deliveryFailures;
        mAdapter.rewind();
        stopWatch();
        return false;
    }
    state.gathered += fetched.records.size();

    const Timestamp next = maxTimestamp(fetched.records, state.watermark);
    if (mOptions.verbose) {
        mLog << "[BoundedPoller] Updating watermark from " << state.watermark
             << " to " << next << "\n";
    }
    try {
        mStore.setWatermark(job.jobId, next);
    } catch (const std::exception& e) {
        mLog << "[BoundedPoller] error: could not persist watermark " << next
             << ": " << e.what() << "\n";
        state.failed = true;
        return false;
    }
    state.watermark = next;
    job.watermark   = next;
    ++state.iterations;

    cycle.recordCount  = fetched.records.size();
    cycle.newWatermark = next;
    stopWatch();
    return true;
}

bool BoundedPoller::admitNext(const PollCycleResult& cycle)
{
    const auto projected = projectNextCycleCost(cycle.elapsed,
                                                mAdapter.throttleInterval(),
                                                mOptions.safetyMultiplierMilli);
    const auto remaining = mStore.remainingExecutionTime();

    if (mOptions.verbose) {
        mLog << "[BoundedPoller] Gather process for '" << mAdapter.type()
             << "' executed in " << formatSeconds(cycle.elapsed)
             << "s; next cycle projected at " << formatSeconds(projected)
             << "s with " << formatSeconds(remaining) << "s remaining\n";
    }

    if (!admitNextCycle(projected, remaining)) {
        mLog << "[BoundedPoller] Stopping '" << mAdapter.type()
             << "': next cycle needs " << formatSeconds(projected)
             << "s but only " << formatSeconds(remaining) << "s remain\n";
        return false;
    }
    return true;
}

void BoundedPoller::finalize(JobConfig& job, const RunState& state)
{
    mStore.setWatermark(job.jobId, state.watermark);
    job.watermark = state.watermark;

    if (state.failed) {
        mStore.markFailed(job.jobId);
        job.status = JobStatus::Failed;
    } else {
        mStore.markSucceeded(job.jobId);
        job.status = JobStatus::Succeeded;
    }

    if (state.watermark == job.startWatermark) {
        mLog << "[BoundedPoller] warning: ending watermark is the same as the "
             << "starting watermark (" << state.watermark << ")\n";
    }

    mLog << "[BoundedPoller] App " << (state.failed ? "failed" : "complete")
         << " for service '" << mAdapter.type() << "'. Gathered "
         << state.gathered << " records in " << state.iterations << " polls.\n";
}

} // namespace app_poller
