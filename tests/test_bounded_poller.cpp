/// @file test_bounded_poller.cpp
/// Unit tests for bounded_poller.hpp: lifecycle, watermark commits and
/// time-budget admission, driven by in-memory fakes.

#include "bounded_poller.hpp"
#include "errors.hpp"
#include "graphql_adapter.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace app_poller;
using namespace std::chrono_literals;

namespace {

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

/// Store for a single job.  Every mutation is appended to a shared event log.
class FakeStore : public WatermarkStore {
public:
    FakeStore(std::vector<std::string>& events, JobStatus status, Timestamp watermark)
        : mEvents(events), status(status), watermark(watermark) {}

    JobConfig load(const std::string& jobId) override {
        JobConfig job;
        job.jobId       = jobId;
        job.sourceType  = "fake_logs";
        job.destination = "rule_processor";
        job.credentials = {{"api_key", "k"}, {"subdomain", "acme"}};
        job.status      = status;
        job.watermark   = watermark;
        return job;
    }

    bool isRunning(const std::string&) override { return status == JobStatus::Running; }

    void markRunning(const std::string&) override {
        status = JobStatus::Running;
        mEvents.push_back("markRunning");
    }
    void markSucceeded(const std::string&) override {
        status = JobStatus::Succeeded;
        mEvents.push_back("markSucceeded");
    }
    void markFailed(const std::string&) override {
        status = JobStatus::Failed;
        mEvents.push_back("markFailed");
    }

    Timestamp getWatermark(const std::string&) override { return watermark; }

    void setWatermark(const std::string&, Timestamp ts) override {
        watermark = ts;
        mEvents.push_back("setWatermark:" + std::to_string(ts));
    }

    std::chrono::nanoseconds remainingExecutionTime() override {
        ++remainingQueries;
        if (remainingScript.empty()) return 1h;
        const auto next = remainingScript.front();
        remainingScript.pop_front();
        return next;
    }

    std::deque<std::chrono::nanoseconds> remainingScript;
    int remainingQueries = 0;

private:
    std::vector<std::string>& mEvents;

public:
    JobStatus status;
    Timestamp watermark;
};

/// Adapter replaying a script of pages; once exhausted it repeats `fallback`.
class ScriptedAdapter : public SourceAdapter {
public:
    using Step = std::function<FetchResult(Timestamp since)>;

    std::string service() const override { return "fake"; }
    std::string logType() const override { return "logs"; }

    std::set<std::string> requiredCredentialKeys() const override {
        return {"api_key", "subdomain"};
    }

    std::chrono::nanoseconds throttleInterval() const override { return interval; }

    void rewind() override { ++rewinds; }

    FetchResult fetchNext(const Credentials&, Timestamp since) override {
        ++fetchCount;
        sinceSeen.push_back(since);
        if (!steps.empty()) {
            auto step = steps.front();
            steps.pop_front();
            return step(since);
        }
        if (fallback) return fallback(since);
        return {};
    }

    std::deque<Step>         steps;
    Step                     fallback;
    std::chrono::nanoseconds interval = 2s;
    int                      fetchCount = 0;
    int                      rewinds    = 0;
    std::vector<Timestamp>   sinceSeen;
};

class FakeSink : public RecordSink {
public:
    explicit FakeSink(std::vector<std::string>& events) : mEvents(events) {}

    bool deliver(const std::string& destination,
                 const std::vector<Record>& records) override {
        ++deliverCalls;
        lastDestination = destination;
        mEvents.push_back("deliver:" + std::to_string(records.size()));
        if (throwOnDeliver) throw std::runtime_error("broker unavailable");
        if (!accept) return false;
        if (rejectNext > 0) {
            --rejectNext;
            return false;
        }
        delivered.insert(delivered.end(), records.begin(), records.end());
        return true;
    }

    bool                accept = true;
    bool                throwOnDeliver = false;
    int                 rejectNext = 0;
    int                 deliverCalls = 0;
    std::string         lastDestination;
    std::vector<Record> delivered;

private:
    std::vector<std::string>& mEvents;
};

Record makeRecord(const std::string& id, Timestamp ts) {
    Record r;
    r.id        = id;
    r.timestamp = ts;
    r.payload   = {{"id", id}};
    return r;
}

ScriptedAdapter::Step page(std::vector<Record> records, bool more) {
    return [records, more](Timestamp) {
        FetchResult result;
        result.records       = records;
        result.moreAvailable = more;
        return result;
    };
}

ScriptedAdapter::Step failing(std::function<void()> thrower) {
    return [thrower](Timestamp) -> FetchResult {
        thrower();
        return {};
    };
}

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------

class BoundedPollerTest : public ::testing::Test {
protected:
    static constexpr Timestamp kStart = 1700000000;

    std::vector<std::string>               events;
    FakeStore                              store{events, JobStatus::Idle, kStart};
    FakeSink                               sink{events};
    ScriptedAdapter                        adapter;
    std::ostringstream                     log;
    std::vector<std::chrono::nanoseconds>  sleeps;

    BoundedPoller makePoller() {
        BoundedPoller::Options opts;
        opts.sleep = [this](std::chrono::nanoseconds d) { sleeps.push_back(d); };
        return BoundedPoller(adapter, store, sink, log, opts);
    }

    std::size_t indexOf(const std::string& event) const {
        for (std::size_t i = 0; i < events.size(); ++i) {
            if (events[i] == event) return i;
        }
        return events.size();
    }
};

} // namespace

// ============================================================================
// Mutual-exclusion guard
// ============================================================================

TEST_F(BoundedPollerTest, AlreadyRunningJobPerformsNoWork) {
    store.status = JobStatus::Running;
    adapter.fallback = page({makeRecord("a", kStart + 10)}, false);

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_FALSE(summary.started);
    EXPECT_EQ(summary.iterations, 0);
    EXPECT_EQ(summary.recordsGathered, 0u);
    EXPECT_EQ(adapter.fetchCount, 0);
    EXPECT_EQ(sink.deliverCalls, 0);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(store.status, JobStatus::Running);
    EXPECT_EQ(store.watermark, kStart);
    EXPECT_NE(log.str().find("already running"), std::string::npos);
}

// ============================================================================
// Single page
// ============================================================================

TEST_F(BoundedPollerTest, ThreeRecordsThenNoMoreData) {
    adapter.steps.push_back(page({makeRecord("a", kStart + 10),
                                  makeRecord("b", kStart + 30),
                                  makeRecord("c", kStart + 20)}, false));

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_TRUE(summary.started);
    EXPECT_EQ(summary.status, JobStatus::Succeeded);
    EXPECT_EQ(summary.iterations, 1);
    EXPECT_EQ(summary.recordsGathered, 3u);
    EXPECT_EQ(summary.finalWatermark, kStart + 30);
    EXPECT_EQ(summary.deliveryFailures, 0);

    EXPECT_EQ(store.status, JobStatus::Succeeded);
    EXPECT_EQ(store.watermark, kStart + 30);
    EXPECT_EQ(job.status, JobStatus::Succeeded);
    EXPECT_EQ(job.startWatermark, kStart);
    EXPECT_EQ(sink.lastDestination, "rule_processor");
    EXPECT_EQ(adapter.sinceSeen.front(), kStart);
}

TEST_F(BoundedPollerTest, FirstIterationNeverSleeps) {
    adapter.steps.push_back(page({makeRecord("a", kStart + 1)}, false));

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_TRUE(sleeps.empty());
    EXPECT_EQ(summary.totalSleep, 0ns);
}

TEST_F(BoundedPollerTest, EmptyFetchSucceedsWithoutProgressAndWarns) {
    adapter.steps.push_back(page({}, false));

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_EQ(summary.status, JobStatus::Succeeded);
    EXPECT_EQ(summary.iterations, 0);
    EXPECT_EQ(summary.finalWatermark, kStart);
    EXPECT_EQ(sink.deliverCalls, 0);
    EXPECT_EQ(store.watermark, kStart);
    EXPECT_NE(log.str().find("warning: ending watermark is the same"), std::string::npos);
}

TEST_F(BoundedPollerTest, OlderRecordsNeverMoveWatermarkBackwards) {
    adapter.steps.push_back(page({makeRecord("old", kStart - 500)}, false));

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_EQ(summary.recordsGathered, 1u);
    EXPECT_EQ(summary.finalWatermark, kStart);
    EXPECT_GE(store.watermark, kStart);
}

// ============================================================================
// Commit ordering and delivery failure
// ============================================================================

TEST_F(BoundedPollerTest, WatermarkPersistedOnlyAfterDelivery) {
    adapter.steps.push_back(page({makeRecord("a", kStart + 5)}, true));
    adapter.steps.push_back(page({makeRecord("b", kStart + 9)}, false));

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    poller.run(job);

    const std::vector<std::string> expected = {
        "markRunning",
        "deliver:1", "setWatermark:" + std::to_string(kStart + 5),
        "deliver:1", "setWatermark:" + std::to_string(kStart + 9),
        "setWatermark:" + std::to_string(kStart + 9),
        "markSucceeded",
    };
    EXPECT_EQ(events, expected);
}

TEST_F(BoundedPollerTest, DeliveryFailureLeavesWatermarkUnchanged) {
    sink.accept = false;
    adapter.fallback = page({makeRecord("a", kStart + 50)}, true);

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_EQ(store.watermark, kStart);
    EXPECT_EQ(summary.finalWatermark, kStart);
    EXPECT_EQ(summary.deliveryFailures, 1);
    EXPECT_EQ(summary.recordsGathered, 0u);
    // Not fatal: the run completes, the failure is only counted.
    EXPECT_EQ(summary.status, JobStatus::Succeeded);
    EXPECT_EQ(store.status, JobStatus::Succeeded);
    EXPECT_EQ(events.back(), "markSucceeded");
    // The loop stops instead of fetching past the undelivered batch.
    EXPECT_EQ(adapter.fetchCount, 1);
    EXPECT_EQ(adapter.rewinds, 2);
    EXPECT_EQ(indexOf("setWatermark:" + std::to_string(kStart + 50)), events.size());
}

TEST_F(BoundedPollerTest, ThrowingSinkCountsAsDeliveryFailure) {
    sink.throwOnDeliver = true;
    adapter.steps.push_back(page({makeRecord("a", kStart + 50)}, false));

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_EQ(summary.deliveryFailures, 1);
    EXPECT_EQ(summary.status, JobStatus::Succeeded);
    EXPECT_EQ(store.watermark, kStart);
    EXPECT_NE(log.str().find("broker unavailable"), std::string::npos);
}

TEST_F(BoundedPollerTest, RejectedPageIsRefetchedByNextRun) {
    using json = nlohmann::json;

    const auto recordsPage = [](const std::vector<std::string>& ids, bool more) {
        json edges = json::array();
        for (const auto& id : ids) {
            edges.push_back({{"cursor", "cur-" + id},
                             {"node", {{"id", id},
                                       {"updatedAt", "2024-01-01T00:00:0" +
                                                     id.substr(1) + "Z"}}}});
        }
        json body = {{"data", {{"records", {{"edges", edges},
                                            {"pageInfo", {{"hasNextPage", more}}}}}}}};
        return GraphQLClient::Response{200, body};
    };

    std::deque<GraphQLClient::Response> replies = {
        recordsPage({"r1", "r2"}, true),
        recordsPage({"r1", "r2"}, true),
        recordsPage({"r3", "r4"}, false),
    };
    std::vector<json> sent;

    GraphQLSourceAdapter::Options opts;
    opts.minInterval = 0s;
    opts.log         = &log;
    opts.sleep       = [](std::chrono::milliseconds) {};
    opts.transport   = [&](const std::string&, const std::string&,
                           const std::string&, const json& variables) {
        sent.push_back(variables);
        auto next = replies.front();
        replies.pop_front();
        return next;
    };
    GraphQLSourceAdapter source(opts);

    sink.rejectNext = 1;
    BoundedPoller::Options pollerOpts;
    pollerOpts.sleep = [](std::chrono::nanoseconds) {};
    BoundedPoller poller(source, store, sink, log, pollerOpts);

    JobConfig job = store.load("job-1");
    job.credentials = {{"endpoint", "http://localhost:4000/graphql"},
                       {"access_token", "t"}};
    const auto first = poller.run(job);
    EXPECT_EQ(first.deliveryFailures, 1);
    EXPECT_EQ(store.watermark, kStart);

    const auto second = poller.run(job);

    ASSERT_EQ(sent.size(), 3u);
    EXPECT_FALSE(sent[1].contains("after"));
    EXPECT_EQ(sent[2]["after"], "cur-r2");

    ASSERT_EQ(sink.delivered.size(), 4u);
    EXPECT_EQ(sink.delivered[0].id, "r1");
    EXPECT_EQ(sink.delivered[3].id, "r4");
    EXPECT_EQ(second.deliveryFailures, 0);
    EXPECT_EQ(store.watermark, 1704067204);
}

TEST_F(BoundedPollerTest, FailureAfterProgressKeepsLastCommittedWatermark) {
    adapter.steps.push_back(page({makeRecord("a", kStart + 150)}, true));
    adapter.steps.push_back(failing([] { throw std::runtime_error("HTTP 500"); }));

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_EQ(summary.status, JobStatus::Failed);
    EXPECT_EQ(summary.iterations, 1);
    EXPECT_EQ(store.watermark, kStart + 150);
    EXPECT_EQ(store.status, JobStatus::Failed);
    EXPECT_EQ(adapter.sinceSeen.back(), kStart + 150);
}

// ============================================================================
// Continuation flag
// ============================================================================

TEST_F(BoundedPollerTest, MoreAvailableMustBeReassertedEachFetch) {
    adapter.steps.push_back(page({makeRecord("a", kStart + 1)}, true));
    adapter.steps.push_back(page({makeRecord("b", kStart + 2)}, false));
    adapter.steps.push_back(page({makeRecord("c", kStart + 3)}, true));

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_EQ(adapter.fetchCount, 2);
    EXPECT_EQ(summary.iterations, 2);
    EXPECT_EQ(summary.finalWatermark, kStart + 2);
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], adapter.interval);
}

// ============================================================================
// Admission control
// ============================================================================

TEST_F(BoundedPollerTest, EndlessPaginationStopsOnTimeBudget) {
    adapter.interval = 1s;
    Timestamp next = kStart;
    adapter.fallback = [&next](Timestamp) {
        ++next;
        FetchResult r;
        r.records.push_back(makeRecord("r" + std::to_string(next), next));
        r.moreAvailable = true;
        return r;
    };
    for (int left = 10; left >= 1; --left) {
        store.remainingScript.push_back(std::chrono::seconds(left));
    }

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    // 10s, 9s, ... 2s admit a ~1s cycle; 1s does not.
    EXPECT_EQ(summary.iterations, 10);
    EXPECT_EQ(adapter.fetchCount, 10);
    EXPECT_EQ(store.remainingQueries, 10);
    EXPECT_EQ(sleeps.size(), 9u);
    EXPECT_EQ(summary.status, JobStatus::Succeeded);
    EXPECT_EQ(summary.finalWatermark, kStart + 10);
    EXPECT_NE(log.str().find("Stopping"), std::string::npos);
}

TEST_F(BoundedPollerTest, RemainingBudgetBelowThrottleStopsAfterFirstCycle) {
    adapter.interval = 5s;
    adapter.fallback = page({makeRecord("a", kStart + 1)}, true);
    store.remainingScript.push_back(5s);

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    const auto summary = poller.run(job);

    EXPECT_EQ(adapter.fetchCount, 1);
    EXPECT_EQ(summary.iterations, 1);
    EXPECT_TRUE(sleeps.empty());
}

// ============================================================================
// Configuration errors
// ============================================================================

TEST_F(BoundedPollerTest, MissingCredentialThrowsBeforeAnyStateChange) {
    JobConfig job = store.load("job-1");
    job.credentials.erase("subdomain");

    auto poller = makePoller();
    try {
        poller.run(job);
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("'subdomain'"), std::string::npos);
    }

    EXPECT_EQ(adapter.fetchCount, 0);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(store.status, JobStatus::Idle);
}

TEST_F(BoundedPollerTest, ConfigurationErrorDuringGatherFinalizesAsFailed) {
    adapter.steps.push_back(failing([] { throw ConfigurationError("token revoked"); }));

    JobConfig job = store.load("job-1");
    auto poller = makePoller();
    EXPECT_THROW(poller.run(job), ConfigurationError);

    EXPECT_EQ(store.status, JobStatus::Failed);
    EXPECT_EQ(store.watermark, kStart);
    EXPECT_EQ(events.back(), "markFailed");
}

// ============================================================================
// Reuse
// ============================================================================

TEST_F(BoundedPollerTest, CountersDoNotLeakAcrossRuns) {
    adapter.steps.push_back(page({makeRecord("a", kStart + 1),
                                  makeRecord("b", kStart + 2)}, false));
    adapter.steps.push_back(page({makeRecord("c", kStart + 3)}, false));

    auto poller = makePoller();

    JobConfig first = store.load("job-1");
    const auto s1 = poller.run(first);

    JobConfig second = store.load("job-1");
    const auto s2 = poller.run(second);

    EXPECT_EQ(s1.recordsGathered, 2u);
    EXPECT_EQ(s2.recordsGathered, 1u);
    EXPECT_EQ(s2.iterations, 1);
    EXPECT_EQ(second.startWatermark, kStart + 2);
    EXPECT_EQ(s2.finalWatermark, kStart + 3);
    // The second run starts fresh, so it does not sleep first either.
    EXPECT_TRUE(sleeps.empty());
}
