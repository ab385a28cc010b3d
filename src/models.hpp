#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace app_poller {

/// Seconds since the Unix epoch.  Used as the resumption watermark.
using Timestamp = std::int64_t;

/// Credential map as stored with the job ("auth" section).
using Credentials = std::map<std::string, std::string>;

enum class JobStatus {
    Idle,
    Running,
    Succeeded,
    Failed
};

/// "idle", "running", "succeeded", "failed"
const char* toString(JobStatus status);

/// Inverse of toString().  Throws std::invalid_argument on unknown names.
JobStatus parseJobStatus(const std::string& name);

/// One record gathered from a source.
struct Record {
    std::string    id;
    Timestamp      timestamp = 0;   // 0 when the source gave none
    nlohmann::json payload;
};

/// Persistent description of one job (source + sink pairing).
struct JobConfig {
    std::string jobId;
    std::string sourceType;      // e.g. "graphql_records"
    std::string destination;     // downstream target for the sink
    Credentials credentials;
    JobStatus   status         = JobStatus::Idle;
    Timestamp   watermark      = 0;
    Timestamp   startWatermark = 0;
};

/// Outcome of one gather cycle.  Consumed immediately by the poller.
struct PollCycleResult {
    std::size_t              recordCount  = 0;
    Timestamp                newWatermark = 0;
    std::chrono::nanoseconds elapsed{0};
};

/// Returned to the caller of BoundedPoller::run().
struct RunSummary {
    bool                     started          = false;
    JobStatus                status           = JobStatus::Idle;
    std::size_t              recordsGathered  = 0;
    int                      iterations       = 0;
    Timestamp                finalWatermark   = 0;
    int                      deliveryFailures = 0;
    std::chrono::nanoseconds totalSleep{0};
};

} // namespace app_poller
