#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <ostream>
#include <string>

namespace app_poller {

/// Durable per-job state plus the clock of the current invocation.
class WatermarkStore {
public:
    virtual ~WatermarkStore() = default;

    /// Throws ConfigurationError if the job is unknown.
    virtual JobConfig load(const std::string& jobId) = 0;

    virtual bool isRunning(const std::string& jobId) = 0;
    virtual void markRunning(const std::string& jobId) = 0;
    virtual void markSucceeded(const std::string& jobId) = 0;
    virtual void markFailed(const std::string& jobId) = 0;

    virtual Timestamp getWatermark(const std::string& jobId) = 0;
    virtual void setWatermark(const std::string& jobId, Timestamp ts) = 0;

    /// Time left before the host terminates this invocation.
    virtual std::chrono::nanoseconds remainingExecutionTime() = 0;
};

/// Wall-clock budget of one invocation, fixed when constructed.
class ExecutionDeadline {
public:
    explicit ExecutionDeadline(std::chrono::nanoseconds budget)
        : mDeadline(std::chrono::steady_clock::now() + budget) {}

    /// Never negative.
    std::chrono::nanoseconds remaining() const;

private:
    std::chrono::steady_clock::time_point mDeadline;
};

/// WatermarkStore persisted as one JSON document:
///
///   {"jobs": {"<id>": {"type": "...", "destination": "...",
///                      "auth": {...}, "current_state": "idle",
///                      "last_timestamp": 0, "running_since": 0}}}
///
/// Every call re-reads the file so that separate invocations observe each
/// other's state.  Writes go to "<path>.tmp" and are renamed into place.
class JsonFileWatermarkStore : public WatermarkStore {
public:
    /// @param staleAfter  A job marked running longer ago than this is
    ///                    treated as abandoned.  Zero disables the check.
    JsonFileWatermarkStore(std::string path,
                           const ExecutionDeadline& deadline,
                           std::chrono::seconds staleAfter = std::chrono::seconds{0},
                           std::ostream& log = std::cerr);

    JobConfig load(const std::string& jobId) override;

    bool isRunning(const std::string& jobId) override;
    void markRunning(const std::string& jobId) override;
    void markSucceeded(const std::string& jobId) override;
    void markFailed(const std::string& jobId) override;

    Timestamp getWatermark(const std::string& jobId) override;
    void setWatermark(const std::string& jobId, Timestamp ts) override;

    std::chrono::nanoseconds remainingExecutionTime() override;

    /// Return a job to idle regardless of its current state.
    void reset(const std::string& jobId);

    /// Insert or replace a job definition.
    void save(const JobConfig& job);

private:
    std::string              mPath;
    const ExecutionDeadline& mDeadline;
    std::chrono::seconds     mStaleAfter;
    std::ostream&            mLog;

    nlohmann::json readDocument() const;
    void           writeDocument(const nlohmann::json& doc) const;

    /// Reference to jobs[jobId]; throws ConfigurationError when absent.
    static nlohmann::json& jobNode(nlohmann::json& doc, const std::string& jobId);

    void setStatus(const std::string& jobId, JobStatus status);
};

} // namespace app_poller
