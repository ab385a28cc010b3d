#include "watermark_store.hpp"
#include "errors.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace app_poller {

namespace {

Timestamp nowEpochSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

// ---------------------------------------------------------------------------
// ExecutionDeadline
// ---------------------------------------------------------------------------

std::chrono::nanoseconds ExecutionDeadline::remaining() const {
    const auto left = mDeadline - std::chrono::steady_clock::now();
    if (left <= std::chrono::steady_clock::duration::zero()) {
        return std::chrono::nanoseconds::zero();
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(left);
}

// ---------------------------------------------------------------------------
// JsonFileWatermarkStore
// ---------------------------------------------------------------------------

JsonFileWatermarkStore::JsonFileWatermarkStore(std::string path,
                                               const ExecutionDeadline& deadline,
                                               std::chrono::seconds staleAfter,
                                               std::ostream& log)
    : mPath(std::move(path))
    , mDeadline(deadline)
    , mStaleAfter(staleAfter)
    , mLog(log) {}

JobConfig JsonFileWatermarkStore::load(const std::string& jobId) {
    auto doc = readDocument();
    const auto& node = jobNode(doc, jobId);

    JobConfig job;
    job.jobId = jobId;
    try {
        job.sourceType  = node.value("type", "");
        job.destination = node.value("destination", "");
        if (node.contains("auth")) {
            if (!node["auth"].is_object()) {
                throw ConfigurationError("Auth config for job '" + jobId +
                                         "' must be an object");
            }
            for (const auto& item : node["auth"].items()) {
                job.credentials[item.key()] = item.value().get<std::string>();
            }
        }
        job.status    = parseJobStatus(node.value("current_state", "idle"));
        job.watermark = node.value("last_timestamp", Timestamp{0});
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed config for job '" + jobId +
                                 "': " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError("Malformed config for job '" + jobId +
                                 "': " + e.what());
    }
    job.startWatermark = job.watermark;
    return job;
}

bool JsonFileWatermarkStore::isRunning(const std::string& jobId) {
    auto doc = readDocument();
    const auto& node = jobNode(doc, jobId);

    if (node.value("current_state", "idle") != toString(JobStatus::Running)) {
        return false;
    }
    if (mStaleAfter.count() <= 0) {
        return true;
    }

    const Timestamp since = node.value("running_since", Timestamp{0});
    const Timestamp age   = nowEpochSeconds() - since;
    if (age > mStaleAfter.count()) {
        mLog << "[WatermarkStore] warning: job '" << jobId
             << "' has been running for " << age
             << "s (limit " << mStaleAfter.count()
             << "s); treating it as abandoned\n";
        return false;
    }
    return true;
}

void JsonFileWatermarkStore::markRunning(const std::string& jobId) {
    auto doc = readDocument();
    auto& node = jobNode(doc, jobId);
    node["current_state"] = toString(JobStatus::Running);
    node["running_since"] = nowEpochSeconds();
    writeDocument(doc);
}

void JsonFileWatermarkStore::markSucceeded(const std::string& jobId) {
    setStatus(jobId, JobStatus::Succeeded);
}

void JsonFileWatermarkStore::markFailed(const std::string& jobId) {
    setStatus(jobId, JobStatus::Failed);
}

Timestamp JsonFileWatermarkStore::getWatermark(const std::string& jobId) {
    auto doc = readDocument();
    return jobNode(doc, jobId).value("last_timestamp", Timestamp{0});
}

void JsonFileWatermarkStore::setWatermark(const std::string& jobId, Timestamp ts) {
    auto doc = readDocument();
    jobNode(doc, jobId)["last_timestamp"] = ts;
    writeDocument(doc);
}

std::chrono::nanoseconds JsonFileWatermarkStore::remainingExecutionTime() {
    return mDeadline.remaining();
}

void JsonFileWatermarkStore::reset(const std::string& jobId) {
    setStatus(jobId, JobStatus::Idle);
}

void JsonFileWatermarkStore::save(const JobConfig& job) {
    if (job.jobId.empty()) {
        throw std::invalid_argument("Cannot save a job without an id");
    }

    // A missing file starts a new document; an unreadable one is an error.
    nlohmann::json doc = nlohmann::json::object();
    if (std::ifstream(mPath).good()) {
        doc = readDocument();
    }
    if (!doc.is_object()) {
        throw std::runtime_error("State file is not a JSON object: " + mPath);
    }
    if (!doc.contains("jobs") || !doc["jobs"].is_object()) {
        doc["jobs"] = nlohmann::json::object();
    }

    nlohmann::json node;
    node["type"]           = job.sourceType;
    node["destination"]    = job.destination;
    node["auth"]           = job.credentials;
    node["current_state"]  = toString(job.status);
    node["last_timestamp"] = job.watermark;
    doc["jobs"][job.jobId] = node;
    writeDocument(doc);
}

// ---------------------------------------------------------------------------
// Private
// ---------------------------------------------------------------------------

nlohmann::json JsonFileWatermarkStore::readDocument() const {
    std::ifstream in(mPath);
    if (!in) {
        throw std::runtime_error("Cannot open state file: " + mPath);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse state file " + mPath +
                                 ": " + e.what());
    }
}

void JsonFileWatermarkStore::writeDocument(const nlohmann::json& doc) const {
    const std::string tmp = mPath + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write state file: " + tmp);
        }
        out << doc.dump(2) << "\n";
        out.flush();
        if (!out) {
            throw std::runtime_error("Short write to state file: " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), mPath.c_str()) != 0) {
        throw std::runtime_error("Cannot replace state file: " + mPath);
    }
}

nlohmann::json& JsonFileWatermarkStore::jobNode(nlohmann::json& doc,
                                                const std::string& jobId)
{
    if (!doc.is_object() || !doc.contains("jobs") || !doc["jobs"].is_object() ||
        !doc["jobs"].contains(jobId)) {
        throw ConfigurationError("No config found for job '" + jobId + "'");
    }
    return doc["jobs"][jobId];
}

void JsonFileWatermarkStore::setStatus(const std::string& jobId, JobStatus status) {
    auto doc = readDocument();
    auto& node = jobNode(doc, jobId);
    node["current_state"] = toString(status);
    if (status != JobStatus::Running) {
        node.erase("running_since");
    }
    writeDocument(doc);
}

} // namespace app_poller
