#include "models.hpp"

#include <stdexcept>

namespace app_poller {

const char* toString(JobStatus status) {
    switch (status) {
        case JobStatus::Idle:      return "idle";
        case JobStatus::Running:   return "running";
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Failed:    return "failed";
    }
    return "unknown";
}

JobStatus parseJobStatus(const std::string& name) {
    if (name == "idle")      return JobStatus::Idle;
    if (name == "running")   return JobStatus::Running;
    if (name == "succeeded") return JobStatus::Succeeded;
    if (name == "failed")    return JobStatus::Failed;
    throw std::invalid_argument("Unknown job status: " + name);
}

} // namespace app_poller
