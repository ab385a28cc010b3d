#pragma once

#include "models.hpp"

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace app_poller {

/// One page returned by a source.
struct FetchResult {
    std::vector<Record> records;
    /// Set when the source truncated the response and another page is ready.
    /// Must be re-asserted on every fetch; the poller consumes it once.
    bool moreAvailable = false;
};

/// Capability interface implemented once per external data source.
class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    /// Originating service, e.g. "graphql".
    virtual std::string service() const = 0;

    /// Kind of records within the service, e.g. "records", "audit".
    virtual std::string logType() const = 0;

    /// Registry key: service() + "_" + logType().
    std::string type() const { return service() + "_" + logType(); }

    /// Keys the job's credential map must contain.
    virtual std::set<std::string> requiredCredentialKeys() const = 0;

    /// Pause to observe before the next request.
    virtual std::chrono::nanoseconds throttleInterval() const = 0;

    /// Fetch one page of records newer than @p sinceWatermark.
    /// May throw ConfigurationError for unusable credentials and
    /// std::runtime_error for anything else.
    virtual FetchResult fetchNext(const Credentials& credentials,
                                  Timestamp sinceWatermark) = 0;

    /// Drop any position held from earlier fetches so the next one starts
    /// from the committed watermark.  Called at the start of every run and
    /// after a page could not be delivered.
    virtual void rewind() {}
};

} // namespace app_poller
