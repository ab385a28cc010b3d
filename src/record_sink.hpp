#pragma once

#include "models.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace app_poller {

/// Downstream consumer of gathered records.
class RecordSink {
public:
    virtual ~RecordSink() = default;

    /// Hand @p records to @p destination.  Returns false (or throws) when the
    /// batch was not accepted.
    virtual bool deliver(const std::string& destination,
                         const std::vector<Record>& records) = 0;
};

/// Writes one JSON object per line:
///   {"destination": "...", "id": "...", "timestamp": N, "record": {...}}
class JsonLinesSink : public RecordSink {
public:
    explicit JsonLinesSink(std::ostream& out) : mOut(out) {}

    bool deliver(const std::string& destination,
                 const std::vector<Record>& records) override;

    std::size_t totalWritten() const { return mTotalWritten; }

private:
    std::ostream& mOut;
    std::size_t   mTotalWritten = 0;
};

} // namespace app_poller
