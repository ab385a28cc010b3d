#include "record_sink.hpp"

#include <nlohmann/json.hpp>

namespace app_poller {

bool JsonLinesSink::deliver(const std::string& destination,
                            const std::vector<Record>& records)
{
    if (!mOut) return false;

    // Serialise the whole batch first so a dump error leaves the stream untouched.
    std::string batch;
    for (const auto& rec : records) {
        nlohmann::json line;
        line["destination"] = destination;
        line["id"]          = rec.id;
        line["timestamp"]   = rec.timestamp;
        line["record"]      = rec.payload;
        batch += line.dump();
        batch += '\n';
    }

    mOut << batch;
    mOut.flush();
    if (!mOut) return false;

    mTotalWritten += records.size();
    return true;
}

} // namespace app_poller
