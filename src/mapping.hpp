#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace app_poller {

/// One page of a records connection.
struct PageResult {
    std::vector<Record>        records;
    std::optional<std::string> lastCursor;
    bool                       hasNextPage = false;
};

/// Parse a GraphQL response body holding the connection at data.<field>.
/// Throws std::runtime_error if the expected shape is missing.
PageResult parseRecordsPage(const nlohmann::json& responseBody,
                            const std::string& connectionField = "records");

/// Map one edge node to a Record.  The whole node becomes the payload;
/// "updatedAt" (ISO-8601) gives the timestamp, 0 when absent.
/// Throws std::invalid_argument for an unparseable "updatedAt".
Record parseRecordNode(const nlohmann::json& node);

/// Return human-readable error messages from a GraphQL response (may be empty).
std::vector<std::string> extractGraphqlErrors(const nlohmann::json& responseBody);

/// Latest timestamp among @p records, or @p floor if none is later.
Timestamp maxTimestamp(const std::vector<Record>& records, Timestamp floor);

} // namespace app_poller
