#include "mapping.hpp"
#include "util.hpp"

#include <algorithm>
#include <stdexcept>

namespace app_poller {

Record parseRecordNode(const nlohmann::json& node) {
    Record rec;
    if (node.contains("id")) {
        const auto& id = node["id"];
        rec.id = id.is_string() ? id.get<std::string>() : id.dump();
    }

    const std::string updatedAt = node.value("updatedAt", "");
    if (!updatedAt.empty()) {
        rec.timestamp = parseIso8601(updatedAt);
    }

    rec.payload = node;
    return rec;
}

PageResult parseRecordsPage(const nlohmann::json& responseBody,
                            const std::string& connectionField)
{
    PageResult result;

    if (!responseBody.is_object() || !responseBody.contains("data")) {
        throw std::runtime_error("Response missing 'data' field");
    }

    const auto& data = responseBody["data"];
    if (data.is_null()) {
        // Top-level errors only.
        return result;
    }
    if (!data.is_object() || !data.contains(connectionField)) {
        throw std::runtime_error("Response missing 'data." + connectionField +
                                 "' field");
    }
    const auto& connection = data[connectionField];

    if (connection.contains("edges") && connection["edges"].is_array()) {
        for (const auto& edge : connection["edges"]) {
            if (edge.contains("node")) {
                result.records.push_back(parseRecordNode(edge["node"]));
            }
            if (edge.contains("cursor") && edge["cursor"].is_string()) {
                result.lastCursor = edge["cursor"].get<std::string>();
            }
        }
    }

    if (connection.contains("pageInfo")) {
        result.hasNextPage = connection["pageInfo"].value("hasNextPage", false);
    }

    return result;
}

std::vector<std::string>
extractGraphqlErrors(const nlohmann::json& responseBody) {
    std::vector<std::string> errors;

    if (responseBody.contains("errors") && responseBody["errors"].is_array()) {
        for (const auto& err : responseBody["errors"]) {
            errors.push_back(err.is_object()
                                 ? err.value("message", "Unknown GraphQL error")
                                 : err.dump());
        }
    }
    return errors;
}

Timestamp maxTimestamp(const std::vector<Record>& records, Timestamp floor) {
    Timestamp latest = floor;
    for (const auto& rec : records) {
        latest = std::max(latest, rec.timestamp);
    }
    return latest;
}

} // namespace app_poller
