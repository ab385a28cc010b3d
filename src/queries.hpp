#pragma once

#include <string>

namespace app_poller {
namespace queries {

/// Records updated after $since, oldest first, cursor-paginated.
/// Variables: $first (Int!), $after (String, nullable), $since (String!).
inline const std::string kRecordsQuery = R"(
query FetchRecords($first: Int!, $after: String, $since: String!) {
  records(first: $first, after: $after, updatedSince: $since, sortKey: UPDATED_AT) {
    edges {
      cursor
      node {
        id
        updatedAt
        payload
      }
    }
    pageInfo {
      hasNextPage
    }
  }
}
)";

} // namespace queries
} // namespace app_poller
