#pragma once

#include "graphql_client.hpp"
#include "source_adapter.hpp"
#include "throttle.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>

namespace app_poller {

/// SourceAdapter for a cursor-paginated GraphQL "records" connection.
///
/// Credentials: "endpoint" (URL) and "access_token".  Pages are requested
/// oldest first from the watermark; the cursor of a truncated page is kept
/// for the next fetch of the same adapter instance.  Transient failures are
/// retried here with exponential backoff; the poller never retries.
class GraphQLSourceAdapter : public SourceAdapter {
public:
    static constexpr const char* kType = "graphql_records";

    /// Sends one request.  The default builds a GraphQLClient per call.
    using Transport = std::function<GraphQLClient::Response(
        const std::string& endpoint, const std::string& accessToken,
        const std::string& query, const nlohmann::json& variables)>;

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Options {
        int                      pageSize     = 100;
        std::chrono::nanoseconds minInterval  = std::chrono::seconds(1);
        double                   costMargin   = 20.0;
        int                      timeoutMs    = 5000;
        int                      maxAttempts  = 6;
        bool                     verbose      = false;
        std::ostream*            log          = &std::cerr;
        Transport                transport;   // empty: real HTTP
        Sleeper                  sleep;       // empty: std::this_thread::sleep_for
    };

    struct Stats {
        int totalRequests = 0;
        int totalRetries  = 0;
    };

    explicit GraphQLSourceAdapter(Options options);

    std::string service() const override { return "graphql"; }
    std::string logType() const override { return "records"; }

    std::set<std::string> requiredCredentialKeys() const override;
    std::chrono::nanoseconds throttleInterval() const override;

    FetchResult fetchNext(const Credentials& credentials,
                          Timestamp sinceWatermark) override;

    void rewind() override { mCursor.reset(); }

    Stats getStats() const { return mStats; }
    double avgQueryCost() const { return mThrottle.avgQueryCost(); }

private:
    Options                    mOptions;
    ThrottleController         mThrottle;
    std::optional<std::string> mCursor;
    Stats                      mStats{};

    /// Execute with backoff on 429 / 5xx / network errors.
    /// Throws ConfigurationError on 401 / 403, std::runtime_error once
    /// attempts are exhausted.
    nlohmann::json executeWithRetry(const std::string& endpoint,
                                    const std::string& accessToken,
                                    const nlohmann::json& variables);

    static bool isRetryableStatus(unsigned int status);
};

} // namespace app_poller
