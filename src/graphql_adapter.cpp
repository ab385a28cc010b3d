#include "graphql_adapter.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "queries.hpp"
#include "util.hpp"

#include <stdexcept>
#include <thread>

namespace app_poller {

GraphQLSourceAdapter::GraphQLSourceAdapter(Options options)
    : mOptions(std::move(options))
    , mThrottle(mOptions.minInterval, mOptions.costMargin)
{
    if (mOptions.pageSize <= 0) {
        throw std::invalid_argument("pageSize must be positive");
    }
    if (mOptions.maxAttempts <= 0) {
        throw std::invalid_argument("maxAttempts must be positive");
    }
    if (!mOptions.log) {
        mOptions.log = &std::cerr;
    }
    if (!mOptions.sleep) {
        mOptions.sleep = [](std::chrono::milliseconds d) {
            std::this_thread::sleep_for(d);
        };
    }
    if (!mOptions.transport) {
        const int  timeoutMs = mOptions.timeoutMs;
        const bool verbose   = mOptions.verbose;
        std::ostream* log    = mOptions.log;
        mOptions.transport = [timeoutMs, verbose, log](
                                 const std::string& endpoint,
                                 const std::string& accessToken,
                                 const std::string& query,
                                 const nlohmann::json& variables) {
            GraphQLClient::Options clientOpts;
            clientOpts.timeoutMs = timeoutMs;
            clientOpts.verbose   = verbose;
            clientOpts.log       = log;
            GraphQLClient client(endpoint, accessToken, clientOpts);
            return client.execute(query, variables);
        };
    }
}

std::set<std::string> GraphQLSourceAdapter::requiredCredentialKeys() const {
    return {"access_token", "endpoint"};
}

std::chrono::nanoseconds GraphQLSourceAdapter::throttleInterval() const {
    return mThrottle.nextDelay();
}

// ---------------------------------------------------------------------------
// Fetch one page
// ---------------------------------------------------------------------------

FetchResult GraphQLSourceAdapter::fetchNext(const Credentials& credentials,
                                            Timestamp sinceWatermark)
{
    auto& log = *mOptions.log;

    const auto endpoint = credentials.find("endpoint");
    if (endpoint == credentials.end() || endpoint->second.empty()) {
        throw ConfigurationError("Auth config for service '" + type() +
                                 "' has no endpoint");
    }
    const auto token = credentials.find("access_token");
    const std::string accessToken =
        token == credentials.end() ? std::string() : token->second;

    nlohmann::json variables;
    variables["first"] = mOptions.pageSize;
    variables["since"] = formatIso8601(sinceWatermark);
    if (mCursor) {
        variables["after"] = *mCursor;
    }

    if (mOptions.verbose) {
        log << "[GraphQLSource] Fetching page: first=" << mOptions.pageSize
            << ", since=" << variables["since"].get<std::string>();
        if (mCursor) log << ", after=" << *mCursor;
        log << "\n";
    }

    const auto response = executeWithRetry(endpoint->second, accessToken, variables);
    ++mStats.totalRequests;

    mThrottle.observeResponse(response, log);

    const auto errors = extractGraphqlErrors(response);
    for (const auto& err : errors) {
        log << "[GraphQLSource] error: GraphQL: " << err << "\n";
    }
    if (!response.contains("data") || response["data"].is_null()) {
        mCursor.reset();
        throw std::runtime_error("GraphQL response carried no data (" +
                                 std::to_string(errors.size()) + " errors)");
    }

    PageResult page;
    try {
        page = parseRecordsPage(response);
    } catch (const std::exception& e) {
        mCursor.reset();
        throw std::runtime_error(std::string("Failed to parse page: ") + e.what());
    }

    if (page.hasNextPage && page.lastCursor) {
        mCursor = page.lastCursor;
    } else {
        mCursor.reset();
    }

    FetchResult result;
    result.moreAvailable = page.hasNextPage;
    result.records       = std::move(page.records);
    return result;
}

// ---------------------------------------------------------------------------
// Retry wrapper
// ---------------------------------------------------------------------------

nlohmann::json GraphQLSourceAdapter::executeWithRetry(const std::string& endpoint,
                                                      const std::string& accessToken,
                                                      const nlohmann::json& variables)
{
    auto& log = *mOptions.log;
    std::string lastError;

    for (int attempt = 0; attempt < mOptions.maxAttempts; ++attempt) {
        if (attempt > 0) {
            ++mStats.totalRetries;
            const auto backoff = computeBackoffMs(attempt - 1);
            if (mOptions.verbose) {
                log << "[Retry] " << lastError << ", attempt " << (attempt + 1)
                    << "/" << mOptions.maxAttempts << ", backoff "
                    << backoff.count() << " ms\n";
            }
            mOptions.sleep(backoff);
        }

        GraphQLClient::Response resp;
        try {
            resp = mOptions.transport(endpoint, accessToken,
                                      queries::kRecordsQuery, variables);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(std::string("Invalid endpoint: ") + e.what());
        } catch (const std::runtime_error& e) {
            lastError = std::string("network error: ") + e.what();
            continue;
        }

        if (resp.httpStatus == 401 || resp.httpStatus == 403) {
            throw ConfigurationError("Credentials rejected for service '" +
                                     type() + "': HTTP " +
                                     std::to_string(resp.httpStatus));
        }
        if (isRetryableStatus(resp.httpStatus)) {
            lastError = "HTTP " + std::to_string(resp.httpStatus);
            continue;
        }
        if (resp.httpStatus < 200 || resp.httpStatus > 299) {
            throw std::runtime_error("HTTP request failed for service '" +
                                     type() + "': " +
                                     std::to_string(resp.httpStatus));
        }
        return resp.body;
    }

    throw std::runtime_error("Max retries exceeded.  Last error: " + lastError);
}

bool GraphQLSourceAdapter::isRetryableStatus(unsigned int status) {
    return status == 429 || status >= 500;
}

} // namespace app_poller
