#pragma once

#include <nlohmann/json.hpp>

#include <iostream>
#include <ostream>
#include <string>

namespace app_poller {

/// Synchronous GraphQL-over-HTTP client built on Boost.Beast.
/// One connection per request; HTTPS needs a build with OpenSSL.
class GraphQLClient {
public:
    struct Response {
        unsigned int   httpStatus = 0;
        nlohmann::json body;
    };

    struct Options {
        std::string   tokenHeader = "X-Shopify-Access-Token";
        int           timeoutMs   = 5000;
        bool          verbose     = false;
        std::ostream* log         = &std::cerr;
    };

    /// @param endpoint     Full URL, e.g. "http://localhost:4000/graphql"
    /// @param accessToken  Sent in Options::tokenHeader when non-empty.
    /// Throws std::invalid_argument for a malformed endpoint and
    /// std::runtime_error for HTTPS without SSL support.
    GraphQLClient(const std::string& endpoint,
                  const std::string& accessToken,
                  Options options);

    GraphQLClient(const std::string& endpoint, const std::string& accessToken)
        : GraphQLClient(endpoint, accessToken, Options{}) {}

    /// POST {"query": ..., "variables": ...}.
    /// @throws std::runtime_error on network / timeout / parse errors.
    Response execute(const std::string& query,
                     const nlohmann::json& variables = nlohmann::json::object());

private:
    std::string mHost;
    std::string mPort;
    std::string mTarget;
    std::string mAccessToken;
    Options     mOptions;
    bool        mUseSsl = false;

    Response doHttpRequest(const std::string& requestBody);
    Response doHttpsRequest(const std::string& requestBody);
};

} // namespace app_poller
