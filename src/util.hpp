#pragma once

#include "models.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace app_poller {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path plus query (e.g. "/graphql")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input or a non-HTTP scheme.
UrlParts parseUrl(const std::string& url);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs = 200,
                                           int64_t maxMs  = 5000);

/// Parse an ISO-8601 date-time ("2024-01-01T00:00:00Z", optional fraction,
/// "Z" or "+HH:MM" offset) into epoch seconds.  Fractions are truncated.
/// Throws std::invalid_argument on malformed input.
Timestamp parseIso8601(const std::string& text);

/// Format epoch seconds as "YYYY-MM-DDTHH:MM:SSZ".
std::string formatIso8601(Timestamp ts);

/// Human-readable seconds with millisecond resolution, e.g. "5.012".
std::string formatSeconds(std::chrono::nanoseconds d);

} // namespace app_poller
