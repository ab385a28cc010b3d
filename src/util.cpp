#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace app_poller {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t  era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t  era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp  = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

int readDigits(const std::string& text, std::size_t pos, std::size_t count) {
    if (pos + count > text.size()) {
        throw std::invalid_argument("Truncated ISO-8601 timestamp: " + text);
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

void expectChar(const std::string& text, std::size_t pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// URLs
// ---------------------------------------------------------------------------

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    std::transform(parts.scheme.begin(), parts.scheme.end(),
                   parts.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }

    const auto hostStart = schemeEnd + 3;
    const auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority = url.substr(hostStart, pathStart == std::string::npos
                                                      ? std::string::npos
                                                      : pathStart - hostStart);
    parts.target = pathStart == std::string::npos ? "/" : url.substr(pathStart);
    if (parts.target.front() == '?') {
        parts.target.insert(0, "/");
    }

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty()) {
            throw std::invalid_argument("Invalid URL (empty port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

// ---------------------------------------------------------------------------
// Backoff
// ---------------------------------------------------------------------------

std::chrono::milliseconds computeBackoffMs(int attempt, int64_t baseMs, int64_t maxMs) {
    // base * 2^attempt, clamped before the shift can overflow.
    int64_t backoff = maxMs;
    if (attempt < 31) {
        backoff = std::min(baseMs * (int64_t{1} << attempt), maxMs);
    }

    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> jitter(0, 100);
    return std::chrono::milliseconds(backoff + jitter(rng));
}

// ---------------------------------------------------------------------------
// Timestamps
// ---------------------------------------------------------------------------

Timestamp parseIso8601(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS
    const int year = readDigits(text, 0, 4);
    expectChar(text, 4, '-');
    const int month = readDigits(text, 5, 2);
    expectChar(text, 7, '-');
    const int day = readDigits(text, 8, 2);
    if (text.size() <= 10 || (text[10] != 'T' && text[10] != 't' && text[10] != ' ')) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }
    const int hour = readDigits(text, 11, 2);
    expectChar(text, 13, ':');
    const int minute = readDigits(text, 14, 2);
    expectChar(text, 16, ':');
    const int second = readDigits(text, 17, 2);

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        throw std::invalid_argument("ISO-8601 field out of range: " + text);
    }

    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        const std::size_t fracStart = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos == fracStart) {
            throw std::invalid_argument("Invalid ISO-8601 fraction: " + text);
        }
    }

    int64_t offsetSeconds = 0;
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            const int oh = readDigits(text, pos + 1, 2);
            std::size_t next = pos + 3;
            if (next < text.size() && text[next] == ':') {
                ++next;
            }
            const int om = readDigits(text, next, 2);
            offsetSeconds = (oh * 3600 + om * 60) * (zone == '-' ? -1 : 1);
            pos = next + 2;
        }
        if (pos != text.size()) {
            throw std::invalid_argument("Trailing characters in ISO-8601 timestamp: " + text);
        }
    }

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month),
                                       static_cast<unsigned>(day));
    return days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;
}

std::string formatIso8601(Timestamp ts) {
    int64_t days = ts / 86400;
    int64_t secs = ts % 86400;
    if (secs < 0) {
        secs += 86400;
        --days;
    }

    int64_t  year  = 0;
    unsigned month = 0;
    unsigned day   = 0;
    civilFromDays(days, year, month, day);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                  static_cast<long long>(year), month, day,
                  static_cast<long long>(secs / 3600),
                  static_cast<long long>((secs % 3600) / 60),
                  static_cast<long long>(secs % 60));
    return buf;
}

std::string formatSeconds(std::chrono::nanoseconds d) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    const long long whole = static_cast<long long>(ms / 1000);
    const long long frac  = static_cast<long long>(ms % 1000);

    char buf[40];
    if (ms < 0) {
        std::snprintf(buf, sizeof(buf), "-%lld.%03lld", -whole, -frac);
    } else {
        std::snprintf(buf, sizeof(buf), "%lld.%03lld", whole, frac);
    }
    return buf;
}

} // namespace app_poller
