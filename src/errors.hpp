#pragma once

#include <stdexcept>
#include <string>

namespace app_poller {

/// Fatal configuration problem: missing credentials, unknown job type, ...
/// Always surfaced to the caller of BoundedPoller::run().
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace app_poller
