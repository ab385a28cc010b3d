#include "credentials.hpp"
#include "errors.hpp"

namespace app_poller {

std::set<std::string> missingCredentialKeys(const Credentials& supplied,
                                            const std::set<std::string>& required)
{
    std::set<std::string> missing;
    for (const auto& key : required) {
        if (supplied.find(key) == supplied.end()) {
            missing.insert(key);
        }
    }
    return missing;
}

void validateCredentials(const Credentials& supplied,
                         const std::set<std::string>& required,
                         const std::string& serviceType)
{
    if (required.empty()) return;

    const auto missing = missingCredentialKeys(supplied, required);
    if (missing.empty()) return;

    std::string names;
    for (const auto& key : missing) {
        if (!names.empty()) names += ", ";
        names += "'" + key + "'";
    }
    throw ConfigurationError("Auth config for service '" + serviceType +
                             "' is missing the following required keys: " +
                             names);
}

} // namespace app_poller
