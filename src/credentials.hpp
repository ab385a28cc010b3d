#pragma once

#include "models.hpp"

#include <set>
#include <string>

namespace app_poller {

/// Required keys that are absent from @p supplied, in sorted order.
std::set<std::string> missingCredentialKeys(const Credentials& supplied,
                                            const std::set<std::string>& required);

/// Check @p supplied against the keys a source requires.
/// Throws ConfigurationError naming every missing key, an empty map
/// included.  @p serviceType only labels the message.
void validateCredentials(const Credentials& supplied,
                         const std::set<std::string>& required,
                         const std::string& serviceType);

} // namespace app_poller
