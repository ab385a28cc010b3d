#pragma once

#include "models.hpp"
#include "source_adapter.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace app_poller {

/// Maps a job's declared source type to a constructor for its adapter.
/// Populated once at process start; lookups never mutate it.
class AdapterRegistry {
public:
    using Factory = std::function<std::unique_ptr<SourceAdapter>(const JobConfig&)>;

    /// Throws std::invalid_argument if @p type is empty or already present.
    void registerAdapter(const std::string& type, Factory factory);

    bool contains(const std::string& type) const;

    /// Sorted list of registered types.
    std::vector<std::string> types() const;

    /// Build the adapter for @p job.sourceType.
    /// Throws ConfigurationError when the type is missing or unknown.
    std::unique_ptr<SourceAdapter> create(const JobConfig& job) const;

private:
    std::map<std::string, Factory> mFactories;
};

/// Register every adapter compiled into this binary.
void registerBuiltinAdapters(AdapterRegistry& registry, bool verbose = false);

} // namespace app_poller
