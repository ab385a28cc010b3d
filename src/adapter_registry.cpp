#include "adapter_registry.hpp"
#include "errors.hpp"
#include "graphql_adapter.hpp"

#include <stdexcept>
#include <utility>

namespace app_poller {

void AdapterRegistry::registerAdapter(const std::string& type, Factory factory) {
    if (type.empty()) {
        throw std::invalid_argument("Adapter type must not be empty");
    }
    if (!factory) {
        throw std::invalid_argument("Null factory for adapter type: " + type);
    }
    if (!mFactories.emplace(type, std::move(factory)).second) {
        throw std::invalid_argument("Adapter type registered twice: " + type);
    }
}

bool AdapterRegistry::contains(const std::string& type) const {
    return mFactories.count(type) != 0;
}

std::vector<std::string> AdapterRegistry::types() const {
    std::vector<std::string> out;
    out.reserve(mFactories.size());
    for (const auto& entry : mFactories) {
        out.push_back(entry.first);
    }
    return out;
}

std::unique_ptr<SourceAdapter> AdapterRegistry::create(const JobConfig& job) const {
    if (job.sourceType.empty()) {
        throw ConfigurationError("The 'type' is not defined in the config.");
    }

    const auto it = mFactories.find(job.sourceType);
    if (it == mFactories.end()) {
        throw ConfigurationError("App integration does not exist for type: " +
                                 job.sourceType);
    }
    return it->second(job);
}

void registerBuiltinAdapters(AdapterRegistry& registry, bool verbose) {
    registry.registerAdapter(
        GraphQLSourceAdapter::kType,
        [verbose](const JobConfig&) -> std::unique_ptr<SourceAdapter> {
            GraphQLSourceAdapter::Options opts;
            opts.verbose = verbose;
            return std::make_unique<GraphQLSourceAdapter>(opts);
        });
}

} // namespace app_poller
