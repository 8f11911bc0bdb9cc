#include "service_registry.hpp"
#include <stdexcept>
#include <unordered_set>

namespace {

std::vector<ServiceEntry> checked(std::vector<ServiceEntry> entries) {
    std::unordered_set<std::string> seen;
    for (const auto& entry : entries) {
        if (entry.name.empty()) {
            throw std::invalid_argument("Service name cannot be empty");
        }
        if (entry.url.empty()) {
            throw std::invalid_argument("URL for service '" + entry.name + "' cannot be empty");
        }
        if (!seen.insert(entry.name).second) {
            throw std::invalid_argument("Duplicate service name: " + entry.name);
        }
    }
    return entries;
}

} // namespace

ServiceRegistry::ServiceRegistry(std::vector<ServiceEntry> entries)
    : entries_(checked(std::move(entries))) {}

