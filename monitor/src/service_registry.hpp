#pragma once

#include "types.hpp"
#include <string>
#include <vector>

// Immutable name -> url mapping, iterated in configuration order
class ServiceRegistry {
public:
    using const_iterator = std::vector<ServiceEntry>::const_iterator;

    // Throws std::invalid_argument on an empty name/url or a duplicate name
    explicit ServiceRegistry(std::vector<ServiceEntry> entries);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    const std::vector<ServiceEntry> entries_;
};
