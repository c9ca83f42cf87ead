#ifndef LSHD_CATALOG_HPP
#define LSHD_CATALOG_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include "dev.hpp"

struct CatalogEntry {
    std::string shortPath;
    uint64_t sizeBytes;

    bool operator<(const CatalogEntry& other) const;
    bool operator==(const CatalogEntry& other) const;
};

struct ExclusionRule {
    std::function<bool(const Device&, const BlockDeviceEnumerator&)> matches;
    const char* reason;
};

// Exclusion rules in evaluation order. The first match excludes the device.
const std::vector<ExclusionRule>& exclusionRules();

// Returns the first rule excluding the device, or nullptr if it is kept.
const ExclusionRule* findExclusion(const Device& device, const BlockDeviceEnumerator& enumerator);

bool classify(const Device& device, const BlockDeviceEnumerator& enumerator);

std::string shortenPath(const std::string& path);

// Enumerates, filters, deduplicates and sorts by short path.
// EnumerationError from the enumerator propagates unchanged.
std::vector<CatalogEntry> buildCatalog(BlockDeviceEnumerator& enumerator, bool verbose = false);

#endif
