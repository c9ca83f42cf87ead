#include "include/catalog.hpp"
#include <iostream>
#include <set>

#define DEV_PREFIX     "/dev/"
#define OPTICAL_PREFIX "/dev/sr"
#define ZRAM_PREFIX    "/dev/zram"
#define MD_PREFIX      "/dev/md"

static bool hasPrefix(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool CatalogEntry::operator<(const CatalogEntry& other) const {
    if (shortPath != other.shortPath)
        return shortPath < other.shortPath;
    return sizeBytes < other.sizeBytes;
}

bool CatalogEntry::operator==(const CatalogEntry& other) const {
    return shortPath == other.shortPath && sizeBytes == other.sizeBytes;
}

const std::vector<ExclusionRule>& exclusionRules() {
    static const std::vector<ExclusionRule> rules = {
        {[](const Device& d, const BlockDeviceEnumerator& e) { return !e.isBlockDevice(d.path); },
         "not a block device"},
        {[](const Device& d, const BlockDeviceEnumerator&) { return d.type == DeviceType::DEVICE_MAPPER; },
         "device-mapper device"},
        {[](const Device& d, const BlockDeviceEnumerator&) { return hasPrefix(d.path, OPTICAL_PREFIX); },
         "optical drive"},
        {[](const Device& d, const BlockDeviceEnumerator&) { return hasPrefix(d.path, ZRAM_PREFIX); },
         "compressed RAM disk"},
        {[](const Device& d, const BlockDeviceEnumerator&) { return hasPrefix(d.path, MD_PREFIX); },
         "software RAID device"},
    };
    return rules;
}

const ExclusionRule* findExclusion(const Device& device, const BlockDeviceEnumerator& enumerator) {
    for (const ExclusionRule& rule : exclusionRules()) {
        if (rule.matches(device, enumerator))
            return &rule;
    }
    return nullptr;
}

bool classify(const Device& device, const BlockDeviceEnumerator& enumerator) {
    return findExclusion(device, enumerator) == nullptr;
}

std::string shortenPath(const std::string& path) {
    if (hasPrefix(path, DEV_PREFIX))
        return path.substr(sizeof(DEV_PREFIX) - 1);
    return path;
}

std::vector<CatalogEntry> buildCatalog(BlockDeviceEnumerator& enumerator, bool verbose) {
    std::set<CatalogEntry> unique;

    for (const Device& dev : enumerator.getDevices()) {
        const ExclusionRule* rule = findExclusion(dev, enumerator);
        if (rule) {
            if (verbose)
                std::cerr << dev.path << ": excluded, " << rule->reason << "\n";
            continue;
        }
        if (verbose)
            std::cerr << dev.path << ": kept (" << deviceTypeName(dev.type) << ", "
                      << dev.sizeBytes << " bytes)\n";

        unique.insert({shortenPath(dev.path), dev.sizeBytes});
    }

    // The set orders equal paths by ascending size, so the last one wins
    std::vector<CatalogEntry> catalog;
    for (const CatalogEntry& entry : unique) {
        if (!catalog.empty() && catalog.back().shortPath == entry.shortPath) {
            std::cerr << "Warning: " << entry.shortPath << " reported with sizes "
                      << catalog.back().sizeBytes << " and " << entry.sizeBytes
                      << ", keeping the larger\n";
            catalog.back() = entry;
            continue;
        }
        catalog.push_back(entry);
    }
    return catalog;
}
