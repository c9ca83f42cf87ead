#include "include/report.hpp"
#include <sstream>

std::string formatCatalogText(const std::vector<CatalogEntry>& catalog) {
    std::stringstream ss;
    for (const CatalogEntry& entry : catalog) {
        ss << entry.shortPath << " " << entry.sizeBytes << "\n";
    }
    return ss.str();
}

nlohmann::json catalogToJson(const std::vector<CatalogEntry>& catalog) {
    nlohmann::json j = nlohmann::json::array();

    for (const CatalogEntry& entry : catalog) {
        j.push_back({
            {"name", entry.shortPath},
            {"size", entry.sizeBytes}
        });
    }
    return j;
}

std::string formatCatalog(const std::vector<CatalogEntry>& catalog, ReportFormat format) {
    if (format == ReportFormat::JSON)
        return catalogToJson(catalog).dump() + "\n";
    return formatCatalogText(catalog);
}
