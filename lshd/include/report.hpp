#ifndef LSHD_REPORT_HPP
#define LSHD_REPORT_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "catalog.hpp"

enum class ReportFormat {
    TEXT,
    JSON
};

// "<shortPath> <sizeBytes>\n" per entry, no header.
std::string formatCatalogText(const std::vector<CatalogEntry>& catalog);

nlohmann::json catalogToJson(const std::vector<CatalogEntry>& catalog);

std::string formatCatalog(const std::vector<CatalogEntry>& catalog, ReportFormat format);

#endif
