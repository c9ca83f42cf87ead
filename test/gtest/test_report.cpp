#include <gtest/gtest.h>
#include "report.hpp"

TEST(Report, TextIsOneLinePerEntry) {
    std::vector<CatalogEntry> catalog = {{"sda", 2000}, {"sdb", 1000}};

    EXPECT_EQ(formatCatalog(catalog, ReportFormat::TEXT), "sda 2000\nsdb 1000\n");
}

TEST(Report, JsonKeepsOrderAndFullSize) {
    std::vector<CatalogEntry> catalog = {{"nvme0n1", 2000398934016ULL}, {"sda", 500107862016ULL}};

    nlohmann::json j = catalogToJson(catalog);

    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["name"], "nvme0n1");
    EXPECT_EQ(j[0]["size"].get<uint64_t>(), 2000398934016ULL);
    EXPECT_EQ(j[1]["name"], "sda");
    EXPECT_EQ(formatCatalog(catalog, ReportFormat::JSON),
              "[{\"name\":\"nvme0n1\",\"size\":2000398934016},"
              "{\"name\":\"sda\",\"size\":500107862016}]\n");
}

TEST(Report, EmptyCatalog) {
    std::vector<CatalogEntry> catalog;

    EXPECT_EQ(formatCatalog(catalog, ReportFormat::TEXT), "");
    EXPECT_EQ(formatCatalog(catalog, ReportFormat::JSON), "[]\n");
}
