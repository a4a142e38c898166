#include <gtest/gtest.h>
#include <cstdio>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "common/logging.h"
#include "doclinks/report/report_writer.h"
#include "test_doc_tree.h"

using namespace DocLinks;

class ReportWriterTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        initTestLogging("report_writer");
    }

    void TearDown() override {
        Common::shutdownLogging();
    }

    static auto makeArea(const std::string& name, uint32_t valid, uint32_t broken) -> AreaResult {
        AreaResult area;
        area.name = name;
        area.stats.total_files = 2;
        area.stats.total_links = valid + broken;
        area.stats.valid_links = valid;
        area.stats.broken_links = broken;
        area.stats.internal_links = valid + broken;
        area.stats.valid_internal = valid;
        for (uint32_t i = 0; i < broken; ++i) {
            area.broken.push_back(Finding{"/docs/" + name + "/page.md", i + 1, "missing.md", "file_not_found", 0});
        }
        return area;
    }

    template<typename Write>
    static auto capture(Write&& write) -> std::string {
        FILE* out = std::tmpfile();
        EXPECT_NE(out, nullptr);
        if (!out) {
            return {};
        }
        write(out);
        std::rewind(out);
        std::string content;
        char buffer[1024];
        size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), out)) > 0) {
            content.append(buffer, n);
        }
        std::fclose(out);
        return content;
    }
};

TEST_F(ReportWriterTestBase, SingleAreaJsonDocument) {
    // === GIVEN (Input Contract) ===
    AreaResult area = makeArea("guide", 8, 2);
    area.stats.warnings = 1;
    area.stats.deep_path_warnings = 1;
    area.warnings.push_back(Finding{"/docs/guide/a.md", 4, "b.md#x", "anchor_not_found", 0});
    area.deep_paths.push_back(Finding{"/docs/guide/a.md", 9, "../../../../../../c.md", "", 6});

    // === WHEN ===
    const std::string json = ReportWriter::toJson({area});

    // === THEN (Output Contract) ===
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError()) << json;
    ASSERT_TRUE(doc.IsObject());

    const auto& summary = doc["summary"];
    EXPECT_STREQ(summary["area"].GetString(), "guide");
    EXPECT_EQ(summary["total_files"].GetUint(), 2u);
    EXPECT_EQ(summary["total_links"].GetUint(), 10u);
    EXPECT_EQ(summary["valid_links"].GetUint(), 8u);
    EXPECT_EQ(summary["broken_links"].GetUint(), 2u);
    EXPECT_EQ(summary["warnings"].GetUint(), 1u);
    EXPECT_EQ(summary["success_rate"].GetUint(), 80u);

    ASSERT_TRUE(doc["broken_links"].IsArray());
    ASSERT_EQ(doc["broken_links"].Size(), 2u);
    EXPECT_STREQ(doc["broken_links"][0]["type"].GetString(), "file_not_found");
    EXPECT_EQ(doc["broken_links"][1]["line"].GetUint(), 2u);

    ASSERT_EQ(doc["warnings"].Size(), 1u);
    EXPECT_STREQ(doc["warnings"][0]["type"].GetString(), "anchor_not_found");

    ASSERT_EQ(doc["deep_paths"].Size(), 1u);
    EXPECT_EQ(doc["deep_paths"][0]["depth"].GetUint(), 6u);
    EXPECT_FALSE(doc["deep_paths"][0].HasMember("type"));
    LOG_INFO("PASS: single area JSON parsed back");
}

TEST_F(ReportWriterTestBase, JsonEscapesLinkText) {
    AreaResult area = makeArea("docs", 0, 0);
    area.stats.total_links = 1;
    area.stats.broken_links = 1;
    const std::string nasty = "say \"hi\"\\back\nslash\t.md";
    area.broken.push_back(Finding{"/docs/q\"uote.md", 1, nasty, "file_not_found", 0});

    const std::string json = ReportWriter::toJson({area});

    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError()) << json;
    EXPECT_EQ(std::string(doc["broken_links"][0]["link"].GetString()), nasty);
    EXPECT_EQ(std::string(doc["broken_links"][0]["file"].GetString()), "/docs/q\"uote.md");
    EXPECT_EQ(json.find('\n' + std::string("slash")), std::string::npos) << "Raw newline must be escaped";
}

TEST_F(ReportWriterTestBase, MultiAreaJsonUsesAreasArray) {
    const std::string json = ReportWriter::toJson({makeArea("guide", 5, 0), makeArea("api", 3, 1)});

    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError()) << json;
    ASSERT_TRUE(doc.HasMember("areas"));
    ASSERT_EQ(doc["areas"].Size(), 2u);
    EXPECT_STREQ(doc["areas"][0]["summary"]["area"].GetString(), "guide");
    EXPECT_STREQ(doc["areas"][1]["summary"]["area"].GetString(), "api");
    EXPECT_EQ(doc["areas"][1]["broken_links"].Size(), 1u);
}

TEST_F(ReportWriterTestBase, EmptyAreaSuccessRateIsZero) {
    AreaResult area;
    area.name = "empty";

    rapidjson::Document doc;
    doc.Parse(ReportWriter::toJson({area}).c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["summary"]["total_links"].GetUint(), 0u);
    EXPECT_EQ(doc["summary"]["success_rate"].GetUint(), 0u);
}

TEST_F(ReportWriterTestBase, TextSummaryLines) {
    // === GIVEN ===
    const ReportWriter writer(makePalette(false));
    RunStatistics stats;
    stats.total_files = 3;
    stats.total_links = 10;
    stats.valid_links = 9;
    stats.broken_links = 1;
    stats.internal_links = 8;
    stats.external_links = 2;
    stats.valid_internal = 7;
    stats.valid_external = 2;
    stats.warnings = 2;
    stats.batch_fixes = 1;

    // === WHEN ===
    const std::string text = capture([&](FILE* out) { writer.writeTextSummary(out, stats); });

    // === THEN ===
    EXPECT_NE(text.find("Total files scanned: 3\n"), std::string::npos);
    EXPECT_NE(text.find("Total links found: 10\n"), std::string::npos);
    EXPECT_NE(text.find("  Internal links: 8\n"), std::string::npos);
    EXPECT_NE(text.find("  External links: 2\n"), std::string::npos);
    EXPECT_NE(text.find("Valid links: 9\n"), std::string::npos);
    EXPECT_NE(text.find("  Internal valid: 7\n"), std::string::npos);
    EXPECT_NE(text.find("Broken links: 1\n"), std::string::npos);
    EXPECT_NE(text.find("Warnings: 2\n"), std::string::npos);
    EXPECT_NE(text.find("Batch fixes: 1\n"), std::string::npos);
    EXPECT_NE(text.find("Success rate: 90%\n"), std::string::npos);
    EXPECT_EQ(text.find("Auto-TODO fixes"), std::string::npos) << "Zero counters are omitted";
    EXPECT_EQ(text.find("Deep path warnings"), std::string::npos);
}

TEST_F(ReportWriterTestBase, HeaderAndMultiAreaSummary) {
    const ReportWriter writer(makePalette(false));

    const std::string header = capture([&](FILE* out) { writer.writeHeader(out, "guide"); });
    EXPECT_NE(header.find("Link Validation Report - guide\n"), std::string::npos);

    const std::vector<AreaResult> areas = {makeArea("guide", 5, 0), makeArea("api", 3, 2), makeArea("ops", 1, 1)};
    uint32_t failed = 0;
    const std::string summary = capture([&](FILE* out) { failed = writer.writeMultiAreaSummary(out, areas); });

    EXPECT_EQ(failed, 2u);
    EXPECT_NE(summary.find("Areas validated: 3\n"), std::string::npos);
    EXPECT_NE(summary.find("Areas with errors: 2\n"), std::string::npos);
    EXPECT_NE(summary.find("Total broken links: 3\n"), std::string::npos);
    EXPECT_NE(summary.find("2 area(s) have broken links"), std::string::npos);

    const std::string ok = capture([&](FILE* out) { writer.writeAreaResult(out, areas[0]); });
    EXPECT_NE(ok.find("All 5 links valid"), std::string::npos);
}

TEST_F(ReportWriterTestBase, ColourPaletteWrapsStatusLines) {
    const ReportWriter writer(makePalette(true));
    const std::string line = capture([&](FILE* out) { writer.writeAreaResult(out, makeArea("api", 1, 1)); });

    EXPECT_NE(line.find("\033[0;31m"), std::string::npos);
    EXPECT_NE(line.find("1 broken links\033[0m"), std::string::npos);
}

// Main function for running tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
