#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "common/logging.h"
#include "doclinks/links/link_extractor.h"
#include "test_doc_tree.h"

using namespace DocLinks;

class LinkExtractorTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        initTestLogging("link_extractor");
    }

    void TearDown() override {
        Common::shutdownLogging();
    }

    std::vector<std::string> extract(const std::string& line) {
        std::vector<std::string> targets;
        const size_t n = extractLinks(line, ".md", &targets);
        EXPECT_EQ(n, targets.size());
        return targets;
    }
};

TEST_F(LinkExtractorTestBase, MultipleLinksLeftToRight) {
    // === GIVEN (Input Contract) ===
    const std::string line = "See [setup](setup.md), [API](../api/reference.md#auth) and [top](#overview).";

    // === WHEN ===
    const std::vector<std::string> targets = extract(line);

    // === THEN (Output Contract) ===
    const std::vector<std::string> expected = {"setup.md", "../api/reference.md#auth", "#overview"};
    EXPECT_EQ(targets, expected);
    LOG_INFO("PASS: %zu links extracted", targets.size());
}

TEST_F(LinkExtractorTestBase, NonDocumentTargetsAreIgnored) {
    EXPECT_TRUE(extract("[site](https://example.com) [pic](diagram.png) [mail](mailto:a@b.c)").empty());
    EXPECT_TRUE(extract("No links here, just [brackets] and (parens).").empty());
    EXPECT_TRUE(extract("").empty());
}

TEST_F(LinkExtractorTestBase, ExternalDocumentLinksAreKept) {
    // Scheme links containing the extension are handed on; validation skips them
    const std::vector<std::string> targets = extract("[raw](https://example.com/docs/README.md)");
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0], "https://example.com/docs/README.md");
}

TEST_F(LinkExtractorTestBase, TitlesAndAngleBrackets) {
    const std::vector<std::string> targets =
        extract("[a](guide.md \"The Guide\") [b](<with space.md>) [c](  padded.md  )");

    const std::vector<std::string> expected = {"guide.md", "with space.md", "padded.md"};
    EXPECT_EQ(targets, expected);
}

TEST_F(LinkExtractorTestBase, NestedBracketsInLinkText) {
    const std::vector<std::string> targets =
        extract("[![badge](badge.svg)](status.md) and [see [note]](notes.md)");

    const std::vector<std::string> expected = {"status.md", "notes.md"};
    EXPECT_EQ(targets, expected);
}

TEST_F(LinkExtractorTestBase, UnterminatedLinksStopExtraction) {
    EXPECT_EQ(extract("[ok](ok.md) then [broken](never-closed.md"), std::vector<std::string>{"ok.md"});
    EXPECT_TRUE(extract("[dangling text without close").empty());
}

TEST_F(LinkExtractorTestBase, ReferenceStyleLinksAreNotExtracted) {
    EXPECT_TRUE(extract("[guide][ref]").empty());
    EXPECT_TRUE(extract("[ref]: guide.md").empty());
}

TEST_F(LinkExtractorTestBase, CustomExtension) {
    std::vector<std::string> targets;
    EXPECT_EQ(extractLinks("[a](a.rst) [b](b.md) [c](#c)", ".rst", &targets), 2u);
    const std::vector<std::string> expected = {"a.rst", "#c"};
    EXPECT_EQ(targets, expected);
}

// Main function for running tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
