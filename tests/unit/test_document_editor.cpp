#include <gtest/gtest.h>
#include <filesystem>
#include <string>

#include "common/logging.h"
#include "doclinks/links/document_editor.h"
#include "test_doc_tree.h"

using namespace DocLinks;

class DocumentEditorTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        initTestLogging("document_editor");
    }

    void TearDown() override {
        Common::shutdownLogging();
    }

    DocTree tree_;
    DocumentEditor editor_;
};

TEST_F(DocumentEditorTestBase, ReplaceLinkTargetTouchesOnlyThatLine) {
    // === GIVEN (Input Contract) ===
    const std::string doc = tree_.write("page.md",
        "[a](../old/path/b.md)\n"
        "[b](../old/path/b.md) and [c](old/path/c.md)\n"
        "trailing line\n");

    // === WHEN ===
    const bool ok = editor_.replaceLinkTarget(doc, 2, "../old/path/b.md", "../new/path/b.md");

    // === THEN (Output Contract) ===
    ASSERT_TRUE(ok);
    EXPECT_EQ(tree_.read("page.md"),
        "[a](../old/path/b.md)\n"
        "[b](../new/path/b.md) and [c](old/path/c.md)\n"
        "trailing line\n");
    EXPECT_FALSE(std::filesystem::exists(doc + ".doclinks.tmp"));
    LOG_INFO("PASS: only the link on line 2 rewritten");
}

TEST_F(DocumentEditorTestBase, ReplaceLinkTargetKeepsMatchingLinkText) {
    // === GIVEN ===
    const std::string doc = tree_.write("same.md",
        "See [../old/path/FILE.md](../old/path/FILE.md) here, ../old/path/FILE.md too\n");

    // === WHEN ===
    const bool ok = editor_.replaceLinkTarget(doc, 1, "../old/path/FILE.md", "../new/path/FILE.md");

    // === THEN ===
    ASSERT_TRUE(ok);
    EXPECT_EQ(tree_.read("same.md"),
        "See [../old/path/FILE.md](../new/path/FILE.md) here, ../old/path/FILE.md too\n");
}

TEST_F(DocumentEditorTestBase, ReplaceLinkTargetKeepsTitleAndBrackets) {
    const std::string doc = tree_.write("title.md",
        "[a](<old.md> \"Old\") [b](old.md.bak)\n");

    ASSERT_TRUE(editor_.replaceLinkTarget(doc, 1, "old.md", "new.md"));
    EXPECT_EQ(tree_.read("title.md"), "[a](<new.md> \"Old\") [b](old.md.bak)\n");
}

TEST_F(DocumentEditorTestBase, ReplacementIsLiteral) {
    const std::string doc = tree_.write("meta.md", "[x](a.b/*[c]^$.md)\n");

    ASSERT_TRUE(editor_.replaceLinkTarget(doc, 1, "a.b/*[c]^$.md", "fixed.md"));
    EXPECT_EQ(tree_.read("meta.md"), "[x](fixed.md)\n");

    // '&' and backslashes in the replacement are copied as-is
    ASSERT_TRUE(editor_.replaceLinkTarget(doc, 1, "fixed.md", "a&b\\c.md"));
    EXPECT_EQ(tree_.read("meta.md"), "[x](a&b\\c.md)\n");
}

TEST_F(DocumentEditorTestBase, LineEndingsArePreserved) {
    const std::string doc = tree_.write("crlf.md", "first\r\n[x](old.md)\r\n[y](last.md)");

    ASSERT_TRUE(editor_.replaceLinkTarget(doc, 2, "old.md", "new.md"));
    EXPECT_EQ(tree_.read("crlf.md"), "first\r\n[x](new.md)\r\n[y](last.md)");

    ASSERT_TRUE(editor_.replaceLinkTarget(doc, 3, "last.md", "end.md"));
    EXPECT_EQ(tree_.read("crlf.md"), "first\r\n[x](new.md)\r\n[y](end.md)");
}

TEST_F(DocumentEditorTestBase, FailedEditsLeaveFileUntouched) {
    const std::string original = "[one](one.md)\nline two mentions two.md\n";
    const std::string doc = tree_.write("keep.md", original);

    EXPECT_FALSE(editor_.replaceLinkTarget(doc, 1, "absent.md", "x.md"));
    EXPECT_FALSE(editor_.replaceLinkTarget(doc, 2, "two.md", "x.md")) << "Plain text is not a link";
    EXPECT_FALSE(editor_.replaceLinkTarget(doc, 9, "one.md", "x.md")) << "Line past end of file";
    EXPECT_FALSE(editor_.replaceLinkTarget(doc, 1, "", "x.md")) << "Empty target";
    EXPECT_FALSE(editor_.replaceLinkTarget(tree_.path("missing.md"), 1, "a.md", "b.md"));

    EXPECT_EQ(tree_.read("keep.md"), original);
    EXPECT_FALSE(std::filesystem::exists(doc + ".doclinks.tmp"));
}

TEST_F(DocumentEditorTestBase, ReplaceLinkMarkup) {
    // === GIVEN ===
    const std::string doc = tree_.write("todo.md",
        "Intro\n"
        "Read [the setup guide](setup.md \"Setup\") and [faq](faq.md).\n");

    // === WHEN ===
    const bool ok = editor_.replaceLinkMarkup(doc, 2, "setup.md", "`setup.md` (TODO: to create)");

    // === THEN ===
    ASSERT_TRUE(ok);
    EXPECT_EQ(tree_.read("todo.md"),
        "Intro\n"
        "Read `setup.md` (TODO: to create) and [faq](faq.md).\n");
}

TEST_F(DocumentEditorTestBase, FindLinkMarkupNeedsExactTarget) {
    size_t begin = 0;
    size_t end = 0;

    const std::string line = "[long](setup.md.bak) [nested [text]](setup.md) tail";
    ASSERT_TRUE(DocumentEditor::findLinkMarkup(line, "setup.md", &begin, &end));
    EXPECT_EQ(line.substr(begin, end - begin), "[nested [text]](setup.md)");

    EXPECT_TRUE(DocumentEditor::findLinkMarkup("[a](<setup.md>)", "setup.md", &begin, &end));
    EXPECT_FALSE(DocumentEditor::findLinkMarkup("[a](other.md)", "setup.md", &begin, &end));
    EXPECT_FALSE(DocumentEditor::findLinkMarkup("plain setup.md text", "setup.md", &begin, &end));
}

// Main function for running tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
