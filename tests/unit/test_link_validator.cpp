#include <gtest/gtest.h>
#include <atomic>
#include <string>

#include "common/logging.h"
#include "doclinks/anchors/anchor_index.h"
#include "doclinks/links/document_editor.h"
#include "doclinks/links/history_probe.h"
#include "doclinks/links/link_validator.h"
#include "doclinks/paths/path_resolver.h"
#include "test_doc_tree.h"

using namespace DocLinks;

namespace {

class FakeHistoryProbe final : public HistoryProbe {
public:
    explicit FakeHistoryProbe(Result result) : result_(result) {}

    auto lookup(const std::string& file_name) noexcept -> Result override {
        last_name_ = file_name;
        calls_.fetch_add(1);
        return result_;
    }

    Result result_;
    std::string last_name_;
    std::atomic<int> calls_{0};
};

} // namespace

class LinkValidatorTestBase : public ::testing::Test {
protected:
    LinkValidatorTestBase()
        : paths_(tree_.path("docs"), tree_.path("docs/guide")) {}

    void SetUp() override {
        initTestLogging("link_validator");
        source_ = tree_.write("docs/guide/setup/install.md",
            "# Installation\n"
            "## 2.5 Troubleshooting\n"
            "[index](../index.md)\n"
            "[api](../../api/reference.md#authentication)\n"
            "[moved](../old/path/FILE.md)\n"
            "[planned](roadmap.md \"Roadmap\") and more text\n");
        tree_.write("docs/guide/index.md", "# Guide\n## Overview\n");
        tree_.write("docs/api/reference.md", "# Reference\n## Authentication\n");
        tree_.write("docs/guide/new/path/FILE.md", "# File\n");
    }

    void TearDown() override {
        Common::shutdownLogging();
    }

    auto validate(uint32_t line, const std::string& link, HistoryProbe* history = nullptr) -> Verdict {
        LinkValidator validator(options_, paths_, &index_, history, &editor_);
        return validator.validate(source_, line, link);
    }

    DocTree tree_;
    PathResolver paths_;
    ValidatorOptions options_;
    AnchorIndex index_;
    DocumentEditor editor_;
    std::string source_;
};

TEST_F(LinkValidatorTestBase, InternalAndExternalTargets) {
    // === GIVEN (Input Contract) ===
    // area is docs/guide; docs/api lies outside it

    // === WHEN ===
    const Verdict internal = validate(3, "../index.md");
    const Verdict external = validate(4, "../../api/reference.md#authentication");

    // === THEN (Output Contract) ===
    EXPECT_EQ(internal.kind, VerdictKind::INTERNAL_VALID);
    EXPECT_TRUE(internal.internal);
    EXPECT_EQ(internal.resolved, tree_.path("docs/guide/index.md"));
    EXPECT_EQ(internal.depth, 1u);
    EXPECT_TRUE(internal.isValid());

    EXPECT_EQ(external.kind, VerdictKind::EXTERNAL_VALID);
    EXPECT_FALSE(external.internal);
    EXPECT_EQ(external.file_part, "../../api/reference.md");
    EXPECT_EQ(external.anchor, "#authentication");
    LOG_INFO("PASS: internal and external links classified");
}

TEST_F(LinkValidatorTestBase, SchemeLinksAreSkipped) {
    for (const char* link : {"https://example.com/a.md", "http://x/y.md", "ftp://host/f.md", "mailto:team@example.com"}) {
        const Verdict verdict = validate(1, link);
        EXPECT_EQ(verdict.kind, VerdictKind::EXTERNAL_VALID) << link;
        EXPECT_EQ(verdict.action, LinkAction::SKIPPED_EXTERNAL) << link;
        EXPECT_FALSE(verdict.internal) << link;
        EXPECT_TRUE(verdict.resolved.empty()) << link;
    }
    EXPECT_FALSE(LinkValidator::hasExternalScheme("https-notes.md"));
}

TEST_F(LinkValidatorTestBase, MissingFileIsBroken) {
    const Verdict verdict = validate(3, "../nowhere.md#intro");

    EXPECT_EQ(verdict.kind, VerdictKind::BROKEN);
    EXPECT_EQ(verdict.reason, BrokenReason::FILE_NOT_FOUND);
    EXPECT_STREQ(verdict.typeName(), "file_not_found");
    EXPECT_EQ(verdict.resolved, tree_.path("docs/guide/nowhere.md"));
    EXPECT_FALSE(verdict.isValid());
}

TEST_F(LinkValidatorTestBase, DirectoryTargetIsBroken) {
    const Verdict verdict = validate(3, "../new.md/");
    EXPECT_EQ(verdict.kind, VerdictKind::BROKEN);

    tree_.write("docs/guide/folder.md/child.md", "# Child\n");
    EXPECT_EQ(validate(3, "../folder.md").kind, VerdictKind::BROKEN) << "Only regular files count";
}

TEST_F(LinkValidatorTestBase, SelfAnchors) {
    EXPECT_EQ(validate(1, "#installation").kind, VerdictKind::INTERNAL_VALID);
    EXPECT_EQ(validate(1, "#25-troubleshooting").kind, VerdictKind::INTERNAL_VALID);
    EXPECT_EQ(validate(1, "#").kind, VerdictKind::INTERNAL_VALID);

    const Verdict missing = validate(1, "#uninstall");
    EXPECT_EQ(missing.kind, VerdictKind::BROKEN);
    EXPECT_EQ(missing.reason, BrokenReason::ANCHOR);
    EXPECT_STREQ(missing.typeName(), "anchor");
    EXPECT_EQ(missing.resolved, source_);
}

TEST_F(LinkValidatorTestBase, MissingAnchorInOtherFileIsWarning) {
    const Verdict verdict = validate(3, "../index.md#no-such-section");

    EXPECT_EQ(verdict.kind, VerdictKind::ANCHOR_WARNING);
    EXPECT_TRUE(verdict.isValid()) << "Warnings still count as valid";
    EXPECT_STREQ(verdict.typeName(), "anchor_not_found");

    EXPECT_EQ(validate(3, "../index.md#overview").kind, VerdictKind::INTERNAL_VALID);
    EXPECT_EQ(validate(3, "../index.md#").kind, VerdictKind::INTERNAL_VALID);
}

TEST_F(LinkValidatorTestBase, DeepPathFlagging) {
    tree_.write("docs/guide/setup/a/b/c/d/e/f/deep.md", "[x](../../../../../../../index.md)\n");
    const std::string deep = tree_.path("docs/guide/setup/a/b/c/d/e/f/deep.md");
    LinkValidator validator(options_, paths_, &index_, nullptr, &editor_);

    const Verdict six = validator.validate(deep, 1, "../../../../../../../index.md");
    EXPECT_EQ(six.depth, 7u);
    EXPECT_TRUE(six.deep_path);
    EXPECT_EQ(six.kind, VerdictKind::INTERNAL_VALID) << "Depth does not affect validity";

    const Verdict five = validator.validate(deep, 1, "../../../../../index.md");
    EXPECT_EQ(five.depth, 5u);
    EXPECT_FALSE(five.deep_path) << "Threshold is exclusive";

    options_.warn_deep_paths = false;
    const Verdict quiet = validator.validate(deep, 1, "../../../../../../../index.md");
    EXPECT_FALSE(quiet.deep_path);
}

TEST_F(LinkValidatorTestBase, BatchFixRewritesSourceLine) {
    // === GIVEN ===
    options_.fix_old = "old/path/";
    options_.fix_new = "new/path/";

    // === WHEN ===
    const Verdict verdict = validate(5, "../old/path/FILE.md");

    // === THEN ===
    EXPECT_EQ(verdict.kind, VerdictKind::INTERNAL_VALID);
    EXPECT_EQ(verdict.action, LinkAction::BATCH_FIXED);
    EXPECT_EQ(verdict.fixed_link, "../new/path/FILE.md");
    EXPECT_NE(tree_.read("docs/guide/setup/install.md").find("[moved](../new/path/FILE.md)"), std::string::npos);
    EXPECT_EQ(tree_.read("docs/guide/setup/install.md").find("old/path"), std::string::npos);
    LOG_INFO("PASS: batch fix applied to line 5");
}

TEST_F(LinkValidatorTestBase, BatchFixRewritesTargetNotLinkText) {
    // === GIVEN ===
    source_ = tree_.write("docs/guide/setup/same.md",
        "# Same\n"
        "\n"
        "See [../old/path/FILE.md](../old/path/FILE.md) here\n");
    options_.fix_old = "old/path/";
    options_.fix_new = "new/path/";

    // === WHEN ===
    const Verdict verdict = validate(3, "../old/path/FILE.md");

    // === THEN ===
    EXPECT_EQ(verdict.action, LinkAction::BATCH_FIXED);
    const std::string content = tree_.read("docs/guide/setup/same.md");
    EXPECT_NE(content.find("[../old/path/FILE.md](../new/path/FILE.md)"), std::string::npos) << content;
    EXPECT_EQ(content.find("](../old/path/FILE.md)"), std::string::npos);
}

TEST_F(LinkValidatorTestBase, FailedBatchFixFallsBackToValidation) {
    options_.fix_old = "old/path/";
    options_.fix_new = "new/path/";

    // Line 3 does not contain the link text
    const Verdict verdict = validate(3, "../old/path/FILE.md");

    EXPECT_EQ(verdict.action, LinkAction::NONE);
    EXPECT_EQ(verdict.kind, VerdictKind::BROKEN);
    EXPECT_EQ(verdict.reason, BrokenReason::FILE_NOT_FOUND);
}

TEST_F(LinkValidatorTestBase, AutoTodoMarksNeverWrittenFiles) {
    // === GIVEN ===
    options_.auto_todo = true;
    FakeHistoryProbe history(HistoryProbe::Result::NOT_FOUND);

    // === WHEN ===
    const Verdict verdict = validate(6, "roadmap.md", &history);

    // === THEN ===
    EXPECT_EQ(verdict.action, LinkAction::TODO_MARKED);
    EXPECT_EQ(verdict.kind, VerdictKind::INTERNAL_VALID);
    EXPECT_EQ(history.last_name_, "roadmap.md");
    EXPECT_NE(tree_.read("docs/guide/setup/install.md").find("`roadmap.md` (TODO: to create) and more text"),
              std::string::npos);
}

TEST_F(LinkValidatorTestBase, AutoTodoLeavesFilesWithHistoryBroken) {
    options_.auto_todo = true;
    FakeHistoryProbe history(HistoryProbe::Result::FOUND);
    const std::string before = tree_.read("docs/guide/setup/install.md");

    const Verdict verdict = validate(6, "roadmap.md", &history);

    EXPECT_EQ(verdict.kind, VerdictKind::BROKEN);
    EXPECT_TRUE(verdict.history_found);
    EXPECT_EQ(tree_.read("docs/guide/setup/install.md"), before);
}

TEST_F(LinkValidatorTestBase, AutoTodoWithoutHistoryIsBroken) {
    options_.auto_todo = true;
    FakeHistoryProbe history(HistoryProbe::Result::UNAVAILABLE);
    const std::string before = tree_.read("docs/guide/setup/install.md");

    const Verdict verdict = validate(6, "roadmap.md", &history);

    EXPECT_EQ(verdict.kind, VerdictKind::BROKEN);
    EXPECT_FALSE(verdict.history_found);
    EXPECT_EQ(tree_.read("docs/guide/setup/install.md"), before);

    // Disabled auto-TODO never asks for history
    options_.auto_todo = false;
    FakeHistoryProbe unused(HistoryProbe::Result::NOT_FOUND);
    EXPECT_EQ(validate(6, "roadmap.md", &unused).kind, VerdictKind::BROKEN);
    EXPECT_EQ(unused.calls_.load(), 0);
}

TEST_F(LinkValidatorTestBase, StaticHelpers) {
    EXPECT_EQ(LinkValidator::replaceAll("a/old/b/old/c", "old/", "new/"), "a/new/b/new/c");
    EXPECT_EQ(LinkValidator::replaceAll("xx", "x", "xx"), "xxxx");
    EXPECT_EQ(LinkValidator::replaceAll("keep", "", "x"), "keep");

    EXPECT_EQ(LinkValidator::todoMarker("../plans/roadmap.md"), "`roadmap.md` (TODO: to create)");

    EXPECT_STREQ(verdictKindToString(VerdictKind::BROKEN), "broken");
    EXPECT_STREQ(historyResultToString(HistoryProbe::Result::UNAVAILABLE), "unavailable");
}

TEST_F(LinkValidatorTestBase, ShellQuote) {
    EXPECT_EQ(GitHistoryProbe::shellQuote("plain.md"), "'plain.md'");
    EXPECT_EQ(GitHistoryProbe::shellQuote("it's.md"), "'it'\\''s.md'");
}

TEST_F(LinkValidatorTestBase, GitProbeOutsideRepositoryIsUnavailable) {
    // A fresh temp directory is not a git work tree
    GitHistoryProbe probe(tree_.root());
    EXPECT_EQ(probe.lookup("anything.md"), HistoryProbe::Result::UNAVAILABLE);
}

// Main function for running tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
