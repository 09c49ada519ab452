#include <gtest/gtest.h>

#include "liftfix/output/OutputFormatter.h"

#include <llvm/Support/JSON.h>

namespace liftfix {
namespace {

Finding renderedFinding() {
    Finding f;
    f.ruleID = "use-xmalloc";
    f.message = "use \"xmalloc\"";
    f.severity = Severity::Warning;
    f.location = {"src/a.c", 2, 5};
    f.endLine = 2;
    f.endColumn = 15;
    f.range = {BufferRole::Target, OffsetUnit::Byte, 11, 21};
    f.startByte = 11;
    f.endByte = 21;
    f.matchedText = "malloc(16)";
    f.fixStatus = FixStatus::Rendered;
    f.fix = "xmalloc(16)";
    f.fixedLines = "p = xmalloc(16);";
    f.fixApplied = true;
    return f;
}

Finding failedFinding() {
    Finding f;
    f.ruleID = "swap";
    f.message = "swapped";
    f.severity = Severity::Error;
    f.location = {"src/b.c", 1, 1};
    f.endLine = 1;
    f.endColumn = 5;
    f.range = {BufferRole::Target, OffsetUnit::Byte, 0, 4};
    f.matchedText = "f(a)";
    f.fixStatus = FixStatus::Failed;
    f.fixFailure = "UnboundMetavariable(Y)";
    return f;
}

ExecutionMetadata sampleMeta() {
    ExecutionMetadata meta;
    meta.toolVersion = "9.9.9";
    meta.rulesPath = "rules.yml";
    meta.sourceFiles = {"src/a.c", "src/b.c"};
    meta.skippedFiles = {{"big.c", "larger than max_target_bytes (9 > 1)"}};
    meta.summary.filesScanned = 2;
    meta.summary.filesSkipped = 1;
    meta.summary.findings = 2;
    meta.summary.fixesRendered = 1;
    meta.summary.fixesFailed = 1;
    meta.summary.fixesApplied = 1;
    return meta;
}

llvm::json::Value parseOrFail(const std::string &text) {
    auto valueOrErr = llvm::json::parse(text);
    if (!valueOrErr) {
        ADD_FAILURE() << llvm::toString(valueOrErr.takeError()) << "\n" << text;
        return nullptr;
    }
    return std::move(*valueOrErr);
}

TEST(JsonEscapeTest, EscapesSpecialCharacters) {
    EXPECT_EQ(jsonEscape("plain"), "plain");
    EXPECT_EQ(jsonEscape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(jsonEscape("x\ny\tz"), "x\\ny\\tz");
    EXPECT_EQ(jsonEscape(std::string_view("\x01", 1)), "\\u0001");
    EXPECT_EQ(jsonEscape("h\xC3\xA9"), "h\xC3\xA9");
}

TEST(FormatterFactoryTest, KnownNames) {
    EXPECT_NE(makeFormatter("text"), nullptr);
    EXPECT_NE(makeFormatter("json"), nullptr);
    EXPECT_NE(makeFormatter("sarif"), nullptr);
    EXPECT_EQ(makeFormatter("xml"), nullptr);
}

TEST(CLIOutputTest, FindingWithFix) {
    CLIOutputFormatter fmt;
    std::string out = fmt.format({renderedFinding()});
    EXPECT_NE(out.find("src/a.c:2:5: [WARNING] use-xmalloc: use \"xmalloc\"\n"),
              std::string::npos);
    EXPECT_NE(out.find("  | malloc(16)\n"), std::string::npos);
    EXPECT_NE(out.find("  fix:   xmalloc(16)\n"), std::string::npos);
    EXPECT_NE(out.find("  fixed: p = xmalloc(16);\n"), std::string::npos);
    EXPECT_NE(out.find("liftfix: 1 finding(s).\n"), std::string::npos);
}

TEST(CLIOutputTest, FailedFixAndSummary) {
    CLIOutputFormatter fmt;
    std::string out = fmt.format({failedFinding()}, sampleMeta());
    EXPECT_NE(out.find("  no fix: UnboundMetavariable(Y)\n"), std::string::npos);
    EXPECT_NE(out.find("liftfix: 1 finding(s) in 2 file(s) scanned, 1 skipped.\n"),
              std::string::npos);
    EXPECT_NE(out.find("liftfix: 1 fix(es) rendered, 1 failed, 1 applied.\n"),
              std::string::npos);
}

TEST(CLIOutputTest, NoFindings) {
    CLIOutputFormatter fmt;
    EXPECT_EQ(fmt.format({}), "liftfix: no findings.\n");
}

TEST(JSONOutputTest, ResultsAreWellFormed) {
    JSONOutputFormatter fmt;
    llvm::json::Value doc =
        parseOrFail(fmt.format({renderedFinding(), failedFinding()}));
    const llvm::json::Object *root = doc.getAsObject();
    ASSERT_NE(root, nullptr);

    const llvm::json::Array *results = root->getArray("results");
    ASSERT_NE(results, nullptr);
    ASSERT_EQ(results->size(), 2u);

    const llvm::json::Object *first = (*results)[0].getAsObject();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->getString("check_id"), llvm::StringRef("use-xmalloc"));
    EXPECT_EQ(first->getObject("start")->getInteger("offset"), int64_t{11});
    EXPECT_EQ(first->getObject("end")->getInteger("col"), int64_t{15});

    const llvm::json::Object *extra = first->getObject("extra");
    ASSERT_NE(extra, nullptr);
    EXPECT_EQ(extra->getString("message"), llvm::StringRef("use \"xmalloc\""));
    EXPECT_EQ(extra->getString("fix_status"), llvm::StringRef("rendered"));
    EXPECT_EQ(extra->getString("fix"), llvm::StringRef("xmalloc(16)"));
    EXPECT_EQ(extra->getBoolean("fix_applied"), true);

    const llvm::json::Object *failed = (*results)[1].getAsObject()->getObject("extra");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->getString("fix_status"), llvm::StringRef("failed"));
    EXPECT_EQ(failed->getString("fix_failure"),
              llvm::StringRef("UnboundMetavariable(Y)"));
    EXPECT_EQ(failed->get("fix"), nullptr);
}

TEST(JSONOutputTest, MetadataAddsSkippedAndSummary) {
    JSONOutputFormatter fmt;
    llvm::json::Value doc = parseOrFail(fmt.format({}, sampleMeta()));
    const llvm::json::Object *root = doc.getAsObject();
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->getString("version"), llvm::StringRef("9.9.9"));

    const llvm::json::Array *skipped = root->getArray("skipped");
    ASSERT_NE(skipped, nullptr);
    ASSERT_EQ(skipped->size(), 1u);
    EXPECT_EQ((*skipped)[0].getAsObject()->getString("path"), llvm::StringRef("big.c"));

    const llvm::json::Object *summary = root->getObject("summary");
    ASSERT_NE(summary, nullptr);
    EXPECT_EQ(summary->getInteger("files_scanned"), int64_t{2});
    EXPECT_EQ(summary->getInteger("fixes_failed"), int64_t{1});
}

TEST(SARIFOutputTest, FixesBecomeReplacements) {
    SARIFOutputFormatter fmt;
    llvm::json::Value doc =
        parseOrFail(fmt.format({renderedFinding(), failedFinding()}, sampleMeta()));
    const llvm::json::Object *root = doc.getAsObject();
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->getString("version"), llvm::StringRef("2.1.0"));

    const llvm::json::Object *run = (*root->getArray("runs"))[0].getAsObject();
    ASSERT_NE(run, nullptr);

    const llvm::json::Array *rules =
        run->getObject("tool")->getObject("driver")->getArray("rules");
    ASSERT_NE(rules, nullptr);
    ASSERT_EQ(rules->size(), 2u);
    EXPECT_EQ((*rules)[1].getAsObject()->getObject("defaultConfiguration")
                  ->getString("level"),
              llvm::StringRef("error"));

    const llvm::json::Array *notes = (*run->getArray("invocations"))[0]
                                         .getAsObject()
                                         ->getArray("toolExecutionNotifications");
    ASSERT_NE(notes, nullptr);
    EXPECT_EQ(notes->size(), 1u);

    const llvm::json::Array *results = run->getArray("results");
    ASSERT_NE(results, nullptr);
    ASSERT_EQ(results->size(), 2u);

    const llvm::json::Object *fixed = (*results)[0].getAsObject();
    EXPECT_EQ(fixed->getString("level"), llvm::StringRef("warning"));
    const llvm::json::Object *replacement =
        (*(*(*fixed->getArray("fixes"))[0].getAsObject()->getArray("artifactChanges"))[0]
              .getAsObject()
              ->getArray("replacements"))[0]
            .getAsObject();
    ASSERT_NE(replacement, nullptr);
    EXPECT_EQ(replacement->getObject("insertedContent")->getString("text"),
              llvm::StringRef("xmalloc(16)"));
    EXPECT_EQ(replacement->getObject("deletedRegion")->getInteger("startColumn"), int64_t{5});

    const llvm::json::Object *failed = (*results)[1].getAsObject();
    EXPECT_EQ(failed->get("fixes"), nullptr);
    EXPECT_EQ(failed->getObject("properties")->getString("fixFailure"),
              llvm::StringRef("UnboundMetavariable(Y)"));
}

} // namespace
} // namespace liftfix
