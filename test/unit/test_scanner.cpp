#include <gtest/gtest.h>

#include "liftfix/analysis/Scanner.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>

namespace liftfix {
namespace {

const std::string kSamples = LIFTFIX_SAMPLES_DIR;
const std::string kAlloc = kSamples + "/targets/alloc.c";
const std::string kAllocFixed = kSamples + "/targets/alloc.fixed.c";
const std::string kNotes = kSamples + "/targets/notes.txt";

std::string readFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        ADD_FAILURE() << "cannot read " << path;
        return {};
    }
    return bufOrErr.get()->getBuffer().str();
}

class ScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto setOrErr = RuleSet::loadFromFile(kSamples + "/rules.yml",
                                              OffsetUnit::Byte);
        ASSERT_TRUE(static_cast<bool>(setOrErr)) << llvm::toString(setOrErr.takeError());
        rules_ = std::move(*setOrErr);
    }

    RuleSet rules_;
    Config cfg_;
};

TEST_F(ScannerTest, FindsEveryMatchInOffsetOrder) {
    Scanner scanner(rules_, cfg_);
    FileResult result = scanner.scanFile(kAlloc);
    ASSERT_TRUE(result.scanned()) << result.skipReason;
    ASSERT_EQ(result.findings.size(), 5u);

    std::vector<std::string> ids;
    for (const auto &f : result.findings)
        ids.push_back(f.ruleID);
    EXPECT_EQ(ids, (std::vector<std::string>{"use-xmalloc", "strcpy-to-strlcpy",
                                             "log-call-prefix", "log-call-prefix",
                                             "redundant-compare"}));

    EXPECT_EQ(result.findings[0].location.line, 2u);
    EXPECT_EQ(result.findings[0].message, "use xmalloc instead of malloc(n * 4)");
    EXPECT_EQ(result.findings[1].message, "unbounded copy into buf");
    EXPECT_EQ(result.findings[1].fix, "strlcpy(buf, \"hello\", sizeof(buf))");
    EXPECT_EQ(result.findings[3].fix, "log_msg(LOG_INFO)");
    EXPECT_EQ(result.findings[4].fixStatus, FixStatus::None);
    EXPECT_EQ(result.findings[4].message, "n is compared with itself");
    EXPECT_TRUE(result.trace.empty());
}

TEST_F(ScannerTest, MinimumSeverityFiltersFindings) {
    cfg_.minSeverity = Severity::Error;
    Scanner scanner(rules_, cfg_);
    FileResult result = scanner.scanFile(kAlloc);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].ruleID, "strcpy-to-strlcpy");
}

TEST_F(ScannerTest, VerboseScanRecordsTrace) {
    cfg_.verbose = true;
    Scanner scanner(rules_, cfg_);
    FileResult result = scanner.scanFile(kAlloc);
    EXPECT_NE(result.trace.find("use-xmalloc matched"), std::string::npos);
    EXPECT_NE(result.trace.find("$SIZE='n * 4'"), std::string::npos);
}

TEST_F(ScannerTest, FixedFileMatchesExpectation) {
    Scanner scanner(rules_, cfg_);
    FileResult result = scanner.scanFile(kAlloc);
    ASSERT_TRUE(result.scanned()) << result.skipReason;

    FixOutcome outcome = computeFixes(result);
    EXPECT_EQ(outcome.applied, 4u);
    EXPECT_EQ(outcome.overlapped, 0u);
    EXPECT_EQ(outcome.fixedText, readFile(kAllocFixed));
    EXPECT_EQ(outcome.spliced, (std::vector<size_t>{0, 1, 2, 3}));

    auto test = runFixTest(result, outcome.fixedText);
    ASSERT_TRUE(test.has_value());
    EXPECT_TRUE(test->passed) << test->detail;
    EXPECT_EQ(test->expectedPath, kAllocFixed);
}

TEST_F(ScannerTest, FixTestReportsFirstDifferingLine) {
    Scanner scanner(rules_, cfg_);
    FileResult result = scanner.scanFile(kAlloc);
    std::string fixed = readFile(kAllocFixed);
    fixed.replace(fixed.find("xmalloc"), 7, "calloc");

    auto test = runFixTest(result, fixed);
    ASSERT_TRUE(test.has_value());
    EXPECT_FALSE(test->passed);
    EXPECT_EQ(test->detail,
              "line 2: expected '    char *buf = xmalloc(n * 4);', "
              "got '    char *buf = calloc(n * 4);'");
}

TEST_F(ScannerTest, NoExpectationFileMeansNoFixTest) {
    FileResult result;
    result.path = kNotes;
    EXPECT_FALSE(runFixTest(result, "").has_value());
    EXPECT_EQ(expectedFixedPath(kAlloc), kAllocFixed);
}

TEST_F(ScannerTest, OverlappingFixesKeepTheOuterOne) {
    RuleSpec spec;
    spec.id = "wrap";
    spec.pattern = "g($X)";
    spec.fix = "h($X)";
    spec.languages = {"c"};
    RuleSet set = RuleSet::fromSpecs({spec}, OffsetUnit::Byte);

    Scanner scanner(set, cfg_);
    auto target = std::make_shared<const SourceBuffer>(
        BufferRole::Target, "g(g(1));", OffsetUnit::Byte, "nested.c");
    FileResult result = scanner.scanBuffer(target, *findLanguage("c"));
    ASSERT_EQ(result.findings.size(), 2u);

    FixOutcome outcome = computeFixes(result);
    EXPECT_EQ(outcome.fixedText, "h(g(1));");
    EXPECT_EQ(outcome.applied, 1u);
    EXPECT_EQ(outcome.overlapped, 1u);
    EXPECT_EQ(outcome.spliced, (std::vector<size_t>{0}));
}

TEST_F(ScannerTest, ComputingFixesDoesNotMarkThemApplied) {
    Scanner scanner(rules_, cfg_);
    FileResult result = scanner.scanFile(kAlloc);
    ASSERT_TRUE(result.scanned()) << result.skipReason;

    // A dry run stops here: fixes are rendered and spliced, never written.
    FixOutcome outcome = computeFixes(result);
    EXPECT_EQ(outcome.applied, 4u);
    for (const auto &f : result.findings)
        EXPECT_FALSE(f.fixApplied) << f.ruleID;
    EXPECT_EQ(readFile(kAlloc).find("xmalloc"), std::string::npos);
}

TEST_F(ScannerTest, WrittenFixesAreMarkedApplied) {
    llvm::SmallString<128> path;
    ASSERT_FALSE(llvm::sys::fs::createTemporaryFile("liftfix", "c", path));
    {
        llvm::Error err = writeFixedFile(path.str().str(), readFile(kAlloc));
        ASSERT_FALSE(static_cast<bool>(err)) << llvm::toString(std::move(err));
    }

    Scanner scanner(rules_, cfg_);
    FileResult result = scanner.scanFile(path.str().str());
    ASSERT_TRUE(result.scanned()) << result.skipReason;
    FixOutcome outcome = computeFixes(result);

    llvm::Error err = writeFixedFile(result.path, outcome.fixedText);
    ASSERT_FALSE(static_cast<bool>(err)) << llvm::toString(std::move(err));
    markApplied(result, outcome);

    EXPECT_EQ(readFile(result.path), readFile(kAllocFixed));
    for (size_t i = 0; i < 4; ++i)
        EXPECT_TRUE(result.findings[i].fixApplied) << result.findings[i].ruleID;
    EXPECT_FALSE(result.findings[4].fixApplied);
    llvm::sys::fs::remove(path);
}

TEST_F(ScannerTest, UnknownExtensionIsSkipped) {
    Scanner scanner(rules_, cfg_);
    FileResult result = scanner.scanFile(kNotes);
    EXPECT_FALSE(result.scanned());
    EXPECT_EQ(result.skipReason, "no language for this file extension");
    EXPECT_EQ(result.buffer, nullptr);
}

TEST_F(ScannerTest, OversizedFileIsSkipped) {
    cfg_.maxTargetBytes = 16;
    Scanner scanner(rules_, cfg_);
    FileResult result = scanner.scanFile(kAlloc);
    EXPECT_FALSE(result.scanned());
    EXPECT_EQ(result.skipReason.rfind("larger than max_target_bytes (", 0), 0u);
}

TEST_F(ScannerTest, UnparsableTargetIsSkipped) {
    Scanner scanner(rules_, cfg_);
    auto target = std::make_shared<const SourceBuffer>(
        BufferRole::Target, "f(;", OffsetUnit::Byte, "broken.c");
    FileResult result = scanner.scanBuffer(target, *findLanguage("c"));
    EXPECT_FALSE(result.scanned());
    EXPECT_TRUE(result.findings.empty());
}

TEST_F(ScannerTest, ParallelScanKeepsInputOrder) {
    cfg_.jobs = 2;
    Scanner scanner(rules_, cfg_);
    auto results = scanner.scanAll({kAlloc, kNotes, kAlloc, kNotes});
    ASSERT_EQ(results.size(), 4u);
    EXPECT_TRUE(results[0].scanned());
    EXPECT_FALSE(results[1].scanned());
    EXPECT_TRUE(results[2].scanned());
    EXPECT_FALSE(results[3].scanned());
    EXPECT_EQ(results[2].findings.size(), 5u);

    RunSummary summary;
    for (const auto &r : results)
        accumulate(summary, r);
    EXPECT_EQ(summary.filesScanned, 2u);
    EXPECT_EQ(summary.filesSkipped, 2u);
    EXPECT_EQ(summary.findings, 10u);
    EXPECT_EQ(summary.fixesRendered, 8u);
    EXPECT_EQ(summary.fixesFailed, 0u);
}

TEST(CollectTargetsTest, DirectorySkipsExpectationsAndUnknownFiles) {
    auto filesOrErr = collectTargets({kSamples + "/targets"});
    ASSERT_TRUE(static_cast<bool>(filesOrErr)) << llvm::toString(filesOrErr.takeError());
    EXPECT_EQ(*filesOrErr, (std::vector<std::string>{kAlloc}));
}

TEST(CollectTargetsTest, ExplicitFilesAreKept) {
    auto filesOrErr = collectTargets({kNotes, kAllocFixed});
    ASSERT_TRUE(static_cast<bool>(filesOrErr)) << llvm::toString(filesOrErr.takeError());
    EXPECT_EQ(*filesOrErr, (std::vector<std::string>{kNotes, kAllocFixed}));
}

TEST(CollectTargetsTest, MissingPathIsAnError) {
    auto filesOrErr = collectTargets({kSamples + "/does-not-exist"});
    ASSERT_FALSE(static_cast<bool>(filesOrErr));
    EXPECT_NE(llvm::toString(filesOrErr.takeError()).find("does-not-exist"),
              std::string::npos);
}

TEST(WriteFixedFileTest, ReplacesContents) {
    llvm::SmallString<128> path;
    ASSERT_FALSE(llvm::sys::fs::createTemporaryFile("liftfix", "c", path));

    for (const char *text : {"x = 1;\n", "y;\n"}) {
        llvm::Error err = writeFixedFile(path.str().str(), text);
        ASSERT_FALSE(static_cast<bool>(err)) << llvm::toString(std::move(err));
        EXPECT_EQ(readFile(path.str().str()), text);
    }
    llvm::sys::fs::remove(path);
}

TEST(WriteFixedFileTest, UnwritablePathIsAnError) {
    llvm::Error err = writeFixedFile(kSamples + "/no-such-dir/out.c", "x");
    ASSERT_TRUE(static_cast<bool>(err));
    EXPECT_NE(llvm::toString(std::move(err)).find("no-such-dir"), std::string::npos);
}

} // namespace
} // namespace liftfix
