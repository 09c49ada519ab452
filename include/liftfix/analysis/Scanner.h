#pragma once

#include "liftfix/core/Config.h"
#include "liftfix/core/ExecutionMetadata.h"
#include "liftfix/core/Finding.h"
#include "liftfix/core/RuleSet.h"
#include "liftfix/core/SourceBuffer.h"
#include "liftfix/lang/Language.h"

#include <llvm/Support/Error.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace liftfix {

struct FileResult {
    std::string path;
    std::shared_ptr<const SourceBuffer> buffer; // null when skipped
    std::vector<Finding> findings;
    std::string skipReason; // non-empty when the file was not scanned
    std::string trace;      // per-match detail, verbose runs only

    bool scanned() const { return skipReason.empty(); }
};

// Runs every rule over target files. Holds only references to immutable
// state, so one scanner may serve any number of threads.
class Scanner {
public:
    Scanner(const RuleSet &rules, const Config &cfg)
        : rules_(rules), cfg_(cfg) {}

    // Parses and matches an already loaded target.
    FileResult scanBuffer(std::shared_ptr<const SourceBuffer> target,
                          const Language &lang) const;

    FileResult scanFile(const std::string &path) const;

    // Bounded parallel scan; results are in the order of `paths`.
    std::vector<FileResult> scanAll(const std::vector<std::string> &paths) const;

private:
    const RuleSet &rules_;
    const Config &cfg_;
};

// Expands directories recursively into files with a known language
// extension. Explicit file arguments are kept as given. A path that does not
// exist is an error.
llvm::Expected<std::vector<std::string>>
collectTargets(const std::vector<std::string> &roots);

struct FixOutcome {
    std::string fixedText;
    std::vector<size_t> spliced; // indices into FileResult::findings
    unsigned applied    = 0;
    unsigned overlapped = 0;
};

// Splices every rendered fix of one scanned file, in offset order. Fixes
// overlapping an earlier one are skipped with a warning. Nothing is written
// and no finding is marked applied.
FixOutcome computeFixes(const FileResult &result);

// Marks the findings whose fixes went into `outcome` as applied. Call only
// once the fixed text has been written.
void markApplied(FileResult &result, const FixOutcome &outcome);

// Replaces the file contents in one write.
llvm::Error writeFixedFile(const std::string &path, const std::string &text);

// Sibling holding the expected fixed output of `path`: `x.fixed.ext` or
// `x.ext.fixed`, whichever exists.
std::optional<std::string> expectedFixedPath(const std::string &path);

struct FixTestResult {
    std::string path;
    std::string expectedPath;
    bool passed = false;
    std::string detail;
};

// Compares the fixed content of a scanned file with its expectation file.
// nullopt when the file has no expectation.
std::optional<FixTestResult> runFixTest(const FileResult &result,
                                        const std::string &fixedText);

// Adds the scan and fix-rendering counters of one file to the summary.
void accumulate(RunSummary &summary, const FileResult &result);

} // namespace liftfix
