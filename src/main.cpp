#include "liftfix/analysis/Scanner.h"
#include "liftfix/core/Config.h"
#include "liftfix/core/ExecutionMetadata.h"
#include "liftfix/core/Finding.h"
#include "liftfix/core/RuleSet.h"
#include "liftfix/core/Severity.h"
#include "liftfix/core/Version.h"
#include "liftfix/lang/Language.h"
#include "liftfix/output/OutputFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

static llvm::cl::OptionCategory LiftfixCat("liftfix options");

static llvm::cl::opt<std::string> RulesPath(
    "config",
    llvm::cl::desc("Rules file (YAML)"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(LiftfixCat));
static llvm::cl::alias RulesPathShort(
    "c", llvm::cl::desc("Alias for --config"),
    llvm::cl::aliasopt(RulesPath));

static llvm::cl::opt<std::string> SettingsPath(
    "settings",
    llvm::cl::desc("Tool settings file (default: .liftfix.yml when present)"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::opt<std::string> Pattern(
    "pattern",
    llvm::cl::desc("Search for a single pattern instead of a rules file"),
    llvm::cl::value_desc("pattern"),
    llvm::cl::cat(LiftfixCat));
static llvm::cl::alias PatternShort(
    "e", llvm::cl::desc("Alias for --pattern"),
    llvm::cl::aliasopt(Pattern));

static llvm::cl::opt<std::string> FixTemplateText(
    "fix",
    llvm::cl::desc("Fix template for --pattern; may use its metavariables"),
    llvm::cl::value_desc("template"),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::opt<std::string> Lang(
    "lang",
    llvm::cl::desc("Language of --pattern"),
    llvm::cl::init("c"),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::opt<bool> Autofix(
    "autofix",
    llvm::cl::desc("Write rendered fixes back to the target files"),
    llvm::cl::cat(LiftfixCat));
static llvm::cl::alias AutofixShort(
    "a", llvm::cl::desc("Alias for --autofix"),
    llvm::cl::aliasopt(Autofix));

static llvm::cl::opt<bool> DryRun(
    "dryrun",
    llvm::cl::desc("Render and report fixes without writing them"),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::opt<unsigned> Jobs(
    "jobs",
    llvm::cl::desc("Files scanned in parallel (0: hardware concurrency)"),
    llvm::cl::init(0),
    llvm::cl::cat(LiftfixCat));
static llvm::cl::alias JobsShort(
    "j", llvm::cl::desc("Alias for --jobs"),
    llvm::cl::aliasopt(Jobs));

static llvm::cl::opt<uint64_t> MaxTargetBytes(
    "max-target-bytes",
    llvm::cl::desc("Skip files larger than this (0: no limit)"),
    llvm::cl::init(1000000),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (text|json|sarif)"),
    llvm::cl::init("text"),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write output to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::opt<std::string> MinSev(
    "min-severity",
    llvm::cl::desc("Minimum severity to report (INFO|WARNING|ERROR)"),
    llvm::cl::init("INFO"),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::opt<liftfix::OffsetUnit> Unit(
    "offset-unit",
    llvm::cl::desc("Unit of source offsets"),
    llvm::cl::values(
        clEnumValN(liftfix::OffsetUnit::Byte, "byte", "UTF-8 bytes"),
        clEnumValN(liftfix::OffsetUnit::CodePoint, "codepoint",
                   "Unicode code points")),
    llvm::cl::init(liftfix::OffsetUnit::Byte),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::opt<bool> Quiet(
    "quiet",
    llvm::cl::desc("Only print findings"),
    llvm::cl::cat(LiftfixCat));
static llvm::cl::alias QuietShort(
    "q", llvm::cl::desc("Alias for --quiet"),
    llvm::cl::aliasopt(Quiet));

static llvm::cl::opt<bool> Verbose(
    "verbose",
    llvm::cl::desc("Log every match and how its fix was printed"),
    llvm::cl::cat(LiftfixCat));
static llvm::cl::alias VerboseShort(
    "v", llvm::cl::desc("Alias for --verbose"),
    llvm::cl::aliasopt(Verbose));

static llvm::cl::opt<bool> TestFixed(
    "test-fixed",
    llvm::cl::desc("Compare fixed output with x.fixed.ext or x.ext.fixed "
                   "files instead of writing fixes"),
    llvm::cl::cat(LiftfixCat));

static llvm::cl::list<std::string> Targets(
    llvm::cl::Positional,
    llvm::cl::desc("<file or directory>..."),
    llvm::cl::cat(LiftfixCat));

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(LiftfixCat);
    llvm::cl::ParseCommandLineOptions(
        argc, argv, "liftfix: structural search and autofix for C sources\n");

    // Load settings.
    std::string settingsPath = SettingsPath.getValue();
    if (settingsPath.empty() && llvm::sys::fs::exists(liftfix::kDefaultConfigFile))
        settingsPath = liftfix::kDefaultConfigFile;
    liftfix::Config cfg = settingsPath.empty()
        ? liftfix::Config::defaults()
        : liftfix::Config::loadFromFile(settingsPath);

    // CLI overrides.
    if (Autofix)
        cfg.autofix = true;
    if (DryRun)
        cfg.dryRun = true;
    if (Jobs.getNumOccurrences())
        cfg.jobs = Jobs;
    if (MaxTargetBytes.getNumOccurrences())
        cfg.maxTargetBytes = MaxTargetBytes;
    if (OutputFormat.getNumOccurrences())
        cfg.outputFormat = OutputFormat;
    if (!OutputFile.empty())
        cfg.outputFile = OutputFile;
    if (Unit.getNumOccurrences())
        cfg.offsetUnit = Unit;
    if (Quiet)
        cfg.quiet = true;
    if (Verbose)
        cfg.verbose = true;
    if (MinSev.getNumOccurrences()) {
        auto sev = liftfix::parseSeverity(MinSev.getValue());
        if (!sev) {
            llvm::errs() << "liftfix: error: unknown severity '" << MinSev
                         << "'\n";
            return 2;
        }
        cfg.minSeverity = *sev;
    }

    auto formatter = liftfix::makeFormatter(cfg.outputFormat);
    if (!formatter) {
        llvm::errs() << "liftfix: error: unknown output format '"
                     << cfg.outputFormat << "'\n";
        return 2;
    }

    // Build the rule set.
    liftfix::RuleSet rules;
    if (!Pattern.empty()) {
        if (!RulesPath.empty()) {
            llvm::errs() << "liftfix: error: --pattern and --config are "
                         << "mutually exclusive\n";
            return 2;
        }
        if (!liftfix::findLanguage(Lang.getValue())) {
            llvm::errs() << "liftfix: error: unsupported language '" << Lang
                         << "'\n";
            return 2;
        }
        liftfix::RuleSpec spec;
        spec.id = liftfix::kCommandLineRuleID;
        spec.pattern = Pattern;
        spec.fix = FixTemplateText;
        spec.message = Pattern;
        spec.severity = liftfix::Severity::Info;
        spec.languages = {Lang.getValue()};
        rules = liftfix::RuleSet::fromSpecs({spec}, cfg.offsetUnit);
        if (rules.empty())
            return 2;
    } else if (!RulesPath.empty()) {
        if (!FixTemplateText.empty())
            llvm::errs() << "liftfix: warning: --fix is ignored without --pattern\n";
        auto rulesOrErr = liftfix::RuleSet::loadFromFile(RulesPath, cfg.offsetUnit);
        if (!rulesOrErr) {
            llvm::errs() << "liftfix: error: "
                         << llvm::toString(rulesOrErr.takeError()) << "\n";
            return 2;
        }
        rules = std::move(*rulesOrErr);
    } else {
        llvm::errs() << "liftfix: error: no rules; pass --config or --pattern\n";
        return 2;
    }

    size_t disabled = rules.disable(cfg.disabledRules);
    if (cfg.verbose) {
        llvm::errs() << "liftfix: " << rules.size() << " rule(s) loaded";
        if (disabled > 0)
            llvm::errs() << ", " << disabled << " disabled";
        llvm::errs() << "\n";
    }

    // Collect targets.
    std::vector<std::string> roots(Targets.begin(), Targets.end());
    if (roots.empty())
        roots.push_back(".");
    auto targetsOrErr = liftfix::collectTargets(roots);
    if (!targetsOrErr) {
        llvm::errs() << "liftfix: error: "
                     << llvm::toString(targetsOrErr.takeError()) << "\n";
        return 2;
    }

    // Build execution metadata for output provenance.
    liftfix::ExecutionMetadata execMeta;
    execMeta.toolVersion = liftfix::kToolVersion;
    execMeta.configPath = settingsPath;
    execMeta.rulesPath = RulesPath.getValue();
    execMeta.timestampEpochSec = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    execMeta.sourceFiles = *targetsOrErr;

    if (cfg.verbose) {
        llvm::errs() << "liftfix: scanning " << targetsOrErr->size()
                     << " file(s)\n";
    }

    // Run analysis.
    liftfix::Scanner scanner(rules, cfg);
    std::vector<liftfix::FileResult> results = scanner.scanAll(*targetsOrErr);

    // Fixes and fix tests run sequentially, one write per file.
    bool ioFailed = false;
    bool applyFixes = cfg.autofix || cfg.dryRun;
    std::vector<liftfix::FixTestResult> fixTests;
    std::vector<liftfix::Finding> findings;

    for (auto &r : results) {
        if (cfg.verbose && !r.trace.empty())
            llvm::errs() << r.trace;

        liftfix::accumulate(execMeta.summary, r);
        if (!r.scanned()) {
            if (!cfg.quiet)
                llvm::errs() << "liftfix: warning: skipping " << r.path << ": "
                             << r.skipReason << "\n";
            execMeta.skippedFiles.push_back({r.path, r.skipReason});
            continue;
        }

        if (TestFixed || applyFixes) {
            liftfix::FixOutcome fixed = liftfix::computeFixes(r);
            execMeta.summary.fixesOverlapped += fixed.overlapped;

            if (TestFixed) {
                if (auto t = liftfix::runFixTest(r, fixed.fixedText))
                    fixTests.push_back(std::move(*t));
            } else if (cfg.autofix && !cfg.dryRun && fixed.applied > 0) {
                if (llvm::Error err = liftfix::writeFixedFile(r.path, fixed.fixedText)) {
                    llvm::errs() << "liftfix: error: "
                                 << llvm::toString(std::move(err)) << "\n";
                    ioFailed = true;
                } else {
                    liftfix::markApplied(r, fixed);
                    execMeta.summary.fixesApplied += fixed.applied;
                    if (cfg.verbose)
                        llvm::errs() << "liftfix: wrote " << fixed.applied
                                     << " fix(es) to " << r.path << "\n";
                }
            }
        }

        for (auto &f : r.findings)
            findings.push_back(std::move(f));
    }

    std::string output = formatter->format(findings, execMeta);

    // Emit.
    if (cfg.outputFile.empty()) {
        llvm::outs() << output;
    } else {
        std::error_code EC;
        llvm::raw_fd_ostream file(cfg.outputFile, EC, llvm::sys::fs::OF_Text);
        if (EC) {
            llvm::errs() << "liftfix: error: cannot open output file '"
                         << cfg.outputFile << "': " << EC.message() << "\n";
            return 2;
        }
        file << output;
    }

    if (TestFixed) {
        unsigned passed = 0;
        for (const auto &t : fixTests) {
            if (t.passed) {
                ++passed;
                llvm::outs() << "liftfix: fix test passed: " << t.path << "\n";
            } else {
                llvm::outs() << "liftfix: fix test FAILED: " << t.path
                             << " vs " << t.expectedPath << ": " << t.detail
                             << "\n";
            }
        }
        llvm::outs() << "liftfix: " << passed << "/" << fixTests.size()
                     << " fix test(s) passed\n";
        if (ioFailed)
            return 2;
        return passed == fixTests.size() ? 0 : 1;
    }

    if (ioFailed)
        return 2;
    return findings.empty() ? 0 : 1;
}
