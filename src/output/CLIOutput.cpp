#include "liftfix/output/OutputFormatter.h"

#include <sstream>

namespace liftfix {

namespace {

// Continuation lines of a multi-line value line up under the first.
void writeIndented(std::ostringstream &os, const std::string &text,
                   const char *indent) {
    for (char c : text) {
        os << c;
        if (c == '\n')
            os << indent;
    }
    os << "\n";
}

void writeFindings(std::ostringstream &os, const std::vector<Finding> &findings) {
    for (const auto &f : findings) {
        os << f.location.file << ":" << f.location.line << ":"
           << f.location.column << ": ";

        os << "[" << severityToString(f.severity) << "] "
           << f.ruleID << ": " << f.message << "\n";

        os << "  | ";
        writeIndented(os, f.matchedText, "  | ");

        switch (f.fixStatus) {
            case FixStatus::Rendered:
                os << "  fix:   ";
                writeIndented(os, f.fix, "         ");
                os << "  fixed: ";
                writeIndented(os, f.fixedLines, "         ");
                break;
            case FixStatus::Failed:
                os << "  no fix: " << f.fixFailure << "\n";
                break;
            case FixStatus::None:
                break;
        }

        os << "\n";
    }
}

} // anonymous namespace

std::string CLIOutputFormatter::format(const std::vector<Finding> &findings) {
    std::ostringstream os;
    writeFindings(os, findings);

    if (findings.empty())
        os << "liftfix: no findings.\n";
    else
        os << "liftfix: " << findings.size() << " finding(s).\n";

    return os.str();
}

std::string CLIOutputFormatter::format(const std::vector<Finding> &findings,
                                       const ExecutionMetadata &meta) {
    std::ostringstream os;
    writeFindings(os, findings);

    const RunSummary &s = meta.summary;
    os << "liftfix: " << findings.size() << " finding(s) in "
       << s.filesScanned << " file(s) scanned, " << s.filesSkipped
       << " skipped.\n";
    if (s.fixesRendered > 0 || s.fixesFailed > 0) {
        os << "liftfix: " << s.fixesRendered << " fix(es) rendered, "
           << s.fixesFailed << " failed, " << s.fixesApplied << " applied";
        if (s.fixesOverlapped > 0)
            os << ", " << s.fixesOverlapped << " overlapping";
        os << ".\n";
    }

    return os.str();
}

std::unique_ptr<OutputFormatter> makeFormatter(std::string_view name) {
    if (name == "text")
        return std::make_unique<CLIOutputFormatter>();
    if (name == "json")
        return std::make_unique<JSONOutputFormatter>();
    if (name == "sarif")
        return std::make_unique<SARIFOutputFormatter>();
    return nullptr;
}

} // namespace liftfix
