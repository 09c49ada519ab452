#include "liftfix/core/Version.h"
#include "liftfix/output/OutputFormatter.h"

#include <cstdio>
#include <sstream>

namespace liftfix {

std::string jsonEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x",
                             static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

namespace {

void writeResults(std::ostringstream &os, const std::vector<Finding> &findings) {
    os << "  \"results\": [\n";

    for (size_t i = 0; i < findings.size(); ++i) {
        const auto &f = findings[i];
        os << "    {\n";
        os << "      \"check_id\": \"" << jsonEscape(f.ruleID) << "\",\n";
        os << "      \"path\": \"" << jsonEscape(f.location.file) << "\",\n";
        os << "      \"start\": { \"line\": " << f.location.line
           << ", \"col\": " << f.location.column
           << ", \"offset\": " << f.range.start << " },\n";
        os << "      \"end\": { \"line\": " << f.endLine
           << ", \"col\": " << f.endColumn
           << ", \"offset\": " << f.range.end << " },\n";
        os << "      \"extra\": {\n";
        os << "        \"message\": \"" << jsonEscape(f.message) << "\",\n";
        os << "        \"severity\": \"" << severityToString(f.severity) << "\",\n";
        os << "        \"lines\": \"" << jsonEscape(f.matchedText) << "\",\n";
        os << "        \"fix_status\": \"" << fixStatusName(f.fixStatus) << "\"";

        if (f.fixStatus == FixStatus::Rendered) {
            os << ",\n        \"fix\": \"" << jsonEscape(f.fix) << "\",\n";
            os << "        \"fixed_lines\": \"" << jsonEscape(f.fixedLines) << "\",\n";
            os << "        \"fix_applied\": " << (f.fixApplied ? "true" : "false");
        } else if (f.fixStatus == FixStatus::Failed) {
            os << ",\n        \"fix_failure\": \"" << jsonEscape(f.fixFailure) << "\"";
        }

        os << "\n      }\n";
        os << "    }";
        if (i + 1 < findings.size()) os << ",";
        os << "\n";
    }

    os << "  ]";
}

} // anonymous namespace

std::string JSONOutputFormatter::format(const std::vector<Finding> &findings) {
    std::ostringstream os;
    os << "{\n  \"version\": \"" << kToolVersion << "\",\n";
    writeResults(os, findings);
    os << "\n}\n";
    return os.str();
}

std::string JSONOutputFormatter::format(const std::vector<Finding> &findings,
                                        const ExecutionMetadata &meta) {
    std::ostringstream os;
    os << "{\n  \"version\": \"" << jsonEscape(meta.toolVersion) << "\",\n";
    writeResults(os, findings);
    os << ",\n";

    os << "  \"skipped\": [";
    for (size_t i = 0; i < meta.skippedFiles.size(); ++i) {
        const auto &sk = meta.skippedFiles[i];
        os << "\n    { \"path\": \"" << jsonEscape(sk.path)
           << "\", \"reason\": \"" << jsonEscape(sk.reason) << "\" }";
        if (i + 1 < meta.skippedFiles.size()) os << ",";
    }
    os << (meta.skippedFiles.empty() ? "],\n" : "\n  ],\n");

    const RunSummary &s = meta.summary;
    os << "  \"summary\": {\n";
    os << "    \"files_scanned\": " << s.filesScanned << ",\n";
    os << "    \"files_skipped\": " << s.filesSkipped << ",\n";
    os << "    \"findings\": " << s.findings << ",\n";
    os << "    \"fixes_rendered\": " << s.fixesRendered << ",\n";
    os << "    \"fixes_failed\": " << s.fixesFailed << ",\n";
    os << "    \"fixes_applied\": " << s.fixesApplied << ",\n";
    os << "    \"fixes_overlapping\": " << s.fixesOverlapped << "\n";
    os << "  }\n}\n";
    return os.str();
}

} // namespace liftfix
