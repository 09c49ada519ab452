#include "liftfix/core/Version.h"
#include "liftfix/output/OutputFormatter.h"

#include <sstream>

namespace liftfix {

namespace {

std::string sarifLevel(Severity sev) {
    switch (sev) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
        case Severity::Info:    return "note";
    }
    return "note";
}

void writeRegion(std::ostringstream &os, const Finding &f, const char *indent) {
    os << indent << "\"startLine\": " << (f.location.line > 0 ? f.location.line : 1) << ",\n";
    os << indent << "\"startColumn\": " << (f.location.column > 0 ? f.location.column : 1) << ",\n";
    os << indent << "\"endLine\": " << (f.endLine > 0 ? f.endLine : 1) << ",\n";
    os << indent << "\"endColumn\": " << (f.endColumn > 0 ? f.endColumn : 1) << "\n";
}

} // anonymous namespace

std::string SARIFOutputFormatter::format(const std::vector<Finding> &findings) {
    ExecutionMetadata meta;
    meta.toolVersion = kToolVersion;
    return format(findings, meta);
}

std::string SARIFOutputFormatter::format(const std::vector<Finding> &findings,
                                         const ExecutionMetadata &meta) {
    std::ostringstream os;

    os << "{\n";
    os << "  \"$schema\": \"https://raw.githubusercontent.com/oasis-tcs/sarif-spec/main/sarif-2.1/schema/sarif-schema-2.1.0.json\",\n";
    os << "  \"version\": \"2.1.0\",\n";
    os << "  \"runs\": [{\n";

    // Tool descriptor.
    os << "    \"tool\": {\n";
    os << "      \"driver\": {\n";
    os << "        \"name\": \"liftfix\",\n";
    os << "        \"version\": \"" << jsonEscape(meta.toolVersion) << "\",\n";
    os << "        \"rules\": [";

    // Collect unique rules.
    std::vector<const Finding *> firstOfRule;
    for (const auto &f : findings) {
        bool found = false;
        for (const Finding *r : firstOfRule)
            if (r->ruleID == f.ruleID) { found = true; break; }
        if (!found)
            firstOfRule.push_back(&f);
    }

    for (size_t i = 0; i < firstOfRule.size(); ++i) {
        const Finding &f = *firstOfRule[i];
        os << "\n          {\n";
        os << "            \"id\": \"" << jsonEscape(f.ruleID) << "\",\n";
        os << "            \"shortDescription\": { \"text\": \"" << jsonEscape(f.message) << "\" },\n";
        os << "            \"defaultConfiguration\": { \"level\": \"" << sarifLevel(f.severity) << "\" }\n";
        os << "          }";
        if (i + 1 < firstOfRule.size()) os << ",";
    }

    os << "\n        ]\n";
    os << "      }\n";
    os << "    },\n";

    // Invocation: run summary and files that were not scanned.
    const RunSummary &s = meta.summary;
    os << "    \"invocations\": [{\n";
    os << "      \"executionSuccessful\": true,\n";
    os << "      \"toolExecutionNotifications\": [";
    for (size_t i = 0; i < meta.skippedFiles.size(); ++i) {
        const auto &sk = meta.skippedFiles[i];
        os << "\n        {\n";
        os << "          \"level\": \"warning\",\n";
        os << "          \"message\": { \"text\": \"" << jsonEscape(sk.reason) << "\" },\n";
        os << "          \"locations\": [{ \"physicalLocation\": { \"artifactLocation\": { \"uri\": \""
           << jsonEscape(sk.path) << "\" } } }]\n";
        os << "        }";
        if (i + 1 < meta.skippedFiles.size()) os << ",";
    }
    os << (meta.skippedFiles.empty() ? "],\n" : "\n      ],\n");
    os << "      \"properties\": {\n";
    os << "        \"timestampEpochSec\": " << meta.timestampEpochSec << ",\n";
    os << "        \"configPath\": \"" << jsonEscape(meta.configPath) << "\",\n";
    os << "        \"rulesPath\": \"" << jsonEscape(meta.rulesPath) << "\",\n";
    os << "        \"filesScanned\": " << s.filesScanned << ",\n";
    os << "        \"filesSkipped\": " << s.filesSkipped << ",\n";
    os << "        \"fixesRendered\": " << s.fixesRendered << ",\n";
    os << "        \"fixesFailed\": " << s.fixesFailed << ",\n";
    os << "        \"fixesApplied\": " << s.fixesApplied << "\n";
    os << "      }\n";
    os << "    }],\n";

    // Artifacts.
    if (!meta.sourceFiles.empty()) {
        os << "    \"artifacts\": [";
        for (size_t i = 0; i < meta.sourceFiles.size(); ++i) {
            os << "\n      { \"location\": { \"uri\": \"" << jsonEscape(meta.sourceFiles[i]) << "\" } }";
            if (i + 1 < meta.sourceFiles.size()) os << ",";
        }
        os << "\n    ],\n";
    }

    // Results.
    os << "    \"results\": [";

    for (size_t i = 0; i < findings.size(); ++i) {
        const auto &f = findings[i];

        os << "\n      {\n";
        os << "        \"ruleId\": \"" << jsonEscape(f.ruleID) << "\",\n";
        os << "        \"level\": \"" << sarifLevel(f.severity) << "\",\n";
        os << "        \"message\": { \"text\": \"" << jsonEscape(f.message) << "\" },\n";

        os << "        \"locations\": [{\n";
        os << "          \"physicalLocation\": {\n";
        os << "            \"artifactLocation\": { \"uri\": \"" << jsonEscape(f.location.file) << "\" },\n";
        os << "            \"region\": {\n";
        writeRegion(os, f, "              ");
        os << "            }\n";
        os << "          }\n";
        os << "        }]";

        if (f.fixStatus == FixStatus::Rendered) {
            os << ",\n        \"fixes\": [{\n";
            os << "          \"description\": { \"text\": \"" << jsonEscape(f.ruleID) << " autofix\" },\n";
            os << "          \"artifactChanges\": [{\n";
            os << "            \"artifactLocation\": { \"uri\": \"" << jsonEscape(f.location.file) << "\" },\n";
            os << "            \"replacements\": [{\n";
            os << "              \"deletedRegion\": {\n";
            writeRegion(os, f, "                ");
            os << "              },\n";
            os << "              \"insertedContent\": { \"text\": \"" << jsonEscape(f.fix) << "\" }\n";
            os << "            }]\n";
            os << "          }]\n";
            os << "        }]";
        } else if (f.fixStatus == FixStatus::Failed) {
            os << ",\n        \"properties\": { \"fixFailure\": \"" << jsonEscape(f.fixFailure) << "\" }";
        }

        os << "\n      }";
        if (i + 1 < findings.size()) os << ",";
    }

    os << "\n    ]\n";
    os << "  }]\n";
    os << "}\n";

    return os.str();
}

} // namespace liftfix
