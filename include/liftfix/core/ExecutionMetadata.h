#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace liftfix {

struct RunSummary {
    unsigned filesScanned   = 0;
    unsigned filesSkipped   = 0; // too large, unreadable, or failed to parse
    unsigned findings       = 0;
    unsigned fixesRendered  = 0;
    unsigned fixesFailed    = 0;
    unsigned fixesApplied   = 0;
    unsigned fixesOverlapped = 0;
};

struct SkippedFile {
    std::string path;
    std::string reason;
};

struct ExecutionMetadata {
    std::string toolVersion;
    std::string configPath;
    std::string rulesPath;
    uint64_t timestampEpochSec = 0;
    std::vector<std::string> sourceFiles;
    std::vector<SkippedFile> skippedFiles;
    RunSummary summary;
};

} // namespace liftfix
