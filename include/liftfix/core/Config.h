#pragma once

#include "liftfix/core/Severity.h"
#include "liftfix/core/SourceBuffer.h"

#include <cstdint>
#include <string>
#include <vector>

namespace liftfix {

inline constexpr const char *kDefaultConfigFile = ".liftfix.yml";

struct Config {
    // Fixing
    bool autofix                = false;
    bool dryRun                 = false; // render and report, never write

    // Scanning
    unsigned jobs               = 0;       // 0 = hardware concurrency
    uint64_t maxTargetBytes     = 1000000; // 0 disables the limit
    OffsetUnit offsetUnit       = OffsetUnit::Byte;

    // Minimum severity to emit
    Severity minSeverity        = Severity::Info;

    // Output
    std::string outputFormat    = "text"; // text|json|sarif
    std::string outputFile;               // empty = stdout
    bool quiet                  = false;
    bool verbose                = false;

    // Rule enable/disable
    std::vector<std::string> disabledRules;

    static Config loadFromFile(const std::string &path);
    static Config defaults();
};

} // namespace liftfix
