#pragma once

#include "liftfix/core/Severity.h"
#include "liftfix/core/SourceBuffer.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace liftfix {

enum class FixStatus : uint8_t {
    None,     // rule carries no fix
    Rendered, // fix text available
    Failed,   // fix could not be produced; see fixFailure
};

constexpr std::string_view fixStatusName(FixStatus s) {
    switch (s) {
        case FixStatus::None:     return "none";
        case FixStatus::Rendered: return "rendered";
        case FixStatus::Failed:   return "failed";
    }
    return "none";
}

struct SourceLocation {
    std::string file;
    unsigned line   = 0;
    unsigned column = 0;
};

struct Finding {
    std::string    ruleID;
    std::string    message;
    Severity       severity = Severity::Info;
    SourceLocation location;
    unsigned       endLine   = 0;
    unsigned       endColumn = 0;

    Range  range;         // matched range, in target units
    size_t startByte = 0; // same range in bytes
    size_t endByte   = 0;
    std::string matchedText;

    FixStatus   fixStatus = FixStatus::None;
    std::string fix;        // replacement for [startByte, endByte)
    std::string fixedLines; // lines of the fixed file touched by the fix
    std::string fixFailure; // why no fix is available
    bool        fixApplied = false;
};

} // namespace liftfix
