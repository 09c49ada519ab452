#pragma once

#include "liftfix/core/Severity.h"
#include "liftfix/core/SourceBuffer.h"

#include <llvm/Support/YAMLTraits.h>

// Scalar enumerations shared by the config file and rule files.

namespace llvm {
namespace yaml {

template <>
struct ScalarEnumerationTraits<liftfix::Severity> {
    static void enumeration(IO &io, liftfix::Severity &value) {
        io.enumCase(value, "INFO",    liftfix::Severity::Info);
        io.enumCase(value, "WARNING", liftfix::Severity::Warning);
        io.enumCase(value, "ERROR",   liftfix::Severity::Error);
    }
};

template <>
struct ScalarEnumerationTraits<liftfix::OffsetUnit> {
    static void enumeration(IO &io, liftfix::OffsetUnit &value) {
        io.enumCase(value, "byte",      liftfix::OffsetUnit::Byte);
        io.enumCase(value, "codepoint", liftfix::OffsetUnit::CodePoint);
    }
};

} // namespace yaml
} // namespace llvm
