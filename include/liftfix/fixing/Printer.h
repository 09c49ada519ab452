#pragma once

#include "liftfix/core/Node.h"
#include "liftfix/core/SourceBuffer.h"

#include <llvm/Support/Error.h>

#include <cstddef>
#include <string>

namespace liftfix {

// Provenance of every printed character, in bytes of output.
struct PrintStats {
    size_t liftedTargetChars     = 0;
    size_t liftedTemplateChars   = 0;
    size_t synthesizedChars      = 0;
    unsigned synthesizedSeparators = 0;
};

// Renders a substituted tree. Per node, in priority order:
//   1. origin present and nothing below was altered: verbatim slice of the
//      buffer the origin points into
//   2. synthesized connective token: its canonical text
//   3. altered composite: children in order, with the template text lying
//      between consecutive template children lifted from the template
//   4. anything else: UnprintableNode
// Pure: the same tree and buffers always give the same text.
llvm::Expected<std::string> printFix(const NodePtr &tree,
                                     const SourceBuffer &target,
                                     const SourceBuffer &fixTemplate,
                                     PrintStats *stats = nullptr);

} // namespace liftfix
