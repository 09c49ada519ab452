#pragma once

#include "liftfix/core/SourceBuffer.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace liftfix {

// target[0, start) + fixText + target[end, length). The range must belong to
// the target buffer and use its offset unit.
std::string spliceFix(const SourceBuffer &target, const Range &matchRange,
                      std::string_view fixText);

struct Edit {
    Range range;
    std::string replacement;
};

struct ApplyResult {
    std::string text;
    std::vector<size_t> applied; // indices into the input, ascending offsets
    std::vector<size_t> skipped; // overlapped an earlier edit
};

// Applies non-overlapping edits in one pass. Edits are ordered by start
// offset (stable for ties); an edit overlapping one already accepted is
// skipped.
ApplyResult applyEdits(const SourceBuffer &target, const std::vector<Edit> &edits);

// Lines of `fixed` touched by a fix spliced at [startByte, startByte + len).
std::string fixedLinesPreview(std::string_view fixed, size_t startByte,
                              size_t len);

} // namespace liftfix
