#include "liftfix/fixing/Splice.h"

#include <algorithm>
#include <numeric>

namespace liftfix {

std::string spliceFix(const SourceBuffer &target, const Range &matchRange,
                      std::string_view fixText) {
    target.checkRange(matchRange);

    std::string_view text = target.text();
    size_t b = target.toByteOffset(matchRange.start);
    size_t e = target.toByteOffset(matchRange.end);

    std::string out;
    out.reserve(b + fixText.size() + (text.size() - e));
    out.append(text.substr(0, b));
    out.append(fixText);
    out.append(text.substr(e));
    return out;
}

ApplyResult applyEdits(const SourceBuffer &target, const std::vector<Edit> &edits) {
    std::vector<size_t> order(edits.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return edits[a].range.start < edits[b].range.start;
    });

    ApplyResult result;
    uint32_t lastEnd = 0;
    bool any = false;
    for (size_t idx : order) {
        const Range &R = edits[idx].range;
        target.checkRange(R);
        if (any && R.start < lastEnd) {
            result.skipped.push_back(idx);
            continue;
        }
        result.applied.push_back(idx);
        lastEnd = R.end;
        any = true;
    }

    // Splice back to front so earlier offsets stay valid.
    std::string text(target.text());
    for (auto it = result.applied.rbegin(); it != result.applied.rend(); ++it) {
        const Edit &E = edits[*it];
        size_t b = target.toByteOffset(E.range.start);
        size_t e = target.toByteOffset(E.range.end);
        text.replace(b, e - b, E.replacement);
    }
    result.text = std::move(text);
    return result;
}

std::string fixedLinesPreview(std::string_view fixed, size_t startByte,
                              size_t len) {
    startByte = std::min(startByte, fixed.size());
    size_t endByte = std::min(startByte + len, fixed.size());

    size_t lineBegin = fixed.rfind('\n', startByte == 0 ? 0 : startByte - 1);
    lineBegin = (lineBegin == std::string_view::npos || startByte == 0)
                    ? 0 : lineBegin + 1;
    size_t lineEnd = fixed.find('\n', endByte);
    if (lineEnd == std::string_view::npos)
        lineEnd = fixed.size();
    return std::string(fixed.substr(lineBegin, lineEnd - lineBegin));
}

} // namespace liftfix
