#include "liftfix/core/SourceBuffer.h"
#include "liftfix/core/FixError.h"

#include <llvm/ADT/Twine.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/Support/ErrorHandling.h>

#include <algorithm>

namespace liftfix {

namespace {

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

[[noreturn]] void unitMismatch(const SourceBuffer &buf, const Range &R,
                               llvm::StringRef what) {
    std::string msg;
    llvm::raw_string_ostream os(msg);
    os << "liftfix: " << fixErrorKindName(FixErrorKind::OffsetUnitMismatch)
       << ": " << what << " (range " << bufferRoleName(R.buffer) << "["
       << R.start << ", " << R.end << ") in " << offsetUnitName(R.unit)
       << " units, buffer " << bufferRoleName(buf.role()) << " in "
       << offsetUnitName(buf.unit()) << " units, length " << buf.length()
       << ")";
    llvm::report_fatal_error(llvm::Twine(os.str()), /*gen_crash_diag=*/false);
}

} // anonymous namespace

SourceBuffer::SourceBuffer(BufferRole role, std::string text, OffsetUnit unit,
                           std::string name)
    : role_(role), unit_(unit), name_(std::move(name)),
      text_(std::move(text)) {

    if (unit_ == OffsetUnit::CodePoint) {
        unitToByte_.reserve(text_.size() + 1);
        for (size_t i = 0; i < text_.size(); ++i) {
            if (!isContinuationByte(static_cast<unsigned char>(text_[i])))
                unitToByte_.push_back(static_cast<uint32_t>(i));
        }
        length_ = static_cast<uint32_t>(unitToByte_.size());
        unitToByte_.push_back(static_cast<uint32_t>(text_.size()));
    } else {
        length_ = static_cast<uint32_t>(text_.size());
    }

    lineStarts_.push_back(0);
    for (size_t i = 0; i < text_.size(); ++i) {
        if (text_[i] == '\n')
            lineStarts_.push_back(fromByteOffset(i + 1));
    }
}

uint32_t SourceBuffer::fromByteOffset(size_t byteOffset) const {
    if (unit_ == OffsetUnit::Byte)
        return static_cast<uint32_t>(std::min(byteOffset, text_.size()));

    // Offsets inside a multi-byte sequence round down to its start.
    auto it = std::upper_bound(unitToByte_.begin(), unitToByte_.end(),
                               static_cast<uint32_t>(byteOffset));
    if (it == unitToByte_.begin())
        return 0;
    return static_cast<uint32_t>(std::distance(unitToByte_.begin(), it) - 1);
}

size_t SourceBuffer::toByteOffset(uint32_t offset) const {
    if (offset > length_)
        offset = length_;
    if (unit_ == OffsetUnit::Byte)
        return offset;
    return unitToByte_[offset];
}

Range SourceBuffer::range(uint32_t start, uint32_t end) const {
    Range R{role_, unit_, start, end};
    checkRange(R);
    return R;
}

void SourceBuffer::checkRange(const Range &R) const {
    if (R.unit != unit_)
        unitMismatch(*this, R, "offset unit differs from buffer");
    if (R.buffer != role_)
        unitMismatch(*this, R, "range belongs to another buffer");
    if (R.start > R.end || R.end > length_)
        unitMismatch(*this, R, "range exceeds buffer");
}

std::string_view SourceBuffer::slice(const Range &R) const {
    checkRange(R);
    size_t b = toByteOffset(R.start);
    size_t e = toByteOffset(R.end);
    return std::string_view(text_).substr(b, e - b);
}

LineColumn SourceBuffer::locate(uint32_t offset) const {
    offset = std::min(offset, length_);
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
    size_t lineIdx = static_cast<size_t>(std::distance(lineStarts_.begin(), it)) - 1;

    LineColumn lc;
    lc.line   = static_cast<unsigned>(lineIdx + 1);
    lc.column = offset - lineStarts_[lineIdx] + 1;
    return lc;
}

} // namespace liftfix
