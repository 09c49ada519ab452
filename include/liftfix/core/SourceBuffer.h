#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace liftfix {

// Unit every offset of a buffer, and of every range derived from it, is
// expressed in. Fixed when the buffer is created.
enum class OffsetUnit : uint8_t {
    Byte,
    CodePoint, // UTF-8 sequence starts
};

constexpr std::string_view offsetUnitName(OffsetUnit u) {
    switch (u) {
        case OffsetUnit::Byte:      return "byte";
        case OffsetUnit::CodePoint: return "codepoint";
    }
    return "byte";
}

// Identity of a buffer within one match: the file being fixed, or the fix
// pattern text.
enum class BufferRole : uint8_t {
    Target,
    Template,
};

constexpr std::string_view bufferRoleName(BufferRole r) {
    switch (r) {
        case BufferRole::Target:   return "target";
        case BufferRole::Template: return "template";
    }
    return "target";
}

// Half-open span [start, end) of one buffer.
struct Range {
    BufferRole buffer = BufferRole::Target;
    OffsetUnit unit   = OffsetUnit::Byte;
    uint32_t start    = 0;
    uint32_t end      = 0;

    uint32_t length() const { return end - start; }
    bool empty() const { return start == end; }
    bool contains(const Range &other) const {
        return buffer == other.buffer && start <= other.start &&
               other.end <= end;
    }

    bool operator==(const Range &) const = default;
};

struct LineColumn {
    unsigned line   = 1; // 1-based
    unsigned column = 1; // 1-based, in buffer units
};

// Immutable source text. All content needed for slicing and locating is
// materialized in the constructor, so a buffer can be read from any number
// of threads.
class SourceBuffer {
public:
    SourceBuffer(BufferRole role, std::string text,
                 OffsetUnit unit = OffsetUnit::Byte,
                 std::string name = {});

    BufferRole role() const { return role_; }
    OffsetUnit unit() const { return unit_; }
    const std::string &name() const { return name_; }
    std::string_view text() const { return text_; }

    // Length in buffer units.
    uint32_t length() const { return length_; }

    uint32_t fromByteOffset(size_t byteOffset) const;
    size_t toByteOffset(uint32_t offset) const;

    // Builds a range of this buffer. Offsets are in buffer units.
    Range range(uint32_t start, uint32_t end) const;
    Range whole() const { return range(0, length_); }

    // Verbatim text of R. R must belong to this buffer and use its unit;
    // anything else is an internal invariant violation and aborts.
    std::string_view slice(const Range &R) const;

    LineColumn locate(uint32_t offset) const;

    // Aborts unless R was produced for this buffer.
    void checkRange(const Range &R) const;

private:
    BufferRole role_;
    OffsetUnit unit_;
    std::string name_;
    std::string text_;
    uint32_t length_ = 0;

    // CodePoint buffers only: byte position of each unit, plus a sentinel.
    std::vector<uint32_t> unitToByte_;
    // Unit offset of each line start.
    std::vector<uint32_t> lineStarts_;
};

} // namespace liftfix
