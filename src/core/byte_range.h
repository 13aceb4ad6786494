#pragma once

#include <cstdint>
#include <string>

/// Inclusive byte span [start, end] of a file.
///
/// Serialized as "start-end", which is also the file name of the segment
/// holding those bytes. The pair (0, 0) doubles as the sentinel for an empty
/// file: a zero-byte download is still one trivial segment named "0-0".
struct ByteRange {
    int64_t start = 0;
    int64_t end = 0;

    /// True inclusive span, end - start + 1. No sentinel handling.
    int64_t length() const { return end - start + 1; }

    bool operator==(const ByteRange& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const ByteRange& other) const { return !(*this == other); }
    bool operator<(const ByteRange& other) const {
        return start < other.start || (start == other.start && end < other.end);
    }
};

/// "start-end"
std::string toString(const ByteRange& range);

/// Parse "start-end". Throws std::invalid_argument on anything else,
/// including negative numbers and end < start.
ByteRange parseRange(const std::string& text);

/// Byte length implied by a range string.
///
/// Returns end - start + 1, except 0 when end == 0 (empty-file sentinel).
/// A genuine one-byte file also serializes as "0-0" and reports 0 here;
/// callers that know the file size should use expectedSegmentSize().
int64_t rangeLength(const std::string& text);

/// Payload size of the segment for `range` in a file of `file_size` bytes:
/// 0 for an empty file, range.length() otherwise.
int64_t expectedSegmentSize(const ByteRange& range, int64_t file_size);
