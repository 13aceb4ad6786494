#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include "byte_range.h"

/// Split a file into download ranges.
///
/// @param file_size  Total file size in bytes (must be >= 0).
/// @param max_chunk  Largest range to hand to one connection (must be > 0).
/// @return Ranges ordered by offset.
///
/// Behaviour:
///  - file_size == 0 yields the single sentinel range (0, 0).
///  - If the file holds fewer than two full chunks, one range covers
///    [0, file_size-1] and the remainder is folded into it.
///  - Otherwise ranges are max_chunk bytes long and the last one ends
///    at file_size-1, possibly shorter.
///  - Ranges are contiguous: r[i].end + 1 == r[i+1].start.
///
/// Throws std::invalid_argument for negative sizes or non-positive chunks.
std::vector<ByteRange> partitionRanges(int64_t file_size, int64_t max_chunk);

/// Serialized names of the given ranges, in order.
std::vector<std::string> rangeNames(const std::vector<ByteRange>& ranges);
