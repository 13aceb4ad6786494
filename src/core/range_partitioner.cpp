#include "range_partitioner.h"

#include <algorithm>
#include <stdexcept>

std::vector<ByteRange> partitionRanges(int64_t file_size, int64_t max_chunk) {
    if (file_size < 0) {
        throw std::invalid_argument("file_size must be >= 0");
    }
    if (max_chunk <= 0) {
        throw std::invalid_argument("max_chunk must be > 0");
    }

    std::vector<ByteRange> ranges;

    // Empty file → one trivial segment.
    if (file_size == 0) {
        ranges.push_back(ByteRange{0, 0});
        return ranges;
    }

    int64_t span = std::min(max_chunk, file_size);
    int64_t num_chunks = std::max<int64_t>(file_size / span, 1);

    // Fewer than two full chunks: one range, remainder folded in.
    if (num_chunks == 1) {
        ranges.push_back(ByteRange{0, file_size - 1});
        return ranges;
    }

    ranges.reserve(static_cast<size_t>(num_chunks + 1));

    int64_t last_byte = file_size - 1;
    int64_t offset = 0;
    for (;;) {
        int64_t end = (last_byte - offset < span) ? last_byte : offset + span - 1;
        ranges.push_back(ByteRange{offset, end});
        if (end == last_byte) {
            break;
        }
        offset = end + 1;
    }

    return ranges;
}

std::vector<std::string> rangeNames(const std::vector<ByteRange>& ranges) {
    std::vector<std::string> names;
    names.reserve(ranges.size());
    for (const auto& r : ranges) {
        names.push_back(toString(r));
    }
    return names;
}
