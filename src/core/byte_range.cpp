#include "byte_range.h"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace {

// Strict non-negative decimal; std::stoll would accept signs, blanks and
// trailing garbage.
int64_t parseOffset(const std::string& digits, const std::string& text) {
    if (digits.empty()) {
        throw std::invalid_argument("malformed range: \"" + text + "\"");
    }
    int64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("malformed range: \"" + text + "\"");
        }
        int digit = c - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            throw std::invalid_argument("range offset overflows: \"" + text + "\"");
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace

std::string toString(const ByteRange& range) {
    return std::to_string(range.start) + "-" + std::to_string(range.end);
}

ByteRange parseRange(const std::string& text) {
    auto dash = text.find('-');
    if (dash == std::string::npos) {
        throw std::invalid_argument("malformed range: \"" + text + "\"");
    }

    ByteRange range;
    range.start = parseOffset(text.substr(0, dash), text);
    range.end   = parseOffset(text.substr(dash + 1), text);

    if (range.end < range.start) {
        throw std::invalid_argument("range end precedes start: \"" + text + "\"");
    }
    return range;
}

int64_t rangeLength(const std::string& text) {
    ByteRange range = parseRange(text);
    return range.end > 0 ? range.length() : 0;
}

int64_t expectedSegmentSize(const ByteRange& range, int64_t file_size) {
    return file_size == 0 ? 0 : range.length();
}
