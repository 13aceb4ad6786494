#include "size_format.h"

#include <cmath>
#include <cstdio>

namespace {

constexpr int64_t KB = 1024;
constexpr int64_t MB = 1024 * KB;
constexpr int64_t GB = 1024 * MB;

std::string decimal(double value, int places) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", places, value);
    std::string s(buf);

    // "2.50" -> "2.5", "2.00" -> "2.0"
    while (s.size() >= 2 && s.back() == '0' && s[s.size() - 2] != '.') {
        s.pop_back();
    }
    return s;
}

} // namespace

std::string sizeFormat(int64_t size, const std::string& tail) {
    if (size == 0) {
        return "---";
    }

    std::string s;
    if (size < KB) {
        s = std::to_string(size) + " bytes";
    } else if (size < MB) {
        s = std::to_string(std::llround(static_cast<double>(size) / KB)) + " KB";
    } else if (size < GB) {
        s = decimal(static_cast<double>(size) / MB, 1) + " MB";
    } else {
        s = decimal(static_cast<double>(size) / GB, 2) + " GB";
    }
    return s + tail;
}
