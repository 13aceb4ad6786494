#include "segment_store.h"
#include "logger.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

SegmentStore::SegmentStore(std::string segment_dir)
    : dir_(std::move(segment_dir))
{
}

std::string SegmentStore::pathFor(const ByteRange& range) const {
    return (fs::path(dir_) / toString(range)).string();
}

std::vector<ByteRange> SegmentStore::list() const {
    std::vector<ByteRange> ranges;

    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return ranges;
    }

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        try {
            ranges.push_back(parseRange(entry.path().filename().string()));
        } catch (const std::invalid_argument&) {
            // Not a segment (journal, temp file, ...).
        }
    }

    std::sort(ranges.begin(), ranges.end());
    return ranges;
}

std::vector<ByteRange> SegmentStore::missing(const std::vector<ByteRange>& ranges) const {
    std::vector<ByteRange> result;
    for (const auto& r : ranges) {
        std::error_code ec;
        if (!fs::is_regular_file(pathFor(r), ec)) {
            result.push_back(r);
        }
    }
    return result;
}

bool SegmentStore::verify(const ByteRange& range, int64_t file_size) const {
    std::error_code ec;
    auto actual = fs::file_size(pathFor(range), ec);
    if (ec) {
        return false;
    }
    return static_cast<int64_t>(actual) == expectedSegmentSize(range, file_size);
}

bool SegmentStore::removeAll(LogSink* log) const {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        if (log) {
            log->error("failed to remove segment directory " + dir_ + ": " + ec.message());
        }
        return false;
    }
    return true;
}
