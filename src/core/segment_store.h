#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "byte_range.h"

class LogSink;

/// On-disk layout of downloaded segments: one file per range, named by the
/// range's serialized form, inside a working directory that is distinct from
/// the target file's directory.
class SegmentStore {
public:
    explicit SegmentStore(std::string segment_dir);

    const std::string& directory() const { return dir_; }

    /// segment_dir/"start-end"
    std::string pathFor(const ByteRange& range) const;

    /// Ranges of every regular file whose name parses as a range, sorted by
    /// offset. Other files are skipped. A missing directory yields nothing.
    std::vector<ByteRange> list() const;

    /// Subset of `ranges` (order kept) whose segment file does not exist.
    std::vector<ByteRange> missing(const std::vector<ByteRange>& ranges) const;

    /// True if the segment exists and holds exactly
    /// expectedSegmentSize(range, file_size) bytes.
    bool verify(const ByteRange& range, int64_t file_size) const;

    /// Recursively delete the working directory. A missing directory counts
    /// as success. Failures are logged through `log` when non-null.
    bool removeAll(LogSink* log = nullptr) const;

private:
    std::string dir_;
};
