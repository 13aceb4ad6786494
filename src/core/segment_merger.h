#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "byte_range.h"

class LogSink;

/// Thrown when the target file cannot be opened or created. Nothing has been
/// merged when this escapes, so the caller's pending set is still accurate.
class MergeError : public std::runtime_error {
public:
    MergeError(const std::string& what, const std::string& path)
        : std::runtime_error(what), path_(path) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

struct MergeOptions {
    size_t buffer_size = 256 * 1024;     // bytes copied per read/write
    bool remove_merged_segments = true;  // delete a segment once it is in the target
};

/// Outcome of one merge pass.
struct MergeReport {
    std::vector<ByteRange> merged;   // written to the target in this pass
    std::vector<ByteRange> pending;  // still to be retried, input order kept
    int64_t bytes_written = 0;

    bool complete() const { return pending.empty(); }
};

/// Copies downloaded segments into the target file at their absolute offsets.
///
/// One pass owns the target file for its duration: passes over the same
/// target must not run concurrently.
class SegmentMerger {
public:
    explicit SegmentMerger(LogSink* log = nullptr, MergeOptions options = {});

    /// Merge every range of `pending` whose segment file under `segment_dir`
    /// can be read, and return the ranges that could not be merged.
    ///
    /// A missing or unreadable segment, or a failed write, leaves only that
    /// range pending; the pass continues with the next one. Running merge
    /// again with the returned set retries just those ranges.
    ///
    /// Throws MergeError if `target_path` cannot be opened for update.
    std::vector<ByteRange> merge(const std::vector<ByteRange>& pending,
                                 const std::string& segment_dir,
                                 const std::string& target_path) const;

    /// Same as merge(), also reporting what was written.
    MergeReport mergeWithReport(const std::vector<ByteRange>& pending,
                                const std::string& segment_dir,
                                const std::string& target_path) const;

private:
    LogSink* log_;          // non-owning, may be nullptr
    MergeOptions options_;
};
