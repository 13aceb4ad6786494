#include "segment_merger.h"
#include "logger.h"
#include "segment_store.h"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

// Open read/update without truncating; create the file first if needed.
// The target is unbuffered: a failed write must not leave bytes behind that a
// later seek would flush at another range's offset.
bool openTarget(std::fstream& target, const std::string& path) {
    target.rdbuf()->pubsetbuf(nullptr, 0);
    target.open(path, std::ios::in | std::ios::out | std::ios::binary);
    if (target.is_open()) {
        return true;
    }

    std::ofstream create(path, std::ios::out | std::ios::binary | std::ios::app);
    if (!create.is_open()) {
        return false;
    }
    create.close();

    target.clear();
    target.rdbuf()->pubsetbuf(nullptr, 0);
    target.open(path, std::ios::in | std::ios::out | std::ios::binary);
    return target.is_open();
}

} // namespace

SegmentMerger::SegmentMerger(LogSink* log, MergeOptions options)
    : log_(log)
    , options_(options)
{
    if (options_.buffer_size == 0) {
        options_.buffer_size = MergeOptions{}.buffer_size;
    }
}

std::vector<ByteRange> SegmentMerger::merge(const std::vector<ByteRange>& pending,
                                            const std::string& segment_dir,
                                            const std::string& target_path) const {
    return mergeWithReport(pending, segment_dir, target_path).pending;
}

MergeReport SegmentMerger::mergeWithReport(const std::vector<ByteRange>& pending,
                                           const std::string& segment_dir,
                                           const std::string& target_path) const {
    std::fstream target;
    if (!openTarget(target, target_path)) {
        if (log_) {
            log_->error("merge: cannot open target file " + target_path);
        }
        throw MergeError("cannot open target file for update: " + target_path, target_path);
    }

    SegmentStore store(segment_dir);
    MergeReport report;
    std::vector<char> buffer(options_.buffer_size);

    for (size_t i = 0; i < pending.size(); ++i) {
        const ByteRange& range = pending[i];
        const std::string name = toString(range);
        const std::string segment_path = store.pathFor(range);

        std::ifstream segment(segment_path, std::ios::in | std::ios::binary);
        if (!segment.is_open()) {
            if (log_) {
                log_->warn("merge: segment " + name + " missing or unreadable, left pending");
            }
            report.pending.push_back(range);
            continue;
        }

        // Offset writes past the current end leave a hole that reads as zeros.
        target.clear();
        target.seekp(static_cast<std::streamoff>(range.start), std::ios::beg);
        bool ok = static_cast<bool>(target);

        int64_t copied = 0;
        while (ok) {
            segment.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (segment.bad()) {
                ok = false;
                break;
            }
            std::streamsize got = segment.gcount();
            if (got > 0) {
                target.write(buffer.data(), got);
                if (!target) {
                    ok = false;
                    break;
                }
                copied += got;
            }
            if (segment.eof()) {
                break;
            }
            if (!segment) {
                ok = false;
            }
        }

        if (ok) {
            target.flush();
            ok = static_cast<bool>(target);
        }

        if (!ok) {
            if (log_) {
                log_->warn("merge: I/O error while merging segment " + name
                    + " into " + target_path + ", left pending");
            }
            report.pending.push_back(range);

            target.close();
            target.clear();
            if (!openTarget(target, target_path)) {
                if (log_) {
                    log_->error("merge: cannot reopen target file " + target_path
                        + ", remaining segments left pending");
                }
                report.pending.insert(report.pending.end(),
                                      pending.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                                      pending.end());
                break;
            }
            continue;
        }

        segment.close();
        report.merged.push_back(range);
        report.bytes_written += copied;

        if (log_) {
            log_->debug("merge: segment " + name + " written at offset "
                + std::to_string(range.start) + " (" + std::to_string(copied) + " bytes)");
        }

        if (options_.remove_merged_segments) {
            std::error_code ec;
            fs::remove(segment_path, ec);
            if (ec && log_) {
                log_->warn("merge: could not delete merged segment " + name + ": " + ec.message());
            }
        }
    }

    if (log_) {
        log_->info("merge: " + std::to_string(report.merged.size()) + " segment(s) merged into "
            + target_path + ", " + std::to_string(report.pending.size()) + " pending");
    }

    return report;
}
