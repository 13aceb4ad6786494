#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include "byte_range.h"

/// What a resumed run needs to finish assembling a file: where the pieces
/// are, where they go, and which ranges have not been merged yet.
struct MergeJournal {
    std::string target_path;
    std::string segment_dir;
    int64_t file_size = 0;
    int64_t max_chunk = 0;
    std::vector<ByteRange> pending;
};

class MergeJournalFile {
public:
    /// Serialize the journal to JSON and write it to file.
    static bool save(const std::string& journal_path, const MergeJournal& journal);

    /// Deserialize a journal. Returns nullopt if the file is missing, is not
    /// valid JSON, lacks a field, or lists an unparsable range.
    static std::optional<MergeJournal> load(const std::string& journal_path);

    /// Delete the journal from disk.
    static bool remove(const std::string& journal_path);
};
