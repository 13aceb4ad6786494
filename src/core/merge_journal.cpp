#include "merge_journal.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdio>
#include <stdexcept>

using json = nlohmann::json;

// ── JSON serialization helpers ─────────────────────────────────

static json journalToJson(const MergeJournal& journal) {
    json pending_arr = json::array();
    for (const auto& r : journal.pending) {
        pending_arr.push_back(toString(r));
    }
    return json{
        {"target_path", journal.target_path},
        {"segment_dir", journal.segment_dir},
        {"file_size",   journal.file_size},
        {"max_chunk",   journal.max_chunk},
        {"pending",     pending_arr}
    };
}

static MergeJournal journalFromJson(const json& j) {
    MergeJournal journal;
    journal.target_path = j.at("target_path").get<std::string>();
    journal.segment_dir = j.at("segment_dir").get<std::string>();
    journal.file_size   = j.at("file_size").get<int64_t>();
    journal.max_chunk   = j.at("max_chunk").get<int64_t>();
    if (journal.file_size < 0 || journal.max_chunk < 0) {
        throw std::invalid_argument("negative file_size or max_chunk");
    }
    for (const auto& rj : j.at("pending")) {
        ByteRange range = parseRange(rj.get<std::string>());
        // "0-0" is the only range an empty file has.
        int64_t last_byte = journal.file_size == 0 ? 0 : journal.file_size - 1;
        if (range.end > last_byte) {
            throw std::invalid_argument("range past end of file: " + toString(range));
        }
        journal.pending.push_back(range);
    }
    return journal;
}

// ── MergeJournalFile implementation ────────────────────────────

bool MergeJournalFile::save(const std::string& journal_path, const MergeJournal& journal) {
    std::ofstream ofs(journal_path);
    if (!ofs.is_open()) {
        return false;
    }
    ofs << journalToJson(journal).dump(4);
    return ofs.good();
}

std::optional<MergeJournal> MergeJournalFile::load(const std::string& journal_path) {
    std::ifstream ifs(journal_path);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    try {
        json j = json::parse(ifs);
        return journalFromJson(j);
    } catch (const json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

bool MergeJournalFile::remove(const std::string& journal_path) {
    return std::remove(journal_path.c_str()) == 0;
}
