#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/assembler_config.h"
#include "core/byte_range.h"
#include "core/logger.h"
#include "core/merge_journal.h"
#include "core/range_partitioner.h"
#include "core/segment_merger.h"
#include "core/segment_store.h"
#include "core/size_format.h"

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitPending = 2;

void printUsage() {
    std::cerr <<
        "usage: segasm [--config FILE] <command> [args]\n"
        "\n"
        "  split  <size> [max_chunk]                       print byte ranges\n"
        "  plan   <size> <segment_dir> <target> <journal>  start a merge journal\n"
        "  merge  <journal>                                merge pending segments\n"
        "  status <journal>                                show pending segments\n";
}

int64_t parseCount(const std::string& text, const char* what) {
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(what) + " is not a number: " + text);
    }
    if (used != text.size()) {
        throw std::invalid_argument(std::string(what) + " is not a number: " + text);
    }
    return value;
}

MergeJournal loadJournalOrThrow(const std::string& path) {
    auto journal = MergeJournalFile::load(path);
    if (!journal) {
        throw std::runtime_error("cannot read merge journal: " + path);
    }
    return *journal;
}

// ── commands ───────────────────────────────────────────────────

int cmdSplit(const std::vector<std::string>& args, const AssemblerConfig& config) {
    if (args.empty() || args.size() > 2) {
        printUsage();
        return kExitFailure;
    }
    int64_t size = parseCount(args[0], "size");
    int64_t chunk = args.size() == 2 ? parseCount(args[1], "max_chunk") : config.max_chunk_size;

    for (const auto& name : rangeNames(partitionRanges(size, chunk))) {
        std::cout << name << "\n";
    }
    return kExitOk;
}

int cmdPlan(const std::vector<std::string>& args, const AssemblerConfig& config, Logger& log) {
    if (args.size() != 4) {
        printUsage();
        return kExitFailure;
    }

    MergeJournal journal;
    journal.file_size   = parseCount(args[0], "size");
    journal.max_chunk   = config.max_chunk_size;
    journal.segment_dir = args[1];
    journal.target_path = args[2];
    journal.pending     = partitionRanges(journal.file_size, journal.max_chunk);

    fs::path target_dir = fs::path(journal.target_path).parent_path();
    if (target_dir.empty()) {
        target_dir = ".";
    }
    if (fs::weakly_canonical(journal.segment_dir) == fs::weakly_canonical(target_dir)) {
        throw std::invalid_argument("segment directory must differ from the target's directory");
    }
    fs::create_directories(journal.segment_dir);

    if (!MergeJournalFile::save(args[3], journal)) {
        log.error("cannot write merge journal " + args[3]);
        return kExitFailure;
    }

    log.info("planned " + std::to_string(journal.pending.size()) + " segment(s) for "
        + journal.target_path + " (" + sizeFormat(journal.file_size) + ")");
    for (const auto& r : journal.pending) {
        std::cout << toString(r) << "\n";
    }
    return kExitOk;
}

int cmdMerge(const std::vector<std::string>& args, const AssemblerConfig& config, Logger& log) {
    if (args.size() != 1) {
        printUsage();
        return kExitFailure;
    }
    const std::string& journal_path = args[0];
    MergeJournal journal = loadJournalOrThrow(journal_path);

    MergeOptions options;
    options.buffer_size = config.copy_buffer_size;
    options.remove_merged_segments = config.remove_merged_segments;

    SegmentMerger merger(&log, options);
    MergeReport report = merger.mergeWithReport(journal.pending, journal.segment_dir,
                                                journal.target_path);

    log.info("wrote " + sizeFormat(report.bytes_written) + " from "
        + std::to_string(report.merged.size()) + " segment(s)");

    if (report.complete()) {
        if (!MergeJournalFile::remove(journal_path)) {
            log.warn("could not remove merge journal " + journal_path);
        }
        if (config.remove_merged_segments) {
            SegmentStore(journal.segment_dir).removeAll(&log);
        }
        log.info(journal.target_path + " fully assembled");
        return kExitOk;
    }

    journal.pending = report.pending;
    if (!MergeJournalFile::save(journal_path, journal)) {
        log.error("cannot update merge journal " + journal_path);
        return kExitFailure;
    }
    for (const auto& r : report.pending) {
        std::cout << toString(r) << "\n";
    }
    return kExitPending;
}

int cmdStatus(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printUsage();
        return kExitFailure;
    }
    MergeJournal journal = loadJournalOrThrow(args[0]);
    SegmentStore store(journal.segment_dir);

    std::cout << "target:  " << journal.target_path << "\n"
              << "size:    " << sizeFormat(journal.file_size) << "\n"
              << "pending: " << journal.pending.size() << "\n";

    for (const auto& r : journal.pending) {
        const char* state = "ready";
        if (!store.missing({r}).empty()) {
            state = "missing";
        } else if (!store.verify(r, journal.file_size)) {
            state = "size mismatch";
        }
        std::cout << "  " << toString(r) << "  " << state << "\n";
    }
    return journal.pending.empty() ? kExitOk : kExitPending;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    Logger log;
    log.setEchoToStderr(true);

    try {
        AssemblerConfig config;
        if (args.size() >= 2 && args[0] == "--config") {
            config = loadConfig(args[1]);
            args.erase(args.begin(), args.begin() + 2);
        }

        log.setMinLevel(config.log_level);
        if (!log.setLogFile(config.log_file)) {
            log.warn("cannot open log file " + config.log_file);
        }

        if (args.empty()) {
            printUsage();
            return kExitFailure;
        }

        const std::string command = args[0];
        args.erase(args.begin());

        if (command == "split")  return cmdSplit(args, config);
        if (command == "plan")   return cmdPlan(args, config, log);
        if (command == "merge")  return cmdMerge(args, config, log);
        if (command == "status") return cmdStatus(args);

        printUsage();
        return kExitFailure;
    } catch (const MergeError& e) {
        log.error(e.what());
    } catch (const ConfigError& e) {
        log.error(e.what());
    } catch (const std::exception& e) {
        log.error(e.what());
    }
    return kExitFailure;
}
