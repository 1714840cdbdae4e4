#pragma once

#include "error.h"
#include "types.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

// ---------------------------------------------------------------------------
// Line codec
// ---------------------------------------------------------------------------

namespace journal {

/// Encode a record as one JSON object (no trailing newline).
std::string encode(const OperationRecord& rec);

/// Decode one line. Returns nullopt for malformed or incomplete lines.
std::optional<OperationRecord> decode(const std::string& line);

/// Read every well-formed record in a journal file, in file order.
/// Malformed lines (such as a torn final line) are skipped.
/// @throws JournalError if the file does not exist or cannot be read.
std::vector<OperationRecord> read_all(const std::filesystem::path& path);

/// Summaries of every run recorded in a journal file, in first-seen order.
/// @throws JournalError if the file does not exist or cannot be read.
std::vector<JournalSummary> list_runs(const std::filesystem::path& path);

} // namespace journal

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

/// Append-only record log for one process identifier.
///
/// Records are held in memory and, when a path is given, appended to a JSON
/// Lines file shared by any number of runs. Appends are serialized by a mutex
/// within the process and by an advisory lock across processes.
///
/// Forward runs reserve sequence numbers when work is scheduled and commit
/// records as work completes; commits are written strictly in sequence order.
///
/// @code
///     ferry::Journal j("run-1", "/var/lib/ferry/journal.jsonl");
///     auto seq = j.reserve_seq();
///     rec.seq = seq;
///     j.commit(rec);
///     j.close(false);
/// @endcode
class Journal {
public:
    /// Start a new journal for `process_id`.
    /// @throws JournalError if `path` already holds records for `process_id`
    ///         or cannot be opened for appending.
    Journal(std::string process_id, std::optional<std::filesystem::path> path);

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    /// Open the records of an existing run for replay.
    /// @throws JournalError if the file is missing/unreadable or holds no
    ///         records for `process_id`.
    static std::unique_ptr<Journal> load(const std::filesystem::path& path,
                                         const std::string& process_id);

    const std::string& process_id() const { return pid_; }
    const std::optional<std::filesystem::path>& path() const { return path_; }

    /// Directory holding files displaced by overwrites, or nullopt for an
    /// in-memory journal.
    std::optional<std::filesystem::path> backup_dir() const;

    /// Assign the next sequence number to a piece of scheduled work.
    uint64_t reserve_seq();

    /// Hand in the finished record for a reserved sequence number.
    /// Records are appended once every lower reserved number is in.
    /// A failed write does not throw; see failed().
    /// @throws JournalError if `rec.seq` was not reserved or is already in.
    void commit(OperationRecord rec);

    /// Assign a sequence number and append immediately.
    /// A failed write does not throw; see failed().
    OperationRecord append(OperationRecord rec);

    /// Append the close marker (Complete or Truncated). A journal that
    /// failed() always closes as Truncated.
    void close(bool truncated);

    /// True once a write to the journal file has failed. From then on records
    /// are only kept in memory and the file is left as it was.
    bool failed() const;

    /// The error that made the journal fail, if any.
    std::optional<std::string> failure() const;

    /// Status of the first close marker, or nullopt if never closed.
    std::optional<Status> close_status() const;

    /// Snapshot of all appended records, in sequence order.
    std::vector<OperationRecord> records() const;

private:
    struct LoadTag {};
    Journal(LoadTag, std::string process_id, std::filesystem::path path,
            std::vector<OperationRecord> existing);

    /// Write every pending record whose turn has come. Caller holds mutex_.
    void flush_locked();

    /// Write `rec` unless the journal is in-memory or has failed; a write
    /// error marks the journal failed.
    void persist_locked(const OperationRecord& rec);

    /// @throws JournalError
    void write_locked(const OperationRecord& rec);

    std::string                             pid_;
    std::optional<std::filesystem::path>    path_;
    mutable std::mutex                      mutex_;
    std::vector<OperationRecord>            records_;
    std::map<uint64_t, OperationRecord>     pending_;
    uint64_t                                next_seq_   = 1;
    uint64_t                                next_write_ = 1;
    std::optional<Status>                   closed_;
    bool                                    failed_ = false;
    std::string                             failure_;
};

} // namespace ferry
