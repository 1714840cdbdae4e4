#pragma once

#include "error.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

/// Default read buffer for fingerprinting and copying (1 MiB).
constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

// ---------------------------------------------------------------------------
// Enumerations
// ---------------------------------------------------------------------------

/// Content digest algorithms.
enum class HashAlgorithm : uint8_t {
    XxHash, ///< XXH3 128-bit, fast, non-cryptographic (default).
    Blake3, ///< BLAKE3 256-bit.
    Md5,    ///< MD5 128-bit.
    Sha256, ///< SHA-256.
    Sha512, ///< SHA-512.
};

/// Policy applied when a destination path is occupied.
enum class ConflictMode : uint8_t {
    Rename,    ///< Pick the first free "name (n).ext".
    Skip,      ///< Leave the destination untouched.
    Overwrite, ///< Replace the destination.
    Defer,     ///< Ask the caller's decision callback.
};

/// Journaled action.
enum class Action : uint8_t {
    Copy,
    Move,
    Undo,
    Redo,
    Close, ///< End-of-run marker; status is Complete or Truncated.
};

/// Outcome of a journaled action.
enum class Status : uint8_t {
    Applied,
    Skipped,
    Failed,
    SkippedDependency, ///< "skipped-due-to-dependency"
    Complete,          ///< Close marker: run finished normally.
    Truncated,         ///< Close marker: run was cancelled.
};

const char* hash_algorithm_name(HashAlgorithm algo);
const char* conflict_mode_name(ConflictMode mode);
const char* action_name(Action action);
const char* status_name(Status status);

/// Parse "xxhash", "blake3", "md5", "sha256", "sha512" (case-insensitive).
/// @throws ValidationError for unknown names.
HashAlgorithm parse_hash_algorithm(const std::string& name);

/// Parse "rename", "skip", "overwrite", "defer" ("prompt" is an alias of defer).
/// @throws ValidationError for unknown names.
ConflictMode parse_conflict_mode(const std::string& name);

/// @throws JournalError for unknown names.
Action parse_action(const std::string& name);

/// @throws JournalError for unknown names.
Status parse_status(const std::string& name);

// ---------------------------------------------------------------------------
// Digest
// ---------------------------------------------------------------------------

/// Algorithm-tagged content identity. Two files hold the same content iff
/// their digests compare equal.
struct Digest {
    HashAlgorithm        algorithm = HashAlgorithm::XxHash;
    std::vector<uint8_t> bytes;

    bool empty() const { return bytes.empty(); }

    /// Lowercase hex rendering of `bytes`.
    std::string hex() const;

    /// Parse a hex string produced by hex().
    /// @throws JournalError on malformed input.
    static Digest from_hex(HashAlgorithm algo, const std::string& hex);

    bool operator==(const Digest& o) const {
        return algorithm == o.algorithm && bytes == o.bytes;
    }
    bool operator!=(const Digest& o) const { return !(*this == o); }
};

// ---------------------------------------------------------------------------
// CandidateEntry
// ---------------------------------------------------------------------------

/// A file selected by the filter. Not persisted.
struct CandidateEntry {
    std::filesystem::path           path;     ///< Absolute path on disk.
    std::filesystem::path           relative; ///< Path relative to the source root.
    uint64_t                        size = 0;
    std::filesystem::file_time_type mtime{};
};

// ---------------------------------------------------------------------------
// OperationRecord
// ---------------------------------------------------------------------------

/// One journal line. Immutable once appended.
struct OperationRecord {
    uint64_t    seq = 0;
    std::string pid;
    Action      action = Action::Copy;
    std::string src;
    std::string dest;
    Digest      digest;
    Status      status = Status::Applied;
    uint64_t    timestamp = 0;            ///< POSIX epoch milliseconds.

    std::optional<uint64_t>    ref;       ///< Original seq (undo/redo only).
    bool                       dry_run = false;
    std::optional<std::string> reason;    ///< Why skipped or failed.
    std::optional<ErrorKind>   error;     ///< Failure category.
    std::optional<std::string> backup;    ///< Preserved overwritten destination.
    std::vector<std::string>   created_dirs; ///< Directories created, outermost first.
};

// ---------------------------------------------------------------------------
// RunResult
// ---------------------------------------------------------------------------

/// A per-file failure.
struct FailedEntry {
    std::string path;
    ErrorKind   kind;
    std::string reason;
};

/// Summary returned by copy / move / undo / redo.
struct RunResult {
    std::string                  process_id;
    size_t                       total   = 0;
    size_t                       applied = 0;
    size_t                       skipped = 0;
    size_t                       failed  = 0;
    std::vector<FailedEntry>     failures;
    std::vector<OperationRecord> records;  ///< Per-file outcomes, in seq order.
    bool                         truncated = false; ///< Cancelled before completion.

    bool ok() const { return failed == 0; }
};

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

enum class EventKind : uint8_t {
    RunStarted,
    FileStarted,
    FileApplied,
    FileSkipped,
    FileFailed,
    RunFinished,
};

const char* event_kind_name(EventKind kind);

/// Structured progress notification emitted by the engine.
struct Event {
    EventKind   kind;
    std::string process_id;
    uint64_t    seq = 0;          ///< 0 for run-level events.
    Action      action = Action::Copy;
    std::string src;
    std::string dest;
    std::string message;
};

/// Receives events. May be invoked from worker threads, one call at a time.
using EventSink = std::function<void(const Event&)>;

// ---------------------------------------------------------------------------
// Conflict decisions
// ---------------------------------------------------------------------------

/// What the decision callback is told about a collision.
struct ConflictContext {
    std::filesystem::path source;
    std::filesystem::path destination; ///< The occupied target path.
    Digest                source_digest;
    uint64_t              source_size = 0;
    uint64_t              destination_size = 0;
};

/// The callback's answer. `apply_to_all` makes the decision sticky for the
/// rest of the run.
struct ConflictAnswer {
    ConflictMode decision     = ConflictMode::Skip;
    bool         apply_to_all = false;
};

/// Decision strategy for ConflictMode::Defer. With several workers it may be
/// called from more than one thread at a time; no engine lock is held
/// during the call.
using DecisionCallback = std::function<ConflictAnswer(const ConflictContext&)>;

// ---------------------------------------------------------------------------
// CancelToken
// ---------------------------------------------------------------------------

/// Shared cancellation flag. cancel() may be called from any thread.
class CancelToken {
public:
    void cancel() { flag_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return flag_.load(std::memory_order_relaxed); }
private:
    std::atomic<bool> flag_{false};
};

// ---------------------------------------------------------------------------
// TransferOptions
// ---------------------------------------------------------------------------

/// Options for copy() and move().
struct TransferOptions {
    ConflictMode  resolve         = ConflictMode::Rename;
    HashAlgorithm algorithm       = HashAlgorithm::XxHash;
    size_t        chunk_size      = DEFAULT_CHUNK_SIZE;
    bool          dry_run         = false;
    bool          preserve_meta   = true;
    bool          verify          = false;
    bool          recurse         = false;
    bool          recursive_check = false; ///< Dedup against the whole destination tree.
    bool          has_extension   = false; ///< Match patterns against the extension only.
    bool          no_create       = false; ///< Destination root must already exist.

    std::optional<std::vector<std::string>> include_regex;
    std::optional<std::vector<std::string>> exclude_regex;
    std::optional<std::vector<std::string>> include_glob;
    std::optional<std::vector<std::string>> exclude_glob;

    std::optional<std::filesystem::path> journal;    ///< JSON Lines file; in-memory if unset.
    std::optional<std::string>           process_id; ///< Generated if unset.
    size_t                               workers = 1;

    DecisionCallback             on_conflict;
    EventSink                    on_event;
    std::shared_ptr<CancelToken> cancel;

    /// @throws ValidationError on chunk_size == 0 or workers == 0.
    void validate() const;
};

// ---------------------------------------------------------------------------
// ReplayOptions
// ---------------------------------------------------------------------------

/// Options for undo() and redo().
struct ReplayOptions {
    std::optional<std::filesystem::path> journal;
    bool                                 force      = false; ///< Ignore digest guards.
    bool                                 dry_run    = false;
    size_t                               chunk_size = DEFAULT_CHUNK_SIZE;

    EventSink                    on_event;
    std::shared_ptr<CancelToken> cancel;
};

// ---------------------------------------------------------------------------
// JournalSummary
// ---------------------------------------------------------------------------

/// One run found in a journal file.
struct JournalSummary {
    std::string             process_id;
    uint64_t                started = 0;  ///< Timestamp of the first record.
    uint64_t                finished = 0; ///< Timestamp of the last record.
    size_t                  operations = 0; ///< Copy/move records.
    std::optional<Status>   closed;       ///< Complete / Truncated, nullopt if never closed.
};

} // namespace ferry
