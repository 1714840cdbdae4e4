#include "ferry/types.h"
#include "ferry/error.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace ferry {

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:   return "validation";
        case ErrorKind::Filesystem:   return "filesystem";
        case ErrorKind::Conflict:     return "conflict";
        case ErrorKind::Verification: return "verification";
        case ErrorKind::Journal:      return "journal";
        case ErrorKind::UndoConflict: return "undo_conflict";
        case ErrorKind::Dependency:   return "dependency";
    }
    return "unknown";
}

const char* hash_algorithm_name(HashAlgorithm algo) {
    switch (algo) {
        case HashAlgorithm::XxHash: return "xxhash";
        case HashAlgorithm::Blake3: return "blake3";
        case HashAlgorithm::Md5:    return "md5";
        case HashAlgorithm::Sha256: return "sha256";
        case HashAlgorithm::Sha512: return "sha512";
    }
    return "xxhash";
}

const char* conflict_mode_name(ConflictMode mode) {
    switch (mode) {
        case ConflictMode::Rename:    return "rename";
        case ConflictMode::Skip:      return "skip";
        case ConflictMode::Overwrite: return "overwrite";
        case ConflictMode::Defer:     return "defer";
    }
    return "rename";
}

const char* action_name(Action action) {
    switch (action) {
        case Action::Copy:  return "copy";
        case Action::Move:  return "move";
        case Action::Undo:  return "undo";
        case Action::Redo:  return "redo";
        case Action::Close: return "close";
    }
    return "copy";
}

const char* status_name(Status status) {
    switch (status) {
        case Status::Applied:           return "applied";
        case Status::Skipped:           return "skipped";
        case Status::Failed:            return "failed";
        case Status::SkippedDependency: return "skipped-due-to-dependency";
        case Status::Complete:          return "complete";
        case Status::Truncated:         return "truncated";
    }
    return "failed";
}

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::RunStarted:  return "run-started";
        case EventKind::FileStarted: return "file-started";
        case EventKind::FileApplied: return "file-applied";
        case EventKind::FileSkipped: return "file-skipped";
        case EventKind::FileFailed:  return "file-failed";
        case EventKind::RunFinished: return "run-finished";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Parsers
// ---------------------------------------------------------------------------

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

HashAlgorithm parse_hash_algorithm(const std::string& name) {
    std::string n = lower(name);
    if (n == "xxhash" || n == "xxh3" || n == "xxh128") return HashAlgorithm::XxHash;
    if (n == "blake3") return HashAlgorithm::Blake3;
    if (n == "md5")    return HashAlgorithm::Md5;
    if (n == "sha256") return HashAlgorithm::Sha256;
    if (n == "sha512") return HashAlgorithm::Sha512;
    throw ValidationError("unknown hash algorithm '" + name + "'");
}

ConflictMode parse_conflict_mode(const std::string& name) {
    std::string n = lower(name);
    if (n == "rename")    return ConflictMode::Rename;
    if (n == "skip")      return ConflictMode::Skip;
    if (n == "overwrite") return ConflictMode::Overwrite;
    if (n == "defer" || n == "prompt") return ConflictMode::Defer;
    throw ValidationError("unknown conflict mode '" + name + "'");
}

Action parse_action(const std::string& name) {
    if (name == "copy")  return Action::Copy;
    if (name == "move")  return Action::Move;
    if (name == "undo")  return Action::Undo;
    if (name == "redo")  return Action::Redo;
    if (name == "close") return Action::Close;
    throw JournalError("unknown action '" + name + "'");
}

Status parse_status(const std::string& name) {
    if (name == "applied")                   return Status::Applied;
    if (name == "skipped")                   return Status::Skipped;
    if (name == "failed")                    return Status::Failed;
    if (name == "skipped-due-to-dependency") return Status::SkippedDependency;
    if (name == "complete")                  return Status::Complete;
    if (name == "truncated")                 return Status::Truncated;
    throw JournalError("unknown status '" + name + "'");
}

// ---------------------------------------------------------------------------
// Digest
// ---------------------------------------------------------------------------

std::string Digest::hex() const {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += digits[(b >> 4) & 0xF];
        out += digits[b & 0xF];
    }
    return out;
}

Digest Digest::from_hex(HashAlgorithm algo, const std::string& hex) {
    auto nibble = [&](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw JournalError("invalid digest: " + hex);
    };
    if (hex.size() % 2 != 0) throw JournalError("invalid digest: " + hex);

    Digest d;
    d.algorithm = algo;
    d.bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        d.bytes.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return d;
}

// ---------------------------------------------------------------------------
// TransferOptions
// ---------------------------------------------------------------------------

void TransferOptions::validate() const {
    if (chunk_size == 0) throw ValidationError("chunk size must be greater than zero");
    if (workers == 0)    throw ValidationError("worker count must be greater than zero");
    if (process_id) {
        const std::string& id = *process_id;
        if (id.empty() || id == "." || id == ".." ||
            id.find('/') != std::string::npos || id.find('\\') != std::string::npos) {
            throw ValidationError("invalid process id '" + id + "'");
        }
    }
}

} // namespace ferry
