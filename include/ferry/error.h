#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ferry {

// ---------------------------------------------------------------------------
// ErrorKind
// ---------------------------------------------------------------------------

/// Category of a failure, carried by exceptions and by per-file results.
enum class ErrorKind : uint8_t {
    Validation,   ///< Bad arguments or missing/invalid paths (fatal).
    Filesystem,   ///< I/O failure on one file (recoverable).
    Conflict,     ///< Deferred conflict with no decision available.
    Verification, ///< Post-transfer digest mismatch.
    Journal,      ///< Missing, corrupt or duplicate journal (fatal for replay).
    UndoConflict, ///< Current state diverged from the recorded digest.
    Dependency,   ///< Skipped because an earlier record in its chain failed.
};

/// Lowercase name used in journals and reports ("filesystem", ...).
const char* error_kind_name(ErrorKind kind);

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all ferry exceptions.
class FerryError : public std::runtime_error {
public:
    FerryError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const { return kind_; }
private:
    ErrorKind kind_;
};

// ---------------------------------------------------------------------------
// Specific exception types
// ---------------------------------------------------------------------------

/// Arguments or paths are invalid. Raised before any filesystem mutation.
class ValidationError : public FerryError {
public:
    explicit ValidationError(const std::string& msg)
        : FerryError(ErrorKind::Validation, "validation error: " + msg) {}
};

/// A filesystem operation on a single file failed.
class FilesystemError : public FerryError {
public:
    FilesystemError(const std::string& path, const std::string& msg)
        : FerryError(ErrorKind::Filesystem, "filesystem error: " + path + ": " + msg),
          path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// A conflict needed a decision that nobody could provide.
class ConflictError : public FerryError {
public:
    explicit ConflictError(const std::string& path)
        : FerryError(ErrorKind::Conflict, "unresolved conflict: " + path),
          path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// The transferred bytes do not hash to the source digest.
class VerificationError : public FerryError {
public:
    VerificationError(const std::string& path,
                      const std::string& expected,
                      const std::string& actual)
        : FerryError(ErrorKind::Verification,
                     "verification failed: " + path + " (expected " + expected +
                     ", got " + actual + ")"),
          path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// The journal is missing, unreadable, corrupt, or a process id collides.
class JournalError : public FerryError {
public:
    explicit JournalError(const std::string& msg)
        : FerryError(ErrorKind::Journal, "journal error: " + msg) {}
};

/// A file's current content no longer matches what the journal recorded.
class UndoConflictError : public FerryError {
public:
    UndoConflictError(const std::string& path, const std::string& msg)
        : FerryError(ErrorKind::UndoConflict, "state diverged: " + path + ": " + msg),
          path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

} // namespace ferry
