#pragma once

#include "error.h"
#include "types.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace ferry {

// ---------------------------------------------------------------------------
// TransferSettings / TransferOutcome
// ---------------------------------------------------------------------------

struct TransferSettings {
    bool          dry_run       = false;
    bool          preserve_meta = true;
    bool          verify        = false;
    HashAlgorithm algorithm     = HashAlgorithm::XxHash;
    size_t        chunk_size    = DEFAULT_CHUNK_SIZE;
};

/// Side effects of one transfer, as recorded in the journal.
struct TransferOutcome {
    std::optional<std::filesystem::path> backup;       ///< Where the replaced file went.
    std::vector<std::filesystem::path>   created_dirs; ///< Outermost first.
};

// ---------------------------------------------------------------------------
// TransferExecutor
// ---------------------------------------------------------------------------

/// Performs single-file copies and moves.
///
/// Data is written to a temporary sibling of the target and renamed into
/// place, so an interrupted or failed transfer never leaves a partial file at
/// the target. A move deletes its source only after the target is in place.
class TransferExecutor {
public:
    explicit TransferExecutor(TransferSettings settings);

    const TransferSettings& settings() const { return settings_; }

    /// Copy or move `source` to `target`.
    ///
    /// When `backup_to` is set and `target` exists, the existing file is moved
    /// there first; on failure it is put back. Without `backup_to` an
    /// existing target is replaced atomically.
    ///
    /// With settings().verify the written bytes are re-hashed and compared
    /// with `expected` before they are placed.
    ///
    /// In dry-run mode nothing is touched and an empty outcome is returned.
    ///
    /// @throws FilesystemError on I/O failure.
    /// @throws VerificationError on digest mismatch (source left intact).
    TransferOutcome transfer(Action action,
                             const std::filesystem::path& source,
                             const std::filesystem::path& target,
                             const Digest& expected,
                             const std::optional<std::filesystem::path>& backup_to = std::nullopt) const;

    // -- Primitives shared with undo / redo ----------------------------------

    /// Create missing parent directories of `file`.
    /// Returns the directories created, outermost first.
    static std::vector<std::filesystem::path>
    make_parents(const std::filesystem::path& file);

    /// Move `from` to `to` by rename, falling back to copy + remove across
    /// filesystems. `to` must not exist.
    /// @throws FilesystemError
    void relocate(const std::filesystem::path& from,
                  const std::filesystem::path& to) const;

    /// Remove a regular file.
    /// @throws FilesystemError
    static void remove_file(const std::filesystem::path& path);

    /// Remove each directory that is empty, deepest first. Failures are
    /// logged and ignored.
    static void prune_dirs(std::vector<std::filesystem::path> dirs);

private:
    /// Write `source` to a temporary sibling of `target`, optionally verify
    /// it against `verify_against`, then rename it into place.
    void copy_into(const std::filesystem::path& source,
                   const std::filesystem::path& target,
                   const Digest* verify_against,
                   bool preserve_meta) const;

    TransferSettings settings_;
};

} // namespace ferry
