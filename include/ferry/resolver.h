#pragma once

#include "error.h"
#include "types.h"

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ferry {

// ---------------------------------------------------------------------------
// DedupIndex
// ---------------------------------------------------------------------------

/// Digest → paths index of files already under a destination tree.
/// Thread-safe.
///
/// Parallel workers go through claim(): the first caller to present a digest
/// owns it until it settles (the transfer landed) or releases it (it did
/// not). Later callers with the same digest wait for that outcome, so one
/// content is placed at most once per run.
class DedupIndex {
public:
    DedupIndex() = default;
    DedupIndex(const DedupIndex&) = delete;
    DedupIndex& operator=(const DedupIndex&) = delete;

    /// Fingerprint every regular file under `root` (recursively, symlinks not
    /// followed). Unreadable files are logged and left out.
    void scan(const std::filesystem::path& root,
              HashAlgorithm algo,
              size_t chunk_size = DEFAULT_CHUNK_SIZE);

    void add(const Digest& digest, const std::filesystem::path& path);

    /// Some path whose content has `digest`, if any. Unsettled claims are
    /// not reported.
    std::optional<std::filesystem::path> find(const Digest& digest) const;

    /// Return a path already holding `digest`, or claim the digest for
    /// `path` and return nullopt. Blocks while another claim on the same
    /// digest is outstanding.
    std::optional<std::filesystem::path> claim(const Digest& digest,
                                               const std::filesystem::path& path);

    /// Complete a claim: the content now lives at `path`.
    void settle(const Digest& digest, const std::filesystem::path& path);

    /// Drop a claim without recording a path.
    void release(const Digest& digest);

    size_t size() const;

private:
    struct Slot {
        std::vector<std::filesystem::path> paths;
        bool                               pending = false;
    };

    mutable std::mutex              mutex_;
    std::condition_variable         settled_;
    std::map<std::string, Slot>     by_digest_;
    size_t                          count_ = 0;
};

// ---------------------------------------------------------------------------
// NameReservations
// ---------------------------------------------------------------------------

/// Destination names claimed by the current run. Reservations last for the
/// whole run so dry runs and parallel workers never pick the same name.
class NameReservations {
public:
    NameReservations() = default;
    NameReservations(const NameReservations&) = delete;
    NameReservations& operator=(const NameReservations&) = delete;

    /// Claim `path` if no file exists there and nobody reserved it.
    bool try_reserve(const std::filesystem::path& path);

    /// Claim `path` even though a file exists there (overwrite).
    /// Returns false if another file of this run already claimed it.
    bool claim_existing(const std::filesystem::path& path);

    /// Claim the first free "stem (n).ext" next to `target`, n = 1, 2, ...
    std::filesystem::path reserve_renamed(const std::filesystem::path& target);

    bool reserved(const std::filesystem::path& path) const;

private:
    mutable std::mutex              mutex_;
    std::set<std::filesystem::path> reserved_;
};

// ---------------------------------------------------------------------------
// ConflictResolver
// ---------------------------------------------------------------------------

/// Where a candidate ends up.
struct Resolution {
    enum class Kind : uint8_t {
        Place,   ///< Target is free.
        Replace, ///< Target exists and will be overwritten.
        Skip,    ///< Nothing to do.
    };

    Kind                  kind = Kind::Place;
    std::filesystem::path target;
    std::string           reason; ///< Set for Skip.
};

/// Per-candidate conflict state machine.
///
/// Identical content at the colliding location (or, with a DedupIndex,
/// anywhere under the destination) always resolves to Skip. Otherwise the
/// configured ConflictMode applies; Defer consults the DecisionCallback,
/// once per conflicting file, unless an earlier answer was marked
/// apply_to_all. The callback is invoked with no resolver lock held.
///
/// With a DedupIndex, a Place or Replace result leaves the digest claimed in
/// the index; the caller settles or releases it once the transfer is done.
class ConflictResolver {
public:
    ConflictResolver(ConflictMode mode,
                     HashAlgorithm algo,
                     size_t chunk_size,
                     DecisionCallback on_conflict,
                     NameReservations& names,
                     DedupIndex* index = nullptr);

    ConflictResolver(const ConflictResolver&) = delete;
    ConflictResolver& operator=(const ConflictResolver&) = delete;

    /// Decide what happens to `candidate` (whose content is `digest`) headed
    /// for `target`.
    /// @throws ConflictError if Defer has no callback, or the callback defers.
    /// @throws FilesystemError if the occupied target cannot be inspected.
    /// Any index claim is released before an exception leaves.
    Resolution resolve(const CandidateEntry& candidate,
                       const Digest& digest,
                       const std::filesystem::path& target);

private:
    /// Name resolution proper. Sets `identical` when the target already
    /// holds the same bytes.
    Resolution place(const CandidateEntry& candidate,
                     const Digest& digest,
                     const std::filesystem::path& target,
                     bool& identical);

    ConflictMode decide(const CandidateEntry& candidate,
                        const Digest& digest,
                        const std::filesystem::path& target);

    ConflictMode                mode_;
    HashAlgorithm               algo_;
    size_t                      chunk_size_;
    DecisionCallback            on_conflict_;
    NameReservations&           names_;
    DedupIndex*                 index_;
    std::mutex                  decision_mutex_;
    std::optional<ConflictMode> sticky_;
};

} // namespace ferry
