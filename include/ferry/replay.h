#pragma once

#include "error.h"
#include "types.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ferry {

// ---------------------------------------------------------------------------
// RecordState: where each forward operation stands after undo/redo history
// ---------------------------------------------------------------------------

struct RecordState {
    OperationRecord original;  ///< The copy/move record.
    OperationRecord effective; ///< Original paths plus the latest redo's side effects.
    bool            undone = false;
};

/// Fold a run's records into per-operation state, keyed by the original seq.
/// Only applied, non-dry-run copy/move records are reversible; dry-run and
/// non-applied undo/redo records do not change state.
std::map<uint64_t, RecordState>
derive_states(const std::vector<OperationRecord>& records);

// ---------------------------------------------------------------------------
// Undo / Redo
// ---------------------------------------------------------------------------

/// Reverse every applied operation of run `process_id`, newest first.
///
/// A copy is reversed by deleting the destination, a move by moving the
/// destination back to its source path. Either only proceeds when the
/// destination still has the recorded digest, unless `opts.force`.
/// Files displaced by overwrites are restored, and directories the run
/// created are removed once empty.
///
/// @throws JournalError if no journal path is given, the journal cannot be
///         read, or it holds no records for `process_id`.
RunResult undo(const std::string& process_id, const ReplayOptions& opts = {});

/// Re-apply every currently undone operation of run `process_id`, oldest
/// first, after checking each source still has its recorded digest.
///
/// @throws JournalError as for undo().
RunResult redo(const std::string& process_id, const ReplayOptions& opts = {});

} // namespace ferry
