#pragma once

#include "error.h"
#include "types.h"

#include <filesystem>

namespace ferry {

/// Copy every file selected under `source` into `destination`.
///
/// Each candidate is fingerprinted, resolved against the destination
/// (duplicates are skipped, name collisions follow `opts.resolve`) and
/// transferred. Every candidate yields one journal record. Per-file problems
/// are reported in the RunResult; the batch always runs to completion or
/// cancellation.
///
/// @code
///     ferry::TransferOptions opts;
///     opts.include_glob = std::vector<std::string>{"*.txt"};
///     opts.journal = "/tmp/ferry.jsonl";
///     auto result = ferry::copy("/src", "/dest", opts);
///     // later
///     ferry::ReplayOptions ropts;
///     ropts.journal = "/tmp/ferry.jsonl";
///     ferry::undo(result.process_id, ropts);
/// @endcode
///
/// @throws ValidationError for bad options or paths (before any mutation).
/// @throws JournalError if the journal cannot be created or the process id
///         is already taken.
RunResult copy(const std::filesystem::path& source,
               const std::filesystem::path& destination,
               const TransferOptions& opts = {});

/// Move every file selected under `source` into `destination`. A source file
/// is removed only after its destination is in place (and verified when
/// `opts.verify` is set).
///
/// @throws ValidationError, JournalError as for copy().
RunResult move(const std::filesystem::path& source,
               const std::filesystem::path& destination,
               const TransferOptions& opts = {});

} // namespace ferry
