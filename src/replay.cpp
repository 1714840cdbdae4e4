#include "ferry/replay.h"
#include "ferry/digest.h"
#include "ferry/executor.h"
#include "ferry/journal.h"
#include "ferry/log.h"
#include "internal.h"

#include <algorithm>
#include <memory>
#include <set>
#include <system_error>

namespace ferry {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// derive_states
// ---------------------------------------------------------------------------

std::map<uint64_t, RecordState>
derive_states(const std::vector<OperationRecord>& records) {
    std::vector<const OperationRecord*> ordered;
    for (auto& rec : records) ordered.push_back(&rec);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const OperationRecord* a, const OperationRecord* b) {
                         return a->seq < b->seq;
                     });

    std::map<uint64_t, RecordState> states;
    for (const OperationRecord* rec : ordered) {
        if (rec->status != Status::Applied || rec->dry_run) continue;

        if (rec->action == Action::Copy || rec->action == Action::Move) {
            states[rec->seq] = RecordState{*rec, *rec, false};
            continue;
        }
        if (!rec->ref) continue;
        auto it = states.find(*rec->ref);
        if (it == states.end()) continue;

        if (rec->action == Action::Undo) {
            it->second.undone = true;
        } else if (rec->action == Action::Redo) {
            it->second.undone = false;
            it->second.effective.backup       = rec->backup;
            it->second.effective.created_dirs = rec->created_dirs;
        }
    }
    return states;
}

// ---------------------------------------------------------------------------
// Undo / Redo
// ---------------------------------------------------------------------------

namespace {

bool occupied(const fs::path& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

/// Fail unless `path` still holds the content recorded in `rec`.
void check_digest(const fs::path& path, const OperationRecord& rec, size_t chunk_size) {
    Digest now = fingerprint(path, rec.digest.algorithm, chunk_size);
    if (now != rec.digest) {
        throw UndoConflictError(path.string(), "content changed since the transfer");
    }
}

class Replayer {
public:
    Replayer(Action direction, const std::string& process_id, const ReplayOptions& opts)
        : direction_(direction)
        , opts_(opts)
        , events_(opts.on_event, process_id)
        , executor_(make_settings(opts))
    {
        if (!opts.journal) {
            throw JournalError(std::string(action_name(direction)) +
                               " needs a persisted journal");
        }
        journal_ = Journal::load(*opts.journal, process_id);
    }

    RunResult run() {
        const std::string& pid = journal_->process_id();
        logger()->info("{} {}{}", action_name(direction_), pid,
                       opts_.dry_run ? " (dry run)" : "");
        events_.emit(EventKind::RunStarted, nullptr, opts_.journal->string());

        auto states = derive_states(journal_->records());
        std::vector<RecordState*> order;
        for (auto& entry : states) order.push_back(&entry.second);
        if (direction_ == Action::Undo) std::reverse(order.begin(), order.end());

        std::vector<OperationRecord> written;
        std::vector<fs::path> prune;
        bool truncated = false;

        for (RecordState* state : order) {
            if (opts_.cancel && opts_.cancel->cancelled()) {
                truncated = true;
                break;
            }
            OperationRecord rec = step(*state, prune);
            written.push_back(journal_->append(std::move(rec)));
            emit_outcome(written.back());
            if (journal_->failed()) {
                truncated = true;
                break;
            }
        }

        if (!opts_.dry_run) TransferExecutor::prune_dirs(prune);

        journal_->close(truncated);
        RunResult result = report::tally(pid, std::move(written), truncated);
        report::add_journal_failure(result, *journal_);
        logger()->info("{} {}: {} applied, {} skipped, {} failed", action_name(direction_), pid,
                       result.applied, result.skipped, result.failed);
        events_.emit(EventKind::RunFinished, nullptr,
                     std::to_string(result.applied) + " applied, " +
                     std::to_string(result.skipped) + " skipped, " +
                     std::to_string(result.failed) + " failed");
        return result;
    }

private:
    static TransferSettings make_settings(const ReplayOptions& opts) {
        TransferSettings s;
        s.dry_run    = opts.dry_run;
        s.chunk_size = opts.chunk_size;
        return s;
    }

    OperationRecord step(const RecordState& state, std::vector<fs::path>& prune) {
        const OperationRecord& eff = state.effective;

        OperationRecord rec;
        rec.action  = direction_;
        rec.ref     = state.original.seq;
        rec.src     = eff.src;
        rec.dest    = eff.dest;
        rec.digest  = eff.digest;
        rec.dry_run = opts_.dry_run;
        events_.emit(EventKind::FileStarted, &rec);

        if (direction_ == Action::Undo && state.undone && !opts_.force) {
            rec.status = Status::Skipped;
            rec.reason = "already undone";
            return rec;
        }
        if (direction_ == Action::Redo && !state.undone) {
            rec.status = Status::Skipped;
            rec.reason = "not undone";
            return rec;
        }
        if (blocked_.count(eff.src) || blocked_.count(eff.dest)) {
            block(eff);
            rec.status = Status::SkippedDependency;
            rec.error  = ErrorKind::Dependency;
            rec.reason = "depends on a failed operation";
            return rec;
        }

        try {
            if (direction_ == Action::Undo) {
                undo_one(eff);
                for (auto& d : eff.created_dirs) prune.emplace_back(d);
                if (eff.backup) prune.push_back(fs::path(*eff.backup).parent_path());
            } else {
                TransferOutcome out = redo_one(eff);
                if (out.backup) rec.backup = out.backup->string();
                for (auto& d : out.created_dirs) rec.created_dirs.push_back(d.string());
            }
            rec.status = Status::Applied;
        } catch (const FerryError& e) {
            block(eff);
            rec.status = Status::Failed;
            rec.error  = e.kind();
            rec.reason = e.what();
        } catch (const fs::filesystem_error& e) {
            block(eff);
            rec.status = Status::Failed;
            rec.error  = ErrorKind::Filesystem;
            rec.reason = e.what();
        }
        return rec;
    }

    void block(const OperationRecord& eff) {
        blocked_.insert(eff.src);
        blocked_.insert(eff.dest);
    }

    /// Remove the copy (or move it back), then restore a displaced file.
    void undo_one(const OperationRecord& eff) {
        fs::path src(eff.src), dest(eff.dest);
        bool have_dest = occupied(dest);

        if (eff.action == Action::Copy) {
            if (!have_dest && !opts_.force) {
                throw UndoConflictError(dest.string(), "destination is missing");
            }
        } else {
            if (!have_dest) throw UndoConflictError(dest.string(), "destination is missing");
            if (occupied(src)) throw UndoConflictError(src.string(), "source path is occupied");
        }
        if (have_dest && !opts_.force) check_digest(dest, eff, opts_.chunk_size);

        std::optional<fs::path> backup;
        if (eff.backup) {
            if (occupied(*eff.backup)) {
                backup = fs::path(*eff.backup);
            } else {
                logger()->warn("undo: backup {} is gone, {} will not be restored",
                               *eff.backup, dest.string());
            }
        }
        if (opts_.dry_run) return;

        if (eff.action == Action::Copy) {
            if (have_dest) TransferExecutor::remove_file(dest);
        } else {
            TransferExecutor::make_parents(src);
            executor_.relocate(dest, src);
        }
        if (backup) executor_.relocate(*backup, dest);
    }

    /// Re-apply the recorded action, displacing the destination again if the
    /// original run did.
    TransferOutcome redo_one(const OperationRecord& eff) {
        fs::path src(eff.src), dest(eff.dest);

        if (!occupied(src)) throw UndoConflictError(src.string(), "source is missing");
        if (!opts_.force) check_digest(src, eff, opts_.chunk_size);

        std::optional<fs::path> backup_to;
        if (eff.backup) backup_to = fs::path(*eff.backup);
        if (occupied(dest) && !backup_to) {
            throw UndoConflictError(dest.string(), "destination is occupied");
        }
        return executor_.transfer(eff.action, src, dest, eff.digest, backup_to);
    }

    void emit_outcome(const OperationRecord& rec) {
        switch (rec.status) {
            case Status::Applied:
                logger()->debug("[{}] {} of #{} applied", rec.seq, action_name(direction_),
                                rec.ref.value_or(0));
                events_.emit(EventKind::FileApplied, &rec);
                break;
            case Status::Failed:
                logger()->warn("[{}] {} of #{} failed: {}", rec.seq, action_name(direction_),
                               rec.ref.value_or(0), rec.reason.value_or(""));
                events_.emit(EventKind::FileFailed, &rec);
                break;
            default:
                events_.emit(EventKind::FileSkipped, &rec);
                break;
        }
    }

    Action                   direction_;
    const ReplayOptions&     opts_;
    EventEmitter             events_;
    TransferExecutor         executor_;
    std::unique_ptr<Journal> journal_;
    std::set<std::string>    blocked_;
};

} // anonymous namespace

RunResult undo(const std::string& process_id, const ReplayOptions& opts) {
    if (opts.chunk_size == 0) throw ValidationError("chunk size must be greater than zero");
    return Replayer(Action::Undo, process_id, opts).run();
}

RunResult redo(const std::string& process_id, const ReplayOptions& opts) {
    if (opts.chunk_size == 0) throw ValidationError("chunk size must be greater than zero");
    return Replayer(Action::Redo, process_id, opts).run();
}

} // namespace ferry
