#include "ferry/engine.h"
#include "ferry/digest.h"
#include "ferry/executor.h"
#include "ferry/filter.h"
#include "ferry/journal.h"
#include "ferry/log.h"
#include "ferry/resolver.h"
#include "internal.h"

#include <memory>
#include <system_error>

namespace ferry {

namespace fs = std::filesystem;

namespace {

/// Check the roots before anything on disk is touched.
fs::path check_roots(const FileFilter& filter,
                     const fs::path& destination,
                     const TransferOptions& opts) {
    fs::path dest_root = paths::absolute_normal(destination);
    const fs::path& src_root = filter.root();

    if (dest_root == src_root) {
        throw ValidationError("source and destination are the same: " + src_root.string());
    }
    if (opts.recurse && paths::is_within(dest_root, src_root)) {
        throw ValidationError("destination lies inside the source tree: " + dest_root.string());
    }

    std::error_code ec;
    auto st = fs::status(dest_root, ec);
    if (fs::exists(st)) {
        if (!fs::is_directory(st)) {
            throw ValidationError("destination is not a directory: " + dest_root.string());
        }
    } else if (opts.no_create) {
        throw ValidationError("destination does not exist: " + dest_root.string());
    }
    return dest_root;
}

/// One forward run: filter, fingerprint, resolve, transfer, journal.
RunResult run_transfer(Action action,
                       const fs::path& source,
                       const fs::path& destination,
                       const TransferOptions& opts) {
    opts.validate();
    FileFilter filter(source, FilterRules::from_options(opts));
    fs::path dest_root = check_roots(filter, destination, opts);

    std::string pid = opts.process_id ? *opts.process_id : paths::make_process_id();
    Journal journal(pid, opts.journal);
    EventEmitter events(opts.on_event, pid);

    logger()->info("{} {}: {} -> {}{}", action_name(action), pid,
                   filter.root().string(), dest_root.string(),
                   opts.dry_run ? " (dry run)" : "");
    events.emit(EventKind::RunStarted, nullptr,
                filter.root().string() + " -> " + dest_root.string());

    DedupIndex index;
    if (opts.recursive_check) index.scan(dest_root, opts.algorithm, opts.chunk_size);

    NameReservations names;
    ConflictResolver resolver(opts.resolve, opts.algorithm, opts.chunk_size,
                              opts.on_conflict, names,
                              opts.recursive_check ? &index : nullptr);

    TransferSettings settings;
    settings.dry_run       = opts.dry_run;
    settings.preserve_meta = opts.preserve_meta;
    settings.verify        = opts.verify;
    settings.algorithm     = opts.algorithm;
    settings.chunk_size    = opts.chunk_size;
    TransferExecutor executor(settings);

    const auto backup_dir = journal.backup_dir();
    const auto& cancel = opts.cancel;

    auto process = [&](const CandidateEntry& c, uint64_t seq) {
        OperationRecord rec;
        rec.seq              = seq;
        rec.action           = action;
        rec.src              = c.path.string();
        rec.dest             = (dest_root / c.relative).string();
        rec.dry_run          = opts.dry_run;
        rec.digest.algorithm = opts.algorithm;
        events.emit(EventKind::FileStarted, &rec);

        if (cancel && cancel->cancelled()) {
            rec.status = Status::Skipped;
            rec.reason = "cancelled";
        } else if (journal.failed()) {
            rec.status = Status::Skipped;
            rec.reason = "journal unavailable";
        } else {
            bool claimed = false;
            try {
                rec.digest = fingerprint(c.path, opts.algorithm, opts.chunk_size);
                Resolution r = resolver.resolve(c, rec.digest, dest_root / c.relative);
                rec.dest = r.target.string();
                claimed = opts.recursive_check && r.kind != Resolution::Kind::Skip;

                if (r.kind == Resolution::Kind::Skip) {
                    rec.status = Status::Skipped;
                    rec.reason = r.reason;
                } else {
                    std::optional<fs::path> backup_to;
                    if (r.kind == Resolution::Kind::Replace && backup_dir) {
                        backup_to = *backup_dir /
                            (std::to_string(seq) + "-" + r.target.filename().string());
                    }
                    TransferOutcome out =
                        executor.transfer(action, c.path, r.target, rec.digest, backup_to);
                    rec.status = Status::Applied;
                    if (out.backup) rec.backup = out.backup->string();
                    for (auto& d : out.created_dirs) rec.created_dirs.push_back(d.string());
                    if (claimed) {
                        index.settle(rec.digest, r.target);
                        claimed = false;
                    }
                }
            } catch (const FerryError& e) {
                rec.status = Status::Failed;
                rec.error  = e.kind();
                rec.reason = e.what();
            } catch (const fs::filesystem_error& e) {
                rec.status = Status::Failed;
                rec.error  = ErrorKind::Filesystem;
                rec.reason = e.what();
            }
            // The content did not land; let a later file with it try.
            if (claimed) index.release(rec.digest);
        }

        switch (rec.status) {
            case Status::Applied:
                logger()->debug("[{}] {} {} -> {}", seq, action_name(action), rec.src, rec.dest);
                events.emit(EventKind::FileApplied, &rec);
                break;
            case Status::Failed:
                logger()->warn("[{}] {} failed: {}", seq, rec.src, *rec.reason);
                events.emit(EventKind::FileFailed, &rec);
                break;
            default:
                logger()->debug("[{}] skipped {}: {}", seq, rec.src, rec.reason.value_or(""));
                events.emit(EventKind::FileSkipped, &rec);
                break;
        }
        journal.commit(std::move(rec));
    };

    bool truncated = false;
    std::unique_ptr<WorkerPool> pool;
    if (opts.workers > 1) pool = std::make_unique<WorkerPool>(opts.workers, opts.workers * 2);

    for (const auto& c : filter) {
        if ((cancel && cancel->cancelled()) || journal.failed()) {
            truncated = true;
            break;
        }
        uint64_t seq = journal.reserve_seq();
        if (pool) {
            pool->submit([&process, c, seq] { process(c, seq); });
        } else {
            process(c, seq);
        }
    }
    if (pool) pool->wait();
    if ((cancel && cancel->cancelled()) || journal.failed()) truncated = true;

    journal.close(truncated);
    RunResult result = report::tally(pid, journal.records(), truncated);
    report::add_journal_failure(result, journal);

    logger()->info("{} {}: {} applied, {} skipped, {} failed{}", action_name(action), pid,
                   result.applied, result.skipped, result.failed,
                   truncated ? " (cancelled)" : "");
    events.emit(EventKind::RunFinished, nullptr,
                std::to_string(result.applied) + " applied, " +
                std::to_string(result.skipped) + " skipped, " +
                std::to_string(result.failed) + " failed");
    return result;
}

} // anonymous namespace

RunResult copy(const fs::path& source, const fs::path& destination,
               const TransferOptions& opts) {
    return run_transfer(Action::Copy, source, destination, opts);
}

RunResult move(const fs::path& source, const fs::path& destination,
               const TransferOptions& opts) {
    return run_transfer(Action::Move, source, destination, opts);
}

} // namespace ferry
