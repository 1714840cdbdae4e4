#include "internal.h"
#include "ferry/journal.h"
#include "ferry/log.h"

#include <algorithm>

namespace ferry {

// ---------------------------------------------------------------------------
// report
// ---------------------------------------------------------------------------

namespace report {

RunResult tally(std::string process_id,
                std::vector<OperationRecord> records,
                bool truncated) {
    RunResult r;
    r.process_id = std::move(process_id);
    r.truncated  = truncated;

    records.erase(std::remove_if(records.begin(), records.end(),
                                 [](const OperationRecord& rec) {
                                     return rec.action == Action::Close;
                                 }),
                  records.end());
    std::sort(records.begin(), records.end(),
              [](const OperationRecord& a, const OperationRecord& b) { return a.seq < b.seq; });

    for (auto& rec : records) {
        ++r.total;
        switch (rec.status) {
            case Status::Applied:
                ++r.applied;
                break;
            case Status::Failed:
                ++r.failed;
                r.failures.push_back({rec.src,
                                      rec.error.value_or(ErrorKind::Filesystem),
                                      rec.reason.value_or("")});
                break;
            default:
                ++r.skipped;
                break;
        }
    }
    r.records = std::move(records);
    return r;
}

void add_journal_failure(RunResult& result, const Journal& journal) {
    auto failure = journal.failure();
    if (!failure) return;
    std::string where = journal.path() ? journal.path()->string() : std::string();
    logger()->error("{}: journal stopped recording, run ended early: {}",
                    result.process_id, *failure);
    result.failures.push_back({where, ErrorKind::Journal, *failure});
    ++result.failed;
}

} // namespace report

// ---------------------------------------------------------------------------
// EventEmitter
// ---------------------------------------------------------------------------

void EventEmitter::emit(EventKind kind, const OperationRecord* rec, std::string message) {
    if (!sink_) return;

    Event ev;
    ev.kind       = kind;
    ev.process_id = pid_;
    ev.message    = std::move(message);
    if (rec) {
        ev.seq    = rec->seq;
        ev.action = rec->action;
        ev.src    = rec->src;
        ev.dest   = rec->dest;
        if (ev.message.empty() && rec->reason) ev.message = *rec->reason;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    sink_(ev);
}

} // namespace ferry
