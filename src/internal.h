#pragma once
/// Internal helpers shared between ferry source files.
/// Not part of the public API.

#include "ferry/error.h"
#include "ferry/types.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ferry {

class Journal;

// ---------------------------------------------------------------------------
// paths: naming helpers
// ---------------------------------------------------------------------------

namespace paths {

/// "dir/stem (n).ext" for `target` = "dir/stem.ext".
std::filesystem::path numbered(const std::filesystem::path& target, unsigned n);

/// Hidden temporary sibling of `target` for atomic placement.
std::filesystem::path temp_sibling(const std::filesystem::path& target);

/// True if `child` equals `parent` or lies underneath it (lexically, after
/// making both absolute and normal).
bool is_within(const std::filesystem::path& child,
               const std::filesystem::path& parent);

/// New process identifier: UTC time, OS pid and 32 random bits.
std::string make_process_id();

/// Milliseconds since the POSIX epoch.
uint64_t now_millis();

/// Absolute, lexically normal form of `p`.
std::filesystem::path absolute_normal(const std::filesystem::path& p);

} // namespace paths

// ---------------------------------------------------------------------------
// lock: advisory journal file lock
// ---------------------------------------------------------------------------

namespace lock {

/// Run `fn` while holding the advisory lock for `journal`
/// (`<journal>.lock`).
void with_journal_lock(const std::filesystem::path& journal,
                       std::function<void()> fn);

} // namespace lock

// ---------------------------------------------------------------------------
// glob: pattern matching helpers
// ---------------------------------------------------------------------------

namespace glob {

/// Shell-style match of `name` against `pattern`: `*`, `?`, `[abc]`,
/// `[a-z]`, `[!x]` / `[^x]`. `*` and `?` also match a leading dot.
bool fnmatch(const std::string& pattern, const std::string& name);

} // namespace glob

// ---------------------------------------------------------------------------
// report: RunResult assembly
// ---------------------------------------------------------------------------

namespace report {

/// Count outcomes and collect failures from per-file records.
RunResult tally(std::string process_id,
                std::vector<OperationRecord> records,
                bool truncated);

/// If writing `journal` failed during the run, list that as a failure of
/// `result`.
void add_journal_failure(RunResult& result, const Journal& journal);

} // namespace report

// ---------------------------------------------------------------------------
// EventEmitter: serializes calls into the caller's EventSink
// ---------------------------------------------------------------------------

class EventEmitter {
public:
    EventEmitter(EventSink sink, std::string process_id)
        : sink_(std::move(sink)), pid_(std::move(process_id)) {}

    void emit(EventKind kind, const OperationRecord* rec = nullptr,
              std::string message = {});

private:
    EventSink   sink_;
    std::string pid_;
    std::mutex  mutex_;
};

// ---------------------------------------------------------------------------
// WorkerPool: bounded pool for per-file work
// ---------------------------------------------------------------------------

/// Fixed set of threads draining a bounded task queue. submit() blocks while
/// the queue is full. The first exception escaping a task is rethrown from
/// wait().
class WorkerPool {
public:
    WorkerPool(size_t threads, size_t queue_limit);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);

    /// Block until every submitted task has finished.
    void wait();

private:
    void run();

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    size_t                            queue_limit_;
    size_t                            active_ = 0;
    std::mutex                        mutex_;
    std::condition_variable           task_ready_;
    std::condition_variable           space_ready_;
    std::condition_variable           idle_;
    std::exception_ptr                error_;
    bool                              stop_ = false;
};

} // namespace ferry
