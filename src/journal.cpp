#include "ferry/journal.h"
#include "ferry/log.h"
#include "internal.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <map>
#include <string>
#include <system_error>

namespace ferry {

namespace fs = std::filesystem;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Line codec
// ---------------------------------------------------------------------------

namespace journal {

namespace {

ErrorKind parse_error_kind(const std::string& name) {
    for (auto k : {ErrorKind::Validation, ErrorKind::Filesystem, ErrorKind::Conflict,
                   ErrorKind::Verification, ErrorKind::Journal, ErrorKind::UndoConflict,
                   ErrorKind::Dependency}) {
        if (name == error_kind_name(k)) return k;
    }
    throw JournalError("unknown error kind: " + name);
}

} // anonymous namespace

std::string encode(const OperationRecord& rec) {
    json j;
    j["pid"]    = rec.pid;
    j["seq"]    = rec.seq;
    j["action"] = action_name(rec.action);
    j["src"]    = rec.src;
    j["dest"]   = rec.dest;
    j["algo"]   = hash_algorithm_name(rec.digest.algorithm);
    j["digest"] = rec.digest.hex();
    j["status"] = status_name(rec.status);
    j["ts"]     = rec.timestamp;
    if (rec.ref)     j["ref"] = *rec.ref;
    if (rec.dry_run) j["dry_run"] = true;
    if (rec.reason)  j["reason"] = *rec.reason;
    if (rec.error)   j["error"] = error_kind_name(*rec.error);
    if (rec.backup)  j["backup"] = *rec.backup;
    if (!rec.created_dirs.empty()) j["created_dirs"] = rec.created_dirs;
    return j.dump();
}

std::optional<OperationRecord> decode(const std::string& line) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    try {
        OperationRecord rec;
        rec.pid       = j.at("pid").get<std::string>();
        rec.seq       = j.at("seq").get<uint64_t>();
        rec.action    = parse_action(j.at("action").get<std::string>());
        rec.src       = j.at("src").get<std::string>();
        rec.dest      = j.at("dest").get<std::string>();
        rec.digest    = Digest::from_hex(parse_hash_algorithm(j.at("algo").get<std::string>()),
                                         j.at("digest").get<std::string>());
        rec.status    = parse_status(j.at("status").get<std::string>());
        rec.timestamp = j.at("ts").get<uint64_t>();

        if (j.contains("ref"))     rec.ref = j["ref"].get<uint64_t>();
        if (j.contains("dry_run")) rec.dry_run = j["dry_run"].get<bool>();
        if (j.contains("reason"))  rec.reason = j["reason"].get<std::string>();
        if (j.contains("error"))   rec.error = parse_error_kind(j["error"].get<std::string>());
        if (j.contains("backup"))  rec.backup = j["backup"].get<std::string>();
        if (j.contains("created_dirs")) {
            rec.created_dirs = j["created_dirs"].get<std::vector<std::string>>();
        }
        if (rec.pid.empty() || rec.seq == 0) return std::nullopt;
        return rec;
    } catch (const json::exception&) {
        return std::nullopt;
    } catch (const FerryError&) {
        return std::nullopt;
    }
}

std::vector<OperationRecord> read_all(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw JournalError("journal not found: " + path.string());
    }
    std::ifstream in(path);
    if (!in) throw JournalError("cannot read journal: " + path.string());

    std::vector<OperationRecord> out;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        auto rec = decode(line);
        if (!rec) {
            logger()->warn("journal: {}:{}: skipping malformed line", path.string(), lineno);
            continue;
        }
        out.push_back(std::move(*rec));
    }
    if (in.bad()) throw JournalError("read error: " + path.string());
    return out;
}

std::vector<JournalSummary> list_runs(const fs::path& path) {
    std::vector<JournalSummary> runs;
    std::map<std::string, size_t> index;

    for (auto& rec : read_all(path)) {
        auto it = index.find(rec.pid);
        if (it == index.end()) {
            it = index.emplace(rec.pid, runs.size()).first;
            JournalSummary s;
            s.process_id = rec.pid;
            s.started    = rec.timestamp;
            runs.push_back(std::move(s));
        }
        auto& s = runs[it->second];
        s.started  = std::min(s.started, rec.timestamp);
        s.finished = std::max(s.finished, rec.timestamp);
        if (rec.action == Action::Copy || rec.action == Action::Move) ++s.operations;
        if (rec.action == Action::Close && !s.closed) s.closed = rec.status;
    }
    return runs;
}

} // namespace journal

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

Journal::Journal(std::string process_id, std::optional<fs::path> path)
    : pid_(std::move(process_id))
    , path_(std::move(path))
{
    if (!path_) return;

    std::error_code ec;
    if (path_->has_parent_path()) {
        fs::create_directories(path_->parent_path(), ec);
        if (ec) {
            throw JournalError("cannot create journal directory " +
                               path_->parent_path().string() + ": " + ec.message());
        }
    }

    lock::with_journal_lock(*path_, [&] {
        if (fs::exists(*path_, ec)) {
            for (auto& rec : journal::read_all(*path_)) {
                if (rec.pid == pid_) {
                    throw JournalError("process id already present in " +
                                       path_->string() + ": " + pid_);
                }
            }
        }
        std::ofstream probe(*path_, std::ios::app);
        if (!probe) throw JournalError("cannot open journal for appending: " + path_->string());
    });
}

Journal::Journal(LoadTag, std::string process_id, fs::path path,
                 std::vector<OperationRecord> existing)
    : pid_(std::move(process_id))
    , path_(std::move(path))
    , records_(std::move(existing))
{
    std::stable_sort(records_.begin(), records_.end(),
                     [](const OperationRecord& a, const OperationRecord& b) {
                         return a.seq < b.seq;
                     });
    for (auto& rec : records_) {
        if (rec.action == Action::Close && !closed_) closed_ = rec.status;
    }
    next_seq_   = records_.back().seq + 1;
    next_write_ = next_seq_;
}

std::unique_ptr<Journal> Journal::load(const fs::path& path,
                                       const std::string& process_id) {
    std::vector<OperationRecord> mine;
    for (auto& rec : journal::read_all(path)) {
        if (rec.pid == process_id) mine.push_back(std::move(rec));
    }
    if (mine.empty()) {
        throw JournalError("no records for process id " + process_id +
                           " in " + path.string());
    }
    return std::unique_ptr<Journal>(new Journal(LoadTag{}, process_id, path, std::move(mine)));
}

std::optional<fs::path> Journal::backup_dir() const {
    if (!path_) return std::nullopt;
    return fs::path(path_->string() + ".d") / pid_;
}

uint64_t Journal::reserve_seq() {
    std::lock_guard<std::mutex> lk(mutex_);
    return next_seq_++;
}

void Journal::commit(OperationRecord rec) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (rec.seq < next_write_ || rec.seq >= next_seq_ || pending_.count(rec.seq)) {
        throw JournalError("sequence number " + std::to_string(rec.seq) + " not reserved");
    }
    rec.pid = pid_;
    if (rec.timestamp == 0) rec.timestamp = paths::now_millis();
    pending_.emplace(rec.seq, std::move(rec));
    flush_locked();
}

OperationRecord Journal::append(OperationRecord rec) {
    std::lock_guard<std::mutex> lk(mutex_);
    rec.seq = next_seq_++;
    rec.pid = pid_;
    if (rec.timestamp == 0) rec.timestamp = paths::now_millis();
    pending_.emplace(rec.seq, rec);
    flush_locked();
    return rec;
}

void Journal::close(bool truncated) {
    std::lock_guard<std::mutex> lk(mutex_);

    // Reserved numbers that never came in: write what we have, in order.
    if (!pending_.empty()) {
        logger()->warn("journal: {} record(s) out of order at close", pending_.size());
        for (auto& entry : pending_) {
            records_.push_back(entry.second);
            persist_locked(records_.back());
        }
        pending_.clear();
    }

    OperationRecord rec;
    rec.seq       = next_seq_++;
    rec.pid       = pid_;
    rec.action    = Action::Close;
    rec.status    = truncated || failed_ ? Status::Truncated : Status::Complete;
    rec.timestamp = paths::now_millis();
    records_.push_back(rec);
    persist_locked(rec);
    next_write_ = next_seq_;
    if (!closed_) closed_ = rec.status;
}

std::optional<Status> Journal::close_status() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closed_;
}

std::vector<OperationRecord> Journal::records() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return records_;
}

bool Journal::failed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return failed_;
}

std::optional<std::string> Journal::failure() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!failed_) return std::nullopt;
    return failure_;
}

void Journal::flush_locked() {
    while (!pending_.empty() && pending_.begin()->first == next_write_) {
        auto node = pending_.extract(pending_.begin());
        records_.push_back(std::move(node.mapped()));
        ++next_write_;
        persist_locked(records_.back());
    }
}

void Journal::persist_locked(const OperationRecord& rec) {
    if (!path_ || failed_) return;
    try {
        write_locked(rec);
    } catch (const JournalError& e) {
        failed_  = true;
        failure_ = e.what();
        logger()->error("journal: {} (record {} onward kept in memory only)",
                        failure_, rec.seq);
    }
}

void Journal::write_locked(const OperationRecord& rec) {
    std::string line = journal::encode(rec) + "\n";

    lock::with_journal_lock(*path_, [&] {
        // A torn final line from a crashed writer must not swallow ours.
        std::error_code ec;
        auto size = fs::file_size(*path_, ec);
        if (!ec && size > 0) {
            std::ifstream tail(*path_, std::ios::binary);
            tail.seekg(-1, std::ios::end);
            char last = '\n';
            if (tail.get(last) && last != '\n') line.insert(line.begin(), '\n');
        }

        std::ofstream out(*path_, std::ios::app | std::ios::binary);
        if (!out) throw JournalError("cannot open journal for appending: " + path_->string());
        out << line;
        out.flush();
        if (!out) throw JournalError("write failed: " + path_->string());
    });
}

} // namespace ferry
