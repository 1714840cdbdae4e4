#include <catch2/catch_test_macros.hpp>
#include <ferry/ferry.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    static std::atomic<unsigned> counter{0};
    auto dir = fs::temp_directory_path() /
               ("ferry_undo_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count()))
                + "_" + std::to_string(counter++));
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << content;
}

static std::string read_file(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

/// Relative path -> content for every file and "<dir>/" for every directory.
static std::map<std::string, std::string> snapshot(const fs::path& root) {
    std::map<std::string, std::string> out;
    if (!fs::exists(root)) return out;
    for (auto& e : fs::recursive_directory_iterator(root)) {
        auto rel = e.path().lexically_relative(root).generic_string();
        if (e.is_directory()) out[rel + "/"] = "";
        else out[rel] = read_file(e.path());
    }
    return out;
}

static ferry::ReplayOptions replay_opts(const fs::path& journal) {
    ferry::ReplayOptions opts;
    opts.journal = journal;
    return opts;
}

// ---------------------------------------------------------------------------
// Copy
// ---------------------------------------------------------------------------

TEST_CASE("Undo: copy then undo restores the destination", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");
    write_file(dir / "src" / "sub" / "b.txt", "bravo");
    write_file(dir / "src" / "report.txt", "new");
    write_file(dir / "dest" / "report.txt", "old");
    write_file(dir / "dest" / "keep.md", "untouched");
    auto before_dest = snapshot(dir / "dest");
    auto before_src = snapshot(dir / "src");

    ferry::TransferOptions opts;
    opts.recurse = true;
    opts.journal = dir / "j.jsonl";
    auto run = ferry::copy(dir / "src", dir / "dest", opts);
    REQUIRE(run.applied == 3);
    CHECK(fs::exists(dir / "dest" / "report (1).txt"));

    auto result = ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));
    CHECK(result.ok());
    CHECK(result.applied == 3);
    CHECK(snapshot(dir / "dest") == before_dest);
    CHECK(snapshot(dir / "src") == before_src);

    fs::remove_all(dir);
}

TEST_CASE("Undo: overwrite is reversed from the backup", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "new");
    write_file(dir / "dest" / "a.txt", "old");

    ferry::TransferOptions opts;
    opts.resolve = ferry::ConflictMode::Overwrite;
    opts.journal = dir / "j.jsonl";
    auto run = ferry::copy(dir / "src", dir / "dest", opts);
    REQUIRE(read_file(dir / "dest" / "a.txt") == "new");

    auto result = ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));
    CHECK(result.applied == 1);
    CHECK(read_file(dir / "dest" / "a.txt") == "old");
    CHECK_FALSE(fs::exists(dir / "j.jsonl.d" / run.process_id));

    fs::remove_all(dir);
}

TEST_CASE("Undo: modified destination is an undo conflict", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");

    ferry::TransferOptions opts;
    opts.journal = dir / "j.jsonl";
    auto run = ferry::copy(dir / "src", dir / "dest", opts);
    write_file(dir / "dest" / "a.txt", "edited by someone");

    auto result = ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));
    CHECK(result.failed == 1);
    REQUIRE(result.failures.size() == 1);
    CHECK(result.failures[0].kind == ferry::ErrorKind::UndoConflict);
    CHECK(read_file(dir / "dest" / "a.txt") == "edited by someone");

    auto forced_opts = replay_opts(dir / "j.jsonl");
    forced_opts.force = true;
    auto forced = ferry::undo(run.process_id, forced_opts);
    CHECK(forced.applied == 1);
    CHECK_FALSE(fs::exists(dir / "dest" / "a.txt"));

    fs::remove_all(dir);
}

TEST_CASE("Undo: second undo is skipped", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");

    ferry::TransferOptions opts;
    opts.journal = dir / "j.jsonl";
    auto run = ferry::copy(dir / "src", dir / "dest", opts);

    ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));
    auto again = ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));
    CHECK(again.applied == 0);
    CHECK(again.skipped == 1);
    CHECK(again.records[0].reason == std::optional<std::string>("already undone"));

    fs::remove_all(dir);
}

TEST_CASE("Undo: skipped and dry-run records are not reversed", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "same");
    write_file(dir / "dest" / "a.txt", "same");

    ferry::TransferOptions opts;
    opts.journal = dir / "j.jsonl";
    auto run = ferry::copy(dir / "src", dir / "dest", opts);
    REQUIRE(run.skipped == 1);

    auto result = ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));
    CHECK(result.total == 0);
    CHECK(fs::exists(dir / "dest" / "a.txt"));

    write_file(dir / "src2" / "b.txt", "bravo");
    opts.dry_run = true;
    auto dry = ferry::copy(dir / "src2", dir / "dest", opts);
    CHECK(ferry::undo(dry.process_id, replay_opts(dir / "j.jsonl")).total == 0);

    fs::remove_all(dir);
}

TEST_CASE("Undo: dry run changes nothing", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");

    ferry::TransferOptions opts;
    opts.journal = dir / "j.jsonl";
    auto run = ferry::copy(dir / "src", dir / "dest", opts);

    auto dry_opts = replay_opts(dir / "j.jsonl");
    dry_opts.dry_run = true;
    auto dry = ferry::undo(run.process_id, dry_opts);
    CHECK(dry.applied == 1);
    CHECK(dry.records[0].dry_run);
    CHECK(fs::exists(dir / "dest" / "a.txt"));

    // The dry run does not count as an undo.
    auto real = ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));
    CHECK(real.applied == 1);
    CHECK_FALSE(fs::exists(dir / "dest" / "a.txt"));

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Move
// ---------------------------------------------------------------------------

TEST_CASE("Undo: move of report.txt with rename", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "report.txt", "quarterly");
    write_file(dir / "dest" / "report.txt", "annual");

    ferry::TransferOptions opts;
    opts.journal = dir / "j.jsonl";
    auto run = ferry::move(dir / "src", dir / "dest", opts);
    REQUIRE(fs::exists(dir / "dest" / "report (1).txt"));
    REQUIRE_FALSE(fs::exists(dir / "src" / "report.txt"));

    auto result = ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));
    CHECK(result.applied == 1);
    CHECK_FALSE(fs::exists(dir / "dest" / "report (1).txt"));
    CHECK(read_file(dir / "src" / "report.txt") == "quarterly");
    CHECK(read_file(dir / "dest" / "report.txt") == "annual");

    fs::remove_all(dir);
}

TEST_CASE("Undo: move back refuses an occupied source path", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");

    ferry::TransferOptions opts;
    opts.journal = dir / "j.jsonl";
    auto run = ferry::move(dir / "src", dir / "dest", opts);
    write_file(dir / "src" / "a.txt", "someone else");

    auto result = ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));
    CHECK(result.failed == 1);
    CHECK(result.failures[0].kind == ferry::ErrorKind::UndoConflict);
    CHECK(read_file(dir / "dest" / "a.txt") == "alpha");
    CHECK(read_file(dir / "src" / "a.txt") == "someone else");

    fs::remove_all(dir);
}

TEST_CASE("Undo: later records depending on a failure are skipped", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");

    // Run 1 copies a.txt; run 2 moves the copy further.
    ferry::TransferOptions opts;
    opts.journal = dir / "j.jsonl";
    opts.process_id = "chain";
    auto run = ferry::copy(dir / "src", dir / "mid", opts);
    REQUIRE(run.applied == 1);

    // Hand-build a follow-up move in the same run: mid/a.txt -> out/a.txt.
    {
        auto j = ferry::Journal::load(dir / "j.jsonl", "chain");
        fs::create_directories(dir / "out");
        fs::rename(dir / "mid" / "a.txt", dir / "out" / "a.txt");
        ferry::OperationRecord rec;
        rec.action = ferry::Action::Move;
        rec.src    = (dir / "mid" / "a.txt").string();
        rec.dest   = (dir / "out" / "a.txt").string();
        rec.digest = run.records[0].digest;
        rec.status = ferry::Status::Applied;
        j->append(rec);
    }
    // Break the newest operation: its destination was edited.
    write_file(dir / "out" / "a.txt", "edited");

    auto result = ferry::undo("chain", replay_opts(dir / "j.jsonl"));
    CHECK(result.failed == 1);
    CHECK(result.skipped == 1);
    REQUIRE(result.records.size() == 2);
    CHECK(result.records[0].status == ferry::Status::Failed);
    CHECK(result.records[1].status == ferry::Status::SkippedDependency);
    CHECK(result.records[1].error == std::optional<ferry::ErrorKind>(ferry::ErrorKind::Dependency));
    CHECK(result.failures.size() == 1);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

TEST_CASE("Undo: needs a journal path", "[undo]") {
    CHECK_THROWS_AS(ferry::undo("anything"), ferry::JournalError);
}

TEST_CASE("Undo: unknown process id throws", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");

    ferry::TransferOptions opts;
    opts.journal = dir / "j.jsonl";
    ferry::copy(dir / "src", dir / "dest", opts);

    CHECK_THROWS_AS(ferry::undo("no-such-run", replay_opts(dir / "j.jsonl")),
                    ferry::JournalError);
    CHECK_THROWS_AS(ferry::undo("no-such-run", replay_opts(dir / "missing.jsonl")),
                    ferry::JournalError);

    fs::remove_all(dir);
}

TEST_CASE("Undo: journal records the reversal", "[undo]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");

    ferry::TransferOptions opts;
    opts.journal = dir / "j.jsonl";
    auto run = ferry::copy(dir / "src", dir / "dest", opts);
    ferry::undo(run.process_id, replay_opts(dir / "j.jsonl"));

    auto all = ferry::journal::read_all(dir / "j.jsonl");
    // copy, close, undo, close
    REQUIRE(all.size() == 4);
    CHECK(all[2].action == ferry::Action::Undo);
    CHECK(all[2].ref == std::optional<uint64_t>(1));
    CHECK(all[2].seq > all[1].seq);
    CHECK(all[3].action == ferry::Action::Close);

    fs::remove_all(dir);
}
