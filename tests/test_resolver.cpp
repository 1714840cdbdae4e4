#include <catch2/catch_test_macros.hpp>
#include <ferry/ferry.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    static std::atomic<unsigned> counter{0};
    auto dir = fs::temp_directory_path() /
               ("ferry_resolve_" + std::to_string(
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

static ferry::CandidateEntry candidate(const fs::path& p) {
    ferry::CandidateEntry c;
    c.path = p;
    c.relative = p.filename();
    c.size = fs::file_size(p);
    return c;
}

static ferry::Digest digest_of(const fs::path& p) {
    return ferry::fingerprint(p, ferry::HashAlgorithm::XxHash);
}

using Kind = ferry::Resolution::Kind;

// ---------------------------------------------------------------------------
// Free and identical targets
// ---------------------------------------------------------------------------

TEST_CASE("Resolver: free target is placed", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");

    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Rename, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, nullptr, names);
    auto c = candidate(dir / "src" / "a.txt");
    auto res = r.resolve(c, digest_of(c.path), dir / "dst" / "a.txt");
    CHECK(res.kind == Kind::Place);
    CHECK(res.target == dir / "dst" / "a.txt");
    CHECK(names.reserved(dir / "dst" / "a.txt"));

    fs::remove_all(dir);
}

TEST_CASE("Resolver: identical content at target is skipped in every mode", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");
    write_file(dir / "dst" / "a.txt", "alpha");

    for (auto mode : {ferry::ConflictMode::Rename, ferry::ConflictMode::Skip,
                      ferry::ConflictMode::Overwrite, ferry::ConflictMode::Defer}) {
        ferry::NameReservations names;
        ferry::ConflictResolver r(mode, ferry::HashAlgorithm::XxHash,
                                  ferry::DEFAULT_CHUNK_SIZE, nullptr, names);
        auto c = candidate(dir / "src" / "a.txt");
        auto res = r.resolve(c, digest_of(c.path), dir / "dst" / "a.txt");
        CHECK(res.kind == Kind::Skip);
    }

    fs::remove_all(dir);
}

TEST_CASE("Resolver: dedup index skips content found elsewhere", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "photo.jpg", "pixels");
    write_file(dir / "dst" / "2023" / "old-name.jpg", "pixels");

    ferry::DedupIndex index;
    index.scan(dir / "dst", ferry::HashAlgorithm::XxHash, ferry::DEFAULT_CHUNK_SIZE);
    CHECK(index.size() == 1);

    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Rename, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, nullptr, names, &index);
    auto c = candidate(dir / "src" / "photo.jpg");
    auto res = r.resolve(c, digest_of(c.path), dir / "dst" / "photo.jpg");
    CHECK(res.kind == Kind::Skip);
    CHECK(res.reason.find("old-name.jpg") != std::string::npos);

    fs::remove_all(dir);
}

TEST_CASE("Resolver: index claim makes a second claimant wait", "[resolver]") {
    ferry::DedupIndex index;
    auto d = ferry::fingerprint_bytes("pixels", 6, ferry::HashAlgorithm::XxHash);

    CHECK_FALSE(index.claim(d, "/dst/first.jpg"));
    CHECK_FALSE(index.find(d));
    CHECK(index.size() == 0);

    std::atomic<bool> done{false};
    std::optional<fs::path> seen;
    std::thread other([&] {
        seen = index.claim(d, "/dst/second.jpg");
        done = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(done);

    index.settle(d, "/dst/renamed.jpg");
    other.join();
    REQUIRE(seen);
    CHECK(*seen == fs::path("/dst/renamed.jpg"));
    CHECK(index.size() == 1);
}

TEST_CASE("Resolver: released claim passes to the next claimant", "[resolver]") {
    ferry::DedupIndex index;
    auto d = ferry::fingerprint_bytes("pixels", 6, ferry::HashAlgorithm::XxHash);

    CHECK_FALSE(index.claim(d, "/dst/a.jpg"));
    index.release(d);
    CHECK_FALSE(index.claim(d, "/dst/b.jpg"));
    index.settle(d, "/dst/b.jpg");
    CHECK(index.find(d) == std::optional<fs::path>(fs::path("/dst/b.jpg")));
}

TEST_CASE("Resolver: placed file keeps its index claim until settled", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "alpha");

    ferry::DedupIndex index;
    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Rename, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, nullptr, names, &index);
    auto c = candidate(dir / "src" / "a.txt");
    auto d = digest_of(c.path);
    auto res = r.resolve(c, d, dir / "dst" / "a.txt");
    CHECK(res.kind == Kind::Place);
    CHECK_FALSE(index.find(d));

    index.settle(d, res.target);
    auto again = r.resolve(c, d, dir / "dst" / "a.txt");
    CHECK(again.kind == Kind::Skip);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Modes
// ---------------------------------------------------------------------------

TEST_CASE("Resolver: rename picks the first free numbered name", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "report.txt", "new");
    write_file(dir / "dst" / "report.txt", "old");
    write_file(dir / "dst" / "report (1).txt", "older");

    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Rename, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, nullptr, names);
    auto c = candidate(dir / "src" / "report.txt");
    auto res = r.resolve(c, digest_of(c.path), dir / "dst" / "report.txt");
    CHECK(res.kind == Kind::Place);
    CHECK(res.target == dir / "dst" / "report (2).txt");

    // A second resolution in the same run must not get the same name.
    auto again = r.resolve(c, digest_of(c.path), dir / "dst" / "report.txt");
    CHECK(again.target == dir / "dst" / "report (3).txt");

    fs::remove_all(dir);
}

TEST_CASE("Resolver: skip leaves a different file alone", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "new");
    write_file(dir / "dst" / "a.txt", "old");

    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Skip, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, nullptr, names);
    auto c = candidate(dir / "src" / "a.txt");
    auto res = r.resolve(c, digest_of(c.path), dir / "dst" / "a.txt");
    CHECK(res.kind == Kind::Skip);
    CHECK(res.reason == "destination exists");

    fs::remove_all(dir);
}

TEST_CASE("Resolver: overwrite replaces once per run", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "new");
    write_file(dir / "src" / "b.txt", "newer");
    write_file(dir / "dst" / "a.txt", "old");

    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Overwrite, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, nullptr, names);
    auto a = candidate(dir / "src" / "a.txt");
    auto res = r.resolve(a, digest_of(a.path), dir / "dst" / "a.txt");
    CHECK(res.kind == Kind::Replace);

    auto b = candidate(dir / "src" / "b.txt");
    CHECK_THROWS_AS(r.resolve(b, digest_of(b.path), dir / "dst" / "a.txt"),
                    ferry::ConflictError);

    fs::remove_all(dir);
}

TEST_CASE("Resolver: overwrite refuses a directory", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "new");
    fs::create_directories(dir / "dst" / "a.txt");

    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Overwrite, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, nullptr, names);
    auto c = candidate(dir / "src" / "a.txt");
    CHECK_THROWS_AS(r.resolve(c, digest_of(c.path), dir / "dst" / "a.txt"),
                    ferry::FilesystemError);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Defer
// ---------------------------------------------------------------------------

TEST_CASE("Resolver: defer without callback throws ConflictError", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "new");
    write_file(dir / "dst" / "a.txt", "old");

    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Defer, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, nullptr, names);
    auto c = candidate(dir / "src" / "a.txt");
    CHECK_THROWS_AS(r.resolve(c, digest_of(c.path), dir / "dst" / "a.txt"),
                    ferry::ConflictError);

    fs::remove_all(dir);
}

TEST_CASE("Resolver: defer asks per file unless applied to all", "[resolver]") {
    auto dir = make_temp_dir();
    for (auto n : {"a", "b", "c"}) {
        write_file(dir / "src" / (std::string(n) + ".txt"), std::string("new ") + n);
        write_file(dir / "dst" / (std::string(n) + ".txt"), std::string("old ") + n);
    }

    int asked = 0;
    ferry::ConflictContext seen;
    auto callback = [&](const ferry::ConflictContext& ctx) {
        ++asked;
        seen = ctx;
        ferry::ConflictAnswer answer;
        answer.decision = ferry::ConflictMode::Skip;
        answer.apply_to_all = asked == 2;
        return answer;
    };

    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Defer, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, callback, names);
    for (auto n : {"a", "b", "c"}) {
        auto c = candidate(dir / "src" / (std::string(n) + ".txt"));
        auto res = r.resolve(c, digest_of(c.path), dir / "dst" / (std::string(n) + ".txt"));
        CHECK(res.kind == Kind::Skip);
    }
    CHECK(asked == 2);
    CHECK(seen.destination == dir / "dst" / "b.txt");
    CHECK(seen.destination_size == 5);

    fs::remove_all(dir);
}

TEST_CASE("Resolver: defer answered with rename", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "src" / "a.txt", "new");
    write_file(dir / "dst" / "a.txt", "old");

    auto callback = [](const ferry::ConflictContext&) {
        ferry::ConflictAnswer answer;
        answer.decision = ferry::ConflictMode::Rename;
        return answer;
    };
    ferry::NameReservations names;
    ferry::ConflictResolver r(ferry::ConflictMode::Defer, ferry::HashAlgorithm::XxHash,
                              ferry::DEFAULT_CHUNK_SIZE, callback, names);
    auto c = candidate(dir / "src" / "a.txt");
    auto res = r.resolve(c, digest_of(c.path), dir / "dst" / "a.txt");
    CHECK(res.kind == Kind::Place);
    CHECK(res.target == dir / "dst" / "a (1).txt");

    fs::remove_all(dir);
}

TEST_CASE("Resolver: numbered names", "[resolver]") {
    auto dir = make_temp_dir();
    write_file(dir / "archive.tar.gz", "x");
    write_file(dir / "Makefile", "x");

    ferry::NameReservations names;
    CHECK(names.reserve_renamed(dir / "archive.tar.gz") == dir / "archive.tar (1).gz");
    CHECK(names.reserve_renamed(dir / "Makefile") == dir / "Makefile (1)");

    fs::remove_all(dir);
}
