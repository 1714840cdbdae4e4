#include "ferry/resolver.h"
#include "ferry/digest.h"
#include "ferry/log.h"
#include "internal.h"

#include <system_error>

namespace ferry {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// DedupIndex
// ---------------------------------------------------------------------------

void DedupIndex::scan(const fs::path& root, HashAlgorithm algo, size_t chunk_size) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return;

    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        logger()->warn("dedup: cannot scan {}: {}", root.string(), ec.message());
        return;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            logger()->warn("dedup: scan error under {}: {}", root.string(), ec.message());
            break;
        }
        auto st = it->symlink_status(ec);
        if (ec || !fs::is_regular_file(st)) continue;
        try {
            add(fingerprint(it->path(), algo, chunk_size), it->path());
        } catch (const FilesystemError& e) {
            logger()->warn("dedup: {}", e.what());
        }
    }
    logger()->debug("dedup: indexed {} file(s) under {}", size(), root.string());
}

void DedupIndex::add(const Digest& digest, const fs::path& path) {
    std::lock_guard<std::mutex> lk(mutex_);
    by_digest_[digest.hex()].paths.push_back(path);
    ++count_;
}

std::optional<fs::path> DedupIndex::find(const Digest& digest) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = by_digest_.find(digest.hex());
    if (it == by_digest_.end()) return std::nullopt;
    const Slot& slot = it->second;
    size_t known = slot.paths.size() - (slot.pending ? 1 : 0);
    if (known == 0) return std::nullopt;
    return slot.paths.front();
}

std::optional<fs::path> DedupIndex::claim(const Digest& digest, const fs::path& path) {
    std::string key = digest.hex();
    std::unique_lock<std::mutex> lk(mutex_);
    settled_.wait(lk, [&] {
        auto it = by_digest_.find(key);
        return it == by_digest_.end() || !it->second.pending;
    });

    Slot& slot = by_digest_[key];
    if (!slot.paths.empty()) return slot.paths.front();
    slot.paths.push_back(path);
    slot.pending = true;
    return std::nullopt;
}

void DedupIndex::settle(const Digest& digest, const fs::path& path) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = by_digest_.find(digest.hex());
        if (it == by_digest_.end() || !it->second.pending) return;
        it->second.paths.back() = path;
        it->second.pending = false;
        ++count_;
    }
    settled_.notify_all();
}

void DedupIndex::release(const Digest& digest) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = by_digest_.find(digest.hex());
        if (it == by_digest_.end() || !it->second.pending) return;
        it->second.paths.pop_back();
        it->second.pending = false;
        if (it->second.paths.empty()) by_digest_.erase(it);
    }
    settled_.notify_all();
}

size_t DedupIndex::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return count_;
}

// ---------------------------------------------------------------------------
// NameReservations
// ---------------------------------------------------------------------------

namespace {

bool occupied(const fs::path& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

} // anonymous namespace

bool NameReservations::try_reserve(const fs::path& path) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (reserved_.count(path) || occupied(path)) return false;
    reserved_.insert(path);
    return true;
}

bool NameReservations::claim_existing(const fs::path& path) {
    std::lock_guard<std::mutex> lk(mutex_);
    return reserved_.insert(path).second;
}

fs::path NameReservations::reserve_renamed(const fs::path& target) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (unsigned n = 1; ; ++n) {
        fs::path candidate = paths::numbered(target, n);
        if (reserved_.count(candidate) || occupied(candidate)) continue;
        reserved_.insert(candidate);
        return candidate;
    }
}

bool NameReservations::reserved(const fs::path& path) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return reserved_.count(path) != 0;
}

// ---------------------------------------------------------------------------
// ConflictResolver
// ---------------------------------------------------------------------------

ConflictResolver::ConflictResolver(ConflictMode mode,
                                   HashAlgorithm algo,
                                   size_t chunk_size,
                                   DecisionCallback on_conflict,
                                   NameReservations& names,
                                   DedupIndex* index)
    : mode_(mode)
    , algo_(algo)
    , chunk_size_(chunk_size)
    , on_conflict_(std::move(on_conflict))
    , names_(names)
    , index_(index)
{}

Resolution ConflictResolver::resolve(const CandidateEntry& candidate,
                                     const Digest& digest,
                                     const fs::path& target) {
    bool identical = false;
    if (!index_) return place(candidate, digest, target, identical);

    if (auto dup = index_->claim(digest, target)) {
        Resolution r;
        r.kind   = Resolution::Kind::Skip;
        r.target = target;
        r.reason = "duplicate of " + dup->string();
        return r;
    }

    Resolution r;
    try {
        r = place(candidate, digest, target, identical);
    } catch (...) {
        index_->release(digest);
        throw;
    }
    if (r.kind == Resolution::Kind::Skip) {
        // Identical bytes already sit at the target; anything else skipped
        // leaves the content unplaced.
        if (identical) {
            index_->settle(digest, r.target);
        } else {
            index_->release(digest);
        }
    }
    return r;
}

Resolution ConflictResolver::place(const CandidateEntry& candidate,
                                   const Digest& digest,
                                   const fs::path& target,
                                   bool& identical) {
    Resolution r;
    r.target = target;

    if (names_.try_reserve(target)) {
        r.kind = Resolution::Kind::Place;
        return r;
    }

    // Occupied. Placement is an atomic rename, so a regular file at the
    // target is always complete; a name merely claimed by an in-flight
    // transfer of this run has nothing to compare yet.
    std::error_code ec;
    auto st = fs::symlink_status(target, ec);
    if (!ec && fs::is_regular_file(st)) {
        if (fingerprint(target, algo_, chunk_size_) == digest) {
            r.kind    = Resolution::Kind::Skip;
            r.reason  = "identical content at destination";
            identical = true;
            return r;
        }
    }

    switch (decide(candidate, digest, target)) {
        case ConflictMode::Rename:
            r.kind   = Resolution::Kind::Place;
            r.target = names_.reserve_renamed(target);
            return r;

        case ConflictMode::Skip:
            r.kind   = Resolution::Kind::Skip;
            r.reason = "destination exists";
            return r;

        case ConflictMode::Overwrite:
            if (fs::is_directory(st)) {
                throw FilesystemError(target.string(), "destination is a directory");
            }
            if (!names_.claim_existing(target)) {
                throw ConflictError(target.string() + " (claimed by another file of this run)");
            }
            r.kind = Resolution::Kind::Replace;
            return r;

        case ConflictMode::Defer:
            break;
    }
    throw ConflictError(target.string());
}

ConflictMode ConflictResolver::decide(const CandidateEntry& candidate,
                                      const Digest& digest,
                                      const fs::path& target) {
    if (mode_ != ConflictMode::Defer) return mode_;

    {
        std::lock_guard<std::mutex> lk(decision_mutex_);
        if (sticky_) return *sticky_;
    }
    if (!on_conflict_) throw ConflictError(target.string());

    ConflictContext ctx;
    ctx.source        = candidate.path;
    ctx.destination   = target;
    ctx.source_digest = digest;
    ctx.source_size   = candidate.size;
    std::error_code ec;
    auto dsize = fs::file_size(target, ec);
    ctx.destination_size = ec ? 0 : dsize;

    ConflictAnswer answer = on_conflict_(ctx);
    if (answer.decision == ConflictMode::Defer) throw ConflictError(target.string());
    if (answer.apply_to_all) {
        std::lock_guard<std::mutex> lk(decision_mutex_);
        if (!sticky_) sticky_ = answer.decision;
    }
    return answer.decision;
}

} // namespace ferry
