#include "ferry/filter.h"
#include "ferry/log.h"
#include "internal.h"

#include <algorithm>
#include <system_error>

namespace ferry {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// FilterRules
// ---------------------------------------------------------------------------

FilterRules FilterRules::from_options(const TransferOptions& opts) {
    FilterRules r;
    r.recurse       = opts.recurse;
    r.has_extension = opts.has_extension;
    r.include_regex = opts.include_regex;
    r.exclude_regex = opts.exclude_regex;
    r.include_glob  = opts.include_glob;
    r.exclude_glob  = opts.exclude_glob;
    return r;
}

// ---------------------------------------------------------------------------
// FileFilter
// ---------------------------------------------------------------------------

namespace {

std::vector<std::regex>
compile_all(const std::optional<std::vector<std::string>>& patterns) {
    std::vector<std::regex> out;
    if (!patterns) return out;
    for (auto& p : *patterns) {
        if (p.empty()) continue;
        try {
            out.emplace_back(p, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw ValidationError("invalid regex '" + p + "': " + e.what());
        }
    }
    return out;
}

bool has_patterns(const std::optional<std::vector<std::string>>& patterns) {
    if (!patterns) return false;
    return std::any_of(patterns->begin(), patterns->end(),
                       [](const std::string& p) { return !p.empty(); });
}

/// Read one directory, sorted by name. Unreadable directories yield nothing.
std::vector<fs::directory_entry> read_sorted(const fs::path& dir) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        logger()->warn("filter: cannot read {}: {}", dir.string(), ec.message());
        return entries;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            logger()->warn("filter: error while reading {}: {}", dir.string(), ec.message());
            break;
        }
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });
    return entries;
}

} // anonymous namespace

FileFilter::FileFilter(fs::path root, FilterRules rules)
    : root_(paths::absolute_normal(root))
    , rules_(std::move(rules))
{
    std::error_code ec;
    auto st = fs::status(root_, ec);
    if (ec || !fs::exists(st)) {
        throw ValidationError("source does not exist: " + root_.string());
    }
    if (!fs::is_directory(st)) {
        throw ValidationError("source is not a directory: " + root_.string());
    }
    include_re_ = compile_all(rules_.include_regex);
    exclude_re_ = compile_all(rules_.exclude_regex);
}

bool FileFilter::matches(const fs::path& relative) const {
    std::string name = relative.filename().string();
    std::string rel  = relative.generic_string();
    std::string ext  = relative.extension().string();
    const std::string& subject = rules_.has_extension ? ext : name;

    auto glob_hit = [&](const std::string& pattern) {
        if (pattern.empty()) return false;
        if (rules_.has_extension) {
            return glob::fnmatch(pattern, ext)
                || (!ext.empty() && glob::fnmatch(pattern, ext.substr(1)));
        }
        return glob::fnmatch(pattern, name) || glob::fnmatch(pattern, rel);
    };
    auto regex_hit = [&](const std::regex& re) {
        return std::regex_search(subject, re);
    };

    // Exclusions first: they win over any include.
    if (std::any_of(exclude_re_.begin(), exclude_re_.end(), regex_hit)) return false;
    if (rules_.exclude_glob &&
        std::any_of(rules_.exclude_glob->begin(), rules_.exclude_glob->end(), glob_hit)) {
        return false;
    }

    if (!include_re_.empty() &&
        std::none_of(include_re_.begin(), include_re_.end(), regex_hit)) {
        return false;
    }
    if (has_patterns(rules_.include_glob) &&
        std::none_of(rules_.include_glob->begin(), rules_.include_glob->end(), glob_hit)) {
        return false;
    }
    return true;
}

std::vector<CandidateEntry> FileFilter::collect() const {
    std::vector<CandidateEntry> out;
    for (const auto& c : *this) out.push_back(c);
    return out;
}

// ---------------------------------------------------------------------------
// FileFilter::iterator
// ---------------------------------------------------------------------------

struct FileFilter::iterator::State {
    struct Frame {
        std::vector<fs::directory_entry> entries;
        size_t                           next = 0;
    };

    const FileFilter*  owner;
    std::vector<Frame> stack;
};

FileFilter::iterator::iterator(const FileFilter* owner)
    : state_(std::make_shared<State>())
{
    state_->owner = owner;
    state_->stack.push_back({read_sorted(owner->root_), 0});
    advance();
}

FileFilter::iterator& FileFilter::iterator::operator++() {
    advance();
    return *this;
}

void FileFilter::iterator::advance() {
    if (!state_) return;
    const FileFilter& owner = *state_->owner;

    while (!state_->stack.empty()) {
        auto& frame = state_->stack.back();
        if (frame.next >= frame.entries.size()) {
            state_->stack.pop_back();
            continue;
        }
        const fs::directory_entry entry = frame.entries[frame.next++];

        std::error_code ec;
        auto st = entry.symlink_status(ec);
        if (ec) continue;

        if (fs::is_directory(st)) {
            if (owner.rules_.recurse) {
                state_->stack.push_back({read_sorted(entry.path()), 0});
            }
            continue;
        }
        if (!fs::is_regular_file(st)) continue; // symlinks, fifos, sockets

        fs::path rel = entry.path().lexically_relative(owner.root_);
        if (!owner.matches(rel)) continue;

        current_.path     = entry.path();
        current_.relative = rel;
        current_.size     = entry.file_size(ec);
        if (ec) current_.size = 0;
        current_.mtime    = entry.last_write_time(ec);
        return;
    }

    state_.reset(); // exhausted
}

} // namespace ferry
