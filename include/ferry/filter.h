#pragma once

#include "error.h"
#include "types.h"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace ferry {

// ---------------------------------------------------------------------------
// FilterRules
// ---------------------------------------------------------------------------

/// Selection rules for candidate files. Exclude patterns always win over
/// include patterns; with no include pattern every non-excluded file passes.
struct FilterRules {
    bool recurse       = false;
    bool has_extension = false; ///< Match against ".ext" instead of the file name.

    std::optional<std::vector<std::string>> include_regex;
    std::optional<std::vector<std::string>> exclude_regex;
    std::optional<std::vector<std::string>> include_glob;
    std::optional<std::vector<std::string>> exclude_glob;

    /// Pick the filter-related fields out of TransferOptions.
    static FilterRules from_options(const TransferOptions& opts);
};

// ---------------------------------------------------------------------------
// FileFilter
// ---------------------------------------------------------------------------

/// Lazy, restartable sequence of regular files under a root directory.
///
/// Directories are read one at a time as the iteration reaches them and
/// entries come out sorted by name, so two scans of an unchanged tree yield
/// the same order. Symbolic links are neither followed nor yielded.
///
/// @code
///     ferry::FileFilter filter("/data/photos", rules);
///     for (const auto& c : filter) {
///         std::cout << c.relative << "\n";
///     }
/// @endcode
class FileFilter {
public:
    /// @throws ValidationError if `root` is missing or not a directory,
    ///         or if a regex does not compile.
    FileFilter(std::filesystem::path root, FilterRules rules);

    /// True if a file at `relative` (to the root) passes the rules.
    bool matches(const std::filesystem::path& relative) const;

    const std::filesystem::path& root() const { return root_; }
    const FilterRules& rules() const { return rules_; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = CandidateEntry;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const CandidateEntry*;
        using reference         = const CandidateEntry&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++();

        bool operator==(const iterator& o) const { return state_ == o.state_; }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        friend class FileFilter;
        struct State;

        explicit iterator(const FileFilter* owner);
        void advance();

        std::shared_ptr<State> state_; ///< Null at end.
        CandidateEntry         current_;
    };

    /// Start a fresh scan of the tree.
    iterator begin() const { return iterator(this); }
    iterator end() const { return iterator(); }

    /// Run a full scan and return every candidate.
    std::vector<CandidateEntry> collect() const;

private:
    std::filesystem::path   root_;
    FilterRules             rules_;
    std::vector<std::regex> include_re_;
    std::vector<std::regex> exclude_re_;
};

} // namespace ferry
