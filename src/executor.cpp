#include "ferry/executor.h"
#include "ferry/digest.h"
#include "ferry/log.h"
#include "internal.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace ferry {

namespace fs = std::filesystem;

namespace {

/// Removes a temporary file unless released.
struct TempFile {
    fs::path path;
    bool     keep = false;

    explicit TempFile(fs::path p) : path(std::move(p)) {}
    ~TempFile() {
        if (!keep) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
};

bool exists_nofollow(const fs::path& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

size_t depth(const fs::path& p) {
    return static_cast<size_t>(std::distance(p.begin(), p.end()));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// TransferExecutor
// ---------------------------------------------------------------------------

TransferExecutor::TransferExecutor(TransferSettings settings)
    : settings_(std::move(settings))
{
    if (settings_.chunk_size == 0) {
        throw ValidationError("chunk size must be greater than zero");
    }
}

TransferOutcome TransferExecutor::transfer(Action action,
                                           const fs::path& source,
                                           const fs::path& target,
                                           const Digest& expected,
                                           const std::optional<fs::path>& backup_to) const {
    TransferOutcome out;
    if (settings_.dry_run) return out;

    out.created_dirs = make_parents(target);

    bool placed = false;
    try {
        if (backup_to && exists_nofollow(target)) {
            make_parents(*backup_to);
            relocate(target, *backup_to);
            out.backup = *backup_to;
        }

        bool renamed = false;
        if (action == Action::Move && !settings_.verify) {
            std::error_code ec;
            fs::rename(source, target, ec);
            if (!ec) {
                renamed = true;
            } else if (ec != std::errc::cross_device_link) {
                throw FilesystemError(source.string(),
                                      "cannot move to " + target.string() + ": " + ec.message());
            }
        }

        if (!renamed) {
            copy_into(source, target,
                      settings_.verify && !expected.empty() ? &expected : nullptr,
                      settings_.preserve_meta);
            placed = true;
            if (action == Action::Move) remove_file(source);
        }
    } catch (...) {
        // Put the destination back the way it was, then report.
        std::error_code ec;
        if (placed) fs::remove(target, ec);
        if (out.backup) {
            fs::rename(*out.backup, target, ec);
            if (ec) {
                logger()->error("transfer: could not restore {} from {}: {}",
                                target.string(), out.backup->string(), ec.message());
            }
        }
        prune_dirs(out.created_dirs);
        throw;
    }

    logger()->debug("{}: {} -> {}", action_name(action), source.string(), target.string());
    return out;
}

void TransferExecutor::copy_into(const fs::path& source,
                                 const fs::path& target,
                                 const Digest* verify_against,
                                 bool preserve_meta) const {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw FilesystemError(source.string(),
                              std::string("cannot open for reading: ") + std::strerror(errno));
    }

    TempFile tmp(paths::temp_sibling(target));
    {
        std::ofstream out(tmp.path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw FilesystemError(target.string(),
                                  std::string("cannot create: ") + std::strerror(errno));
        }
        std::vector<char> buffer(settings_.chunk_size);
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = in.gcount();
            if (got > 0 && !out.write(buffer.data(), got)) {
                throw FilesystemError(target.string(),
                                      std::string("write failed: ") + std::strerror(errno));
            }
        }
        if (in.bad()) throw FilesystemError(source.string(), "read error");
        out.close();
        if (!out) {
            throw FilesystemError(target.string(),
                                  std::string("write failed: ") + std::strerror(errno));
        }
    }

    if (verify_against) {
        Digest actual = fingerprint(tmp.path, verify_against->algorithm, settings_.chunk_size);
        if (actual != *verify_against) {
            throw VerificationError(target.string(), verify_against->hex(), actual.hex());
        }
    }

    if (preserve_meta) {
        std::error_code ec;
        auto st = fs::status(source, ec);
        if (!ec) fs::permissions(tmp.path, st.permissions(), fs::perm_options::replace, ec);
        if (ec) {
            logger()->warn("transfer: cannot copy permissions to {}: {}",
                           target.string(), ec.message());
        }
        auto mtime = fs::last_write_time(source, ec);
        if (!ec) fs::last_write_time(tmp.path, mtime, ec);
        if (ec) {
            logger()->warn("transfer: cannot copy modification time to {}: {}",
                           target.string(), ec.message());
        }
    }

    std::error_code ec;
    fs::rename(tmp.path, target, ec);
    if (ec) {
        throw FilesystemError(target.string(), "cannot place file: " + ec.message());
    }
    tmp.keep = true;
}

// ---------------------------------------------------------------------------
// Primitives
// ---------------------------------------------------------------------------

std::vector<fs::path> TransferExecutor::make_parents(const fs::path& file) {
    std::vector<fs::path> missing;
    for (fs::path dir = file.parent_path();
         !dir.empty() && !exists_nofollow(dir);
         dir = dir.parent_path()) {
        missing.push_back(dir);
        if (dir == dir.parent_path()) break;
    }
    std::reverse(missing.begin(), missing.end());

    std::vector<fs::path> created;
    for (auto& dir : missing) {
        std::error_code ec;
        if (fs::create_directory(dir, ec)) {
            created.push_back(dir);
        } else if (ec) {
            throw FilesystemError(dir.string(), "cannot create directory: " + ec.message());
        }
    }
    return created;
}

void TransferExecutor::relocate(const fs::path& from, const fs::path& to) const {
    if (exists_nofollow(to)) {
        throw FilesystemError(to.string(), "already exists");
    }
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;
    if (ec != std::errc::cross_device_link) {
        throw FilesystemError(from.string(),
                              "cannot move to " + to.string() + ": " + ec.message());
    }
    copy_into(from, to, nullptr, true);
    remove_file(from);
}

void TransferExecutor::remove_file(const fs::path& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) throw FilesystemError(path.string(), "cannot remove: " + ec.message());
    if (!removed) throw FilesystemError(path.string(), "no such file");
}

void TransferExecutor::prune_dirs(std::vector<fs::path> dirs) {
    std::sort(dirs.begin(), dirs.end(), [](const fs::path& a, const fs::path& b) {
        return depth(a) > depth(b);
    });
    dirs.erase(std::unique(dirs.begin(), dirs.end()), dirs.end());

    for (auto& dir : dirs) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec)) continue;
        fs::remove(dir, ec);
        if (ec) {
            logger()->warn("prune: cannot remove {}: {}", dir.string(), ec.message());
        }
    }
}

} // namespace ferry
