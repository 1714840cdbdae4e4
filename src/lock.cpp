#include "internal.h"
#include "ferry/error.h"

#include <filesystem>
#include <string>
#include <functional>
#include <chrono>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>

namespace ferry {
namespace lock {

namespace {

/// RAII POSIX flock guard.
struct FlockGuard {
    int fd;
    explicit FlockGuard(int f) : fd(f) {}
    ~FlockGuard() {
        if (fd >= 0) {
            ::flock(fd, LOCK_UN);
            ::close(fd);
        }
    }
    FlockGuard(const FlockGuard&) = delete;
    FlockGuard& operator=(const FlockGuard&) = delete;
};

} // anonymous namespace

/// Take an exclusive flock on `<journal>.lock`, run `fn`, release.
/// Waits up to 30 seconds for other writers.
void with_journal_lock(const std::filesystem::path& journal,
                       std::function<void()> fn) {
    std::string lock_str = journal.string() + ".lock";

    int fd = ::open(lock_str.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw JournalError("cannot open lock file: " + lock_str +
                           ": " + std::strerror(errno));
    }
    FlockGuard guard(fd);

    using namespace std::chrono;
    auto deadline = steady_clock::now() + seconds(30);
    while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK && errno != EINTR) {
            throw JournalError(std::string("flock failed: ") + std::strerror(errno));
        }
        if (steady_clock::now() >= deadline) {
            throw JournalError("timeout waiting for journal lock: " + lock_str);
        }
        std::this_thread::sleep_for(milliseconds(20));
    }

    fn();
}

} // namespace lock
} // namespace ferry
