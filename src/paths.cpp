#include "internal.h"
#include "ferry/error.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <random>
#include <string>

#include <unistd.h>

namespace ferry {
namespace paths {

/// "report.txt" -> "report (n).txt"; ".bashrc" -> ".bashrc (n)";
/// "a.tar.gz" -> "a.tar (n).gz".
std::filesystem::path numbered(const std::filesystem::path& target, unsigned n) {
    std::string stem = target.stem().string();
    std::string ext  = target.extension().string();
    std::string name = stem + " (" + std::to_string(n) + ")" + ext;
    return target.parent_path() / name;
}

std::filesystem::path temp_sibling(const std::filesystem::path& target) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%08x",
                  static_cast<unsigned>(rng()));
    std::string name = "." + target.filename().string() +
                       ".ferry-" + suffix + ".tmp";
    return target.parent_path() / name;
}

std::filesystem::path absolute_normal(const std::filesystem::path& p) {
    return std::filesystem::absolute(p).lexically_normal();
}

bool is_within(const std::filesystem::path& child,
               const std::filesystem::path& parent) {
    auto c = absolute_normal(child);
    auto p = absolute_normal(parent);
    auto ci = c.begin();
    for (auto pi = p.begin(); pi != p.end(); ++pi) {
        if (pi->empty()) continue; // trailing separator
        if (ci == c.end() || *ci != *pi) return false;
        ++ci;
    }
    return true;
}

std::string make_process_id() {
    static std::mutex m;
    static std::mt19937_64 rng{std::random_device{}() ^
        static_cast<uint64_t>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count())};

    uint32_t salt;
    {
        std::lock_guard<std::mutex> lk(m);
        salt = static_cast<uint32_t>(rng());
    }

    std::time_t t = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%SZ", &utc);

    char buf[80];
    std::snprintf(buf, sizeof(buf), "%s-%ld-%08x",
                  stamp, static_cast<long>(::getpid()), salt);
    return buf;
}

uint64_t now_millis() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace paths
} // namespace ferry
