#include "ferry/log.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ferry {

namespace {

std::mutex                      s_logger_mutex;
std::shared_ptr<spdlog::logger> s_logger;

std::shared_ptr<spdlog::logger> make_default() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto lg = std::make_shared<spdlog::logger>("ferry", std::move(sink));
    lg->set_level(spdlog::level::warn);
    return lg;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lk(s_logger_mutex);
    if (!s_logger) s_logger = make_default();
    return s_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> lg) {
    std::lock_guard<std::mutex> lk(s_logger_mutex);
    s_logger = lg ? std::move(lg) : make_default();
}

} // namespace ferry
