#pragma once

#include <memory>

#include <spdlog/logger.h>

namespace ferry {

/// The library logger ("ferry"). Created on first use with a stderr sink at
/// warn level.
std::shared_ptr<spdlog::logger> logger();

/// Route library logging through `lg`. Passing nullptr restores the default.
void set_logger(std::shared_ptr<spdlog::logger> lg);

} // namespace ferry
