#pragma once

#include "visibility.hpp"
#include <memory>
#include <spdlog/spdlog.h>

namespace replay {

/**
 * @brief Returns the logger every replay component writes to. Unless an application
 * installs its own with setLogger(), a stdout color logger named "replay" is created
 * on first use.
 */
REPLAY_PUBLIC std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Replaces the library logger. Passing nullptr restores the default.
 */
REPLAY_PUBLIC void setLogger(std::shared_ptr<spdlog::logger> logger);

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "log.inl"
#endif
