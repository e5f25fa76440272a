#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <string>

namespace uptimegrid::core {

/// Logger handed explicitly to every component.
using LoggerPtr = std::shared_ptr<spdlog::logger>;

/**
 * @brief Creates a logger that discards everything.
 * @param name Logger name (not registered globally).
 */
LoggerPtr makeNullLogger(const std::string& name = "null");

} // namespace uptimegrid::core
