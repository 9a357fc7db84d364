#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/logger.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <memory>

namespace breeze {

namespace log = spdlog;

// Loggers are injected into the components that emit messages instead of being reached through a
// process-wide singleton. A null Logger is never stored: components fall back to the spdlog default logger.
using Logger = std::shared_ptr<spdlog::logger>;

inline Logger LoggerOrDefault(Logger logger) {
  if (!logger) {
    logger = spdlog::default_logger();
  }
  return logger;
}

}  // namespace breeze
