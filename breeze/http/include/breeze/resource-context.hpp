#pragma once

#include <memory>

#include "breeze/app-config.hpp"
#include "breeze/log.hpp"

namespace breeze {

// Per-application state shared (read-only) by every Resource serving a request of this application.
struct ResourceContext {
  // Context made of the current spdlog default logger and a default AppConfig.
  static std::shared_ptr<const ResourceContext> Default();

  Logger logger;
  AppConfig config;
};

}  // namespace breeze
