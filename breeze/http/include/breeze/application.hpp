#pragma once

#include <memory>
#include <vector>

#include "breeze/app-config.hpp"
#include "breeze/connection.hpp"
#include "breeze/http-request.hpp"
#include "breeze/log.hpp"
#include "breeze/resource-context.hpp"
#include "breeze/route-binding.hpp"
#include "breeze/route-table.hpp"

namespace breeze {

// Entry point of the engine: routes each (connection, request) pair delivered by the transport layer to the
// binding registered for the request path, or to a fallback answering 404 Not Found.
//
// Example:
//
//   breeze::Application app({breeze::RouteBinding([](const breeze::HttpRequest&) { return std::string("hello wind!"); },
//                                                 "/", {"get"})});
//   app.react(conn, request);
class Application {
 public:
  // Throws ConfigurationError if 'config' is invalid or if one of the bindings is an error binding.
  // If 'logger' is null, the spdlog default logger is used.
  explicit Application(std::vector<RouteBinding> bindings, AppConfig config = {}, Logger logger = {});

  // Handles 'request' received on 'conn'. Both should stay valid until the response has been written,
  // which is signaled by the closing of 'conn'.
  void react(IConnection& conn, const HttpRequest& request);

  [[nodiscard]] const RouteTable& routes() const noexcept { return _routes; }

  [[nodiscard]] const AppConfig& config() const noexcept { return _context->config; }

  [[nodiscard]] const Logger& logger() const noexcept { return _context->logger; }

 private:
  RouteTable _routes;
  RouteBinding _notFoundBinding;
  std::shared_ptr<const ResourceContext> _context;
};

}  // namespace breeze
