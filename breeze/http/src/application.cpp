#include "breeze/application.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "breeze/http-error.hpp"
#include "breeze/http-request.hpp"
#include "breeze/log.hpp"
#include "breeze/resource-context.hpp"
#include "breeze/route-binding.hpp"

namespace breeze {

namespace {

std::shared_ptr<const ResourceContext> BuildContext(AppConfig config, Logger logger) {
  config.validate();
  return std::make_shared<const ResourceContext>(ResourceContext{LoggerOrDefault(std::move(logger)), std::move(config)});
}

}  // namespace

Application::Application(std::vector<RouteBinding> bindings, AppConfig config, Logger logger)
    : _routes(std::move(bindings)),
      _notFoundBinding([](const HttpRequest&) -> std::string { throw HttpError::NotFound(); }),
      _context(BuildContext(std::move(config), std::move(logger))) {
  std::unordered_set<std::string_view> seenRoutes;
  for (const RouteBinding& binding : _routes) {
    if (!seenRoutes.insert(binding.route()).second) {
      _context->logger->warn("Route {} is registered more than once, only the first binding will be used",
                             binding.route());
    }
  }
  _context->logger->debug("Application created with {} route(s)", _routes.size());
}

void Application::react(IConnection& conn, const HttpRequest& request) {
  const RouteBinding* binding = _routes.lookup(request.path());
  if (binding == nullptr) {
    binding = &_notFoundBinding;
  }
  binding->follow(conn, request, _context);
}

}  // namespace breeze
