#include "breeze/route-binding.hpp"

#include <exception>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "breeze/http-error.hpp"
#include "breeze/http-method.hpp"
#include "breeze/http-status-code.hpp"
#include "breeze/log.hpp"
#include "breeze/resource.hpp"

namespace breeze {

namespace {

void CheckRoute(std::string_view route) {
  if (route.empty() || route.front() != '/') {
    throw ConfigurationError("Route '" + std::string(route) + "' should start with '/'");
  }
}

void CheckCallable(const auto& handler) {
  if (!handler) {
    throw ConfigurationError("Request handler registered to app should be callable");
  }
}

}  // namespace

RouteBinding::RouteBinding(Handler handler, std::string_view route, http::MethodBmp methods, bool errorBinding)
    : _handler(std::move(handler)), _route(route), _methods(methods), _errorBinding(errorBinding) {
  if (!_errorBinding) {
    CheckRoute(_route);
    if ((_methods & ~http::kAllMethods) != 0) {
      throw ConfigurationError("Unsupported HTTP method in bitmap " + std::to_string(_methods));
    }
  }
}

RouteBinding::RouteBinding(SyncHandler handler)
    : RouteBinding(Handler(WrapSyncHandler(std::move(handler))), std::string_view(), http::kAllMethods, true) {}

RouteBinding::RouteBinding(SyncHandler handler, std::string_view route, std::initializer_list<std::string_view> methods)
    : RouteBinding(std::move(handler), route, ParseMethods(methods)) {}

RouteBinding::RouteBinding(SyncHandler handler, std::string_view route, http::MethodBmp methods)
    : RouteBinding(Handler(WrapSyncHandler(std::move(handler))), route, methods, false) {}

RouteBinding::RouteBinding(ResourceFactory factory, std::string_view route, http::MethodBmp methods)
    : RouteBinding(Handler(std::move(factory)), route, methods, false) {
  CheckCallable(std::get<ResourceFactory>(_handler));
}

RouteBinding::RouteBinding(ResourceFactory factory, std::string_view route,
                           std::initializer_list<std::string_view> methods)
    : RouteBinding(std::move(factory), route, ParseMethods(methods)) {}

RouteBinding::RouteBinding(std::shared_ptr<Resource> resource, std::string_view route, http::MethodBmp methods)
    : RouteBinding(Handler(std::move(resource)), route, methods, false) {
  if (!std::get<std::shared_ptr<Resource>>(_handler)) {
    throw ConfigurationError("Resource instance registered to app should not be null");
  }
}

RouteBinding::RouteBinding(std::shared_ptr<Resource> resource, std::string_view route,
                           std::initializer_list<std::string_view> methods)
    : RouteBinding(std::move(resource), route, ParseMethods(methods)) {}

RouteBinding::ResourceFactory RouteBinding::WrapSyncHandler(SyncHandler handler) {
  CheckCallable(handler);
  return [handler = std::move(handler)]() {
    auto resource = std::make_shared<Resource>();
    resource->inject(handler);
    return resource;
  };
}

http::MethodBmp RouteBinding::ParseMethods(std::initializer_list<std::string_view> methods) {
  http::MethodBmp bmp{};
  for (std::string_view name : methods) {
    const auto method = http::MethodStrToOptEnum(name);
    if (!method) {
      throw ConfigurationError("Unsupported HTTP method '" + std::string(name) + "'");
    }
    bmp = bmp | *method;
  }
  return bmp;
}

void RouteBinding::follow(IConnection& conn, const HttpRequest& request,
                          std::shared_ptr<const ResourceContext> context) const {
  if (!context) {
    context = ResourceContext::Default();
  }

  std::shared_ptr<Resource> resource;
  if (const auto* pFactory = std::get_if<ResourceFactory>(&_handler)) {
    try {
      resource = (*pFactory)();
      if (!resource) {
        context->logger->error("Resource factory returned no resource for {}", request.path());
      }
    } catch (const std::exception& ex) {
      context->logger->error("Exception while creating resource for {}: {}", request.path(), ex.what());
    } catch (...) {
      context->logger->error("Unknown exception while creating resource for {}", request.path());
    }
    if (!resource) {
      answerInternalError(conn, request, context);
      return;
    }
  } else {
    resource = std::get<std::shared_ptr<Resource>>(_handler);
    if (resource->processing()) {
      context->logger->error("Resource bound to {} is still processing a previous request", _route);
      answerInternalError(conn, request, context);
      return;
    }
  }

  resource->attach(*this, std::move(context));
  resource->react(conn, request);
}

void RouteBinding::answerInternalError(IConnection& conn, const HttpRequest& request,
                                       const std::shared_ptr<const ResourceContext>& context) const {
  auto transient = std::make_shared<Resource>();
  transient->attach(*this, context);
  transient->reject(conn, request, http::StatusCodeInternalServerError);
}

}  // namespace breeze
