#pragma once

#include <concepts>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "breeze/connection.hpp"
#include "breeze/http-method.hpp"
#include "breeze/http-request.hpp"
#include "breeze/resource-context.hpp"
#include "breeze/resource.hpp"

namespace breeze {

// Association of a route, a set of allowed HTTP methods and a request handler.
//
// The handler is either:
//  - a ResourceFactory, called once per request to get a fresh Resource (this is also how plain function
//    handlers are stored: each request gets its own Resource invoking the function),
//  - a bound Resource instance, reused for sequential requests.
//
// A binding constructed without route is an error binding: it is the fallback used when no route matches the
// request path, it accepts every method and allowed() always returns false for it.
class RouteBinding {
 public:
  using SyncHandler = Resource::SyncHandler;
  using ResourceFactory = std::function<std::shared_ptr<Resource>()>;
  using Handler = std::variant<ResourceFactory, std::shared_ptr<Resource>>;

  // Error binding answering every request by calling 'handler'.
  // Throws ConfigurationError if 'handler' is empty.
  explicit RouteBinding(SyncHandler handler);

  // Binds a plain function to 'route' for given method names (case-insensitive, among GET, HEAD, POST, PUT
  // and DELETE).
  // Throws ConfigurationError if 'handler' is empty, if 'route' does not start with '/' or if a method name
  // is not supported.
  RouteBinding(SyncHandler handler, std::string_view route, std::initializer_list<std::string_view> methods);

  RouteBinding(SyncHandler handler, std::string_view route, http::MethodBmp methods);

  RouteBinding(ResourceFactory factory, std::string_view route, http::MethodBmp methods);

  RouteBinding(ResourceFactory factory, std::string_view route, std::initializer_list<std::string_view> methods);

  // Binds an existing instance. It will serve all requests to 'route', one at a time.
  RouteBinding(std::shared_ptr<Resource> resource, std::string_view route, http::MethodBmp methods);

  RouteBinding(std::shared_ptr<Resource> resource, std::string_view route,
               std::initializer_list<std::string_view> methods);

  // Binding creating a new default constructed ResourceT for each request.
  template <std::derived_from<Resource> ResourceT>
  static RouteBinding Of(std::string_view route, http::MethodBmp methods) {
    return {ResourceFactory([] { return std::make_shared<ResourceT>(); }), route, methods};
  }

  template <std::derived_from<Resource> ResourceT>
  static RouteBinding Of(std::string_view route, std::initializer_list<std::string_view> methods) {
    return {ResourceFactory([] { return std::make_shared<ResourceT>(); }), route, methods};
  }

  // Makes a Resource handle 'request' received on 'conn'.
  // Both should stay valid until the response has been written.
  // If no Resource can be provided (factory failure, busy bound instance), a 500 response is sent.
  void follow(IConnection& conn, const HttpRequest& request,
              std::shared_ptr<const ResourceContext> context = ResourceContext::Default()) const;

  // Tells whether 'method' is accepted by this binding. Always false for an error binding.
  [[nodiscard]] bool allowed(http::Method method) const noexcept {
    return !_errorBinding && http::IsMethodSet(_methods, method);
  }

  [[nodiscard]] bool isErrorBinding() const noexcept { return _errorBinding; }

  // Empty for an error binding.
  [[nodiscard]] std::string_view route() const noexcept { return _route; }

  [[nodiscard]] http::MethodBmp methods() const noexcept { return _methods; }

  [[nodiscard]] bool holdsInstance() const noexcept { return std::holds_alternative<std::shared_ptr<Resource>>(_handler); }

 private:
  RouteBinding(Handler handler, std::string_view route, http::MethodBmp methods, bool errorBinding);

  static ResourceFactory WrapSyncHandler(SyncHandler handler);

  static http::MethodBmp ParseMethods(std::initializer_list<std::string_view> methods);

  void answerInternalError(IConnection& conn, const HttpRequest& request,
                           const std::shared_ptr<const ResourceContext>& context) const;

  Handler _handler;
  std::string _route;
  http::MethodBmp _methods{};
  bool _errorBinding{false};
};

}  // namespace breeze
