#include "breeze/route-binding.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "breeze/app-config.hpp"
#include "breeze/http-error.hpp"
#include "breeze/http-method.hpp"
#include "breeze/http-request.hpp"
#include "breeze/http-status-code.hpp"
#include "breeze/log-capture.hpp"
#include "breeze/log.hpp"
#include "breeze/recording-connection.hpp"
#include "breeze/resource-context.hpp"
#include "breeze/resource.hpp"
#include "breeze/response-parsing.hpp"

namespace breeze {

namespace {

class CountingResource : public Resource {
 public:
  static inline int nbInstances = 0;

  CountingResource() { ++nbInstances; }

 protected:
  void handleGet() override {
    write("counted");
    finish();
  }
};

// Never answers by itself.
class IdleResource : public Resource {
 public:
  void answer() {
    write("idle");
    finish();
  }

 protected:
  void handleGet() override {}
};

}  // namespace

class RouteBindingTest : public ::testing::Test {
 protected:
  [[nodiscard]] std::shared_ptr<const ResourceContext> context() const {
    return std::make_shared<const ResourceContext>(ResourceContext{logs.logger(), AppConfig{}});
  }

  test::ParsedResponse follow(const RouteBinding& binding, const HttpRequest& request) {
    binding.follow(conn, request, context());
    return test::ParseResponse(conn.lastPayload());
  }

  test::LogCapture logs;
  test::RecordingConnection conn;
};

TEST_F(RouteBindingTest, MethodNamesAreCaseInsensitive) {
  RouteBinding binding([](const HttpRequest&) { return std::string("x"); }, "/x", {"get", "POST", "Delete"});
  EXPECT_FALSE(binding.isErrorBinding());
  EXPECT_EQ(binding.route(), "/x");
  EXPECT_TRUE(binding.allowed(http::Method::GET));
  EXPECT_TRUE(binding.allowed(http::Method::POST));
  EXPECT_TRUE(binding.allowed(http::Method::DELETE));
  EXPECT_FALSE(binding.allowed(http::Method::PUT));
  EXPECT_FALSE(binding.allowed(http::Method::HEAD));
  EXPECT_EQ(binding.methods(), http::Method::GET | http::Method::POST | http::Method::DELETE);
}

TEST_F(RouteBindingTest, MethodBitmap) {
  auto binding = RouteBinding::Of<CountingResource>("/c", http::Method::PUT | http::Method::HEAD);
  EXPECT_TRUE(binding.allowed(http::Method::PUT));
  EXPECT_TRUE(binding.allowed(http::Method::HEAD));
  EXPECT_FALSE(binding.allowed(http::Method::GET));
  EXPECT_FALSE(binding.holdsInstance());
}

TEST_F(RouteBindingTest, UnsupportedMethodName) {
  try {
    RouteBinding binding([](const HttpRequest&) { return std::string(); }, "/x", {"get", "patch"});
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError& ex) {
    EXPECT_STREQ(ex.what(), "Unsupported HTTP method 'patch'");
  }
  EXPECT_THROW(RouteBinding::Of<CountingResource>("/c", {"connect"}), ConfigurationError);
  EXPECT_THROW(RouteBinding::Of<CountingResource>("/c", static_cast<http::MethodBmp>(1U << 6)), ConfigurationError);
}

TEST_F(RouteBindingTest, InvalidRoute) {
  EXPECT_THROW(RouteBinding::Of<CountingResource>("", {"get"}), ConfigurationError);
  EXPECT_THROW(RouteBinding::Of<CountingResource>("items", {"get"}), ConfigurationError);
}

TEST_F(RouteBindingTest, HandlerShouldBeCallable) {
  EXPECT_THROW(RouteBinding(RouteBinding::SyncHandler{}, "/x", {"get"}), ConfigurationError);
  EXPECT_THROW(RouteBinding(RouteBinding::SyncHandler{}), ConfigurationError);
  EXPECT_THROW(RouteBinding(RouteBinding::ResourceFactory{}, "/x", {"get"}), ConfigurationError);
  EXPECT_THROW(RouteBinding(std::shared_ptr<Resource>{}, "/x", {"get"}), ConfigurationError);
}

TEST_F(RouteBindingTest, ErrorBinding) {
  RouteBinding binding([](const HttpRequest&) -> std::string { throw HttpError::NotFound(); });
  EXPECT_TRUE(binding.isErrorBinding());
  EXPECT_TRUE(binding.route().empty());
  EXPECT_FALSE(binding.allowed(http::Method::GET));

  // Every method reaches the handler.
  const auto response = follow(binding, HttpRequest(http::Method::PUT, "/whatever"));
  EXPECT_EQ(response.statusCode, http::StatusCodeNotFound);
}

TEST_F(RouteBindingTest, DisallowedMethodNeverRunsHandler) {
  int nbCalls = 0;
  RouteBinding binding(
      [&nbCalls](const HttpRequest&) {
        ++nbCalls;
        return std::string("called");
      },
      "/x", {"get"});
  const auto response = follow(binding, HttpRequest(http::Method::POST, "/x"));
  EXPECT_EQ(response.statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(nbCalls, 0);
}

TEST_F(RouteBindingTest, FunctionHandlerGetsRequest) {
  RouteBinding binding([](const HttpRequest& request) { return std::string(request.path()); }, "/x", {"get"});
  const auto response = follow(binding, HttpRequest(http::Method::GET, "/x?q=1"));
  EXPECT_EQ(response.statusCode, http::StatusCodeOK);
  EXPECT_EQ(response.body, "/x");
}

TEST_F(RouteBindingTest, FreshResourcePerRequest) {
  CountingResource::nbInstances = 0;
  const auto binding = RouteBinding::Of<CountingResource>("/c", {"get"});
  HttpRequest request(http::Method::GET, "/c");
  binding.follow(conn, request, context());
  binding.follow(conn, request, context());
  EXPECT_EQ(CountingResource::nbInstances, 2);
  EXPECT_EQ(conn.nbWrites(), 2U);
}

TEST_F(RouteBindingTest, BoundInstanceIsReused) {
  CountingResource::nbInstances = 0;
  auto resource = std::make_shared<CountingResource>();
  RouteBinding binding(resource, "/c", {"get"});
  EXPECT_TRUE(binding.holdsInstance());
  HttpRequest request(http::Method::GET, "/c");
  binding.follow(conn, request, context());
  binding.follow(conn, request, context());
  EXPECT_EQ(CountingResource::nbInstances, 1);
  EXPECT_EQ(conn.nbWrites(), 2U);
}

TEST_F(RouteBindingTest, BusyBoundInstance) {
  auto resource = std::make_shared<IdleResource>();
  RouteBinding binding(resource, "/idle", {"get"});
  HttpRequest request(http::Method::GET, "/idle");

  test::RecordingConnection firstConn;
  binding.follow(firstConn, request, context());
  EXPECT_TRUE(resource->processing());

  const auto busyResponse = follow(binding, request);
  EXPECT_EQ(busyResponse.statusCode, http::StatusCodeInternalServerError);
  EXPECT_TRUE(conn.closed());
  EXPECT_EQ(logs.count(log::level::err, "still processing"), 1U);

  // the busy instance was not disturbed
  EXPECT_TRUE(resource->processing());
  EXPECT_EQ(firstConn.nbWrites(), 0U);
  resource->answer();
  EXPECT_EQ(test::ParseResponse(firstConn.lastPayload()).body, "idle");
  EXPECT_FALSE(resource->processing());
}

TEST_F(RouteBindingTest, ThrowingFactory) {
  RouteBinding binding(RouteBinding::ResourceFactory([]() -> std::shared_ptr<Resource> {
                         throw std::runtime_error("no resource today");
                       }),
                       "/f", {"get"});
  const auto response = follow(binding, HttpRequest(http::Method::GET, "/f"));
  EXPECT_EQ(response.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(logs.count(log::level::err), 1U);
  EXPECT_EQ(logs.count(log::level::err, "no resource today"), 1U);
}

TEST_F(RouteBindingTest, NullFactoryResult) {
  RouteBinding binding(RouteBinding::ResourceFactory([] { return std::shared_ptr<Resource>(); }), "/f", {"get"});
  const auto response = follow(binding, HttpRequest(http::Method::GET, "/f"));
  EXPECT_EQ(response.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(logs.count(log::level::err), 1U);
}

TEST_F(RouteBindingTest, DefaultContext) {
  const auto binding = RouteBinding::Of<CountingResource>("/c", {"get"});
  HttpRequest request(http::Method::GET, "/c");
  binding.follow(conn, request);
  EXPECT_EQ(test::ParseResponse(conn.lastPayload()).body, "counted");
}

}  // namespace breeze
