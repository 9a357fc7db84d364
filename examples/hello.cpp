#include <breeze/breeze.hpp>
#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

using namespace breeze;

namespace {

// Connection printing each response on the standard output.
class StdoutConnection : public IConnection {
 public:
  void write(std::string payload, WriteCompletion onComplete) override {
    std::cout << payload << "\n\n";
    _lastPayload = std::move(payload);
    onComplete();
  }

  void close() override { std::cout << "-- connection closed --\n\n"; }

  // Value of the ETag header of the last response, empty if none.
  [[nodiscard]] std::string lastEtag() const {
    static constexpr std::string_view kEtagPrefix = "\r\nETag: ";
    const auto pos = _lastPayload.find(kEtagPrefix);
    if (pos == std::string::npos) {
      return {};
    }
    const auto first = pos + kEtagPrefix.size();
    return _lastPayload.substr(first, _lastPayload.find("\r\n", first) - first);
  }

 private:
  std::string _lastPayload;
};

class HelloResource : public Resource {
 protected:
  void handleGet() override {
    write("hello ");
    write(request().headerValue("X-Name").value_or("wind"));
    write("!");
    finish();
  }

  void handlePost() override {
    setStatusCode(http::StatusCodeCreated);
    write("posted to ");
    write(request().url());
    finish();
  }
};

}  // namespace

int main(int argc, char **argv) {
  std::string_view target = "/";
  if (argc > 1) {
    target = argv[1];
  }

  std::cout << fullVersionString() << "\n\n";

  try {
    Application app({RouteBinding([](const HttpRequest &) { return std::string("hello wind!"); }, "/", {"get"}),
                     RouteBinding::Of<HelloResource>("/resource", {"get", "post"})},
                    AppConfig{}.withServerName("breeze-hello"));

    StdoutConnection conn;
    for (http::Method method : {http::Method::GET, http::Method::POST}) {
      HttpRequest request(method, target);
      request.header(http::Host, "localhost");
      app.react(conn, request);
    }

    // Conditional request: same content, so the ETag matches and no body is sent.
    HttpRequest first(http::Method::GET, "/resource");
    app.react(conn, first);
    HttpRequest conditional(http::Method::GET, "/resource");
    conditional.header(http::IfNoneMatch, conn.lastEtag());
    app.react(conn, conditional);
  } catch (const std::exception &e) {
    std::cerr << "breeze-hello encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
