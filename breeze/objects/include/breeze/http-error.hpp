#pragma once

#include <stdexcept>
#include <string>

#include "breeze/http-status-code.hpp"

namespace breeze {

// Raised at setup time: malformed route table, unsupported method name, non-callable handler, invalid
// configuration values. Fatal to startup, never converted into a response.
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string &msg) : std::invalid_argument(msg) {}
  explicit ConfigurationError(const char *msg) : std::invalid_argument(msg) {}
};

// An expected HTTP condition raised from request handling code.
// Resource converts NotFound, MethodNotAllowed and NotModified into a response carrying the same status code.
class HttpError : public std::runtime_error {
 public:
  explicit HttpError(http::StatusCode status);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  static HttpError NotFound() { return HttpError(http::StatusCodeNotFound); }
  static HttpError MethodNotAllowed() { return HttpError(http::StatusCodeMethodNotAllowed); }
  static HttpError NotModified() { return HttpError(http::StatusCodeNotModified); }

 private:
  http::StatusCode _status;
};

}  // namespace breeze
