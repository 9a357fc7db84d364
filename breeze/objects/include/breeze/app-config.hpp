#pragma once

#include <string>
#include <string_view>

#include "breeze/http-constants.hpp"

namespace breeze {

struct AppConfig {
  // Global switch for ETag based conditional responses. When false, no Resource computes nor checks ETags,
  // regardless of Resource::etagAvailable(). Default: true.
  bool enableEtag{true};

  // Emit one "<METHOD> <URL> <STATUS>" info line per completed request. Default: true.
  bool enableAccessLog{true};

  // Emit "Connection: close" on every response. The engine serves a single request per connection
  // and always closes it once the response has been written. Default: true.
  bool closeConnection{true};

  // If non-empty, a "Server" header with this value is added to every response.
  std::string serverName;

  // Content-Type applied to responses with a body when the handler did not set one.
  std::string defaultContentType{http::ContentTypeTextPlainUtf8};

  AppConfig& withEtag(bool enable = true);

  AppConfig& withAccessLog(bool enable = true);

  AppConfig& withCloseConnection(bool enable = true);

  AppConfig& withServerName(std::string_view name);

  AppConfig& withDefaultContentType(std::string_view contentType);

  // Throws ConfigurationError if some values cannot be emitted as header values.
  void validate() const;
};

}  // namespace breeze
