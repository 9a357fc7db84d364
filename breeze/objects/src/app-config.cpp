#include "breeze/app-config.hpp"

#include <string>
#include <string_view>

#include "breeze/http-error.hpp"
#include "breeze/http-header-is-valid.hpp"

namespace breeze {

AppConfig& AppConfig::withEtag(bool enable) {
  enableEtag = enable;
  return *this;
}

AppConfig& AppConfig::withAccessLog(bool enable) {
  enableAccessLog = enable;
  return *this;
}

AppConfig& AppConfig::withCloseConnection(bool enable) {
  closeConnection = enable;
  return *this;
}

AppConfig& AppConfig::withServerName(std::string_view name) {
  serverName.assign(name);
  return *this;
}

AppConfig& AppConfig::withDefaultContentType(std::string_view contentType) {
  defaultContentType.assign(contentType);
  return *this;
}

void AppConfig::validate() const {
  if (!http::IsValidHeaderValue(serverName)) {
    throw ConfigurationError("Invalid server name '" + serverName + "'");
  }
  if (defaultContentType.empty()) {
    throw ConfigurationError("Default content type cannot be empty");
  }
  if (!http::IsValidHeaderValue(defaultContentType)) {
    throw ConfigurationError("Invalid default content type '" + defaultContentType + "'");
  }
}

}  // namespace breeze
