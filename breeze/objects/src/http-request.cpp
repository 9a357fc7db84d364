#include "breeze/http-request.hpp"

#include <optional>
#include <stdexcept>
#include <string_view>

#include "breeze/ascii.hpp"
#include "breeze/http-header-is-valid.hpp"

namespace breeze {

HttpRequest::HttpRequest(http::Method method, std::string_view url, std::string_view version)
    : _url(url), _version(version), _pathLen(url.find_first_of("?#")), _method(method) {
  if (_url.empty()) {
    throw std::invalid_argument("HTTP request target cannot be empty");
  }
  if (_pathLen == std::string_view::npos) {
    _pathLen = _url.size();
  }
}

HttpRequest& HttpRequest::header(std::string_view name, std::string_view value) & {
  value = TrimOws(value);
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument("HTTP header name is invalid");
  }
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument("HTTP header value is invalid");
  }
  _headers.emplace_back(std::string(name), std::string(value));
  return *this;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  for (const HeaderField& field : _headers) {
    if (CaseInsensitiveEqual(field.name, name)) {
      return std::string_view(field.value);
    }
  }
  return std::nullopt;
}

}  // namespace breeze
