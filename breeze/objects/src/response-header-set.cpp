#include "breeze/response-header-set.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "breeze/ascii.hpp"
#include "breeze/http-constants.hpp"
#include "breeze/http-header-is-valid.hpp"

namespace breeze {

void ResponseHeaderSet::add(std::string_view name, std::string_view value) {
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument("HTTP header name is invalid");
  }
  value = TrimOws(value);
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument("HTTP header value is invalid");
  }
  auto it = std::ranges::find_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it != _fields.end()) {
    it->value.assign(value);
  } else {
    _fields.emplace_back(std::string(name), std::string(value));
  }
}

bool ResponseHeaderSet::remove(std::string_view name) {
  return std::erase_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.name, name); }) != 0;
}

void ResponseHeaderSet::addContentLength(std::size_t nbBytes) { add(http::ContentLength, std::to_string(nbBytes)); }

void ResponseHeaderSet::toJsonContent() { add(http::ContentType, http::ContentTypeApplicationJson); }

void ResponseHeaderSet::addEtag(std::string_view etag) { add(http::ETag, etag); }

std::optional<std::string_view> ResponseHeaderSet::value(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

}  // namespace breeze
