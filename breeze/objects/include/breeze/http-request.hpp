#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "breeze/http-constants.hpp"
#include "breeze/http-method.hpp"
#include "breeze/http-version.hpp"

namespace breeze {

// Structured HTTP request as produced by the (external) HTTP parsing layer.
// Immutable for the duration of one handling cycle: the transport owns it and must keep it alive
// until the completion callback of the response write has been invoked.
class HttpRequest {
 public:
  struct HeaderField {
    std::string name;
    std::string value;
  };

  // Creates a request for the given method and request-target (path with optional query string / fragment).
  // Throws std::invalid_argument if the target is empty.
  HttpRequest(http::Method method, std::string_view url, std::string_view version = http::HTTP11Sv);

  // Appends a header field. Duplicated header names are kept, lookups return the first one.
  // The value is trimmed of optional whitespace.
  // Throws std::invalid_argument if the name is not a valid token or the value contains CR / LF.
  HttpRequest& header(std::string_view name, std::string_view value) &;
  HttpRequest&& header(std::string_view name, std::string_view value) && {
    return std::move(this->header(name, value));
  }

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Full request target, e.g. "/search?q=wind".
  [[nodiscard]] std::string_view url() const noexcept { return _url; }

  // Request target without query string and fragment, e.g. "/search".
  [[nodiscard]] std::string_view path() const noexcept { return std::string_view(_url).substr(0, _pathLen); }

  // Version token exactly as received, e.g. "HTTP/1.1".
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // Parsed version, std::nullopt if the received token is not of the form "HTTP/x.y".
  [[nodiscard]] std::optional<http::Version> parsedVersion() const noexcept { return http::ParseHttpVersion(_version); }

  // Case-insensitive lookup of the first header with given name.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Conditional request validator (value of the If-None-Match header), if any.
  [[nodiscard]] std::optional<std::string_view> ifNoneMatch() const noexcept {
    return headerValue(http::IfNoneMatch);
  }

  [[nodiscard]] std::span<const HeaderField> headers() const noexcept { return _headers; }

 private:
  std::string _url;
  std::string _version;
  std::vector<HeaderField> _headers;
  std::size_t _pathLen;
  http::Method _method;
};

}  // namespace breeze
