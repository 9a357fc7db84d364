#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "breeze/http-status-code.hpp"
#include "breeze/http-version.hpp"
#include "breeze/response-header-set.hpp"

namespace breeze {

class HttpRequest;

// Status line and header block of a response.
// It is a snapshot: later modifications of the ResponseHeaderSet it was built from are not reflected,
// a new HttpResponse should be generated instead.
class HttpResponse {
 public:
  // The status line echoes the version of 'request' when it is a valid HTTP/1.x version, HTTP/1.1 otherwise
  // (including when 'request' is nullptr).
  HttpResponse(http::StatusCode status, const ResponseHeaderSet& headers, const HttpRequest* request);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] http::Version version() const noexcept { return _version; }

  [[nodiscard]] std::span<const ResponseHeaderSet::Field> headers() const noexcept { return _headers; }

  // Serialized head: "<version> <code> <reason>\r\n" followed by "Name: value\r\n" for each header,
  // and the final empty line.
  [[nodiscard]] std::string raw() const;

 private:
  std::vector<ResponseHeaderSet::Field> _headers;
  http::Version _version{http::HTTP_1_1};
  http::StatusCode _status;
};

}  // namespace breeze
