#include "breeze/http-response.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "breeze/http-constants.hpp"
#include "breeze/http-request.hpp"
#include "breeze/http-status-code.hpp"

namespace breeze {

HttpResponse::HttpResponse(http::StatusCode status, const ResponseHeaderSet& headers, const HttpRequest* request)
    : _headers(headers.fields().begin(), headers.fields().end()), _status(status) {
  if (request != nullptr) {
    const auto requestVersion = request->parsedVersion();
    if (requestVersion && requestVersion->major == 1) {
      _version = *requestVersion;
    }
  }
}

std::string HttpResponse::raw() const {
  const std::string_view reason = http::ReasonPhraseFor(_status);

  std::size_t totalSize = http::HTTP11Sv.size() + 1U + 3U + 1U + reason.size() + http::CRLF.size();
  for (const auto& field : _headers) {
    totalSize += field.name.size() + http::HeaderSep.size() + field.value.size() + http::CRLF.size();
  }
  totalSize += http::CRLF.size();

  std::string ret;
  ret.reserve(totalSize);
  ret.append(_version.str());
  ret.push_back(' ');
  ret.append(std::to_string(_status));
  ret.push_back(' ');
  ret.append(reason);
  ret.append(http::CRLF);
  for (const auto& field : _headers) {
    ret.append(field.name);
    ret.append(http::HeaderSep);
    ret.append(field.value);
    ret.append(http::CRLF);
  }
  ret.append(http::CRLF);
  return ret;
}

}  // namespace breeze
