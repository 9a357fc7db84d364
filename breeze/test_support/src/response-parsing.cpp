#include "breeze/response-parsing.hpp"

#include <charconv>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "breeze/ascii.hpp"
#include "breeze/http-constants.hpp"

namespace breeze::test {

std::optional<std::string_view> ParsedResponse::header(std::string_view name) const {
  for (const auto& [key, value] : headers) {
    if (CaseInsensitiveEqual(key, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

ParsedResponse ParseResponse(std::string_view raw) {
  const auto headEnd = raw.find("\r\n\r\n");
  if (headEnd == std::string_view::npos) {
    throw std::runtime_error("missing end of response head");
  }
  ParsedResponse out;
  out.body.assign(raw.substr(headEnd + 4));

  std::string_view head = raw.substr(0, headEnd + 2);

  const auto statusLineEnd = head.find(http::CRLF);
  const std::string_view statusLine = head.substr(0, statusLineEnd);
  head.remove_prefix(statusLineEnd + http::CRLF.size());

  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos) {
    throw std::runtime_error("bad status line");
  }
  out.version.assign(statusLine.substr(0, firstSpace));
  std::string_view codeAndReason = statusLine.substr(firstSpace + 1);
  const auto secondSpace = codeAndReason.find(' ');
  const std::string_view code = codeAndReason.substr(0, secondSpace);
  const auto [ptr, errc] = std::from_chars(code.data(), code.data() + code.size(), out.statusCode);
  if (errc != std::errc() || ptr != code.data() + code.size() || code.size() != 3U) {
    throw std::runtime_error("bad status code");
  }
  if (secondSpace != std::string_view::npos) {
    out.reason.assign(codeAndReason.substr(secondSpace + 1));
  }

  while (!head.empty()) {
    const auto lineEnd = head.find(http::CRLF);
    const std::string_view line = head.substr(0, lineEnd);
    head.remove_prefix(lineEnd + http::CRLF.size());
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      throw std::runtime_error("bad header line");
    }
    out.headers.emplace_back(std::string(line.substr(0, colon)), std::string(TrimOws(line.substr(colon + 1))));
  }
  return out;
}

}  // namespace breeze::test
