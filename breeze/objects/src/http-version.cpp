#include "breeze/http-version.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace breeze::http {

std::string Version::str() const {
  std::string ret(kHttpPrefix);
  ret.append(std::to_string(major));
  ret.push_back('.');
  ret.append(std::to_string(minor));
  return ret;
}

std::optional<Version> ParseHttpVersion(std::string_view token) noexcept {
  // minimal length "HTTP/x.y"
  if (token.size() < kHttpPrefix.size() + 3U || !token.starts_with(kHttpPrefix)) {
    return std::nullopt;
  }
  token.remove_prefix(kHttpPrefix.size());

  const auto dotPos = token.find('.');
  if (dotPos == std::string_view::npos) {
    return std::nullopt;
  }

  Version version;
  const char *first = token.data();
  const char *dot = first + dotPos;
  const char *last = first + token.size();

  auto [majorEnd, majorErr] = std::from_chars(first, dot, version.major);
  if (majorErr != std::errc() || majorEnd != dot) {
    return std::nullopt;
  }
  auto [minorEnd, minorErr] = std::from_chars(dot + 1, last, version.minor);
  if (minorErr != std::errc() || minorEnd != last) {
    return std::nullopt;
  }
  return version;
}

}  // namespace breeze::http
