#pragma once

#include <string_view>

#include "breeze/ascii.hpp"

namespace breeze::http {

// Validates that a header name consists only of tchar characters as per RFC 7230 §3.2.6.
constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  if (name.empty()) {
    return false;
  }
  for (char ch : name) {
    if (!is_tchar(ch)) {
      return false;
    }
  }
  return true;
}

// Validates that a header value does not contain any invalid characters.
// Specifically, it must not contain CR or LF characters, but may contain HTAB and visible ASCII characters.
// The empty value is allowed.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  for (char ch : value) {
    const auto uc = static_cast<unsigned char>(ch);
    if (uc == '\t') {
      continue;
    }
    if (uc < 0x20 || uc > 0x7E) {
      return false;
    }
  }
  return true;
}

}  // namespace breeze::http
