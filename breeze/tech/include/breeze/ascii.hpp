#pragma once

#include <cstdint>
#include <string_view>

namespace breeze {

constexpr char tolower(char ch) noexcept {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch | 0x20);
  }
  return ch;
}

/// RFC 7230: tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*"
///                  / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
///                  / DIGIT / ALPHA
constexpr bool is_tchar(char ch) noexcept {
  constexpr uint64_t kBitmap[2] = {
      (1ULL << '!') | (1ULL << '#') | (1ULL << '$') | (1ULL << '%') | (1ULL << '&') | (1ULL << '\'') | (1ULL << '*') |
          (1ULL << '+') | (1ULL << '-') | (1ULL << '.') | (0x3FFULL << '0'),
      (0x3FFFFFFULL << ('A' - 64)) | (1ULL << ('^' - 64)) | (1ULL << ('_' - 64)) | (0x3FFFFFFULL << ('a' - 64)) |
          (1ULL << ('`' - 64)) | (1ULL << ('|' - 64)) | (1ULL << ('~' - 64))};

  const auto uc = static_cast<unsigned char>(ch);
  return uc < 128U && ((kBitmap[uc >> 6] >> (uc & 63)) & 1U) != 0U;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
    sv.remove_suffix(1);
  }
  return sv;
}

}  // namespace breeze
