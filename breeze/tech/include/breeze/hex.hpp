#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace breeze {

/// Appends to 'out' the lower case hexadecimal representation of each byte of 'bytes'.
/// Examples:
///  {0x2c}       -> "2c"
///  {0xd4, 0x1d} -> "d41d"
inline void AppendLowerHex(std::string &out, std::span<const unsigned char> bytes) {
  static constexpr const char *const kHexits = "0123456789abcdef";

  out.reserve(out.size() + (2UL * bytes.size()));
  for (unsigned char byte : bytes) {
    out.push_back(kHexits[byte >> 4U]);
    out.push_back(kHexits[byte & 0x0FU]);
  }
}

inline std::string ToLowerHex(std::span<const unsigned char> bytes) {
  std::string ret;
  AppendLowerHex(ret, bytes);
  return ret;
}

}  // namespace breeze
