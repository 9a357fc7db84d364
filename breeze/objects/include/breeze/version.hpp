#pragma once

#include <openssl/opensslv.h>
#include <spdlog/version.h>

#include <string>
#include <string_view>

#ifndef BREEZE_VERSION_STR
#error "BREEZE_VERSION_STR must be defined via build system"
#endif

namespace breeze {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return BREEZE_VERSION_STR; }

// Multiline description of the project and of the libraries it was built with:
//   breeze <version>
//     digest: <OpenSSL version text>
//     logging: spdlog <major>.<minor>.<patch>
//     json: <glaze | disabled>
inline std::string fullVersionString() {
  std::string ret("breeze ");
  ret.append(version());
  ret.append("\n  digest: ");
  ret.append(OPENSSL_VERSION_TEXT);
  ret.append("\n  logging: spdlog ");
  ret.append(std::to_string(SPDLOG_VER_MAJOR));
  ret.push_back('.');
  ret.append(std::to_string(SPDLOG_VER_MINOR));
  ret.push_back('.');
  ret.append(std::to_string(SPDLOG_VER_PATCH));
#ifdef BREEZE_ENABLE_GLAZE
  ret.append("\n  json: glaze");
#else
  ret.append("\n  json: disabled");
#endif
  return ret;
}

}  // namespace breeze
