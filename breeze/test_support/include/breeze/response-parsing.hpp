#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace breeze::test {

struct ParsedResponse {
  std::string version;                                       // e.g. "HTTP/1.1"
  std::string reason;                                        // reason phrase, may be empty
  std::vector<std::pair<std::string, std::string>> headers;  // in wire order
  std::string body;                                          // everything after the empty line
  int statusCode{-1};

  // Case-insensitive lookup of the first header named 'name'.
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

// Splits a raw HTTP/1.x response into its parts.
// Throws std::runtime_error if the status line or the header block is malformed.
ParsedResponse ParseResponse(std::string_view raw);

}  // namespace breeze::test
