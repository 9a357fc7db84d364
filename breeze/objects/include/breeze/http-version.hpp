#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace breeze::http {

// RFC 9112 §2.5 HTTP version token representation
inline constexpr std::string_view kHttpPrefix = "HTTP/";

struct Version {
  uint8_t major{};
  uint8_t minor{};

  // Builds the textual representation of the version, e.g. "HTTP/1.1".
  [[nodiscard]] std::string str() const;

  constexpr auto operator<=>(const Version &) const noexcept = default;
};

inline constexpr Version HTTP_1_0{1, 0};
inline constexpr Version HTTP_1_1{1, 1};

// Parse a textual HTTP version token (e.g. "HTTP/1.1") into Version.
// Returns std::nullopt if format is invalid.
std::optional<Version> ParseHttpVersion(std::string_view token) noexcept;

}  // namespace breeze::http
