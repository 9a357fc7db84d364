#pragma once

#include <string_view>

namespace breeze::http {

// HTTP header field names are case-insensitive per RFC 7230. We store them here
// in their conventional canonical form for emission. Lookups must stay case-insensitive.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Standard Header Field Names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ETag = "ETag";
inline constexpr std::string_view IfNoneMatch = "If-None-Match";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Server = "Server";

// Header values
inline constexpr std::string_view close = "close";

inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeTextPlainUtf8 = "text/plain; charset=utf-8";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";

}  // namespace breeze::http
