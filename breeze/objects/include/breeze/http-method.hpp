#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

namespace breeze::http {

enum class Method : uint8_t { GET = 1 << 0, HEAD = 1 << 1, POST = 1 << 2, PUT = 1 << 3, DELETE = 1 << 4 };

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 5;

using MethodBmp = uint8_t;

inline constexpr MethodBmp kAllMethods = (1U << kNbMethods) - 1U;

static_assert(kNbMethods <= sizeof(MethodBmp) * 8,
              "MethodBmp type too small to hold all methods; increase size or change type");

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(static_cast<MethodBmp>(lhs) | static_cast<MethodBmp>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(lhs | static_cast<MethodBmp>(rhs));
}

constexpr bool IsMethodSet(MethodBmp mask, Method method) noexcept {
  return (mask & static_cast<MethodBmp>(method)) != 0U;
}

constexpr MethodIdx MethodToIdx(Method method) noexcept {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<unsigned>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) noexcept { return static_cast<Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET", "HEAD", "POST", "PUT", "DELETE"};

// Canonical (upper case) token of the method, as emitted on the wire and in access logs.
constexpr std::string_view MethodToStr(Method method) noexcept { return kMethodStrings[MethodToIdx(method)]; }

// Case-insensitive parsing of a method token ("get", "GET", "Get"...).
// Returns std::nullopt for tokens outside of the supported set.
std::optional<Method> MethodStrToOptEnum(std::string_view token) noexcept;

}  // namespace breeze::http
