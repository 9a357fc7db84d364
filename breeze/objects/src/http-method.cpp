#include "breeze/http-method.hpp"

#include <optional>
#include <string_view>

#include "breeze/ascii.hpp"

namespace breeze::http {

std::optional<Method> MethodStrToOptEnum(std::string_view token) noexcept {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (CaseInsensitiveEqual(token, kMethodStrings[methodIdx])) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

}  // namespace breeze::http
