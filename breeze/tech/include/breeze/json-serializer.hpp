#pragma once

#ifdef BREEZE_ENABLE_GLAZE

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace breeze {

/// Serialize a C++ object to JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize.
/// Example usage:
///   struct Greeting { std::string text; };
///   template<> struct glz::meta<Greeting> { ... };
///   auto json = breeze::SerializeToJson(greeting);
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace breeze

#endif  // BREEZE_ENABLE_GLAZE
