#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "breeze/route-binding.hpp"

namespace breeze {

// Ordered collection of route bindings, looked up by exact path.
// It should not be modified once requests are being served: Resources keep a pointer to the binding that
// created them until their response has been written.
class RouteTable {
 public:
  using const_iterator = std::vector<RouteBinding>::const_iterator;

  RouteTable() noexcept = default;

  // Throws ConfigurationError if one of the bindings is an error binding.
  explicit RouteTable(std::vector<RouteBinding> bindings);

  // Appends 'binding' after the existing ones.
  // Throws ConfigurationError if 'binding' is an error binding.
  void add(RouteBinding binding);

  // Returns the first binding whose route is exactly 'path', or nullptr if none matches.
  // Matching is case-sensitive and does not normalize trailing slashes.
  [[nodiscard]] const RouteBinding* lookup(std::string_view path) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _bindings.size(); }

  [[nodiscard]] bool empty() const noexcept { return _bindings.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _bindings.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _bindings.end(); }

 private:
  std::vector<RouteBinding> _bindings;
};

}  // namespace breeze
