#include "breeze/route-table.hpp"

#include <algorithm>
#include <string_view>
#include <utility>
#include <vector>

#include "breeze/http-error.hpp"
#include "breeze/route-binding.hpp"

namespace breeze {

namespace {

void CheckNotErrorBinding(const RouteBinding& binding) {
  if (binding.isErrorBinding()) {
    throw ConfigurationError("Route table only accepts bindings with a route");
  }
}

}  // namespace

RouteTable::RouteTable(std::vector<RouteBinding> bindings) : _bindings(std::move(bindings)) {
  std::ranges::for_each(_bindings, CheckNotErrorBinding);
}

void RouteTable::add(RouteBinding binding) {
  CheckNotErrorBinding(binding);
  _bindings.push_back(std::move(binding));
}

const RouteBinding* RouteTable::lookup(std::string_view path) const noexcept {
  auto it = std::ranges::find(_bindings, path, &RouteBinding::route);
  return it == _bindings.end() ? nullptr : &*it;
}

}  // namespace breeze
