#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace breeze {

// Mutable collection of response headers, serialized in insertion order.
// Names are compared case-insensitively; adding a header that already exists replaces its value in place.
class ResponseHeaderSet {
 public:
  struct Field {
    std::string name;
    std::string value;
  };

  // Adds or replaces the header 'name'.
  // Throws std::invalid_argument if the name is not a valid token or the value contains CR / LF.
  void add(std::string_view name, std::string_view value);

  // Removes the header 'name', if present. Returns true if a header was removed.
  bool remove(std::string_view name);

  void clear() noexcept { _fields.clear(); }

  // Sets Content-Length from given byte count.
  void addContentLength(std::size_t nbBytes);

  // Switches Content-Type to application/json.
  void toJsonContent();

  void addEtag(std::string_view etag);

  [[nodiscard]] std::optional<std::string_view> value(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return value(name).has_value(); }

  // Ordered view of the headers, as they will be serialized.
  [[nodiscard]] std::span<const Field> fields() const noexcept { return _fields; }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

 private:
  std::vector<Field> _fields;
};

}  // namespace breeze
