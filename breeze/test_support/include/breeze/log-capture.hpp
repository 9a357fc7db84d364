#pragma once

#include <spdlog/sinks/ringbuffer_sink.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "breeze/log.hpp"

namespace breeze::test {

// Logger keeping its last entries in memory, to be injected in the components under test.
class LogCapture {
 public:
  struct Entry {
    log::level::level_enum level;
    std::string message;
  };

  explicit LogCapture(std::string_view name = "breeze-test", std::size_t capacity = 256);

  [[nodiscard]] const Logger& logger() const noexcept { return _logger; }

  // Captured entries, oldest first.
  [[nodiscard]] std::vector<Entry> entries() const;

  [[nodiscard]] std::size_t count(log::level::level_enum level) const;

  // Number of entries at 'level' whose message contains 'part'.
  [[nodiscard]] std::size_t count(log::level::level_enum level, std::string_view part) const;

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> _sink;
  Logger _logger;
};

}  // namespace breeze::test
