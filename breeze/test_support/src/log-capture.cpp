#include "breeze/log-capture.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "breeze/log.hpp"

namespace breeze::test {

LogCapture::LogCapture(std::string_view name, std::size_t capacity)
    : _sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(capacity)),
      _logger(std::make_shared<spdlog::logger>(std::string(name), _sink)) {
  _logger->set_level(log::level::trace);
}

std::vector<LogCapture::Entry> LogCapture::entries() const {
  std::vector<Entry> ret;
  for (const auto& msg : _sink->last_raw()) {
    ret.emplace_back(msg.level, std::string(msg.payload.data(), msg.payload.size()));
  }
  return ret;
}

std::size_t LogCapture::count(log::level::level_enum level) const {
  const auto all = entries();
  return static_cast<std::size_t>(std::ranges::count(all, level, &Entry::level));
}

std::size_t LogCapture::count(log::level::level_enum level, std::string_view part) const {
  const auto all = entries();
  return static_cast<std::size_t>(std::ranges::count_if(
      all, [level, part](const Entry& entry) { return entry.level == level && entry.message.contains(part); }));
}

}  // namespace breeze::test
