#include "breeze/recording-connection.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace breeze::test {

void RecordingConnection::write(std::string payload, WriteCompletion onComplete) {
  _payloads.push_back(std::move(payload));
  if (_completion == Completion::Immediate) {
    if (onComplete) {
      onComplete();
    }
  } else {
    _pending.push_back(std::move(onComplete));
  }
}

bool RecordingConnection::completePendingWrite() {
  if (_pending.empty()) {
    return false;
  }
  // The completion may release the last reference to its resource: take it out of the queue first.
  WriteCompletion onComplete = std::move(_pending.front());
  _pending.pop_front();
  if (onComplete) {
    onComplete();
  }
  return true;
}

std::string_view RecordingConnection::lastPayload() const noexcept {
  if (_payloads.empty()) {
    return {};
  }
  return _payloads.back();
}

}  // namespace breeze::test
