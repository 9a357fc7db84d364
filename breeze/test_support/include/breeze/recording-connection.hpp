#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "breeze/connection.hpp"

namespace breeze::test {

// In-memory connection recording every payload written to it.
// With Completion::Immediate, write completions are invoked before write() returns, like a transport whose socket
// buffer always has room. With Completion::Deferred, they are queued until completePendingWrite() is called, which
// simulates a write notified later by the event loop.
class RecordingConnection : public IConnection {
 public:
  enum class Completion : uint8_t { Immediate, Deferred };

  explicit RecordingConnection(Completion completion = Completion::Immediate) : _completion(completion) {}

  void write(std::string payload, WriteCompletion onComplete) override;

  void close() override { ++_nbCloses; }

  // Invokes the completion of the oldest pending write.
  // Returns false if there was no pending write.
  bool completePendingWrite();

  [[nodiscard]] std::span<const std::string> payloads() const noexcept { return _payloads; }

  // Last written payload, empty if nothing was written.
  [[nodiscard]] std::string_view lastPayload() const noexcept;

  [[nodiscard]] std::size_t nbWrites() const noexcept { return _payloads.size(); }

  [[nodiscard]] std::size_t nbPendingWrites() const noexcept { return _pending.size(); }

  [[nodiscard]] int nbCloses() const noexcept { return _nbCloses; }

  [[nodiscard]] bool closed() const noexcept { return _nbCloses != 0; }

 private:
  std::vector<std::string> _payloads;
  std::deque<WriteCompletion> _pending;
  int _nbCloses{};
  Completion _completion;
};

}  // namespace breeze::test
