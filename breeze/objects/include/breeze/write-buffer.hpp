#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

namespace breeze {

// Ordered, double-ended container of byte chunks keeping track of its total byte length.
// Invariant: totalBytes() is always equal to the sum of the sizes of the stored chunks.
// Empty chunks are never stored.
class WriteBuffer {
 public:
  using const_iterator = std::deque<std::string>::const_iterator;

  // Appends 'chunk' after the last stored chunk.
  void append(std::string chunk);

  // Inserts 'chunk' before the first stored chunk.
  void appendLeft(std::string chunk);

  // Coalesces the first 'nbBytes' buffered bytes into a single chunk placed at the front.
  // If 'nbBytes' ends in the middle of a chunk, this chunk is split and its remaining part stays
  // as the second chunk. 'nbBytes' is clamped to totalBytes().
  // After gather(totalBytes()), the buffer holds exactly one chunk (or none if it was empty).
  void gather(std::size_t nbBytes);

  // Removes and returns the front chunk.
  // Prerequisite: buffer should not be empty.
  std::string popLeft();

  void clear() noexcept;

  [[nodiscard]] std::size_t totalBytes() const noexcept { return _totalBytes; }

  [[nodiscard]] std::size_t nbChunks() const noexcept { return _chunks.size(); }

  [[nodiscard]] bool empty() const noexcept { return _chunks.empty(); }

  [[nodiscard]] std::string_view front() const noexcept { return _chunks.front(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _chunks.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _chunks.end(); }

 private:
  std::deque<std::string> _chunks;
  std::size_t _totalBytes{};
};

}  // namespace breeze
