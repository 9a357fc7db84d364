#include "breeze/write-buffer.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <string>
#include <utility>

namespace breeze {

void WriteBuffer::append(std::string chunk) {
  if (chunk.empty()) {
    return;
  }
  _totalBytes += chunk.size();
  _chunks.push_back(std::move(chunk));
}

void WriteBuffer::appendLeft(std::string chunk) {
  if (chunk.empty()) {
    return;
  }
  _totalBytes += chunk.size();
  _chunks.push_front(std::move(chunk));
}

void WriteBuffer::gather(std::size_t nbBytes) {
  nbBytes = std::min(nbBytes, _totalBytes);
  if (nbBytes == 0 || _chunks.front().size() == nbBytes) {
    return;
  }

  std::string gathered;
  gathered.reserve(nbBytes);
  while (gathered.size() < nbBytes) {
    std::string& chunk = _chunks.front();
    const std::size_t remaining = nbBytes - gathered.size();
    if (chunk.size() <= remaining) {
      gathered.append(chunk);
      _chunks.pop_front();
    } else {
      gathered.append(chunk, 0, remaining);
      chunk.erase(0, remaining);
    }
  }
  _chunks.push_front(std::move(gathered));
}

std::string WriteBuffer::popLeft() {
  assert(!_chunks.empty());
  std::string chunk = std::move(_chunks.front());
  _chunks.pop_front();
  _totalBytes -= chunk.size();
  return chunk;
}

void WriteBuffer::clear() noexcept {
  _chunks.clear();
  _totalBytes = 0;
}

}  // namespace breeze
