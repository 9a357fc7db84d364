#pragma once

#include <functional>
#include <string>

namespace breeze {

// Transport abstraction of one client connection, implemented by the (external) socket / stream layer.
class IConnection {
 public:
  // Invoked exactly once, after the bytes passed to write() have been fully handed off.
  using WriteCompletion = std::function<void()>;

  virtual ~IConnection() = default;

  // Non-blocking write of 'payload'. Ownership of the bytes is transferred to the connection.
  // 'onComplete' may be invoked before write() returns (synchronous transports) or later, from the event loop.
  virtual void write(std::string payload, WriteCompletion onComplete) = 0;

  virtual void close() = 0;
};

}  // namespace breeze
