#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "breeze/connection.hpp"
#include "breeze/http-method.hpp"
#include "breeze/http-request.hpp"
#include "breeze/http-response.hpp"
#include "breeze/http-status-code.hpp"
#include "breeze/log.hpp"
#include "breeze/resource-context.hpp"
#include "breeze/response-header-set.hpp"
#include "breeze/write-buffer.hpp"

#ifdef BREEZE_ENABLE_GLAZE
#include "breeze/json-serializer.hpp"
#endif

namespace breeze {

class RouteBinding;

// Handler of one HTTP request: owns the buffered output, the response headers and the finish / error protocol.
//
// Subclass it and override the handleXxx methods of the HTTP methods you serve. By default a Resource is
// asynchronous: the handler is responsible for calling finish() (or sendResponse()) itself, possibly later, after
// the handleXxx call returned (in that case, keep a std::shared_ptr to the Resource, obtained via
// shared_from_this(), until then). Call setAsynchronous(false) to have finish() called automatically after the
// handleXxx method returns.
//
// Responses to HEAD requests carry the headers of the corresponding GET response, Content-Length included, but no
// body.
//
// Lifecycle: New -> Processing -> Handling -> Finishing -> Sent -> Cleared.
// Once the response has been handed to the connection (Sent), the Resource must not be touched until the
// completion callback of the write fired, which closes the connection, logs the access line and resets the
// per-request state (Cleared). A Cleared resource may react to a new request.
//
// Exceptions raised while handling:
//  - HttpError with status 404, 405 or 304 becomes a response with that status.
//  - any other HttpError is logged and becomes a 500 response.
//  - any other exception is logged with its full nested chain and becomes a 500 response.
class Resource : public std::enable_shared_from_this<Resource> {
 public:
  enum class State : uint8_t { New, Processing, Handling, Finishing, Sent, Cleared };

  // Plain function handler: receives the request and returns the response body.
  using SyncHandler = std::function<std::string(const HttpRequest&)>;

  Resource();

  Resource(const Resource&) = delete;
  Resource(Resource&&) = delete;
  Resource& operator=(const Resource&) = delete;
  Resource& operator=(Resource&&) = delete;

  virtual ~Resource();

  // Starts the handling of 'request' received on 'conn'.
  // Both must stay valid until the completion callback of the response write has been invoked.
  // Throws std::logic_error if this resource is already processing another request.
  void react(IConnection& conn, const HttpRequest& request);

  // Makes this resource answer every request by calling 'handler' synchronously and sending its result
  // as the body, instead of dispatching to the handleXxx methods.
  void inject(SyncHandler handler) { _syncHandler = std::move(handler); }

  // Buffers 'chunk' at the end of the body (or before the already buffered data if 'prepend' is true).
  // Empty chunks are ignored.
  void write(std::string_view chunk, bool prepend = false);

#ifdef BREEZE_ENABLE_GLAZE
  // Buffers the JSON serialization of 'value' and switches the response Content-Type to application/json.
  template <class T>
    requires(!std::convertible_to<const T&, std::string_view>)
  void write(const T& value) {
    _responseHeaders.toJsonContent();
    write(SerializeToJson(value));
  }
#endif

  // Should be called before finish() / sendResponse().
  // Throws std::invalid_argument if the header name or value is invalid.
  void addResponseHeader(std::string_view name, std::string_view value) { _responseHeaders.add(name, value); }

  bool removeResponseHeader(std::string_view name) { return _responseHeaders.remove(name); }

  // Status code used by finish(). Default is 200.
  void setStatusCode(http::StatusCode statusCode) noexcept { _statusCode = statusCode; }

  // Sends the buffered body as the response.
  // If ETag validation is available and the If-None-Match header of the request is equal to the ETag of the
  // buffered body, a 304 response without body is sent instead. Otherwise the ETag is added to the response.
  void finish();

  // Sends a response with given status, discarding any previously buffered body and headers.
  // 304 keeps the headers set so far, except Content-Length and Content-Type.
  // The body is errorMessage(), except for statuses forbidding a body (1xx, 204, 304).
  void sendResponse(http::StatusCode statusCode = http::StatusCodeOK);

  [[nodiscard]] State state() const noexcept { return _state; }

  // true from react() until the completion callback of the response write has run.
  [[nodiscard]] bool processing() const noexcept {
    return _state != State::New && _state != State::Cleared;
  }

  [[nodiscard]] bool asynchronous() const noexcept { return _asynchronous; }

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] const ResponseHeaderSet& responseHeaders() const noexcept { return _responseHeaders; }

  [[nodiscard]] const WriteBuffer& writeBuffer() const noexcept { return _writeBuffer; }

 protected:
  // Called once, before the first request is handled by this resource.
  virtual void initialize() {}

  // Default implementations raise HttpError::MethodNotAllowed().
  virtual void handleGet();
  virtual void handleHead();
  virtual void handlePost();
  virtual void handlePut();
  virtual void handleDelete();

  // Body of the responses sent by sendResponse(). Default is "<code> <reason>", e.g. "404 Not Found".
  [[nodiscard]] virtual std::string errorMessage() const;

  // Whether ETag validation can be used for the current request.
  // ETags do not exist in HTTP/1.0 (RFC 1945), so it returns true only for versions strictly above 1.0.
  // Override it to return false to disable conditional responses for a resource type.
  [[nodiscard]] virtual bool etagAvailable() const;

  void setAsynchronous(bool asynchronous) noexcept { _asynchronous = asynchronous; }

  // Request being handled.
  // Prerequisite: processing() should be true.
  [[nodiscard]] const HttpRequest& request() const noexcept { return *_request; }

  [[nodiscard]] const Logger& logger() const noexcept { return _context->logger; }

  [[nodiscard]] const RouteBinding* binding() const noexcept { return _binding; }

 private:
  friend class RouteBinding;

  void attach(const RouteBinding& binding, std::shared_ptr<const ResourceContext> context);

  void begin(IConnection& conn, const HttpRequest& request);

  // Answers 'request' with 'statusCode' without running any handler.
  void reject(IConnection& conn, const HttpRequest& request, http::StatusCode statusCode);

  void dispatch(http::Method method);

  void finishImpl();
  void sendResponseImpl(http::StatusCode statusCode);

  template <class Func>
  void runGuarded(Func&& func);

  void fail(http::StatusCode statusCode);

  bool startCompletion(std::string_view operation);

  // Completes the headers, prepends the serialized head to the body and hands the payload to the connection.
  void transmitResponse();

  void completeHeaders(bool hasBody);

  void transmit();

  void clear();

  void logAccess() const;

  void resetRequestState() noexcept;

  [[nodiscard]] bool etagEnabled() const;

  std::shared_ptr<const ResourceContext> _context;
  const RouteBinding* _binding{nullptr};
  SyncHandler _syncHandler;
  IConnection* _conn{nullptr};
  const HttpRequest* _request{nullptr};
  std::optional<HttpResponse> _response;
  std::string _etag;
  WriteBuffer _writeBuffer;
  ResponseHeaderSet _responseHeaders;
  uint64_t _cycle{};
  http::StatusCode _statusCode{http::StatusCodeOK};
  State _state{State::New};
  bool _asynchronous{true};
  bool _initialized{false};
};

}  // namespace breeze
