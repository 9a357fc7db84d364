#include "breeze/resource.hpp"

#include <array>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "breeze/etag.hpp"
#include "breeze/http-constants.hpp"
#include "breeze/http-error.hpp"
#include "breeze/http-method.hpp"
#include "breeze/http-status-code.hpp"
#include "breeze/http-version.hpp"
#include "breeze/log.hpp"
#include "breeze/resource-context.hpp"
#include "breeze/route-binding.hpp"

namespace breeze {

namespace {

void AppendExceptionChain(std::string& out, const std::exception& ex) {
  out.append(ex.what());
  try {
    std::rethrow_if_nested(ex);
  } catch (const std::exception& nested) {
    out.append(" <- caused by: ");
    AppendExceptionChain(out, nested);
  } catch (...) {
    out.append(" <- caused by: unknown exception");
  }
}

std::string DescribeException(const std::exception& ex) {
  std::string ret;
  AppendExceptionChain(ret, ex);
  return ret;
}

constexpr std::string_view StateToStr(Resource::State state) {
  switch (state) {
    case Resource::State::New:
      return "new";
    case Resource::State::Processing:
      return "processing";
    case Resource::State::Handling:
      return "handling";
    case Resource::State::Finishing:
      return "finishing";
    case Resource::State::Sent:
      return "sent";
    case Resource::State::Cleared:
      return "cleared";
    default:
      return "unknown";
  }
}

}  // namespace

Resource::Resource() = default;

Resource::~Resource() = default;

void Resource::attach(const RouteBinding& binding, std::shared_ptr<const ResourceContext> context) {
  _binding = &binding;
  _context = std::move(context);
}

template <class Func>
void Resource::runGuarded(Func&& func) {
  try {
    func();
  } catch (const HttpError& ex) {
    switch (ex.status()) {
      case http::StatusCodeNotFound:
        [[fallthrough]];
      case http::StatusCodeMethodNotAllowed:
        [[fallthrough]];
      case http::StatusCodeNotModified:
        logger()->debug("{}", ex.what());
        fail(ex.status());
        break;
      default:
        logger()->warn("Unhandled {} in resource, answering {}", ex.what(), http::StatusCodeInternalServerError);
        fail(http::StatusCodeInternalServerError);
        break;
    }
  } catch (const std::exception& ex) {
    logger()->error("Exception in resource handler: {}", DescribeException(ex));
    fail(http::StatusCodeInternalServerError);
  } catch (...) {
    logger()->error("Unknown exception in resource handler");
    fail(http::StatusCodeInternalServerError);
  }
}

void Resource::begin(IConnection& conn, const HttpRequest& request) {
  if (processing()) {
    throw std::logic_error("Resource is already processing a request");
  }
  if (!_context) {
    _context = ResourceContext::Default();
  }
  _conn = &conn;
  _request = &request;
  _state = State::Processing;
  ++_cycle;
}

void Resource::reject(IConnection& conn, const HttpRequest& request, http::StatusCode statusCode) {
  begin(conn, request);
  fail(statusCode);
}

void Resource::react(IConnection& conn, const HttpRequest& request) {
  begin(conn, request);

  logger()->debug("Reacting to {} {}", http::MethodToStr(request.method()), request.url());

  runGuarded([this] {
    if (!_initialized) {
      _initialized = true;
      initialize();
    }
    const http::Method method = _request->method();
    if (_binding != nullptr && !_binding->isErrorBinding() && !_binding->allowed(method)) {
      throw HttpError::MethodNotAllowed();
    }
    _state = State::Handling;
    if (_syncHandler) {
      write(_syncHandler(*_request));
      finishImpl();
      return;
    }
    dispatch(method);
    if (!_asynchronous && _state == State::Handling) {
      finishImpl();
    }
  });
}

void Resource::dispatch(http::Method method) {
  using Handle = void (Resource::*)();
  // Same order as http::Method bits
  static constexpr std::array<Handle, http::kNbMethods> kHandles{&Resource::handleGet, &Resource::handleHead,
                                                                 &Resource::handlePost, &Resource::handlePut,
                                                                 &Resource::handleDelete};
  (this->*kHandles[http::MethodToIdx(method)])();
}

void Resource::handleGet() { throw HttpError::MethodNotAllowed(); }
void Resource::handleHead() { throw HttpError::MethodNotAllowed(); }
void Resource::handlePost() { throw HttpError::MethodNotAllowed(); }
void Resource::handlePut() { throw HttpError::MethodNotAllowed(); }
void Resource::handleDelete() { throw HttpError::MethodNotAllowed(); }

std::string Resource::errorMessage() const {
  std::string ret = std::to_string(_statusCode);
  const std::string_view reason = http::ReasonPhraseFor(_statusCode);
  if (!reason.empty()) {
    ret.push_back(' ');
    ret.append(reason);
  }
  return ret;
}

bool Resource::etagAvailable() const {
  const auto version = request().parsedVersion();
  return version && *version > http::HTTP_1_0;
}

void Resource::write(std::string_view chunk, bool prepend) {
  if (chunk.empty()) {
    return;
  }
  if (prepend) {
    _writeBuffer.appendLeft(std::string(chunk));
  } else {
    _writeBuffer.append(std::string(chunk));
  }
}

void Resource::finish() {
  if (startCompletion("finish")) {
    runGuarded([this] { finishImpl(); });
  }
}

void Resource::sendResponse(http::StatusCode statusCode) {
  if (startCompletion("sendResponse")) {
    runGuarded([this, statusCode] { sendResponseImpl(statusCode); });
  }
}

bool Resource::startCompletion(std::string_view operation) {
  if (_state == State::Processing || _state == State::Handling) {
    return true;
  }
  if (_context) {
    logger()->error("{}() ignored: resource is in state '{}'", operation, StateToStr(_state));
  } else {
    log::error("{}() ignored: resource is not attached to any request", operation);
  }
  return false;
}

bool Resource::etagEnabled() const { return _context->config.enableEtag && _request != nullptr && etagAvailable(); }

void Resource::finishImpl() {
  _state = State::Finishing;

  if (etagEnabled()) {
    std::string etag = ComputeEtag(_writeBuffer);
    const auto ifNoneMatch = _request->ifNoneMatch();
    if (ifNoneMatch && *ifNoneMatch == etag) {
      _etag = std::move(etag);
      throw HttpError::NotModified();
    }
    _responseHeaders.addEtag(etag);
  }

  if (!http::StatusCodeAllowsBody(_statusCode)) {
    _writeBuffer.clear();
  }

  transmitResponse();
}

void Resource::sendResponseImpl(http::StatusCode statusCode) {
  _state = State::Finishing;

  _writeBuffer.clear();
  _statusCode = statusCode;

  if (statusCode == http::StatusCodeNotModified) {
    // A 304 carries the same metadata as the 200 it replaces (Cache-Control, Vary...), only content headers go.
    _responseHeaders.remove(http::ContentLength);
    _responseHeaders.remove(http::ContentType);
    if (!_etag.empty()) {
      _responseHeaders.addEtag(_etag);
    }
  } else {
    _responseHeaders.clear();
  }
  if (http::StatusCodeAllowsBody(statusCode)) {
    write(errorMessage());
  }

  transmitResponse();
}

void Resource::transmitResponse() {
  completeHeaders(!_writeBuffer.empty());
  if (_request != nullptr && _request->method() == http::Method::HEAD) {
    // Same head as the GET equivalent, Content-Length included, but no content.
    _writeBuffer.clear();
  }
  _response.emplace(_statusCode, _responseHeaders, _request);
  _writeBuffer.appendLeft(_response->raw());
  _writeBuffer.gather(_writeBuffer.totalBytes());
  transmit();
}

void Resource::completeHeaders(bool hasBody) {
  const AppConfig& config = _context->config;
  if (hasBody) {
    _responseHeaders.addContentLength(_writeBuffer.totalBytes());
    if (!_responseHeaders.contains(http::ContentType)) {
      _responseHeaders.add(http::ContentType, config.defaultContentType);
    }
  }
  if (!config.serverName.empty()) {
    _responseHeaders.add(http::Server, config.serverName);
  }
  if (config.closeConnection) {
    _responseHeaders.add(http::Connection, http::close);
  }
}

void Resource::transmit() {
  _state = State::Sent;

  std::string payload = _writeBuffer.popLeft();

  // The pending write owns the resource until its completion.
  std::shared_ptr<Resource> self = weak_from_this().lock();
  const uint64_t cycle = _cycle;

  logger()->debug("Writing {} bytes of response {}", payload.size(), _response->status());

  try {
    _conn->write(std::move(payload), [this, self = std::move(self), cycle]() {
      if (cycle != _cycle || _state != State::Sent) {
        logger()->error("Unexpected write completion in state '{}'", StateToStr(_state));
        return;
      }
      clear();
    });
  } catch (const std::exception& ex) {
    logger()->error("Exception while writing response: {}", ex.what());
    clear();
  } catch (...) {
    logger()->error("Unknown exception while writing response");
    clear();
  }
}

void Resource::fail(http::StatusCode statusCode) {
  if (_state == State::Sent || _state == State::Cleared) {
    logger()->error("Cannot answer {}: response was already handed to the connection", statusCode);
    return;
  }
  try {
    sendResponseImpl(statusCode);
  } catch (const std::exception& ex) {
    logger()->critical("Unable to send {} response: {}, closing connection", statusCode, ex.what());
    clear();
  } catch (...) {
    logger()->critical("Unable to send {} response, closing connection", statusCode);
    clear();
  }
}

void Resource::clear() {
  if (_conn != nullptr) {
    try {
      _conn->close();
    } catch (const std::exception& ex) {
      logger()->error("Exception while closing connection: {}", ex.what());
    }
  }
  logAccess();
  _state = State::Cleared;
  resetRequestState();
}

void Resource::logAccess() const {
  if (_context->config.enableAccessLog && _request != nullptr && _response) {
    logger()->info("{} {} {}", http::MethodToStr(_request->method()), _request->url(), _response->status());
  }
}

void Resource::resetRequestState() noexcept {
  _conn = nullptr;
  _request = nullptr;
  _response.reset();
  _etag.clear();
  _writeBuffer.clear();
  _responseHeaders.clear();
  _statusCode = http::StatusCodeOK;
}

}  // namespace breeze
