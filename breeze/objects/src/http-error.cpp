#include "breeze/http-error.hpp"

#include <stdexcept>
#include <string>

#include "breeze/http-status-code.hpp"

namespace breeze {

namespace {

std::string BuildHttpErrorMessage(http::StatusCode status) {
  std::string msg = "HTTP error ";
  msg.append(std::to_string(status));
  const auto reason = http::ReasonPhraseFor(status);
  if (!reason.empty()) {
    msg.push_back(' ');
    msg.append(reason);
  }
  return msg;
}

}  // namespace

HttpError::HttpError(http::StatusCode status) : std::runtime_error(BuildHttpErrorMessage(status)), _status(status) {}

}  // namespace breeze
