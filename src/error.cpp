// ============================================================================
// error.cpp — implementation for error.hpp
// ============================================================================

#include "p100link/error.hpp"

namespace p100link {

const char* to_reason(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:            return "ok";
    case ErrorCode::ConnectionLost:  return "connection_lost";
    case ErrorCode::Timeout:         return "timeout";
    case ErrorCode::Busy:            return "busy";
    case ErrorCode::NotConnected:    return "not_connected";
    case ErrorCode::Ambiguous:       return "ambiguous";
    case ErrorCode::NotFound:        return "not_found";
    case ErrorCode::MalformedFrame:  return "malformed_frame";
    case ErrorCode::InvalidArgument: return "invalid_argument";
    case ErrorCode::Cancelled:       return "cancelled";
    case ErrorCode::Config:          return "config";
  }
  return "unknown";
}

std::string Error::to_string() const {
  std::string s = reason();
  if (!detail.empty()) {
    s += ' ';
    s += detail;
  }
  return s;
}

} // namespace p100link
