#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy shared by every p100link layer.
 *
 * @details
 * Operations in this library never throw across the public surface. They
 * return `bool` and fill an `Error` out-parameter, the same way the CLI
 * dispatcher helpers report `err="bad_value:..."`. `Error::reason()` yields a
 * stable snake_case token so scripts can act on `status=error reason=<token>`.
 *
 * Taxonomy
 * --------
 * - ConnectionLost  transport I/O failure or supervisor teardown; aborts the
 *                   pending request and triggers reconnection.
 * - Timeout         no matching frame before the command deadline.
 * - Busy            submit while another command is awaiting its reply.
 * - NotConnected    submit while the link is not up.
 * - Ambiguous       name selector matched more than one entry.
 * - NotFound        name selector matched nothing.
 * - MalformedFrame  a frame or payload could not be interpreted.
 * - InvalidArgument caller supplied an out-of-range or unparsable value.
 * - Cancelled       the caller abandoned the wait.
 * - Config          configuration file or value rejected.
 */

#include <string>
#include <utility>

namespace p100link {

enum class ErrorCode {
  None = 0,
  ConnectionLost,
  Timeout,
  Busy,
  NotConnected,
  Ambiguous,
  NotFound,
  MalformedFrame,
  InvalidArgument,
  Cancelled,
  Config
};

/// Stable token for an error code, e.g. "not_connected".
const char* to_reason(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::None};
  std::string detail;   ///< free-form context, e.g. "VOL? after 2000 ms"

  bool ok() const { return code == ErrorCode::None; }
  const char* reason() const { return to_reason(code); }

  void set(ErrorCode c, std::string d = {}) {
    code = c;
    detail = std::move(d);
  }
  void clear() { code = ErrorCode::None; detail.clear(); }

  /// "reason" or "reason detail" for one-line diagnostics.
  std::string to_string() const;
};

} // namespace p100link
