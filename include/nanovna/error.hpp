#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy shared by every NanoVNA driver operation.
 *
 * @details
 * PURPOSE
 * -------
 * Driver calls never throw across the library API. Each operation returns
 * `bool` and fills an `Error` out-parameter on failure. The code tells the
 * caller *what kind* of failure happened; the detail string carries the
 * specifics (the rejected value, the raw probe text, the I/O reason).
 *
 * `Error::to_string()` renders a stable `reason[:detail]` token so the CLI
 * can print `status=error reason=out_of_range:start_hz=10<min=50000` and
 * scripts can grep the reason without parsing prose.
 *
 * TAXONOMY
 * --------
 * - NotConnected        operation attempted with no open channel.
 * - OutOfRange          sweep parameter violates the active capability bounds.
 * - CommandFailed       every command form for an operation was rejected.
 * - NoData              a sweep produced no parseable frequency or S11 samples.
 * - UnrecognizedDevice  detection heuristics matched no known variant.
 * - NoDeviceFound       auto-connect exhausted all candidate ports.
 * - Timeout             a read timed out before any byte arrived.
 * - Io                  open/read/write failed at the transport.
 */

#include <cstdint>
#include <string>
#include <utility>

namespace nanovna {

enum class ErrorCode : uint8_t {
  None = 0,
  NotConnected,
  OutOfRange,
  CommandFailed,
  NoData,
  UnrecognizedDevice,
  NoDeviceFound,
  Timeout,
  Io
};

/// Stable snake_case name for a code ("not_connected", "out_of_range", ...).
const char* error_code_name(ErrorCode code);

struct Error {
  ErrorCode   code{ErrorCode::None};
  std::string detail;

  bool ok() const { return code == ErrorCode::None; }
  void clear() { code = ErrorCode::None; detail.clear(); }

  /// "reason" or "reason:detail".
  std::string to_string() const;
};

/**
 * @brief Record a failure in @p err and return false.
 *
 * Lets call sites stay one line: `return fail(err, ErrorCode::NoData, "s11");`
 */
inline bool fail(Error& err, ErrorCode code, std::string detail = {}) {
  err.code = code;
  err.detail = std::move(detail);
  return false;
}

} // namespace nanovna
