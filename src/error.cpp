// ============================================================================
// error.cpp - implementation for error.hpp
// Stable reason tokens for the CLI "status=error reason=..." lines.
// ============================================================================

#include "nanovna/error.hpp"

namespace nanovna {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:               return "ok";
        case ErrorCode::NotConnected:       return "not_connected";
        case ErrorCode::OutOfRange:         return "out_of_range";
        case ErrorCode::CommandFailed:      return "command_failed";
        case ErrorCode::NoData:             return "no_data";
        case ErrorCode::UnrecognizedDevice: return "unrecognized_device";
        case ErrorCode::NoDeviceFound:      return "no_device_found";
        case ErrorCode::Timeout:            return "timeout";
        case ErrorCode::Io:                 return "io";
    }
    return "unknown";
}

std::string Error::to_string() const {
    std::string s = error_code_name(code);
    if (!detail.empty()) {
        s += ':';
        s += detail;
    }
    return s;
}

} // namespace nanovna
