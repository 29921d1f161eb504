#pragma once
/**
 * @file device_info.hpp
 * @brief Best-effort model / firmware / serial extraction from the `info` reply.
 *
 * The `info` text is free-form and differs per firmware family, so the
 * parser works line by line with a few substring rules:
 *
 *  - V2 family: a line mentioning "nanovna" or "saa2" is the model; a line
 *    mentioning "firmware" or "version" gives the firmware (text after the
 *    first ':').
 *  - Others: the first retained line is the model; a line starting with
 *    "serial" gives the serial number; the first token starting with "v"
 *    (and longer than "v") is the firmware version.
 *
 * When nothing better is found the model reads "<variant name> (detected)".
 */

#include "nanovna/hardware.hpp"

#include <string>

namespace nanovna {

struct DeviceInfo {
  std::string model;
  std::string firmware;
  std::string serial_number;
};

DeviceInfo parse_device_info(const HardwareInfo& hw, const std::string& reply);

} // namespace nanovna
